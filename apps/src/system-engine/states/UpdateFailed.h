#pragma once

#include "StateForward.h"
#include "system-engine/api/ClientCommand.h"
#include <string>

namespace NixBlitz {
namespace System {
namespace State {

struct UpdateFailed {
    std::string message;

    // Retries the switch.
    Any onEvent(const SystemApi::SwitchConfig& cmd, SystemEngine& engine);

    bool operator==(const UpdateFailed&) const = default;
    static constexpr const char* name() { return "UpdateFailed"; }
};

} // namespace State
} // namespace System
} // namespace NixBlitz
