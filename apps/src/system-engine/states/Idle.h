#pragma once

#include "StateForward.h"
#include "system-engine/api/ClientCommand.h"

namespace NixBlitz {
namespace System {
namespace State {

struct Idle {
    void onEnter(SystemEngine& engine);

    Any onEvent(const SystemApi::SwitchConfig& cmd, SystemEngine& engine);

    bool operator==(const Idle&) const = default;
    static constexpr const char* name() { return "Idle"; }
};

} // namespace State
} // namespace System
} // namespace NixBlitz
