#pragma once

#include "StateForward.h"
#include "installer-engine/api/ClientCommand.h"

namespace NixBlitz {
namespace Installer {
namespace State {

// The user is editing the project configuration in another tool.
struct UpdateConfig {
    Any onEvent(const InstallApi::UpdateConfigFinished& cmd, InstallerEngine& engine);

    bool operator==(const UpdateConfig&) const = default;
    static constexpr const char* name() { return "UpdateConfig"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
