#pragma once

#include "StateForward.h"
#include "core/SystemInfo.h"
#include "installer-engine/api/ClientCommand.h"

namespace NixBlitz {
namespace Installer {
namespace State {

struct SystemCheckCompleted {
    CheckResult result;

    Any onEvent(const InstallApi::UpdateConfig& cmd, InstallerEngine& engine);
    Any onEvent(const InstallApi::StartInstallation& cmd, InstallerEngine& engine);

    bool operator==(const SystemCheckCompleted&) const = default;
    static constexpr const char* name() { return "SystemCheckCompleted"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
