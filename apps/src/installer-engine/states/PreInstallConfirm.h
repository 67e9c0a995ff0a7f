#pragma once

#include "StateForward.h"
#include "core/SystemInfo.h"
#include "installer-engine/api/ClientCommand.h"

namespace NixBlitz {
namespace Installer {
namespace State {

struct PreInstallConfirm {
    PreInstallConfirmData data;

    Any onEvent(const InstallApi::StartInstallation& cmd, InstallerEngine& engine);
    Any onEvent(const InstallApi::UpdateConfig& cmd, InstallerEngine& engine);
    Any onEvent(const InstallApi::UpdateConfigFinished& cmd, InstallerEngine& engine);

    bool operator==(const PreInstallConfirm&) const = default;
    static constexpr const char* name() { return "PreInstallConfirm"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
