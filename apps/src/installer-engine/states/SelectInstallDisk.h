#pragma once

#include "StateForward.h"
#include "core/SystemInfo.h"
#include "installer-engine/api/ClientCommand.h"
#include <vector>

namespace NixBlitz {
namespace Installer {
namespace State {

struct SelectInstallDisk {
    std::vector<DiskInfo> disks;

    // Lists the disks and enters disk selection. On a listing error the error is published
    // and `stay` is returned.
    static Any enterFrom(Any stay, InstallerEngine& engine);

    Any onEvent(const InstallApi::InstallDiskSelected& cmd, InstallerEngine& engine);
    Any onEvent(const InstallApi::UpdateConfig& cmd, InstallerEngine& engine);

    bool operator==(const SelectInstallDisk&) const = default;
    static constexpr const char* name() { return "SelectInstallDisk"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
