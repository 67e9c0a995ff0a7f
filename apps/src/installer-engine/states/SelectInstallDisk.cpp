#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

#include <algorithm>

namespace NixBlitz {
namespace Installer {
namespace State {

Any SelectInstallDisk::enterFrom(Any stay, InstallerEngine& engine)
{
    auto disks = engine.listDisks();
    if (disks.isError()) {
        engine.publishError("Failed to list disks: " + disks.errorValue().message);
        return stay;
    }

    LOG_INFO(Install, "Found {} candidate disk(s)", disks.value().size());
    return SelectInstallDisk{ .disks = std::move(disks.value()) };
}

Any SelectInstallDisk::onEvent(const InstallApi::InstallDiskSelected& cmd, InstallerEngine& engine)
{
    LOG_INFO(State, "InstallDiskSelected command received: {}", cmd.path);

    const bool known = std::any_of(disks.begin(), disks.end(), [&cmd](const DiskInfo& disk) {
        return disk.path == cmd.path;
    });
    if (!known) {
        LOG_WARN(Install, "Selected disk {} is not in the disk list", cmd.path);
        return SelectDiskError{ .message = "Disk Not Found" };
    }

    auto apps = engine.enabledApps();
    if (apps.isError()) {
        engine.publishError("Failed to read enabled apps: " + apps.errorValue().message);
        return *this;
    }

    engine.selectDisk(cmd.path);
    return PreInstallConfirm{
        .data = PreInstallConfirmData{ .apps = std::move(apps.value()), .disk = cmd.path },
    };
}

Any SelectInstallDisk::onEvent(const InstallApi::UpdateConfig& /*cmd*/, InstallerEngine& /*engine*/)
{
    LOG_INFO(State, "UpdateConfig command received");
    return UpdateConfig{};
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
