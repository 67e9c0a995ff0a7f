#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

namespace NixBlitz {
namespace Installer {
namespace State {

Any PreInstallConfirm::onEvent(
    const InstallApi::StartInstallation& /*cmd*/, InstallerEngine& engine)
{
    LOG_INFO(State, "StartInstallation command received for {}", data.disk);
    // A build detached by DevReset may still be writing to the disk.
    if (engine.buildInProgress()) {
        engine.publishError("A previous build is still running");
        return *this;
    }
    engine.selectDisk(data.disk);
    return Installing{ .steps = initialInstallSteps() };
}

Any PreInstallConfirm::onEvent(const InstallApi::UpdateConfig& /*cmd*/, InstallerEngine& /*engine*/)
{
    LOG_INFO(State, "UpdateConfig command received");
    return UpdateConfig{};
}

// The project may have changed since the disk was picked, so disk selection starts over.
Any PreInstallConfirm::onEvent(
    const InstallApi::UpdateConfigFinished& /*cmd*/, InstallerEngine& engine)
{
    LOG_INFO(State, "UpdateConfigFinished command received");
    return SelectInstallDisk::enterFrom(*this, engine);
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
