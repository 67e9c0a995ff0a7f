#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

namespace NixBlitz {
namespace Installer {
namespace State {

Any SystemCheckCompleted::onEvent(const InstallApi::UpdateConfig& /*cmd*/, InstallerEngine& engine)
{
    LOG_INFO(State, "UpdateConfig command received");
    if (!result.is_compatible) {
        engine.publishError("Cannot update config: system is not compatible");
        return *this;
    }
    return UpdateConfig{};
}

Any SystemCheckCompleted::onEvent(
    const InstallApi::StartInstallation& /*cmd*/, InstallerEngine& engine)
{
    LOG_INFO(State, "StartInstallation command received");

    if (!result.is_compatible) {
        engine.publishError("Cannot start installation: system is not compatible");
        return *this;
    }
    if (!engine.installDisk().has_value()) {
        engine.publishError("Cannot start installation: no install disk selected");
        return *this;
    }
    if (engine.buildInProgress()) {
        engine.publishError("A previous build is still running");
        return *this;
    }

    return Installing{ .steps = initialInstallSteps() };
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
