#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

namespace NixBlitz {
namespace Installer {
namespace State {

Any SelectDiskError::onEvent(
    const InstallApi::UpdateConfigFinished& /*cmd*/, InstallerEngine& engine)
{
    LOG_INFO(State, "UpdateConfigFinished command received");
    return SelectInstallDisk::enterFrom(*this, engine);
}

Any SelectDiskError::onEvent(const InstallApi::UpdateConfig& /*cmd*/, InstallerEngine& /*engine*/)
{
    LOG_INFO(State, "UpdateConfig command received");
    return UpdateConfig{};
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
