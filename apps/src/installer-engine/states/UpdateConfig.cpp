#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

namespace NixBlitz {
namespace Installer {
namespace State {

Any UpdateConfig::onEvent(const InstallApi::UpdateConfigFinished& /*cmd*/, InstallerEngine& engine)
{
    LOG_INFO(State, "UpdateConfigFinished command received");
    return SelectInstallDisk::enterFrom(*this, engine);
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
