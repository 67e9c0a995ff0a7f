#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

namespace NixBlitz {
namespace Installer {
namespace State {

void Idle::onEnter(InstallerEngine& /*engine*/)
{
    LOG_INFO(State, "Idle, waiting for a system check");
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
