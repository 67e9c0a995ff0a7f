#include "State.h"
#include "core/LoggingChannels.h"
#include "installer-engine/InstallerEngine.h"

namespace NixBlitz {
namespace Installer {
namespace State {

void Installing::onEnter(InstallerEngine& engine)
{
    LOG_INFO(State, "Installing, {} steps queued", steps.size());
    engine.startBuild();
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
