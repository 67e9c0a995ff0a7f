#include "State.h"
#include "core/LoggingChannels.h"
#include "system-engine/SystemEngine.h"

namespace NixBlitz {
namespace System {
namespace State {

void Switching::onEnter(SystemEngine& engine)
{
    LOG_INFO(State, "Switching to the new configuration");
    engine.startSwitch();
}

} // namespace State
} // namespace System
} // namespace NixBlitz
