#include "State.h"
#include "core/LoggingChannels.h"
#include "system-engine/SystemEngine.h"

namespace NixBlitz {
namespace System {
namespace State {

void Idle::onEnter(SystemEngine& /*engine*/)
{
    LOG_INFO(State, "Idle state ready for commands");
}

Any Idle::onEvent(const SystemApi::SwitchConfig& /*cmd*/, SystemEngine& engine)
{
    LOG_INFO(State, "SwitchConfig command received");
    // A switch detached by DevReset may still be running nixblitz apply.
    if (engine.switchInProgress()) {
        engine.publishError("A previous build is still running");
        return *this;
    }
    return Switching{};
}

} // namespace State
} // namespace System
} // namespace NixBlitz
