#include "State.h"
#include "core/LoggingChannels.h"
#include "system-engine/SystemEngine.h"

namespace NixBlitz {
namespace System {
namespace State {

Any UpdateFailed::onEvent(const SystemApi::SwitchConfig& /*cmd*/, SystemEngine& engine)
{
    LOG_INFO(State, "SwitchConfig command received after failure: {}", message);
    if (engine.switchInProgress()) {
        engine.publishError("A previous build is still running");
        return *this;
    }
    return Switching{};
}

} // namespace State
} // namespace System
} // namespace NixBlitz
