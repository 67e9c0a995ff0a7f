#pragma once

#include "core/ApiError.h"
#include "core/Result.h"
#include "system-engine/api/ClientCommand.h"
#include "system-engine/api/ServerEvent.h"
#include "system-engine/states/State.h"
#include <string>

namespace NixBlitz {
namespace System {

// JSON text codec for the system update WebSocket protocol.
struct UpdateProtocol {
    using State = ::NixBlitz::System::State::Any;
    using Event = SystemApi::ServerEvent;
    using Command = SystemApi::ClientCommand;

    static Event snapshotEvent(const State& state);

    static std::string encode(const Event& event);
    static Result<Command, ApiError> decode(const std::string& text);

    static std::string encodeCommand(const Command& command);
    static Result<Event, ApiError> decodeEvent(const std::string& text);
};

} // namespace System
} // namespace NixBlitz
