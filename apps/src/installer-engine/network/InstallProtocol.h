#pragma once

#include "core/ApiError.h"
#include "core/Result.h"
#include "installer-engine/api/ClientCommand.h"
#include "installer-engine/api/ServerEvent.h"
#include "installer-engine/states/State.h"
#include <string>

namespace NixBlitz {
namespace Installer {

/**
 * @brief JSON text codec for the installer WebSocket protocol.
 *
 * One externally tagged JSON value per message, e.g. "PerformSystemCheck",
 * {"InstallDiskSelected": "/dev/sda"}, {"StateChanged": {"InstallFailed": "..."}}.
 */
struct InstallProtocol {
    using State = ::NixBlitz::Installer::State::Any;
    using Event = InstallApi::ServerEvent;
    using Command = InstallApi::ClientCommand;

    static Event snapshotEvent(const State& state);

    static std::string encode(const Event& event);
    static Result<Command, ApiError> decode(const std::string& text);

    // Client side, used by tools and tests.
    static std::string encodeCommand(const Command& command);
    static Result<Event, ApiError> decodeEvent(const std::string& text);
};

} // namespace Installer
} // namespace NixBlitz
