#include "InstallProtocol.h"
#include "core/VariantSerializer.h"

#include <nlohmann/json.hpp>

namespace NixBlitz {
namespace Installer {

namespace {

// Build output is not guaranteed to be valid UTF-8.
std::string dumpLenient(const nlohmann::json& j)
{
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

InstallProtocol::Event InstallProtocol::snapshotEvent(const State& state)
{
    return InstallApi::StateChanged{ state };
}

std::string InstallProtocol::encode(const Event& event)
{
    return dumpLenient(VariantSerializer::toJson(event.getVariant()));
}

Result<InstallProtocol::Command, ApiError> InstallProtocol::decode(const std::string& text)
{
    auto result = VariantSerializer::fromString<Command::Variant>(text);
    if (result.isError()) {
        return Result<Command, ApiError>::error(result.errorValue());
    }
    return Result<Command, ApiError>::okay(Command(std::move(result.value())));
}

std::string InstallProtocol::encodeCommand(const Command& command)
{
    return dumpLenient(VariantSerializer::toJson(command.getVariant()));
}

Result<InstallProtocol::Event, ApiError> InstallProtocol::decodeEvent(const std::string& text)
{
    auto result = VariantSerializer::fromString<Event::Variant>(text);
    if (result.isError()) {
        return Result<Event, ApiError>::error(result.errorValue());
    }
    return Result<Event, ApiError>::okay(Event(std::move(result.value())));
}

} // namespace Installer
} // namespace NixBlitz
