#include "UpdateProtocol.h"
#include "core/VariantSerializer.h"

#include <nlohmann/json.hpp>

namespace NixBlitz {
namespace System {

UpdateProtocol::Event UpdateProtocol::snapshotEvent(const State& state)
{
    return SystemApi::StateChanged{ state };
}

std::string UpdateProtocol::encode(const Event& event)
{
    // Switch output may contain invalid UTF-8.
    return VariantSerializer::toJson(event.getVariant())
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<UpdateProtocol::Command, ApiError> UpdateProtocol::decode(const std::string& text)
{
    auto result = VariantSerializer::fromString<Command::Variant>(text);
    if (result.isError()) {
        return Result<Command, ApiError>::error(result.errorValue());
    }
    return Result<Command, ApiError>::okay(Command(std::move(result.value())));
}

std::string UpdateProtocol::encodeCommand(const Command& command)
{
    return VariantSerializer::toJson(command.getVariant()).dump();
}

Result<UpdateProtocol::Event, ApiError> UpdateProtocol::decodeEvent(const std::string& text)
{
    auto result = VariantSerializer::fromString<Event::Variant>(text);
    if (result.isError()) {
        return Result<Event, ApiError>::error(result.errorValue());
    }
    return Result<Event, ApiError>::okay(Event(std::move(result.value())));
}

} // namespace System
} // namespace NixBlitz
