#include "State.h"
#include "core/VariantSerializer.h"

#include <nlohmann/json.hpp>

namespace NixBlitz {
namespace Installer {
namespace State {

void to_json(nlohmann::json& j, const Any& state)
{
    j = VariantSerializer::toJson(state.getVariant());
}

void from_json(const nlohmann::json& j, Any& state)
{
    state = VariantSerializer::fromJsonOrThrow<Any::Variant>(j);
}

} // namespace State
} // namespace Installer
} // namespace NixBlitz
