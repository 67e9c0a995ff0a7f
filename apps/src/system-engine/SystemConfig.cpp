#include "SystemConfig.h"
#include "core/ReflectSerializer.h"

namespace NixBlitz {
namespace System {

void from_json(const nlohmann::json& j, SystemConfig& cfg)
{
    ReflectSerializer::from_json_into(j, cfg);
}

void to_json(nlohmann::json& j, const SystemConfig& cfg)
{
    j = ReflectSerializer::to_json(cfg);
}

} // namespace System
} // namespace NixBlitz
