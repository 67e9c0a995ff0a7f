#include "InstallerConfig.h"
#include "core/ReflectSerializer.h"

namespace NixBlitz {
namespace Installer {

void from_json(const nlohmann::json& j, InstallerConfig& cfg)
{
    ReflectSerializer::from_json_into(j, cfg);
}

void to_json(nlohmann::json& j, const InstallerConfig& cfg)
{
    j = ReflectSerializer::to_json(cfg);
}

} // namespace Installer
} // namespace NixBlitz
