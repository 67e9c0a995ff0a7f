#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace NixBlitz {
namespace Installer {

/**
 * @brief Settings of the installer engine, loaded from installer-engine.json.
 *
 * Keys absent from the file keep the defaults below.
 */
struct InstallerConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 3000;
    // Project directory; the flake lives in <work_dir>/src.
    std::string work_dir;
    bool demo = false;
    std::string privilege_command = "sudo";
    uint64_t event_capacity = 100;
    std::string nixos_config = "nixblitzvm";
    // Used by StartInstallation when no disk was selected.
    std::string default_disk;
    bool copy_config = true;
};

void from_json(const nlohmann::json& j, InstallerConfig& cfg);
void to_json(nlohmann::json& j, const InstallerConfig& cfg);

} // namespace Installer
} // namespace NixBlitz
