#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace NixBlitz {
namespace System {

/**
 * @brief Settings of the system engine, loaded from system-engine.json.
 */
struct SystemConfig {
    std::string bind_address = "127.0.0.1";
    uint16_t port = 3000;
    std::string work_dir;
    bool demo = false;
    std::string privilege_command = "doas";
    uint64_t event_capacity = 100;
    // Runs as `<apply_command> apply --work-dir <work_dir>`.
    std::string apply_command = "nixblitz";
};

void from_json(const nlohmann::json& j, SystemConfig& cfg);
void to_json(nlohmann::json& j, const SystemConfig& cfg);

} // namespace System
} // namespace NixBlitz
