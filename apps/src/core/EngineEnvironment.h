#pragma once

#include "LoggingChannels.h"
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <string>

namespace NixBlitz {

inline std::string getEnvValue(const char* name)
{
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') {
        return "";
    }
    return value;
}

template <typename Config>
concept EngineSettings = requires(Config c) {
    c.bind_address = std::string();
    c.port = uint16_t{};
    c.work_dir = std::string();
    c.demo = true;
};

/**
 * @brief Applies NIXBLITZ_WORK_DIR, NIXBLITZ_DEMO, IP and PORT on top of a loaded config.
 *
 * Unset or empty variables leave the field alone. An unparseable PORT is logged and ignored.
 */
template <EngineSettings Config>
void applyEnvironmentOverrides(Config& config)
{
    const auto workDir = getEnvValue("NIXBLITZ_WORK_DIR");
    if (!workDir.empty()) {
        config.work_dir = workDir;
    }

    const auto demo = getEnvValue("NIXBLITZ_DEMO");
    if (!demo.empty()) {
        config.demo = demo == "1" || demo == "true";
    }

    const auto ip = getEnvValue("IP");
    if (!ip.empty()) {
        config.bind_address = ip;
    }

    const auto port = getEnvValue("PORT");
    if (!port.empty()) {
        try {
            const unsigned long value = std::stoul(port);
            if (value == 0 || value > 65535) {
                SLOG_WARN("Ignoring out of range PORT={}", port);
            }
            else {
                config.port = static_cast<uint16_t>(value);
            }
        }
        catch (const std::exception& e) {
            SLOG_WARN("Ignoring invalid PORT={}: {}", port, e.what());
        }
    }
}

} // namespace NixBlitz
