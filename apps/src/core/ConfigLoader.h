#pragma once

#include "Result.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace NixBlitz {

/**
 * @brief Finds and loads engine config files.
 *
 * Search order (first match wins):
 * 1. Explicit config directory (setConfigDir, or NIXBLITZ_CONFIG_DIR)
 * 2. ./config/ (development checkout)
 * 3. ~/.config/nixblitz/
 * 4. /etc/nixblitz/ (written by the NixOS module)
 *
 * At each location <name>.local wins over <name>. The .local file replaces the
 * base file, it is not merged with it.
 */
class ConfigLoader {
public:
    static void setConfigDir(const std::string& path);
    static void clearConfigDir();

    /**
     * @brief Load a config file on top of the given defaults.
     *
     * Keys missing from the file keep their default value. A missing file is not an
     * error, the defaults are returned. A file that exists but cannot be parsed is.
     */
    template <typename T>
    static Result<T, std::string> loadOrDefault(const std::string& filename, T defaults);

    static std::optional<std::filesystem::path> findConfigFile(const std::string& filename);
    static std::vector<std::filesystem::path> getSearchPaths();

private:
    static std::optional<std::string> explicitConfigDir_;
    static Result<nlohmann::json, std::string> readJson(const std::filesystem::path& path);
};

template <typename T>
Result<T, std::string> ConfigLoader::loadOrDefault(const std::string& filename, T defaults)
{
    const auto path = findConfigFile(filename);
    if (!path.has_value()) {
        return Result<T, std::string>::okay(std::move(defaults));
    }

    auto jsonResult = readJson(path.value());
    if (jsonResult.isError()) {
        return Result<T, std::string>::error(jsonResult.errorValue());
    }

    try {
        T config = std::move(defaults);
        // Unqualified so the config type's own from_json is found by ADL.
        from_json(jsonResult.value(), config);
        return Result<T, std::string>::okay(std::move(config));
    }
    catch (const std::exception& e) {
        return Result<T, std::string>::error(
            "Failed to parse " + path->string() + ": " + e.what());
    }
}

} // namespace NixBlitz
