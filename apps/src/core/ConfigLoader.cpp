#include "ConfigLoader.h"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace NixBlitz {

std::optional<std::string> ConfigLoader::explicitConfigDir_ = std::nullopt;

void ConfigLoader::setConfigDir(const std::string& path)
{
    explicitConfigDir_ = path;
}

void ConfigLoader::clearConfigDir()
{
    explicitConfigDir_ = std::nullopt;
}

std::vector<std::filesystem::path> ConfigLoader::getSearchPaths()
{
    namespace fs = std::filesystem;
    std::vector<fs::path> paths;

    if (explicitConfigDir_.has_value()) {
        paths.emplace_back(explicitConfigDir_.value());
    }
    else if (const char* envDir = std::getenv("NIXBLITZ_CONFIG_DIR"); envDir && envDir[0]) {
        paths.emplace_back(envDir);
    }

    paths.push_back(fs::current_path() / "config");

    if (const char* home = std::getenv("HOME")) {
        paths.push_back(fs::path(home) / ".config" / "nixblitz");
    }

    paths.emplace_back("/etc/nixblitz");

    return paths;
}

std::optional<std::filesystem::path> ConfigLoader::findConfigFile(const std::string& filename)
{
    namespace fs = std::filesystem;

    for (const auto& dir : getSearchPaths()) {
        for (const auto& candidate : { dir / (filename + ".local"), dir / filename }) {
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
    }

    spdlog::debug("ConfigLoader: {} not found in any search path", filename);
    return std::nullopt;
}

Result<nlohmann::json, std::string> ConfigLoader::readJson(const std::filesystem::path& path)
{
    spdlog::info("ConfigLoader: Loading config from {}", path.string());

    try {
        if (std::filesystem::file_size(path) == 0) {
            return Result<nlohmann::json, std::string>::error(
                "Empty config file: " + path.string());
        }

        std::ifstream file(path);
        if (!file.is_open()) {
            return Result<nlohmann::json, std::string>::error(
                "Cannot open config file: " + path.string());
        }

        return Result<nlohmann::json, std::string>::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        std::string error = "Parse error in " + path.string() + ": " + e.what();
        spdlog::error("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
    catch (const std::exception& e) {
        std::string error = "Error reading " + path.string() + ": " + e.what();
        spdlog::error("ConfigLoader: {}", error);
        return Result<nlohmann::json, std::string>::error(error);
    }
}

} // namespace NixBlitz
