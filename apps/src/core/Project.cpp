#include "Project.h"
#include "LoggingChannels.h"

#include <fstream>
#include <nlohmann/json.hpp>

namespace NixBlitz {

namespace {

using JsonResult = Result<nlohmann::json, ApiError>;

JsonResult readAppFile(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        return JsonResult::error(ApiError("Cannot open " + path.string()));
    }
    try {
        return JsonResult::okay(nlohmann::json::parse(file));
    }
    catch (const nlohmann::json::parse_error& e) {
        return JsonResult::error(ApiError("Failed to parse " + path.string() + ": " + e.what()));
    }
}

bool isEnabled(const nlohmann::json& app)
{
    if (!app.is_object() || !app.contains("enable")) {
        return false;
    }
    const auto& enable = app.at("enable");
    if (enable.is_boolean()) {
        return enable.get<bool>();
    }
    if (enable.is_object() && enable.contains("value") && enable.at("value").is_boolean()) {
        return enable.at("value").get<bool>();
    }
    return false;
}

// Returns true if any option changed.
bool clearPendingChanges(nlohmann::json& app)
{
    if (!app.is_object()) {
        return false;
    }

    bool changed = false;
    for (auto& [key, option] : app.items()) {
        if (!option.is_object() || !option.contains("value")) {
            continue;
        }
        if (!option.contains("original") || option.at("original") != option.at("value")) {
            option["original"] = option.at("value");
            changed = true;
        }
        for (const char* flag : { "dirty", "applied" }) {
            if (option.contains(flag) && option.at(flag) != false) {
                option[flag] = false;
                changed = true;
            }
        }
    }
    return changed;
}

} // namespace

const std::vector<Project::AppFile>& Project::appFiles()
{
    static const std::vector<AppFile> files = {
        { "Bitcoin", "src/btc/bitcoind.json" },
        { "Core Lightning", "src/btc/cln.json" },
        { "LND", "src/btc/lnd.json" },
        { "Blitz API", "src/blitz/api.json" },
        { "Raspiblitz WebUi", "src/blitz/web.json" },
    };
    return files;
}

Project::Project(std::filesystem::path workDir) : workDir_(std::move(workDir))
{}

Result<std::vector<std::string>, ApiError> Project::enabledApps() const
{
    std::vector<std::string> apps{ "NixOS" };

    for (const auto& appFile : appFiles()) {
        const auto path = workDir_ / appFile.relativePath;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            LOG_DEBUG(System, "{} not configured ({} missing)", appFile.displayName, path.string());
            continue;
        }

        auto json = readAppFile(path);
        if (json.isError()) {
            return Result<std::vector<std::string>, ApiError>::error(json.errorValue());
        }
        if (isEnabled(json.value())) {
            apps.push_back(appFile.displayName);
        }
    }

    return Result<std::vector<std::string>, ApiError>::okay(std::move(apps));
}

Result<std::monostate, ApiError> Project::markChangesApplied() const
{
    for (const auto& appFile : appFiles()) {
        const auto path = workDir_ / appFile.relativePath;
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            continue;
        }

        auto json = readAppFile(path);
        if (json.isError()) {
            return Result<std::monostate, ApiError>::error(json.errorValue());
        }
        if (!clearPendingChanges(json.value())) {
            continue;
        }

        std::ofstream out(path, std::ios::trunc);
        out << json.value().dump(2) << '\n';
        if (!out) {
            return Result<std::monostate, ApiError>::error(
                ApiError("Failed to write " + path.string()));
        }
        LOG_DEBUG(System, "Marked {} as applied", path.string());
    }

    LOG_INFO(System, "Project changes marked as applied in {}", workDir_.string());
    return Result<std::monostate, ApiError>::okay(std::monostate{});
}

} // namespace NixBlitz
