#pragma once

#include "ApiError.h"
#include "Result.h"
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace NixBlitz {

/**
 * @brief Read-mostly view of a nixblitz project directory.
 *
 * Only the parts the engines need: which apps are enabled, and clearing the pending-change
 * markers once a configuration has been applied. Each app keeps its options in a JSON file
 * under <work_dir>/src; an option is an object with at least a "value" member.
 */
class Project {
public:
    struct AppFile {
        const char* displayName;
        const char* relativePath;
    };

    static const std::vector<AppFile>& appFiles();

    explicit Project(std::filesystem::path workDir);

    const std::filesystem::path& workDir() const { return workDir_; }

    // "NixOS" first, then every app whose "enable" option is true. Missing files count as
    // disabled.
    Result<std::vector<std::string>, ApiError> enabledApps() const;

    // Sets original = value and clears dirty/applied flags on every option.
    Result<std::monostate, ApiError> markChangesApplied() const;

private:
    std::filesystem::path workDir_;
};

} // namespace NixBlitz
