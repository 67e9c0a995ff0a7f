#pragma once

#include "core/ApiError.h"
#include "core/Result.h"
#include <array>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace NixBlitz {
namespace Installer {

// Build phases of disko-install, in execution order.
enum class StepName { Deps, Build, Disk, Mount, Copy, Bootloader };

inline constexpr std::array<StepName, 6> kStepOrder = {
    StepName::Deps, StepName::Build, StepName::Disk,
    StepName::Mount, StepName::Copy, StepName::Bootloader,
};

const char* stepDescription(StepName step);

// Substring of a build output line that marks the start of the step.
const char* stepLandmark(StepName step);

struct StepWaiting {
    static constexpr const char* name() { return "Waiting"; }
};

struct StepInProgress {
    static constexpr const char* name() { return "InProgress"; }
};

struct StepDone {
    static constexpr const char* name() { return "Done"; }
};

struct StepFailed {
    std::string reason;

    static constexpr const char* name() { return "Failed"; }
};

using StepStatus = std::variant<StepWaiting, StepInProgress, StepDone, StepFailed>;

std::string statusName(const StepStatus& status);

// Waiting -> InProgress -> Done | Failed. Nothing else.
bool isLegalStepMove(const StepStatus& from, const StepStatus& to);

struct InstallStep {
    StepName name = StepName::Deps;
    StepStatus status = StepWaiting{};

    bool operator==(const InstallStep& other) const;
};

void to_json(nlohmann::json& j, const InstallStep& step);
void from_json(const nlohmann::json& j, InstallStep& step);

std::vector<InstallStep> initialInstallSteps();

/**
 * @brief Follows build output and moves the step list forward.
 *
 * The current step is the one InProgress. A landmark for a later step finishes the current
 * step and starts the new one; landmarks for the current or earlier steps are ignored.
 * Every mutating call returns the steps whose status changed, in order, for broadcasting.
 */
class StepTracker {
public:
    StepTracker();

    std::vector<InstallStep> begin();
    std::vector<InstallStep> observeLine(const std::string& line);
    std::vector<InstallStep> finishCurrent();
    // Finishes the current step and runs every remaining Waiting step through to Done.
    std::vector<InstallStep> finishAll();
    std::vector<InstallStep> failCurrent(const std::string& reason);

    Result<std::monostate, ApiError> setStatus(StepName name, StepStatus status);

    const std::vector<InstallStep>& steps() const { return steps_; }
    std::optional<StepName> current() const;

private:
    InstallStep& stepFor(StepName name);

    std::vector<InstallStep> steps_;
};

} // namespace Installer
} // namespace NixBlitz
