#include "InstallSteps.h"
#include "core/LoggingChannels.h"
#include "core/ReflectSerializer.h"
#include "core/VariantSerializer.h"

#include <nlohmann/json.hpp>

namespace NixBlitz {
namespace Installer {

const char* stepDescription(StepName step)
{
    switch (step) {
        case StepName::Deps:
            return "Fetching Dependencies";
        case StepName::Build:
            return "Building NixOS System";
        case StepName::Disk:
            return "Partitioning & Formatting Disk";
        case StepName::Mount:
            return "Mounting Filesystems";
        case StepName::Copy:
            return "Copying System to Disk";
        case StepName::Bootloader:
            return "Installing Bootloader";
    }
    return "";
}

const char* stepLandmark(StepName step)
{
    switch (step) {
        case StepName::Deps:
            return "unpacking 'github:";
        case StepName::Build:
            return "derivations will be built";
        case StepName::Disk:
            return "sgdisk";
        case StepName::Mount:
            return "mount /dev/disk";
        case StepName::Copy:
            return "Copying store paths";
        case StepName::Bootloader:
            return "installing the boot loader";
    }
    return "";
}

std::string statusName(const StepStatus& status)
{
    return std::visit([](const auto& s) { return std::string(s.name()); }, status);
}

bool isLegalStepMove(const StepStatus& from, const StepStatus& to)
{
    if (std::holds_alternative<StepWaiting>(from)) {
        return std::holds_alternative<StepInProgress>(to);
    }
    if (std::holds_alternative<StepInProgress>(from)) {
        return std::holds_alternative<StepDone>(to) || std::holds_alternative<StepFailed>(to);
    }
    return false;
}

bool InstallStep::operator==(const InstallStep& other) const
{
    if (name != other.name || status.index() != other.status.index()) {
        return false;
    }
    const auto* failed = std::get_if<StepFailed>(&status);
    const auto* otherFailed = std::get_if<StepFailed>(&other.status);
    return !failed || failed->reason == otherFailed->reason;
}

void to_json(nlohmann::json& j, const InstallStep& step)
{
    j = nlohmann::json{
        { "name", ReflectSerializer::enumToJson(step.name) },
        { "status", VariantSerializer::toJson(step.status) },
    };
}

void from_json(const nlohmann::json& j, InstallStep& step)
{
    step.name = ReflectSerializer::enumFromJson<StepName>(j.at("name"));
    step.status = VariantSerializer::fromJsonOrThrow<StepStatus>(j.at("status"));
}

std::vector<InstallStep> initialInstallSteps()
{
    std::vector<InstallStep> steps;
    for (const auto name : kStepOrder) {
        steps.push_back(InstallStep{ .name = name, .status = StepWaiting{} });
    }
    return steps;
}

StepTracker::StepTracker() : steps_(initialInstallSteps())
{}

std::optional<StepName> StepTracker::current() const
{
    for (const auto& step : steps_) {
        if (std::holds_alternative<StepInProgress>(step.status)) {
            return step.name;
        }
    }
    return std::nullopt;
}

InstallStep& StepTracker::stepFor(StepName name)
{
    return steps_[static_cast<size_t>(name)];
}

Result<std::monostate, ApiError> StepTracker::setStatus(StepName name, StepStatus status)
{
    InstallStep& step = stepFor(name);
    if (!isLegalStepMove(step.status, status)) {
        const std::string message = std::string("Illegal step move for ")
            + stepDescription(name) + ": " + statusName(step.status) + " -> "
            + statusName(status);
        LOG_WARN(Install, "{}", message);
        return Result<std::monostate, ApiError>::error(ApiError(message));
    }

    step.status = std::move(status);
    LOG_DEBUG(Install, "Step {} is now {}", stepDescription(name), statusName(step.status));
    return Result<std::monostate, ApiError>::okay(std::monostate{});
}

std::vector<InstallStep> StepTracker::begin()
{
    std::vector<InstallStep> updates;
    if (setStatus(kStepOrder.front(), StepInProgress{}).isValue()) {
        updates.push_back(stepFor(kStepOrder.front()));
    }
    return updates;
}

std::vector<InstallStep> StepTracker::observeLine(const std::string& line)
{
    std::vector<InstallStep> updates;
    const auto active = current();
    if (!active.has_value()) {
        return updates;
    }

    // Find the latest step whose landmark appears in this line.
    std::optional<StepName> reached;
    for (const auto name : kStepOrder) {
        if (line.find(stepLandmark(name)) != std::string::npos) {
            reached = name;
        }
    }
    if (!reached.has_value() || reached.value() <= active.value()) {
        return updates;
    }

    LOG_INFO(Install, "Reached step: {}", stepDescription(reached.value()));

    // Steps without their own landmark are passed through so none is left Waiting.
    const auto first = static_cast<size_t>(active.value());
    const auto last = static_cast<size_t>(reached.value());
    for (size_t index = first; index < last; ++index) {
        InstallStep& step = steps_[index];
        if (std::holds_alternative<StepWaiting>(step.status)) {
            if (setStatus(step.name, StepInProgress{}).isError()) {
                continue;
            }
            updates.push_back(step);
        }
        if (setStatus(step.name, StepDone{}).isValue()) {
            updates.push_back(step);
        }
    }

    if (setStatus(reached.value(), StepInProgress{}).isValue()) {
        updates.push_back(stepFor(reached.value()));
    }
    return updates;
}

std::vector<InstallStep> StepTracker::finishCurrent()
{
    std::vector<InstallStep> updates;
    const auto active = current();
    if (active.has_value() && setStatus(active.value(), StepDone{}).isValue()) {
        updates.push_back(stepFor(active.value()));
    }
    return updates;
}

std::vector<InstallStep> StepTracker::finishAll()
{
    std::vector<InstallStep> updates = finishCurrent();
    for (auto& step : steps_) {
        if (!std::holds_alternative<StepWaiting>(step.status)) {
            continue;
        }
        if (setStatus(step.name, StepInProgress{}).isError()) {
            continue;
        }
        updates.push_back(step);
        if (setStatus(step.name, StepDone{}).isValue()) {
            updates.push_back(step);
        }
    }
    return updates;
}

std::vector<InstallStep> StepTracker::failCurrent(const std::string& reason)
{
    std::vector<InstallStep> updates;
    const auto active = current();
    if (active.has_value() && setStatus(active.value(), StepFailed{ reason }).isValue()) {
        updates.push_back(stepFor(active.value()));
    }
    return updates;
}

} // namespace Installer
} // namespace NixBlitz
