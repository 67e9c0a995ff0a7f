#pragma once

#include "core/SystemInfo.h"
#include "installer-engine/InstallSteps.h"
#include "installer-engine/states/State.h"
#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace NixBlitz {
namespace InstallApi {

// Full snapshot of the engine state after a transition.
struct StateChanged {
    Installer::State::Any state;

    bool operator==(const StateChanged&) const = default;
    static constexpr const char* name() { return "StateChanged"; }
};

struct SystemSummaryUpdated {
    SystemSummary summary;

    bool operator==(const SystemSummaryUpdated&) const = default;
    static constexpr const char* name() { return "SystemSummaryUpdated"; }
};

struct ProcessListUpdated {
    ProcessList processes;

    bool operator==(const ProcessListUpdated&) const = default;
    static constexpr const char* name() { return "ProcessListUpdated"; }
};

struct InstallStepUpdate {
    Installer::InstallStep step;

    bool operator==(const InstallStepUpdate&) const = default;
    static constexpr const char* name() { return "InstallStepUpdate"; }
};

// One line of build output; stderr lines carry a "[STDERR] " prefix.
struct InstallLog {
    std::string line;

    bool operator==(const InstallLog&) const = default;
    static constexpr const char* name() { return "InstallLog"; }
};

struct Error {
    std::string message;

    bool operator==(const Error&) const = default;
    static constexpr const char* name() { return "Error"; }
};

/**
 * @brief Everything the installer engine broadcasts to observers.
 */
class ServerEvent {
public:
    using Variant = std::variant<
        StateChanged,
        SystemSummaryUpdated,
        ProcessListUpdated,
        InstallStepUpdate,
        InstallLog,
        Error>;

    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, ServerEvent>)
    ServerEvent(T&& event) : variant_(std::forward<T>(event))
    {}

    ServerEvent() = default;
    bool operator==(const ServerEvent&) const = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getEventName(const ServerEvent& event)
{
    return std::visit([](auto&& e) { return std::string(e.name()); }, event.getVariant());
}

} // namespace InstallApi
} // namespace NixBlitz
