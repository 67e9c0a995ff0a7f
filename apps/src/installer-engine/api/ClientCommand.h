#pragma once

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace NixBlitz {
namespace InstallApi {

struct PerformSystemCheck {
    bool operator==(const PerformSystemCheck&) const = default;
    static constexpr const char* name() { return "PerformSystemCheck"; }
};

struct GetSystemSummary {
    bool operator==(const GetSystemSummary&) const = default;
    static constexpr const char* name() { return "GetSystemSummary"; }
};

struct GetProcessList {
    bool operator==(const GetProcessList&) const = default;
    static constexpr const char* name() { return "GetProcessList"; }
};

struct UpdateConfig {
    bool operator==(const UpdateConfig&) const = default;
    static constexpr const char* name() { return "UpdateConfig"; }
};

struct UpdateConfigFinished {
    bool operator==(const UpdateConfigFinished&) const = default;
    static constexpr const char* name() { return "UpdateConfigFinished"; }
};

struct InstallDiskSelected {
    std::string path;

    bool operator==(const InstallDiskSelected&) const = default;
    static constexpr const char* name() { return "InstallDiskSelected"; }
};

struct StartInstallation {
    bool operator==(const StartInstallation&) const = default;
    static constexpr const char* name() { return "StartInstallation"; }
};

struct DevReset {
    bool operator==(const DevReset&) const = default;
    static constexpr const char* name() { return "DevReset"; }
};

/**
 * @brief Everything an observer can ask the installer engine to do.
 */
class ClientCommand {
public:
    using Variant = std::variant<
        PerformSystemCheck,
        GetSystemSummary,
        GetProcessList,
        UpdateConfig,
        UpdateConfigFinished,
        InstallDiskSelected,
        StartInstallation,
        DevReset>;

    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, ClientCommand>)
    ClientCommand(T&& command) : variant_(std::forward<T>(command))
    {}

    ClientCommand() = default;
    bool operator==(const ClientCommand&) const = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getCommandName(const ClientCommand& command)
{
    return std::visit([](auto&& c) { return std::string(c.name()); }, command.getVariant());
}

} // namespace InstallApi
} // namespace NixBlitz
