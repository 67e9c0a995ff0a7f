#pragma once

#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace NixBlitz {
namespace SystemApi {

// Build the project configuration and switch the running system to it.
struct SwitchConfig {
    bool operator==(const SwitchConfig&) const = default;
    static constexpr const char* name() { return "SwitchConfig"; }
};

struct DevReset {
    bool operator==(const DevReset&) const = default;
    static constexpr const char* name() { return "DevReset"; }
};

struct Reboot {
    bool operator==(const Reboot&) const = default;
    static constexpr const char* name() { return "Reboot"; }
};

class ClientCommand {
public:
    using Variant = std::variant<SwitchConfig, DevReset, Reboot>;

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

} // namespace SystemApi
} // namespace NixBlitz
