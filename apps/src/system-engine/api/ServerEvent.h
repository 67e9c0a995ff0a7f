#pragma once

#include "system-engine/states/State.h"
#include <concepts>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace NixBlitz {
namespace SystemApi {

struct StateChanged {
    System::State::Any state;

    bool operator==(const StateChanged&) const = default;
    static constexpr const char* name() { return "StateChanged"; }
};

// One line of switch output; stderr lines carry a "[STDERR] " prefix.
struct UpdateLog {
    std::string line;

    bool operator==(const UpdateLog&) const = default;
    static constexpr const char* name() { return "UpdateLog"; }
};

struct Error {
    std::string message;

    bool operator==(const Error&) const = default;
    static constexpr const char* name() { return "Error"; }
};

class ServerEvent {
public:
    using Variant = std::variant<StateChanged, UpdateLog, Error>;

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

} // namespace SystemApi
} // namespace NixBlitz
