#pragma once

#include "Idle.h"
#include "StateForward.h"
#include "Switching.h"
#include "UpdateFailed.h"
#include "UpdateSucceeded.h"

#include <concepts>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <type_traits>
#include <variant>

namespace NixBlitz {
namespace System {
namespace State {

class Any {
public:
    using Variant = std::variant<Idle, Switching, UpdateFailed, UpdateSucceeded>;

    template <typename T>
        requires(!std::same_as<std::remove_cvref_t<T>, Any>)
    Any(T&& state) : variant_(std::forward<T>(state))
    {}

    Any() = default;
    bool operator==(const Any&) const = default;

    Variant& getVariant() { return variant_; }
    const Variant& getVariant() const { return variant_; }

private:
    Variant variant_;
};

inline std::string getCurrentStateName(const Any& state)
{
    return std::visit([](const auto& s) { return std::string(s.name()); }, state.getVariant());
}

void to_json(nlohmann::json& j, const Any& state);
void from_json(const nlohmann::json& j, Any& state);

} // namespace State
} // namespace System
} // namespace NixBlitz
