#pragma once

#include "ApiError.h"
#include "Result.h"
#include <reflect>

#include <cstddef>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace NixBlitz {

/**
 * Externally tagged JSON encoding for closed unions.
 *
 * Every alternative is a struct with a static name(). Empty alternatives encode as the
 * bare name, alternatives with exactly one member encode as a single-key object whose
 * value is that member:
 *
 *   Idle                       -> "Idle"
 *   SelectDiskError{"boom"}    -> {"SelectDiskError": "boom"}
 *
 * Decoding also accepts the object form for empty alternatives ({"Idle": null}).
 */
namespace VariantSerializer {

template <typename T>
concept TaggedAlternative = requires {
    { T::name() } -> std::convertible_to<const char*>;
};

template <typename T>
inline constexpr bool is_unit_v = std::is_empty_v<T>;

template <typename T>
using payload_t = std::remove_cvref_t<decltype(reflect::get<0>(std::declval<T&>()))>;

template <TaggedAlternative T>
nlohmann::json alternativeToJson(const T& alternative)
{
    if constexpr (is_unit_v<T>) {
        return std::string(T::name());
    }
    else {
        static_assert(reflect::size<T>() == 1, "Tagged alternatives carry exactly one member");
        nlohmann::json payload = reflect::get<0>(alternative);
        return nlohmann::json{ { T::name(), std::move(payload) } };
    }
}

template <typename... Ts>
nlohmann::json toJson(const std::variant<Ts...>& variant)
{
    return std::visit([](const auto& alt) { return alternativeToJson(alt); }, variant);
}

template <typename Variant, std::size_t I = 0>
bool assignAlternative(Variant& out, const std::string& tag, const nlohmann::json& payload)
{
    if constexpr (I == std::variant_size_v<Variant>) {
        return false;
    }
    else {
        using T = std::variant_alternative_t<I, Variant>;
        if (tag != T::name()) {
            return assignAlternative<Variant, I + 1>(out, tag, payload);
        }

        T alternative{};
        if constexpr (!is_unit_v<T>) {
            if (payload.is_null()) {
                throw std::runtime_error(tag + " requires a payload");
            }
            reflect::get<0>(alternative) = payload.get<payload_t<T>>();
        }
        out = std::move(alternative);
        return true;
    }
}

/**
 * Throws std::runtime_error (or nlohmann::json::exception for a bad payload) on failure.
 */
template <typename Variant>
Variant fromJsonOrThrow(const nlohmann::json& j)
{
    std::string tag;
    nlohmann::json payload;

    if (j.is_string()) {
        tag = j.get<std::string>();
    }
    else if (j.is_object() && j.size() == 1) {
        tag = j.begin().key();
        payload = j.begin().value();
    }
    else {
        throw std::runtime_error("Expected a variant name or a single-key object");
    }

    Variant out;
    if (!assignAlternative(out, tag, payload)) {
        throw std::runtime_error("Unknown variant: " + tag);
    }
    return out;
}

template <typename Variant>
Result<Variant, ApiError> fromJson(const nlohmann::json& j)
{
    try {
        return Result<Variant, ApiError>::okay(fromJsonOrThrow<Variant>(j));
    }
    catch (const std::exception& e) {
        return Result<Variant, ApiError>::error(ApiError(e.what()));
    }
}

template <typename Variant>
Result<Variant, ApiError> fromString(const std::string& text)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e) {
        return Result<Variant, ApiError>::error(
            ApiError(std::string("JSON parse error: ") + e.what()));
    }
    return fromJson<Variant>(j);
}

} // namespace VariantSerializer
} // namespace NixBlitz
