#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json for JSON
 * generation. Member names become object keys, enums are written by enumerator name,
 * and empty optionals are omitted.
 *
 * Example:
 *   struct DiskInfo { std::string name; uint64_t size_bytes = 0; };
 *   auto j = ReflectSerializer::to_json(DiskInfo{ "sda", 64 });
 *   auto disk = ReflectSerializer::from_json<DiskInfo>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename E>
nlohmann::json enumToJson(E value)
{
    return std::string(reflect::enum_name(value));
}

template <typename E>
E enumFromJson(const nlohmann::json& j)
{
    const auto str = j.get<std::string>();
    for (const auto& [enumValue, enumName] : reflect::enumerators<E>) {
        if (enumName == str) {
            return static_cast<E>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + str);
}

template <typename V>
nlohmann::json valueToJson(const V& value)
{
    if constexpr (std::is_enum_v<V>) {
        return enumToJson(value);
    }
    else {
        return nlohmann::json(value);
    }
}

template <typename V>
V valueFromJson(const nlohmann::json& j)
{
    if constexpr (std::is_enum_v<V>) {
        return enumFromJson<V>(j);
    }
    else {
        return j.get<V>();
    }
}

/**
 * Serialize any aggregate type to nlohmann::json.
 */
template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);
            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    j[name] = valueToJson(*value);
                }
            }
            else {
                j[name] = valueToJson(value);
            }
        },
        obj);

    return j;
}

/**
 * Deserialize nlohmann::json onto an existing aggregate. Members absent from the JSON
 * keep their current value.
 */
template <typename T>
void from_json_into(const nlohmann::json& j, T& obj)
{
    if (!j.is_object()) {
        throw std::runtime_error("Expected JSON object, got " + std::string(j.type_name()));
    }

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if (!j.contains(name)) {
                return;
            }

            if constexpr (is_optional_v<MemberType>) {
                if (j[name].is_null()) {
                    reflect::get<I>(obj).reset();
                }
                else {
                    reflect::get<I>(obj) =
                        valueFromJson<typename MemberType::value_type>(j[name]);
                }
            }
            else {
                reflect::get<I>(obj) = valueFromJson<MemberType>(j[name]);
            }
        },
        obj);
}

/**
 * Deserialize nlohmann::json to any aggregate type.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};
    from_json_into(j, obj);
    return obj;
}

} // namespace ReflectSerializer
