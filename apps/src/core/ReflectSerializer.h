#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <reflect>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace ReflectSerializerAdl {

// Wrapping the json reference stops nlohmann's own templated to_json/from_json from matching,
// so the traits below only detect hand-written overloads found by ADL.
struct JsonAdapter {
    nlohmann::json& json;
    operator nlohmann::json&() const { return json; }
};

struct ConstJsonAdapter {
    const nlohmann::json& json;
    operator const nlohmann::json&() const { return json; }
};

template <typename T>
auto test_to_json(int)
    -> decltype(to_json(JsonAdapter{ std::declval<nlohmann::json&>() }, std::declval<const T&>()), std::true_type{});

template <typename T>
std::false_type test_to_json(...);

template <typename T>
inline constexpr bool has_adl_to_json_v = decltype(test_to_json<T>(0))::value;

template <typename T>
auto test_from_json(int)
    -> decltype(from_json(ConstJsonAdapter{ std::declval<const nlohmann::json&>() }, std::declval<T&>()), std::true_type{});

template <typename T>
std::false_type test_from_json(...);

template <typename T>
inline constexpr bool has_adl_from_json_v = decltype(test_from_json<T>(0))::value;

} // namespace ReflectSerializerAdl

/**
 * Reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time member introspection and nlohmann/json for the
 * document. Enums use an ADL to_json/from_json pair when one exists, otherwise the
 * enumerator name.
 *
 * Example:
 *   struct Rates { double mutation = 0.1; double crossover = 0.7; };
 *   auto j = ReflectSerializer::to_json(Rates{});
 *   auto rates = ReflectSerializer::from_json<Rates>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename E>
nlohmann::json enumToJson(const E& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_to_json_v<E>) {
        nlohmann::json j;
        to_json(ReflectSerializerAdl::JsonAdapter{ j }, value);
        return j;
    }
    else {
        return std::string(reflect::enum_name(value));
    }
}

template <typename E>
void enumFromJson(const nlohmann::json& j, E& value)
{
    if constexpr (ReflectSerializerAdl::has_adl_from_json_v<E>) {
        from_json(ReflectSerializerAdl::ConstJsonAdapter{ j }, value);
    }
    else {
        const auto str = j.get<std::string>();
        for (const auto& [enumValue, enumName] : reflect::enumerators<E>) {
            if (enumName == str) {
                value = static_cast<E>(enumValue);
                return;
            }
        }
        throw std::runtime_error("Invalid enum value: " + str);
    }
}

/**
 * Serialize any aggregate type to nlohmann::json. Empty optionals are omitted.
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
                    if constexpr (std::is_enum_v<typename MemberType::value_type>) {
                        j[name] = enumToJson(*value);
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = enumToJson(value);
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

/**
 * Deserialize nlohmann::json to any aggregate type. Members absent from the document keep
 * their default member initializers.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            const auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name) || j.at(name).is_null()) {
                return;
            }

            auto& member = reflect::get<I>(obj);
            using MemberType = std::remove_reference_t<decltype(member)>;

            if constexpr (is_optional_v<MemberType>) {
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    InnerType enumValue{};
                    enumFromJson(j.at(name), enumValue);
                    member = enumValue;
                }
                else {
                    member = j.at(name).template get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                enumFromJson(j.at(name), member);
            }
            else {
                member = j.at(name).template get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
