/// @file value.hpp
/// @brief Field values stored in blocks, sub-blocks and variables.

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace oplog_cpp {

/// Represents an empty field.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A closed set of primitive values a field can hold.
///
/// Alternatives: Null, bool, int64_t, double, string.
using FieldValue = std::variant<
    Null,
    bool,
    std::int64_t,
    double,
    std::string
>;

/// Named field values, ordered by key.
using FieldMap = std::map<std::string, FieldValue, std::less<>>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { printf("%s\n", s.c_str()); },
///     [](std::int64_t i) { printf("%lld\n", i); },
///     [](auto&&) { printf("other\n"); },
/// }, some_variant);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- Typed extraction helpers -------------------------------------------------

/// Extract a typed value from a FieldValue, or nullopt on type mismatch.
/// @code
/// auto color = get_field<std::string>(value);
/// @endcode
template <typename T>
auto get_field(const FieldValue& v) -> std::optional<T> {
    if (const auto* t = std::get_if<T>(&v)) {
        return *t;
    }
    return std::nullopt;
}

/// Extract a typed value for a key of a FieldMap.
template <typename T>
auto get_field(const FieldMap& fields, std::string_view key) -> std::optional<T> {
    auto it = fields.find(key);
    if (it == fields.end()) return std::nullopt;
    return get_field<T>(it->second);
}

}  // namespace oplog_cpp
