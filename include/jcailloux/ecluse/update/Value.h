#ifndef JCX_ECLUSE_UPDATE_VALUE_H
#define JCX_ECLUSE_UPDATE_VALUE_H

#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>
#include <vector>

#include "jcailloux/ecluse/valuegen/Guid.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// ColumnType: declared storage type of a column
//
// Drives text -> value conversion of returned rows and the conversion of a
// generated identity before it is written into a key slot.
// =============================================================================

enum class ColumnType : uint8_t {
    Bool,
    Int32,
    Int64,
    Double,
    String,
    Guid
};

/// A column value. monostate is SQL NULL.
using DbValue = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string, valuegen::Guid>;

/// One returned row, text protocol: nullopt is NULL.
using RawRow = std::vector<std::optional<std::string>>;

/// A named parameter bound to the batch script (referenced as @name).
struct ParameterBinding {
    std::string name;
    DbValue value;
};

using ParameterList = std::vector<ParameterBinding>;

[[nodiscard]] inline bool isNull(const DbValue& v) noexcept {
    return std::holds_alternative<std::monostate>(v);
}

[[nodiscard]] inline const char* toString(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::Bool:   return "bool";
        case ColumnType::Int32:  return "int32";
        case ColumnType::Int64:  return "int64";
        case ColumnType::Double: return "double";
        case ColumnType::String: return "string";
        case ColumnType::Guid:   return "guid";
    }
    return "unknown";
}

namespace detail {

template<typename T>
T parseNumber(std::string_view raw, ColumnType type) {
    T val{};
    auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), val);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        throw std::invalid_argument(
            "cannot convert '" + std::string(raw) + "' to " + toString(type));
    }
    return val;
}

}  // namespace detail

/// Convert one text-protocol field into a typed value.
/// @throws std::invalid_argument if the text does not fit the declared type.
[[nodiscard]] inline DbValue parseValue(ColumnType type, const std::optional<std::string>& raw) {
    if (!raw) return std::monostate{};
    std::string_view sv = *raw;

    switch (type) {
        case ColumnType::Bool:
            if (sv == "1" || sv == "true" || sv == "TRUE") return true;
            if (sv == "0" || sv == "false" || sv == "FALSE") return false;
            throw std::invalid_argument("cannot convert '" + *raw + "' to bool");
        case ColumnType::Int32:
            return detail::parseNumber<int32_t>(sv, type);
        case ColumnType::Int64:
            return detail::parseNumber<int64_t>(sv, type);
        case ColumnType::Double:
            return detail::parseNumber<double>(sv, type);
        case ColumnType::String:
            return *raw;
        case ColumnType::Guid:
            if (auto g = valuegen::Guid::parse(sv)) return *g;
            throw std::invalid_argument("cannot convert '" + *raw + "' to guid");
    }
    throw std::invalid_argument("unknown column type");
}

/// Human-readable rendering for diagnostics (not SQL).
[[nodiscard]] inline std::string toDisplayString(const DbValue& v) {
    return std::visit([](const auto& x) -> std::string {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) return "NULL";
        else if constexpr (std::is_same_v<T, bool>) return x ? "true" : "false";
        else if constexpr (std::is_same_v<T, std::string>) return "'" + x + "'";
        else if constexpr (std::is_same_v<T, valuegen::Guid>) return x.toString();
        else return std::to_string(x);
    }, v);
}

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_VALUE_H
