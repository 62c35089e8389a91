#ifndef JCX_ECLUSE_IO_MYSQL_PARAMS_H
#define JCX_ECLUSE_IO_MYSQL_PARAMS_H

#include <charconv>
#include <cmath>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <variant>

#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::io {

// =============================================================================
// MySqlParams: client-side binding of @name parameters
//
// A multi-statement script cannot go through a server-side prepared
// statement, so named parameters are replaced by SQL literals before the
// script is sent. Strings are escaped by the connection
// (mysql_real_escape_string, charset aware); defaultEscape() is the
// charset-agnostic fallback used when no connection is at hand.
// =============================================================================

using Escaper = std::function<std::string(std::string_view)>;

/// Backslash escaping for NUL, \n, \r, \\, ', " and Ctrl-Z.
[[nodiscard]] inline std::string defaultEscape(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (char ch : s) {
        switch (ch) {
            case '\0':   out += "\\0"; break;
            case '\n':   out += "\\n"; break;
            case '\r':   out += "\\r"; break;
            case '\\':   out += "\\\\"; break;
            case '\'':   out += "\\'"; break;
            case '"':    out += "\\\""; break;
            case '\x1a': out += "\\Z"; break;
            default:     out += ch; break;
        }
    }
    return out;
}

/// SQL literal for one value.
/// @throws std::invalid_argument for non-finite doubles.
[[nodiscard]] inline std::string renderLiteral(const update::DbValue& value,
                                               const Escaper& escape = defaultEscape) {
    return std::visit([&](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "TRUE" : "FALSE";
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                throw std::invalid_argument("non-finite double cannot be sent to MySQL");
            }
            char buf[32];
            auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
            if (ec != std::errc{}) throw std::invalid_argument("cannot render double");
            return std::string(buf, ptr);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "'" + escape(v) + "'";
        } else if constexpr (std::is_same_v<T, valuegen::Guid>) {
            return "'" + v.toString() + "'";
        } else {
            return std::to_string(v);
        }
    }, value);
}

namespace detail {

[[nodiscard]] inline bool isVariableChar(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')
        || c == '_' || c == '$' || c == '.';
}

/// Copy a quoted section starting at sql[i] (the opening quote) and return
/// the index just past its closing quote. Backslash escapes apply inside
/// '...' and "...", not inside `...`.
inline size_t copyQuoted(std::string_view sql, size_t i, std::string& out) {
    const char quote = sql[i];
    out += sql[i++];
    while (i < sql.size()) {
        const char c = sql[i];
        out += c;
        ++i;
        if (c == '\\' && quote != '`' && i < sql.size()) {
            out += sql[i++];
        } else if (c == quote) {
            return i;
        }
    }
    return i;
}

} // namespace detail

/// Replace every @name that matches a parameter with its literal.
/// Quoted strings, quoted identifiers, comments, @@system variables and
/// unknown user variables are left untouched.
/// @throws std::invalid_argument on duplicate parameter names.
[[nodiscard]] inline std::string interpolate(std::string_view sql, const update::ParameterList& params,
                                             const Escaper& escape = defaultEscape) {
    std::unordered_map<std::string_view, const update::DbValue*> lookup;
    lookup.reserve(params.size());
    for (const auto& p : params) {
        if (!lookup.emplace(p.name, &p.value).second) {
            throw std::invalid_argument("duplicate parameter @" + p.name);
        }
    }

    std::string out;
    out.reserve(sql.size() + params.size() * 8);

    size_t i = 0;
    while (i < sql.size()) {
        const char c = sql[i];

        if (c == '\'' || c == '"' || c == '`') {
            i = detail::copyQuoted(sql, i, out);
            continue;
        }

        // -- comment (needs trailing whitespace) and # comment, to end of line
        const bool dashComment = c == '-' && i + 2 < sql.size() && sql[i + 1] == '-'
            && (sql[i + 2] == ' ' || sql[i + 2] == '\t' || sql[i + 2] == '\n');
        if (dashComment || c == '#') {
            const size_t end = sql.find('\n', i);
            const size_t stop = end == std::string_view::npos ? sql.size() : end;
            out.append(sql.substr(i, stop - i));
            i = stop;
            continue;
        }

        if (c == '/' && i + 1 < sql.size() && sql[i + 1] == '*') {
            const size_t end = sql.find("*/", i + 2);
            const size_t stop = end == std::string_view::npos ? sql.size() : end + 2;
            out.append(sql.substr(i, stop - i));
            i = stop;
            continue;
        }

        if (c == '@') {
            if (i + 1 < sql.size() && sql[i + 1] == '@') {
                size_t j = i + 2;
                while (j < sql.size() && detail::isVariableChar(sql[j])) ++j;
                out.append(sql.substr(i, j - i));
                i = j;
                continue;
            }

            size_t j = i + 1;
            while (j < sql.size() && detail::isVariableChar(sql[j])) ++j;
            auto it = lookup.find(sql.substr(i + 1, j - i - 1));
            if (j > i + 1 && it != lookup.end()) {
                out += renderLiteral(*it->second, escape);
            } else {
                out.append(sql.substr(i, j - i));
            }
            i = j;
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_MYSQL_PARAMS_H
