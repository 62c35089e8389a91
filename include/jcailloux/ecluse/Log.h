#ifndef JCX_ECLUSE_LOG_H
#define JCX_ECLUSE_LOG_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace jcailloux::ecluse::log {

// =============================================================================
// Log: callback-routed logging for ecluse
//
// The library never writes to stdout/stderr on its own. The application
// installs a callback at startup and decides where messages go; without a
// callback every ECLUSE_LOG_* statement is a no-op.
//
// A minimum level filters messages before they are formatted, so DEBUG
// statements in the batch hot path cost a single comparison when disabled.
//
// Usage:
//   ECLUSE_LOG_ERROR << "batch failed at command " << index << ": " << e.what();
//   ECLUSE_LOG_DEBUG << "executing " << count << " commands";
//
// Configuration (in application startup):
//   jcailloux::ecluse::log::setCallback([](Level level, const char* msg, size_t len) {
//       spdlog::log(toSpdlog(level), std::string_view(msg, len));
//   });
//   jcailloux::ecluse::log::setMinLevel(Level::Warn);
// =============================================================================

enum class Level : uint8_t { Debug, Warn, Error };

/// Log callback type. The application provides this to route logs.
using Callback = void(*)(Level level, const char* msg, size_t len);

namespace detail {
    inline Callback& callback() noexcept {
        static Callback cb = nullptr;
        return cb;
    }

    inline Level& minLevel() noexcept {
        static Level level = Level::Debug;
        return level;
    }
}  // namespace detail

/// Set the log callback. Pass nullptr to disable logging.
inline void setCallback(Callback cb) noexcept { detail::callback() = cb; }

/// Get the current log callback.
inline Callback getCallback() noexcept { return detail::callback(); }

/// Drop every message below `level`.
inline void setMinLevel(Level level) noexcept { detail::minLevel() = level; }

[[nodiscard]] inline Level getMinLevel() noexcept { return detail::minLevel(); }

/// True when a message at `level` would reach the callback.
[[nodiscard]] inline bool enabled(Level level) noexcept {
    return getCallback() != nullptr && level >= getMinLevel();
}

// =============================================================================
// LogStream: accumulates one message, dispatches it on destruction
// =============================================================================

class LogStream {
public:
    explicit LogStream(Level level) noexcept : level_(level) {}

    ~LogStream() {
        if (auto cb = getCallback()) {
            cb(level_, buf_.data(), buf_.size());
        }
    }

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    LogStream& operator<<(const char* s) {
        if (s) buf_ += s;
        return *this;
    }

    LogStream& operator<<(std::string_view s) {
        buf_.append(s.data(), s.size());
        return *this;
    }

    LogStream& operator<<(const std::string& s) {
        buf_ += s;
        return *this;
    }

    LogStream& operator<<(char c) {
        buf_ += c;
        return *this;
    }

    LogStream& operator<<(bool b) {
        buf_ += b ? "true" : "false";
        return *this;
    }

    template<typename T> requires std::integral<T> && (!std::same_as<T, char>) && (!std::same_as<T, bool>)
    LogStream& operator<<(T val) {
        buf_ += std::to_string(val);
        return *this;
    }

    LogStream& operator<<(double val) {
        buf_ += std::to_string(val);
        return *this;
    }

private:
    Level level_;
    std::string buf_;
};

}  // namespace jcailloux::ecluse::log

// =============================================================================
// Macros: the stream operands are only evaluated when the level is enabled
// =============================================================================

#define ECLUSE_LOG_AT(lvl) \
    if (!::jcailloux::ecluse::log::enabled(lvl)) ; \
    else ::jcailloux::ecluse::log::LogStream(lvl)

#define ECLUSE_LOG_ERROR ECLUSE_LOG_AT(::jcailloux::ecluse::log::Level::Error)
#define ECLUSE_LOG_WARN  ECLUSE_LOG_AT(::jcailloux::ecluse::log::Level::Warn)
#define ECLUSE_LOG_DEBUG ECLUSE_LOG_AT(::jcailloux::ecluse::log::Level::Debug)

#endif  // JCX_ECLUSE_LOG_H
