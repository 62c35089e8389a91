#ifndef JCX_ECLUSE_IO_CONTEXT_H
#define JCX_ECLUSE_IO_CONTEXT_H

#include <concepts>
#include <cstdint>
#include <functional>
#include <utility>

namespace jcailloux::ecluse::io {

enum class IoEvent : uint8_t {
    None    = 0,
    Read    = 1 << 0,
    Write   = 1 << 1,
    Error   = 1 << 2,
};

[[nodiscard]] constexpr IoEvent operator|(IoEvent a, IoEvent b) noexcept {
    return static_cast<IoEvent>(
        static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr IoEvent operator&(IoEvent a, IoEvent b) noexcept {
    return static_cast<IoEvent>(
        static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}

constexpr IoEvent& operator|=(IoEvent& a, IoEvent b) noexcept {
    return a = a | b;
}

[[nodiscard]] constexpr bool hasEvent(IoEvent set, IoEvent flag) noexcept {
    return (set & flag) != IoEvent::None;
}

// IoContext: the event loop the application runs (epoll, io_uring, asio, ...)
//
// The adapters only need socket readiness callbacks and a way to defer a
// callback to the next loop iteration.

template<typename T>
concept IoContext = requires(
    T& ctx,
    int fd,
    IoEvent events,
    std::function<void(IoEvent)> io_cb,
    std::function<void()> cb,
    typename T::WatchHandle handle
) {
    { ctx.addWatch(fd, events, std::move(io_cb)) } -> std::same_as<typename T::WatchHandle>;
    { ctx.removeWatch(handle) } -> std::same_as<void>;
    { ctx.updateWatch(handle, events) } -> std::same_as<void>;
    { ctx.post(std::move(cb)) } -> std::same_as<void>;
};

// =============================================================================
// SocketWatch: at most one active readiness watch on one socket
//
// arm() replaces any previous watch, disarm() is idempotent, and the
// destructor removes whatever is still registered.
// =============================================================================

template<IoContext Io>
class SocketWatch {
public:
    explicit SocketWatch(Io& io) noexcept : io_(&io) {}

    ~SocketWatch() { disarm(); }

    SocketWatch(SocketWatch&& o) noexcept
        : io_(o.io_)
        , handle_(std::exchange(o.handle_, {}))
        , active_(std::exchange(o.active_, false)) {}

    SocketWatch& operator=(SocketWatch&& o) noexcept {
        if (this != &o) {
            disarm();
            io_ = o.io_;
            handle_ = std::exchange(o.handle_, {});
            active_ = std::exchange(o.active_, false);
        }
        return *this;
    }

    SocketWatch(const SocketWatch&) = delete;
    SocketWatch& operator=(const SocketWatch&) = delete;

    void arm(int fd, IoEvent events, std::function<void(IoEvent)> cb) {
        disarm();
        handle_ = io_->addWatch(fd, events, std::move(cb));
        active_ = true;
    }

    void update(IoEvent events) {
        if (active_) io_->updateWatch(handle_, events);
    }

    void disarm() {
        if (active_) {
            io_->removeWatch(handle_);
            active_ = false;
        }
    }

    [[nodiscard]] bool active() const noexcept { return active_; }

    [[nodiscard]] Io& context() const noexcept { return *io_; }

private:
    Io* io_;
    typename Io::WatchHandle handle_{};
    bool active_ = false;
};

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_CONTEXT_H
