#ifndef JCX_ECLUSE_IO_TASK_H
#define JCX_ECLUSE_IO_TASK_H

#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace jcailloux::ecluse::io {

// =============================================================================
// OperationCancelled: outcome of a stop request observed at a suspension point
//
// Never wrapped by the update layer: a cancelled batch surfaces as this type,
// not as an UpdateError.
// =============================================================================

class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("operation cancelled") {}
    explicit OperationCancelled(const std::string& what)
        : std::runtime_error("operation cancelled: " + what) {}
};

/// Throw OperationCancelled if a stop was requested on `stop`.
inline void throwIfCancelled(const std::stop_token& stop, const char* where = nullptr) {
    if (stop.stop_requested()) {
        if (where) throw OperationCancelled(where);
        throw OperationCancelled();
    }
}

template<typename T = void>
class Task;

namespace detail {

struct PromiseBase {
    std::coroutine_handle<> continuation_ = std::noop_coroutine();

    struct FinalAwaiter {
        [[nodiscard]] bool await_ready() const noexcept { return false; }

        template<typename Promise>
        [[nodiscard]] std::coroutine_handle<>
        await_suspend(std::coroutine_handle<Promise> h) noexcept {
            return h.promise().continuation_;
        }

        void await_resume() noexcept {}
    };

    [[nodiscard]] std::suspend_always initial_suspend() noexcept { return {}; }
    [[nodiscard]] FinalAwaiter final_suspend() noexcept { return {}; }
};

} // namespace detail

// Task<T>: lazy, awaitable, move-only coroutine with symmetric transfer
//
// Nothing runs until the Task is co_awaited. The awaiting coroutine is resumed
// from the final suspend point of the callee, so deep co_await chains do not
// grow the native stack.
//
// fromValue(T) builds a pre-resolved Task: no frame is allocated and
// await_ready() is true. Adapters whose data is already buffered (a stored
// MySQL result, a scripted test stream) answer through this path.

template<typename T>
class Task {
public:
    using value_type = T;

    struct promise_type : detail::PromiseBase {
        std::variant<std::monostate, T, std::exception_ptr> result_;

        Task get_return_object() noexcept {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        template<typename U>
            requires std::is_constructible_v<T, U&&>
        void return_value(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>) {
            result_.template emplace<1>(std::forward<U>(value));
        }

        void unhandled_exception() noexcept {
            result_.template emplace<2>(std::current_exception());
        }
    };

    static Task fromValue(T value) noexcept(std::is_nothrow_move_constructible_v<T>) {
        return Task{std::move(value)};
    }

    Task() noexcept = default;
    explicit Task(std::coroutine_handle<promise_type> h) noexcept : handle_(h) {}
    ~Task() { if (handle_) handle_.destroy(); }

    Task(Task&& o) noexcept
        : handle_(std::exchange(o.handle_, nullptr))
        , ready_value_(std::move(o.ready_value_)) {}
    Task& operator=(Task&& o) noexcept {
        if (this != &o) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(o.handle_, nullptr);
            ready_value_ = std::move(o.ready_value_);
        }
        return *this;
    }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] bool await_ready() const noexcept { return ready_value_.has_value(); }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
        handle_.promise().continuation_ = caller;
        return handle_;
    }

    T await_resume() {
        if (ready_value_) return std::move(*ready_value_);
        auto& result = handle_.promise().result_;
        if (auto* ex = std::get_if<2>(&result))
            std::rethrow_exception(*ex);
        return std::move(std::get<1>(result));
    }

private:
    explicit Task(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : ready_value_(std::move(value)) {}

    std::coroutine_handle<promise_type> handle_ = nullptr;
    std::optional<T> ready_value_;
};

// Task<void> specialization

template<>
class Task<void> {
public:
    using value_type = void;

    struct promise_type : detail::PromiseBase {
        std::exception_ptr exception_;

        Task get_return_object() noexcept {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        void return_void() noexcept {}

        void unhandled_exception() noexcept {
            exception_ = std::current_exception();
        }
    };

    /// Pre-resolved void Task (no coroutine frame).
    static Task ready() noexcept {
        Task t;
        t.ready_ = true;
        return t;
    }

    Task() noexcept = default;
    explicit Task(std::coroutine_handle<promise_type> h) noexcept : handle_(h) {}
    ~Task() { if (handle_) handle_.destroy(); }

    Task(Task&& o) noexcept
        : handle_(std::exchange(o.handle_, nullptr))
        , ready_(o.ready_) {}
    Task& operator=(Task&& o) noexcept {
        if (this != &o) {
            if (handle_) handle_.destroy();
            handle_ = std::exchange(o.handle_, nullptr);
            ready_ = o.ready_;
        }
        return *this;
    }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] bool await_ready() const noexcept { return ready_; }

    std::coroutine_handle<> await_suspend(std::coroutine_handle<> caller) noexcept {
        handle_.promise().continuation_ = caller;
        return handle_;
    }

    void await_resume() {
        if (ready_) return;
        if (handle_.promise().exception_)
            std::rethrow_exception(handle_.promise().exception_);
    }

private:
    std::coroutine_handle<promise_type> handle_ = nullptr;
    bool ready_ = false;
};

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_TASK_H
