#ifndef JCX_ECLUSE_IO_MYSQL_CONNECTION_H
#define JCX_ECLUSE_IO_MYSQL_CONNECTION_H

#include <coroutine>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <mysql.h>

#include "jcailloux/ecluse/Log.h"
#include "jcailloux/ecluse/config/ProviderOptions.h"
#include "jcailloux/ecluse/io/IoContext.h"
#include "jcailloux/ecluse/io/Task.h"
#include "jcailloux/ecluse/io/mysql/MySqlError.h"
#include "jcailloux/ecluse/io/mysql/MySqlParams.h"
#include "jcailloux/ecluse/io/mysql/MySqlResult.h"
#include "jcailloux/ecluse/io/mysql/MySqlResultStream.h"
#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::io {

// =============================================================================
// MySqlConnection: RAII MariaDB Connector/C connection driven by an IoContext
//
// Blocking calls (open, executeBatch) and non-blocking calls (connect,
// executeBatchAsync) can be mixed on the same connection. The non-blocking
// path uses the *_start / *_cont API: each step reports which socket events
// it waits for, the IoContext watch resumes the coroutine when they fire.
//
// Connected with:
//   CLIENT_MULTI_STATEMENTS  a batch is one script of many statements
//   CLIENT_MULTI_RESULTS     one reply per statement
//   CLIENT_FOUND_ROWS        affected rows = matched rows, so an UPDATE that
//                            leaves a row unchanged still counts as 1
//
// A stop request during a non-blocking step abandons it: the coroutine
// resumes with OperationCancelled and the connection is marked broken, since
// the protocol state is unknown. A broken connection must be discarded.
// =============================================================================

template<IoContext Io>
class MySqlConnection {
public:
    using StreamType = MySqlResultStream<MySqlConnection>;
    using RawResult = MySqlRawResult;

    static constexpr unsigned long kClientFlags =
        CLIENT_MULTI_STATEMENTS | CLIENT_MULTI_RESULTS | CLIENT_FOUND_ROWS;

    MySqlConnection(Io& io, MYSQL* mysql) noexcept
        : watch_(io), mysql_(mysql) {}

    ~MySqlConnection() {
        watch_.disarm();
        if (mysql_) mysql_close(mysql_);
    }

    // Move only
    MySqlConnection(MySqlConnection&& o) noexcept
        : watch_(std::move(o.watch_))
        , mysql_(std::exchange(o.mysql_, nullptr))
        , broken_(std::exchange(o.broken_, false)) {}

    MySqlConnection& operator=(MySqlConnection&& o) noexcept {
        if (this != &o) {
            watch_ = std::move(o.watch_);
            if (mysql_) mysql_close(mysql_);
            mysql_ = std::exchange(o.mysql_, nullptr);
            broken_ = std::exchange(o.broken_, false);
        }
        return *this;
    }

    MySqlConnection(const MySqlConnection&) = delete;
    MySqlConnection& operator=(const MySqlConnection&) = delete;

    // Connection state

    [[nodiscard]] bool connected() const noexcept { return mysql_ && !broken_; }
    [[nodiscard]] bool broken() const noexcept { return broken_; }

    [[nodiscard]] int socket() const noexcept {
        return mysql_ ? static_cast<int>(mysql_get_socket(mysql_)) : -1;
    }

    [[nodiscard]] MYSQL* raw() const noexcept { return mysql_; }

    // Blocking connect (static factory)

    static MySqlConnection open(Io& io, const config::ConnectionOptions& opts) {
        MySqlConnection conn(io, mysql_init(nullptr));
        conn.configure(opts);

        if (!mysql_real_connect(conn.mysql_, cstr(opts.host), cstr(opts.user), cstr(opts.password),
                                cstr(opts.database), opts.port, cstr(opts.unix_socket), kClientFlags)) {
            throw MySqlConnectionError("connect failed: " + conn.lastError(), mysql_errno(conn.mysql_));
        }
        return conn;
    }

    // Async connect (static factory)

    static Task<MySqlConnection> connect(Io& io, config::ConnectionOptions opts,
                                         std::stop_token stop = {}) {
        MySqlConnection conn(io, mysql_init(nullptr));
        conn.configure(opts);

        MYSQL* ret = nullptr;
        int status = mysql_real_connect_start(&ret, conn.mysql_, cstr(opts.host), cstr(opts.user),
                                              cstr(opts.password), cstr(opts.database), opts.port,
                                              cstr(opts.unix_socket), kClientFlags);
        co_await conn.awaitOperation(status, [&conn, &ret](int ready) {
            return mysql_real_connect_cont(&ret, conn.mysql_, ready);
        }, stop);

        if (!ret) {
            throw MySqlConnectionError("async connect failed: " + conn.lastError(), mysql_errno(conn.mysql_));
        }
        co_return std::move(conn);
    }

    /// Charset-aware string escaping (mysql_real_escape_string).
    [[nodiscard]] std::string escape(std::string_view s) const {
        std::string out(s.size() * 2 + 1, '\0');
        const unsigned long n = mysql_real_escape_string(mysql_, out.data(), s.data(),
                                                         static_cast<unsigned long>(s.size()));
        out.resize(n);
        return out;
    }

    // Batch execution

    StreamType executeBatch(std::string_view sql, const update::ParameterList& params) {
        throwIfUnusable();
        drainPendingResults();

        const std::string script = interpolate(sql, params, escaper());
        if (mysql_real_query(mysql_, script.data(), static_cast<unsigned long>(script.size())) != 0) {
            throw MySqlError("batch failed: " + lastError(), mysql_errno(mysql_));
        }

        StreamType stream(*this);
        stream.start();
        return stream;
    }

    Task<StreamType> executeBatchAsync(std::string_view sql, const update::ParameterList& params,
                                       std::stop_token stop) {
        throwIfUnusable();
        co_await drainPendingResultsAsync(stop);

        const std::string script = interpolate(sql, params, escaper());
        int err = 0;
        int status = mysql_real_query_start(&err, mysql_, script.data(),
                                            static_cast<unsigned long>(script.size()));
        co_await awaitOperation(status, [this, &err](int ready) {
            return mysql_real_query_cont(&err, mysql_, ready);
        }, stop);
        if (err != 0) {
            throw MySqlError("batch failed: " + lastError(), mysql_errno(mysql_));
        }

        StreamType stream(*this, stop);
        co_await stream.startAsync();
        co_return std::move(stream);
    }

    // =========================================================================
    // Physical results (RawResultSource, read by MySqlResultStream)
    // =========================================================================

    MySqlRawResult storeResult() {
        return makeRaw(mysql_store_result(mysql_));
    }

    /// Advance to the next statement's reply. false when none remain.
    /// @throws MySqlError if that statement failed.
    bool nextRawResult() {
        if (!mysql_more_results(mysql_)) return false;
        const int rc = mysql_next_result(mysql_);
        if (rc > 0) {
            throw MySqlError("statement failed: " + lastError(), mysql_errno(mysql_));
        }
        return rc == 0;
    }

    Task<MySqlRawResult> storeResultAsync(std::stop_token stop) {
        MYSQL_RES* res = nullptr;
        int status = mysql_store_result_start(&res, mysql_);
        co_await awaitOperation(status, [this, &res](int ready) {
            return mysql_store_result_cont(&res, mysql_, ready);
        }, stop);
        co_return makeRaw(res);
    }

    Task<bool> nextRawResultAsync(std::stop_token stop) {
        if (!mysql_more_results(mysql_)) co_return false;

        int rc = 0;
        int status = mysql_next_result_start(&rc, mysql_);
        co_await awaitOperation(status, [this, &rc](int ready) {
            return mysql_next_result_cont(&rc, mysql_, ready);
        }, stop);
        if (rc > 0) {
            throw MySqlError("statement failed: " + lastError(), mysql_errno(mysql_));
        }
        co_return rc == 0;
    }

private:

    static const char* cstr(const std::string& s) noexcept {
        return s.empty() ? nullptr : s.c_str();
    }

    void configure(const config::ConnectionOptions& opts) {
        if (!mysql_) {
            throw MySqlConnectionError("mysql_init returned null");
        }
        if (mysql_options(mysql_, MYSQL_OPT_NONBLOCK, nullptr) != 0) {
            throw MySqlConnectionError("cannot enable non-blocking mode: " + lastError());
        }
        if (mysql_options(mysql_, MYSQL_SET_CHARSET_NAME, opts.charset.c_str()) != 0) {
            throw MySqlConnectionError("cannot set charset " + opts.charset + ": " + lastError());
        }
    }

    [[nodiscard]] std::string lastError() const {
        return mysql_ ? std::string(mysql_error(mysql_)) : std::string("no connection");
    }

    void throwIfUnusable() const {
        if (!mysql_) throw MySqlConnectionError("connection is closed");
        if (broken_) throw MySqlConnectionError("connection abandoned by a cancelled operation");
    }

    Escaper escaper() const {
        return [this](std::string_view s) { return escape(s); };
    }

    MySqlRawResult makeRaw(MYSQL_RES* res) {
        MySqlResult rows(res);
        if (!res && mysql_field_count(mysql_) != 0) {
            throw MySqlError("cannot store result: " + lastError(), mysql_errno(mysql_));
        }
        return {std::move(rows),
                static_cast<int64_t>(mysql_affected_rows(mysql_)),
                static_cast<int64_t>(mysql_insert_id(mysql_))};
    }

    /// Discard replies a previous stream did not read.
    void drainPendingResults() {
        size_t drained = 0;
        while (nextRawResult()) {
            storeResult();
            ++drained;
        }
        if (drained > 0) {
            ECLUSE_LOG_DEBUG << "discarded " << drained << " unread result(s)";
        }
    }

    Task<void> drainPendingResultsAsync(std::stop_token stop) {
        size_t drained = 0;
        while (co_await nextRawResultAsync(stop)) {
            co_await storeResultAsync(stop);
            ++drained;
        }
        if (drained > 0) {
            ECLUSE_LOG_DEBUG << "discarded " << drained << " unread result(s)";
        }
    }

    // =========================================================================
    // Non-blocking step awaiter
    // =========================================================================

    static IoEvent toIoEvents(int status) noexcept {
        IoEvent events = IoEvent::None;
        if (status & MYSQL_WAIT_READ) events |= IoEvent::Read;
        if (status & MYSQL_WAIT_WRITE) events |= IoEvent::Write;
        if (status & MYSQL_WAIT_EXCEPT) events |= IoEvent::Error;
        return events;
    }

    static int toWaitStatus(IoEvent events) noexcept {
        int ready = 0;
        if (hasEvent(events, IoEvent::Read)) ready |= MYSQL_WAIT_READ;
        if (hasEvent(events, IoEvent::Write)) ready |= MYSQL_WAIT_WRITE;
        if (hasEvent(events, IoEvent::Error)) ready |= MYSQL_WAIT_EXCEPT;
        return ready;
    }

    struct OperationAwaiter {
        struct Cancel {
            OperationAwaiter* self;
            void operator()() const noexcept { self->cancel(); }
        };

        MySqlConnection* conn;
        int status;                         // wait flags of the last step, 0 = done
        std::function<int(int)> resume_op;  // *_cont with the ready flags
        std::stop_token stop;
        std::coroutine_handle<> continuation{};
        std::optional<std::stop_callback<Cancel>> on_stop{};
        bool cancelled = false;

        [[nodiscard]] bool await_ready() const noexcept { return status == 0; }

        void await_suspend(std::coroutine_handle<> h) {
            continuation = h;
            wait();
            if (stop.stop_possible()) {
                on_stop.emplace(stop, Cancel{this});
            }
        }

        void await_resume() {
            on_stop.reset();
            if (cancelled) {
                throw OperationCancelled("mysql operation abandoned");
            }
        }

    private:
        void wait() {
            const IoEvent events = toIoEvents(status);
            if (events == IoEvent::None) {
                // Only a timeout was requested: let the client library handle it.
                conn->watch_.disarm();
                conn->watch_.context().post([this] { step(MYSQL_WAIT_TIMEOUT); });
                return;
            }
            if (conn->watch_.active()) {
                conn->watch_.update(events);
            } else {
                conn->watch_.arm(conn->socket(), events, [this](IoEvent ready) {
                    step(toWaitStatus(ready));
                });
            }
        }

        void step(int ready) {
            if (cancelled) return;
            status = resume_op(ready);
            if (status == 0) {
                conn->watch_.disarm();
                continuation.resume();
                return;
            }
            wait();
        }

        void cancel() noexcept {
            if (cancelled || status == 0) return;
            cancelled = true;
            conn->broken_ = true;
            conn->watch_.disarm();
            auto h = continuation;
            conn->watch_.context().post([h] { h.resume(); });
        }
    };

    OperationAwaiter awaitOperation(int status, std::function<int(int)> resume_op, std::stop_token stop) {
        return OperationAwaiter{this, status, std::move(resume_op), std::move(stop)};
    }

    SocketWatch<Io> watch_;
    MYSQL* mysql_ = nullptr;
    bool broken_ = false;
};

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_MYSQL_CONNECTION_H
