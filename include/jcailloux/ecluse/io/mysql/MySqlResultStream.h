#ifndef JCX_ECLUSE_IO_MYSQL_RESULT_STREAM_H
#define JCX_ECLUSE_IO_MYSQL_RESULT_STREAM_H

#include <concepts>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <utility>

#include "jcailloux/ecluse/io/Task.h"
#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::io {

/// Physical replies of one multi-statement script, one statement at a time.
/// storeResult() takes the current statement's reply; nextRawResult() moves
/// to the next statement and returns false once none remain.
template<typename S>
concept RawResultSource = requires(S& s, std::stop_token stop) {
    typename S::RawResult;
    { s.storeResult() } -> std::same_as<typename S::RawResult>;
    { s.nextRawResult() } -> std::same_as<bool>;
    { s.storeResultAsync(stop) } -> std::same_as<Task<typename S::RawResult>>;
    { s.nextRawResultAsync(stop) } -> std::same_as<Task<bool>>;
} && requires(typename S::RawResult r) {
    { r.rows.valid() } -> std::convertible_to<bool>;
    { r.rows.fetchRow() } -> std::same_as<std::optional<update::RawRow>>;
    { r.affected_rows } -> std::convertible_to<int64_t>;
    { r.insert_id } -> std::convertible_to<int64_t>;
};

// =============================================================================
// MySqlResultStream: logical result sets of one multi-statement reply
//
// The server answers every statement separately. A DML statement followed by
// its read-back SELECT yields two physical results (an OK packet, then rows);
// they are folded into one logical result set carrying the DML statement's
// affected-row count, the INSERT id and the SELECT's rows. Folding needs one
// physical result of lookahead, held in pending_.
//
// Rows are stored client side (mysql_store_result), so readRowAsync() never
// suspends. Only advancing between results touches the socket.
//
// Source models RawResultSource. The class is left unconstrained so a
// connection can name its stream type inside its own definition.
// The stream borrows its source; it must not outlive it.
// =============================================================================

template<typename Source>
class MySqlResultStream {
public:
    using RawResult = typename Source::RawResult;

    explicit MySqlResultStream(Source& source, std::stop_token stop = {}) noexcept
        : source_(&source), stop_(std::move(stop)) {}

    MySqlResultStream(MySqlResultStream&&) noexcept = default;
    MySqlResultStream& operator=(MySqlResultStream&&) noexcept = default;
    MySqlResultStream(const MySqlResultStream&) = delete;
    MySqlResultStream& operator=(const MySqlResultStream&) = delete;

    /// Load the first logical result set. Called once, right after the
    /// script was sent.
    void start() { load(source_->storeResult()); }

    Task<void> startAsync() {
        co_await loadAsync(co_await source_->storeResultAsync(stop_));
    }

    [[nodiscard]] int64_t affectedRows() const noexcept { return current_.affected_rows; }
    [[nodiscard]] int64_t lastInsertId() const noexcept { return current_.insert_id; }

    [[nodiscard]] std::optional<update::RawRow> readRow() {
        return current_.rows.fetchRow();
    }

    bool nextResult() {
        if (pending_) {
            auto first = std::move(*pending_);
            pending_.reset();
            load(std::move(first));
            return true;
        }
        if (!source_->nextRawResult()) {
            current_ = {};
            return false;
        }
        load(source_->storeResult());
        return true;
    }

    Task<std::optional<update::RawRow>> readRowAsync() {
        return Task<std::optional<update::RawRow>>::fromValue(readRow());
    }

    Task<bool> nextResultAsync() {
        if (pending_) {
            auto first = std::move(*pending_);
            pending_.reset();
            co_await loadAsync(std::move(first));
            co_return true;
        }
        if (!co_await source_->nextRawResultAsync(stop_)) {
            current_ = {};
            co_return false;
        }
        co_await loadAsync(co_await source_->storeResultAsync(stop_));
        co_return true;
    }

private:
    /// Make `first` current, absorbing the next physical result if it is
    /// the row set of a column-less statement.
    void load(RawResult first) {
        if (first.rows.valid() || !source_->nextRawResult()) {
            current_ = std::move(first);
            return;
        }
        fold(std::move(first), source_->storeResult());
    }

    Task<void> loadAsync(RawResult first) {
        if (first.rows.valid() || !co_await source_->nextRawResultAsync(stop_)) {
            current_ = std::move(first);
            co_return;
        }
        fold(std::move(first), co_await source_->storeResultAsync(stop_));
    }

    void fold(RawResult first, RawResult next) {
        if (next.rows.valid()) {
            next.affected_rows = first.affected_rows;
            next.insert_id = first.insert_id;
            current_ = std::move(next);
        } else {
            current_ = std::move(first);
            pending_ = std::move(next);
        }
    }

    Source* source_;
    std::stop_token stop_;
    RawResult current_;
    std::optional<RawResult> pending_;
};

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_MYSQL_RESULT_STREAM_H
