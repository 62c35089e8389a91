#ifndef JCX_ECLUSE_UPDATE_RESULT_STREAM_H
#define JCX_ECLUSE_UPDATE_RESULT_STREAM_H

#include <concepts>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string_view>

#include "jcailloux/ecluse/io/Task.h"
#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// Result stream and connection capabilities consumed by the batch
//
// A stream is forward-only and starts positioned on the first result set.
//   affectedRows() : row count reported for the current result set
//   lastInsertId() : first identity generated by the current statement (0 if none)
//   readRow()      : next row of the current result set, nullopt when exhausted
//   nextResult()   : advance to the next result set, false when none remain
// =============================================================================

template<typename S>
concept ResultStream = requires(S& s) {
    { s.affectedRows() } -> std::convertible_to<int64_t>;
    { s.lastInsertId() } -> std::convertible_to<int64_t>;
    { s.readRow() } -> std::same_as<std::optional<RawRow>>;
    { s.nextResult() } -> std::same_as<bool>;
};

template<typename S>
concept AsyncResultStream = requires(S& s) {
    { s.affectedRows() } -> std::convertible_to<int64_t>;
    { s.lastInsertId() } -> std::convertible_to<int64_t>;
    { s.readRowAsync() } -> std::same_as<io::Task<std::optional<RawRow>>>;
    { s.nextResultAsync() } -> std::same_as<io::Task<bool>>;
};

template<typename C>
concept BatchConnection = requires(C& c, std::string_view sql, const ParameterList& params) {
    typename C::StreamType;
    { c.executeBatch(sql, params) } -> std::same_as<typename C::StreamType>;
} && ResultStream<typename C::StreamType>;

template<typename C>
concept AsyncBatchConnection = requires(C& c, std::string_view sql, const ParameterList& params,
                                        std::stop_token st) {
    typename C::StreamType;
    { c.executeBatchAsync(sql, params, st) } -> std::same_as<io::Task<typename C::StreamType>>;
} && AsyncResultStream<typename C::StreamType>;

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_RESULT_STREAM_H
