#ifndef JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_BATCH_H
#define JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_BATCH_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

#include "jcailloux/ecluse/Log.h"
#include "jcailloux/ecluse/config/BatchConfig.h"
#include "jcailloux/ecluse/config/ConfigurationError.h"
#include "jcailloux/ecluse/io/Task.h"
#include "jcailloux/ecluse/update/ModificationCommand.h"
#include "jcailloux/ecluse/update/ResultSetMapping.h"
#include "jcailloux/ecluse/update/ResultStream.h"
#include "jcailloux/ecluse/update/UpdateError.h"
#include "jcailloux/ecluse/update/UpdateSqlGenerator.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// ModificationCommandBatch: one flush cycle worth of row changes
//
// Lifecycle:
//   1. addCommand() until it refuses (row ceiling, parameter ceiling, or the
//      script grew too long). A refused command belongs to the next batch.
//   2. execute() / executeAsync() sends the script and reconciles the reply.
//   3. The batch is discarded; the next cycle gets a fresh one.
//
// Script text is assembled lazily and only ever appended to. Consecutive
// inserts with the same table and column shape are merged into one multi-row
// INSERT; the still-open group is rendered on every retrieval and cached once
// it is closed by an incompatible command.
//
// The batch does not own its commands; they must outlive it.
// =============================================================================

class ModificationCommandBatch {
public:
    /// @throws config::ConfigurationError if max_batch_size is not positive.
    ModificationCommandBatch(const UpdateSqlGenerator& generator, int max_batch_size,
                             const config::BatchConfig& cfg = config::Default)
        : generator_(&generator)
        , config_(cfg)
        , commands_left_to_length_check_(cfg.length_check_interval)
    {
        if (max_batch_size <= 0) {
            throw config::ConfigurationError(
                "max batch size must be positive, got " + std::to_string(max_batch_size));
        }
        max_batch_size_ = std::min(max_batch_size, cfg.max_row_count);
    }

    ModificationCommandBatch(ModificationCommandBatch&&) noexcept = default;
    ModificationCommandBatch& operator=(ModificationCommandBatch&&) noexcept = default;
    ModificationCommandBatch(const ModificationCommandBatch&) = delete;
    ModificationCommandBatch& operator=(const ModificationCommandBatch&) = delete;

    // =========================================================================
    // Admission
    // =========================================================================

    /// Admit `command` into the batch. false leaves the batch unchanged.
    bool addCommand(ModificationCommand& command) {
        if (commands_.empty()) {
            resetCommandText();
        }

        if (!canAddCommand(command)) {
            return false;
        }

        commands_.push_back(&command);
        mappings_.push_back(ResultSetMapping::LastInResultSet);

        if (!isCommandTextValid()) {
            commands_.pop_back();
            mappings_.pop_back();
            parameter_count_ -= countParameters(command);
            resetCommandText();
            return false;
        }
        return true;
    }

    /// Row and parameter ceilings. Reserves the command's parameters on success.
    bool canAddCommand(const ModificationCommand& command) {
        if (full_ || commands_.size() >= static_cast<size_t>(max_batch_size_)) {
            return false;
        }

        const int additional = countParameters(command);
        if (parameter_count_ + additional >= config_.max_parameter_count) {
            return false;
        }

        parameter_count_ += additional;
        return true;
    }

    [[nodiscard]] static int countParameters(const ModificationCommand& command) noexcept {
        return command.parameterCount();
    }

    // =========================================================================
    // Command text
    // =========================================================================

    /// Full script: cached statements followed by the open insert group.
    /// Also fills the result set mapping of the open group.
    [[nodiscard]] std::string commandText() {
        updateCachedCommandText();
        return cached_text_ + bulkInsertCommandText(commands_.size());
    }

    /// Drop the cached script and the open insert group. Nothing is rendered
    /// for the dropped group; the next retrieval starts over from command 0.
    void resetCommandText() {
        cached_text_.clear();
        generator_->appendBatchHeader(cached_text_);
        next_uncached_ = 0;
        bulk_insert_commands_.clear();
    }

    /// Parameter values of every admitted command, in script order.
    [[nodiscard]] ParameterList parameters() const {
        ParameterList params;
        params.reserve(static_cast<size_t>(std::max(0, parameter_count_ - 1)));
        for (const auto* command : commands_) {
            for (const auto& c : command->columnModifications()) {
                if (c.parameter_name) {
                    params.push_back({*c.parameter_name, c.value});
                }
                if (c.original_parameter_name) {
                    params.push_back({*c.original_parameter_name, c.original_value});
                }
            }
        }
        return params;
    }

    /// Same table, same ordered written columns and same ordered read columns.
    /// Inserts that read back a row are never grouped.
    [[nodiscard]] static bool canBeInsertedInSameStatement(
            const ModificationCommand& first, const ModificationCommand& second) {
        if (first.requiresRowReadBack() || second.requiresRowReadBack()) {
            return false;
        }
        if (first.tableName() != second.tableName() || first.schema() != second.schema()) {
            return false;
        }
        return sameColumnNames(first, second, &ColumnModification::is_write)
            && sameColumnNames(first, second, &ColumnModification::is_read);
    }

    // =========================================================================
    // Execution
    // =========================================================================

    template<BatchConnection Connection>
    void execute(Connection& connection) {
        if (commands_.empty()) return;

        auto stream = [&] {
            try {
                const std::string sql = prepareCommandText();
                return connection.executeBatch(sql, parameters());
            } catch (...) {
                rethrowAsUpdateError("batch execution failed", allCommands());
            }
        }();

        consume(stream);
    }

    template<AsyncBatchConnection Connection>
    io::Task<void> executeAsync(Connection& connection, std::stop_token stop = {}) {
        if (commands_.empty()) co_return;

        std::optional<typename Connection::StreamType> stream;
        try {
            io::throwIfCancelled(stop, "before batch submission");
            const std::string sql = prepareCommandText();
            const ParameterList params = parameters();
            stream.emplace(co_await connection.executeBatchAsync(sql, params, stop));
        } catch (...) {
            rethrowAsUpdateError("batch execution failed", allCommands());
        }

        co_await consumeAsync(*stream, stop);
    }

    // =========================================================================
    // Reconciliation
    // =========================================================================

    /// Walk the reply stream in lockstep with the admitted commands.
    /// @throws ConcurrencyConflictError on an affected-row mismatch.
    /// @throws UpdateError for anything else, wrapping the original cause.
    template<ResultStream Stream>
    void consume(Stream& stream) {
        const size_t count = mappings_.size();
        size_t command_index = 0;
        try {
            while (true) {
                command_index = skipNoResultSet(command_index);
                if (command_index >= count) break;

                if (commands_[command_index]->requiresResultPropagation()) {
                    do {
                        if (propagatesIdentity(command_index)) {
                            propagateIdentity(command_index, stream.lastInsertId());
                        } else {
                            propagateRow(command_index, stream.readRow());
                        }
                    } while (++command_index < count
                             && mappings_[command_index - 1] == ResultSetMapping::NotLastInResultSet);
                } else {
                    validateAffectedRows(command_index, stream.affectedRows());
                }

                if (command_index >= count) break;
                if (!stream.nextResult()) {
                    checkNothingLeft(command_index);
                    return;
                }
            }

            size_t extra = 0;
            while (stream.nextResult()) ++extra;
            warnExtraResultSets(extra);
        } catch (...) {
            rethrowAsUpdateError("reading batch results failed", {commandAt(command_index)});
        }
    }

    template<AsyncResultStream Stream>
    io::Task<void> consumeAsync(Stream& stream, std::stop_token stop = {}) {
        const size_t count = mappings_.size();
        size_t command_index = 0;
        try {
            while (true) {
                command_index = skipNoResultSet(command_index);
                if (command_index >= count) break;

                if (commands_[command_index]->requiresResultPropagation()) {
                    do {
                        if (propagatesIdentity(command_index)) {
                            propagateIdentity(command_index, stream.lastInsertId());
                        } else {
                            io::throwIfCancelled(stop, "reading a result row");
                            propagateRow(command_index, co_await stream.readRowAsync());
                        }
                    } while (++command_index < count
                             && mappings_[command_index - 1] == ResultSetMapping::NotLastInResultSet);
                } else {
                    validateAffectedRows(command_index, stream.affectedRows());
                }

                if (command_index >= count) break;
                io::throwIfCancelled(stop, "advancing to the next result set");
                if (!co_await stream.nextResultAsync()) {
                    checkNothingLeft(command_index);
                    co_return;
                }
            }

            size_t extra = 0;
            while (true) {
                io::throwIfCancelled(stop, "draining result sets");
                if (!co_await stream.nextResultAsync()) break;
                ++extra;
            }
            warnExtraResultSets(extra);
        } catch (...) {
            rethrowAsUpdateError("reading batch results failed", {commandAt(command_index)});
        }
    }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] size_t size() const noexcept { return commands_.size(); }
    [[nodiscard]] bool empty() const noexcept { return commands_.empty(); }

    /// True once no further command can be admitted on row count or script length.
    [[nodiscard]] bool isFull() const noexcept {
        return full_ || commands_.size() >= static_cast<size_t>(max_batch_size_);
    }

    [[nodiscard]] const std::vector<ModificationCommand*>& commands() const noexcept { return commands_; }
    [[nodiscard]] const std::vector<ResultSetMapping>& resultSetMappings() const noexcept { return mappings_; }
    [[nodiscard]] int parameterCount() const noexcept { return parameter_count_; }
    [[nodiscard]] int64_t commandsLeftToLengthCheck() const noexcept { return commands_left_to_length_check_; }
    [[nodiscard]] int maxBatchSize() const noexcept { return max_batch_size_; }
    [[nodiscard]] const config::BatchConfig& batchConfig() const noexcept { return config_; }

private:
    // =========================================================================
    // Assembly
    // =========================================================================

    /// Re-check the script length once the countdown runs out.
    bool isCommandTextValid() {
        if (--commands_left_to_length_check_ >= 0) {
            return true;
        }

        const auto length = static_cast<int64_t>(commandText().size());
        const int64_t ceiling = config_.max_script_length;
        if (length >= ceiling) {
            full_ = true;
            ECLUSE_LOG_WARN << "batch full: script reached " << length << " bytes (ceiling "
                            << ceiling << ") with " << commands_.size() << " command(s)";
            return false;
        }

        const int64_t average = std::max<int64_t>(1, length / static_cast<int64_t>(commands_.size()));
        if (length + average >= ceiling) {
            // One more average command would reach the ceiling.
            full_ = true;
            ECLUSE_LOG_WARN << "batch full: " << length << " bytes, no room for another "
                            << average << "-byte command (ceiling " << ceiling << ")";
            return true;
        }

        const int64_t capacity = (ceiling - length) / average;
        commands_left_to_length_check_ = std::max<int64_t>(1, capacity / 4);
        ECLUSE_LOG_DEBUG << "script length " << length << " bytes, next check in "
                         << commands_left_to_length_check_ << " command(s)";
        return true;
    }

    void updateCachedCommandText() {
        while (next_uncached_ < commands_.size()) {
            const size_t position = next_uncached_;
            const ModificationCommand& command = *commands_[position];

            if (command.entityState() == EntityState::Added && !command.requiresRowReadBack()) {
                if (!bulk_insert_commands_.empty()
                    && !canBeInsertedInSameStatement(*bulk_insert_commands_.front(), command)) {
                    closeBulkInsertGroup(position);
                }
                bulk_insert_commands_.push_back(&command);
            } else {
                closeBulkInsertGroup(position);
                mappings_[position] = appendSingleOperation(command, position);
            }
            next_uncached_ = position + 1;
        }
    }

    ResultSetMapping appendSingleOperation(const ModificationCommand& command, size_t position) {
        switch (command.entityState()) {
            case EntityState::Added:
                return generator_->appendInsertOperation(cached_text_, command, position);
            case EntityState::Modified:
                return generator_->appendUpdateOperation(cached_text_, command, position);
            case EntityState::Deleted:
                break;
        }
        return generator_->appendDeleteOperation(cached_text_, command, position);
    }

    void closeBulkInsertGroup(size_t last_index) {
        if (bulk_insert_commands_.empty()) return;
        cached_text_ += bulkInsertCommandText(last_index);
        ECLUSE_LOG_DEBUG << "closed insert group of " << bulk_insert_commands_.size()
                         << " row(s) into " << bulk_insert_commands_.front()->tableName();
        bulk_insert_commands_.clear();
    }

    /// Render the open group, whose last member sits just before `last_index`,
    /// and record its result set mapping.
    std::string bulkInsertCommandText(size_t last_index) {
        if (bulk_insert_commands_.empty()) {
            return {};
        }

        std::string text;
        const size_t first_index = last_index - bulk_insert_commands_.size();
        const ResultSetMapping grouping =
            generator_->appendBulkInsertOperation(text, bulk_insert_commands_, last_index);

        for (size_t i = first_index; i < last_index; ++i) {
            mappings_[i] = grouping;
        }
        if (grouping != ResultSetMapping::NoResultSet) {
            mappings_[last_index - 1] = ResultSetMapping::LastInResultSet;
        }
        return text;
    }

    static bool sameColumnNames(const ModificationCommand& a, const ModificationCommand& b,
                                bool ColumnModification::*flag) {
        const auto& ca = a.columnModifications();
        const auto& cb = b.columnModifications();
        auto ia = ca.begin();
        auto ib = cb.begin();
        while (true) {
            while (ia != ca.end() && !((*ia).*flag)) ++ia;
            while (ib != cb.end() && !((*ib).*flag)) ++ib;
            if (ia == ca.end() || ib == cb.end()) {
                return ia == ca.end() && ib == cb.end();
            }
            if (ia->column_name != ib->column_name) {
                return false;
            }
            ++ia;
            ++ib;
        }
    }

    std::string prepareCommandText() {
        std::string sql = commandText();
        if (mappings_.size() != commands_.size()) {
            throw UpdateError(
                "result set mapping covers " + std::to_string(mappings_.size()) + " of "
                + std::to_string(commands_.size()) + " command(s)",
                allCommands());
        }
        ECLUSE_LOG_DEBUG << "executing batch: " << commands_.size() << " command(s), "
                         << parameter_count_ - 1 << " parameter(s), " << sql.size() << " bytes";
        return sql;
    }

    // =========================================================================
    // Reconciliation steps
    // =========================================================================

    [[nodiscard]] size_t skipNoResultSet(size_t index) const noexcept {
        while (index < mappings_.size() && mappings_[index] == ResultSetMapping::NoResultSet) {
            ++index;
        }
        return index;
    }

    /// Generated identity for a grouped insert, one returned row for
    /// everything else.
    [[nodiscard]] bool propagatesIdentity(size_t index) const noexcept {
        const ModificationCommand& command = *commands_[index];
        return command.entityState() == EntityState::Added && !command.requiresRowReadBack();
    }

    /// Exactly one row is expected.
    void propagateRow(size_t index, const std::optional<RawRow>& row) {
        ModificationCommand& command = *commands_[index];
        if (!row && command.entityState() == EntityState::Added) {
            throw UpdateError("no row read back for " + command.describe(), {&command});
        }
        if (!row) {
            ECLUSE_LOG_ERROR << "concurrency conflict: no row returned for " << command.describe();
            throw ConcurrencyConflictError(index, 1, 0, {&command});
        }
        command.propagateResults(*row);
    }

    /// Insert command: store the identity reported for its result set into
    /// the server-generated key columns.
    void propagateIdentity(size_t index, int64_t first_identity) {
        ModificationCommand& command = *commands_[index];
        const auto& columns = command.columnModifications();

        size_t position_in_group = 0;
        if (config_.identity_propagation == config::IdentityPropagation::Sequential) {
            while (position_in_group < index
                   && mappings_[index - position_in_group - 1] == ResultSetMapping::NotLastInResultSet) {
                ++position_in_group;
            }
        }
        const int64_t value = first_identity
            + static_cast<int64_t>(position_in_group) * config_.identity_increment;

        for (size_t i = 0; i < columns.size(); ++i) {
            if (!columns[i].is_key || !columns[i].is_read) continue;
            if (first_identity == 0) {
                throw UpdateError("server reported no generated identity for " + command.describe(),
                                  {&command});
            }
            command.assignGeneratedKey(i, value);
        }
    }

    /// The current result set covers `index` and every following command up
    /// to its last member; its affected-row count must match that span.
    void validateAffectedRows(size_t& index, int64_t actual) {
        const size_t start = index;
        int64_t expected = 1;
        while (++index < mappings_.size()
               && mappings_[index - 1] == ResultSetMapping::NotLastInResultSet) {
            ++expected;
        }

        if (actual != expected) {
            std::vector<const ModificationCommand*> covered(commands_.begin() + start,
                                                            commands_.begin() + index);
            ECLUSE_LOG_ERROR << "concurrency conflict at command " << start << " ("
                             << commands_[start]->describe() << "): expected " << expected
                             << " row(s), got " << actual;
            throw ConcurrencyConflictError(start, expected, actual, std::move(covered));
        }
    }

    void checkNothingLeft(size_t index) const {
        index = skipNoResultSet(index);
        if (index < mappings_.size()) {
            throw UpdateError("fewer result sets than expected: nothing returned for command "
                              + std::to_string(index) + " (" + commands_[index]->describe() + ")",
                              {commands_[index]});
        }
    }

    static void warnExtraResultSets(size_t extra) {
        if (extra > 0) {
            ECLUSE_LOG_WARN << "batch reply carried " << extra << " unexpected result set(s)";
        }
    }

    // =========================================================================
    // Errors
    // =========================================================================

    [[nodiscard]] const ModificationCommand* commandAt(size_t index) const noexcept {
        if (commands_.empty()) return nullptr;
        return commands_[std::min(index, commands_.size() - 1)];
    }

    [[nodiscard]] std::vector<const ModificationCommand*> allCommands() const {
        return {commands_.begin(), commands_.end()};
    }

    /// Must be called from a catch handler. Update errors and cancellation
    /// pass through; anything else becomes an UpdateError holding the cause.
    [[noreturn]] static void rethrowAsUpdateError(const char* what,
                                                  std::vector<const ModificationCommand*> commands) {
        try {
            throw;
        } catch (const UpdateError&) {
            throw;
        } catch (const io::OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            ECLUSE_LOG_ERROR << what << ": " << e.what();
            throw UpdateError(std::string(what) + ": " + e.what(), std::move(commands),
                              std::current_exception());
        } catch (...) {
            ECLUSE_LOG_ERROR << what << ": unknown exception";
            throw UpdateError(std::string(what) + ": unknown exception", std::move(commands),
                              std::current_exception());
        }
    }

    const UpdateSqlGenerator* generator_;
    config::BatchConfig config_;
    int max_batch_size_ = 0;

    std::vector<ModificationCommand*> commands_;
    std::vector<ResultSetMapping> mappings_;
    std::vector<const ModificationCommand*> bulk_insert_commands_;

    std::string cached_text_;
    size_t next_uncached_ = 0;

    int parameter_count_ = 1;   // slot 0 is the script itself
    int64_t commands_left_to_length_check_;
    bool full_ = false;
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_BATCH_H
