#ifndef JCX_ECLUSE_UPDATE_BATCH_EXECUTOR_H
#define JCX_ECLUSE_UPDATE_BATCH_EXECUTOR_H

#include <cstddef>
#include <span>
#include <stop_token>

#include "jcailloux/ecluse/Log.h"
#include "jcailloux/ecluse/io/Task.h"
#include "jcailloux/ecluse/update/ModificationCommand.h"
#include "jcailloux/ecluse/update/ModificationCommandBatch.h"
#include "jcailloux/ecluse/update/ModificationCommandBatchFactory.h"
#include "jcailloux/ecluse/update/ResultStream.h"
#include "jcailloux/ecluse/update/UpdateError.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// BatchExecutor: splits a list of commands into batches and runs them
//
// Commands are admitted in order. When the current batch refuses a command,
// the batch is executed and the command starts a new one. A command that
// even an empty batch refuses is an error.
//
// Usage:
//   BatchExecutor executor{factory};
//   size_t batches = executor.execute(commands, connection);
//   size_t batches = co_await executor.executeAsync(commands, connection, stop);
// =============================================================================

class BatchExecutor {
public:
    explicit BatchExecutor(const ModificationCommandBatchFactory& factory) noexcept
        : factory_(&factory) {}

    /// @return number of batches executed
    template<BatchConnection Connection>
    size_t execute(std::span<ModificationCommand* const> commands, Connection& connection) const {
        size_t executed = 0;
        auto batch = factory_->create();
        for (auto* command : commands) {
            if (batch.addCommand(*command)) continue;

            if (batch.empty()) throwTooLarge(*command);
            batch.execute(connection);
            ++executed;

            batch = factory_->create();
            if (!batch.addCommand(*command)) throwTooLarge(*command);
        }

        if (!batch.empty()) {
            batch.execute(connection);
            ++executed;
        }
        ECLUSE_LOG_DEBUG << "saved " << commands.size() << " command(s) in " << executed << " batch(es)";
        return executed;
    }

    template<AsyncBatchConnection Connection>
    io::Task<size_t> executeAsync(std::span<ModificationCommand* const> commands, Connection& connection,
                                  std::stop_token stop = {}) const {
        size_t executed = 0;
        auto batch = factory_->create();
        for (auto* command : commands) {
            if (batch.addCommand(*command)) continue;

            if (batch.empty()) throwTooLarge(*command);
            co_await batch.executeAsync(connection, stop);
            ++executed;

            batch = factory_->create();
            if (!batch.addCommand(*command)) throwTooLarge(*command);
        }

        if (!batch.empty()) {
            co_await batch.executeAsync(connection, stop);
            ++executed;
        }
        ECLUSE_LOG_DEBUG << "saved " << commands.size() << " command(s) in " << executed << " batch(es)";
        co_return executed;
    }

private:
    [[noreturn]] static void throwTooLarge(const ModificationCommand& command) {
        throw UpdateError("command exceeds batch limits: " + command.describe(), {&command});
    }

    const ModificationCommandBatchFactory* factory_;
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_BATCH_EXECUTOR_H
