#ifndef JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_BATCH_FACTORY_H
#define JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_BATCH_FACTORY_H

#include <string>

#include "jcailloux/ecluse/config/BatchConfig.h"
#include "jcailloux/ecluse/config/ConfigurationError.h"
#include "jcailloux/ecluse/config/ProviderOptions.h"
#include "jcailloux/ecluse/update/ModificationCommandBatch.h"
#include "jcailloux/ecluse/update/UpdateSqlGenerator.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// ModificationCommandBatchFactory: fresh batch per flush cycle
//
// Options are validated once, here; create() never fails on configuration.
// The generator must outlive the factory and every batch it creates.
// =============================================================================

class ModificationCommandBatchFactory {
public:
    /// @throws config::ConfigurationError if options are invalid
    ///         (e.g. max_batch_size <= 0).
    ModificationCommandBatchFactory(const UpdateSqlGenerator& generator,
                                    const config::ProviderOptions& options)
        : generator_(&generator)
        , batch_config_(options.batch)
    {
        options.validate();
        max_batch_size_ = options.effectiveMaxBatchSize();
    }

    ModificationCommandBatchFactory(const UpdateSqlGenerator& generator,
                                    const config::BatchConfig& batch_config = config::Default)
        : ModificationCommandBatchFactory(generator, config::ProviderOptions{.batch = batch_config}) {}

    [[nodiscard]] ModificationCommandBatch create() const {
        return ModificationCommandBatch{*generator_, max_batch_size_, batch_config_};
    }

    [[nodiscard]] int maxBatchSize() const noexcept { return max_batch_size_; }
    [[nodiscard]] const config::BatchConfig& batchConfig() const noexcept { return batch_config_; }

private:
    const UpdateSqlGenerator* generator_;
    config::BatchConfig batch_config_;
    int max_batch_size_ = 0;
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_BATCH_FACTORY_H
