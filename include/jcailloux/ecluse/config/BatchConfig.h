#ifndef JCX_ECLUSE_CONFIG_BATCH_CONFIG_H
#define JCX_ECLUSE_CONFIG_BATCH_CONFIG_H

#include <cstdint>

namespace jcailloux::ecluse::config {

// =========================================================================
// Identity propagation - how a grouped INSERT hands out generated keys
// =========================================================================
enum class IdentityPropagation : uint8_t {
    Uniform,     // every row of the group receives the reported identity
    Sequential   // k-th row receives identity + k * identity_increment
};

// =========================================================================
// BatchConfig - ceilings and heuristics owned by one batch instance
// =========================================================================
//
// Usage:
//   ModificationCommandBatch batch{gen, config::Default};
//   ModificationCommandBatch batch{gen,
//       config::Default.with_max_parameter_count(10).with_length_check_interval(0)};
//

struct BatchConfig {
    // Admission
    int max_row_count = 1000;
    int max_parameter_count = 2100;

    // Script length guard
    int network_packet_size = 4096;
    int64_t max_script_length = int64_t{65536} * 4096 / 2;
    int length_check_interval = 50;

    // Result reconciliation
    IdentityPropagation identity_propagation = IdentityPropagation::Uniform;
    int64_t identity_increment = 1;

    // Fluent chainable modifiers
    constexpr BatchConfig with_max_row_count(int v) const { auto c = *this; c.max_row_count = v; return c; }
    constexpr BatchConfig with_max_parameter_count(int v) const { auto c = *this; c.max_parameter_count = v; return c; }
    constexpr BatchConfig with_max_script_length(int64_t v) const { auto c = *this; c.max_script_length = v; return c; }
    constexpr BatchConfig with_length_check_interval(int v) const { auto c = *this; c.length_check_interval = v; return c; }
    constexpr BatchConfig with_identity_propagation(IdentityPropagation v) const { auto c = *this; c.identity_propagation = v; return c; }
    constexpr BatchConfig with_identity_increment(int64_t v) const { auto c = *this; c.identity_increment = v; return c; }

    /// Also rescales max_script_length (65536 packets of half the packet size).
    constexpr BatchConfig with_network_packet_size(int v) const {
        auto c = *this;
        c.network_packet_size = v;
        c.max_script_length = int64_t{65536} * v / 2;
        return c;
    }

    constexpr bool operator==(const BatchConfig&) const = default;
};

// =========================================================================
// Presets
// =========================================================================

/// Server limits of a stock MySQL / MariaDB install; one identity for a whole
/// grouped insert.
inline constexpr BatchConfig Default{};

/// Grouped inserts derive one identity per row from the first reported one
/// (auto_increment_increment must match identity_increment).
inline constexpr BatchConfig SequentialIdentity{
    .identity_propagation = IdentityPropagation::Sequential,
};

}  // namespace jcailloux::ecluse::config

#endif  // JCX_ECLUSE_CONFIG_BATCH_CONFIG_H
