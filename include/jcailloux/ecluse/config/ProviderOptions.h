#ifndef JCX_ECLUSE_CONFIG_PROVIDER_OPTIONS_H
#define JCX_ECLUSE_CONFIG_PROVIDER_OPTIONS_H

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <glaze/glaze.hpp>

#include "jcailloux/ecluse/config/BatchConfig.h"
#include "jcailloux/ecluse/config/ConfigurationError.h"

namespace jcailloux::ecluse::config {

struct ConnectionOptions {
    std::string host = "localhost";
    uint16_t port = 3306;
    std::string user;
    std::string password;
    std::string database;
    std::string unix_socket;   // empty = TCP
    std::string charset = "utf8mb4";
};

// =============================================================================
// ProviderOptions: runtime options of the provider
//
// Loaded from JSON at startup:
//   {
//     "max_batch_size": 200,
//     "batch": { "identity_propagation": "Sequential" },
//     "connection": { "host": "db", "user": "app", "database": "shop" }
//   }
// Missing keys keep their defaults. max_batch_size, when present, must be
// positive; it is capped by batch.max_row_count.
// =============================================================================

struct ProviderOptions {
    std::optional<int> max_batch_size;
    BatchConfig batch{};
    ConnectionOptions connection{};

    /// Rows admitted per batch: min(max_batch_size, batch.max_row_count).
    [[nodiscard]] int effectiveMaxBatchSize() const noexcept {
        return std::min(max_batch_size.value_or(batch.max_row_count), batch.max_row_count);
    }

    /// @throws ConfigurationError describing the first invalid field.
    void validate() const {
        if (max_batch_size && *max_batch_size <= 0) {
            throw ConfigurationError(
                "max_batch_size must be positive, got " + std::to_string(*max_batch_size));
        }
        if (batch.max_row_count <= 0)
            throw ConfigurationError("batch.max_row_count must be positive");
        if (batch.max_parameter_count <= 1)
            throw ConfigurationError("batch.max_parameter_count must be greater than 1");
        if (batch.network_packet_size <= 0)
            throw ConfigurationError("batch.network_packet_size must be positive");
        if (batch.max_script_length <= 0)
            throw ConfigurationError("batch.max_script_length must be positive");
        if (batch.length_check_interval < 0)
            throw ConfigurationError("batch.length_check_interval must not be negative");
        if (batch.identity_increment <= 0)
            throw ConfigurationError("batch.identity_increment must be positive");
        if (connection.host.empty() && connection.unix_socket.empty())
            throw ConfigurationError("connection needs a host or a unix_socket");
    }

    /// Parse and validate.
    /// @throws ConfigurationError on malformed JSON, unknown keys or invalid values.
    [[nodiscard]] static ProviderOptions fromJson(std::string_view json) {
        ProviderOptions opts;
        if (auto ec = glz::read_json(opts, json)) {
            throw ConfigurationError("invalid provider options: " + glz::format_error(ec, json));
        }
        opts.validate();
        return opts;
    }

    [[nodiscard]] std::string toJson() const {
        std::string out;
        if (glz::write_json(*this, out)) {
            throw ConfigurationError("cannot serialize provider options");
        }
        return out;
    }
};

}  // namespace jcailloux::ecluse::config

// =============================================================================
// Glaze metadata
// =============================================================================

template<>
struct glz::meta<jcailloux::ecluse::config::IdentityPropagation> {
    using enum jcailloux::ecluse::config::IdentityPropagation;
    static constexpr auto value = enumerate(Uniform, Sequential);
};

template<>
struct glz::meta<jcailloux::ecluse::config::BatchConfig> {
    using T = jcailloux::ecluse::config::BatchConfig;
    static constexpr auto value = object(
        "max_row_count", &T::max_row_count,
        "max_parameter_count", &T::max_parameter_count,
        "network_packet_size", &T::network_packet_size,
        "max_script_length", &T::max_script_length,
        "length_check_interval", &T::length_check_interval,
        "identity_propagation", &T::identity_propagation,
        "identity_increment", &T::identity_increment
    );
};

template<>
struct glz::meta<jcailloux::ecluse::config::ConnectionOptions> {
    using T = jcailloux::ecluse::config::ConnectionOptions;
    static constexpr auto value = object(
        "host", &T::host,
        "port", &T::port,
        "user", &T::user,
        "password", &T::password,
        "database", &T::database,
        "unix_socket", &T::unix_socket,
        "charset", &T::charset
    );
};

template<>
struct glz::meta<jcailloux::ecluse::config::ProviderOptions> {
    using T = jcailloux::ecluse::config::ProviderOptions;
    static constexpr auto value = object(
        "max_batch_size", &T::max_batch_size,
        "batch", &T::batch,
        "connection", &T::connection
    );
};

#endif  // JCX_ECLUSE_CONFIG_PROVIDER_OPTIONS_H
