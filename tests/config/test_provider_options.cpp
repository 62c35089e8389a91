#include <catch2/catch_test_macros.hpp>

#include <jcailloux/ecluse/config/BatchConfig.h>
#include <jcailloux/ecluse/config/ConfigurationError.h>
#include <jcailloux/ecluse/config/ProviderOptions.h>

#include <stdexcept>
#include <string>

using namespace jcailloux::ecluse::config;

// =============================================================================
// Effective batch size
// =============================================================================

TEST_CASE("absent max_batch_size falls back to the row ceiling", "[config][options]") {
    ProviderOptions opts;
    REQUIRE_FALSE(opts.max_batch_size.has_value());
    REQUIRE(opts.effectiveMaxBatchSize() == 1000);
    REQUIRE_NOTHROW(opts.validate());
}

TEST_CASE("max_batch_size is capped by the row ceiling", "[config][options]") {
    REQUIRE(ProviderOptions{.max_batch_size = 42}.effectiveMaxBatchSize() == 42);
    REQUIRE(ProviderOptions{.max_batch_size = 5000}.effectiveMaxBatchSize() == 1000);
    REQUIRE(ProviderOptions{.max_batch_size = 5000, .batch = Default.with_max_row_count(8000)}
                .effectiveMaxBatchSize() == 5000);
}

TEST_CASE("validate rejects out-of-range values", "[config][options]") {
    REQUIRE_THROWS_AS(ProviderOptions{.max_batch_size = 0}.validate(), ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions{.max_batch_size = -1}.validate(), ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions{.batch = Default.with_max_parameter_count(1)}.validate(),
                      ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions{.batch = Default.with_length_check_interval(-1)}.validate(),
                      ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions{.batch = Default.with_max_script_length(0)}.validate(),
                      ConfigurationError);

    ProviderOptions no_endpoint;
    no_endpoint.connection.host.clear();
    REQUIRE_THROWS_AS(no_endpoint.validate(), ConfigurationError);
    no_endpoint.connection.unix_socket = "/run/mysqld/mysqld.sock";
    REQUIRE_NOTHROW(no_endpoint.validate());
}

TEST_CASE("ConfigurationError is an invalid_argument", "[config][options]") {
    try {
        ProviderOptions{.max_batch_size = 0}.validate();
        FAIL("expected ConfigurationError");
    } catch (const std::invalid_argument& e) {
        REQUIRE(std::string(e.what()) == "max_batch_size must be positive, got 0");
    }
}

// =============================================================================
// JSON
// =============================================================================

TEST_CASE("options load from JSON", "[config][options][json]") {
    const auto opts = ProviderOptions::fromJson(R"({
        "max_batch_size": 200,
        "batch": { "identity_propagation": "Sequential", "identity_increment": 2 },
        "connection": { "host": "db", "port": 3307, "user": "app", "database": "shop" }
    })");

    REQUIRE(opts.max_batch_size == 200);
    REQUIRE(opts.effectiveMaxBatchSize() == 200);
    REQUIRE(opts.batch.identity_propagation == IdentityPropagation::Sequential);
    REQUIRE(opts.batch.identity_increment == 2);
    REQUIRE(opts.batch.max_parameter_count == 2100);
    REQUIRE(opts.connection.host == "db");
    REQUIRE(opts.connection.port == 3307);
    REQUIRE(opts.connection.user == "app");
    REQUIRE(opts.connection.database == "shop");
    REQUIRE(opts.connection.charset == "utf8mb4");
}

TEST_CASE("empty JSON keeps every default", "[config][options][json]") {
    const auto opts = ProviderOptions::fromJson("{}");
    REQUIRE_FALSE(opts.max_batch_size.has_value());
    REQUIRE(opts.batch == Default);
    REQUIRE(opts.connection.host == "localhost");
    REQUIRE(opts.connection.port == 3306);
}

TEST_CASE("bad JSON is a configuration error", "[config][options][json]") {
    REQUIRE_THROWS_AS(ProviderOptions::fromJson("{ not json"), ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions::fromJson(R"({"max_batch_sise": 10})"), ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions::fromJson(R"({"batch": {"identity_propagation": "Random"}})"),
                      ConfigurationError);
    REQUIRE_THROWS_AS(ProviderOptions::fromJson(R"({"max_batch_size": 0})"), ConfigurationError);
}

TEST_CASE("options survive a JSON round trip", "[config][options][json]") {
    ProviderOptions opts;
    opts.max_batch_size = 64;
    opts.batch = SequentialIdentity.with_max_row_count(500);
    opts.connection.user = "svc";

    const auto back = ProviderOptions::fromJson(opts.toJson());
    REQUIRE(back.max_batch_size == 64);
    REQUIRE(back.batch == opts.batch);
    REQUIRE(back.connection.user == "svc");
}
