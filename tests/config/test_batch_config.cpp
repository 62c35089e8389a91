#include <catch2/catch_test_macros.hpp>

#include <jcailloux/ecluse/config/BatchConfig.h>

using namespace jcailloux::ecluse::config;

// Compile-time checks: presets and modifiers are usable in constant expressions

inline constexpr auto Tight = Default
    .with_max_row_count(10)
    .with_max_parameter_count(50)
    .with_length_check_interval(0);

static_assert(Tight.max_row_count == 10);
static_assert(Tight.max_parameter_count == 50);
static_assert(Tight.length_check_interval == 0);
static_assert(Tight.max_script_length == Default.max_script_length);
static_assert(SequentialIdentity.identity_propagation == IdentityPropagation::Sequential);
static_assert(SequentialIdentity.with_identity_propagation(IdentityPropagation::Uniform) == Default);

TEST_CASE("Default matches a stock server", "[config][batch]") {
    REQUIRE(Default.max_row_count == 1000);
    REQUIRE(Default.max_parameter_count == 2100);
    REQUIRE(Default.network_packet_size == 4096);
    REQUIRE(Default.max_script_length == 134'217'728);
    REQUIRE(Default.length_check_interval == 50);
    REQUIRE(Default.identity_propagation == IdentityPropagation::Uniform);
    REQUIRE(Default.identity_increment == 1);
}

TEST_CASE("modifiers leave the source untouched", "[config][batch]") {
    const auto changed = Default.with_identity_increment(5);
    REQUIRE(changed.identity_increment == 5);
    REQUIRE(Default.identity_increment == 1);
    REQUIRE_FALSE(changed == Default);
}

TEST_CASE("packet size rescales the script ceiling", "[config][batch]") {
    const auto big = Default.with_network_packet_size(16384);
    REQUIRE(big.network_packet_size == 16384);
    REQUIRE(big.max_script_length == int64_t{65536} * 16384 / 2);

    // An explicit ceiling set afterwards wins
    const auto capped = big.with_max_script_length(1'000'000);
    REQUIRE(capped.max_script_length == 1'000'000);
    REQUIRE(capped.network_packet_size == 16384);
}
