#ifndef JCX_ECLUSE_VALUEGEN_VALUE_GENERATOR_H
#define JCX_ECLUSE_VALUEGEN_VALUE_GENERATOR_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <random>
#include <string>

#include "jcailloux/ecluse/update/Value.h"
#include "jcailloux/ecluse/valuegen/Guid.h"

namespace jcailloux::ecluse::valuegen {

enum class ValueGenerated : uint8_t {
    Never,
    OnAdd,
    OnAddOrUpdate
};

/// What the selector needs to know about a mapped property.
struct PropertyInfo {
    std::string name;
    update::ColumnType type = update::ColumnType::String;
    ValueGenerated value_generated = ValueGenerated::Never;
    std::optional<std::string> default_value_sql;
};

// =============================================================================
// ValueGenerator: client-side values for new rows
//
// Temporary values only stand in until the row is saved: identity
// propagation overwrites them. Permanent values are written as is.
// =============================================================================

class ValueGenerator {
public:
    virtual ~ValueGenerator() = default;
    [[nodiscard]] virtual update::DbValue next() = 0;
    [[nodiscard]] virtual bool generatesTemporaryValues() const noexcept = 0;
};

namespace detail {

inline Guid randomGuid(std::mt19937_64& rng) {
    Guid g;
    for (size_t i = 0; i < g.bytes.size(); i += 8) {
        uint64_t r = rng();
        for (size_t b = 0; b < 8; ++b) g.bytes[i + b] = static_cast<uint8_t>(r >> (b * 8));
    }
    g.bytes[6] = static_cast<uint8_t>((g.bytes[6] & 0x0f) | 0x40);   // version 4
    g.bytes[8] = static_cast<uint8_t>((g.bytes[8] & 0x3f) | 0x80);   // RFC 4122 variant
    return g;
}

} // namespace detail

/// Random (version 4) GUIDs, replaced by the server value on save.
class TemporaryGuidValueGenerator : public ValueGenerator {
public:
    TemporaryGuidValueGenerator() : rng_(std::random_device{}()) {}

    [[nodiscard]] update::DbValue next() override { return detail::randomGuid(rng_); }
    [[nodiscard]] bool generatesTemporaryValues() const noexcept override { return true; }

private:
    std::mt19937_64 rng_;
};

/// Permanent GUIDs whose canonical text sorts in generation order: the first
/// 8 bytes hold a process-wide counter (big endian) seeded from the clock,
/// the last 8 are random. Keeps CHAR(36) primary keys append-mostly.
class SequentialGuidValueGenerator : public ValueGenerator {
public:
    SequentialGuidValueGenerator() : rng_(std::random_device{}()) {}

    [[nodiscard]] update::DbValue next() override {
        Guid g = detail::randomGuid(rng_);
        const uint64_t n = counter().fetch_add(1, std::memory_order_relaxed) + 1;
        for (size_t b = 0; b < 8; ++b) {
            g.bytes[b] = static_cast<uint8_t>(n >> ((7 - b) * 8));
        }
        return g;
    }

    [[nodiscard]] bool generatesTemporaryValues() const noexcept override { return false; }

private:
    static std::atomic<uint64_t>& counter() noexcept {
        static std::atomic<uint64_t> c{static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::microseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count())};
        return c;
    }

    std::mt19937_64 rng_;
};

/// Placeholder keys for identity columns: distinct, far from real
/// identities, overwritten by the generated key after the INSERT.
class TemporaryNumberValueGenerator : public ValueGenerator {
public:
    explicit TemporaryNumberValueGenerator(update::ColumnType type) noexcept : type_(type) {}

    [[nodiscard]] update::DbValue next() override {
        const int64_t v = current_++;
        if (type_ == update::ColumnType::Int32) return static_cast<int32_t>(v);
        return v;
    }

    [[nodiscard]] bool generatesTemporaryValues() const noexcept override { return true; }

private:
    update::ColumnType type_;
    int64_t current_ = int64_t{std::numeric_limits<int32_t>::min()} + 1000;
};

// =============================================================================
// ValueGeneratorSelector
//
//   Guid, not generated or with a DEFAULT expression -> TemporaryGuid
//   Guid, generated on add                           -> SequentialGuid
//   Int32 / Int64 generated on add                   -> TemporaryNumber
//   anything else                                    -> nullptr
// =============================================================================

class ValueGeneratorSelector {
public:
    [[nodiscard]] std::unique_ptr<ValueGenerator> select(const PropertyInfo& property) const {
        if (property.type == update::ColumnType::Guid) {
            if (property.value_generated == ValueGenerated::Never || property.default_value_sql) {
                return std::make_unique<TemporaryGuidValueGenerator>();
            }
            return std::make_unique<SequentialGuidValueGenerator>();
        }

        if ((property.type == update::ColumnType::Int32 || property.type == update::ColumnType::Int64)
            && property.value_generated != ValueGenerated::Never) {
            return std::make_unique<TemporaryNumberValueGenerator>(property.type);
        }
        return nullptr;
    }
};

} // namespace jcailloux::ecluse::valuegen

#endif // JCX_ECLUSE_VALUEGEN_VALUE_GENERATOR_H
