#ifndef JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_H
#define JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_H

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "jcailloux/ecluse/update/ColumnModification.h"
#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::update {

enum class EntityState : uint8_t {
    Added,      // INSERT
    Modified,   // UPDATE
    Deleted     // DELETE
};

[[nodiscard]] inline const char* toString(EntityState state) noexcept {
    switch (state) {
        case EntityState::Added:    return "Added";
        case EntityState::Modified: return "Modified";
        case EntityState::Deleted:  return "Deleted";
    }
    return "Unknown";
}

// =============================================================================
// ModificationCommand: one pending row change (insert, update or delete)
//
// Built and owned by the caller (the unit of work). A batch keeps a
// non-owning pointer for one execute cycle and writes back into it through
// propagateResults() and assignGeneratedKey() only.
// =============================================================================

class ModificationCommand {
public:
    ModificationCommand(std::string table_name, std::string schema, EntityState state,
                        std::vector<ColumnModification> columns = {})
        : table_name_(std::move(table_name))
        , schema_(std::move(schema))
        , state_(state)
        , columns_(std::move(columns)) {}

    [[nodiscard]] const std::string& tableName() const noexcept { return table_name_; }
    [[nodiscard]] const std::string& schema() const noexcept { return schema_; }
    [[nodiscard]] EntityState entityState() const noexcept { return state_; }

    [[nodiscard]] const std::vector<ColumnModification>& columnModifications() const noexcept {
        return columns_;
    }

    ColumnModification& addColumn(ColumnModification column) {
        return columns_.emplace_back(std::move(column));
    }

    /// True if any column must be read back after execution.
    [[nodiscard]] bool requiresResultPropagation() const noexcept {
        for (const auto& c : columns_) {
            if (c.is_read) return true;
        }
        return false;
    }

    /// True if a read column is not part of the key, so the generated
    /// identity alone cannot fill it (server defaults, computed columns).
    [[nodiscard]] bool requiresRowReadBack() const noexcept {
        for (const auto& c : columns_) {
            if (c.is_read && !c.is_key) return true;
        }
        return false;
    }

    /// Number of bound parameter slots (write + original value parameters).
    [[nodiscard]] int parameterCount() const noexcept {
        int n = 0;
        for (const auto& c : columns_) n += c.parameterSlots();
        return n;
    }

    /// Overwrite the read columns, in declaration order, from one returned row.
    /// @throws std::invalid_argument on a column count mismatch or a value
    ///         that does not convert to the declared column type.
    void propagateResults(const RawRow& row) {
        size_t readCount = 0;
        for (const auto& c : columns_) {
            if (c.is_read) ++readCount;
        }
        if (row.size() != readCount) {
            throw std::invalid_argument(
                "returned row has " + std::to_string(row.size()) + " column(s), "
                + std::to_string(readCount) + " expected for " + table_name_);
        }

        size_t field = 0;
        for (auto& c : columns_) {
            if (!c.is_read) continue;
            c.value = parseValue(c.column_type, row[field++]);
        }
    }

    /// Store a server-generated identity into a key column.
    /// Int32 columns receive a range-checked 32-bit value; any other declared
    /// type receives the raw 64-bit value.
    /// @throws std::out_of_range if column_index is invalid or the value
    ///         does not fit an Int32 column.
    /// @throws std::logic_error if the column is not part of the key.
    void assignGeneratedKey(size_t column_index, int64_t value) {
        auto& c = columns_.at(column_index);
        if (!c.is_key) {
            throw std::logic_error(
                "column " + c.column_name + " of " + table_name_ + " is not a key column");
        }

        if (c.column_type == ColumnType::Int32) {
            if (value < std::numeric_limits<int32_t>::min()
                || value > std::numeric_limits<int32_t>::max()) {
                throw std::out_of_range(
                    "generated value " + std::to_string(value)
                    + " does not fit int32 column " + c.column_name);
            }
            c.value = static_cast<int32_t>(value);
        } else {
            c.value = value;
        }
    }

    /// e.g. "Modified `shop`.`orders` {id=42}"
    [[nodiscard]] std::string describe() const {
        std::string out = toString(state_);
        out += ' ';
        if (!schema_.empty()) {
            out += '`';
            out += schema_;
            out += "`.";
        }
        out += '`';
        out += table_name_;
        out += "` {";
        bool first = true;
        for (const auto& c : columns_) {
            if (!c.is_key) continue;
            if (!first) out += ", ";
            first = false;
            out += c.column_name;
            out += '=';
            out += toDisplayString(c.is_condition && !isNull(c.original_value)
                                       ? c.original_value : c.value);
        }
        out += '}';
        return out;
    }

private:
    std::string table_name_;
    std::string schema_;
    EntityState state_;
    std::vector<ColumnModification> columns_;
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_MODIFICATION_COMMAND_H
