#ifndef JCX_ECLUSE_UPDATE_COLUMN_MODIFICATION_H
#define JCX_ECLUSE_UPDATE_COLUMN_MODIFICATION_H

#include <cstddef>
#include <optional>
#include <string>

#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// ColumnModification: one column of a pending row change
//
// Flags are independent:
//   is_write    : value is sent to the server (bound as parameter_name)
//   is_read     : value is produced by the server and read back
//   is_key      : part of the row's identifying key
//   is_condition: appears in the WHERE clause of an UPDATE/DELETE,
//                  compared against original_value (original_parameter_name)
//
// Usage:
//   ColumnModification{
//       .column_name = "id", .column_type = ColumnType::Int64,
//       .is_read = true, .is_key = true,
//   };
// =============================================================================

struct ColumnModification {
    std::string column_name;
    ColumnType column_type = ColumnType::String;

    bool is_read = false;
    bool is_write = false;
    bool is_key = false;
    bool is_condition = false;

    std::optional<std::string> parameter_name;
    std::optional<std::string> original_parameter_name;

    DbValue value;
    DbValue original_value;

    /// Number of parameter slots this column binds (0, 1 or 2).
    [[nodiscard]] int parameterSlots() const noexcept {
        return (parameter_name ? 1 : 0) + (original_parameter_name ? 1 : 0);
    }
};

// =============================================================================
// ParameterNameGenerator: p0, p1, p2, ... unique within one save operation
//
// Share one generator across every command that can land in the same batch;
// parameter names are looked up by name when the script is bound.
// =============================================================================

class ParameterNameGenerator {
public:
    [[nodiscard]] std::string generateNext() {
        return "p" + std::to_string(next_++);
    }

    void reset() noexcept { next_ = 0; }

private:
    size_t next_ = 0;
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_COLUMN_MODIFICATION_H
