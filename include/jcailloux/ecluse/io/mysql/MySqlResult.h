#ifndef JCX_ECLUSE_IO_MYSQL_RESULT_H
#define JCX_ECLUSE_IO_MYSQL_RESULT_H

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <mysql.h>

#include "jcailloux/ecluse/update/Value.h"

namespace jcailloux::ecluse::io {

// MySqlResult: RAII wrapper for a stored MYSQL_RES (text protocol rows)

class MySqlResult {
public:
    MySqlResult() noexcept = default;

    explicit MySqlResult(MYSQL_RES* result) noexcept
        : result_(result, &mysql_free_result) {}

    /// False for statements that return no columns (INSERT, UPDATE, ...).
    [[nodiscard]] bool valid() const noexcept { return result_ != nullptr; }

    [[nodiscard]] unsigned int fieldCount() const noexcept {
        return result_ ? mysql_num_fields(result_.get()) : 0;
    }

    [[nodiscard]] uint64_t rowCount() const noexcept {
        return result_ ? static_cast<uint64_t>(mysql_num_rows(result_.get())) : 0;
    }

    /// Next row, or nullopt once exhausted. NULL fields become nullopt.
    [[nodiscard]] std::optional<update::RawRow> fetchRow() {
        if (!result_) return std::nullopt;

        MYSQL_ROW row = mysql_fetch_row(result_.get());
        if (!row) return std::nullopt;

        const unsigned long* lengths = mysql_fetch_lengths(result_.get());
        const unsigned int n = mysql_num_fields(result_.get());

        update::RawRow out;
        out.reserve(n);
        for (unsigned int i = 0; i < n; ++i) {
            if (row[i]) out.emplace_back(std::string(row[i], lengths[i]));
            else out.emplace_back(std::nullopt);
        }
        return out;
    }

    [[nodiscard]] MYSQL_RES* raw() const noexcept { return result_.get(); }

private:
    std::unique_ptr<MYSQL_RES, decltype(&mysql_free_result)> result_{nullptr, &mysql_free_result};
};

// One physical reply of a multi-statement script: the stored rows (if any)
// and the counters the server reported for that statement.
struct MySqlRawResult {
    MySqlResult rows;
    int64_t affected_rows = 0;
    int64_t insert_id = 0;
};

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_MYSQL_RESULT_H
