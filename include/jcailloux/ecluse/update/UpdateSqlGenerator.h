#ifndef JCX_ECLUSE_UPDATE_UPDATE_SQL_GENERATOR_H
#define JCX_ECLUSE_UPDATE_UPDATE_SQL_GENERATOR_H

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "jcailloux/ecluse/update/ColumnModification.h"
#include "jcailloux/ecluse/update/ModificationCommand.h"
#include "jcailloux/ecluse/update/ResultSetMapping.h"

namespace jcailloux::ecluse::update {

// =============================================================================
// UpdateSqlGenerator: MySQL dialect statement rendering
//
// Every append* call writes complete statements terminated by ";\n" and
// reports how the statement shows up in the reply stream:
//
//   INSERT (one or many rows)   one OK result, no rows      NotLastInResultSet
//   INSERT + read-back SELECT   one OK result + one row set LastInResultSet
//   UPDATE                      one OK result               LastInResultSet
//   UPDATE + read-back SELECT   one OK result + one row set LastInResultSet
//   DELETE                      one OK result               LastInResultSet
//
// A grouped INSERT reports the first generated identity through
// LAST_INSERT_ID() and echoes no rows. An INSERT that reads back columns
// other than its generated key is rendered alone, followed by a SELECT of
// the new row located through its key.
// =============================================================================

class UpdateSqlGenerator {
public:
    virtual ~UpdateSqlGenerator() = default;

    /// Start-of-script prologue. Empty for MySQL.
    virtual void appendBatchHeader(std::string& /*out*/) const {}

    /// One multi-row INSERT covering every command of `commands`.
    /// All commands must target the same table with the same written columns.
    /// `endPosition` is the batch position just past the group's last member.
    virtual ResultSetMapping appendBulkInsertOperation(
            std::string& out,
            std::span<const ModificationCommand* const> commands,
            size_t /*endPosition*/) const {
        if (commands.empty()) {
            throw std::logic_error("bulk insert needs at least one command");
        }

        const auto& first = *commands.front();
        out += "INSERT INTO ";
        appendTableName(out, first);
        out += " (";
        bool firstCol = true;
        for (const auto& c : first.columnModifications()) {
            if (!c.is_write) continue;
            if (!firstCol) out += ", ";
            firstCol = false;
            appendIdentifier(out, c.column_name);
        }
        out += ") VALUES ";

        for (size_t i = 0; i < commands.size(); ++i) {
            if (i > 0) out += ",\n";
            out += '(';
            bool firstVal = true;
            for (const auto& c : commands[i]->columnModifications()) {
                if (!c.is_write) continue;
                if (!firstVal) out += ", ";
                firstVal = false;
                appendParameter(out, c);
            }
            out += ')';
        }
        out += ";\n";
        return ResultSetMapping::NotLastInResultSet;
    }

    /// Single-row INSERT, with the read-back SELECT when the command reads
    /// columns the generated identity does not cover.
    virtual ResultSetMapping appendInsertOperation(
            std::string& out, const ModificationCommand& command, size_t commandPosition) const {
        const bool read_back = command.requiresRowReadBack();
        if (read_back) requireKey(command);

        const ModificationCommand* one[] = {&command};
        const ResultSetMapping mapping = appendBulkInsertOperation(out, one, commandPosition + 1);
        if (!read_back) {
            return mapping;
        }
        appendSelectAffectedRow(out, command);
        return ResultSetMapping::LastInResultSet;
    }

    virtual ResultSetMapping appendUpdateOperation(
            std::string& out, const ModificationCommand& command, size_t /*commandPosition*/) const {
        if (command.requiresResultPropagation()) requireKey(command);

        out += "UPDATE ";
        appendTableName(out, command);
        out += " SET ";
        bool first = true;
        for (const auto& c : command.columnModifications()) {
            if (!c.is_write) continue;
            if (!first) out += ", ";
            first = false;
            appendIdentifier(out, c.column_name);
            out += " = ";
            appendParameter(out, c);
        }
        if (first) {
            throw std::logic_error("update of " + command.tableName() + " writes no column");
        }
        appendWhereClause(out, command);
        out += ";\n";

        if (command.requiresResultPropagation()) {
            appendSelectAffectedRow(out, command);
        }
        return ResultSetMapping::LastInResultSet;
    }

    virtual ResultSetMapping appendDeleteOperation(
            std::string& out, const ModificationCommand& command, size_t /*commandPosition*/) const {
        if (command.requiresResultPropagation()) {
            throw std::logic_error("delete from " + command.tableName() + " cannot read back columns");
        }
        out += "DELETE FROM ";
        appendTableName(out, command);
        appendWhereClause(out, command);
        out += ";\n";
        return ResultSetMapping::LastInResultSet;
    }

    // =========================================================================
    // Fragments
    // =========================================================================

    /// `name`, embedded backticks doubled.
    static void appendIdentifier(std::string& out, std::string_view name) {
        out += '`';
        for (char ch : name) {
            if (ch == '`') out += '`';
            out += ch;
        }
        out += '`';
    }

    static void appendTableName(std::string& out, const ModificationCommand& command) {
        if (!command.schema().empty()) {
            appendIdentifier(out, command.schema());
            out += '.';
        }
        appendIdentifier(out, command.tableName());
    }

protected:
    static void appendParameter(std::string& out, const ColumnModification& c) {
        if (!c.parameter_name) {
            throw std::logic_error("written column " + c.column_name + " has no parameter");
        }
        out += '@';
        out += *c.parameter_name;
    }

    /// " WHERE `a` = @p1 AND `b` IS NULL"
    static void appendWhereClause(std::string& out, const ModificationCommand& command) {
        bool first = true;
        for (const auto& c : command.columnModifications()) {
            if (!c.is_condition) continue;
            out += first ? " WHERE " : " AND ";
            first = false;
            appendCondition(out, c);
        }
        if (first) {
            throw std::logic_error("statement on " + command.tableName() + " has no condition");
        }
    }

    static void appendCondition(std::string& out, const ColumnModification& c) {
        appendIdentifier(out, c.column_name);
        const auto& name = c.original_parameter_name ? c.original_parameter_name : c.parameter_name;
        const auto& value = c.original_parameter_name ? c.original_value : c.value;
        if (!name || isNull(value)) {
            out += " IS NULL";
            return;
        }
        out += " = @";
        out += *name;
    }

    static void requireKey(const ModificationCommand& command) {
        for (const auto& c : command.columnModifications()) {
            if (c.is_key) return;
        }
        throw std::logic_error("reading back from " + command.tableName() + " needs a key column");
    }

    /// Key column matched against its value after the statement ran: the
    /// generated identity for an inserted read key, the new value for a
    /// written key, the original value otherwise.
    static void appendKeyCondition(std::string& out, const ModificationCommand& command,
                                   const ColumnModification& c) {
        if (command.entityState() == EntityState::Added && c.is_read && !c.is_write) {
            appendIdentifier(out, c.column_name);
            out += " = LAST_INSERT_ID()";
            return;
        }
        if (c.is_write && c.parameter_name) {
            appendIdentifier(out, c.column_name);
            if (isNull(c.value)) {
                out += " IS NULL";
                return;
            }
            out += " = @";
            out += *c.parameter_name;
            return;
        }
        appendCondition(out, c);
    }

    /// SELECT of the read columns, returning a row only when the preceding
    /// statement affected exactly one row.
    static void appendSelectAffectedRow(std::string& out, const ModificationCommand& command) {
        out += "SELECT ";
        bool first = true;
        for (const auto& c : command.columnModifications()) {
            if (!c.is_read) continue;
            if (!first) out += ", ";
            first = false;
            appendIdentifier(out, c.column_name);
        }
        out += " FROM ";
        appendTableName(out, command);
        out += " WHERE ROW_COUNT() = 1";
        for (const auto& c : command.columnModifications()) {
            if (!c.is_key) continue;
            out += " AND ";
            appendKeyCondition(out, command, c);
        }
        out += ";\n";
    }
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_UPDATE_SQL_GENERATOR_H
