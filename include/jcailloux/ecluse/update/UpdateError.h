#ifndef JCX_ECLUSE_UPDATE_UPDATE_ERROR_H
#define JCX_ECLUSE_UPDATE_UPDATE_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace jcailloux::ecluse::update {

class ModificationCommand;

// Failure of a batch. commands() are the records involved (non-owning);
// cause() holds the wrapped exception, null when nothing was wrapped.
class UpdateError : public std::runtime_error {
public:
    explicit UpdateError(const std::string& message,
                         std::vector<const ModificationCommand*> commands = {},
                         std::exception_ptr cause = nullptr)
        : std::runtime_error(message)
        , commands_(std::move(commands))
        , cause_(std::move(cause)) {}

    [[nodiscard]] const std::vector<const ModificationCommand*>& commands() const noexcept {
        return commands_;
    }

    [[nodiscard]] const std::exception_ptr& cause() const noexcept { return cause_; }

private:
    std::vector<const ModificationCommand*> commands_;
    std::exception_ptr cause_;
};

// A result set reported a different affected-row count than the number of
// commands it covers. Usually an optimistic concurrency violation.
class ConcurrencyConflictError : public UpdateError {
public:
    ConcurrencyConflictError(size_t command_index, int64_t expected, int64_t actual,
                             std::vector<const ModificationCommand*> commands)
        : UpdateError("concurrency conflict at command " + std::to_string(command_index)
                      + ": expected " + std::to_string(expected) + " row(s) affected, got "
                      + std::to_string(actual),
                      std::move(commands))
        , command_index_(command_index)
        , expected_(expected)
        , actual_(actual) {}

    [[nodiscard]] size_t commandIndex() const noexcept { return command_index_; }
    [[nodiscard]] int64_t expected() const noexcept { return expected_; }
    [[nodiscard]] int64_t actual() const noexcept { return actual_; }

private:
    size_t command_index_;
    int64_t expected_;
    int64_t actual_;
};

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_UPDATE_ERROR_H
