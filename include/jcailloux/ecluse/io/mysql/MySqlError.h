#ifndef JCX_ECLUSE_IO_MYSQL_ERROR_H
#define JCX_ECLUSE_IO_MYSQL_ERROR_H

#include <stdexcept>
#include <string>

namespace jcailloux::ecluse::io {

class MySqlError : public std::runtime_error {
public:
    explicit MySqlError(const std::string& what, unsigned int error_code = 0)
        : std::runtime_error(what), error_code_(error_code) {}

    /// Server / client error number (mysql_errno), 0 if not applicable.
    [[nodiscard]] unsigned int errorCode() const noexcept { return error_code_; }

private:
    unsigned int error_code_;
};

class MySqlConnectionError : public MySqlError {
public:
    using MySqlError::MySqlError;
};

} // namespace jcailloux::ecluse::io

#endif // JCX_ECLUSE_IO_MYSQL_ERROR_H
