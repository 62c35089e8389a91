#ifndef JCX_ECLUSE_CONFIG_CONFIGURATION_ERROR_H
#define JCX_ECLUSE_CONFIG_CONFIGURATION_ERROR_H

#include <stdexcept>

namespace jcailloux::ecluse::config {

class ConfigurationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

}  // namespace jcailloux::ecluse::config

#endif  // JCX_ECLUSE_CONFIG_CONFIGURATION_ERROR_H
