#ifndef JCX_ECLUSE_UPDATE_RESULT_SET_MAPPING_H
#define JCX_ECLUSE_UPDATE_RESULT_SET_MAPPING_H

#include <cstdint>

namespace jcailloux::ecluse::update {

// How one command's SQL shows up in the reply stream.
enum class ResultSetMapping : uint8_t {
    NoResultSet,          // contributes nothing to the stream
    NotLastInResultSet,   // shares the current result set with the next command
    LastInResultSet       // closes the current result set
};

[[nodiscard]] inline const char* toString(ResultSetMapping m) noexcept {
    switch (m) {
        case ResultSetMapping::NoResultSet:        return "NoResultSet";
        case ResultSetMapping::NotLastInResultSet: return "NotLastInResultSet";
        case ResultSetMapping::LastInResultSet:    return "LastInResultSet";
    }
    return "Unknown";
}

}  // namespace jcailloux::ecluse::update

#endif  // JCX_ECLUSE_UPDATE_RESULT_SET_MAPPING_H
