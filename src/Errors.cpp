/**
 * @file Errors.cpp
 * @brief Message formatting for decode errors
 */

#include "dualform/Errors.hpp"
#include "dualform/DotPath.hpp"

namespace dualform {

std::string DecodeError::path_string() const {
    return join_dot_path(path_);
}

std::string DecodeError::format_message(const std::vector<std::string>& path,
                                        const std::string& details) {
    if (path.empty()) return details;
    return "Decode error at '" + join_dot_path(path) + "': " + details;
}

} // namespace dualform
