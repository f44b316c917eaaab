/**
 * @file DotPath.hpp
 * @brief Dot-notation field addressing within documents
 *
 * Fields are addressed with dot-separated paths like "service.options"
 * or "services.0.options"; numeric segments index arrays. The same
 * notation is used to report the location of decode failures.
 */

#ifndef DUALFORM_DOTPATH_HPP
#define DUALFORM_DOTPATH_HPP

#include "Value.hpp"
#include "Errors.hpp"
#include <string>
#include <vector>

namespace dualform {

/**
 * @brief Split a dot-path into segments
 *
 * @param path Dot-separated path like "a.b.c"
 * @return Vector of segments ["a", "b", "c"]
 *
 * Examples:
 * - "service.options" → ["service", "options"]
 * - "services.0.options" → ["services", "0", "options"]
 * - "" → []
 * - "single" → ["single"]
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value from nested structure using dot-path
 *
 * @param data Source document
 * @param path Dot-separated path; empty path is the root
 * @return Pointer to value at path
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a scalar before the final segment
 *
 * Examples:
 * ```cpp
 * Value doc = {{"service", {{"options", "{}"}}}};
 * auto* val = get_by_dot(doc, "service.options");    // OK
 * auto* bad = get_by_dot(doc, "service.missing");    // Throws KeyError
 * auto* bad2 = get_by_dot(doc, "service.options.x"); // Throws TypeError
 * ```
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value in nested structure using dot-path
 *
 * @param data Target document (modified in place)
 * @param path Dot-separated path
 * @param value Value to set
 * @param create_missing If true, create intermediate objects as needed;
 *                       if false, raise error for missing intermediates
 * @throws KeyError if create_missing=false and intermediate segment not found
 * @throws TypeError if an intermediate is a scalar and create_missing=false
 *
 * Numeric segments address existing array elements.
 */
void set_by_dot(Value& data, const std::string& path,
                const Value& value, bool create_missing = true);

/**
 * @brief Check if dot-path exists in nested structure
 *
 * @return true if path fully resolves, false if any segment missing
 * @throws TypeError if traversal hits a scalar before the final segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace dualform

#endif // DUALFORM_DOTPATH_HPP
