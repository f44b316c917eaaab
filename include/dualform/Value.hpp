/**
 * @file Value.hpp
 * @brief Document value type and shape classification
 *
 * Uses nlohmann::json as the underlying tree model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * The decoding templates accept any nlohmann::basic_json specialization,
 * so nlohmann::ordered_json documents keep their insertion order.
 */

#ifndef DUALFORM_VALUE_HPP
#define DUALFORM_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace dualform {

/**
 * @brief JSON-like value type for documents
 *
 * Alias for nlohmann::json. Non-template parts of the library
 * (loader, dot-path helpers, normalization) operate on this type.
 */
using Value = nlohmann::json;

/**
 * @brief Structural category of a value as seen by the decoder
 */
enum class Shape {
    string, ///< Scalar string literal
    map,    ///< Key/value object
    other   ///< Anything else: number, boolean, null, array, binary
};

/**
 * @brief Classify a value by structure
 *
 * Only the node kind is inspected; the value is neither copied nor
 * modified.
 *
 * @param val The value to inspect
 * @return Shape::string, Shape::map or Shape::other
 */
template <typename BasicJsonType>
Shape classify(const BasicJsonType& val) noexcept {
    if (val.is_string()) return Shape::string;
    if (val.is_object()) return Shape::map;
    return Shape::other;
}

/**
 * @brief Printable name of a shape ("string", "map", "other")
 */
inline const char* shape_name(Shape shape) noexcept {
    switch (shape) {
        case Shape::string: return "string";
        case Shape::map: return "map";
        case Shape::other: return "other";
    }
    return "other";
}

/**
 * @brief Get human-readable type name for a value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
template <typename BasicJsonType>
std::string type_name(const BasicJsonType& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    if (val.is_binary()) return "binary";
    return "unknown";
}

} // namespace dualform

#endif // DUALFORM_VALUE_HPP
