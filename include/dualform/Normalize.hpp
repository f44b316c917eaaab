/**
 * @file Normalize.hpp
 * @brief Rewrite string-form fields of a document into map form
 *
 * Uses JsonObject, a schema-agnostic target: its string form is the
 * JSON text of an object, its map form any object. Decoding a field as
 * JsonObject and writing the result back turns
 *
 * ```json
 * { "options": "{\"opt1\":\"val1\"}" }
 * ```
 * into
 * ```json
 * { "options": { "opt1": "val1" } }
 * ```
 */

#ifndef DUALFORM_NORMALIZE_HPP
#define DUALFORM_NORMALIZE_HPP

#include "dualform/StringOrStruct.hpp"
#include "dualform/Value.hpp"

#include <string>

namespace dualform {

/**
 * @brief Any JSON object, accepted as a map or as JSON text
 */
struct JsonObject {
    Value fields = Value::object();
};

/**
 * @brief Map form: copy the object
 * @throws nlohmann type_error (302) if @p j is not an object
 */
void from_json(const Value& j, JsonObject& out);

void to_json(Value& j, const JsonObject& in);

/**
 * @brief String form: parse @p raw as JSON text of an object
 * @throws nlohmann parse_error on invalid JSON
 * @throws std::invalid_argument if the text is valid JSON but not an object
 */
void from_string(const std::string& raw, JsonObject& out);

/**
 * @brief Classify the value at @p path
 * @throws KeyError, TypeError if the path does not resolve
 */
Shape shape_at(const Value& doc, const std::string& path);

/**
 * @brief Decode the field at @p path in either form and store it back
 *        in map form
 *
 * A map-form field is left as it was. On failure @p doc is unchanged.
 *
 * @param doc Document (modified in place)
 * @param path Dot-path of the field
 * @return The shape the field had before normalization
 * @throws KeyError, TypeError if the path does not resolve
 * @throws DecodeError with @p path attached if the field cannot be decoded
 */
Shape normalize_field(Value& doc, const std::string& path);

} // namespace dualform

#endif // DUALFORM_NORMALIZE_HPP
