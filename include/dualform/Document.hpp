/**
 * @file Document.hpp
 * @brief Whole-document decode entry points
 *
 * The document is decoded by the root type's own from_json; fields
 * declared with get_string_or_struct() / StringOrStruct<T> accept either
 * form. Any failure aborts the whole decode and surfaces as a
 * DecodeError carrying the path of the failing field.
 */

#ifndef DUALFORM_DOCUMENT_HPP
#define DUALFORM_DOCUMENT_HPP

#include "dualform/Loader.hpp"
#include "dualform/StringOrStruct.hpp"
#include "dualform/Value.hpp"

#include <string>

namespace dualform {

/**
 * @brief Decode a parsed document into T
 *
 * @param doc Document root
 * @return Decoded T
 * @throws DecodeError (any of its kinds) on failure
 */
template <typename T, typename BasicJsonType>
T decode_document(const BasicJsonType& doc) {
    T out{};
    decode_structured(doc, out);
    return out;
}

/**
 * @brief Parse JSON text and decode it into T
 *
 * @param text JSON document text
 * @param origin Name used in parse error messages
 * @throws DocumentParseError on a syntax error
 * @throws DecodeError on a decode failure
 */
template <typename T>
T decode_document_text(const std::string& text, const std::string& origin = "<string>") {
    return decode_document<T>(parse_json_text(text, origin));
}

/**
 * @brief Load a .json / .toml file (or "-" for stdin) and decode it into T
 *
 * @throws FileNotFoundError, DocumentParseError, DecodeError
 */
template <typename T>
T decode_document_file(const std::string& path) {
    return decode_document<T>(load_document_file(path));
}

} // namespace dualform

#endif // DUALFORM_DOCUMENT_HPP
