/**
 * @file Loader.hpp
 * @brief Document loading utilities
 *
 * Implements loading documents from:
 * - JSON text and files (using nlohmann::json)
 * - TOML files (using toml++)
 * - standard input ("-", JSON)
 *
 * TOML allows a field to be written either as a string or as a table,
 * so both forms reach the decoder:
 * ```toml
 * options = '{"opt1": "val1"}'
 *
 * [options]
 * opt1 = "val1"
 * ```
 */

#ifndef DUALFORM_LOADER_HPP
#define DUALFORM_LOADER_HPP

#include "dualform/Value.hpp"
#include <string>

namespace dualform {

/**
 * @brief Parse JSON text into a Value
 *
 * @param text JSON document text
 * @param origin Name used in error messages (file path, "<stdin>", ...)
 * @return Parsed Value
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value parse_json_text(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Load a document from a JSON file.
 *
 * @param path Path to the JSON file, or "-" for standard input
 * @return Parsed Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file.
 *
 * Tables map to objects, arrays to arrays; dates and times become
 * strings.
 *
 * @param path Path to the TOML file
 * @return Parsed Value (always an object)
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension.
 *
 * ".json" -> JSON, ".toml" -> TOML, "-" -> JSON from standard input.
 *
 * @param path Path to document file
 * @return Parsed Value
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if file has syntax errors
 * @throws std::runtime_error if extension is not .json or .toml
 */
Value load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

} // namespace dualform

#endif // DUALFORM_LOADER_HPP
