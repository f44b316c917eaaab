/**
 * @file StringParser.hpp
 * @brief Target-type capabilities required by the string-or-struct decoder
 *
 * A target type T must provide:
 * - a string parser: `void from_string(const std::string&, T&)` found by
 *   argument-dependent lookup, or a specialization of string_parser<T>;
 * - a structured decoder: nlohmann's usual `void from_json(const json&, T&)`
 *   (or an nlohmann::adl_serializer<T> specialization).
 *
 * Both report failure by throwing.
 *
 * Example:
 * ```cpp
 * struct Options {
 *     std::string opt1;
 *     std::optional<std::string> opt2;
 * };
 *
 * void from_json(const dualform::Value& j, Options& o);
 *
 * void from_string(const std::string& raw, Options& o) {
 *     o = dualform::from_json_text<Options>(raw);
 * }
 * ```
 */

#ifndef DUALFORM_STRING_PARSER_HPP
#define DUALFORM_STRING_PARSER_HPP

#include "dualform/Value.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <type_traits>
#include <utility>

namespace dualform {

/**
 * @brief Customization point for parsing a target type from a raw string
 *
 * The primary template forwards to `from_string(raw, out)` looked up by
 * ADL in T's namespace. Specialize it for types you cannot add a free
 * function for.
 */
template <typename T, typename = void>
struct string_parser {
    template <typename U = T>
    static auto parse(const std::string& raw, U& out)
        -> decltype(from_string(raw, out), void()) {
        from_string(raw, out);
    }
};

/// True when string_parser<T>::parse(const std::string&, T&) is usable.
template <typename T, typename = void>
struct has_string_parser : std::false_type {};

template <typename T>
struct has_string_parser<T, std::void_t<decltype(string_parser<T>::parse(
    std::declval<const std::string&>(), std::declval<T&>()))>> : std::true_type {};

/// True when T can be structured-decoded from a BasicJsonType node.
template <typename T, typename BasicJsonType, typename = void>
struct has_structured_decode : std::false_type {};

template <typename T, typename BasicJsonType>
struct has_structured_decode<T, BasicJsonType, std::void_t<decltype(
    std::declval<const BasicJsonType&>().get_to(std::declval<T&>()))>> : std::true_type {};

/**
 * @brief Parse JSON text and structured-decode it into T
 *
 * The usual string parser for targets whose string form is their own
 * JSON serialization. Syntax errors surface as nlohmann parse_error,
 * schema errors as whatever T's from_json throws.
 *
 * @param text JSON text, used verbatim
 * @return Decoded T
 */
template <typename T, typename BasicJsonType = Value>
T from_json_text(const std::string& text) {
    T out{};
    BasicJsonType::parse(text).get_to(out);
    return out;
}

} // namespace dualform

#endif // DUALFORM_STRING_PARSER_HPP
