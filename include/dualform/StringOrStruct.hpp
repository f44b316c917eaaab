/**
 * @file StringOrStruct.hpp
 * @brief Decode a field given either as a string or as a structured map
 *
 * A field of type T may appear in a document in two forms:
 *
 * ```json
 * { "options": { "opt1": "val1", "opt2": "val2" } }      // map form
 * { "options": "{\"opt1\":\"val1\",\"opt2\":\"val2\"}" }  // string form
 * ```
 *
 * string_or_struct<T>() inspects the shape of the value and routes it:
 * - string -> string_parser<T> (see StringParser.hpp), raw string verbatim
 * - map    -> T's own from_json, run against the object node unchanged
 * - other  -> UnsupportedShapeError ("expected string or map")
 *
 * All templates are stateless and reentrant. A T is only handed out once
 * fully decoded; on failure a DecodeError is thrown instead.
 */

#ifndef DUALFORM_STRING_OR_STRUCT_HPP
#define DUALFORM_STRING_OR_STRUCT_HPP

#include "dualform/Errors.hpp"
#include "dualform/StringParser.hpp"
#include "dualform/Value.hpp"

#include <nlohmann/json.hpp>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace dualform {

/**
 * @brief Decoding source for the map path
 *
 * Borrows an object node for the duration of one decode; nothing is
 * copied and the entries keep the tree's own order.
 */
template <typename BasicJsonType>
class MapSource {
public:
    /**
     * @param node Object node to expose; must outlive the view
     * @throws UnsupportedShapeError if @p node is not an object
     */
    explicit MapSource(const BasicJsonType& node) : node_(node) {
        if (!node_.is_object()) {
            throw UnsupportedShapeError(type_name(node_));
        }
    }

    /// The node as the framework's decoding source.
    const BasicJsonType& source() const noexcept { return node_; }

private:
    const BasicJsonType& node_;
};

/**
 * @brief Run T's structured decoder on @p j into @p out
 *
 * A DecodeError raised by a nested field keeps its kind and path;
 * anything else the decoder throws (typically nlohmann type_error or
 * out_of_range) becomes a StructuredDecodeError with the original text.
 */
template <typename T, typename BasicJsonType>
void decode_structured(const BasicJsonType& j, T& out) {
    static_assert(has_structured_decode<T, BasicJsonType>::value,
                  "dualform: target type needs from_json(const json&, T&) "
                  "or an nlohmann::adl_serializer<T> specialization");
    try {
        j.get_to(out);
    } catch (const DecodeError&) {
        throw;
    } catch (const std::exception& e) {
        throw StructuredDecodeError(e.what());
    }
}

/**
 * @brief String path: parse @p raw with T's string parser
 *
 * @param raw The string exactly as found in the document
 * @return Parsed T
 * @throws StringParseError carrying the parser's message
 */
template <typename T>
T decode_string_form(const std::string& raw) {
    static_assert(has_string_parser<T>::value,
                  "dualform: target type needs from_string(const std::string&, T&) "
                  "or a dualform::string_parser<T> specialization");
    T out{};
    try {
        string_parser<T>::parse(raw, out);
    } catch (const std::exception& e) {
        throw StringParseError(e.what());
    }
    return out;
}

/**
 * @brief Map path: decode T from the entries of an object node
 *
 * @param object Object node
 * @return Decoded T
 * @throws StructuredDecodeError carrying T's decoder message
 */
template <typename T, typename BasicJsonType>
T decode_map_form(const BasicJsonType& object) {
    MapSource<BasicJsonType> entries(object);
    T out{};
    decode_structured(entries.source(), out);
    return out;
}

/**
 * @brief Decode T from a value given either as a string or as a map
 *
 * @param j Value of unknown shape
 * @return Decoded T
 * @throws UnsupportedShapeError if @p j is neither a string nor an object
 * @throws StringParseError if the string form is rejected by T's parser
 * @throws StructuredDecodeError if the map form is rejected by T's decoder
 *
 * Example:
 * ```cpp
 * auto a = string_or_struct<Options>(Value::parse(R"({"opt1":"x"})"));
 * auto b = string_or_struct<Options>(Value(R"({"opt1":"x"})"));
 * // a and b are equal
 * ```
 */
template <typename T, typename BasicJsonType>
T string_or_struct(const BasicJsonType& j) {
    switch (classify(j)) {
        case Shape::string:
            return decode_string_form<T>(
                j.template get_ref<const typename BasicJsonType::string_t&>());
        case Shape::map:
            return decode_map_form<T>(j);
        case Shape::other:
            break;
    }
    throw UnsupportedShapeError(type_name(j));
}

/**
 * @brief Out-parameter form, for use inside a from_json
 *
 * @p out is only assigned once decoding has succeeded.
 */
template <typename T, typename BasicJsonType>
void string_or_struct(const BasicJsonType& j, T& out) {
    out = string_or_struct<T>(j);
}

/**
 * @brief Decode member @p key of @p object in either form
 *
 * Intended for a containing type's from_json. Failures inside the member
 * get @p key prepended to their path.
 *
 * @throws StructuredDecodeError if @p object has no member @p key
 */
template <typename T, typename BasicJsonType>
void get_string_or_struct(const BasicJsonType& object, const std::string& key, T& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw StructuredDecodeError("missing field '" + key + "'");
    }
    try {
        out = string_or_struct<T>(*it);
    } catch (const DecodeError& e) {
        e.rethrow_at(key);
    }
}

/**
 * @brief Like get_string_or_struct(), but an absent or null member
 *        yields std::nullopt
 */
template <typename T, typename BasicJsonType>
void get_optional_string_or_struct(const BasicJsonType& object, const std::string& key,
                                   std::optional<T>& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        out.reset();
        return;
    }
    try {
        out = string_or_struct<T>(*it);
    } catch (const DecodeError& e) {
        e.rethrow_at(key);
    }
}

/**
 * @brief Structured-decode member @p key of @p object, attaching @p key
 *        to the path of any failure
 *
 * Works for any T with a from_json, including StringOrStruct<U>. @p out
 * is only assigned once the member decoded successfully.
 *
 * @throws StructuredDecodeError if @p object has no member @p key
 */
template <typename T, typename BasicJsonType>
void get_field(const BasicJsonType& object, const std::string& key, T& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        throw StructuredDecodeError("missing field '" + key + "'");
    }
    T value{};
    try {
        decode_structured(*it, value);
    } catch (const DecodeError& e) {
        e.rethrow_at(key);
    }
    out = std::move(value);
}

/**
 * @brief Member wrapper decoded in either form by get<>()/get_to()
 *
 * The wrapper decodes a value, not a member, so it has no field name to
 * report. Read it with get_field() to get the path on failures:
 *
 * ```cpp
 * struct Container {
 *     dualform::StringOrStruct<Options> options;
 * };
 * void from_json(const Value& j, Container& c) {
 *     dualform::get_field(j, "options", c.options);
 * }
 * ```
 */
template <typename T>
struct StringOrStruct {
    T value{};

    const T& operator*() const noexcept { return value; }
    T& operator*() noexcept { return value; }
    const T* operator->() const noexcept { return &value; }
    T* operator->() noexcept { return &value; }
};

} // namespace dualform

namespace nlohmann {

template <typename T>
struct adl_serializer<dualform::StringOrStruct<T>> {
    template <typename BasicJsonType>
    static void from_json(const BasicJsonType& j, dualform::StringOrStruct<T>& out) {
        out.value = dualform::string_or_struct<T>(j);
    }

    // Always written back in map form.
    template <typename BasicJsonType>
    static void to_json(BasicJsonType& j, const dualform::StringOrStruct<T>& in) {
        j = in.value;
    }
};

} // namespace nlohmann

#endif // DUALFORM_STRING_OR_STRUCT_HPP
