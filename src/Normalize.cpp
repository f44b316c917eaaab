/**
 * @file Normalize.cpp
 * @brief Implementation of string-form to map-form normalization
 */

#include "dualform/Normalize.hpp"
#include "dualform/DotPath.hpp"
#include "dualform/Errors.hpp"

#include <stdexcept>
#include <utility>

namespace dualform {

void from_json(const Value& j, JsonObject& out) {
    out.fields = j.get<Value::object_t>();
}

void to_json(Value& j, const JsonObject& in) {
    j = in.fields;
}

void from_string(const std::string& raw, JsonObject& out) {
    Value parsed = Value::parse(raw);
    if (!parsed.is_object()) {
        throw std::invalid_argument("expected JSON text of an object, got " + type_name(parsed));
    }
    out.fields = std::move(parsed);
}

Shape shape_at(const Value& doc, const std::string& path) {
    return classify(*get_by_dot(doc, path));
}

Shape normalize_field(Value& doc, const std::string& path) {
    const Value& field = *get_by_dot(doc, path);
    const Shape shape = classify(field);

    JsonObject decoded;
    try {
        decoded = string_or_struct<JsonObject>(field);
    } catch (const DecodeError& e) {
        e.rethrow_at(split_dot_path(path));
    }

    if (shape == Shape::string) {
        set_by_dot(doc, path, decoded.fields, false);
    }
    return shape;
}

} // namespace dualform
