/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "dualform/DotPath.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace dualform {

std::vector<std::string> split_dot_path(const std::string& path) {
    if (path.empty()) {
        return {};
    }

    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c == '.') {
            if (!current.empty()) {
                segments.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {
    /**
     * @brief Check if segment represents an array index
     * @return true if segment is a valid non-negative integer without
     *         leading zeros
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty()) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Resolve one segment of @p current
     * @return Child pointer, or nullptr if the segment does not exist
     * @throws TypeError if @p current is a scalar
     */
    template <typename V>
    V* child(V* current, const std::string& segment, const std::string& path) {
        if (current->is_object()) {
            auto it = current->find(segment);
            return it == current->end() ? nullptr : &*it;
        }
        if (current->is_array()) {
            if (!is_array_index(segment)) return nullptr;
            // Longer than any in-range index; std::stoull would overflow
            if (segment.size() > std::to_string(current->size()).size()) return nullptr;
            size_t idx = std::stoull(segment);
            return idx < current->size() ? &(*current)[idx] : nullptr;
        }
        throw TypeError(path, "object or array", type_name(*current));
    }
}

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = child(current, seg, path);
        if (current == nullptr) {
            throw KeyError(path, seg);
        }
    }
    return current;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        current = child(current, seg, path);
        if (current == nullptr) {
            return false;
        }
    }
    return true;
}

void set_by_dot(Value& data, const std::string& path,
                const Value& value, bool create_missing) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;

    for (size_t i = 0; i + 1 < segments.size(); ++i) {
        const auto& seg = segments[i];

        if (!current->is_object() && !current->is_array()) {
            if (!create_missing) {
                throw TypeError(path, "object or array", type_name(*current));
            }
            *current = Value::object();
        }

        Value* next = child(current, seg, path);
        if (next == nullptr) {
            if (!create_missing || current->is_array()) {
                throw KeyError(path, seg);
            }
            (*current)[seg] = Value::object();
            next = &(*current)[seg];
        }
        current = next;
    }

    const auto& final_seg = segments.back();
    if (current->is_array()) {
        Value* slot = child(current, final_seg, path);
        if (slot == nullptr) {
            throw KeyError(path, final_seg);
        }
        *slot = value;
        return;
    }
    if (!current->is_object()) {
        if (!create_missing) {
            throw TypeError(path, "object", type_name(*current));
        }
        *current = Value::object();
    }

    (*current)[final_seg] = value;
}

} // namespace dualform
