#pragma once

// json_mini.h
//
// Small RAII layer over json-c. Values cross component boundaries as JSON
// text; Doc owns one parsed tree for the duration of a lookup.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conjure::json_mini {

struct Doc {
    json_object* root{nullptr};

    Doc() = default;
    explicit Doc(json_object* r) : root(r) {}
    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    Doc(Doc&& other) noexcept : root(other.root) { other.root = nullptr; }
    Doc& operator=(Doc&& other) noexcept {
        if (this != &other) {
            if (root) json_object_put(root);
            root = other.root;
            other.root = nullptr;
        }
        return *this;
    }

    ~Doc() {
        if (root) json_object_put(root);
    }

    // Hands ownership to the caller (e.g. json_object_object_add).
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    bool is_object() const { return root && json_object_is_type(root, json_type_object); }
    bool is_array() const { return root && json_object_is_type(root, json_type_array); }
};

// Strict parse: trailing garbage or a truncated document yields an empty Doc.
// The literal "null" parses to a valid Doc whose root is nullptr, so callers
// that need to tell the two apart use is_valid().
inline Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    if (json.size() > static_cast<size_t>(INT_MAX)) {
        json_tokener_free(tok);
        return Doc{};
    }
    // -1: read through the terminating NUL so top-level scalars complete.
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), -1);
    json_tokener_error jerr = json_tokener_get_error(tok);
    size_t consumed = static_cast<size_t>(tok->char_offset);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        char c = json[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

inline bool is_valid(const std::string& json) {
    std::string trimmed = json;
    trimmed.erase(0, trimmed.find_first_not_of(" \n\r\t"));
    if (trimmed.rfind("null", 0) == 0) {
        trimmed.erase(trimmed.find_last_not_of(" \n\r\t") + 1);
        return trimmed == "null";
    }
    return static_cast<bool>(parse(json).root);
}

} // namespace conjure::json_mini
