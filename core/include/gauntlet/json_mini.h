#pragma once

// json_mini.h
//
// Thin helpers over json-c: an owning document handle plus typed field
// lookups on already-parsed objects. Lookups never throw; a missing key or
// a type mismatch yields std::nullopt.

#include <json-c/json.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gauntlet::json_mini {

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

    explicit operator bool() const { return root != nullptr; }
};

// Strict parse: trailing garbage or a truncated document yields an empty Doc.
inline Doc parse(const std::string& json, std::string* err = nullptr) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (err) *err = "json_tokener_new failed";
        return Doc{};
    }
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    const int end = static_cast<int>(json_tokener_get_parse_end(tok));
    if (jerr == json_tokener_success && end < len) {
        // Allow trailing whitespace only.
        for (int i = end; i < len; i++) {
            char c = json[(size_t)i];
            if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
                jerr = json_tokener_error_parse_unexpected;
                break;
            }
        }
    }
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        if (err) *err = json_tokener_error_desc(jerr);
        return Doc{};
    }
    return Doc{obj};
}

inline json_object* field(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

inline std::optional<std::string> get_string(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
}

inline std::optional<int64_t> get_int(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

inline std::optional<bool> get_bool(json_object* obj, const char* key) {
    json_object* v = field(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

// Array of strings. Non-string elements are skipped.
inline std::optional<std::vector<std::string>> get_string_array(json_object* obj, const char* key) {
    json_object* arr = field(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return std::nullopt;
    std::vector<std::string> out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (el && json_object_is_type(el, json_type_string)) {
            out.emplace_back(json_object_get_string(el));
        }
    }
    return out;
}

inline std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

} // namespace gauntlet::json_mini
