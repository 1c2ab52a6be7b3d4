#pragma once

// json_mini.h
//
// Small RAII layer over json-c shared by manifests, lock files, request
// documents and the audit log.

#include <json-c/json.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace prism::json_mini {

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

    // Gives up ownership; caller must json_object_put() the result.
    json_object* release() {
        json_object* r = root;
        root = nullptr;
        return r;
    }

    static Doc object() { return Doc{json_object_new_object()}; }
    static Doc array() { return Doc{json_object_new_array()}; }

    Doc clone() const;
    std::string dump() const;
};

// Returns an empty Doc on any parse error (including trailing garbage).
Doc parse(const std::string& json);

// Reads and parses a whole file. On failure returns an empty Doc and fills err.
Doc parse_file(const std::filesystem::path& path, std::string* err);

// Member lookup. Returns nullptr if obj is not an object or key is absent.
json_object* member(json_object* obj, const char* key);

std::optional<std::string> string_at(json_object* obj, const char* key);
std::optional<int64_t> int_at(json_object* obj, const char* key);
std::optional<bool> bool_at(json_object* obj, const char* key);

// String elements of an array member; non-strings are skipped.
std::vector<std::string> strings_at(json_object* obj, const char* key);

// Truthiness: null, false, 0, "" and empty containers are false.
bool truthy(json_object* v);

// Sorted-key compact serialization (RFC 8785 subset) for hashing.
std::string canonical_json(json_object* obj);

std::string to_string(json_object* obj);

// Adds a string member (json_object_object_add replaces an existing key).
inline void put_string(json_object* obj, const char* key, const std::string& value) {
    json_object_object_add(obj, key, json_object_new_string_len(value.c_str(), static_cast<int>(value.size())));
}

} // namespace prism::json_mini
