#include "prism/json_mini.h"

#include <algorithm>
#include <climits>
#include <fstream>
#include <sstream>

namespace prism::json_mini {

Doc Doc::clone() const {
    if (!root) return Doc{};
    json_object* copy = nullptr;
    if (json_object_deep_copy(root, &copy, nullptr) != 0) return Doc{};
    return Doc{copy};
}

std::string Doc::dump() const {
    return to_string(root);
}

Doc parse(const std::string& json) {
    json_tokener* tok = json_tokener_new();
    if (!tok) return Doc{};
    const int len = static_cast<int>(std::min(json.size(), static_cast<size_t>(INT_MAX)));
    json_object* obj = json_tokener_parse_ex(tok, json.c_str(), len);
    json_tokener_error jerr = json_tokener_get_error(tok);
    const size_t consumed = json_tokener_get_parse_end(tok);
    json_tokener_free(tok);
    if (jerr != json_tokener_success) {
        if (obj) json_object_put(obj);
        return Doc{};
    }
    for (size_t i = consumed; i < json.size(); i++) {
        const char c = json[i];
        if (c != ' ' && c != '\n' && c != '\r' && c != '\t') {
            if (obj) json_object_put(obj);
            return Doc{};
        }
    }
    return Doc{obj};
}

Doc parse_file(const std::filesystem::path& path, std::string* err) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        if (err) *err = "cannot open " + path.string();
        return Doc{};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    Doc d = parse(ss.str());
    if (!d && err) *err = "invalid JSON in " + path.string();
    return d;
}

json_object* member(json_object* obj, const char* key) {
    if (!obj || !json_object_is_type(obj, json_type_object)) return nullptr;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(obj, key, &v)) return nullptr;
    return v;
}

std::optional<std::string> string_at(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_string)) return std::nullopt;
    return std::string(json_object_get_string(v));
}

std::optional<int64_t> int_at(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_int)) return std::nullopt;
    return static_cast<int64_t>(json_object_get_int64(v));
}

std::optional<bool> bool_at(json_object* obj, const char* key) {
    json_object* v = member(obj, key);
    if (!v || !json_object_is_type(v, json_type_boolean)) return std::nullopt;
    return json_object_get_boolean(v) != 0;
}

std::vector<std::string> strings_at(json_object* obj, const char* key) {
    std::vector<std::string> out;
    json_object* arr = member(obj, key);
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
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

bool truthy(json_object* v) {
    if (!v) return false;
    switch (json_object_get_type(v)) {
    case json_type_null: return false;
    case json_type_boolean: return json_object_get_boolean(v) != 0;
    case json_type_int: return json_object_get_int64(v) != 0;
    case json_type_double: return json_object_get_double(v) != 0.0;
    case json_type_string: return json_object_get_string_len(v) > 0;
    case json_type_array: return json_object_array_length(v) > 0;
    case json_type_object: return json_object_object_length(v) > 0;
    }
    return false;
}

static void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) { out << "null"; return; }

    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());

        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            json_object* ks = json_object_new_string(keys[i].c_str());
            out << json_object_to_json_string_ext(ks, JSON_C_TO_STRING_PLAIN);
            json_object_put(ks);
            out << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical_json(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

std::string to_string(json_object* obj) {
    if (!obj) return "null";
    return json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
}

} // namespace prism::json_mini
