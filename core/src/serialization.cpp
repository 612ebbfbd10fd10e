#include "conjure/serialization.h"
#include "conjure/json_mini.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace conjure {

// --- JSON helpers ---

std::string json_quote(const std::string& s) {
    json_object* o = json_object_new_string_len(s.c_str(), (int)s.size());
    if (!o) return "\"\"";
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

bool json_get_string(json_object* o, const char* k, std::string* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_string)) return false;
    *out = json_object_get_string(v);
    return true;
}

bool json_get_bool(json_object* o, const char* k, bool* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_boolean)) { *out = (json_object_get_boolean(v) != 0); return true; }
    return false;
}

bool json_get_int(json_object* o, const char* k, int64_t* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_int)) { *out = json_object_get_int64(v); return true; }
    if (json_object_is_type(v, json_type_double)) { *out = (int64_t)json_object_get_double(v); return true; }
    return false;
}

bool json_get_double(json_object* o, const char* k, double* out) {
    if (!o || !out) return false;
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return false;
    if (json_object_is_type(v, json_type_double) || json_object_is_type(v, json_type_int)) {
        *out = json_object_get_double(v);
        return true;
    }
    return false;
}

std::vector<std::string> json_get_string_array(json_object* o, const char* k) {
    std::vector<std::string> out;
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v) || !v || !json_object_is_type(v, json_type_array)) return out;
    const size_t n = json_object_array_length(v);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* it = json_object_array_get_idx(v, i);
        if (it && json_object_is_type(it, json_type_string)) out.push_back(json_object_get_string(it));
    }
    return out;
}

std::string json_get_raw(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v)) return "null";
    return json_dump(v);
}

json_object* json_string_array(const std::vector<std::string>& items) {
    json_object* arr = json_object_new_array();
    for (const auto& s : items) {
        json_object_array_add(arr, json_object_new_string_len(s.c_str(), (int)s.size()));
    }
    return arr;
}

void json_add_raw(json_object* o, const char* k, const std::string& raw_json) {
    if (!o) return;
    if (json_mini::is_valid(raw_json)) {
        json_mini::Doc d = json_mini::parse(raw_json);
        json_object_object_add(o, k, d.release());
        return;
    }
    json_object_object_add(o, k, json_object_new_string_len(raw_json.c_str(), (int)raw_json.size()));
}

std::string json_dump(json_object* o) {
    if (!o) return "null";
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
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
            out << json_quote(keys[i]) << ":";
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

std::string json_canonical(json_object* o) {
    std::ostringstream out;
    canonical_serialize(o, out);
    return out.str();
}

std::string json_canonical_text(const std::string& raw) {
    if (!json_mini::is_valid(raw)) return raw;
    json_mini::Doc d = json_mini::parse(raw);
    return json_canonical(d.root);
}

// --- JsonMap ---

json_object* json_map_to_object(const JsonMap& m) {
    json_object* o = json_object_new_object();
    for (const auto& kv : m) {
        json_add_raw(o, kv.first.c_str(), kv.second);
    }
    return o;
}

std::string json_map_to_text(const JsonMap& m) {
    json_object* o = json_map_to_object(m);
    std::string out = json_dump(o);
    json_object_put(o);
    return out;
}

bool json_map_from_object(json_object* o, JsonMap* out) {
    if (!out) return false;
    if (!o || !json_object_is_type(o, json_type_object)) return false;
    JsonMap m;
    json_object_object_foreach(o, k, v) {
        m[k] = json_dump(v);
    }
    *out = std::move(m);
    return true;
}

bool json_map_from_text(const std::string& text, JsonMap* out) {
    json_mini::Doc d = json_mini::parse(text);
    return json_map_from_object(d.root, out);
}

std::string iso_now_ms() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace conjure
