#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace conjure {

// --- JSON helpers (json-c wrappers) ---

std::string json_quote(const std::string& s);

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_bool(json_object* o, const char* k, bool* out);
bool json_get_int(json_object* o, const char* k, int64_t* out);
bool json_get_double(json_object* o, const char* k, double* out);
std::vector<std::string> json_get_string_array(json_object* o, const char* k);

// Raw JSON text of member k ("null" when absent).
std::string json_get_raw(json_object* o, const char* k);

json_object* json_string_array(const std::vector<std::string>& items);

// Adds raw JSON text as member k. Unparseable text is stored as a JSON string.
void json_add_raw(json_object* o, const char* k, const std::string& raw_json);

// Plain (compact) serialization; nullptr serializes as "null".
std::string json_dump(json_object* o);

// Sorted-key serialization. Deterministic for hashing and fingerprints.
std::string json_canonical(json_object* o);
// Parse + canonical; returns raw unchanged if it does not parse.
std::string json_canonical_text(const std::string& raw);

// --- string map <-> JSON object of raw values ---
// Shared role state is kept as key -> JSON text so snapshots are plain copies.

using JsonMap = std::map<std::string, std::string>;

json_object* json_map_to_object(const JsonMap& m);
std::string json_map_to_text(const JsonMap& m);
bool json_map_from_object(json_object* o, JsonMap* out);
bool json_map_from_text(const std::string& text, JsonMap* out);

// ISO-8601 UTC with millisecond precision.
std::string iso_now_ms();
int64_t now_ms();

} // namespace conjure
