#include "conjure/guardrail.h"
#include "conjure/json_mini.h"

#include <algorithm>
#include <cctype>

namespace conjure {

namespace {

std::string lower(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

bool contains(const std::string& hay, const std::string& needle) {
    return hay.find(needle) != std::string::npos;
}

bool contains_any(const std::string& hay, const std::vector<std::string>& needles) {
    for (const auto& n : needles) {
        if (contains(hay, n)) return true;
    }
    return false;
}

bool is_ident_char(char c) { return std::isalnum((unsigned char)c) || c == '_'; }

size_t skip_ws(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace((unsigned char)s[i])) i++;
    return i;
}

std::string location_of(const std::string& code, size_t pos) {
    size_t line = 1 + (size_t)std::count(code.begin(), code.begin() + (long)std::min(pos, code.size()), '\n');
    return "program:" + std::to_string(line);
}

// Positions where `word` appears as a whole identifier followed by '('.
std::vector<size_t> call_sites(const std::string& code, const std::string& word) {
    std::vector<size_t> out;
    size_t pos = 0;
    while ((pos = code.find(word, pos)) != std::string::npos) {
        const size_t end = pos + word.size();
        const bool left_ok = pos == 0 || !is_ident_char(code[pos - 1]);
        const bool right_ok = end < code.size() && !is_ident_char(code[end]);
        if (left_ok && right_ok) {
            size_t p = skip_ws(code, end);
            if (p < code.size() && code[p] == '(') out.push_back(pos);
        }
        pos = end;
    }
    return out;
}

// Receiver of a member call ending right before pos ("host" in host.x(),
// "" for an expression receiver such as f().x()). nullopt for a free call.
std::optional<std::string> receiver_before(const std::string& code, size_t pos) {
    size_t i = pos;
    while (i > 0 && std::isspace((unsigned char)code[i - 1])) i--;
    if (i >= 1 && code[i - 1] == '.') {
        i -= 1;
    } else if (i >= 2 && code[i - 2] == '-' && code[i - 1] == '>') {
        i -= 2;
    } else {
        return std::nullopt;
    }
    while (i > 0 && std::isspace((unsigned char)code[i - 1])) i--;
    size_t end = i;
    while (i > 0 && is_ident_char(code[i - 1])) i--;
    return code.substr(i, end - i);
}

// First string literal argument of the call at pos ("" when not a literal).
std::string first_literal_arg(const std::string& code, size_t pos) {
    size_t p = code.find('(', pos);
    if (p == std::string::npos) return "";
    p = skip_ws(code, p + 1);
    if (p >= code.size() || code[p] != '"') return "";
    size_t close = code.find('"', p + 1);
    if (close == std::string::npos) return "";
    return code.substr(p + 1, close - p - 1);
}

bool delegates_to_fetcher(const std::string& code) {
    for (size_t pos : call_sites(code, "delegate")) {
        if (contains(lower(first_literal_arg(code, pos)), "fetch")) return true;
    }
    return false;
}

// Programs that pull data from outside the engine.
bool external_data_flow(const std::string& code) {
    const std::string low = lower(code);
    return delegates_to_fetcher(code) || contains_any(low, {"curl/curl.h", "curl_easy_"});
}

bool fetch_like(const std::string& code) {
    const std::string low = lower(code);
    return external_data_flow(code) || contains(low, "fetch_result");
}

bool blank_member(json_object* o, const char* key) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, key, &v) || !v) return true;
    std::string s = json_object_is_type(v, json_type_string) ? json_object_get_string(v) : json_dump(v);
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    return s.empty();
}

bool valid_provenance_source(json_object* src) {
    if (!src || !json_object_is_type(src, json_type_object)) return false;
    for (const char* k : {"uri", "fetched_at", "retrieval_tool"}) {
        if (blank_member(src, k)) return false;
    }
    std::string mode;
    if (!json_get_string(src, "retrieval_mode", &mode)) return false;
    mode.erase(0, mode.find_first_not_of(" \t\r\n"));
    mode.erase(mode.find_last_not_of(" \t\r\n") + 1);
    mode = lower(mode);
    return mode == "live" || mode == "cached" || mode == "fixture";
}

bool has_external_provenance(const std::string& value_json) {
    json_mini::Doc d = json_mini::parse(value_json);
    if (!d.is_object()) return false;
    json_object* prov = nullptr;
    if (!json_object_object_get_ex(d.root, "provenance", &prov) || !prov ||
        !json_object_is_type(prov, json_type_object)) {
        return false;
    }
    json_object* sources = nullptr;
    if (!json_object_object_get_ex(prov, "sources", &sources) || !sources ||
        !json_object_is_type(sources, json_type_array)) {
        return false;
    }
    const size_t n = json_object_array_length(sources);
    if (n == 0) return false;
    for (size_t i = 0; i < n; i++) {
        if (!valid_provenance_source(json_object_array_get_idx(sources, i))) return false;
    }
    return true;
}

} // namespace

std::string strip_line_comments(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    bool in_string = false;
    for (size_t i = 0; i < code.size(); i++) {
        char c = code[i];
        if (in_string) {
            out.push_back(c);
            if (c == '\\' && i + 1 < code.size()) {
                out.push_back(code[++i]);
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        if (c == '"') {
            in_string = true;
            out.push_back(c);
            continue;
        }
        if (c == '/' && i + 1 < code.size() && code[i + 1] == '/') {
            while (i < code.size() && code[i] != '\n') i++;
            if (i < code.size()) out.push_back('\n');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string GuardrailViolation::to_json() const {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "guardrail_class", json_object_new_string(guardrail_class.c_str()));
    json_object_object_add(o, "violation_type", json_object_new_string(violation_type.c_str()));
    json_object_object_add(o, "violation_subtype", json_object_new_string(violation_subtype.c_str()));
    json_object_object_add(o, "message", json_object_new_string(message.c_str()));
    json_object_object_add(o, "required_correction", json_object_new_string(required_correction.c_str()));
    json_object_object_add(o, "location",
                           location.empty() ? nullptr : json_object_new_string(location.c_str()));
    std::string s = json_dump(o);
    json_object_put(o);
    return s;
}

std::string guardrail_class_for_message(const std::string& message) {
    static const std::vector<std::string> kTerminal = {
        "missing credential", "api key", "unsupported runtime capability", "external service unavailable",
    };
    return contains_any(lower(message), kTerminal) ? GUARDRAIL_TERMINAL : GUARDRAIL_RECOVERABLE;
}

std::string required_correction_for(const std::string& subtype) {
    if (subtype == "singleton_method_mutation") {
        return "Call other roles through host.delegate(role, method, args); only host.define_method may add "
               "attempt-scoped capabilities.";
    }
    if (subtype == "tool_registry_mutation") {
        return "Read the registry with host.tools_json(); never write the \"tools\" key of role memory.";
    }
    if (subtype == "context_tools_shape_misuse") {
        return "Look tools up by name with json_object_object_get_ex on the tools_json() object, or iterate "
               "json_object_object_foreach over name/metadata pairs.";
    }
    if (subtype == "hardcoded_external_fallback_success") {
        return "Do not return hardcoded fallback lists through host.ok. Return a typed low_utility (or "
               "unsupported_capability) error unless the output is derived from fetched data.";
    }
    if (subtype == "missing_external_provenance") {
        return "For external-data success, return a value with provenance.sources[] and give each source uri, "
               "fetched_at, retrieval_tool and retrieval_mode (live|cached|fixture).";
    }
    if (subtype == "role_profile_continuity_violation") {
        return "Keep the role's shared state keys consistent with the role's other methods.";
    }
    return "Rewrite using host.delegate invocation paths and avoid mutating runtime metadata.";
}

GuardrailViolation make_violation(const std::string& subtype, const std::string& message, const std::string& location) {
    GuardrailViolation v;
    v.guardrail_class = guardrail_class_for_message(message);
    v.violation_subtype = subtype;
    v.message = message;
    v.required_correction = required_correction_for(subtype);
    v.location = location;
    return v;
}

std::optional<GuardrailViolation> SingletonMethodMutationCheck::check_code(const std::string& code) const {
    const std::string src = strip_line_comments(code);
    for (size_t pos : call_sites(src, "define_method")) {
        auto recv = receiver_before(src, pos);
        if (recv && *recv != "host") {
            return make_violation(name(),
                                  "Defining methods on objects other than the program host is not supported "
                                  "(receiver '" + (recv->empty() ? std::string("<expression>") : *recv) +
                                  "'); use delegate invocation paths.",
                                  location_of(src, pos));
        }
    }
    return std::nullopt;
}

std::optional<GuardrailViolation> ToolRegistryMutationCheck::check_code(const std::string& code) const {
    const std::string src = strip_line_comments(code);
    for (size_t pos : call_sites(src, "memory_set")) {
        if (first_literal_arg(src, pos) == TOOLS_MEMORY_KEY) {
            return make_violation(name(),
                                  "Programs must not write the tool registry through memory_set(\"tools\", ...).",
                                  location_of(src, pos));
        }
    }
    return std::nullopt;
}

std::optional<GuardrailViolation> ContextToolsShapeCheck::check_code(const std::string& code) const {
    const std::string src = strip_line_comments(code);
    const size_t at = src.find("tools_json()");
    if (at == std::string::npos) return std::nullopt;

    const bool positional = contains_any(src, {"json_object_array_get_idx", "json_object_array_length"});
    const bool name_member = contains(src, "\"name\"") && contains(src, "for (");
    if (!positional && !name_member) return std::nullopt;

    return make_violation(name(),
                          "tools_json() is an object keyed by tool name; look tools up by key or iterate "
                          "name/metadata pairs (not positional elements with a \"name\" member).",
                          location_of(src, at));
}

std::optional<GuardrailViolation> HardcodedFallbackCheck::check_code(const std::string& code) const {
    const std::string src = strip_line_comments(code);
    if (!fetch_like(src)) return std::nullopt;

    size_t pos = 0;
    while ((pos = src.find("fallback_", pos)) != std::string::npos) {
        if (pos > 0 && is_ident_char(src[pos - 1])) {
            pos += 9;
            continue;
        }
        size_t end = pos;
        while (end < src.size() && is_ident_char(src[end])) end++;
        const std::string var = src.substr(pos, end - pos);
        size_t p = skip_ws(src, end);
        const bool declared = p < src.size() &&
                              (src[p] == '{' || (src[p] == '=' && (p + 1 >= src.size() || src[p + 1] != '=')));
        if (declared) {
            for (size_t ok_pos : call_sites(src, "ok")) {
                size_t a = skip_ws(src, src.find('(', ok_pos) + 1);
                if (src.compare(a, var.size(), var) == 0 &&
                    (a + var.size() >= src.size() || !is_ident_char(src[a + var.size()]))) {
                    return make_violation(name(),
                                          "Hardcoded fallback payloads for external-fetch flows must not be returned "
                                          "through host.ok; emit low_utility/unsupported_capability instead.",
                                          location_of(src, ok_pos));
                }
            }
        }
        pos = end;
    }
    return std::nullopt;
}

std::optional<GuardrailViolation> ExternalProvenanceCheck::check_outcome(const std::string& code,
                                                                         const Outcome& outcome) const {
    if (!outcome.ok) return std::nullopt;
    if (!external_data_flow(strip_line_comments(code))) return std::nullopt;
    if (has_external_provenance(outcome.value_json)) return std::nullopt;
    return make_violation(name(),
                          "External-data success must include provenance.sources[] with uri, fetched_at, "
                          "retrieval_tool, and retrieval_mode (live|cached|fixture).");
}

GuardrailPolicy GuardrailPolicy::with_default_checks() {
    GuardrailPolicy p;
    p.add(std::make_unique<SingletonMethodMutationCheck>());
    p.add(std::make_unique<ToolRegistryMutationCheck>());
    p.add(std::make_unique<ContextToolsShapeCheck>());
    p.add(std::make_unique<HardcodedFallbackCheck>());
    p.add(std::make_unique<ExternalProvenanceCheck>());
    return p;
}

void GuardrailPolicy::add(std::unique_ptr<IGuardrailCheck> check) {
    if (check) checks_.push_back(std::move(check));
}

std::optional<GuardrailViolation> GuardrailPolicy::check_code(const std::string& code) const {
    for (const auto& c : checks_) {
        if (auto v = c->check_code(code)) return v;
    }
    return std::nullopt;
}

std::optional<GuardrailViolation> GuardrailPolicy::check_outcome(const std::string& code, const Outcome& outcome) const {
    for (const auto& c : checks_) {
        if (auto v = c->check_outcome(code, outcome)) return v;
    }
    return std::nullopt;
}

std::optional<GuardrailViolation> check_registry_integrity(const JsonMap& before,
                                                           const JsonMap& after,
                                                           const std::string& role,
                                                           const std::string& method_name) {
    auto b = before.find(TOOLS_MEMORY_KEY);
    auto a = after.find(TOOLS_MEMORY_KEY);
    const std::string bv = b == before.end() ? "" : json_canonical_text(b->second);
    const std::string av = a == after.end() ? "" : json_canonical_text(a->second);
    if (bv == av) return std::nullopt;
    return make_violation("tool_registry_mutation",
                          "Tool registry metadata changed during execution of " + role + "." + method_name + ".");
}

} // namespace conjure
