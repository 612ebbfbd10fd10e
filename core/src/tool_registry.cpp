#include "conjure/tool_registry.h"
#include "conjure/fs_util.h"
#include "conjure/json_mini.h"
#include "conjure/log.h"
#include "conjure/serialization.h"

#include <algorithm>

namespace conjure {

namespace {

json_object* entry_to_json(const ToolEntry& e) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "purpose", json_object_new_string(e.purpose.c_str()));
    json_object_object_add(o, "methods", json_string_array(e.methods));
    json_object_object_add(o, "usage_count", json_object_new_int64(e.usage_count));
    json_object_object_add(o, "success_count", json_object_new_int64(e.success_count));
    json_object_object_add(o, "failure_count", json_object_new_int64(e.failure_count));
    json_object_object_add(o, "last_used_at",
                           e.last_used_at.empty() ? nullptr : json_object_new_string(e.last_used_at.c_str()));
    json_object_object_add(o, "created_at", json_object_new_string(e.created_at.c_str()));
    json_object_object_add(o, "lifecycle_state", json_object_new_string(e.lifecycle_state.c_str()));
    return o;
}

json_object* registry_to_json(const std::map<std::string, ToolEntry>& tools) {
    json_object* o = json_object_new_object();
    for (const auto& kv : tools) json_object_object_add(o, kv.first.c_str(), entry_to_json(kv.second));
    return o;
}

} // namespace

ToolRegistry::ToolRegistry(std::filesystem::path path) : path_(std::move(path)) {}

bool ToolRegistry::load(std::string* err) {
    tools_.clear();
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) return true;

    std::string text;
    if (!slurp_file(path_, &text)) {
        if (err) *err = "cannot read " + path_.string();
        return false;
    }
    json_mini::Doc d = json_mini::parse(text);
    json_object* tools = nullptr;
    if (!d.is_object() || !json_object_object_get_ex(d.root, "tools", &tools) ||
        !json_object_is_type(tools, json_type_object)) {
        const std::string moved = quarantine_corrupt_file(path_);
        debug_log("registry: quarantined corrupt file " + moved);
        return true;
    }

    json_object_object_foreach(tools, k, v) {
        if (!v || !json_object_is_type(v, json_type_object)) continue;
        ToolEntry e;
        e.name = k;
        json_get_string(v, "purpose", &e.purpose);
        e.methods = json_get_string_array(v, "methods");
        json_get_int(v, "usage_count", &e.usage_count);
        json_get_int(v, "success_count", &e.success_count);
        json_get_int(v, "failure_count", &e.failure_count);
        json_get_string(v, "last_used_at", &e.last_used_at);
        json_get_string(v, "created_at", &e.created_at);
        json_get_string(v, "lifecycle_state", &e.lifecycle_state);
        tools_[e.name] = e;
    }
    return true;
}

bool ToolRegistry::flush(std::string* err) const {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "schema_version", json_object_new_int(1));
    json_object_object_add(root, "tools", registry_to_json(tools_));
    const std::string body = json_dump(root);
    json_object_put(root);

    const std::string werr = write_atomic(path_, body);
    if (!werr.empty()) {
        if (err) *err = werr;
        return false;
    }
    return true;
}

void ToolRegistry::upsert(const ToolEntry& e) {
    ToolEntry copy = e;
    if (copy.created_at.empty()) copy.created_at = iso_now_ms();
    tools_[copy.name] = copy;
}

const ToolEntry* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

void ToolRegistry::touch_usage(const std::string& name, const std::string& method, bool ok) {
    const std::string ts = iso_now_ms();
    ToolEntry& e = tools_[name];
    if (e.name.empty()) {
        e.name = name;
        e.created_at = ts;
    }
    if (!method.empty() && std::find(e.methods.begin(), e.methods.end(), method) == e.methods.end()) {
        e.methods.push_back(method);
    }
    e.usage_count++;
    if (ok) e.success_count++;
    else e.failure_count++;
    e.last_used_at = ts;
}

std::string ToolRegistry::tools_json() const {
    json_object* o = registry_to_json(tools_);
    std::string out = json_dump(o);
    json_object_put(o);
    return out;
}

} // namespace conjure
