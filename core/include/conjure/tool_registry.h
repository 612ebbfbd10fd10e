#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace conjure {

struct ToolEntry {
    std::string name;
    std::string purpose;
    std::vector<std::string> methods;
    int64_t usage_count{0};
    int64_t success_count{0};
    int64_t failure_count{0};
    std::string last_used_at;
    std::string created_at;
    std::string lifecycle_state{"active"};
};

// Process-wide tool registry backed by <toolstore_root>/registry.json.
// Explicit load (load-or-create) and explicit flush (atomic replace).
class ToolRegistry {
public:
    explicit ToolRegistry(std::filesystem::path path);

    // Missing file: empty registry. Corrupt file: quarantined, empty registry.
    bool load(std::string* err);
    bool flush(std::string* err) const;

    void upsert(const ToolEntry& e);
    const ToolEntry* find(const std::string& name) const;
    // Records one invocation of name.method.
    void touch_usage(const std::string& name, const std::string& method, bool ok);

    // Object keyed by tool name: {purpose, methods, usage_count, ...}.
    std::string tools_json() const;

    using Snapshot = std::map<std::string, ToolEntry>;
    Snapshot snapshot() const { return tools_; }
    void restore(const Snapshot& s) { tools_ = s; }

    size_t size() const { return tools_.size(); }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    std::map<std::string, ToolEntry> tools_;
};

} // namespace conjure
