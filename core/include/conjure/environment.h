#pragma once

#include "conjure/dependency_manifest.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace conjure {

// One materialized runtime environment per distinct manifest.
struct EnvironmentHandle {
    std::string env_id;
    std::string dir;
    DependencyManifest manifest;
    bool cache_hit{false};
    int64_t resolve_ms{0};
    int64_t prepare_ms{0};
    std::vector<std::string> flags;  // compile/link flags for programs in this env
};

// First 16 hex chars of SHA-256 over the canonical manifest JSON.
std::string environment_id(const DependencyManifest& m);

// Materializes environments. Throws Error (dependency_resolution_failed,
// dependency_activation_failed, dependency_install_failed).
class IEnvironmentManager {
public:
    virtual ~IEnvironmentManager() = default;
    virtual EnvironmentHandle ensure(const DependencyManifest& m) = 0;
};

// Dependencies are pkg-config modules; the environment is the resolved
// --cflags/--libs set written under <root>/<env_id>/.
class PkgConfigEnvironmentManager final : public IEnvironmentManager {
public:
    explicit PkgConfigEnvironmentManager(std::filesystem::path root, int timeout_ms = 10000);
    EnvironmentHandle ensure(const DependencyManifest& m) override;

private:
    std::filesystem::path root_;
    int timeout_ms_;
};

// Flags recorded in <env_dir>/flags.txt (empty when absent).
std::vector<std::string> read_environment_flags(const std::string& env_dir);

} // namespace conjure
