#include "conjure/environment.h"
#include "conjure/errors.h"
#include "conjure/fs_util.h"
#include "conjure/hash.h"
#include "conjure/log.h"
#include "conjure/proc.h"
#include "conjure/serialization.h"

#include <cctype>
#include <chrono>
#include <sstream>

namespace conjure {

namespace {

int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - since).count();
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

// ">= 1.2" -> {"--atleast-version", "1.2"}; ">= 0" means any version.
bool version_check_args(const std::string& constraint, std::string* flag, std::string* version) {
    std::string v = trim(constraint);
    if (v.empty() || v == ">= 0") return false;
    struct Op { const char* op; const char* flag; };
    static const Op kOps[] = {
        {">=", "--atleast-version"}, {"~>", "--atleast-version"}, {"<=", "--max-version"},
        {"==", "--exact-version"},   {"=", "--exact-version"},
    };
    for (const auto& o : kOps) {
        std::string op = o.op;
        if (v.rfind(op, 0) == 0) {
            *flag = o.flag;
            *version = trim(v.substr(op.size()));
            return !version->empty();
        }
    }
    *flag = "--exact-version";
    *version = v;
    return true;
}

ProcLimits pkg_config_limits(int timeout_ms) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = 64 * 1024;
    lim.merge_stderr = false;
    return lim;
}

void run_pkg_config(const std::vector<std::string>& argv, int timeout_ms, ProcResult* r) {
    if (!proc_run_capture(argv, "", pkg_config_limits(timeout_ms), r)) {
        throw Error("dependency_activation_failed", "pkg-config failed to start: " + r->error);
    }
    if (r->timed_out) {
        throw Error("dependency_activation_failed", "pkg-config timed out");
    }
    if (r->exit_code == 127) {
        throw Error("dependency_activation_failed", "pkg-config not found on PATH");
    }
}

} // namespace

std::string environment_id(const DependencyManifest& m) {
    return hash::sha256_hex(m.canonical()).substr(0, 16);
}

std::vector<std::string> read_environment_flags(const std::string& env_dir) {
    if (env_dir.empty()) return {};
    std::string text;
    if (!slurp_file(std::filesystem::path(env_dir) / "flags.txt", &text)) return {};
    return split_argv_quoted(text);
}

PkgConfigEnvironmentManager::PkgConfigEnvironmentManager(std::filesystem::path root, int timeout_ms)
    : root_(std::move(root)), timeout_ms_(timeout_ms) {}

EnvironmentHandle PkgConfigEnvironmentManager::ensure(const DependencyManifest& m) {
    const auto t0 = std::chrono::steady_clock::now();
    EnvironmentHandle h;
    h.env_id = environment_id(m);
    h.manifest = m;
    const std::filesystem::path dir = root_ / h.env_id;
    h.dir = dir.string();

    std::error_code ec;
    if (std::filesystem::exists(dir / "ready", ec)) {
        h.cache_hit = true;
        h.flags = read_environment_flags(h.dir);
        h.prepare_ms = elapsed_ms(t0);
        return h;
    }

    // resolve
    const auto t_resolve = std::chrono::steady_clock::now();
    std::vector<std::string> modules;
    for (const auto& d : m.entries()) {
        ProcResult r;
        run_pkg_config({"pkg-config", "--exists", d.name}, timeout_ms_, &r);
        if (r.exit_code != 0) {
            throw Error("dependency_resolution_failed", "pkg-config module not found: " + d.name,
                        "{\"dependency\":" + json_quote(d.name) + "}");
        }
        std::string flag, version;
        if (version_check_args(d.version, &flag, &version)) {
            run_pkg_config({"pkg-config", flag + "=" + version, d.name}, timeout_ms_, &r);
            if (r.exit_code != 0) {
                throw Error("dependency_resolution_failed",
                            "pkg-config module " + d.name + " does not satisfy " + d.version,
                            "{\"dependency\":" + json_quote(d.name) + ",\"version\":" + json_quote(d.version) + "}");
            }
        }
        modules.push_back(d.name);
    }

    std::string flags_text;
    if (!modules.empty()) {
        std::vector<std::string> argv{"pkg-config", "--cflags", "--libs"};
        argv.insert(argv.end(), modules.begin(), modules.end());
        ProcResult r;
        run_pkg_config(argv, timeout_ms_, &r);
        if (r.exit_code != 0) {
            throw Error("dependency_install_failed", "pkg-config --cflags --libs failed (exit_code=" +
                        std::to_string(r.exit_code) + ")");
        }
        flags_text = trim(r.output);
    }
    h.resolve_ms = elapsed_ms(t_resolve);

    // materialize into a staging dir, then publish with one rename
    auto staging = dir;
    staging += ".staging-" + hash::random_hex(4);
    std::filesystem::create_directories(staging, ec);
    if (ec) {
        throw Error("dependency_install_failed", "cannot create " + staging.string() + ": " + ec.message());
    }
    std::string werr = write_atomic(staging / "manifest.json", m.to_json_text());
    if (werr.empty()) werr = write_atomic(staging / "flags.txt", flags_text + "\n");
    if (werr.empty()) werr = write_atomic(staging / "ready", iso_now_ms() + "\n");
    if (!werr.empty()) {
        std::filesystem::remove_all(staging, ec);
        throw Error("dependency_install_failed", werr);
    }
    std::filesystem::rename(staging, dir, ec);
    if (ec) {
        // lost a race with another materializer; theirs is equivalent
        std::error_code ec2;
        std::filesystem::remove_all(staging, ec2);
        if (!std::filesystem::exists(dir / "ready", ec2)) {
            throw Error("dependency_install_failed", "cannot publish " + dir.string() + ": " + ec.message());
        }
    }

    h.flags = split_argv_quoted(flags_text);
    h.prepare_ms = elapsed_ms(t0);
    debug_log("environment " + h.env_id + " materialized (" + std::to_string(modules.size()) + " modules)");
    return h;
}

} // namespace conjure
