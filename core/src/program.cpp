#include "conjure/program.h"
#include "conjure/errors.h"
#include "conjure/fs_util.h"
#include "conjure/hash.h"
#include "conjure/log.h"
#include "conjure/proc.h"
#include "conjure/serialization.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include <dlfcn.h>

namespace conjure {

namespace {

bool try_run_version(const std::string& exe) {
    if (exe.empty()) return false;
    if (exe.find(' ') != std::string::npos || exe.find('\t') != std::string::npos) return false;
    ProcLimits l;
    l.timeout_ms = 1000;
    l.stdout_max_bytes = 4096;
    ProcResult r;
    if (!proc_run_capture({exe, "--version"}, "", l, &r)) return false;
    return r.exit_code == 0;
}

std::string tail(const std::string& s, size_t n) {
    return s.size() <= n ? s : "..." + s.substr(s.size() - n);
}

// dlclose on scope exit.
struct DlHandle {
    void* h{nullptr};
    explicit DlHandle(void* p) : h(p) {}
    DlHandle(const DlHandle&) = delete;
    DlHandle& operator=(const DlHandle&) = delete;
    ~DlHandle() {
        if (h) dlclose(h);
    }
};

} // namespace

const char* program_origin_name(ProgramOrigin o) {
    switch (o) {
    case ProgramOrigin::FRESH: return "fresh";
    case ProgramOrigin::PERSISTED: return "persisted";
    case ProgramOrigin::REPAIRED: return "repaired";
    }
    return "fresh";
}

std::string wrap_program_source(const std::string& body) {
    std::ostringstream src;
    src << "#include \"conjure/program_api.h\"\n"
        << "#include <algorithm>\n#include <cstdint>\n#include <cstring>\n#include <map>\n"
        << "#include <sstream>\n#include <stdexcept>\n#include <string>\n#include <vector>\n\n"
        << "static void conjure_program_body(conjure::ProgramHost& host) {\n"
        << "#line 1 \"program\"\n"
        << body << "\n"
        << "}\n\n"
        << "extern \"C\" int conjure_program_abi_version() { return CONJURE_PROGRAM_ABI_VERSION; }\n\n"
        << "extern \"C\" int conjure_program_run(conjure::ProgramHost* host, char* err_buf, unsigned long err_cap) {\n"
        << "    auto report = [&](const char* msg) {\n"
        << "        if (!err_buf || err_cap == 0) return;\n"
        << "        std::strncpy(err_buf, msg, err_cap - 1);\n"
        << "        err_buf[err_cap - 1] = '\\0';\n"
        << "    };\n"
        << "    try {\n"
        << "        conjure_program_body(*host);\n"
        << "        return 0;\n"
        << "    } catch (const std::exception& e) {\n"
        << "        report(e.what());\n"
        << "    } catch (...) {\n"
        << "        report(\"non-standard exception\");\n"
        << "    }\n"
        << "    return 1;\n"
        << "}\n";
    return src.str();
}

std::string pick_default_compiler() {
    if (const char* e = std::getenv("CONJURE_CXX")) {
        std::string s = e;
        if (!s.empty()) return s;
    }
    if (try_run_version("g++")) return "g++";
    if (try_run_version("clang++")) return "clang++";
    return "";
}

bool is_safe_program_flag(const std::string& f) {
    if (f.empty()) return false;
    for (const char* p : {"-l", "-L", "-I", "-D", "-O", "-std=", "-W", "-pthread"}) {
        if (f.rfind(p, 0) == 0) {
            if (f.rfind("-Wl,", 0) == 0) return false;
            return true;
        }
    }
    if (f.rfind("-f", 0) == 0) return f.rfind("-fplugin", 0) != 0;
    return false;
}

CompiledProgramEvaluator::CompiledProgramEvaluator(Options opts) : opts_(std::move(opts)) {}

std::string CompiledProgramEvaluator::compile(const std::string& code, const std::vector<std::string>& env_flags) {
    const std::string src = wrap_program_source(code);
    std::vector<std::string> flags;
    for (const auto& f : env_flags) {
        if (is_safe_program_flag(f)) flags.push_back(f);
    }

    std::string key_material = src;
    for (const auto& f : flags) key_material += "\n" + f;
    const std::string key = hash::sha256_hex(key_material).substr(0, 24);

    const auto so_path = opts_.cache_dir / (key + ".so");
    std::error_code ec;
    if (std::filesystem::exists(so_path, ec)) return so_path.string();

    std::filesystem::create_directories(opts_.cache_dir, ec);
    const auto src_path = opts_.cache_dir / (key + ".cpp");
    std::string werr = write_atomic(src_path, src);
    if (!werr.empty()) throw Error("execution", "cannot stage program source: " + werr);

    const std::string cxx = opts_.cxx.empty() ? pick_default_compiler() : opts_.cxx;
    if (cxx.empty()) {
        throw Error("execution", "no C++ compiler found (install g++/clang++ or set CONJURE_CXX)");
    }

    auto tmp_so = so_path;
    tmp_so += ".tmp-" + hash::random_hex(4);

    std::vector<std::string> argv{cxx, "-shared", "-fPIC", "-std=c++2a", "-O1", "-w"};
    if (!opts_.include_dir.empty()) argv.push_back("-I" + opts_.include_dir);
    argv.push_back("-o");
    argv.push_back(tmp_so.string());
    argv.push_back(src_path.string());
    argv.insert(argv.end(), flags.begin(), flags.end());

    ProcLimits lim;
    lim.timeout_ms = opts_.compile_timeout_ms;
    lim.stdout_max_bytes = 256 * 1024;
    lim.rlimit_fsize_mb = 256;
    ProcResult r;
    if (!proc_run_capture(argv, "", lim, &r)) {
        throw Error("execution", "compiler failed to start: " + r.error);
    }
    if (r.timed_out) {
        std::filesystem::remove(tmp_so, ec);
        throw Error("timeout", "program compile timed out after " + std::to_string(opts_.compile_timeout_ms) + "ms");
    }
    if (r.exit_code != 0) {
        std::filesystem::remove(tmp_so, ec);
        throw Error("invalid_code", "program does not compile (exit_code=" + std::to_string(r.exit_code) +
                    "): " + tail(r.output, 2000));
    }
    std::filesystem::rename(tmp_so, so_path, ec);
    if (ec) {
        std::error_code ec2;
        std::filesystem::remove(tmp_so, ec2);
        if (!std::filesystem::exists(so_path, ec2)) {
            throw Error("execution", "cannot publish compiled program: " + ec.message());
        }
    }
    debug_log("compiled program " + key);
    return so_path.string();
}

void CompiledProgramEvaluator::run(const std::string& code,
                                   const std::vector<std::string>& env_flags,
                                   ProgramHost& host) {
    const std::string so = compile(code, env_flags);

    DlHandle lib(dlopen(so.c_str(), RTLD_NOW | RTLD_LOCAL));
    if (!lib.h) {
        const char* dl_err = dlerror();
        throw Error("execution", std::string("dlopen failed: ") + (dl_err ? dl_err : "(unknown)"));
    }

    dlerror();  // clear
    auto abi_fn = (conjure_program_abi_version_fn)dlsym(lib.h, "conjure_program_abi_version");
    if (!abi_fn) throw Error("execution", "missing symbol conjure_program_abi_version");
    const int abi = abi_fn();
    if (abi != CONJURE_PROGRAM_ABI_VERSION) {
        throw Error("execution", "program ABI version mismatch: expected=" +
                    std::to_string(CONJURE_PROGRAM_ABI_VERSION) + " got=" + std::to_string(abi));
    }

    dlerror();
    auto run_fn = (conjure_program_run_fn)dlsym(lib.h, "conjure_program_run");
    if (!run_fn) throw Error("execution", "missing symbol conjure_program_run");

    char err_buf[1024] = {0};
    if (run_fn(&host, err_buf, sizeof(err_buf)) != 0) {
        throw Error("execution", err_buf[0] ? err_buf : "program raised");
    }
}

} // namespace conjure
