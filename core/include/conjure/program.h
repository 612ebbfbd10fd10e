#pragma once

#include "conjure/dependency_manifest.h"
#include "conjure/program_api.h"

#include <filesystem>
#include <string>
#include <vector>

namespace conjure {

enum class ProgramOrigin { FRESH, PERSISTED, REPAIRED };

const char* program_origin_name(ProgramOrigin o);

// Generated source plus its declared dependencies. Immutable once an attempt
// starts.
struct Program {
    std::string code;
    DependencyManifest dependencies;
    ProgramOrigin origin{ProgramOrigin::FRESH};
    bool input_sensitive{false};
};

// Runs program code against a host. Throws Error: invalid_code when the
// source does not build, execution when it cannot be loaded or throws.
class IProgramEvaluator {
public:
    virtual ~IProgramEvaluator() = default;
    virtual void run(const std::string& code,
                     const std::vector<std::string>& env_flags,
                     ProgramHost& host) = 0;
};

// Wraps the body into a translation unit exporting the ABI entry points.
std::string wrap_program_source(const std::string& body);

// CONJURE_CXX, else g++, else clang++ (probed with --version). "" if none.
std::string pick_default_compiler();

// Keeps only plain compile/link flags (-I -D -L -l -O -std= -W -f, no -fplugin).
bool is_safe_program_flag(const std::string& f);

// Compiles wrapped programs into shared objects cached by source+flags
// checksum, then dlopen/run/dlclose per call.
class CompiledProgramEvaluator final : public IProgramEvaluator {
public:
    struct Options {
        std::filesystem::path cache_dir;
        std::string cxx;          // "" = pick_default_compiler()
        std::string include_dir;  // where conjure/program_api.h lives
        int compile_timeout_ms{60000};
    };

    explicit CompiledProgramEvaluator(Options opts);

    void run(const std::string& code,
             const std::vector<std::string>& env_flags,
             ProgramHost& host) override;

    // Path of the shared object for code+flags, building it when missing.
    std::string compile(const std::string& code, const std::vector<std::string>& env_flags);

private:
    Options opts_;
};

} // namespace conjure
