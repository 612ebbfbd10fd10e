#include "conjure/artifact_store.h"
#include "conjure/config.h"
#include "conjure/controller.h"
#include "conjure/environment.h"
#include "conjure/generator.h"
#include "conjure/hash.h"
#include "conjure/json_mini.h"
#include "conjure/log.h"
#include "conjure/program.h"
#include "conjure/serialization.h"
#include "conjure/tool_registry.h"
#include "conjure/worker_executor.h"
#include "conjure/worker_supervisor.h"

#include <json-c/json.h>

#include <signal.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

using namespace conjure;

static void usage() {
    std::cerr << "usage:\n"
                 "  conjure_run --role <R> --method <M> [--args <json array>] [--kwargs <json object>]\n"
                 "              [--contract <json>] [--trace <id>]\n"
                 "  conjure_run --verify-log <path>\n";
}

// conjure_worker next to this binary, unless CONJURE_WORKER_BIN is set.
static std::string resolve_worker_bin(const char* argv0, const std::string& configured) {
    if (std::getenv("CONJURE_WORKER_BIN")) return configured;
    std::error_code ec;
    auto self = std::filesystem::canonical(std::filesystem::path(argv0), ec);
    if (ec) return configured;
    auto sibling = self.parent_path() / "conjure_worker";
    if (std::filesystem::exists(sibling, ec)) return sibling.string();
    return configured;
}

static int cmd_verify_log(const std::string& path) {
    std::string err;
    if (!verify_invocation_log(path, &err)) {
        std::cout << "{\"ok\":false,\"error\":" << json_quote(err) << "}\n";
        return 1;
    }
    std::cout << "{\"ok\":true}\n";
    return 0;
}

int main(int argc, char** argv) {
    // writes to a dead generator or worker must fail with EPIPE
    ::signal(SIGPIPE, SIG_IGN);

    Invocation inv;
    std::string verify_path;
    for (int i = 1; i < argc; i++) {
        const std::string a = argv[i];
        auto next = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "missing value for " << flag << "\n";
                std::exit(2);
            }
            return argv[++i];
        };
        if (a == "--role") inv.role = next("--role");
        else if (a == "--method") inv.method_name = next("--method");
        else if (a == "--args") inv.args_json = next("--args");
        else if (a == "--kwargs") inv.kwargs_json = next("--kwargs");
        else if (a == "--contract") inv.contract_json = next("--contract");
        else if (a == "--trace") inv.trace_id = next("--trace");
        else if (a == "--verify-log") verify_path = next("--verify-log");
        else if (a == "-h" || a == "--help") {
            usage();
            return 0;
        } else {
            std::cerr << "unknown argument: " << a << "\n";
            usage();
            return 2;
        }
    }

    if (!verify_path.empty()) return cmd_verify_log(verify_path);

    if (inv.role.empty() || inv.method_name.empty()) {
        usage();
        return 2;
    }
    {
        json_mini::Doc args = json_mini::parse(inv.args_json);
        json_mini::Doc kwargs = json_mini::parse(inv.kwargs_json);
        if (!args.is_array() || !kwargs.is_object()) {
            std::cerr << "--args must be a JSON array and --kwargs a JSON object\n";
            return 2;
        }
        if (!inv.contract_json.empty() && !json_mini::is_valid(inv.contract_json)) {
            std::cerr << "--contract is not valid JSON\n";
            return 2;
        }
    }

    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    RuntimeConfig cfg = RuntimeConfig::from_env();
    set_debug(cfg.debug);
    cfg.worker_bin = resolve_worker_bin(argv[0], cfg.worker_bin);
    debug_log(std::string("profile=") + profile_name(profile) + " toolstore=" + cfg.toolstore_root);

    std::error_code ec;
    std::filesystem::create_directories(cfg.toolstore_root, ec);
    if (ec) {
        std::cerr << "cannot create toolstore root " << cfg.toolstore_root << ": " << ec.message() << "\n";
        return 3;
    }

    ExternalProcessGenerator generator(cfg.generator_cmd);

    CompiledProgramEvaluator::Options eopts;
    eopts.cache_dir = cfg.program_cache_dir;
    eopts.cxx = cfg.cxx;
    eopts.include_dir = cfg.include_dir;
    eopts.compile_timeout_ms = cfg.compile_timeout_ms;
    CompiledProgramEvaluator evaluator(eopts);

    PkgConfigEnvironmentManager environments(cfg.env_root);
    const std::string worker_bin = cfg.worker_bin;
    WorkerSupervisor workers([worker_bin]() { return std::make_unique<SubprocessWorkerExecutor>(worker_bin); },
                             cfg.max_restarts);

    ArtifactStore artifacts(cfg.toolstore_root);
    ToolRegistry registry(std::filesystem::path(cfg.toolstore_root) / "registry.json");
    std::string err;
    if (!registry.load(&err)) {
        std::cerr << "registry load failed: " << err << "\n";
        return 3;
    }

    std::unique_ptr<InvocationLog> log;
    if (!cfg.log_path.empty()) {
        log = std::make_unique<InvocationLog>(cfg.log_path, "run-" + hash::random_hex(6));
        if (!log->is_open()) debug_log("cannot open invocation log " + cfg.log_path);
    }

    ControllerServices svc;
    svc.generator = &generator;
    svc.evaluator = &evaluator;
    svc.environments = &environments;
    svc.workers = &workers;
    svc.artifacts = &artifacts;
    svc.registry = &registry;
    svc.log = log.get();

    AttemptLifecycleController controller(cfg, svc);
    Outcome out = controller.invoke(inv);
    workers.shutdown();

    std::cout << outcome_to_json_text(out) << "\n";
    return out.ok ? 0 : 1;
}
