#include "conjure/config.h"
#include "conjure/log.h"
#include "conjure/program.h"
#include "conjure/worker_protocol.h"

#include <unistd.h>

#include <iostream>
#include <string>

using namespace conjure;

static std::string slurp_stdin() {
    std::string result;
    result.reserve(4096);
    constexpr size_t MAX_STDIN_BYTES = 10ULL * 1024 * 1024;
    char buf[8192];
    while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount()) {
        result.append(buf, (size_t)std::cin.gcount());
        if (result.size() > MAX_STDIN_BYTES) return std::string();
    }
    return result;
}

static void print_error_json(int fd, const std::string& msg) {
    WorkerResponse r;
    r.status = "error";
    r.error_type = "execution";
    r.error_message = msg;
    if (!write_response_line(fd, r)) std::cerr << "conjure_worker: " << msg << "\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage:\n  conjure_worker --serve   (NDJSON requests on stdin, one response line each)\n"
                     "  conjure_worker --run     (one JSON request on stdin)\n";
        return 2;
    }
    const std::string mode = argv[1];

    apply_profile_defaults(detect_profile());
    const RuntimeConfig cfg = RuntimeConfig::from_env();
    set_debug(cfg.debug);

    CompiledProgramEvaluator::Options opts;
    opts.cache_dir = cfg.program_cache_dir;
    opts.cxx = cfg.cxx;
    opts.include_dir = cfg.include_dir;
    opts.compile_timeout_ms = cfg.compile_timeout_ms;
    CompiledProgramEvaluator evaluator(opts);

    std::string chan_err;
    const int out_fd = claim_response_channel(&chan_err);
    if (out_fd < 0) {
        print_error_json(STDOUT_FILENO, "cannot set up response channel: " + chan_err);
        return 5;
    }

    if (mode == "--serve") {
        debug_log("worker serving env " + env_str("CONJURE_WORKER_ENV_DIR", "(none)"));
        return serve_worker(evaluator, std::cin, out_fd);
    }

    if (mode == "--run") {
        const std::string line = slurp_stdin();
        if (line.empty()) {
            print_error_json(out_fd, "empty or oversized request on stdin");
            return 5;
        }
        WorkerRequest req;
        std::string err;
        if (!decode_worker_request(line, &req, &err)) {
            print_error_json(out_fd, "bad request: " + err);
            return 5;
        }
        if (req.env_dir.empty()) req.env_dir = env_str("CONJURE_WORKER_ENV_DIR");
        return write_response_line(out_fd, handle_worker_request(evaluator, req)) ? 0 : 1;
    }

    print_error_json(out_fd, "unknown mode: " + mode);
    return 2;
}
