#pragma once

#include "conjure/program.h"

#include <cstdint>
#include <istream>
#include <string>

namespace conjure {

inline constexpr int WORKER_IPC_VERSION = 1;

// One line of JSON, parent -> worker.
struct WorkerRequest {
    std::string call_id;
    std::string role;
    std::string method_name;
    std::string code;
    std::string args_json{"[]"};
    std::string kwargs_json{"{}"};
    std::string context_snapshot_json{"{}"};
    std::string tools_json{"{}"};
    std::string env_dir;
};

// One line of JSON, worker -> parent.
struct WorkerResponse {
    std::string call_id;
    std::string status{"error"};  // ok | error
    std::string value_json{"null"};
    std::string context_snapshot_json{"{}"};
    std::string error_type;
    std::string error_message;
    int64_t worker_pid{0};
    // Filled by the supervisor.
    int worker_restart_count{0};
    bool terminal{false};
};

std::string encode_worker_request(const WorkerRequest& r);
bool decode_worker_request(const std::string& line, WorkerRequest* out, std::string* err);
std::string encode_worker_response(const WorkerResponse& r);
bool decode_worker_response(const std::string& line, WorkerResponse* out, std::string* err);

// Worker side: runs one request in a fresh sandbox (delegation unavailable).
// Never throws; faults become error responses.
WorkerResponse handle_worker_request(IProgramEvaluator& evaluator, const WorkerRequest& req);

// Takes the response channel off fd 1: returns a private duplicate of
// stdout and points fd 1 at stderr, so program output lands on stderr.
// -1 on failure.
int claim_response_channel(std::string* err);

// Writes one response line to fd. False on a closed or broken channel.
bool write_response_line(int fd, const WorkerResponse& r);

// --serve loop: one request per line until an empty line or EOF.
int serve_worker(IProgramEvaluator& evaluator, std::istream& in, int out_fd);

} // namespace conjure
