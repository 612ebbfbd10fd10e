#include "conjure/worker_protocol.h"
#include "conjure/environment.h"
#include "conjure/errors.h"
#include "conjure/execution_sandbox.h"
#include "conjure/json_mini.h"
#include "conjure/serialization.h"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>

namespace conjure {

namespace {

bool parse_line(const std::string& line, json_mini::Doc* d, std::string* err) {
    *d = json_mini::parse(line);
    if (!d->is_object()) {
        if (err) *err = "invalid JSON";
        return false;
    }
    int64_t ver = 0;
    if (json_get_int(d->root, "ipc_version", &ver) && ver != WORKER_IPC_VERSION) {
        if (err) *err = "unsupported ipc_version " + std::to_string(ver);
        return false;
    }
    return true;
}

std::string raw_or(json_object* o, const char* k, const char* def) {
    json_object* v = nullptr;
    if (!json_object_object_get_ex(o, k, &v) || !v) return def;
    return json_dump(v);
}

WorkerResponse error_response(const WorkerRequest& req, const std::string& type, const std::string& message) {
    WorkerResponse r;
    r.call_id = req.call_id.empty() ? "unknown" : req.call_id;
    r.status = "error";
    r.error_type = type;
    r.error_message = message;
    r.worker_pid = (int64_t)getpid();
    return r;
}

} // namespace

std::string encode_worker_request(const WorkerRequest& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ipc_version", json_object_new_int(WORKER_IPC_VERSION));
    json_object_object_add(o, "call_id", json_object_new_string(r.call_id.c_str()));
    json_object_object_add(o, "role", json_object_new_string(r.role.c_str()));
    json_object_object_add(o, "method_name", json_object_new_string(r.method_name.c_str()));
    json_object_object_add(o, "code", json_object_new_string_len(r.code.c_str(), (int)r.code.size()));
    json_add_raw(o, "args", r.args_json);
    json_add_raw(o, "kwargs", r.kwargs_json);
    json_add_raw(o, "context_snapshot", r.context_snapshot_json);
    json_add_raw(o, "tools", r.tools_json);
    json_object_object_add(o, "env_dir", json_object_new_string(r.env_dir.c_str()));
    std::string line = json_dump(o);
    json_object_put(o);
    return line;
}

bool decode_worker_request(const std::string& line, WorkerRequest* out, std::string* err) {
    if (!out) return false;
    json_mini::Doc d;
    if (!parse_line(line, &d, err)) return false;
    WorkerRequest r;
    json_get_string(d.root, "call_id", &r.call_id);
    json_get_string(d.root, "role", &r.role);
    json_get_string(d.root, "method_name", &r.method_name);
    if (!json_get_string(d.root, "code", &r.code)) {
        if (err) *err = "missing code";
        return false;
    }
    r.args_json = raw_or(d.root, "args", "[]");
    r.kwargs_json = raw_or(d.root, "kwargs", "{}");
    r.context_snapshot_json = raw_or(d.root, "context_snapshot", "{}");
    r.tools_json = raw_or(d.root, "tools", "{}");
    json_get_string(d.root, "env_dir", &r.env_dir);
    *out = std::move(r);
    return true;
}

std::string encode_worker_response(const WorkerResponse& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "ipc_version", json_object_new_int(WORKER_IPC_VERSION));
    json_object_object_add(o, "call_id", json_object_new_string(r.call_id.c_str()));
    json_object_object_add(o, "status", json_object_new_string(r.status.c_str()));
    if (r.status == "ok") {
        json_add_raw(o, "value", r.value_json);
        json_add_raw(o, "context_snapshot", r.context_snapshot_json);
    } else {
        json_object_object_add(o, "error_type", json_object_new_string(r.error_type.c_str()));
        json_object_object_add(o, "error_message", json_object_new_string(r.error_message.c_str()));
    }
    json_object_object_add(o, "worker_pid", json_object_new_int64(r.worker_pid));
    std::string line = json_dump(o);
    json_object_put(o);
    return line;
}

bool decode_worker_response(const std::string& line, WorkerResponse* out, std::string* err) {
    if (!out) return false;
    json_mini::Doc d;
    if (!parse_line(line, &d, err)) return false;
    WorkerResponse r;
    json_get_string(d.root, "call_id", &r.call_id);
    if (!json_get_string(d.root, "status", &r.status) || (r.status != "ok" && r.status != "error")) {
        if (err) *err = "missing or unknown status";
        return false;
    }
    r.value_json = raw_or(d.root, "value", "null");
    r.context_snapshot_json = raw_or(d.root, "context_snapshot", "{}");
    json_get_string(d.root, "error_type", &r.error_type);
    json_get_string(d.root, "error_message", &r.error_message);
    json_get_int(d.root, "worker_pid", &r.worker_pid);
    *out = std::move(r);
    return true;
}

WorkerResponse handle_worker_request(IProgramEvaluator& evaluator, const WorkerRequest& req) {
    JsonMap memory;
    if (!json_map_from_text(req.context_snapshot_json, &memory)) {
        return error_response(req, "non_serializable_result", "context_snapshot is not a JSON object");
    }

    SandboxInputs in;
    in.role = req.role;
    in.method_name = req.method_name;
    in.args_json = req.args_json;
    in.kwargs_json = req.kwargs_json;
    in.tools_json = req.tools_json;

    try {
        SandboxRun run = run_in_sandbox(evaluator, req.code, read_environment_flags(req.env_dir), in, memory);
        if (!run.serializable) {
            return error_response(req, "non_serializable_result", "Worker result is not JSON-serializable");
        }
        WorkerResponse r;
        r.call_id = req.call_id;
        r.status = "ok";
        r.value_json = run.raw_result;
        r.context_snapshot_json = json_map_to_text(memory);
        r.worker_pid = (int64_t)getpid();
        return r;
    } catch (const Error& e) {
        return error_response(req, e.type(), e.what());
    } catch (const std::exception& e) {
        return error_response(req, "execution", e.what());
    }
}

int claim_response_channel(std::string* err) {
    std::fflush(stdout);
    const int fd = ::dup(STDOUT_FILENO);
    if (fd < 0) {
        if (err) *err = std::string("dup stdout: ") + std::strerror(errno);
        return -1;
    }
    if (::dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
        if (err) *err = std::string("dup2 stderr: ") + std::strerror(errno);
        ::close(fd);
        return -1;
    }
    return fd;
}

bool write_response_line(int fd, const WorkerResponse& r) {
    const std::string line = encode_worker_response(r) + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::write(fd, line.data() + off, line.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += (size_t)n;
    }
    return true;
}

int serve_worker(IProgramEvaluator& evaluator, std::istream& in, int out_fd) {
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) break;  // graceful shutdown

        WorkerRequest req;
        std::string err;
        WorkerResponse resp;
        if (!decode_worker_request(line, &req, &err)) {
            resp = error_response(req, "execution", "bad request: " + err);
        } else {
            resp = handle_worker_request(evaluator, req);
        }
        if (!write_response_line(out_fd, resp)) return 1;
    }
    return 0;
}

} // namespace conjure
