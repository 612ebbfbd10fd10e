#include "conjure/worker_supervisor.h"
#include "conjure/errors.h"
#include "conjure/json_mini.h"
#include "conjure/log.h"

namespace conjure {

WorkerSupervisor::WorkerSupervisor(WorkerExecutorFactory factory, int max_restarts)
    : factory_(std::move(factory)), max_restarts_(max_restarts < 0 ? 0 : max_restarts) {}

WorkerSupervisor::~WorkerSupervisor() { shutdown(); }

std::string WorkerSupervisor::env_id() const {
    std::lock_guard<std::mutex> lk(mu_);
    return env_id_;
}

int WorkerSupervisor::restart_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return restart_count_;
}

int WorkerSupervisor::spawn_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return spawn_count_;
}

void WorkerSupervisor::shutdown() {
    std::lock_guard<std::mutex> lk(mu_);
    if (executor_) executor_->shutdown();
    executor_.reset();
    env_id_.clear();
    restart_count_ = 0;
    exhausted_ = false;
}

bool WorkerSupervisor::ensure_executor(const std::string& env_id, const std::string& env_dir, std::string* err) {
    if (executor_ && env_id_ == env_id && executor_->alive()) return true;

    if (env_id_ != env_id) {
        restart_count_ = 0;
        exhausted_ = false;
    }
    if (executor_) {
        debug_log("worker: shutting down pid " + std::to_string(executor_->pid()) + " (env " + env_id_ + " -> " + env_id + ")");
        executor_->shutdown();
        executor_.reset();
    }
    env_id_ = env_id;

    executor_ = factory_();
    if (!executor_) {
        if (err) *err = "worker executor factory returned null";
        return false;
    }
    spawn_count_++;
    if (!executor_->start(env_dir, err)) {
        executor_.reset();
        return false;
    }
    debug_log("worker: started pid " + std::to_string(executor_->pid()) + " for env " + env_id);
    return true;
}

void WorkerSupervisor::restart_after_failure(const std::string& env_dir) {
    if (executor_) executor_->shutdown();
    executor_.reset();
    if (restart_count_ >= max_restarts_) {
        exhausted_ = true;
        return;
    }
    restart_count_++;
    executor_ = factory_();
    if (!executor_) return;
    spawn_count_++;
    std::string err;
    if (!executor_->start(env_dir, &err)) {
        debug_log("worker: restart failed: " + err);
        executor_.reset();
    }
}

WorkerResponse WorkerSupervisor::failure_response(const WorkerRequest& req,
                                                  const std::string& type,
                                                  const std::string& message,
                                                  bool terminal) const {
    WorkerResponse r;
    r.call_id = req.call_id;
    r.status = "error";
    r.error_type = type;
    r.error_message = message;
    r.worker_pid = executor_ ? executor_->pid() : 0;
    r.worker_restart_count = restart_count_;
    r.terminal = terminal;
    return r;
}

WorkerResponse WorkerSupervisor::execute(const std::string& env_id,
                                         const std::string& env_dir,
                                         const WorkerRequest& req,
                                         int timeout_ms) {
    std::lock_guard<std::mutex> lk(mu_);

    // Everything crossing the boundary must be plain data.
    if (!json_mini::is_valid(req.args_json) || !json_mini::is_valid(req.kwargs_json) ||
        !json_mini::is_valid(req.context_snapshot_json)) {
        return failure_response(req, "non_serializable_result",
                                "worker payload is not JSON-serializable", false);
    }

    if (exhausted_ && env_id_ == env_id) {
        return failure_response(req, "worker_crash",
                                "worker restart budget exhausted (" + std::to_string(max_restarts_) + " restarts)", true);
    }

    std::string err;
    if (!ensure_executor(env_id, env_dir, &err)) {
        restart_after_failure(env_dir);
        return failure_response(req, "worker_crash", "worker failed to start: " + err, false);
    }

    try {
        WorkerResponse r = executor_->execute(req, timeout_ms);
        // report the restarts that led here, then start a new failure streak
        r.worker_restart_count = restart_count_;
        restart_count_ = 0;
        r.terminal = false;
        return r;
    } catch (const Error& e) {
        const std::string type = e.type() == "timeout" ? "timeout" : "worker_crash";
        debug_log("worker: " + type + ": " + e.what());
        restart_after_failure(env_dir);
        return failure_response(req, type, e.what(), false);
    }
}

} // namespace conjure
