#pragma once

#include "conjure/worker_executor.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace conjure {

using WorkerExecutorFactory = std::function<std::unique_ptr<IWorkerExecutor>()>;

// One live worker per environment id. A request for another env id shuts the
// current worker down first. Crashes and timeouts restart the worker up to
// max_restarts times; once the budget is spent the next request on that env
// id is answered with a terminal worker_crash and nothing is spawned.
// Calls are serialized: one request in flight at a time.
class WorkerSupervisor {
public:
    static constexpr int DEFAULT_MAX_RESTARTS = 2;

    explicit WorkerSupervisor(WorkerExecutorFactory factory, int max_restarts = DEFAULT_MAX_RESTARTS);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    // Never throws for worker faults: they come back as error responses
    // carrying worker_restart_count and terminal.
    WorkerResponse execute(const std::string& env_id,
                           const std::string& env_dir,
                           const WorkerRequest& req,
                           int timeout_ms);

    void shutdown();

    std::string env_id() const;
    int restart_count() const;
    int spawn_count() const;

private:
    bool ensure_executor(const std::string& env_id, const std::string& env_dir, std::string* err);
    void restart_after_failure(const std::string& env_dir);
    WorkerResponse failure_response(const WorkerRequest& req,
                                    const std::string& type,
                                    const std::string& message,
                                    bool terminal) const;

    WorkerExecutorFactory factory_;
    int max_restarts_;

    mutable std::mutex mu_;
    std::unique_ptr<IWorkerExecutor> executor_;
    std::string env_id_;
    int restart_count_{0};
    int spawn_count_{0};
    bool exhausted_{false};
};

} // namespace conjure
