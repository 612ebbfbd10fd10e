#pragma once

#include "conjure/worker_protocol.h"

#include <sys/types.h>

#include <string>
#include <vector>

namespace conjure {

// One live worker process. Not thread-safe: one request at a time.
class IWorkerExecutor {
public:
    virtual ~IWorkerExecutor() = default;

    virtual bool start(const std::string& env_dir, std::string* err) = 0;
    // Sends req and waits for its response line. Throws Error:
    // timeout (no answer in time), worker_crash (EOF, bad JSON, wrong call_id).
    virtual WorkerResponse execute(const WorkerRequest& req, int timeout_ms) = 0;
    virtual bool alive() = 0;
    virtual void shutdown() = 0;
    virtual int64_t pid() const = 0;
};

// `<worker_bin> --serve` over stdin/stdout pipes, NDJSON. The process must
// ignore SIGPIPE; a dead worker then shows up as worker_crash.
class SubprocessWorkerExecutor final : public IWorkerExecutor {
public:
    explicit SubprocessWorkerExecutor(std::string worker_bin, std::vector<std::string> extra_args = {});
    ~SubprocessWorkerExecutor() override;

    SubprocessWorkerExecutor(const SubprocessWorkerExecutor&) = delete;
    SubprocessWorkerExecutor& operator=(const SubprocessWorkerExecutor&) = delete;

    bool start(const std::string& env_dir, std::string* err) override;
    WorkerResponse execute(const WorkerRequest& req, int timeout_ms) override;
    bool alive() override;
    void shutdown() override;
    int64_t pid() const override { return (int64_t)pid_; }

    static constexpr size_t MAX_RESPONSE_BYTES = 1024 * 1024;

private:
    std::string read_line(int timeout_ms);
    void close_fds();

    std::string worker_bin_;
    std::vector<std::string> extra_args_;
    pid_t pid_{-1};
    int to_child_{-1};    // parent -> child stdin
    int from_child_{-1};  // child stdout -> parent
    std::string pending_;
};

} // namespace conjure
