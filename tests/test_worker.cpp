#include "test_common.h"

#include "conjure/errors.h"
#include "conjure/json_mini.h"
#include "conjure/serialization.h"
#include "conjure/worker_executor.h"
#include "conjure/worker_protocol.h"
#include "conjure/worker_supervisor.h"

#include <signal.h>

#include <memory>
#include <string>

using namespace conjure;

namespace {

WorkerRequest request(const std::string& code) {
    WorkerRequest r;
    r.call_id = "";
    r.role = "tester";
    r.method_name = "probe";
    r.code = code;
    return r;
}

// In-process executor that always dies mid-request.
class CrashingExecutor final : public IWorkerExecutor {
public:
    explicit CrashingExecutor(int* starts) : starts_(starts) {}
    bool start(const std::string&, std::string*) override {
        (*starts_)++;
        alive_ = true;
        return true;
    }
    WorkerResponse execute(const WorkerRequest&, int) override {
        alive_ = false;
        throw Error("worker_crash", "worker exited (status 3)");
    }
    bool alive() override { return alive_; }
    void shutdown() override { alive_ = false; }
    int64_t pid() const override { return 4242; }

private:
    int* starts_;
    bool alive_{false};
};

void test_protocol_codec() {
    WorkerRequest r = request("return:1");
    r.call_id = "abc";
    r.context_snapshot_json = "{\"value\":3}";
    WorkerRequest back;
    std::string err;
    expect_true(decode_worker_request(encode_worker_request(r), &back, &err), "request decodes: " + err);
    expect_eq_str(back.call_id, "abc", "call_id survives");
    expect_eq_str(back.code, "return:1", "code survives");
    expect_true(contains(back.context_snapshot_json, "\"value\""), "snapshot survives");

    expect_true(!decode_worker_request("{\"ipc_version\":99}", &back, &err), "unknown ipc version rejected");
    WorkerResponse resp;
    expect_true(!decode_worker_response("not json", &resp, &err), "garbage response rejected");
    expect_true(!decode_worker_response("{\"status\":\"maybe\"}", &resp, &err), "unknown status rejected");
}

void test_restart_budget() {
    int starts = 0;
    WorkerSupervisor sup([&starts]() { return std::make_unique<CrashingExecutor>(&starts); }, 2);

    for (int i = 1; i <= 3; i++) {
        WorkerResponse r = sup.execute("env-a", "", request("crash"), 1000);
        expect_eq_str(r.status, "error", "crash " + std::to_string(i) + " is an error");
        expect_eq_str(r.error_type, "worker_crash", "crash type");
        expect_true(!r.terminal, "crash " + std::to_string(i) + " is not terminal yet");
    }
    WorkerResponse last = sup.execute("env-a", "", request("crash"), 1000);
    expect_true(last.terminal, "fourth crash is terminal");
    expect_eq_str(last.error_type, "worker_crash", "terminal type");
    expect_eq_ll(sup.spawn_count(), 3, "one spawn plus two restarts");
    expect_eq_ll(starts, 3, "executor starts");

    // another environment gets a fresh budget
    WorkerResponse other = sup.execute("env-b", "", request("crash"), 1000);
    expect_true(!other.terminal, "new env id resets the budget");
    expect_eq_ll(sup.spawn_count(), 5, "env switch spawns, crash restarts");
}

void test_non_serializable_payload() {
    int starts = 0;
    WorkerSupervisor sup([&starts]() { return std::make_unique<CrashingExecutor>(&starts); }, 2);
    WorkerRequest r = request("return:1");
    r.args_json = "[1,";
    WorkerResponse resp = sup.execute("env-a", "", r, 1000);
    expect_eq_str(resp.error_type, "non_serializable_result", "bad args rejected before dispatch");
    expect_eq_ll(starts, 0, "nothing spawned for a bad payload");
}

void test_subprocess(const std::string& stub) {
    auto factory = [stub]() { return std::make_unique<SubprocessWorkerExecutor>(stub); };
    WorkerSupervisor sup(factory, 1);

    WorkerResponse a = sup.execute("env-1", "/tmp", request("return:{\"a\":1}"), 5000);
    expect_eq_str(a.status, "ok", "return script ok: " + a.error_message);
    expect_true(contains(a.value_json, "\"a\""), "value carried back");
    expect_true(a.worker_pid > 0, "worker pid reported");

    WorkerRequest c = request("counter");
    c.context_snapshot_json = "{\"value\":41}";
    WorkerResponse b = sup.execute("env-1", "/tmp", c, 5000);
    expect_eq_str(b.status, "ok", "counter ok");
    JsonMap snap;
    expect_true(json_map_from_text(b.context_snapshot_json, &snap), "snapshot is an object");
    expect_eq_str(snap["value"], "42", "snapshot updated in the worker");
    expect_eq_ll(b.worker_pid, a.worker_pid, "same worker serves the same env id");

    WorkerResponse q = sup.execute("env-1", "/tmp", request("chatty"), 5000);
    expect_eq_str(q.status, "ok", "program stdout does not corrupt the response: " + q.error_message);
    expect_eq_str(q.value_json, "\"quiet\"", "value survives program output");
    expect_eq_ll(sup.spawn_count(), 1, "program output does not restart the worker");

    WorkerResponse e = sup.execute("env-1", "/tmp", request("nope"), 5000);
    expect_eq_str(e.error_type, "execution", "program fault comes back typed");
    expect_eq_ll(sup.spawn_count(), 1, "program faults do not restart the worker");

    WorkerResponse t = sup.execute("env-1", "/tmp", request("sleep:3000"), 200);
    expect_eq_str(t.error_type, "timeout", "slow program times out");
    expect_eq_ll(sup.spawn_count(), 2, "timeout restarts the worker");

    WorkerResponse x = sup.execute("env-1", "/tmp", request("crash"), 5000);
    expect_eq_str(x.error_type, "worker_crash", "exit without answer is a crash");
    WorkerResponse y = sup.execute("env-1", "/tmp", request("return:1"), 5000);
    expect_true(y.terminal, "budget of one restart is spent");

    WorkerResponse z = sup.execute("env-2", "/tmp/other", request("env"), 5000);
    expect_eq_str(z.status, "ok", "new env id starts a new worker");
    expect_true(contains(z.value_json, "/tmp/other"), "worker bound to its env dir");
    sup.shutdown();
}

// Runs before main() installs its own SIGPIPE disposition.
void test_start_keeps_signal_disposition(const std::string& stub) {
    ::signal(SIGPIPE, SIG_DFL);
    SubprocessWorkerExecutor ex(stub);
    std::string err;
    expect_true(ex.start("/tmp", &err), "stub starts: " + err);
    struct sigaction cur {};
    expect_true(::sigaction(SIGPIPE, nullptr, &cur) == 0, "sigaction query");
    expect_true(cur.sa_handler == SIG_DFL, "starting a worker leaves SIGPIPE to the process");
    ex.shutdown();
}

} // namespace

int main(int argc, char** argv) {
    if (argc >= 2) test_start_keeps_signal_disposition(argv[1]);
    ::signal(SIGPIPE, SIG_IGN);
    test_protocol_codec();
    test_restart_budget();
    test_non_serializable_payload();
    if (argc >= 2) test_subprocess(argv[1]);
    return 0;
}
