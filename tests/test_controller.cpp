#include "test_common.h"

#include "conjure/controller.h"
#include "conjure/errors.h"
#include "conjure/json_mini.h"
#include "conjure/serialization.h"

#include <deque>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace conjure;
namespace fs = std::filesystem;

namespace {

// ---- program bodies ----

const char* kCounter =
    "auto n = host.memory_get(\"count\");\n"
    "host.memory_set(\"count\", next(n));\n"
    "host.ok(next(n));";
const char* kForeignDefine =
    "ctx.define_method(\"helper\", \"{}\");\n"
    "host.ok(\"1\");";
const char* kNoBody = "host.ok(\"{\\\"status\\\":200}\");";
const char* kRateLimited = "host.error(\"rate_limit\", \"slow down\", true);";
const char* kParseFail = "host.error(\"parse_error\", \"unparseable page\", true);";
const char* kBroken = "host.ok(undefined_symbol);";
const char* kDefiner =
    "host.define_method(\"helper\", \"{}\");\n"
    "host.ok(host.responds_to(\"helper\") ? \"true\" : \"false\");";
const char* kProber = "host.ok(host.responds_to(\"helper\") ? \"true\" : \"false\");";
const char* kRecurse = "host.set_result(host.delegate(\"loop\", \"run\", \"[]\"));";
const char* kDelegateChild = "host.ok(host.delegate(\"child\", \"run\", \"[]\"));";
const char* kFlaky = "host.ok(fetch_flaky());";
const char* kFixed = "host.ok(\"\\\"v2\\\"\");";
const char* kPushItems = "host.memory_set(\"items\", \"[1]\");\nhost.ok(\"1\");";
const char* kPushStack = "host.memory_set(\"stack\", \"[1]\");\nhost.ok(\"1\");";
const char* kCredential = "auto k = env(\"WEATHER_KEY\");\nhost.ok(\"1\");";
const char* kParse = "host.ok(\"\\\"parsed\\\"\");";

GeneratedPayload payload(const std::string& code, const std::string& deps = "null") {
    GeneratedPayload p;
    p.code = code;
    p.dependencies_json = deps;
    return p;
}

// Scripted generator: per-method queues, the last entry repeats.
class FakeGenerator final : public ICodeGenerator {
public:
    void script(const std::string& method, std::vector<GeneratedPayload> seq) {
        scripts_[method] = std::deque<GeneratedPayload>(seq.begin(), seq.end());
    }

    GeneratedPayload generate(const GenerationRequest& req) override {
        calls++;
        last_user_prompt = req.user_prompt;
        for (auto& kv : scripts_) {
            if (!contains(req.user_prompt, "<method>" + kv.first + "</method>")) continue;
            auto& q = kv.second;
            if (q.empty()) throw Error("provider", "script exhausted");
            GeneratedPayload p = q.front();
            if (q.size() > 1) q.pop_front();
            return p;
        }
        throw Error("provider", "no script for request");
    }

    int calls{0};
    std::string last_user_prompt;

private:
    std::map<std::string, std::deque<GeneratedPayload>> scripts_;
};

int64_t int_of(const std::string& json) {
    json_mini::Doc d = json_mini::parse(json);
    if (!d.root || !json_object_is_type(d.root, json_type_int)) return 0;
    return json_object_get_int64(d.root);
}

// Program text -> behavior.
class FakeEvaluator final : public IProgramEvaluator {
public:
    using Body = std::function<void(ProgramHost&)>;

    FakeEvaluator() {
        bodies_[kCounter] = [](ProgramHost& host) {
            const std::string next = std::to_string(int_of(host.memory_get("count")) + 1);
            host.memory_set("count", next);
            host.ok(next);
        };
        bodies_[kNoBody] = [](ProgramHost& host) { host.ok("{\"status\":200}"); };
        bodies_[kRateLimited] = [](ProgramHost& host) { host.error("rate_limit", "slow down", true); };
        bodies_[kParseFail] = [](ProgramHost& host) { host.error("parse_error", "unparseable page", true); };
        bodies_[kDefiner] = [](ProgramHost& host) {
            host.define_method("helper", "{}");
            host.ok(host.responds_to("helper") ? "true" : "false");
        };
        bodies_[kProber] = [](ProgramHost& host) { host.ok(host.responds_to("helper") ? "true" : "false"); };
        bodies_[kRecurse] = [](ProgramHost& host) { host.set_result(host.delegate("loop", "run", "[]")); };
        bodies_[kDelegateChild] = [](ProgramHost& host) { host.ok(host.delegate("child", "run", "[]")); };
        bodies_[kFlaky] = [this](ProgramHost& host) {
            if (flaky_mode == "timeout") return host.error("timeout", "upstream slow", true);
            if (flaky_mode == "parse") return host.error("parse_error", "layout changed", true);
            host.ok("\"v1\"");
        };
        bodies_[kFixed] = [](ProgramHost& host) { host.ok("\"v2\""); };
        bodies_[kPushItems] = [](ProgramHost& host) {
            host.memory_set("items", "[1]");
            host.ok("1");
        };
        bodies_[kPushStack] = [](ProgramHost& host) {
            host.memory_set("stack", "[1]");
            host.ok("1");
        };
    }

    void run(const std::string& code, const std::vector<std::string>&, ProgramHost& host) override {
        runs++;
        auto it = bodies_.find(code);
        if (it == bodies_.end()) throw Error("invalid_code", "program failed to build: unknown identifier");
        it->second(host);
    }

    int runs{0};
    std::string flaky_mode;

private:
    std::map<std::string, Body> bodies_;
};

// Hands out one directory per manifest without touching pkg-config.
class FakeEnvironments final : public IEnvironmentManager {
public:
    EnvironmentHandle ensure(const DependencyManifest& m) override {
        ensured++;
        EnvironmentHandle h;
        h.env_id = environment_id(m);
        h.dir = "/tmp/conjure-env-" + h.env_id;
        h.manifest = m;
        return h;
    }
    int ensured{0};
};

// Worker that answers every request in-process.
class EchoExecutor final : public IWorkerExecutor {
public:
    explicit EchoExecutor(std::vector<std::string>* started) : started_(started) {}
    bool start(const std::string& env_dir, std::string*) override {
        started_->push_back(env_dir);
        alive_ = true;
        return true;
    }
    WorkerResponse execute(const WorkerRequest& req, int) override {
        WorkerResponse r;
        r.call_id = req.call_id;
        if (contains(req.code, "missing_selector")) {
            r.status = "error";
            r.error_type = "execution";
            r.error_message = "selector not found";
            r.worker_pid = 777;
            return r;
        }
        r.status = "ok";
        r.value_json = "\"parsed\"";
        r.context_snapshot_json = req.context_snapshot_json;
        r.worker_pid = 777;
        return r;
    }
    bool alive() override { return alive_; }
    void shutdown() override { alive_ = false; }
    int64_t pid() const override { return 777; }

private:
    std::vector<std::string>* started_;
    bool alive_{false};
};

// Violation that regeneration cannot fix.
class CredentialCheck final : public IGuardrailCheck {
public:
    const char* name() const override { return "missing_credential"; }
    std::optional<GuardrailViolation> check_code(const std::string& code) const override {
        if (!contains(code, "WEATHER_KEY")) return std::nullopt;
        return make_violation(name(), "Missing credential for the weather service");
    }
};

Invocation call(const std::string& role, const std::string& method, const std::string& args = "[]") {
    Invocation inv;
    inv.role = role;
    inv.method_name = method;
    inv.args_json = args;
    return inv;
}

RuntimeConfig test_config() {
    RuntimeConfig c;
    c.max_generation_attempts = 1;
    c.guardrail_recovery_budget = 1;
    c.fresh_outcome_repair_budget = 1;
    c.execution_repair_budget = 1;
    return c;
}

json_object* member(json_object* o, const char* k) {
    json_object* v = nullptr;
    if (!o || !json_object_object_get_ex(o, k, &v)) return nullptr;
    return v;
}

std::string last_log_line(const fs::path& p) {
    std::ifstream in(p);
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    return last;
}

} // namespace

// Stateful counter: generated once, then served from the artifact store.
static void test_counter_reuse() {
    const fs::path dir = fresh_test_dir("conjure_test_controller_counter");
    FakeGenerator gen;
    FakeEvaluator eval;
    ArtifactStore store(dir);
    ToolRegistry registry(dir / "registry.json");
    InvocationLog log((dir / "invocations.jsonl").string(), "run-test");
    gen.script("increment", {payload(kCounter)});

    ControllerServices svc;
    svc.generator = &gen;
    svc.evaluator = &eval;
    svc.artifacts = &store;
    svc.registry = &registry;
    svc.log = &log;
    AttemptLifecycleController ctl(test_config(), svc);

    Outcome a = ctl.invoke(call("counter", "increment"));
    expect_true(a.ok, "first increment: " + a.error_message);
    expect_eq_str(a.value_json, "1", "first value");
    Outcome b = ctl.invoke(call("counter", "increment"));
    expect_true(b.ok, "second increment: " + b.error_message);
    expect_eq_str(b.value_json, "2", "second value");

    expect_eq_ll(gen.calls, 1, "generated once");
    auto art = store.load("counter", "increment");
    expect_true(art.has_value(), "artifact persisted");
    expect_eq_ll(art->success_count, 2, "both calls counted");
    expect_eq_str(art->code, kCounter, "code stored");
    expect_true(registry.find("counter") != nullptr, "registry touched");
    expect_eq_ll(ctl.invocation_count(), 2, "steps");

    std::string err;
    expect_true(verify_invocation_log(log.path(), &err), "log chain: " + err);
    json_mini::Doc rec = json_mini::parse(last_log_line(log.path()));
    json_object* p = member(rec.root, "payload");
    std::string source;
    expect_true(json_get_string(p, "program_source", &source) && source == "persisted", "second call persisted");
    bool hit = false;
    expect_true(json_get_bool(p, "artifact_hit", &hit) && hit, "artifact hit logged");
}

// Dependencies accumulate per role; conflicting versions are refused.
static void test_dependency_environments() {
    FakeGenerator gen;
    FakeEvaluator eval;
    FakeEnvironments envs;
    std::vector<std::string> started;
    WorkerSupervisor workers([&started]() { return std::make_unique<EchoExecutor>(&started); }, 2);

    gen.script("parse", {payload(kParse, "[{\"name\":\"nokogiri\",\"version\":\"1.16\"}]")});
    gen.script("scrape", {payload(kParse,
                                  "[{\"name\":\"nokogiri\",\"version\":\"1.16\"},"
                                  "{\"name\":\"httparty\",\"version\":\"0.21\"}]")});
    gen.script("legacy", {payload(kParse, "[{\"name\":\"nokogiri\",\"version\":\"1.15\"}]")});

    ControllerServices svc;
    svc.generator = &gen;
    svc.evaluator = &eval;
    svc.environments = &envs;
    svc.workers = &workers;
    AttemptLifecycleController ctl(test_config(), svc);

    Outcome a = ctl.invoke(call("parser", "parse"));
    expect_true(a.ok, "worker call: " + a.error_message);
    expect_eq_str(a.value_json, "\"parsed\"", "worker value");
    const std::string first_env = workers.env_id();
    expect_eq_ll(workers.spawn_count(), 1, "one worker");
    expect_eq_ll(eval.runs, 0, "never evaluated in-process");

    Outcome b = ctl.invoke(call("parser", "scrape"));
    expect_true(b.ok, "additive manifest: " + b.error_message);
    expect_true(workers.env_id() != first_env, "new environment for the wider manifest");
    expect_eq_ll(workers.spawn_count(), 2, "worker replaced on env change");
    expect_eq_ll((long long)ctl.role_manifest("parser")->size(), 2, "manifest grew");

    Outcome c = ctl.invoke(call("parser", "legacy"));
    expect_true(!c.ok, "version conflict fails");
    expect_eq_str(c.error_type, "dependency_manifest_incompatible", "conflict type");
    expect_true(!c.retriable, "conflict is not retriable");
    expect_eq_ll(workers.spawn_count(), 2, "supervisor untouched");
    expect_eq_ll(envs.ensured, 2, "no environment for the conflicting manifest");
    expect_eq_str(ctl.role_manifest("parser")->find("nokogiri")->version, "1.16", "bound manifest kept");

    // a failed worker attempt leaves no manifest bound to the role
    FakeGenerator gen3;
    gen3.script("crawl", {payload("// missing_selector\n" + std::string(kParse),
                                  "[{\"name\":\"nokogiri\",\"version\":\"1.16\"}]")});
    gen3.script("legacy", {payload(kParse, "[{\"name\":\"nokogiri\",\"version\":\"1.15\"}]")});
    ControllerServices svc3 = svc;
    svc3.generator = &gen3;
    AttemptLifecycleController fresh(test_config(), svc3);
    Outcome e = fresh.invoke(call("crawler", "crawl"));
    expect_true(!e.ok, "worker failure surfaces");
    expect_eq_str(e.error_type, "execution", "worker failure type");
    expect_true(fresh.role_manifest("crawler") == nullptr, "no binding after a failed attempt");
    Outcome f = fresh.invoke(call("crawler", "legacy"));
    expect_true(f.ok, "other version accepted once nothing is bound: " + f.error_message);
    expect_eq_str(fresh.role_manifest("crawler")->find("nokogiri")->version, "1.15", "binding from the successful call");

    FakeGenerator gen2;
    gen2.script("parse", {payload(kParse, "[{\"name\":\"nokogiri\",\"version\":\"1.16\"}]")});
    ControllerServices bare;
    bare.generator = &gen2;
    bare.evaluator = &eval;
    AttemptLifecycleController no_workers(test_config(), bare);
    Outcome d = no_workers.invoke(call("parser", "parse"));
    expect_eq_str(d.error_type, "dependency_activation_failed", "no worker runtime");
}

static void test_contract_violation() {
    FakeGenerator gen;
    FakeEvaluator eval;
    gen.script("get", {payload(kNoBody)});
    ControllerServices svc;
    svc.generator = &gen;
    svc.evaluator = &eval;
    AttemptLifecycleController ctl(test_config(), svc);

    Invocation inv = call("http", "get", "[\"https://example.test\"]");
    inv.contract_json = "{\"required\":[\"body\"]}";
    Outcome o = ctl.invoke(inv);
    expect_true(!o.ok, "contract enforced");
    expect_eq_str(o.error_type, "contract_violation", "type");
    expect_true(!o.retriable, "not retriable");
    expect_eq_ll(gen.calls, 1, "no regeneration for a contract violation");

    json_mini::Doc md = json_mini::parse(o.metadata_json);
    std::string mismatch;
    expect_true(json_get_string(md.root, "mismatch", &mismatch) && mismatch == "missing_required_key", "mismatch");
    auto expected = json_get_string_array(md.root, "expected_keys");
    expect_true(expected.size() == 1 && expected[0] == "body", "expected keys");
    expect_true(contains(gen.last_user_prompt, "<deliverable_contract>"), "contract in the prompt");
}

static void test_guardrail_recovery() {
    const fs::path dir = fresh_test_dir("conjure_test_controller_guardrail");
    FakeGenerator gen;
    FakeEvaluator eval;
    InvocationLog log((dir / "invocations.jsonl").string(), "run-test");
    gen.script("increment", {payload(kForeignDefine), payload(kCounter)});
    ControllerServices svc;
    svc.generator = &gen;
    svc.evaluator = &eval;
    svc.log = &log;
    AttemptLifecycleController ctl(test_config(), svc);

    Outcome o = ctl.invoke(call("counter", "increment"));
    expect_true(o.ok, "recovered: " + o.error_message);
    expect_eq_str(o.value_json, "1", "value from the second program");
    expect_eq_ll(gen.calls, 2, "one regeneration");
    expect_eq_ll(eval.runs, 1, "violating program never ran");
    expect_true(contains(gen.last_user_prompt, "<guardrail_feedback>"), "feedback sent back");

    json_mini::Doc rec = json_mini::parse(last_log_line(log.path()));
    json_object* p = member(rec.root, "payload");
    json_object* failures = member(p, "attempt_failures");
    expect_true(failures && json_object_is_type(failures, json_type_array), "attempt failures logged");
    expect_eq_ll((long long)json_object_array_length(failures), 1, "one failed attempt");
    std::string stage;
    json_get_string(json_object_array_get_idx(failures, 0), "stage", &stage);
    expect_eq_str(stage, "guardrail", "stage");
    int64_t recoveries = 0;
    expect_true(json_get_int(p, "guardrail_recovery_attempts", &recoveries) && recoveries == 1, "recoveries");
}

static void test_guardrail_exhaustion() {
    FakeGenerator gen;
    FakeEvaluator eval;
    gen.script("run", {payload(kForeignDefine)});
    gen.script("summarize", {payload(kDelegateChild)});
    ControllerServices svc;
    svc.generator = &gen;
    svc.evaluator = &eval;
    AttemptLifecycleController ctl(test_config(), svc);

    // top level: user-safe message, details in metadata
    Outcome o = ctl.invoke(call("child", "run"));
    expect_eq_str(o.error_type, "guardrail_retry_exhausted", "exhausted");
    expect_eq_ll(gen.calls, 2, "budget + 1 generations");
    expect_eq_str(o.error_message, GUARDRAIL_EXHAUSTED_USER_MESSAGE, "normalized message");
    json_mini::Doc md = json_mini::parse(o.metadata_json);
    bool normalized = false;
    std::string subtype, raw, policy;
    int64_t attempts = 0;
    expect_true(json_get_bool(md.root, "normalized", &normalized) && normalized, "normalized flag");
    expect_true(json_get_string(md.root, "guardrail_subtype", &subtype) && subtype == "singleton_method_mutation",
                "subtype");
    expect_true(json_get_string(md.root, "raw_error_message", &raw) && contains(raw, "child.run"), "raw message");
    expect_true(json_get_string(md.root, "normalization_policy", &policy) &&
                    policy == GUARDRAIL_NORMALIZATION_POLICY,
                "policy");
    expect_true(json_get_int(md.root, "guardrail_recovery_attempts", &attempts) && attempts == 2, "attempts");

    // nested: the delegating program sees the raw failure
    gen.calls = 0;
    Outcome parent = ctl.invoke(call("reporter", "summarize"));
    expect_true(parent.ok, "parent succeeds: " + parent.error_message);
    expect_true(contains(parent.value_json, "Recoverable guardrail retries exhausted"), "raw nested message");
    expect_true(!contains(parent.value_json, GUARDRAIL_EXHAUSTED_USER_MESSAGE), "nested is not normalized");
    expect_eq_ll(gen.calls, 3, "parent once, child budget + 1");

    // terminal violations stop at once
    GuardrailPolicy policy_with_credentials = GuardrailPolicy::with_default_checks();
    policy_with_credentials.add(std::make_unique<CredentialCheck>());
    FakeGenerator gen2;
    gen2.script("forecast", {payload(kCredential)});
    ControllerServices svc2;
    svc2.generator = &gen2;
    svc2.evaluator = &eval;
    AttemptLifecycleController strict(test_config(), svc2, std::move(policy_with_credentials));
    Outcome t = strict.invoke(call("weather", "forecast"));
    expect_eq_str(t.error_type, "tool_registry_violation", "terminal violation type");
    expect_true(!t.retriable, "terminal is not retriable");
    expect_eq_ll(gen2.calls, 1, "no retry for a terminal violation");
    expect_true(contains(t.metadata_json, "terminal_guardrail"), "class in metadata");
}

static void test_retry_paths() {
    FakeEvaluator eval;

    // extrinsic errors are returned as-is
    {
        FakeGenerator gen;
        gen.script("search", {payload(kRateLimited)});
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        AttemptLifecycleController ctl(test_config(), svc);
        Outcome o = ctl.invoke(call("web", "search"));
        expect_eq_str(o.error_type, "rate_limit", "extrinsic passthrough");
        expect_true(o.retriable, "retriability preserved");
        expect_eq_ll(gen.calls, 1, "no repair for extrinsic failures");
    }

    // retriable adaptive outcomes are repaired up to the budget
    {
        FakeGenerator gen;
        gen.script("extract", {payload(kParseFail)});
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        AttemptLifecycleController ctl(test_config(), svc);
        Outcome o = ctl.invoke(call("web", "extract"));
        expect_eq_str(o.error_type, "outcome_repair_retry_exhausted", "outcome repairs exhausted");
        expect_true(!o.retriable, "exhaustion is final");
        expect_eq_ll(gen.calls, 2, "one repair");
        json_mini::Doc md = json_mini::parse(o.metadata_json);
        std::string last;
        expect_true(json_get_string(md.root, "last_error_type", &last) && last == "parse_error", "last error");
    }

    // execution faults get a corrected program
    {
        FakeGenerator gen;
        gen.script("increment", {payload(kBroken), payload(kCounter)});
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        AttemptLifecycleController ctl(test_config(), svc);
        Outcome o = ctl.invoke(call("counter", "increment"));
        expect_true(o.ok, "repaired after a build failure: " + o.error_message);
        expect_eq_ll(gen.calls, 2, "one execution repair");
        expect_true(contains(gen.last_user_prompt, "invalid_code"), "failure fed back");

        FakeGenerator always_broken;
        always_broken.script("increment", {payload(kBroken)});
        svc.generator = &always_broken;
        AttemptLifecycleController ctl2(test_config(), svc);
        Outcome f = ctl2.invoke(call("counter", "increment"));
        expect_eq_str(f.error_type, "invalid_code", "execution type kept");
        expect_true(!f.retriable, "final execution failure is not retriable");
    }
}

static void test_persisted_repair() {
    const fs::path dir = fresh_test_dir("conjure_test_controller_persisted");
    FakeGenerator gen;
    FakeEvaluator eval;
    ArtifactStore store(dir);
    gen.script("latest", {payload(kFlaky), payload(kFixed)});
    ControllerServices svc;
    svc.generator = &gen;
    svc.evaluator = &eval;
    svc.artifacts = &store;
    AttemptLifecycleController ctl(test_config(), svc);

    expect_eq_str(ctl.invoke(call("feed", "latest")).value_json, "\"v1\"", "first run");

    eval.flaky_mode = "timeout";
    Outcome slow = ctl.invoke(call("feed", "latest"));
    expect_eq_str(slow.error_type, "timeout", "extrinsic failure of a persisted program");
    expect_eq_ll(gen.calls, 1, "no repair for extrinsic failures");

    eval.flaky_mode = "parse";
    Outcome repaired = ctl.invoke(call("feed", "latest"));
    expect_true(repaired.ok, "repaired: " + repaired.error_message);
    expect_eq_str(repaired.value_json, "\"v2\"", "repaired value");
    expect_eq_ll(gen.calls, 2, "one repair generation");

    auto art = store.load("feed", "latest");
    expect_eq_str(art->code, kFixed, "repaired code persisted");
    expect_eq_str(art->history[0].trigger, "repair:adaptive_failure", "repair trigger");
    expect_eq_ll(art->repair_count_since_regen, 1, "repair counted");
}

static void test_attempt_isolation_and_delegation() {
    FakeEvaluator eval;

    // capabilities defined by one attempt are gone for the next
    {
        FakeGenerator gen;
        gen.script("define", {payload(kDefiner)});
        gen.script("probe", {payload(kProber)});
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        AttemptLifecycleController ctl(test_config(), svc);
        expect_eq_str(ctl.invoke(call("shape", "define")).value_json, "true", "visible within the attempt");
        expect_eq_str(ctl.invoke(call("shape", "probe")).value_json, "false", "gone afterwards");
    }

    // delegation depth limit
    {
        FakeGenerator gen;
        gen.script("run", {payload(kRecurse)});
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        RuntimeConfig cfg = test_config();
        cfg.max_delegation_depth = 1;
        AttemptLifecycleController ctl(cfg, svc);
        Outcome o = ctl.invoke(call("loop", "run"));
        expect_eq_str(o.error_type, "budget_exceeded", "depth limit");
        expect_true(!o.retriable, "depth limit is final");
        expect_eq_ll(ctl.invocation_count(), 3, "depth 0, 1 and the refused depth 2");
    }

    // hand-registered handlers bypass generation
    {
        FakeGenerator gen;
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        AttemptLifecycleController ctl(test_config(), svc);
        ctl.dispatch().register_handler("math", "add", [](const Invocation& inv) {
            expect_eq_str(inv.args_json, "[1,2]", "handler sees args");
            return Outcome::success("3");
        });
        Outcome o = ctl.invoke(call("math", "add", "[1,2]"));
        expect_eq_str(o.value_json, "3", "handler result");
        expect_eq_str(o.role, "math", "role filled in");
        expect_eq_ll(gen.calls, 0, "no generation");
        expect_eq_ll((long long)ctl.dispatch().size(), 1, "one handler");
    }

    // shared state key continuity under enforcement
    {
        FakeGenerator gen;
        gen.script("push", {payload(kPushItems), payload(kPushStack)});
        ControllerServices svc;
        svc.generator = &gen;
        svc.evaluator = &eval;
        RuntimeConfig cfg = test_config();
        cfg.continuity_enforcement_enabled = true;
        AttemptLifecycleController ctl(cfg, svc);
        ctl.set_continuity_constraint("stack", ContinuityConstraint{{"push", "pop"}, "stack"});
        Outcome o = ctl.invoke(call("stack", "push"));
        expect_true(o.ok, "recovered onto the canonical key: " + o.error_message);
        expect_eq_ll(gen.calls, 2, "one continuity recovery");
        expect_true(ctl.role_memory("stack").count("items") == 0, "rejected attempt's writes rolled back");
        expect_eq_str(ctl.role_memory("stack")["stack"], "[1]", "canonical state written");
    }
}

int main() {
    test_counter_reuse();
    test_dependency_environments();
    test_contract_violation();
    test_guardrail_recovery();
    test_guardrail_exhaustion();
    test_retry_paths();
    test_persisted_repair();
    test_attempt_isolation_and_delegation();
    std::cerr << "test_controller: ALL PASSED" << std::endl;
    return 0;
}
