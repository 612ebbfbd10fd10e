#include "conjure/generator.h"
#include "conjure/config.h"
#include "conjure/errors.h"
#include "conjure/json_mini.h"
#include "conjure/log.h"
#include "conjure/serialization.h"

#include <algorithm>

namespace conjure {

namespace {

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

} // namespace

std::string program_payload_schema() {
    return R"({"type":"object","required":["code"],"properties":{)"
           R"("code":{"type":"string","description":"C++ statements forming the body of a function that receives conjure::ProgramHost& host"},)"
           R"("dependencies":{"type":"array","items":{"type":"object","required":["name"],)"
           R"("properties":{"name":{"type":"string"},"version":{"type":"string"}}}},)"
           R"("input_sensitive":{"type":"boolean"}}})";
}

GeneratedPayload parse_generated_payload(const std::string& text) {
    json_mini::Doc d = json_mini::parse(trim_ws(text));
    if (!d.is_object()) throw Error("invalid_code", "generator returned a non-object payload");

    GeneratedPayload p;
    json_object* code = nullptr;
    if (!json_object_object_get_ex(d.root, "code", &code) || !code ||
        !json_object_is_type(code, json_type_string)) {
        throw Error("invalid_code", "generator returned no code");
    }
    p.code = json_object_get_string(code);
    if (trim_ws(p.code).empty()) throw Error("invalid_code", "generator returned blank code");

    p.dependencies_json = json_get_raw(d.root, "dependencies");
    json_get_bool(d.root, "input_sensitive", &p.input_sensitive);
    return p;
}

ExternalProcessGenerator::ExternalProcessGenerator(std::string cmd, std::string cwd)
    : cmd_(std::move(cmd)), cwd_(std::move(cwd)) {
    argv_ = split_argv_quoted(cmd_);

    lim_.stdout_max_bytes = (size_t)std::max(64 * 1024, env_int("CONJURE_GENERATOR_STDOUT_MAX", 4 * 1024 * 1024));
    lim_.rlimit_fsize_mb = 16;
    lim_.merge_stderr = false;

    fail_threshold_ = std::max(1, env_int("CONJURE_GENERATOR_FAIL_THRESHOLD", 5));
    cooldown_ms_ = (int64_t)std::max(0, env_int("CONJURE_GENERATOR_COOLDOWN_MS", 30000));
}

void ExternalProcessGenerator::mark_failure() {
    consecutive_fail_ += 1;
    if (consecutive_fail_ >= fail_threshold_) {
        disabled_until_ms_ = now_ms() + cooldown_ms_;
        debug_log("generator: breaker open for " + std::to_string(cooldown_ms_) + "ms");
    }
}

GeneratedPayload ExternalProcessGenerator::generate(const GenerationRequest& req) {
    if (argv_.empty()) throw Error("provider", "no generator command configured (CONJURE_GENERATOR_CMD)");
    if (disabled_until_ms_ > now_ms()) {
        throw Error("provider", "generator disabled after " + std::to_string(consecutive_fail_) + " consecutive failures");
    }

    json_object* root = json_object_new_object();
    json_object_object_add(root, "model", json_object_new_string(req.model.c_str()));
    json_object_object_add(root, "system_prompt",
                           json_object_new_string_len(req.system_prompt.c_str(), (int)req.system_prompt.size()));
    json_object_object_add(root, "user_prompt",
                           json_object_new_string_len(req.user_prompt.c_str(), (int)req.user_prompt.size()));
    json_add_raw(root, "schema", req.schema_json);
    json_object_object_add(root, "timeout_ms", json_object_new_int(req.timeout_ms));
    const std::string payload = json_dump(root);
    json_object_put(root);

    ProcLimits lim = lim_;
    lim.timeout_ms = req.timeout_ms;

    ProcResult pr;
    if (!proc_run_capture_stdin(argv_, cwd_, payload, lim, &pr)) {
        mark_failure();
        throw Error("provider", pr.error.empty() ? "generator did not start" : pr.error);
    }
    if (pr.timed_out) {
        mark_failure();
        throw Error("timeout", "generator timed out after " + std::to_string(req.timeout_ms) + "ms");
    }
    if (pr.exit_code != 0) {
        mark_failure();
        throw Error("provider", "generator exit_code=" + std::to_string(pr.exit_code));
    }
    if (pr.output_truncated) {
        mark_failure();
        throw Error("provider", "generator output exceeds " + std::to_string(lim.stdout_max_bytes) + " bytes");
    }

    // Transport worked; payload problems do not trip the breaker.
    consecutive_fail_ = 0;
    disabled_until_ms_ = 0;
    return parse_generated_payload(pr.output);
}

} // namespace conjure
