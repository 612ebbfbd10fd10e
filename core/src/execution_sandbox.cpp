#include "conjure/execution_sandbox.h"
#include "conjure/errors.h"
#include "conjure/json_mini.h"
#include "conjure/outcome.h"

#include <set>

namespace conjure {

namespace {

const std::set<std::string>& forwarded_capabilities() {
    static const std::set<std::string> kCaps = {
        "role", "method_name", "args_json", "kwargs_json", "memory_get", "memory_set",
        "local_get", "local_set", "tools_json", "delegate", "define_method", "responds_to",
        "set_result", "ok", "error",
    };
    return kCaps;
}

// Values stored in role state must be plain JSON.
void require_json(const std::string& what, const std::string& value_json) {
    if (!json_mini::is_valid(value_json)) {
        throw Error("non_serializable_result", what + " is not valid JSON");
    }
}

} // namespace

ExecutionSandbox::ExecutionSandbox(const SandboxInputs& in, JsonMap& memory) : in_(in), memory_(memory) {}

std::string ExecutionSandbox::memory_get(const std::string& key) const {
    auto it = memory_.find(key);
    return it == memory_.end() ? "null" : it->second;
}

void ExecutionSandbox::memory_set(const std::string& key, const std::string& value_json) {
    require_json("memory value for '" + key + "'", value_json);
    memory_[key] = value_json;
}

std::string ExecutionSandbox::local_get(const std::string& key) const {
    auto it = local_.find(key);
    return it == local_.end() ? "null" : it->second;
}

void ExecutionSandbox::local_set(const std::string& key, const std::string& value_json) {
    require_json("local value for '" + key + "'", value_json);
    local_[key] = value_json;
}

std::string ExecutionSandbox::delegate(const std::string& role,
                                       const std::string& method,
                                       const std::string& args_json) {
    if (!in_.delegate) throw Error("execution", "delegation is not available in this execution context");
    delegated_.push_back(role + "." + method);
    return in_.delegate(role, method, args_json.empty() ? "[]" : args_json);
}

void ExecutionSandbox::define_method(const std::string& name, const std::string& body_json) {
    defined_[name] = body_json;
}

bool ExecutionSandbox::responds_to(const std::string& name) const {
    return forwarded_capabilities().count(name) > 0 || defined_.count(name) > 0;
}

void ExecutionSandbox::set_result(const std::string& value_json) {
    result_ = value_json;
    result_serializable_ = json_mini::is_valid(value_json);
}

void ExecutionSandbox::ok(const std::string& value_json) {
    if (!json_mini::is_valid(value_json)) {
        result_ = value_json;
        result_serializable_ = false;
        return;
    }
    result_ = outcome_envelope_ok(value_json);
    result_serializable_ = true;
}

void ExecutionSandbox::error(const std::string& error_type, const std::string& message, bool retriable) {
    result_ = outcome_envelope_error(error_type, message, retriable);
    result_serializable_ = true;
}

SandboxRun run_in_sandbox(IProgramEvaluator& evaluator,
                          const std::string& code,
                          const std::vector<std::string>& env_flags,
                          const SandboxInputs& in,
                          JsonMap& memory) {
    ExecutionSandbox sandbox(in, memory);
    evaluator.run(code, env_flags, sandbox);

    SandboxRun out;
    out.raw_result = sandbox.raw_result();
    out.serializable = sandbox.result_serializable();
    out.delegated_methods = sandbox.delegated_methods();
    return out;
}

} // namespace conjure
