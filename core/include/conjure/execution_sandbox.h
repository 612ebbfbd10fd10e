#pragma once

#include "conjure/program.h"
#include "conjure/program_api.h"
#include "conjure/serialization.h"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace conjure {

// Nested invocation hook: (role, method, args_json) -> outcome envelope.
using DelegateFn = std::function<std::string(const std::string&, const std::string&, const std::string&)>;

struct SandboxInputs {
    std::string role;
    std::string method_name;
    std::string args_json{"[]"};
    std::string kwargs_json{"{}"};
    std::string tools_json{"{}"};
    DelegateFn delegate;  // empty: delegation raises an execution fault
};

// Fresh, attempt-scoped receiver. Forwards a fixed capability set; anything a
// program defines on itself lives only as long as this object.
class ExecutionSandbox final : public ProgramHost {
public:
    ExecutionSandbox(const SandboxInputs& in, JsonMap& memory);

    std::string role() const override { return in_.role; }
    std::string method_name() const override { return in_.method_name; }
    std::string args_json() const override { return in_.args_json; }
    std::string kwargs_json() const override { return in_.kwargs_json; }

    std::string memory_get(const std::string& key) const override;
    void memory_set(const std::string& key, const std::string& value_json) override;
    std::string local_get(const std::string& key) const override;
    void local_set(const std::string& key, const std::string& value_json) override;

    std::string tools_json() const override { return in_.tools_json; }

    std::string delegate(const std::string& role,
                         const std::string& method,
                         const std::string& args_json) override;

    void define_method(const std::string& name, const std::string& body_json) override;
    bool responds_to(const std::string& name) const override;

    void set_result(const std::string& value_json) override;
    void ok(const std::string& value_json) override;
    void error(const std::string& error_type, const std::string& message, bool retriable) override;

    // Raw JSON the program produced ("null" when it set nothing).
    const std::string& raw_result() const { return result_; }
    bool result_serializable() const { return result_serializable_; }
    std::vector<std::string> delegated_methods() const { return delegated_; }

private:
    SandboxInputs in_;
    JsonMap& memory_;
    JsonMap local_;
    std::map<std::string, std::string> defined_;
    std::vector<std::string> delegated_;
    std::string result_{"null"};
    bool result_serializable_{true};
};

struct SandboxRun {
    std::string raw_result{"null"};
    bool serializable{true};
    std::vector<std::string> delegated_methods;  // "role.method"
};

// One attempt: builds a fresh sandbox over `memory`, runs the program, and
// discards the sandbox. Faults propagate as Error.
SandboxRun run_in_sandbox(IProgramEvaluator& evaluator,
                          const std::string& code,
                          const std::vector<std::string>& env_flags,
                          const SandboxInputs& in,
                          JsonMap& memory);

} // namespace conjure
