#pragma once

#include "conjure/guardrail.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace conjure {

inline constexpr size_t MAX_ATTEMPT_FAILURES_RECORDED = 8;
inline constexpr size_t MAX_FAILURE_MESSAGE_LENGTH = 400;

// Keeps the first MAX_FAILURE_MESSAGE_LENGTH - 3 chars and appends "...".
std::string truncate_failure_message(const std::string& message);

struct AttemptFailure {
    int64_t attempt_id{0};
    std::string stage;  // validation | guardrail | execution | outcome_policy
    std::string error_class;
    std::string error_message;
    std::string timestamp;
    std::string call_id;
};

// Append-only, bounded record of failed attempts within one invocation.
class AttemptTelemetry {
public:
    void record(int64_t attempt_id,
                const std::string& stage,
                const std::string& error_class,
                const std::string& error_message,
                const std::string& call_id);

    const std::vector<AttemptFailure>& failures() const { return failures_; }
    bool empty() const { return failures_.empty(); }

    const std::string& latest_stage() const { return latest_stage_; }
    const std::string& latest_class() const { return latest_class_; }
    const std::string& latest_message() const { return latest_message_; }

    // {attempt_failures: [...], latest_failure_stage, latest_failure_class,
    //  latest_failure_message}
    std::string to_json() const;

private:
    std::vector<AttemptFailure> failures_;
    std::string latest_stage_;
    std::string latest_class_;
    std::string latest_message_;
};

// ---- retry feedback ----

struct GuardrailFeedback {
    GuardrailViolation violation;
    int64_t attempt_number{0};
    int remaining_budget{0};
};

struct FailureFeedback {
    std::string failure_type;
    std::string failure_message;
    std::string required_correction;
    int64_t attempt_number{0};
    int remaining_budget{0};
};

FailureFeedback execution_feedback(const std::string& type, const std::string& message,
                                   int64_t attempt_number, int remaining_budget);
FailureFeedback outcome_feedback(const std::string& type, const std::string& message,
                                 int64_t attempt_number, int remaining_budget);

// ---- prompts ----

struct PromptContext {
    std::string role;
    std::string method_name;
    std::string args_json{"[]"};
    std::string kwargs_json{"{}"};
    int depth{0};
    std::string tools_json{"{}"};
    std::vector<std::string> memory_keys;
    std::string contract_json;  // "" = none
};

std::string build_system_prompt(const PromptContext& ctx);
std::string build_user_prompt(const PromptContext& ctx);

// Base prompt plus the feedback blocks of the previous failed attempt.
std::string retry_user_prompt(const std::string& base,
                              const std::optional<GuardrailFeedback>& guardrail,
                              const std::optional<FailureFeedback>& execution,
                              const std::optional<FailureFeedback>& outcome);

// Repair prompt for a persisted program that failed adaptively.
std::string repair_user_prompt(const std::string& base,
                               const std::string& previous_code,
                               const std::string& error_type,
                               const std::string& error_message);

} // namespace conjure
