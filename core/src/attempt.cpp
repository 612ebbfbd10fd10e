#include "conjure/attempt.h"
#include "conjure/serialization.h"

#include <cctype>
#include <sstream>

namespace conjure {

namespace {

const char* normalize_stage(const std::string& stage) {
    if (stage == "validation") return "validation";
    if (stage == "guardrail") return "guardrail";
    if (stage == "outcome_policy") return "outcome_policy";
    return "execution";
}

bool contains_ci(const std::string& hay, const std::string& needle) {
    std::string h = hay;
    for (auto& c : h) c = (char)std::tolower((unsigned char)c);
    return h.find(needle) != std::string::npos;
}

std::string execution_required_correction(const std::string& message) {
    if (contains_ci(message, "error:") || contains_ci(message, "does not compile")) {
        return "Fix the compile errors shown; the body must be valid C++20 statements using only host methods and "
               "the standard library or declared dependencies.";
    }
    if (contains_ci(message, "not valid json") || contains_ci(message, "serializ")) {
        return "Pass only valid JSON text to host.memory_set, host.local_set and host.ok; build values with "
               "json-c or quote strings correctly.";
    }
    if (contains_ci(message, "delegation is not available")) {
        return "Dependency-bearing programs run in a worker without delegation; compute the result directly.";
    }
    return "Fix the runtime fault path and regenerate with explicit null and shape checks before using values.";
}

} // namespace

std::string truncate_failure_message(const std::string& message) {
    if (message.size() <= MAX_FAILURE_MESSAGE_LENGTH) return message;
    return message.substr(0, MAX_FAILURE_MESSAGE_LENGTH - 3) + "...";
}

void AttemptTelemetry::record(int64_t attempt_id,
                              const std::string& stage,
                              const std::string& error_class,
                              const std::string& error_message,
                              const std::string& call_id) {
    AttemptFailure f;
    f.attempt_id = attempt_id;
    f.stage = normalize_stage(stage);
    f.error_class = error_class;
    f.error_message = truncate_failure_message(error_message);
    f.timestamp = iso_now_ms();
    f.call_id = call_id;

    latest_stage_ = f.stage;
    latest_class_ = f.error_class;
    latest_message_ = f.error_message;

    failures_.push_back(std::move(f));
    if (failures_.size() > MAX_ATTEMPT_FAILURES_RECORDED) {
        failures_.erase(failures_.begin(), failures_.end() - (long)MAX_ATTEMPT_FAILURES_RECORDED);
    }
}

std::string AttemptTelemetry::to_json() const {
    json_object* o = json_object_new_object();
    json_object* arr = json_object_new_array();
    for (const auto& f : failures_) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "attempt_id", json_object_new_int64(f.attempt_id));
        json_object_object_add(e, "stage", json_object_new_string(f.stage.c_str()));
        json_object_object_add(e, "error_class", json_object_new_string(f.error_class.c_str()));
        json_object_object_add(e, "error_message", json_object_new_string(f.error_message.c_str()));
        json_object_object_add(e, "timestamp", json_object_new_string(f.timestamp.c_str()));
        json_object_object_add(e, "call_id", f.call_id.empty() ? nullptr : json_object_new_string(f.call_id.c_str()));
        json_object_array_add(arr, e);
    }
    json_object_object_add(o, "attempt_failures", arr);
    auto opt = [&](const char* k, const std::string& v) {
        json_object_object_add(o, k, v.empty() ? nullptr : json_object_new_string(v.c_str()));
    };
    opt("latest_failure_stage", latest_stage_);
    opt("latest_failure_class", latest_class_);
    opt("latest_failure_message", latest_message_);
    std::string s = json_dump(o);
    json_object_put(o);
    return s;
}

FailureFeedback execution_feedback(const std::string& type, const std::string& message,
                                   int64_t attempt_number, int remaining_budget) {
    FailureFeedback f;
    f.failure_type = type.empty() ? "execution" : type;
    f.failure_message = truncate_failure_message(message);
    f.required_correction = execution_required_correction(message);
    f.attempt_number = attempt_number;
    f.remaining_budget = remaining_budget;
    return f;
}

FailureFeedback outcome_feedback(const std::string& type, const std::string& message,
                                 int64_t attempt_number, int remaining_budget) {
    FailureFeedback f = execution_feedback(type, message, attempt_number, remaining_budget);
    if (contains_ci(message, "__conjure_outcome__")) {
        f.required_correction = "Unwrap delegate() envelopes before use: check status and read value, do not "
                                "treat the envelope itself as the result.";
    }
    return f;
}

std::string build_system_prompt(const PromptContext& ctx) {
    std::ostringstream p;
    if (ctx.depth == 0) {
        p << "You are a Tool Builder operating as a C++ agent called '" << ctx.role << "'.\n"
          << "You create durable, reusable tools by writing C++ that is compiled and run in your context.\n";
    } else {
        p << "You are a Tool operating as a C++ agent called '" << ctx.role << "'.\n"
          << "You execute delegated work by writing C++ that is compiled and run in your context.\n";
    }
    p << "\n"
      << "Write the BODY of a function `void run(conjure::ProgramHost& host)` (C++20).\n"
      << "All values crossing the host are JSON text:\n"
      << "- host.args_json() / host.kwargs_json(): call arguments (array / object)\n"
      << "- host.memory_get(key) / host.memory_set(key, json): role state kept across calls\n"
      << "- host.local_get(key) / host.local_set(key, json): scratch for this call only\n"
      << "- host.tools_json(): object keyed by tool name\n"
      << "- host.delegate(role, method, args_json): nested call, returns an outcome envelope\n"
      << "- host.ok(json) / host.error(type, message, retriable) / host.set_result(json)\n"
      << "Throwing std::exception reports an execution failure.\n"
      << "\n"
      << "Rules:\n"
      << "- Only host.define_method may add capabilities; never redefine methods on other objects.\n"
      << "- Never write the \"tools\" key of role state.\n"
      << "- Declare pkg-config modules you need in `dependencies`; programs with dependencies run in an "
         "isolated worker where delegation is unavailable.\n"
      << "- Set input_sensitive when the result must never be reused for other inputs.\n";
    return p.str();
}

std::string build_user_prompt(const PromptContext& ctx) {
    std::ostringstream p;
    p << "<invocation>\n"
      << "<role>" << ctx.role << "</role>\n"
      << "<method>" << ctx.method_name << "</method>\n"
      << "<args>" << ctx.args_json << "</args>\n"
      << "<kwargs>" << ctx.kwargs_json << "</kwargs>\n"
      << "<depth>" << ctx.depth << "</depth>\n"
      << "</invocation>\n";
    p << "<memory_keys>";
    for (size_t i = 0; i < ctx.memory_keys.size(); i++) p << (i ? "," : "") << ctx.memory_keys[i];
    p << "</memory_keys>\n";
    p << "<known_tools>" << ctx.tools_json << "</known_tools>\n";
    if (!ctx.contract_json.empty()) {
        p << "<deliverable_contract>" << ctx.contract_json << "</deliverable_contract>\n"
          << "A successful result must satisfy the deliverable contract exactly.\n";
    }
    return p.str();
}

std::string retry_user_prompt(const std::string& base,
                              const std::optional<GuardrailFeedback>& guardrail,
                              const std::optional<FailureFeedback>& execution,
                              const std::optional<FailureFeedback>& outcome) {
    std::ostringstream p;
    p << base;
    if (guardrail) {
        const auto& v = guardrail->violation;
        p << "\n<guardrail_feedback>\n"
          << "<guardrail_class>" << v.guardrail_class << "</guardrail_class>\n"
          << "<violation_type>" << v.violation_type << "</violation_type>\n"
          << "<violation_subtype>" << v.violation_subtype << "</violation_subtype>\n"
          << "<violation_message>" << v.message << "</violation_message>\n"
          << "<violation_location>" << (v.location.empty() ? "unknown" : v.location) << "</violation_location>\n"
          << "<required_correction>" << v.required_correction << "</required_correction>\n"
          << "<attempt_number>" << guardrail->attempt_number << "</attempt_number>\n"
          << "<remaining_guardrail_budget>" << guardrail->remaining_budget << "</remaining_guardrail_budget>\n"
          << "</guardrail_feedback>\n"
          << "IMPORTANT: Previous attempt violated runtime guardrails.\n"
          << "Regenerate code that satisfies the required correction exactly.\n";
    }
    if (execution) {
        p << "\n<execution_failure_feedback>\n"
          << "<failure_type>" << execution->failure_type << "</failure_type>\n"
          << "<failure_message>" << execution->failure_message << "</failure_message>\n"
          << "<required_correction>" << execution->required_correction << "</required_correction>\n"
          << "<attempt_number>" << execution->attempt_number << "</attempt_number>\n"
          << "<remaining_execution_repair_budget>" << execution->remaining_budget
          << "</remaining_execution_repair_budget>\n"
          << "</execution_failure_feedback>\n"
          << "IMPORTANT: Previous attempt failed during execution.\n";
    }
    if (outcome) {
        p << "\n<outcome_failure_feedback>\n"
          << "<failure_type>" << outcome->failure_type << "</failure_type>\n"
          << "<failure_message>" << outcome->failure_message << "</failure_message>\n"
          << "<required_correction>" << outcome->required_correction << "</required_correction>\n"
          << "<attempt_number>" << outcome->attempt_number << "</attempt_number>\n"
          << "<remaining_outcome_repair_budget>" << outcome->remaining_budget << "</remaining_outcome_repair_budget>\n"
          << "</outcome_failure_feedback>\n"
          << "IMPORTANT: Previous attempt returned a retriable error outcome.\n";
    }
    return p.str();
}

std::string repair_user_prompt(const std::string& base,
                               const std::string& previous_code,
                               const std::string& error_type,
                               const std::string& error_message) {
    std::ostringstream p;
    p << base
      << "\n<repair_request>\n"
      << "<previous_code>\n" << previous_code << "\n</previous_code>\n"
      << "<failure_type>" << error_type << "</failure_type>\n"
      << "<failure_message>" << truncate_failure_message(error_message) << "</failure_message>\n"
      << "</repair_request>\n"
      << "Repair the previous code so it no longer fails this way; keep its state keys and behavior.\n";
    return p.str();
}

} // namespace conjure
