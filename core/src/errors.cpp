#include "conjure/errors.h"

#include <set>

namespace conjure {

Error::Error(std::string type, const std::string& message, std::string metadata_json)
    : std::runtime_error(message), type_(std::move(type)), metadata_json_(std::move(metadata_json)) {
    if (metadata_json_.empty()) metadata_json_ = "{}";
}

bool Error::retriable() const {
    return is_retriable_error_type(type_);
}

bool is_retriable_error_type(const std::string& type) {
    static const std::set<std::string> retriable = {
        "timeout", "provider", "invalid_code",
        "dependency_install_failed", "dependency_activation_failed",
        "environment_preparing", "worker_crash",
    };
    return retriable.count(type) > 0;
}

FailureClass failure_class_for(const std::string& error_type) {
    static const std::set<std::string> extrinsic = {
        "timeout", "provider", "network_error", "rate_limit", "rate_limited",
        "environment_preparing", "worker_crash", "dependency_resolution_failed",
        "dependency_install_failed", "dependency_activation_failed",
    };
    static const std::set<std::string> adaptive = {
        "parse_error", "parse_failed", "low_utility", "wrong_tool_boundary",
        "missing_input", "invalid_format", "schema_mismatch", "contract_violation",
        "guardrail_retry_exhausted", "outcome_repair_retry_exhausted",
    };
    if (error_type.empty()) return FailureClass::NONE;
    if (extrinsic.count(error_type)) return FailureClass::EXTRINSIC;
    if (adaptive.count(error_type)) return FailureClass::ADAPTIVE;
    return FailureClass::INTRINSIC;
}

const char* failure_class_name(FailureClass c) {
    switch (c) {
        case FailureClass::EXTRINSIC: return "extrinsic";
        case FailureClass::ADAPTIVE:  return "adaptive";
        case FailureClass::INTRINSIC: return "intrinsic";
        case FailureClass::NONE:      return "none";
    }
    return "none";
}

} // namespace conjure
