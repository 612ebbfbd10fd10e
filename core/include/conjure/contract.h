#pragma once

#include "conjure/outcome.h"

#include <string>
#include <vector>

namespace conjure {

// Result of checking one success value against a deliverable contract.
struct ContractValidation {
    bool applied{false};
    bool valid{true};
    std::string normalized_value_json{"null"};

    // Set when !valid.
    std::string mismatch;  // missing_required_key | type_mismatch | min_items_violation | nil_required_input
    std::string expected_shape;
    std::string actual_shape;
    std::vector<std::string> expected_keys;
    std::vector<std::string> actual_keys;
    std::string details_json{"{}"};

    // {expected_shape, actual_shape, expected_keys, actual_keys, mismatch, ...details}
    std::string metadata_json() const;
};

// Deliverable contract (or {"deliverable": {...}}) as JSON:
//   {"type": "object"|"array", "required": [...], "min_items": N,
//    "constraints": {"min_items": N, "properties": {key: {"type", "min_items"}}}}
// A contract without a type is an object contract when it names required
// keys or property constraints.
//
// Key lookups are tolerant: "body" is satisfied by "body" or ":body"; the
// normalized value carries the plain spelling.
ContractValidation validate_contract(const std::string& contract_json,
                                     const std::string& value_json,
                                     const std::string& args_json = "[]",
                                     const std::string& kwargs_json = "{}");

// Applies the contract to a success Outcome: contract_violation (never
// retriable) on mismatch, otherwise the normalized value with low-utility
// coercion. Error Outcomes and empty contracts pass through.
Outcome apply_deliverable_contract(const Outcome& o,
                                   const std::string& contract_json,
                                   const std::string& args_json,
                                   const std::string& kwargs_json,
                                   ContractValidation* validation);

// Shared-state continuity: every program of `methods` that touches role
// memory must use `canonical_key` among its state keys.
struct ContinuityConstraint {
    std::vector<std::string> methods;  // empty = every method of the role
    std::string canonical_key;
};

struct ContinuityReport {
    bool evaluated{false};
    bool passed{true};
    std::vector<std::string> observed_keys;
    std::string reason;
    std::string correction_hint;

    std::string to_json() const;
};

ContinuityReport evaluate_continuity(const ContinuityConstraint& c,
                                     const std::string& method_name,
                                     const std::string& code);

} // namespace conjure
