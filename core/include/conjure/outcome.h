#pragma once

#include "conjure/errors.h"

#include <json-c/json.h>

#include <string>

namespace conjure {

// Two-variant result of every invocation. Values travel as JSON text.
struct Outcome {
    bool ok{true};
    std::string value_json{"null"};

    std::string error_type;
    std::string error_message;
    bool retriable{false};

    std::string role;
    std::string method_name;
    std::string metadata_json{"{}"};

    static Outcome success(const std::string& value_json,
                           const std::string& role = "",
                           const std::string& method_name = "");
    static Outcome failure(const std::string& error_type,
                           const std::string& error_message,
                           bool retriable,
                           const std::string& role = "",
                           const std::string& method_name = "",
                           const std::string& metadata_json = "{}");

    // Error Outcome for an engine fault; retriability follows the error type.
    static Outcome from_error(const Error& e, const std::string& role, const std::string& method_name);

    const char* status() const { return ok ? "ok" : "error"; }
};

// Marker key of the explicit success/error envelope produced by host.ok/error.
extern const char* const OUTCOME_ENVELOPE_KEY;

std::string outcome_envelope_ok(const std::string& value_json);
std::string outcome_envelope_error(const std::string& error_type,
                                   const std::string& error_message,
                                   bool retriable);
// Envelope for an existing Outcome (what delegate() hands back to a program).
std::string outcome_envelope(const Outcome& o);

// The single normalization point for raw program results:
//   envelope            -> as declared
//   {"status":"error"} or {error_type, error_message} -> error Outcome
//   anything else       -> ok(value)
// Low-utility statuses are then coerced to a non-retriable low_utility error.
Outcome coerce_outcome(const std::string& raw_json,
                       const std::string& role,
                       const std::string& method_name);

Outcome coerce_low_utility(const Outcome& o);

json_object* outcome_to_json(const Outcome& o);
std::string outcome_to_json_text(const Outcome& o);
bool outcome_from_json(json_object* o, Outcome* out, std::string* err);

} // namespace conjure
