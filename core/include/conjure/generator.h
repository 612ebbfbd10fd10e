#pragma once

#include "conjure/proc.h"

#include <cstdint>
#include <string>
#include <vector>

namespace conjure {

struct GenerationRequest {
    std::string model;
    std::string system_prompt;
    std::string user_prompt;
    std::string schema_json{"{}"};
    int timeout_ms{120000};
};

// What the code-generating service returned, before any validation of the
// dependency list.
struct GeneratedPayload {
    std::string code;
    std::string dependencies_json{"null"};
    bool input_sensitive{false};
};

// JSON schema the generator is asked to satisfy:
// {code: string, dependencies: [{name, version}], input_sensitive: bool}.
std::string program_payload_schema();

// Parses a generator response. Missing, null or blank code is a retriable
// invalid_code Error; text that is not a JSON object is a provider Error.
GeneratedPayload parse_generated_payload(const std::string& text);

class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;
    // Throws Error: timeout, provider, invalid_code.
    virtual GeneratedPayload generate(const GenerationRequest& req) = 0;
};

// Runs an external command (CONJURE_GENERATOR_CMD) once per request:
//   stdin  {model, system_prompt, user_prompt, schema, timeout_ms}
//   stdout {code, dependencies, input_sensitive}
// Consecutive failures trip a breaker that fails fast for a cooldown period.
class ExternalProcessGenerator final : public ICodeGenerator {
public:
    explicit ExternalProcessGenerator(std::string cmd, std::string cwd = ".");

    GeneratedPayload generate(const GenerationRequest& req) override;

    int consecutive_failures() const { return consecutive_fail_; }

private:
    void mark_failure();

    std::string cmd_;
    std::string cwd_;
    std::vector<std::string> argv_;
    ProcLimits lim_;

    int fail_threshold_{5};
    int64_t cooldown_ms_{30000};
    int consecutive_fail_{0};
    int64_t disabled_until_ms_{0};
};

} // namespace conjure
