#pragma once

#include "conjure/outcome.h"
#include "conjure/serialization.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace conjure {

inline constexpr const char* GUARDRAIL_RECOVERABLE = "recoverable_guardrail";
inline constexpr const char* GUARDRAIL_TERMINAL = "terminal_guardrail";

// Stable violation record shared by every check.
struct GuardrailViolation {
    std::string guardrail_class{GUARDRAIL_RECOVERABLE};
    std::string violation_type{"tool_registry_violation"};
    std::string violation_subtype;
    std::string message;
    std::string required_correction;
    std::string location;  // "program:<line>", or "" when unknown

    bool terminal() const { return guardrail_class == GUARDRAIL_TERMINAL; }
    std::string to_json() const;
};

// Builds a violation: class from the message, correction from the subtype.
GuardrailViolation make_violation(const std::string& subtype,
                                  const std::string& message,
                                  const std::string& location = "");

// Messages naming missing credentials, api keys, unsupported runtime
// capabilities or unavailable external services cannot be fixed by
// regenerating.
std::string guardrail_class_for_message(const std::string& message);
std::string required_correction_for(const std::string& subtype);

// One structural or behavioral check. Code checks run before execution,
// outcome checks after a successful one.
class IGuardrailCheck {
public:
    virtual ~IGuardrailCheck() = default;
    virtual const char* name() const = 0;
    virtual std::optional<GuardrailViolation> check_code(const std::string& code) const {
        (void)code;
        return std::nullopt;
    }
    virtual std::optional<GuardrailViolation> check_outcome(const std::string& code, const Outcome& outcome) const {
        (void)code;
        (void)outcome;
        return std::nullopt;
    }
};

class SingletonMethodMutationCheck final : public IGuardrailCheck {
public:
    const char* name() const override { return "singleton_method_mutation"; }
    std::optional<GuardrailViolation> check_code(const std::string& code) const override;
};

class ToolRegistryMutationCheck final : public IGuardrailCheck {
public:
    const char* name() const override { return "tool_registry_mutation"; }
    std::optional<GuardrailViolation> check_code(const std::string& code) const override;
};

class ContextToolsShapeCheck final : public IGuardrailCheck {
public:
    const char* name() const override { return "context_tools_shape_misuse"; }
    std::optional<GuardrailViolation> check_code(const std::string& code) const override;
};

class HardcodedFallbackCheck final : public IGuardrailCheck {
public:
    const char* name() const override { return "hardcoded_external_fallback_success"; }
    std::optional<GuardrailViolation> check_code(const std::string& code) const override;
};

class ExternalProvenanceCheck final : public IGuardrailCheck {
public:
    const char* name() const override { return "missing_external_provenance"; }
    std::optional<GuardrailViolation> check_outcome(const std::string& code, const Outcome& outcome) const override;
};

// Ordered, pluggable list of checks. The first violation wins.
class GuardrailPolicy {
public:
    GuardrailPolicy() = default;
    GuardrailPolicy(GuardrailPolicy&&) = default;
    GuardrailPolicy& operator=(GuardrailPolicy&&) = default;

    static GuardrailPolicy with_default_checks();

    void add(std::unique_ptr<IGuardrailCheck> check);
    size_t size() const { return checks_.size(); }

    std::optional<GuardrailViolation> check_code(const std::string& code) const;
    std::optional<GuardrailViolation> check_outcome(const std::string& code, const Outcome& outcome) const;

private:
    std::vector<std::unique_ptr<IGuardrailCheck>> checks_;
};

// Key of the shared role state that mirrors the tool registry.
inline constexpr const char* TOOLS_MEMORY_KEY = "tools";

// Runtime half of tool_registry_mutation: the registry entry of role state
// must come out of an execution exactly as it went in.
std::optional<GuardrailViolation> check_registry_integrity(const JsonMap& before,
                                                           const JsonMap& after,
                                                           const std::string& role,
                                                           const std::string& method_name);

// Source with // comments removed (string literals are left alone).
std::string strip_line_comments(const std::string& code);

} // namespace conjure
