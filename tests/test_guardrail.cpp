#include "test_common.h"

#include "conjure/guardrail.h"
#include "conjure/outcome.h"

#include <string>
#include <type_traits>

using namespace conjure;

static std::string subtype_of(const std::optional<GuardrailViolation>& v) {
    return v ? v->violation_subtype : std::string("<none>");
}

int main() {
    const GuardrailPolicy policy = GuardrailPolicy::with_default_checks();
    expect_eq_ll((long long)policy.size(), 5, "default checks");

    // clean program
    expect_true(!policy.check_code("host.memory_set(\"count\", \"1\");\nhost.ok(\"1\");"), "clean program passes");

    // method definition on foreign receivers
    {
        auto v = policy.check_code("ctx.define_method(\"x\", fn);");
        expect_eq_str(subtype_of(v), "singleton_method_mutation", "foreign define_method");
        expect_eq_str(v->violation_type, "tool_registry_violation", "violation type");
        expect_eq_str(v->guardrail_class, GUARDRAIL_RECOVERABLE, "recoverable");
        expect_eq_str(v->location, "program:1", "location");
        expect_true(!v->required_correction.empty(), "correction present");

        expect_true(!policy.check_code("host.define_method(\"x\", fn);"), "host.define_method allowed");
        expect_true(!policy.check_code("// ctx.define_method(\"x\", fn);\nhost.ok(\"1\");"), "comments ignored");
    }

    // registry writes
    {
        auto v = policy.check_code("int x = 0;\nhost.memory_set(\"tools\", \"{}\");");
        expect_eq_str(subtype_of(v), "tool_registry_mutation", "tools write");
        expect_eq_str(v->location, "program:2", "second line");
        expect_true(!policy.check_code("host.memory_set(\"toolbox\", \"{}\");"), "other keys fine");
    }

    // positional use of the tools map
    {
        auto v = policy.check_code(
            "json_object* t = parse(host.tools_json());\n"
            "auto first = json_object_array_get_idx(t, 0);");
        expect_eq_str(subtype_of(v), "context_tools_shape_misuse", "positional tools access");
        expect_true(!policy.check_code("json_object* t = parse(host.tools_json());\n"
                                       "json_object_object_get_ex(t, \"http.get\", &v);"),
                    "keyed access allowed");
    }

    // hardcoded fallback through ok() in a fetch flow
    {
        const std::string code =
            "std::string r = host.delegate(\"fetcher\", \"get\", \"[]\");\n"
            "std::string fallback_items = \"[\\\"a\\\",\\\"b\\\"]\";\n"
            "host.ok(fallback_items);";
        auto v = policy.check_code(code);
        expect_eq_str(subtype_of(v), "hardcoded_external_fallback_success", "fallback success");
        expect_eq_str(v->location, "program:3", "points at ok()");

        expect_true(!policy.check_code("std::string fallback_items = \"[]\";\nhost.ok(fallback_items);"),
                    "no fetch flow, no violation");
    }

    // provenance on external-data success
    {
        const std::string code = "std::string r = host.delegate(\"web_fetcher\", \"get\", \"[]\");";
        Outcome bare = Outcome::success("{\"titles\":[\"a\"]}");
        expect_eq_str(subtype_of(policy.check_outcome(code, bare)), "missing_external_provenance", "no provenance");

        Outcome sourced = Outcome::success(
            R"({"titles":["a"],"provenance":{"sources":[{"uri":"https://x","fetched_at":"2026-01-01T00:00:00Z",)"
            R"("retrieval_tool":"http.get","retrieval_mode":" Live "}]}})");
        expect_true(!policy.check_outcome(code, sourced), "valid provenance");

        Outcome bad_mode = Outcome::success(
            R"({"provenance":{"sources":[{"uri":"https://x","fetched_at":"t","retrieval_tool":"h",)"
            R"("retrieval_mode":"guessed"}]}})");
        expect_true(policy.check_outcome(code, bad_mode).has_value(), "unknown retrieval mode");

        Outcome failed = Outcome::failure("network_error", "down", true);
        expect_true(!policy.check_outcome(code, failed), "errors are not checked");
        expect_true(!policy.check_outcome("host.ok(\"1\");", bare), "local programs are not checked");
    }

    // classification
    {
        expect_eq_str(guardrail_class_for_message("Missing credential for service"), GUARDRAIL_TERMINAL,
                      "credential messages are terminal");
        expect_eq_str(guardrail_class_for_message("use delegate"), GUARDRAIL_RECOVERABLE, "default recoverable");
        GuardrailViolation v = make_violation("tool_registry_mutation", "API key not configured");
        expect_true(v.terminal(), "terminal violation");
        expect_true(contains(v.to_json(), "\"violation_subtype\":\"tool_registry_mutation\""), "json form");
    }

    // runtime registry integrity
    {
        JsonMap before{{"tools", "{\"a\":{}}"}, {"count", "1"}};
        JsonMap same{{"tools", "{ \"a\": {} }"}, {"count", "2"}};
        JsonMap changed{{"tools", "{\"a\":{},\"b\":{}}"}, {"count", "1"}};
        expect_true(!check_registry_integrity(before, same, "r", "m"), "other keys may change");
        auto v = check_registry_integrity(before, changed, "r", "m");
        expect_eq_str(subtype_of(v), "tool_registry_mutation", "registry changed");
        expect_true(contains(v->message, "r.m"), "message names the operation");
    }

    // custom policies
    {
        GuardrailPolicy empty;
        expect_true(!empty.check_code("ctx.define_method(\"x\", fn);"), "empty policy allows everything");
        empty.add(std::make_unique<ToolRegistryMutationCheck>());
        expect_true(!empty.check_code("ctx.define_method(\"x\", fn);"), "only the added check runs");

        static_assert(!std::is_copy_constructible_v<GuardrailPolicy>, "policies own their checks");
        GuardrailPolicy moved = std::move(empty);
        expect_eq_ll((long long)moved.size(), 1, "checks follow the policy on move");
        expect_true(moved.check_code("host.memory_set(\"tools\", \"{}\");").has_value(), "moved check still runs");
    }
    std::cerr << "test_guardrail: ALL PASSED" << std::endl;
    return 0;
}
