#include "test_common.h"

#include "conjure/errors.h"
#include "conjure/generator.h"
#include "conjure/proc.h"

#include <signal.h>

#include <cstdlib>
#include <functional>
#include <string>

using namespace conjure;

static std::string error_type_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.type();
    }
    return "<none>";
}

int main() {
    ::signal(SIGPIPE, SIG_IGN);

    // payload parsing
    {
        GeneratedPayload p = parse_generated_payload(
            "  {\"code\":\"host.ok(\\\"1\\\");\",\"dependencies\":[{\"name\":\"zlib\"}],\"input_sensitive\":true}\n");
        expect_eq_str(p.code, "host.ok(\"1\");", "code");
        expect_true(contains(p.dependencies_json, "zlib"), "dependencies kept raw");
        expect_true(p.input_sensitive, "input_sensitive");

        GeneratedPayload bare = parse_generated_payload("{\"code\":\"host.ok(\\\"1\\\");\"}");
        expect_eq_str(bare.dependencies_json, "null", "absent dependencies");
        expect_true(!bare.input_sensitive, "default stable");

        expect_eq_str(error_type_of([] { parse_generated_payload("{\"code\":\"   \"}"); }), "invalid_code", "blank");
        expect_eq_str(error_type_of([] { parse_generated_payload("{\"code\":null}"); }), "invalid_code", "null");
        expect_eq_str(error_type_of([] { parse_generated_payload("{}"); }), "invalid_code", "missing");
        expect_eq_str(error_type_of([] { parse_generated_payload("Sure! Here is the code"); }), "invalid_code", "prose");
        expect_eq_str(error_type_of([] { parse_generated_payload("[\"host.ok(1);\"]"); }), "invalid_code", "array payload");
        expect_true(Error("invalid_code", "x").retriable(), "invalid_code is retriable");
        expect_true(contains(program_payload_schema(), "\"required\":[\"code\"]"), "schema");
    }

    // argv splitting
    {
        auto argv = split_argv_quoted("/bin/sh -c 'echo \"a b\"' \"x\\\"y\"");
        expect_eq_ll((long long)argv.size(), 4, "four tokens");
        expect_eq_str(argv[2], "echo \"a b\"", "single quotes keep everything");
        expect_eq_str(argv[3], "x\"y", "escaped double quote");
    }

    GenerationRequest req;
    req.model = "test-model";
    req.user_prompt = "<invocation><role>counter</role></invocation>";
    req.timeout_ms = 5000;

    // request goes in on stdin, payload comes back on stdout
    {
        ExternalProcessGenerator gen(
            "/bin/sh -c 'grep counter >/dev/null && printf \"%s\" \"{\\\"code\\\":\\\"host.ok(1);\\\"}\"'");
        GeneratedPayload p = gen.generate(req);
        expect_eq_str(p.code, "host.ok(1);", "generated code");
        expect_eq_ll(gen.consecutive_failures(), 0, "no failures");
    }

    // transport failures open the breaker
    {
        setenv("CONJURE_GENERATOR_FAIL_THRESHOLD", "2", 1);
        setenv("CONJURE_GENERATOR_COOLDOWN_MS", "60000", 1);
        ExternalProcessGenerator gen("/bin/sh -c 'cat >/dev/null; exit 3'");
        expect_eq_str(error_type_of([&] { gen.generate(req); }), "provider", "non-zero exit");
        expect_eq_str(error_type_of([&] { gen.generate(req); }), "provider", "second failure");
        expect_eq_ll(gen.consecutive_failures(), 2, "failures counted");
        std::string msg;
        try {
            gen.generate(req);
        } catch (const Error& e) {
            msg = e.what();
        }
        expect_true(contains(msg, "disabled"), "breaker open: " + msg);
        unsetenv("CONJURE_GENERATOR_FAIL_THRESHOLD");
        unsetenv("CONJURE_GENERATOR_COOLDOWN_MS");
    }

    // timeouts
    {
        ExternalProcessGenerator gen("/bin/sh -c 'sleep 5'");
        GenerationRequest quick = req;
        quick.timeout_ms = 200;
        expect_eq_str(error_type_of([&] { gen.generate(quick); }), "timeout", "slow generator");
    }

    expect_eq_str(error_type_of([&] { ExternalProcessGenerator("").generate(req); }), "provider", "no command");
    return 0;
}
