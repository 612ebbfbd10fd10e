#pragma once

// Program ABI (v1).
//
// A generated program is the body of a function that receives
// `conjure::ProgramHost& host`. The engine wraps it into a shared object that
// exports the entry points below and never links against conjure_core: all
// calls go through this pure-virtual surface and every value is JSON text.

#include <string>

// ABI version constant. Compiled programs export
// conjure_program_abi_version() returning this value.
#define CONJURE_PROGRAM_ABI_VERSION 1

namespace conjure {

class ProgramHost {
public:
    virtual ~ProgramHost() = default;

    virtual std::string role() const = 0;
    virtual std::string method_name() const = 0;
    virtual std::string args_json() const = 0;    // JSON array
    virtual std::string kwargs_json() const = 0;  // JSON object

    // Shared role state. Reads of an absent key return "null".
    virtual std::string memory_get(const std::string& key) const = 0;
    virtual void memory_set(const std::string& key, const std::string& value_json) = 0;

    // Call-local scratch, gone after the call.
    virtual std::string local_get(const std::string& key) const = 0;
    virtual void local_set(const std::string& key, const std::string& value_json) = 0;

    // Tool registry snapshot: object keyed by tool name.
    virtual std::string tools_json() const = 0;

    // Nested invocation. Returns an outcome envelope.
    virtual std::string delegate(const std::string& role,
                                 const std::string& method,
                                 const std::string& args_json) = 0;

    // Capabilities scoped to the current attempt.
    virtual void define_method(const std::string& name, const std::string& body_json) = 0;
    virtual bool responds_to(const std::string& name) const = 0;

    virtual void set_result(const std::string& value_json) = 0;
    virtual void ok(const std::string& value_json) = 0;
    virtual void error(const std::string& error_type, const std::string& message, bool retriable) = 0;
};

} // namespace conjure

// Entry points exported by a compiled program (C linkage):
//   extern "C" int conjure_program_abi_version();
//   extern "C" int conjure_program_run(conjure::ProgramHost* host,
//                                      char* err_buf, unsigned long err_cap);
// conjure_program_run returns 0 on success. When the program throws, the
// exception message is copied into err_buf and 1 is returned.
extern "C" {
    typedef int (*conjure_program_abi_version_fn)();
    typedef int (*conjure_program_run_fn)(conjure::ProgramHost* host, char* err_buf, unsigned long err_cap);
}
