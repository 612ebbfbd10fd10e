#pragma once
#include <cstdint>
#include <fstream>
#include <string>

namespace conjure {

// JSONL event log with a tamper-evident hash chain:
//   chain_hash = SHA256(chain_prev || canonical record)
// Appends to an existing file and continues its chain.
class InvocationLog {
public:
    InvocationLog(const std::string& path, const std::string& run_id);

    void event(int64_t step, const std::string& name, const std::string& payload_json);

    const std::string& path() const { return path_; }
    const std::string& chain_head() const { return chain_prev_; }
    bool is_open() const { return out_.is_open(); }

private:
    std::string path_;
    std::string run_id_;
    std::ofstream out_;
    std::string chain_prev_;
};

// Recomputes the chain of a log file. Returns false and the first bad line
// number in err when a record was altered, dropped or reordered.
bool verify_invocation_log(const std::string& path, std::string* err);

// Diagnostics to stderr, prefixed "[conjure]", when CONJURE_DEBUG is set.
bool debug_enabled();
void set_debug(bool on);
void debug_log(const std::string& msg);

} // namespace conjure
