#include "test_common.h"

#include "conjure/fs_util.h"
#include "conjure/log.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using namespace conjure;
namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const fs::path& p) {
    std::ifstream in(p);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) out.push_back(line);
    }
    return out;
}

static void write_lines(const fs::path& p, const std::vector<std::string>& lines) {
    std::ostringstream body;
    for (const auto& l : lines) body << l << "\n";
    if (!write_atomic(p, body.str()).empty()) die("cannot rewrite " + p.string());
}

int main() {
    const fs::path dir = fresh_test_dir("conjure_test_log");
    const fs::path path = dir / "invocations.jsonl";

    {
        InvocationLog log(path.string(), "run-a");
        expect_true(log.is_open(), "open");
        expect_eq_str(log.chain_head(), std::string(64, '0'), "genesis");
        log.event(1, "invocation", "{\"role\":\"counter\",\"method\":\"increment\",\"outcome_status\":\"ok\"}");
        log.event(2, "invocation", "{\"role\":\"counter\",\"method\":\"increment\",\"outcome_status\":\"error\"}");
        expect_true(log.chain_head() != std::string(64, '0'), "chain advanced");
    }

    std::string err;
    expect_true(verify_invocation_log(path.string(), &err), "fresh log verifies: " + err);

    // a second writer continues the chain
    std::string head;
    {
        InvocationLog log(path.string(), "run-b");
        head = log.chain_head();
        log.event(1, "invocation", "{\"role\":\"http\",\"method\":\"get\"}");
    }
    expect_true(head != std::string(64, '0'), "tail hash picked up");
    expect_true(verify_invocation_log(path.string(), &err), "appended log verifies: " + err);

    auto lines = read_lines(path);
    expect_eq_ll((long long)lines.size(), 3, "three records");
    expect_true(contains(lines[0], "\"event\":\"invocation\""), "event name");
    expect_true(contains(lines[2], "\"run_id\":\"run-b\""), "run id");

    // altered payload
    {
        auto bad = lines;
        const size_t at = bad[1].find("\"error\"");
        expect_true(at != std::string::npos, "payload present");
        bad[1].replace(at, 7, "\"ok\"");
        write_lines(path, bad);
        expect_true(!verify_invocation_log(path.string(), &err), "tamper detected");
        expect_true(contains(err, "line 2"), "bad line reported: " + err);
    }

    // dropped record
    {
        write_lines(path, {lines[0], lines[2]});
        expect_true(!verify_invocation_log(path.string(), &err), "gap detected");
        expect_true(contains(err, "chain_prev"), "broken link: " + err);
    }

    // reordered records
    {
        write_lines(path, {lines[1], lines[0], lines[2]});
        expect_true(!verify_invocation_log(path.string(), &err), "reorder detected");
        expect_true(contains(err, "line 1"), "first line: " + err);
    }

    expect_true(!verify_invocation_log((dir / "missing.jsonl").string(), &err), "missing file");
    std::cerr << "test_log: ALL PASSED" << std::endl;
    return 0;
}
