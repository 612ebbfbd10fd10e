#include "conjure/log.h"
#include "conjure/hash.h"
#include "conjure/json_mini.h"
#include "conjure/serialization.h"

#include <json-c/json.h>

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace conjure {

namespace {

const std::string kGenesis(64, '0');

// Last chain_hash of an existing log, or the genesis value.
std::string tail_chain_hash(const std::string& path) {
    std::ifstream in(path);
    if (!in) return kGenesis;
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    if (last.empty()) return kGenesis;
    json_mini::Doc d = json_mini::parse(last);
    std::string h;
    if (!json_get_string(d.root, "chain_hash", &h) || h.size() != 64) return kGenesis;
    return h;
}

json_object* build_record(const std::string& run_id, int64_t step, const std::string& name,
                          const std::string& canonical_payload, const std::string& ts) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_object_new_string(name.c_str()));
    json_add_raw(rec, "payload", canonical_payload);
    json_object_object_add(rec, "run_id", json_object_new_string(run_id.c_str()));
    json_object_object_add(rec, "step", json_object_new_int64(step));
    json_object_object_add(rec, "ts", json_object_new_string(ts.c_str()));
    return rec;
}

std::atomic<int> g_debug{-1};

} // namespace

InvocationLog::InvocationLog(const std::string& path, const std::string& run_id)
    : path_(path), run_id_(run_id), chain_prev_(tail_chain_hash(path)) {
    out_.open(path, std::ios::out | std::ios::app);
}

void InvocationLog::event(int64_t step, const std::string& name, const std::string& payload_json) {
    if (!out_.is_open()) return;
    const std::string ts = iso_now_ms();
    const std::string canonical_payload = json_canonical_text(payload_json);

    json_object* rec = build_record(run_id_, step, name, canonical_payload, ts);
    const std::string record = json_canonical(rec);
    const std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    json_object_object_add(rec, "chain_hash", json_object_new_string(chain_hash.c_str()));
    json_object_object_add(rec, "chain_prev", json_object_new_string(chain_prev_.c_str()));
    out_ << json_canonical(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    chain_prev_ = chain_hash;
}

bool verify_invocation_log(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string prev = kGenesis;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        json_mini::Doc d = json_mini::parse(line);
        if (!d.is_object()) {
            if (err) *err = "line " + std::to_string(lineno) + ": not a JSON object";
            return false;
        }
        std::string chain_hash, chain_prev;
        json_get_string(d.root, "chain_hash", &chain_hash);
        json_get_string(d.root, "chain_prev", &chain_prev);
        if (chain_prev != prev) {
            if (err) *err = "line " + std::to_string(lineno) + ": chain_prev mismatch";
            return false;
        }
        json_object_object_del(d.root, "chain_hash");
        json_object_object_del(d.root, "chain_prev");
        if (hash::sha256_hex(prev + json_canonical(d.root)) != chain_hash) {
            if (err) *err = "line " + std::to_string(lineno) + ": chain_hash mismatch";
            return false;
        }
        prev = chain_hash;
    }
    return true;
}

bool debug_enabled() {
    int v = g_debug.load();
    if (v < 0) {
        const char* e = std::getenv("CONJURE_DEBUG");
        v = (e && *e && std::string(e) != "0") ? 1 : 0;
        g_debug.store(v);
    }
    return v == 1;
}

void set_debug(bool on) { g_debug.store(on ? 1 : 0); }

void debug_log(const std::string& msg) {
    if (!debug_enabled()) return;
    std::cerr << "[conjure] " << msg << "\n";
}

} // namespace conjure
