#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace conjure::hash {

// ---------- SHA-256 ----------
// Used for artifact checksums, environment ids, contract fingerprints and the
// invocation log hash chain.

class Sha256 {
public:
    Sha256();
    void update(const uint8_t* data, size_t n);
    void update(const std::string& s) { update(reinterpret_cast<const uint8_t*>(s.data()), s.size()); }
    std::array<uint8_t, 32> finish();

private:
    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
};

std::string sha256_hex(const std::string& s);

// "sha256:<hex>" as stored in artifact records.
std::string code_checksum(const std::string& code);

// ---------- random ids ----------
// n_bytes of OS randomness rendered as lowercase hex (2*n_bytes chars).
std::string random_hex(size_t n_bytes);

} // namespace conjure::hash
