#include "conjure/hash.h"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <random>
#include <sstream>

#ifdef __linux__
#include <sys/random.h>
#endif

namespace conjure::hash {

namespace {

inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }

const uint32_t K[64] = {
  0x428a2f98u,0x71374491u,0xb5c0fbcfu,0xe9b5dba5u,0x3956c25bu,0x59f111f1u,0x923f82a4u,0xab1c5ed5u,
  0xd807aa98u,0x12835b01u,0x243185beu,0x550c7dc3u,0x72be5d74u,0x80deb1feu,0x9bdc06a7u,0xc19bf174u,
  0xe49b69c1u,0xefbe4786u,0x0fc19dc6u,0x240ca1ccu,0x2de92c6fu,0x4a7484aau,0x5cb0a9dcu,0x76f988dau,
  0x983e5152u,0xa831c66du,0xb00327c8u,0xbf597fc7u,0xc6e00bf3u,0xd5a79147u,0x06ca6351u,0x14292967u,
  0x27b70a85u,0x2e1b2138u,0x4d2c6dfcu,0x53380d13u,0x650a7354u,0x766a0abbu,0x81c2c92eu,0x92722c85u,
  0xa2bfe8a1u,0xa81a664bu,0xc24b8b70u,0xc76c51a3u,0xd192e819u,0xd6990624u,0xf40e3585u,0x106aa070u,
  0x19a4c116u,0x1e376c08u,0x2748774cu,0x34b0bcb5u,0x391c0cb3u,0x4ed8aa4au,0x5b9cca4fu,0x682e6ff3u,
  0x748f82eeu,0x78a5636fu,0x84c87814u,0x8cc70208u,0x90befffau,0xa4506cebu,0xbef9a3f7u,0xc67178f2u
};

void compress(uint32_t H[8], const uint8_t* block) {
    uint32_t W[64];
    for (int i = 0; i < 16; i++) {
        W[i] = (uint32_t(block[i * 4]) << 24) | (uint32_t(block[i * 4 + 1]) << 16) |
               (uint32_t(block[i * 4 + 2]) << 8) | uint32_t(block[i * 4 + 3]);
    }
    for (int i = 16; i < 64; i++) {
        uint32_t s0 = rotr(W[i - 15], 7) ^ rotr(W[i - 15], 18) ^ (W[i - 15] >> 3);
        uint32_t s1 = rotr(W[i - 2], 17) ^ rotr(W[i - 2], 19) ^ (W[i - 2] >> 10);
        W[i] = s1 + W[i - 7] + s0 + W[i - 16];
    }

    uint32_t v[8];
    std::memcpy(v, H, sizeof(v));
    for (int i = 0; i < 64; i++) {
        uint32_t S1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
        uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
        uint32_t t1 = v[7] + S1 + ch + K[i] + W[i];
        uint32_t S0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
        uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
        uint32_t t2 = S0 + maj;
        v[7] = v[6]; v[6] = v[5]; v[5] = v[4]; v[4] = v[3] + t1;
        v[3] = v[2]; v[2] = v[1]; v[1] = v[0]; v[0] = t1 + t2;
    }
    for (int i = 0; i < 8; i++) H[i] += v[i];
}

} // namespace

Sha256::Sha256() {
    static const uint32_t init[8] = {
        0x6a09e667u,0xbb67ae85u,0x3c6ef372u,0xa54ff53au,0x510e527fu,0x9b05688cu,0x1f83d9abu,0x5be0cd19u
    };
    std::memcpy(h_, init, sizeof(h_));
}

void Sha256::update(const uint8_t* data, size_t n) {
    total_ += n;
    while (n > 0) {
        size_t take = std::min(n, sizeof(buf_) - buf_len_);
        std::memcpy(buf_ + buf_len_, data, take);
        buf_len_ += take;
        data += take;
        n -= take;
        if (buf_len_ == sizeof(buf_)) {
            compress(h_, buf_);
            buf_len_ = 0;
        }
    }
}

std::array<uint8_t, 32> Sha256::finish() {
    const uint64_t bitlen = total_ * 8ULL;
    uint8_t pad = 0x80;
    update(&pad, 1);
    uint8_t zero = 0;
    while (buf_len_ != 56) update(&zero, 1);
    uint8_t len[8];
    for (int i = 0; i < 8; i++) len[i] = uint8_t((bitlen >> (56 - 8 * i)) & 0xff);
    update(len, 8);

    std::array<uint8_t, 32> out{};
    for (int i = 0; i < 8; i++) {
        out[i * 4 + 0] = uint8_t((h_[i] >> 24) & 0xff);
        out[i * 4 + 1] = uint8_t((h_[i] >> 16) & 0xff);
        out[i * 4 + 2] = uint8_t((h_[i] >> 8) & 0xff);
        out[i * 4 + 3] = uint8_t(h_[i] & 0xff);
    }
    return out;
}

static std::string to_hex(const uint8_t* p, size_t n) {
    std::ostringstream oss;
    for (size_t i = 0; i < n; i++) oss << std::hex << std::setw(2) << std::setfill('0') << int(p[i]);
    return oss.str();
}

std::string sha256_hex(const std::string& s) {
    Sha256 h;
    h.update(s);
    auto d = h.finish();
    return to_hex(d.data(), d.size());
}

std::string code_checksum(const std::string& code) {
    return "sha256:" + sha256_hex(code);
}

std::string random_hex(size_t n_bytes) {
    std::string raw(n_bytes, '\0');
    size_t got = 0;
#ifdef __linux__
    while (got < n_bytes) {
        ssize_t r = getrandom(&raw[got], n_bytes - got, 0);
        if (r <= 0) break;
        got += (size_t)r;
    }
#endif
    if (got < n_bytes) {
        // getrandom unavailable: fall back to the seeded generator
        static thread_local std::mt19937_64 rng{std::random_device{}()};
        for (size_t i = got; i < n_bytes; i++) raw[i] = (char)(rng() & 0xff);
    }
    return to_hex(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

} // namespace conjure::hash
