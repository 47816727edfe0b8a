#include "util/Random.hpp"

#include <climits>
#include <cstring>
#include <stdexcept>

#include <openssl/rand.h>

namespace saltline {
namespace Random {

std::string randomBytes(std::size_t count) {
    std::string out(count, '\0');
    if (count == 0) return out;
    if (count > static_cast<std::size_t>(INT_MAX)) {
        throw std::runtime_error("randomBytes: request too large");
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string randomString(const std::string& charset, std::size_t count) {
    if (charset.empty() || charset.size() > 256) {
        throw std::runtime_error("randomString: charset must have 1-256 characters");
    }
    const unsigned n = static_cast<unsigned>(charset.size());
    const unsigned limit = 256 - (256 % n);

    std::string out;
    out.reserve(count);
    while (out.size() < count) {
        std::string pool = randomBytes(count - out.size() + 8);
        for (char raw : pool) {
            unsigned v = static_cast<unsigned char>(raw);
            if (v >= limit) continue;
            out.push_back(charset[v % n]);
            if (out.size() == count) break;
        }
    }
    return out;
}

uint64_t randomInt(uint64_t low, uint64_t high) {
    if (low > high) {
        throw std::runtime_error("randomInt: empty range");
    }
    const uint64_t span = high - low;
    if (span == UINT64_MAX) {
        uint64_t v = 0;
        std::string raw = randomBytes(sizeof(v));
        std::memcpy(&v, raw.data(), sizeof(v));
        return v;
    }
    const uint64_t n = span + 1;
    const uint64_t limit = UINT64_MAX - (UINT64_MAX % n);
    for (;;) {
        uint64_t v = 0;
        std::string raw = randomBytes(sizeof(v));
        std::memcpy(&v, raw.data(), sizeof(v));
        if (v < limit) return low + v % n;
    }
}

}  // namespace Random
}  // namespace saltline
