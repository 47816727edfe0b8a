#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace saltline {

/**
 * @brief Salt material from the OpenSSL CSPRNG
 *
 * RAND_bytes is internally synchronized, so these are safe to call from
 * any number of threads. Both throw std::runtime_error if the generator
 * reports failure; a salt is never produced from a weaker source.
 */
namespace Random {

/// count raw random bytes
std::string randomBytes(std::size_t count);

/**
 * @brief count characters drawn uniformly from charset
 *
 * Uses rejection sampling so charsets whose size does not divide 256
 * are not biased toward their first characters.
 */
std::string randomString(const std::string& charset, std::size_t count);

/// Uniform integer in [low, high]; low must not exceed high
uint64_t randomInt(uint64_t low, uint64_t high);

}  // namespace Random

}  // namespace saltline
