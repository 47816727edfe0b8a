#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace saltline {

/**
 * @brief Strategy interface for message digests
 *
 * Handlers that run their own digest loop (sha512_crypt) talk to this
 * interface instead of a concrete algorithm. Byte strings are carried in
 * std::string; nothing here assumes text.
 */
class IDigest {
public:
    virtual ~IDigest() = default;

    /// Reset to the initial state
    virtual void reset() = 0;

    /// Feed raw bytes
    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Feed a byte string
    virtual void update(const std::string& data) = 0;

    /// Finalize, return the raw digest and reset for reuse
    virtual std::string digest() = 0;

    /// Algorithm name ("sha1", "sha256", "sha512")
    virtual const char* name() const = 0;

    /// Digest size in bytes
    virtual size_t digestSize() const = 0;
};

/**
 * @brief Factory for digest instances, backed by OpenSSL EVP
 */
class DigestFactory {
public:
    /// Create a digest by name; returns nullptr for unsupported names
    static std::unique_ptr<IDigest> create(const std::string& algorithm);

    /// True if create() would succeed for this name
    static bool supports(const std::string& algorithm);
};

/**
 * @brief PBKDF2 with HMAC-<digest> as PRF (RFC 8018)
 *
 * @param secret Password bytes
 * @param salt Salt bytes (may be empty)
 * @param rounds Iteration count, at least 1
 * @param keyLen Derived key length in bytes
 * @param digestName "sha1", "sha256" or "sha512"
 * @return keyLen bytes of derived key
 *
 * Throws std::runtime_error if OpenSSL cannot run the derivation.
 */
std::string pbkdf2Hmac(const std::string& secret, const std::string& salt,
                       uint32_t rounds, size_t keyLen, const std::string& digestName);

}
