#include "util/Digest.hpp"

#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

namespace saltline {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct KdfCtxDeleter {
    void operator()(EVP_KDF_CTX* ctx) const { EVP_KDF_CTX_free(ctx); }
};

const EVP_MD* lookupMd(const std::string& algorithm) {
    if (algorithm == "sha1") return EVP_sha1();
    if (algorithm == "sha256") return EVP_sha256();
    if (algorithm == "sha512") return EVP_sha512();
    return nullptr;
}

/**
 * @brief IDigest over an OpenSSL EVP message digest
 */
class EvpDigest : public IDigest {
public:
    EvpDigest(const EVP_MD* md, const char* algorithm)
        : md(md), algorithm(algorithm), ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        reset();
    }

    void reset() override {
        if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
            throw std::runtime_error(std::string("EVP_DigestInit_ex failed for ") + algorithm);
        }
    }

    void update(const uint8_t* data, size_t len) override {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx.get(), data, len) != 1) {
            throw std::runtime_error(std::string("EVP_DigestUpdate failed for ") + algorithm);
        }
    }

    void update(const std::string& data) override {
        update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    }

    std::string digest() override {
        unsigned char out[EVP_MAX_MD_SIZE];
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1) {
            throw std::runtime_error(std::string("EVP_DigestFinal_ex failed for ") + algorithm);
        }
        reset();
        return std::string(reinterpret_cast<const char*>(out), outLen);
    }

    const char* name() const override { return algorithm; }
    size_t digestSize() const override { return static_cast<size_t>(EVP_MD_get_size(md)); }

private:
    const EVP_MD* md;
    const char* algorithm;
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx;
};

}

std::unique_ptr<IDigest> DigestFactory::create(const std::string& algorithm) {
    if (algorithm == "sha1") return std::make_unique<EvpDigest>(EVP_sha1(), "sha1");
    if (algorithm == "sha256") return std::make_unique<EvpDigest>(EVP_sha256(), "sha256");
    if (algorithm == "sha512") return std::make_unique<EvpDigest>(EVP_sha512(), "sha512");
    return nullptr;
}

bool DigestFactory::supports(const std::string& algorithm) {
    return lookupMd(algorithm) != nullptr;
}

std::string pbkdf2Hmac(const std::string& secret, const std::string& salt,
                       uint32_t rounds, size_t keyLen, const std::string& digestName) {
    if (!lookupMd(digestName)) {
        throw std::runtime_error("pbkdf2: unsupported digest " + digestName);
    }
    if (rounds == 0) {
        throw std::runtime_error("pbkdf2: rounds must be at least 1");
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_PBKDF2, nullptr);
    if (!kdf) {
        throw std::runtime_error("EVP_KDF_fetch(PBKDF2) failed");
    }
    std::unique_ptr<EVP_KDF_CTX, KdfCtxDeleter> kctx(EVP_KDF_CTX_new(kdf));
    EVP_KDF_free(kdf);
    if (!kctx) {
        throw std::runtime_error("EVP_KDF_CTX_new failed");
    }

    // OpenSSL takes non-const buffers; it only reads them.
    std::string pass = secret;
    std::string saltBuf = salt;
    std::string mdName = digestName;
    uint64_t iterations = rounds;
    int noLowerBoundChecks = 1;

    OSSL_PARAM params[6];
    OSSL_PARAM* p = params;
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, pass.data(), pass.size());
    *p++ = OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltBuf.data(), saltBuf.size());
    *p++ = OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_ITER, &iterations);
    *p++ = OSSL_PARAM_construct_utf8_string(OSSL_KDF_PARAM_DIGEST, mdName.data(), 0);
    *p++ = OSSL_PARAM_construct_int(OSSL_KDF_PARAM_PKCS5, &noLowerBoundChecks);
    *p = OSSL_PARAM_construct_end();

    std::string out(keyLen, '\0');
    if (EVP_KDF_derive(kctx.get(), reinterpret_cast<unsigned char*>(out.data()), out.size(), params) <= 0) {
        throw std::runtime_error("pbkdf2: EVP_KDF_derive failed for hmac-" + digestName);
    }
    return out;
}

}
