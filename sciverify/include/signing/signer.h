/**
 * @file signer.h
 * @brief Ed25519 签名（OpenSSL EVP）
 *
 * seal 计算结果的内容地址并对地址签名：
 *   content_address = "sha256:" + hex(SHA-256(canonical_bytes))
 *   signature       = base64(Ed25519(content_address))
 *   public_key_ref  = "ed25519:" + SHA-256(raw public key) 前 16 位十六进制
 *
 * 密钥在构造时显式传入，之后不再修改。EVP_PKEY 在多个线程间只读共享，
 * 每次签名使用独立的 EVP_MD_CTX。
 */

#ifndef SCIV_SIGNING_SIGNER_H
#define SCIV_SIGNING_SIGNER_H

#include <string>
#include <memory>
#include <vector>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/err.h>

#include "core/error.h"
#include "core/types.h"
#include "core/logger.h"
#include "core/utils.h"
#include "signing/canonical.h"

namespace sciv {
namespace signing {

struct Seal {
    std::string content_address;
    std::string signature;
    std::string public_key_ref;
};

namespace detail {

struct PKeyDeleter {
    void operator()(EVP_PKEY *p) const { EVP_PKEY_free(p); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX *p) const { EVP_MD_CTX_free(p); }
};
struct BioDeleter {
    void operator()(BIO *p) const { BIO_free_all(p); }
};
struct PKeyCtxDeleter {
    void operator()(EVP_PKEY_CTX *p) const { EVP_PKEY_CTX_free(p); }
};

using PKeyPtr = std::unique_ptr<EVP_PKEY, PKeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using BioPtr = std::unique_ptr<BIO, BioDeleter>;
using PKeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PKeyCtxDeleter>;

/**
 * @brief 取出并清空 OpenSSL 错误队列
 */
inline std::string openssl_error() {
    std::string out;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        if (!out.empty()) out += "; ";
        out += buf;
    }
    return out.empty() ? "unknown OpenSSL error" : out;
}

inline std::string bio_to_string(BIO *bio) {
    char *data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return len > 0 ? std::string(data, static_cast<size_t>(len)) : std::string();
}

inline Result<std::string> key_ref(EVP_PKEY *pkey) {
    unsigned char raw[64];
    size_t len = sizeof(raw);
    if (EVP_PKEY_get_raw_public_key(pkey, raw, &len) != 1) {
        return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE,
                          "cannot read raw public key: " + openssl_error());
    }
    std::string digest = sha256_hex(std::string(reinterpret_cast<char *>(raw), len));
    return "ed25519:" + digest.substr(0, 16);
}

inline Result<std::string> public_pem(EVP_PKEY *pkey) {
    BioPtr bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey) != 1) {
        return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE, "cannot export public key: " + openssl_error());
    }
    return bio_to_string(bio.get());
}

/**
 * @brief 校验：重算地址，核对密钥引用，再验签名
 */
inline Result<void> verify_with(EVP_PKEY *pkey, const std::string &ref,
                                const VerificationResult &r) {
    if (!r.is_sealed()) {
        return Err(ErrorCode::VERIFY_FAILED, "result for " + r.job_id + " is not sealed");
    }
    std::string address = content_address(r);
    if (address != r.content_address) {
        return Err(ErrorCode::VERIFY_FAILED, "content address mismatch for " + r.job_id);
    }
    if (r.public_key_ref != ref) {
        return Err(ErrorCode::VERIFY_FAILED,
                   "result signed by " + r.public_key_ref + ", expected " + ref);
    }
    auto sig = base64_decode(r.signature);
    if (sig.is_error()) {
        return Err(ErrorCode::VERIFY_FAILED, "signature is not valid base64");
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey) != 1) {
        return Err(ErrorCode::VERIFY_FAILED, "verify init failed: " + openssl_error());
    }
    const std::string &s = sig.value();
    int rc = EVP_DigestVerify(ctx.get(),
                              reinterpret_cast<const unsigned char *>(s.data()), s.size(),
                              reinterpret_cast<const unsigned char *>(address.data()),
                              address.size());
    if (rc != 1) {
        ERR_clear_error();
        return Err(ErrorCode::VERIFY_FAILED, "signature does not verify for " + r.job_id);
    }
    return Ok();
}

} // namespace detail

//==============================================================================
// Signer
//==============================================================================

class Signer {
private:
    detail::PKeyPtr key_;
    std::string key_ref_;

    explicit Signer(detail::PKeyPtr key, std::string ref)
        : key_(std::move(key)), key_ref_(std::move(ref)) {}

    static Result<Signer> wrap(detail::PKeyPtr key) {
        if (EVP_PKEY_id(key.get()) != EVP_PKEY_ED25519) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE, "signing key is not an Ed25519 key");
        }
        SCIV_TRY_UNWRAP(ref, detail::key_ref(key.get()));
        return Signer(std::move(key), ref);
    }

public:
    Signer(Signer&&) = default;
    Signer& operator=(Signer&&) = default;

    /**
     * @brief 从 PKCS#8 PEM 文件加载私钥
     */
    static Result<Signer> load(const std::string &path) {
        auto pem = read_file(path);
        if (pem.is_error()) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE,
                              "cannot read signing key " + path + ": " + pem.error().message());
        }
        return from_pem(pem.value());
    }

    static Result<Signer> from_pem(const std::string &pem) {
        detail::BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE, "BIO_new_mem_buf failed");
        }
        detail::PKeyPtr key(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
        if (!key) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE,
                              "cannot parse private key: " + detail::openssl_error());
        }
        return wrap(std::move(key));
    }

    /**
     * @brief 生成新的 Ed25519 密钥对
     */
    static Result<Signer> generate() {
        detail::PKeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
        EVP_PKEY *raw = nullptr;
        if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
            EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE,
                              "Ed25519 key generation failed: " + detail::openssl_error());
        }
        return wrap(detail::PKeyPtr(raw));
    }

    const std::string& public_key_ref() const { return key_ref_; }

    Result<std::string> public_key_pem() const {
        return detail::public_pem(key_.get());
    }

    /**
     * @brief 以 PKCS#8 PEM 写出私钥，权限 0600
     */
    Result<void> save_private_key(const std::string &path) const {
        detail::BioPtr bio(BIO_new(BIO_s_mem()));
        if (!bio || PEM_write_bio_PrivateKey(bio.get(), key_.get(), nullptr, nullptr, 0,
                                             nullptr, nullptr) != 1) {
            return Err(ErrorCode::KEY_UNAVAILABLE, "cannot encode private key: " + detail::openssl_error());
        }
        return write_file_atomic(path, detail::bio_to_string(bio.get()), 0600);
    }

    /**
     * @brief 计算内容地址并签名
     */
    Result<Seal> seal(const VerificationResult &r) const {
        Seal s;
        s.content_address = content_address(r);
        s.public_key_ref = key_ref_;

        detail::MdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
            return SCIV_ERROR(ErrorCode::SIGNING_FAILED,
                              "sign init failed: " + detail::openssl_error());
        }
        const auto *msg = reinterpret_cast<const unsigned char *>(s.content_address.data());
        size_t sig_len = 0;
        if (EVP_DigestSign(ctx.get(), nullptr, &sig_len, msg, s.content_address.size()) != 1) {
            return SCIV_ERROR(ErrorCode::SIGNING_FAILED,
                              "sign size query failed: " + detail::openssl_error());
        }
        std::vector<unsigned char> sig(sig_len);
        if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, msg, s.content_address.size()) != 1) {
            return SCIV_ERROR(ErrorCode::SIGNING_FAILED,
                              "signing failed: " + detail::openssl_error());
        }
        s.signature = base64_encode(std::string(reinterpret_cast<char *>(sig.data()), sig_len));
        return s;
    }

    /**
     * @brief 签名并把地址、签名、密钥引用写回结果
     */
    Result<void> seal_into(VerificationResult &r) const {
        auto s = seal(r);
        if (s.is_error()) return s.error();
        r.content_address = s.value().content_address;
        r.signature = s.value().signature;
        r.public_key_ref = s.value().public_key_ref;
        return Ok();
    }

    Result<void> verify(const VerificationResult &r) const {
        return detail::verify_with(key_.get(), key_ref_, r);
    }
};

//==============================================================================
// PublicKeyVerifier
//==============================================================================

/**
 * @brief 只持有公钥的一方用来校验结果
 */
class PublicKeyVerifier {
private:
    detail::PKeyPtr key_;
    std::string key_ref_;

    PublicKeyVerifier(detail::PKeyPtr key, std::string ref)
        : key_(std::move(key)), key_ref_(std::move(ref)) {}

public:
    PublicKeyVerifier(PublicKeyVerifier&&) = default;
    PublicKeyVerifier& operator=(PublicKeyVerifier&&) = default;

    static Result<PublicKeyVerifier> from_pem(const std::string &pem) {
        detail::BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
        if (!bio) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE, "BIO_new_mem_buf failed");
        }
        detail::PKeyPtr key(PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
        if (!key || EVP_PKEY_id(key.get()) != EVP_PKEY_ED25519) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE,
                              "not an Ed25519 public key: " + detail::openssl_error());
        }
        SCIV_TRY_UNWRAP(ref, detail::key_ref(key.get()));
        return PublicKeyVerifier(std::move(key), ref);
    }

    static Result<PublicKeyVerifier> load(const std::string &path) {
        auto pem = read_file(path);
        if (pem.is_error()) {
            return SCIV_ERROR(ErrorCode::KEY_UNAVAILABLE,
                              "cannot read public key " + path + ": " + pem.error().message());
        }
        return from_pem(pem.value());
    }

    const std::string& public_key_ref() const { return key_ref_; }

    Result<void> verify(const VerificationResult &r) const {
        return detail::verify_with(key_.get(), key_ref_, r);
    }
};

} // namespace signing
} // namespace sciv

#endif // SCIV_SIGNING_SIGNER_H
