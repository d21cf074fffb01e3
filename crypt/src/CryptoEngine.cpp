#include "CryptoEngine.hpp"
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <climits>
#include <iostream>

namespace Vaultline {

CipherCtxPtr CryptoEngine::newContext() {
    return CipherCtxPtr(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
}

ErrorCode CryptoEngine::seal(const ContentKey& key, const unsigned char* iv,
                             const unsigned char* aad, size_t aadLen,
                             const unsigned char* plaintext, size_t plaintextLen,
                             std::vector<unsigned char>& out) {
    if (!key.isSet()) return ErrorCode::InvalidKeyMaterial;
    if (plaintextLen > INT_MAX || aadLen > INT_MAX) return ErrorCode::InvalidArgument;

    CipherCtxPtr ctx = newContext();
    if (!ctx) return ErrorCode::CryptoFailure;

    if (1 != EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), NULL, NULL, NULL)) return ErrorCode::CryptoFailure;

    if (1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, VAULTLINE_IV_SIZE, NULL)) return ErrorCode::CryptoFailure;

    if (1 != EVP_EncryptInit_ex(ctx.get(), NULL, NULL, key.data(), iv)) return ErrorCode::CryptoFailure;

    int len = 0;
    if (aadLen > 0) {
        if (1 != EVP_EncryptUpdate(ctx.get(), NULL, &len, aad, static_cast<int>(aadLen))) return ErrorCode::CryptoFailure;
    }

    size_t start = out.size();
    out.resize(start + plaintextLen + VAULTLINE_TAG_SIZE);

    int ciphertextLen = 0;
    if (plaintextLen > 0) {
        if (1 != EVP_EncryptUpdate(ctx.get(), out.data() + start, &len, plaintext, static_cast<int>(plaintextLen))) {
            out.resize(start);
            return ErrorCode::CryptoFailure;
        }
        ciphertextLen = len;
    }

    if (1 != EVP_EncryptFinal_ex(ctx.get(), out.data() + start + ciphertextLen, &len)) {
        out.resize(start);
        return ErrorCode::CryptoFailure;
    }
    ciphertextLen += len;

    // GCM has no padding, ciphertext length == plaintext length
    if (1 != EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, VAULTLINE_TAG_SIZE, out.data() + start + ciphertextLen)) {
        out.resize(start);
        return ErrorCode::CryptoFailure;
    }

    return ErrorCode::None;
}

ErrorCode CryptoEngine::open(const ContentKey& key, const unsigned char* iv,
                             const unsigned char* aad, size_t aadLen,
                             const unsigned char* sealed, size_t sealedLen,
                             std::vector<unsigned char>& out) {
    if (!key.isSet()) return ErrorCode::InvalidKeyMaterial;
    if (sealedLen < VAULTLINE_TAG_SIZE) return ErrorCode::TruncatedInput;
    if (sealedLen > INT_MAX || aadLen > INT_MAX) return ErrorCode::InvalidArgument;

    size_t ciphertextLen = sealedLen - VAULTLINE_TAG_SIZE;

    CipherCtxPtr ctx = newContext();
    if (!ctx) return ErrorCode::CryptoFailure;

    if (!EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), NULL, NULL, NULL)) return ErrorCode::CryptoFailure;

    if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, VAULTLINE_IV_SIZE, NULL)) return ErrorCode::CryptoFailure;

    if (!EVP_DecryptInit_ex(ctx.get(), NULL, NULL, key.data(), iv)) return ErrorCode::CryptoFailure;

    int len = 0;
    if (aadLen > 0) {
        if (1 != EVP_DecryptUpdate(ctx.get(), NULL, &len, aad, static_cast<int>(aadLen))) return ErrorCode::CryptoFailure;
    }

    size_t start = out.size();
    out.resize(start + ciphertextLen);

    int plaintextLen = 0;
    if (ciphertextLen > 0) {
        if (1 != EVP_DecryptUpdate(ctx.get(), out.data() + start, &len, sealed, static_cast<int>(ciphertextLen))) {
            OPENSSL_cleanse(out.data() + start, ciphertextLen);
            out.resize(start);
            return ErrorCode::CryptoFailure;
        }
        plaintextLen = len;
    }

    std::vector<unsigned char> tag(sealed + ciphertextLen, sealed + sealedLen);
    if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, VAULTLINE_TAG_SIZE, tag.data())) {
        OPENSSL_cleanse(out.data() + start, ciphertextLen);
        out.resize(start);
        return ErrorCode::CryptoFailure;
    }

    int ret = EVP_DecryptFinal_ex(ctx.get(), out.data() + start + plaintextLen, &len);
    if (ret <= 0) {
        // Tag mismatch: wipe what EVP_DecryptUpdate already produced
        OPENSSL_cleanse(out.data() + start, ciphertextLen);
        out.resize(start);
        ERR_clear_error();
        return ErrorCode::AuthenticationFailed;
    }

    return ErrorCode::None;
}

ErrorCode CryptoEngine::randomBytes(size_t count, std::vector<unsigned char>& out) {
    if (count > INT_MAX) return ErrorCode::InvalidArgument;
    out.resize(count);
    if (count == 0) return ErrorCode::None;
    if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        std::cerr << "[CryptoEngine] RAND_bytes failed" << std::endl;
        out.clear();
        return ErrorCode::CryptoFailure;
    }
    return ErrorCode::None;
}

ErrorCode CryptoEngine::sha256(const unsigned char* data, size_t len, std::vector<unsigned char>& outDigest) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data, len, digest, &digestLen, EVP_sha256(), NULL) != 1) {
        std::cerr << "[CryptoEngine] SHA-256 failed" << std::endl;
        return ErrorCode::CryptoFailure;
    }
    outDigest.assign(digest, digest + digestLen);
    return ErrorCode::None;
}

std::string CryptoEngine::toHex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0x0F];
    }
    return hex;
}

bool CryptoEngine::constantTimeEquals(const unsigned char* a, const unsigned char* b, size_t len) {
    return CRYPTO_memcmp(a, b, len) == 0;
}

void CryptoEngine::cleanse(std::vector<unsigned char>& buffer) {
    if (!buffer.empty()) OPENSSL_cleanse(buffer.data(), buffer.size());
    buffer.clear();
}

void CryptoEngine::cleanse(std::string& buffer) {
    if (!buffer.empty()) OPENSSL_cleanse(&buffer[0], buffer.size());
    buffer.clear();
}

} // namespace Vaultline
