#pragma once
#include <vector>
#include <string>
#include <memory>
#include <openssl/evp.h>
#include "VaultTypes.hpp"

namespace Vaultline {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

/**
 * Single-shot AES-256-GCM. Output of seal() is ciphertext followed by the
 * 16 byte tag, appended to the caller's buffer.
 */
class CryptoEngine {
public:
    static ErrorCode seal(const ContentKey& key, const unsigned char* iv,
                          const unsigned char* aad, size_t aadLen,
                          const unsigned char* plaintext, size_t plaintextLen,
                          std::vector<unsigned char>& out);

    // On failure nothing is left appended to out
    static ErrorCode open(const ContentKey& key, const unsigned char* iv,
                          const unsigned char* aad, size_t aadLen,
                          const unsigned char* sealed, size_t sealedLen,
                          std::vector<unsigned char>& out);

    static ErrorCode randomBytes(size_t count, std::vector<unsigned char>& out);

    static ErrorCode sha256(const unsigned char* data, size_t len, std::vector<unsigned char>& outDigest);
    static std::string toHex(const unsigned char* data, size_t len);

    // Compares two equal length buffers without early exit
    static bool constantTimeEquals(const unsigned char* a, const unsigned char* b, size_t len);

    static void cleanse(std::vector<unsigned char>& buffer);
    static void cleanse(std::string& buffer);

private:
    static CipherCtxPtr newContext();
};

} // namespace Vaultline
