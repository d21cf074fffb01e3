#include "KeyDerivation.hpp"
#include "CryptoEngine.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <iostream>

namespace Vaultline {

bool KeyDerivation::isWellFormedIdentifier(const std::string& stableUserId) {
    if (stableUserId.empty() || stableUserId.size() > VAULTLINE_MAX_IDENTIFIER_LENGTH) return false;
    for (unsigned char c : stableUserId) {
        if (c <= 0x20 || c == 0x7F) return false;
    }
    return true;
}

ErrorCode KeyDerivation::deriveContentKey(const std::string& stableUserId, ContentKey& outKey) const {
    outKey.clear();

    if (!isWellFormedIdentifier(stableUserId)) {
        std::cerr << "[KeyDerivation] Rejected malformed identifier" << std::endl;
        return ErrorCode::InvalidKeyMaterial;
    }

    // Obfuscated Salt: "vault-salt" (10 bytes, no terminator)
    // XOR Key: 0x55
    // Rebuilt at runtime so it does not show up in 'strings'
    const unsigned char xorKey = 0x55;
    const unsigned char obfuscated[] = {
        0x76^0x55, 0x61^0x55, 0x75^0x55, 0x6C^0x55, 0x74^0x55, // vault
        0x2D^0x55, // -
        0x73^0x55, 0x61^0x55, 0x6C^0x55, 0x74^0x55 // salt
    };

    unsigned char salt[sizeof(obfuscated)];
    for (size_t i = 0; i < sizeof(obfuscated); i++) {
        salt[i] = obfuscated[i] ^ xorKey;
    }

    std::string password = stableUserId;
    if (password.size() < 32) password.append(32 - password.size(), '0');

    int ok = PKCS5_PBKDF2_HMAC(password.c_str(), static_cast<int>(password.length()),
                               salt, sizeof(salt), VAULTLINE_KDF_ITERATIONS, EVP_sha256(),
                               VAULTLINE_KEY_SIZE, outKey.data());

    CryptoEngine::cleanse(password);
    OPENSSL_cleanse(salt, sizeof(salt));

    if (ok != 1) {
        std::cerr << "[KeyDerivation] Error in key derivation" << std::endl;
        outKey.clear();
        return ErrorCode::CryptoFailure;
    }

    outKey.markSet();
    return ErrorCode::None;
}

std::string KeyDerivation::fingerprint(const ContentKey& key) {
    std::vector<unsigned char> digest;
    if (!key.isSet() || CryptoEngine::sha256(key.data(), key.size(), digest) != ErrorCode::None) return "";
    return CryptoEngine::toHex(digest.data(), 8);
}

} // namespace Vaultline
