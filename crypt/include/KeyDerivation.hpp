#pragma once
#include <string>
#include "VaultTypes.hpp"

#define VAULTLINE_KDF_ITERATIONS 100000
#define VAULTLINE_MAX_IDENTIFIER_LENGTH 128

namespace Vaultline {

/**
 * Derives the account content key from the stable user identifier.
 *
 * PBKDF2-HMAC-SHA256, fixed application salt, 100k iterations, 32 byte output.
 * The identifier is right-padded with '0' to 32 characters before use so
 * keys match the ones the web client derived.
 *
 * NOTE: no user-held secret goes into the derivation. Anyone who knows the
 * identifier can rebuild the key. Changing this changes which data can be
 * recovered, so it stays as-is until the key model is redesigned.
 */
class KeyDerivation {
public:
    KeyDerivation() = default;

    ErrorCode deriveContentKey(const std::string& stableUserId, ContentKey& outKey) const;

    static bool isWellFormedIdentifier(const std::string& stableUserId);

    // First 8 bytes of SHA-256(key) as hex, safe to print
    static std::string fingerprint(const ContentKey& key);
};

} // namespace Vaultline
