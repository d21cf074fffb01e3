#include "LocalAccessGate.hpp"
#include "CryptoEngine.hpp"
#include <iostream>

namespace Vaultline {

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

LocalAccessGate::LocalAccessGate(const std::string& credentialSha256Hex) {
    if (credentialSha256Hex.size() != 64) return;

    std::vector<unsigned char> digest;
    for (size_t i = 0; i < credentialSha256Hex.size(); i += 2) {
        int hi = hexValue(credentialSha256Hex[i]);
        int lo = hexValue(credentialSha256Hex[i + 1]);
        if (hi < 0 || lo < 0) return;
        digest.push_back(static_cast<unsigned char>((hi << 4) | lo));
    }
    m_digest = std::move(digest);
}

AccessDecision LocalAccessGate::requestAccess(const std::string& fileId, const std::string& reAuthProof) {
    AccessDecision decision;

    if (!isConfigured()) {
        decision.reason = "No primary credential configured";
        return decision;
    }
    if (reAuthProof.empty()) {
        decision.reason = "Re-authentication required";
        return decision;
    }

    std::vector<unsigned char> proofDigest;
    if (CryptoEngine::sha256(reinterpret_cast<const unsigned char*>(reAuthProof.data()), reAuthProof.size(),
                             proofDigest) != ErrorCode::None) {
        decision.reason = "Could not verify credential";
        return decision;
    }

    if (proofDigest.size() != m_digest.size() ||
        !CryptoEngine::constantTimeEquals(proofDigest.data(), m_digest.data(), m_digest.size())) {
        decision.reason = "Credential rejected";
        return decision;
    }

    std::vector<unsigned char> nonce;
    if (CryptoEngine::randomBytes(16, nonce) != ErrorCode::None) {
        decision.reason = "Could not issue grant";
        return decision;
    }

    decision.granted = true;
    decision.grant.fileId = fileId;
    decision.grant.token = CryptoEngine::toHex(nonce.data(), nonce.size());
    CryptoEngine::cleanse(nonce);
    return decision;
}

} // namespace Vaultline
