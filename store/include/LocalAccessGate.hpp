#pragma once
#include <string>
#include <vector>
#include "Collaborators.hpp"

namespace Vaultline {

/**
 * Single-user access gate for the command line tools. The primary
 * credential is only known by its SHA-256 digest (hex). Every request is
 * checked on its own and yields a fresh one-shot grant token.
 */
class LocalAccessGate : public AccessGate {
public:
    explicit LocalAccessGate(const std::string& credentialSha256Hex);

    AccessDecision requestAccess(const std::string& fileId, const std::string& reAuthProof) override;

    bool isConfigured() const { return m_digest.size() == 32; }

private:
    std::vector<unsigned char> m_digest;
};

} // namespace Vaultline
