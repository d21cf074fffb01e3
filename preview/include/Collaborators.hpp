#pragma once
#include <string>
#include "VaultTypes.hpp"
#include "AuditEvent.hpp"

namespace Vaultline {

// Opaque proof that the caller re-authenticated with the primary credential.
// Valid for one operation only.
struct AccessGrant {
    std::string fileId;
    std::string token;
};

struct AccessDecision {
    bool granted = false;
    AccessGrant grant;
    std::string reason;
};

class AccessGate {
public:
    virtual ~AccessGate() = default;

    // Must reject anything but the account's primary credential
    virtual AccessDecision requestAccess(const std::string& fileId, const std::string& reAuthProof) = 0;
};

class CiphertextStore {
public:
    virtual ~CiphertextStore() = default;

    virtual bool fetchBlob(const std::string& fileId, const AccessGrant& grant, EncryptedBlob& outBlob) = 0;
    virtual bool fetchMetadata(const std::string& fileId, const AccessGrant& grant, EncryptedMetadata& outMetadata) = 0;
};

class AuditSink {
public:
    virtual ~AuditSink() = default;
    virtual void record(const AuditEvent& event) = 0;
};

// Prints one JSON line per event
class ConsoleAuditSink : public AuditSink {
public:
    void record(const AuditEvent& event) override;
};

} // namespace Vaultline
