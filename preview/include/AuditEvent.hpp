#pragma once
#include <ctime>
#include <string>
#include <nlohmann/json.hpp>

namespace Vaultline {

// Transition record for the external audit log. Never carries key
// material, plaintext, ciphertext or grant tokens.
struct AuditEvent {
    std::string type;     // requested, decrypted, classified, errored:<reason>, released
    std::string fileId;
    std::string detail;
    time_t timestamp = 0;

    static AuditEvent make(const std::string& type, const std::string& fileId, const std::string& detail = "");

    nlohmann::json toJson() const;
};

} // namespace Vaultline
