#include "AuditEvent.hpp"
#include "Collaborators.hpp"
#include <iostream>

using json = nlohmann::json;

namespace Vaultline {

AuditEvent AuditEvent::make(const std::string& type, const std::string& fileId, const std::string& detail) {
    AuditEvent event;
    event.type = type;
    event.fileId = fileId;
    event.detail = detail;
    time(&event.timestamp);
    return event;
}

json AuditEvent::toJson() const {
    json j;
    j["event"] = type;
    j["fileId"] = fileId;
    if (!detail.empty()) j["detail"] = detail;
    j["timestamp"] = static_cast<long>(timestamp);
    return j;
}

void ConsoleAuditSink::record(const AuditEvent& event) {
    std::cout << "[Audit] " << event.toJson().dump() << std::endl;
}

} // namespace Vaultline
