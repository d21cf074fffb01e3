#include "PreviewOrchestrator.hpp"
#include "CryptoEngine.hpp"
#include "MetadataCodec.hpp"
#include <cstdio>
#include <iostream>
#include <utility>

namespace Vaultline {

PreviewOrchestrator::PreviewOrchestrator(AccessGate& gate, CiphertextStore& store, EphemeralResourceStore& resources,
                                         const KeyDerivation& kdf, const PreviewSettings& settings, AuditSink* audit)
    : m_gate(gate),
      m_store(store),
      m_resources(resources),
      m_kdf(kdf),
      m_audit(audit),
      m_classifier(settings.sniffWindow),
      m_previewTextLimit(settings.previewTextLimit) {}

PreviewOrchestrator::~PreviewOrchestrator() {
    close();
}

const char* PreviewOrchestrator::stateName(State state) {
    switch (state) {
        case State::Idle: return "Idle";
        case State::Requesting: return "Requesting";
        case State::Decrypting: return "Decrypting";
        case State::Classifying: return "Classifying";
        case State::Rendered: return "Rendered";
        case State::Released: return "Released";
        case State::Errored: return "Errored";
    }
    return "Unknown";
}

PreviewOrchestrator::State PreviewOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

ResourceHandle PreviewOrchestrator::liveHandle() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_live;
}

void PreviewOrchestrator::emitLocked(const char* type, const std::string& detail) {
    if (m_audit) m_audit->record(AuditEvent::make(type, m_fileId, detail));
}

void PreviewOrchestrator::releaseLocked(const char* reason) {
    if (m_live.valid()) {
        ErrorCode err = m_resources.revoke(m_live);
        if (err != ErrorCode::None) {
            // Non-fatal, the handle is forgotten either way
            std::cerr << "[PreviewOrchestrator] " << errorCodeName(err) << " for " << m_live.id << std::endl;
        }
        m_live = ResourceHandle{};
    }
    m_state = State::Released;
    emitLocked("released", reason);
}

bool PreviewOrchestrator::inFlightLocked() const {
    return m_state == State::Requesting || m_state == State::Decrypting || m_state == State::Classifying;
}

void PreviewOrchestrator::abandonLocked() {
    // The in-flight open() sees a stale ticket and drops its result
    m_generation++;
    releaseLocked("cancelled");
}

void PreviewOrchestrator::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state == State::Rendered) {
        releaseLocked("closed");
    } else if (inFlightLocked()) {
        abandonLocked();
    }
}

void PreviewOrchestrator::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (inFlightLocked()) abandonLocked();
}

bool PreviewOrchestrator::isCurrent(uint64_t ticket) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return ticket == m_generation;
}

bool PreviewOrchestrator::advance(uint64_t ticket, State next, const char* event, const std::string& detail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (ticket != m_generation) return false;
    m_state = next;
    if (event) emitLocked(event, detail);
    return true;
}

PreviewResult PreviewOrchestrator::abandoned(const std::string& fileId) const {
    PreviewResult result;
    result.fileId = fileId;
    result.error = ErrorCode::Cancelled;
    return result;
}

PreviewResult PreviewOrchestrator::fail(uint64_t ticket, const std::string& fileId, ErrorCode error, ErrorCode cause) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (ticket != m_generation) return abandoned(fileId);

    m_state = State::Errored;
    emitLocked((std::string("errored:") + errorCodeName(error)).c_str(),
               cause != error ? errorCodeName(cause) : "");

    std::cerr << "[PreviewOrchestrator] Preview of " << fileId << " failed: " << errorCodeName(error);
    if (cause != error) std::cerr << " (" << errorCodeName(cause) << ")";
    std::cerr << std::endl;

    PreviewResult result;
    result.fileId = fileId;
    result.error = error;
    result.cause = cause;
    return result;
}

std::string PreviewOrchestrator::truncateUtf8(const std::vector<unsigned char>& bytes, size_t limit) {
    if (bytes.size() <= limit) return std::string(bytes.begin(), bytes.end());

    // Do not split a multi-byte sequence
    size_t cut = limit;
    while (cut > 0 && (bytes[cut] & 0xC0) == 0x80) cut--;
    return std::string(bytes.begin(), bytes.begin() + cut);
}

PreviewResult PreviewOrchestrator::open(const PreviewRequest& request) {
    const std::string& fileId = request.fileId;
    uint64_t ticket;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // A rendered or still running preview gives way to the new request
        if (m_state == State::Rendered || inFlightLocked()) {
            releaseLocked("superseded");
        }
        ticket = ++m_generation;
        m_fileId = fileId;
        m_state = State::Requesting;
        emitLocked("requested", "");
    }

    // ===== Requesting =====
    AccessDecision decision = m_gate.requestAccess(fileId, request.reAuthProof);
    if (!isCurrent(ticket)) {
        CryptoEngine::cleanse(decision.grant.token);
        return abandoned(fileId);
    }
    if (!decision.granted) {
        if (!decision.reason.empty()) {
            std::cerr << "[PreviewOrchestrator] Access gate: " << decision.reason << std::endl;
        }
        return fail(ticket, fileId, ErrorCode::AccessDenied, ErrorCode::AccessDenied);
    }

    EncryptedMetadata sealedMetadata;
    EncryptedBlob blob;
    bool fetched = m_store.fetchMetadata(fileId, decision.grant, sealedMetadata);
    if (fetched && isCurrent(ticket)) {
        fetched = m_store.fetchBlob(fileId, decision.grant, blob);
    }

    // Grants are single use
    CryptoEngine::cleanse(decision.grant.token);

    if (!isCurrent(ticket)) return abandoned(fileId);
    if (!fetched) return fail(ticket, fileId, ErrorCode::FetchFailed, ErrorCode::FetchFailed);

    // ===== Decrypting =====
    if (!advance(ticket, State::Decrypting, nullptr, "")) return abandoned(fileId);

    ContentKey key;
    ErrorCode err = m_kdf.deriveContentKey(request.stableUserId, key);
    if (err != ErrorCode::None) return fail(ticket, fileId, err, err);

    FileMetadata metadata;
    err = MetadataCodec::decryptMetadata(key, sealedMetadata, metadata);
    if (err != ErrorCode::None) return fail(ticket, fileId, ErrorCode::DecryptionFailed, err);

    std::vector<unsigned char> plaintext;
    err = m_cipher.decryptStream(key, blob, plaintext, request.onProgress);
    key.clear();
    if (err != ErrorCode::None) return fail(ticket, fileId, ErrorCode::DecryptionFailed, err);

    // ===== Classifying =====
    if (!advance(ticket, State::Classifying, "decrypted", std::to_string(plaintext.size()) + " bytes")) {
        CryptoEngine::cleanse(plaintext);
        return abandoned(fileId);
    }

    ClassifiedContent content = m_classifier.adopt(std::move(plaintext));
    if (content.signature.empty()) {
        std::cerr << "[PreviewOrchestrator] No signature matched for " << fileId
                  << ", offering generic binary view" << std::endl;
    }

    PreviewResult result;
    result.fileId = fileId;
    result.detectedKind = content.detectedKind;
    result.sniffConfidence = content.sniffConfidence;
    result.metadata = std::move(metadata);
    result.payload.decryptedSize = content.rawBytes.size();

    if (content.detectedKind == DetectedKind::Text) {
        result.payload.text = truncateUtf8(content.rawBytes, m_previewTextLimit);
        result.payload.truncated = content.rawBytes.size() > m_previewTextLimit;
        CryptoEngine::cleanse(content.rawBytes);
    }

    // ===== Rendered =====
    std::lock_guard<std::mutex> lock(m_mutex);
    if (ticket != m_generation) {
        // Abandoned while classifying: nothing of this request may survive
        CryptoEngine::cleanse(content.rawBytes);
        CryptoEngine::cleanse(result.payload.text);
        return abandoned(fileId);
    }

    const std::string signature = content.signature.empty() ? "none" : content.signature;

    // Created under the lock so a newer preview can never overlap this handle
    if (content.detectedKind != DetectedKind::Text) {
        result.payload.resource = m_resources.create(std::move(content));
    }
    result.ok = true;
    m_state = State::Rendered;
    m_live = result.payload.resource;

    char confidence[16];
    std::snprintf(confidence, sizeof(confidence), "%.2f", result.sniffConfidence);
    emitLocked("classified", std::string(kindName(result.detectedKind)) + " signature=" +
               signature + " confidence=" + confidence);
    return result;
}

} // namespace Vaultline
