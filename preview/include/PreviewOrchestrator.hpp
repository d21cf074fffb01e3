#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "VaultTypes.hpp"
#include "KeyDerivation.hpp"
#include "ChunkedCipher.hpp"
#include "ContentClassifier.hpp"
#include "EphemeralResourceStore.hpp"
#include "Collaborators.hpp"

#define VAULTLINE_DEFAULT_PREVIEW_TEXT_LIMIT (1024 * 1024)

namespace Vaultline {

struct PreviewSettings {
    size_t previewTextLimit = VAULTLINE_DEFAULT_PREVIEW_TEXT_LIMIT;
    size_t sniffWindow = VAULTLINE_DEFAULT_SNIFF_WINDOW;
};

struct PreviewRequest {
    std::string fileId;
    std::string stableUserId;
    std::string reAuthProof;
    ProgressCallback onProgress;  // body decryption, on the open() thread
};

struct PreviewPayload {
    std::string text;           // DetectedKind::Text only, bounded by previewTextLimit
    bool truncated = false;
    ResourceHandle resource;    // every other kind
    uint64_t decryptedSize = 0;
};

struct PreviewResult {
    bool ok = false;
    ErrorCode error = ErrorCode::None;
    ErrorCode cause = ErrorCode::None;  // underlying failure behind DecryptionFailed
    std::string fileId;
    DetectedKind detectedKind = DetectedKind::Binary;
    float sniffConfidence = 0.0f;
    FileMetadata metadata;              // declaredType is advisory only
    PreviewPayload payload;
};

/**
 * PreviewOrchestrator - one preview at a time for one viewer
 *
 * Idle -> Requesting -> Decrypting -> Classifying -> Rendered -> Released
 * with Errored reachable from every step.
 *
 * open() runs the whole flow on the calling thread. close() and cancel() may
 * be called from any thread: close() on a rendered preview revokes the
 * resource handle, and both abandon an in-flight request, which then drops
 * its result at the next checkpoint. Opening a new preview releases the current one first,
 * so at most one handle is ever live per orchestrator.
 *
 * Audit events are delivered under the orchestrator lock; sinks must not
 * call back into the orchestrator. The resource store is only entered with
 * that lock held, so a handle is registered only for the current request.
 */
class PreviewOrchestrator {
public:
    enum class State { Idle, Requesting, Decrypting, Classifying, Rendered, Released, Errored };

    PreviewOrchestrator(AccessGate& gate, CiphertextStore& store, EphemeralResourceStore& resources,
                        const KeyDerivation& kdf, const PreviewSettings& settings, AuditSink* audit = nullptr);
    ~PreviewOrchestrator();

    PreviewOrchestrator(const PreviewOrchestrator&) = delete;
    PreviewOrchestrator& operator=(const PreviewOrchestrator&) = delete;

    PreviewResult open(const PreviewRequest& request);
    void close();

    // Abandons an in-flight open(); a rendered preview stays up
    void cancel();

    State state() const;
    ResourceHandle liveHandle() const;

    static const char* stateName(State state);

private:
    bool isCurrent(uint64_t ticket) const;
    bool advance(uint64_t ticket, State next, const char* event, const std::string& detail);
    PreviewResult fail(uint64_t ticket, const std::string& fileId, ErrorCode error, ErrorCode cause);
    PreviewResult abandoned(const std::string& fileId) const;

    // Caller holds m_mutex
    bool inFlightLocked() const;
    void abandonLocked();
    void releaseLocked(const char* reason);
    void emitLocked(const char* type, const std::string& detail);

    static std::string truncateUtf8(const std::vector<unsigned char>& bytes, size_t limit);

    AccessGate& m_gate;
    CiphertextStore& m_store;
    EphemeralResourceStore& m_resources;
    const KeyDerivation& m_kdf;
    AuditSink* m_audit;

    ChunkedCipher m_cipher;
    ContentClassifier m_classifier;
    size_t m_previewTextLimit;

    mutable std::mutex m_mutex;
    State m_state = State::Idle;
    uint64_t m_generation = 0;
    std::string m_fileId;
    ResourceHandle m_live;
};

} // namespace Vaultline
