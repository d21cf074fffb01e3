#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "ContentClassifier.hpp"

#define VAULTLINE_HANDLE_PREFIX "vaultline:blob/"

namespace Vaultline {

struct ResourceHandle {
    std::string id;
    bool valid() const { return !id.empty(); }
};

/**
 * Table of decrypted binary payloads a viewer can bind to by handle, in the
 * spirit of a browser blob URL registry. Revoking wipes the bytes. Handle
 * ids are never reused. Thread-safe.
 */
class EphemeralResourceStore {
public:
    using Reader = std::function<void(const std::vector<unsigned char>& bytes, DetectedKind kind)>;

    EphemeralResourceStore() = default;
    ~EphemeralResourceStore();

    EphemeralResourceStore(const EphemeralResourceStore&) = delete;
    EphemeralResourceStore& operator=(const EphemeralResourceStore&) = delete;

    // Takes ownership of bytes
    ResourceHandle create(std::vector<unsigned char>&& bytes, DetectedKind kind);
    ResourceHandle create(ClassifiedContent&& content);

    // Calls reader under the store lock. False if the handle is not live.
    bool read(const ResourceHandle& handle, const Reader& reader) const;

    size_t size(const ResourceHandle& handle) const;
    bool isLive(const ResourceHandle& handle) const;

    // ResourceReleaseFailure when the handle is unknown or already revoked
    ErrorCode revoke(const ResourceHandle& handle);

    size_t liveCount() const;

private:
    struct Entry {
        std::vector<unsigned char> bytes;
        DetectedKind kind;
    };

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    uint64_t m_nextId = 1;
};

} // namespace Vaultline
