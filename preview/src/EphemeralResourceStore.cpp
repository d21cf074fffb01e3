#include "EphemeralResourceStore.hpp"
#include "CryptoEngine.hpp"
#include <iostream>

namespace Vaultline {

EphemeralResourceStore::~EphemeralResourceStore() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_entries.empty()) {
        std::cerr << "[EphemeralResourceStore] Warning: " << m_entries.size()
                  << " resource(s) still live at shutdown, wiping" << std::endl;
    }
    for (auto& kv : m_entries) {
        CryptoEngine::cleanse(kv.second.bytes);
    }
    m_entries.clear();
}

ResourceHandle EphemeralResourceStore::create(std::vector<unsigned char>&& bytes, DetectedKind kind) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ResourceHandle handle{VAULTLINE_HANDLE_PREFIX + std::to_string(m_nextId++)};
    Entry entry;
    entry.bytes = std::move(bytes);
    entry.kind = kind;
    m_entries.emplace(handle.id, std::move(entry));
    return handle;
}

ResourceHandle EphemeralResourceStore::create(ClassifiedContent&& content) {
    return create(std::move(content.rawBytes), content.detectedKind);
}

bool EphemeralResourceStore::read(const ResourceHandle& handle, const Reader& reader) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(handle.id);
    if (it == m_entries.end()) return false;
    if (reader) reader(it->second.bytes, it->second.kind);
    return true;
}

size_t EphemeralResourceStore::size(const ResourceHandle& handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(handle.id);
    return it == m_entries.end() ? 0 : it->second.bytes.size();
}

bool EphemeralResourceStore::isLive(const ResourceHandle& handle) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(handle.id) > 0;
}

ErrorCode EphemeralResourceStore::revoke(const ResourceHandle& handle) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(handle.id);
    if (it == m_entries.end()) {
        std::cerr << "[EphemeralResourceStore] Revoke of unknown handle " << handle.id << std::endl;
        return ErrorCode::ResourceReleaseFailure;
    }
    CryptoEngine::cleanse(it->second.bytes);
    m_entries.erase(it);
    return ErrorCode::None;
}

size_t EphemeralResourceStore::liveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

} // namespace Vaultline
