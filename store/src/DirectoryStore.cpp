#include "DirectoryStore.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace Vaultline {

DirectoryStore::DirectoryStore(const std::string& root) : m_root(root) {}

bool DirectoryStore::isValidFileId(const std::string& fileId) {
    if (fileId.empty() || fileId.size() > 128 || fileId[0] == '.') return false;
    for (char c : fileId) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '-' || c == '_' || c == '.';
        if (!ok) return false;
    }
    return true;
}

std::string DirectoryStore::blobPath(const std::string& fileId) const {
    return (fs::path(m_root) / (fileId + ".blob")).string();
}

std::string DirectoryStore::metaPath(const std::string& fileId) const {
    return (fs::path(m_root) / (fileId + ".meta.json")).string();
}

bool DirectoryStore::contains(const std::string& fileId) const {
    if (!isValidFileId(fileId)) return false;
    std::error_code ec;
    return fs::is_regular_file(blobPath(fileId), ec) && fs::is_regular_file(metaPath(fileId), ec);
}

bool DirectoryStore::write(const std::string& fileId, const SealedFile& file) {
    if (!isValidFileId(fileId)) {
        std::cerr << "[DirectoryStore] Rejected file id: " << fileId << std::endl;
        return false;
    }

    std::error_code ec;
    fs::create_directories(m_root, ec);
    if (ec) {
        std::cerr << "[DirectoryStore] Could not create " << m_root << ": " << ec.message() << std::endl;
        return false;
    }

    std::vector<unsigned char> wire = file.blob.serialize();

    std::ofstream blobOut(blobPath(fileId), std::ios::binary | std::ios::trunc);
    if (!blobOut) {
        std::cerr << "[DirectoryStore] Could not open " << blobPath(fileId) << std::endl;
        return false;
    }
    blobOut.write(reinterpret_cast<const char*>(wire.data()), static_cast<std::streamsize>(wire.size()));
    blobOut.close();
    if (!blobOut) {
        std::cerr << "[DirectoryStore] Write failed for " << blobPath(fileId) << std::endl;
        return false;
    }

    json j;
    j["encryptedName"] = file.metadata.name.toToken();
    j["encryptedMimeType"] = file.metadata.declaredType.toToken();
    j["originalSize"] = file.originalSize;
    j["encryptedSize"] = static_cast<uint64_t>(wire.size());
    j["chunkSize"] = file.blob.chunkSize;

    std::ofstream metaOut(metaPath(fileId), std::ios::trunc);
    if (!metaOut) {
        std::cerr << "[DirectoryStore] Could not open " << metaPath(fileId) << std::endl;
        return false;
    }
    metaOut << j.dump(2) << std::endl;
    metaOut.close();
    if (!metaOut) {
        std::cerr << "[DirectoryStore] Write failed for " << metaPath(fileId) << std::endl;
        return false;
    }

    std::cout << "[DirectoryStore] Stored " << fileId << " (" << wire.size() << " bytes)" << std::endl;
    return true;
}

bool DirectoryStore::remove(const std::string& fileId) {
    if (!isValidFileId(fileId)) return false;
    std::error_code ec;
    bool removedBlob = fs::remove(blobPath(fileId), ec);
    bool removedMeta = fs::remove(metaPath(fileId), ec);
    return removedBlob || removedMeta;
}

bool DirectoryStore::checkGrant(const std::string& fileId, const AccessGrant& grant) const {
    if (!isValidFileId(fileId)) {
        std::cerr << "[DirectoryStore] Rejected file id: " << fileId << std::endl;
        return false;
    }
    if (grant.fileId != fileId || grant.token.empty()) {
        std::cerr << "[DirectoryStore] Grant does not cover " << fileId << std::endl;
        return false;
    }
    return true;
}

bool DirectoryStore::readSidecar(const std::string& fileId, Sidecar& outSidecar) const {
    try {
        std::ifstream f(metaPath(fileId));
        if (!f.is_open()) {
            std::cerr << "[DirectoryStore] No metadata for " << fileId << std::endl;
            return false;
        }

        json j;
        f >> j;

        Sidecar sidecar;
        if (SealedField::fromToken(j.at("encryptedName").get<std::string>(), sidecar.metadata.name) != ErrorCode::None ||
            SealedField::fromToken(j.at("encryptedMimeType").get<std::string>(), sidecar.metadata.declaredType) != ErrorCode::None) {
            std::cerr << "[DirectoryStore] Malformed metadata tokens for " << fileId << std::endl;
            return false;
        }
        sidecar.originalSize = j.at("originalSize").get<uint64_t>();
        sidecar.encryptedSize = j.at("encryptedSize").get<uint64_t>();
        sidecar.chunkSize = j.value("chunkSize", static_cast<uint32_t>(VAULTLINE_DEFAULT_CHUNK_SIZE));

        outSidecar = std::move(sidecar);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DirectoryStore] Failed to read metadata for " << fileId << ": " << e.what() << std::endl;
        return false;
    }
}

bool DirectoryStore::fetchMetadata(const std::string& fileId, const AccessGrant& grant, EncryptedMetadata& outMetadata) {
    if (!checkGrant(fileId, grant)) return false;

    Sidecar sidecar;
    if (!readSidecar(fileId, sidecar)) return false;

    outMetadata = std::move(sidecar.metadata);
    return true;
}

bool DirectoryStore::fetchBlob(const std::string& fileId, const AccessGrant& grant, EncryptedBlob& outBlob) {
    if (!checkGrant(fileId, grant)) return false;

    Sidecar sidecar;
    if (!readSidecar(fileId, sidecar)) return false;

    std::ifstream in(blobPath(fileId), std::ios::binary);
    if (!in) {
        std::cerr << "[DirectoryStore] Could not open " << blobPath(fileId) << std::endl;
        return false;
    }
    std::vector<unsigned char> wire((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    if (wire.size() != sidecar.encryptedSize) {
        // Left to the cipher to reject, truncation is reported as such
        std::cerr << "[DirectoryStore] Blob for " << fileId << " is " << wire.size()
                  << " bytes, metadata says " << sidecar.encryptedSize << std::endl;
    }

    ErrorCode err = EncryptedBlob::parse(wire, sidecar.chunkSize, outBlob);
    if (err != ErrorCode::None) {
        std::cerr << "[DirectoryStore] Unreadable blob for " << fileId << ": " << errorCodeName(err) << std::endl;
        return false;
    }
    return true;
}

} // namespace Vaultline
