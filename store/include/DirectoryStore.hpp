#pragma once
#include <string>
#include "VaultTypes.hpp"
#include "FileSealer.hpp"
#include "Collaborators.hpp"

namespace Vaultline {

/**
 * DirectoryStore - ciphertext on local disk
 *
 * <root>/<fileId>.blob       iv || ct+tag per chunk
 * <root>/<fileId>.meta.json  {"encryptedName", "encryptedMimeType",
 *                             "originalSize", "encryptedSize", "chunkSize"}
 *
 * The store only ever sees ciphertext. Fetches require a grant issued for
 * the same file id.
 */
class DirectoryStore : public CiphertextStore {
public:
    explicit DirectoryStore(const std::string& root);

    bool write(const std::string& fileId, const SealedFile& file);
    bool remove(const std::string& fileId);
    bool contains(const std::string& fileId) const;

    bool fetchBlob(const std::string& fileId, const AccessGrant& grant, EncryptedBlob& outBlob) override;
    bool fetchMetadata(const std::string& fileId, const AccessGrant& grant, EncryptedMetadata& outMetadata) override;

    const std::string& root() const { return m_root; }

    // Letters, digits, '-', '_' and '.', no leading dot, at most 128 chars
    static bool isValidFileId(const std::string& fileId);

private:
    struct Sidecar {
        EncryptedMetadata metadata;
        uint64_t originalSize = 0;
        uint64_t encryptedSize = 0;
        uint32_t chunkSize = 0;
    };

    bool readSidecar(const std::string& fileId, Sidecar& outSidecar) const;
    bool checkGrant(const std::string& fileId, const AccessGrant& grant) const;

    std::string blobPath(const std::string& fileId) const;
    std::string metaPath(const std::string& fileId) const;

    std::string m_root;
};

} // namespace Vaultline
