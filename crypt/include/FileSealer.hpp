#pragma once
#include <string>
#include <vector>
#include "VaultTypes.hpp"
#include "KeyDerivation.hpp"
#include "ChunkedCipher.hpp"

#define VAULTLINE_MAX_UPLOAD_BYTES (100ULL * 1024 * 1024)
#define VAULTLINE_MAX_NAME_LENGTH 255

namespace Vaultline {

struct UploadPolicy {
    uint64_t maxUploadBytes = VAULTLINE_MAX_UPLOAD_BYTES;
    size_t maxNameLength = VAULTLINE_MAX_NAME_LENGTH;

    ErrorCode validate(const std::string& name, uint64_t size) const;
};

struct SealedFile {
    EncryptedBlob blob;
    EncryptedMetadata metadata;
    uint64_t originalSize = 0;
};

struct UnsealedFile {
    FileMetadata metadata;
    std::vector<unsigned char> body;
};

/**
 * Upload path: validates, derives the key, seals name, declared type and body.
 * The key only lives for the duration of one call.
 */
class FileSealer {
public:
    FileSealer(const KeyDerivation& kdf, uint32_t chunkSize, const UploadPolicy& policy);

    ErrorCode seal(const std::string& stableUserId, const FileMetadata& metadata,
                   const std::vector<unsigned char>& body, SealedFile& outFile,
                   const ProgressCallback& progress = nullptr) const;

    ErrorCode unseal(const std::string& stableUserId, const SealedFile& file, UnsealedFile& outFile,
                     const ProgressCallback& progress = nullptr) const;

private:
    const KeyDerivation& m_kdf;
    ChunkedCipher m_cipher;
    UploadPolicy m_policy;
};

} // namespace Vaultline
