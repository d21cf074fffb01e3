#include "FileSealer.hpp"
#include "MetadataCodec.hpp"
#include "CryptoEngine.hpp"
#include <iostream>

namespace Vaultline {

ErrorCode UploadPolicy::validate(const std::string& name, uint64_t size) const {
    if (size > maxUploadBytes) {
        std::cerr << "[UploadPolicy] File size " << size << " exceeds maximum of "
                  << maxUploadBytes / (1024 * 1024) << "MB" << std::endl;
        return ErrorCode::UploadRejected;
    }
    if (name.length() > maxNameLength) {
        std::cerr << "[UploadPolicy] Filename is too long (" << name.length() << " bytes)" << std::endl;
        return ErrorCode::UploadRejected;
    }
    return ErrorCode::None;
}

FileSealer::FileSealer(const KeyDerivation& kdf, uint32_t chunkSize, const UploadPolicy& policy)
    : m_kdf(kdf), m_cipher(chunkSize), m_policy(policy) {}

ErrorCode FileSealer::seal(const std::string& stableUserId, const FileMetadata& metadata,
                           const std::vector<unsigned char>& body, SealedFile& outFile,
                           const ProgressCallback& progress) const {
    ErrorCode err = m_policy.validate(metadata.name, body.size());
    if (err != ErrorCode::None) return err;

    ContentKey key;
    err = m_kdf.deriveContentKey(stableUserId, key);
    if (err != ErrorCode::None) return err;

    SealedFile sealed;
    err = MetadataCodec::encryptMetadata(key, metadata, sealed.metadata);
    if (err != ErrorCode::None) return err;

    err = m_cipher.encryptStream(key, body, sealed.blob, progress);
    if (err != ErrorCode::None) return err;

    sealed.originalSize = body.size();
    std::cout << "[FileSealer] Sealed " << body.size() << " bytes in "
              << (sealed.blob.ciphertext.size() + VAULTLINE_IV_SIZE) << " byte blob" << std::endl;

    outFile = std::move(sealed);
    return ErrorCode::None;
}

ErrorCode FileSealer::unseal(const std::string& stableUserId, const SealedFile& file, UnsealedFile& outFile,
                             const ProgressCallback& progress) const {
    ContentKey key;
    ErrorCode err = m_kdf.deriveContentKey(stableUserId, key);
    if (err != ErrorCode::None) return err;

    UnsealedFile plain;
    err = MetadataCodec::decryptMetadata(key, file.metadata, plain.metadata);
    if (err != ErrorCode::None) return err;

    err = m_cipher.decryptStream(key, file.blob, plain.body, progress);
    if (err != ErrorCode::None) return err;

    if (plain.body.size() != file.originalSize) {
        std::cerr << "[FileSealer] Warning: body is " << plain.body.size()
                  << " bytes, metadata says " << file.originalSize << std::endl;
    }

    outFile = std::move(plain);
    return ErrorCode::None;
}

} // namespace Vaultline
