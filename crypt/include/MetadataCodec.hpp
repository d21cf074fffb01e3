#pragma once
#include <string>
#include "VaultTypes.hpp"

namespace Vaultline {

// Seals the original file name and declared MIME type. Each field gets its
// own nonce, independent from the body.
class MetadataCodec {
public:
    static ErrorCode encryptMetadata(const ContentKey& key, const FileMetadata& metadata, EncryptedMetadata& outMetadata);
    static ErrorCode decryptMetadata(const ContentKey& key, const EncryptedMetadata& metadata, FileMetadata& outMetadata);

    static ErrorCode encryptField(const ContentKey& key, const std::string& value, SealedField& outField);
    static ErrorCode decryptField(const ContentKey& key, const SealedField& field, std::string& outValue);
};

} // namespace Vaultline
