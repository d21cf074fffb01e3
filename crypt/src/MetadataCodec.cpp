#include "MetadataCodec.hpp"
#include "CryptoEngine.hpp"
#include <iostream>

namespace Vaultline {

ErrorCode MetadataCodec::encryptField(const ContentKey& key, const std::string& value, SealedField& outField) {
    std::vector<unsigned char> iv;
    ErrorCode err = CryptoEngine::randomBytes(VAULTLINE_IV_SIZE, iv);
    if (err != ErrorCode::None) return err;

    std::vector<unsigned char> sealed;
    err = CryptoEngine::seal(key, iv.data(), nullptr, 0,
                             reinterpret_cast<const unsigned char*>(value.data()), value.size(), sealed);
    if (err != ErrorCode::None) return err;

    outField.iv = std::move(iv);
    outField.ciphertext = std::move(sealed);
    return ErrorCode::None;
}

ErrorCode MetadataCodec::decryptField(const ContentKey& key, const SealedField& field, std::string& outValue) {
    if (field.iv.size() != VAULTLINE_IV_SIZE || field.ciphertext.size() < VAULTLINE_TAG_SIZE) {
        return ErrorCode::TruncatedInput;
    }

    std::vector<unsigned char> plain;
    ErrorCode err = CryptoEngine::open(key, field.iv.data(), nullptr, 0,
                                       field.ciphertext.data(), field.ciphertext.size(), plain);
    if (err != ErrorCode::None) return err;

    outValue.assign(plain.begin(), plain.end());
    CryptoEngine::cleanse(plain);
    return ErrorCode::None;
}

ErrorCode MetadataCodec::encryptMetadata(const ContentKey& key, const FileMetadata& metadata, EncryptedMetadata& outMetadata) {
    EncryptedMetadata sealed;

    ErrorCode err = encryptField(key, metadata.name, sealed.name);
    if (err != ErrorCode::None) {
        std::cerr << "[MetadataCodec] Failed to seal name: " << errorCodeName(err) << std::endl;
        return err;
    }

    err = encryptField(key, metadata.declaredType, sealed.declaredType);
    if (err != ErrorCode::None) {
        std::cerr << "[MetadataCodec] Failed to seal declared type: " << errorCodeName(err) << std::endl;
        return err;
    }

    outMetadata = std::move(sealed);
    return ErrorCode::None;
}

ErrorCode MetadataCodec::decryptMetadata(const ContentKey& key, const EncryptedMetadata& metadata, FileMetadata& outMetadata) {
    FileMetadata plain;

    ErrorCode err = decryptField(key, metadata.name, plain.name);
    if (err != ErrorCode::None) return err;

    err = decryptField(key, metadata.declaredType, plain.declaredType);
    if (err != ErrorCode::None) return err;

    outMetadata = std::move(plain);
    return ErrorCode::None;
}

} // namespace Vaultline
