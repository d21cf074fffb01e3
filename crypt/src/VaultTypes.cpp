#include "VaultTypes.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>

namespace Vaultline {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidKeyMaterial: return "InvalidKeyMaterial";
        case ErrorCode::AccessDenied: return "AccessDenied";
        case ErrorCode::TruncatedInput: return "TruncatedInput";
        case ErrorCode::AuthenticationFailed: return "AuthenticationFailed";
        case ErrorCode::DecryptionFailed: return "DecryptionFailed";
        case ErrorCode::UnclassifiableContent: return "UnclassifiableContent";
        case ErrorCode::ResourceReleaseFailure: return "ResourceReleaseFailure";
        case ErrorCode::FetchFailed: return "FetchFailed";
        case ErrorCode::UploadRejected: return "UploadRejected";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::CryptoFailure: return "CryptoFailure";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

// ========== ContentKey ==========

ContentKey::ContentKey() {
    m_bytes.fill(0);
}

ContentKey::ContentKey(const ContentKey& other) : m_bytes(other.m_bytes), m_set(other.m_set) {}

ContentKey& ContentKey::operator=(const ContentKey& other) {
    if (this != &other) {
        m_bytes = other.m_bytes;
        m_set = other.m_set;
    }
    return *this;
}

ContentKey::~ContentKey() {
    clear();
}

void ContentKey::clear() {
    OPENSSL_cleanse(m_bytes.data(), m_bytes.size());
    m_set = false;
}

bool ContentKey::operator==(const ContentKey& other) const {
    if (m_set != other.m_set) return false;
    return CRYPTO_memcmp(m_bytes.data(), other.m_bytes.data(), m_bytes.size()) == 0;
}

// ========== EncryptedBlob ==========

std::vector<unsigned char> EncryptedBlob::serialize() const {
    std::vector<unsigned char> wire;
    wire.reserve(iv.size() + ciphertext.size());
    wire.insert(wire.end(), iv.begin(), iv.end());
    wire.insert(wire.end(), ciphertext.begin(), ciphertext.end());
    return wire;
}

ErrorCode EncryptedBlob::parse(const std::vector<unsigned char>& wire, uint32_t chunkSize, EncryptedBlob& outBlob) {
    if (chunkSize == 0) return ErrorCode::InvalidArgument;
    if (wire.size() < VAULTLINE_IV_SIZE + VAULTLINE_TAG_SIZE) return ErrorCode::TruncatedInput;

    outBlob.iv.assign(wire.begin(), wire.begin() + VAULTLINE_IV_SIZE);
    outBlob.ciphertext.assign(wire.begin() + VAULTLINE_IV_SIZE, wire.end());
    outBlob.chunkSize = chunkSize;
    return ErrorCode::None;
}

// ========== SealedField ==========

std::string SealedField::toToken() const {
    std::vector<unsigned char> combined;
    combined.reserve(iv.size() + ciphertext.size());
    combined.insert(combined.end(), iv.begin(), iv.end());
    combined.insert(combined.end(), ciphertext.begin(), ciphertext.end());

    // 4 output chars per 3 input bytes, plus NUL
    std::string out(4 * ((combined.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), combined.data(), static_cast<int>(combined.size()));
    out.resize(len > 0 ? static_cast<size_t>(len) : 0);
    return out;
}

ErrorCode SealedField::fromToken(const std::string& token, SealedField& outField) {
    std::string cleaned;
    cleaned.reserve(token.size());
    for (char c : token) {
        if (!std::isspace(static_cast<unsigned char>(c))) cleaned += c;
    }

    if (cleaned.empty() || cleaned.size() % 4 != 0) return ErrorCode::TruncatedInput;

    size_t padding = 0;
    while (padding < 2 && cleaned[cleaned.size() - 1 - padding] == '=') padding++;

    for (size_t i = 0; i < cleaned.size() - padding; ++i) {
        unsigned char c = static_cast<unsigned char>(cleaned[i]);
        if (!std::isalnum(c) && c != '+' && c != '/') return ErrorCode::TruncatedInput;
    }

    std::vector<unsigned char> decoded(cleaned.size() / 4 * 3);
    int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char*>(cleaned.data()), static_cast<int>(cleaned.size()));
    if (len < 0) return ErrorCode::TruncatedInput;

    // EVP_DecodeBlock counts the padding as zero bytes
    decoded.resize(static_cast<size_t>(len) - padding);

    if (decoded.size() < VAULTLINE_IV_SIZE + VAULTLINE_TAG_SIZE) return ErrorCode::TruncatedInput;

    outField.iv.assign(decoded.begin(), decoded.begin() + VAULTLINE_IV_SIZE);
    outField.ciphertext.assign(decoded.begin() + VAULTLINE_IV_SIZE, decoded.end());
    return ErrorCode::None;
}

} // namespace Vaultline
