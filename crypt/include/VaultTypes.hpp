#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

// Vaultline sealed body layout:
// [0-11]  Base IV (12 bytes)
// For each chunk i (chunkSize plaintext bytes, last one may be shorter):
// [..]    AES-256-GCM ciphertext of chunk i
// [..+16] GCM tag of chunk i
// Chunk nonce = baseIv[0..7] || uint32_le(i)
// Chunk AAD   = baseIv || 0x01 for the last chunk, 0x00 otherwise
#define VAULTLINE_IV_SIZE 12
#define VAULTLINE_TAG_SIZE 16
#define VAULTLINE_KEY_SIZE 32
#define VAULTLINE_DEFAULT_CHUNK_SIZE (64 * 1024)

namespace Vaultline {

enum class ErrorCode {
    None,
    InvalidKeyMaterial,
    AccessDenied,
    TruncatedInput,
    AuthenticationFailed,
    DecryptionFailed,
    UnclassifiableContent,
    ResourceReleaseFailure,
    FetchFailed,
    UploadRejected,
    InvalidArgument,
    CryptoFailure,
    Cancelled
};

// Stable tag used in audit events and tool output
const char* errorCodeName(ErrorCode code);

/**
 * 256-bit AES content key. Lives only in memory and is wiped on destruction.
 */
class ContentKey {
public:
    ContentKey();
    ContentKey(const ContentKey& other);
    ContentKey& operator=(const ContentKey& other);
    ~ContentKey();

    unsigned char* data() { return m_bytes.data(); }
    const unsigned char* data() const { return m_bytes.data(); }
    size_t size() const { return m_bytes.size(); }

    bool isSet() const { return m_set; }
    void markSet() { m_set = true; }
    void clear();

    // Constant-time comparison
    bool operator==(const ContentKey& other) const;
    bool operator!=(const ContentKey& other) const { return !(*this == other); }

private:
    std::array<unsigned char, VAULTLINE_KEY_SIZE> m_bytes;
    bool m_set = false;
};

struct EncryptedBlob {
    std::vector<unsigned char> iv;          // 12 byte base nonce
    std::vector<unsigned char> ciphertext;  // ct || tag per chunk
    uint32_t chunkSize = VAULTLINE_DEFAULT_CHUNK_SIZE;

    // Wire form: iv || ciphertext
    std::vector<unsigned char> serialize() const;
    static ErrorCode parse(const std::vector<unsigned char>& wire, uint32_t chunkSize, EncryptedBlob& outBlob);
};

struct SealedField {
    std::vector<unsigned char> iv;          // 12 bytes
    std::vector<unsigned char> ciphertext;  // ct || tag

    // base64(iv || ct || tag)
    std::string toToken() const;
    static ErrorCode fromToken(const std::string& token, SealedField& outField);
};

struct EncryptedMetadata {
    SealedField name;
    SealedField declaredType;
};

struct FileMetadata {
    std::string name;
    std::string declaredType;
};

struct Progress {
    uint64_t processed;
    uint64_t total;
    int percentage;
};

using ProgressCallback = std::function<void(const Progress&)>;

} // namespace Vaultline
