#pragma once
#include <vector>
#include <cstdint>
#include "VaultTypes.hpp"

namespace Vaultline {

/**
 * Chunked AES-256-GCM for file bodies.
 *
 * Every chunk is sealed on its own under baseIv[0..7] || uint32_le(index).
 * Associated data is the full base IV followed by a flag byte marking the
 * final chunk (0x01), so dropping trailing chunks or touching any IV byte
 * fails authentication. An empty body is a single empty final chunk.
 *
 * decryptStream() only hands plaintext back once every chunk verified.
 */
class ChunkedCipher {
public:
    explicit ChunkedCipher(uint32_t chunkSize = VAULTLINE_DEFAULT_CHUNK_SIZE);

    ErrorCode encryptStream(const ContentKey& key, const std::vector<unsigned char>& plaintext,
                            EncryptedBlob& outBlob, const ProgressCallback& progress = nullptr) const;

    ErrorCode decryptStream(const ContentKey& key, const EncryptedBlob& blob,
                            std::vector<unsigned char>& outPlaintext, const ProgressCallback& progress = nullptr) const;

    uint32_t chunkSize() const { return m_chunkSize; }

    // Size of ciphertext (excluding the base IV) for a given body size
    static uint64_t sealedSize(uint64_t plaintextSize, uint32_t chunkSize);

private:
    static void chunkNonce(const unsigned char* baseIv, uint32_t index, unsigned char* out);
    static void chunkAad(const unsigned char* baseIv, bool final, unsigned char* out);
    static void report(const ProgressCallback& progress, uint64_t processed, uint64_t total);

    uint32_t m_chunkSize;
};

} // namespace Vaultline
