#include "ChunkedCipher.hpp"
#include "CryptoEngine.hpp"
#include <algorithm>
#include <iostream>

namespace Vaultline {

namespace {
const uint64_t kMaxChunks = 0x100000000ULL;
const unsigned char kMiddleChunk = 0x00;
const unsigned char kFinalChunk = 0x01;
}

ChunkedCipher::ChunkedCipher(uint32_t chunkSize) : m_chunkSize(chunkSize) {}

void ChunkedCipher::chunkNonce(const unsigned char* baseIv, uint32_t index, unsigned char* out) {
    std::copy(baseIv, baseIv + 8, out);
    out[8] = static_cast<unsigned char>(index & 0xFF);
    out[9] = static_cast<unsigned char>((index >> 8) & 0xFF);
    out[10] = static_cast<unsigned char>((index >> 16) & 0xFF);
    out[11] = static_cast<unsigned char>((index >> 24) & 0xFF);
}

void ChunkedCipher::chunkAad(const unsigned char* baseIv, bool final, unsigned char* out) {
    std::copy(baseIv, baseIv + VAULTLINE_IV_SIZE, out);
    out[VAULTLINE_IV_SIZE] = final ? kFinalChunk : kMiddleChunk;
}

void ChunkedCipher::report(const ProgressCallback& progress, uint64_t processed, uint64_t total) {
    if (!progress) return;
    int percentage = total == 0 ? 100 : static_cast<int>((processed * 100 + total / 2) / total);
    progress(Progress{processed, total, percentage});
}

uint64_t ChunkedCipher::sealedSize(uint64_t plaintextSize, uint32_t chunkSize) {
    if (chunkSize == 0) return 0;
    uint64_t chunks = plaintextSize == 0 ? 1 : (plaintextSize + chunkSize - 1) / chunkSize;
    return plaintextSize + chunks * VAULTLINE_TAG_SIZE;
}

ErrorCode ChunkedCipher::encryptStream(const ContentKey& key, const std::vector<unsigned char>& plaintext,
                                       EncryptedBlob& outBlob, const ProgressCallback& progress) const {
    if (m_chunkSize == 0) return ErrorCode::InvalidArgument;
    if (!key.isSet()) return ErrorCode::InvalidKeyMaterial;

    uint64_t numChunks = plaintext.empty() ? 1 : (plaintext.size() + m_chunkSize - 1) / m_chunkSize;
    if (numChunks > kMaxChunks) {
        std::cerr << "[ChunkedCipher] Body too large: " << numChunks << " chunks" << std::endl;
        return ErrorCode::InvalidArgument;
    }

    // Fresh base nonce for every call
    std::vector<unsigned char> baseIv;
    ErrorCode err = CryptoEngine::randomBytes(VAULTLINE_IV_SIZE, baseIv);
    if (err != ErrorCode::None) return err;

    std::vector<unsigned char> ciphertext;
    ciphertext.reserve(static_cast<size_t>(sealedSize(plaintext.size(), m_chunkSize)));

    unsigned char nonce[VAULTLINE_IV_SIZE];
    unsigned char aad[VAULTLINE_IV_SIZE + 1];
    for (uint64_t i = 0; i < numChunks; ++i) {
        size_t offset = static_cast<size_t>(i * m_chunkSize);
        size_t chunkLen = std::min(static_cast<size_t>(m_chunkSize), plaintext.size() - offset);

        chunkNonce(baseIv.data(), static_cast<uint32_t>(i), nonce);
        chunkAad(baseIv.data(), i + 1 == numChunks, aad);
        err = CryptoEngine::seal(key, nonce, aad, sizeof(aad), plaintext.data() + offset, chunkLen, ciphertext);
        if (err != ErrorCode::None) {
            std::cerr << "[ChunkedCipher] Chunk " << i << " encryption failed" << std::endl;
            return err;
        }

        report(progress, offset + chunkLen, plaintext.size());
    }

    outBlob.iv = std::move(baseIv);
    outBlob.ciphertext = std::move(ciphertext);
    outBlob.chunkSize = m_chunkSize;
    return ErrorCode::None;
}

ErrorCode ChunkedCipher::decryptStream(const ContentKey& key, const EncryptedBlob& blob,
                                       std::vector<unsigned char>& outPlaintext, const ProgressCallback& progress) const {
    outPlaintext.clear();

    if (blob.chunkSize == 0) return ErrorCode::InvalidArgument;
    if (!key.isSet()) return ErrorCode::InvalidKeyMaterial;
    if (blob.iv.size() != VAULTLINE_IV_SIZE || blob.ciphertext.size() < VAULTLINE_TAG_SIZE) {
        return ErrorCode::TruncatedInput;
    }

    const uint64_t frameSize = static_cast<uint64_t>(blob.chunkSize) + VAULTLINE_TAG_SIZE;
    const uint64_t total = blob.ciphertext.size();
    const uint64_t numChunks = (total + frameSize - 1) / frameSize;
    const uint64_t lastFrame = total - (numChunks - 1) * frameSize;

    if (lastFrame < VAULTLINE_TAG_SIZE) return ErrorCode::TruncatedInput;
    if (numChunks > kMaxChunks) return ErrorCode::InvalidArgument;

    std::vector<unsigned char> plaintext;
    plaintext.reserve(static_cast<size_t>(total - numChunks * VAULTLINE_TAG_SIZE));

    unsigned char nonce[VAULTLINE_IV_SIZE];
    unsigned char aad[VAULTLINE_IV_SIZE + 1];
    for (uint64_t i = 0; i < numChunks; ++i) {
        size_t offset = static_cast<size_t>(i * frameSize);
        size_t frameLen = static_cast<size_t>(std::min(frameSize, total - offset));

        chunkNonce(blob.iv.data(), static_cast<uint32_t>(i), nonce);
        chunkAad(blob.iv.data(), i + 1 == numChunks, aad);
        ErrorCode err = CryptoEngine::open(key, nonce, aad, sizeof(aad), blob.ciphertext.data() + offset, frameLen, plaintext);
        if (err != ErrorCode::None) {
            // Fail closed: nothing decrypted so far leaves this function
            CryptoEngine::cleanse(plaintext);
            std::cerr << "[ChunkedCipher] Chunk " << i << " of " << numChunks << " rejected: "
                      << errorCodeName(err) << std::endl;
            return err;
        }

        report(progress, offset + frameLen, total);
    }

    outPlaintext = std::move(plaintext);
    return ErrorCode::None;
}

} // namespace Vaultline
