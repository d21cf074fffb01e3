#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "VaultTypes.hpp"

#define VAULTLINE_DEFAULT_SNIFF_WINDOW 8192

namespace Vaultline {

enum class DetectedKind { Text, Image, Pdf, Audio, Video, Binary };

const char* kindName(DetectedKind kind);

struct SignatureMarker {
    size_t offset;
    std::vector<unsigned char> bytes;
};

struct Signature {
    DetectedKind kind;
    const char* name;
    std::vector<SignatureMarker> markers;  // all must match
};

struct Classification {
    DetectedKind kind = DetectedKind::Binary;
    float confidence = 0.0f;
    std::string signature;                 // matched signature, "utf8-text" or empty
    ErrorCode status = ErrorCode::None;    // UnclassifiableContent for the binary fallback
};

// Decrypted bytes together with what they were found to be. Lives from
// classification until the preview is rendered or dropped.
struct ClassifiedContent {
    std::vector<unsigned char> rawBytes;
    DetectedKind detectedKind = DetectedKind::Binary;
    float sniffConfidence = 0.0f;
    std::string signature;                 // empty for the binary fallback
};

/**
 * Works out what decrypted bytes really are. The declared MIME type is never
 * consulted: signature table first (pdf, image, audio, video in that order),
 * then a UTF-8 text check over the first sniffWindow bytes, then binary.
 */
class ContentClassifier {
public:
    explicit ContentClassifier(size_t sniffWindow = VAULTLINE_DEFAULT_SNIFF_WINDOW);

    DetectedKind classify(const std::vector<unsigned char>& bytes) const;
    Classification inspect(const std::vector<unsigned char>& bytes) const;

    // Classifies and takes ownership of bytes
    ClassifiedContent adopt(std::vector<unsigned char>&& bytes) const;

    // Priority ordered
    static const std::vector<Signature>& signatures();

    // True when the bytes are valid UTF-8 without control characters besides
    // TAB, LF, CR and FF. A sequence cut at the end is accepted if allowCutTail.
    static bool looksLikeText(const unsigned char* data, size_t len, bool allowCutTail);

private:
    static bool matches(const Signature& sig, const std::vector<unsigned char>& bytes);

    size_t m_sniffWindow;
};

} // namespace Vaultline
