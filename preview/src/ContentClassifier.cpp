#include "ContentClassifier.hpp"
#include <algorithm>
#include <utility>

namespace Vaultline {

const char* kindName(DetectedKind kind) {
    switch (kind) {
        case DetectedKind::Text: return "text";
        case DetectedKind::Image: return "image";
        case DetectedKind::Pdf: return "pdf";
        case DetectedKind::Audio: return "audio";
        case DetectedKind::Video: return "video";
        case DetectedKind::Binary: return "binary";
    }
    return "binary";
}

ContentClassifier::ContentClassifier(size_t sniffWindow)
    : m_sniffWindow(sniffWindow == 0 ? VAULTLINE_DEFAULT_SNIFF_WINDOW : sniffWindow) {}

const std::vector<Signature>& ContentClassifier::signatures() {
    static const std::vector<Signature> table = {
        // Documents
        {DetectedKind::Pdf, "pdf", {{0, {0x25, 0x50, 0x44, 0x46}}}},  // %PDF

        // Images
        {DetectedKind::Image, "png", {{0, {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}}}},
        {DetectedKind::Image, "jpeg", {{0, {0xFF, 0xD8, 0xFF}}}},
        {DetectedKind::Image, "gif87a", {{0, {0x47, 0x49, 0x46, 0x38, 0x37, 0x61}}}},
        {DetectedKind::Image, "gif89a", {{0, {0x47, 0x49, 0x46, 0x38, 0x39, 0x61}}}},
        {DetectedKind::Image, "webp", {{0, {'R', 'I', 'F', 'F'}}, {8, {'W', 'E', 'B', 'P'}}}},
        {DetectedKind::Image, "tiff-le", {{0, {0x49, 0x49, 0x2A, 0x00}}}},
        {DetectedKind::Image, "tiff-be", {{0, {0x4D, 0x4D, 0x00, 0x2A}}}},
        // BM followed by the two zeroed reserved words of the file header
        {DetectedKind::Image, "bmp", {{0, {0x42, 0x4D}}, {6, {0x00, 0x00, 0x00, 0x00}}}},
        {DetectedKind::Image, "ico", {{0, {0x00, 0x00, 0x01, 0x00}}}},

        // Audio
        {DetectedKind::Audio, "mp3-id3", {{0, {0x49, 0x44, 0x33}}}},
        {DetectedKind::Audio, "mp3-frame", {{0, {0xFF, 0xFB}}}},
        {DetectedKind::Audio, "mp3-frame-v2", {{0, {0xFF, 0xF3}}}},
        {DetectedKind::Audio, "mp3-frame-v25", {{0, {0xFF, 0xF2}}}},
        {DetectedKind::Audio, "wav", {{0, {'R', 'I', 'F', 'F'}}, {8, {'W', 'A', 'V', 'E'}}}},
        {DetectedKind::Audio, "flac", {{0, {'f', 'L', 'a', 'C'}}}},
        {DetectedKind::Audio, "ogg", {{0, {'O', 'g', 'g', 'S'}}}},
        {DetectedKind::Audio, "aiff", {{0, {'F', 'O', 'R', 'M'}}, {8, {'A', 'I', 'F', 'F'}}}},
        {DetectedKind::Audio, "m4a", {{4, {'f', 't', 'y', 'p'}}, {8, {'M', '4', 'A', ' '}}}},

        // Video
        {DetectedKind::Video, "iso-bmff", {{4, {'f', 't', 'y', 'p'}}}},
        {DetectedKind::Video, "matroska", {{0, {0x1A, 0x45, 0xDF, 0xA3}}}},
        {DetectedKind::Video, "avi", {{0, {'R', 'I', 'F', 'F'}}, {8, {'A', 'V', 'I', ' '}}}},
        {DetectedKind::Video, "flv", {{0, {'F', 'L', 'V', 0x01}}}},
        {DetectedKind::Video, "mpeg-ps", {{0, {0x00, 0x00, 0x01, 0xBA}}}},
        {DetectedKind::Video, "mpeg-video", {{0, {0x00, 0x00, 0x01, 0xB3}}}},
    };
    return table;
}

bool ContentClassifier::matches(const Signature& sig, const std::vector<unsigned char>& bytes) {
    for (const auto& marker : sig.markers) {
        if (bytes.size() < marker.offset + marker.bytes.size()) return false;
        if (!std::equal(marker.bytes.begin(), marker.bytes.end(), bytes.begin() + marker.offset)) return false;
    }
    return true;
}

bool ContentClassifier::looksLikeText(const unsigned char* data, size_t len, bool allowCutTail) {
    size_t i = 0;

    // UTF-8 BOM
    if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) i = 3;

    while (i < len) {
        unsigned char c = data[i];

        if (c < 0x80) {
            if (c < 0x20 && c != 0x09 && c != 0x0A && c != 0x0D && c != 0x0C) return false;
            if (c == 0x7F) return false;
            i++;
            continue;
        }

        size_t need;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) need = 1;
        else if (c == 0xE0) { need = 2; lo = 0xA0; }
        else if (c >= 0xE1 && c <= 0xEC) need = 2;
        else if (c == 0xED) { need = 2; hi = 0x9F; }   // no surrogates
        else if (c >= 0xEE && c <= 0xEF) need = 2;
        else if (c == 0xF0) { need = 3; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) need = 3;
        else if (c == 0xF4) { need = 3; hi = 0x8F; }  // <= U+10FFFF
        else return false;

        for (size_t k = 1; k <= need; ++k) {
            if (i + k >= len) return allowCutTail;
            unsigned char b = data[i + k];
            unsigned char min = (k == 1) ? lo : 0x80;
            unsigned char max = (k == 1) ? hi : 0xBF;
            if (b < min || b > max) return false;
        }
        i += need + 1;
    }
    return true;
}

Classification ContentClassifier::inspect(const std::vector<unsigned char>& bytes) const {
    Classification result;

    if (bytes.empty()) {
        result.status = ErrorCode::UnclassifiableContent;
        return result;
    }

    for (const auto& sig : signatures()) {
        if (!matches(sig, bytes)) continue;

        size_t magicLen = 0;
        for (const auto& marker : sig.markers) magicLen += marker.bytes.size();

        result.kind = sig.kind;
        result.confidence = magicLen >= 4 ? 1.0f : 0.75f;
        result.signature = sig.name;
        return result;
    }

    size_t window = std::min(bytes.size(), m_sniffWindow);
    bool whole = window == bytes.size();
    if (looksLikeText(bytes.data(), window, !whole)) {
        result.kind = DetectedKind::Text;
        result.confidence = whole ? 0.9f : 0.6f;
        result.signature = "utf8-text";
        return result;
    }

    result.status = ErrorCode::UnclassifiableContent;
    return result;
}

ClassifiedContent ContentClassifier::adopt(std::vector<unsigned char>&& bytes) const {
    Classification classification = inspect(bytes);

    ClassifiedContent content;
    content.rawBytes = std::move(bytes);
    content.detectedKind = classification.kind;
    content.sniffConfidence = classification.confidence;
    content.signature = std::move(classification.signature);
    return content;
}

DetectedKind ContentClassifier::classify(const std::vector<unsigned char>& bytes) const {
    return inspect(bytes).kind;
}

} // namespace Vaultline
