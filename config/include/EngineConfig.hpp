#pragma once
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "VaultTypes.hpp"
#include "FileSealer.hpp"
#include "PreviewOrchestrator.hpp"

#define VAULTLINE_MAX_CHUNK_SIZE (16 * 1024 * 1024)

namespace Vaultline {

/**
 * Engine settings, loaded from vaultline.json. Keys that are missing keep
 * their defaults; a file with out-of-range values is rejected as a whole.
 *
 * {
 *   "chunkSize": 65536,
 *   "previewTextLimit": 1048576,
 *   "sniffWindow": 8192,
 *   "maxUploadBytes": 104857600,
 *   "maxNameLength": 255,
 *   "storeRoot": "vault-store",
 *   "primaryCredentialSha256": "<hex>"
 * }
 */
struct EngineConfig {
    uint32_t chunkSize = VAULTLINE_DEFAULT_CHUNK_SIZE;
    size_t previewTextLimit = VAULTLINE_DEFAULT_PREVIEW_TEXT_LIMIT;
    size_t sniffWindow = VAULTLINE_DEFAULT_SNIFF_WINDOW;
    uint64_t maxUploadBytes = VAULTLINE_MAX_UPLOAD_BYTES;
    size_t maxNameLength = VAULTLINE_MAX_NAME_LENGTH;
    std::string storeRoot = "vault-store";
    std::string primaryCredentialSha256;  // only used by the local access gate

    bool load(const std::string& path);
    bool loadFromString(const std::string& text);
    bool validate(std::string& outError) const;

    UploadPolicy uploadPolicy() const;
    PreviewSettings previewSettings() const;

    std::string toJson() const;

private:
    bool apply(const nlohmann::json& j);
};

} // namespace Vaultline
