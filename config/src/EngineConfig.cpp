#include "EngineConfig.hpp"
#include <fstream>
#include <initializer_list>
#include <iostream>

using json = nlohmann::json;

namespace Vaultline {

bool EngineConfig::load(const std::string& path) {
    try {
        std::ifstream f(path);
        if (!f.is_open()) {
            std::cerr << "[EngineConfig] Could not open " << path << std::endl;
            return false;
        }

        json j;
        f >> j;
        if (!apply(j)) return false;

        std::cout << "[EngineConfig] Loaded " << path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Failed to load config: " << e.what() << std::endl;
        return false;
    }
}

bool EngineConfig::loadFromString(const std::string& text) {
    try {
        return apply(json::parse(text));
    } catch (const std::exception& e) {
        std::cerr << "[EngineConfig] Failed to parse config: " << e.what() << std::endl;
        return false;
    }
}

bool EngineConfig::apply(const json& j) {
    if (!j.is_object()) {
        std::cerr << "[EngineConfig] Config root must be an object" << std::endl;
        return false;
    }

    for (const char* key : {"chunkSize", "previewTextLimit", "sniffWindow", "maxUploadBytes", "maxNameLength"}) {
        if (j.contains(key) && !j[key].is_number_unsigned()) {
            std::cerr << "[EngineConfig] " << key << " must be a non-negative integer" << std::endl;
            return false;
        }
    }

    EngineConfig next = *this;
    if (j.contains("chunkSize")) {
        uint64_t value = j["chunkSize"].get<uint64_t>();
        next.chunkSize = value > VAULTLINE_MAX_CHUNK_SIZE ? 0 : static_cast<uint32_t>(value);
    }
    if (j.contains("previewTextLimit")) next.previewTextLimit = j["previewTextLimit"].get<size_t>();
    if (j.contains("sniffWindow")) next.sniffWindow = j["sniffWindow"].get<size_t>();
    if (j.contains("maxUploadBytes")) next.maxUploadBytes = j["maxUploadBytes"].get<uint64_t>();
    if (j.contains("maxNameLength")) next.maxNameLength = j["maxNameLength"].get<size_t>();
    if (j.contains("storeRoot")) next.storeRoot = j["storeRoot"].get<std::string>();
    if (j.contains("primaryCredentialSha256")) next.primaryCredentialSha256 = j["primaryCredentialSha256"].get<std::string>();

    std::string error;
    if (!next.validate(error)) {
        std::cerr << "[EngineConfig] Invalid config: " << error << std::endl;
        return false;
    }

    *this = next;
    return true;
}

bool EngineConfig::validate(std::string& outError) const {
    if (chunkSize == 0 || chunkSize > VAULTLINE_MAX_CHUNK_SIZE) {
        outError = "chunkSize must be between 1 and " + std::to_string(VAULTLINE_MAX_CHUNK_SIZE);
        return false;
    }
    if (previewTextLimit == 0) {
        outError = "previewTextLimit must be positive";
        return false;
    }
    if (sniffWindow == 0) {
        outError = "sniffWindow must be positive";
        return false;
    }
    if (maxNameLength == 0) {
        outError = "maxNameLength must be positive";
        return false;
    }
    if (storeRoot.empty()) {
        outError = "storeRoot must not be empty";
        return false;
    }
    if (!primaryCredentialSha256.empty()) {
        if (primaryCredentialSha256.size() != 64 ||
            primaryCredentialSha256.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos) {
            outError = "primaryCredentialSha256 must be 64 hex characters";
            return false;
        }
    }
    return true;
}

UploadPolicy EngineConfig::uploadPolicy() const {
    UploadPolicy policy;
    policy.maxUploadBytes = maxUploadBytes;
    policy.maxNameLength = maxNameLength;
    return policy;
}

PreviewSettings EngineConfig::previewSettings() const {
    PreviewSettings settings;
    settings.previewTextLimit = previewTextLimit;
    settings.sniffWindow = sniffWindow;
    return settings;
}

std::string EngineConfig::toJson() const {
    json j;
    j["chunkSize"] = chunkSize;
    j["previewTextLimit"] = previewTextLimit;
    j["sniffWindow"] = sniffWindow;
    j["maxUploadBytes"] = maxUploadBytes;
    j["maxNameLength"] = maxNameLength;
    j["storeRoot"] = storeRoot;
    // primaryCredentialSha256 is never dumped
    return j.dump(2);
}

} // namespace Vaultline
