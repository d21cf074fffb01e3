#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "EngineConfig.hpp"
#include "ConfigLocator.hpp"
#include "DirectoryStore.hpp"
#include "LocalAccessGate.hpp"
#include "PreviewOrchestrator.hpp"
#include "CryptoEngine.hpp"

using namespace Vaultline;

static bool readProof(const std::string& proofFile, std::string& outProof) {
    if (!proofFile.empty()) {
        std::ifstream f(proofFile);
        if (!f) {
            std::cerr << "Error: Could not open proof file: " << proofFile << std::endl;
            return false;
        }
        std::getline(f, outProof);
    } else {
        std::cout << "Primary credential: " << std::flush;
        std::getline(std::cin, outProof);
    }
    while (!outProof.empty() && (outProof.back() == '\n' || outProof.back() == '\r')) outProof.pop_back();
    return true;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::string configPath;
    std::string proofFile;
    std::string outPath;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--proof-file" && i + 1 < argc) {
            proofFile = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            outPath = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() < 2) {
        std::cout << "Usage: vault-preview <file_id> <user_id> [--proof-file path] [--out path] [--config path]\n";
        return 1;
    }

    ConfigLocator locator;
    if (!configPath.empty()) locator.setOverridePath(configPath);

    EngineConfig config;
    std::string found = locator.findConfig();
    if (!found.empty() && !config.load(found)) {
        std::cerr << "Refusing to run with a broken config: " << found << std::endl;
        return 1;
    }

    LocalAccessGate gate(config.primaryCredentialSha256);
    if (!gate.isConfigured()) {
        std::cerr << "Error: primaryCredentialSha256 is not set in " << (found.empty() ? "config" : found) << std::endl;
        return 1;
    }

    PreviewRequest request;
    request.fileId = args[0];
    request.stableUserId = args[1];
    if (!readProof(proofFile, request.reAuthProof)) return 1;

    int lastShown = -1;
    request.onProgress = [&lastShown](const Progress& p) {
        if (p.percentage / 10 != lastShown / 10 || p.percentage == 100) {
            lastShown = p.percentage;
            std::cerr << "\r  Decrypting: " << p.percentage << "%" << std::flush;
        }
    };

    DirectoryStore store(config.storeRoot);
    EphemeralResourceStore resources;
    KeyDerivation kdf;
    ConsoleAuditSink audit;
    PreviewOrchestrator orchestrator(gate, store, resources, kdf, config.previewSettings(), &audit);

    PreviewResult result = orchestrator.open(request);
    CryptoEngine::cleanse(request.reAuthProof);
    if (lastShown >= 0) std::cerr << std::endl;

    if (!result.ok) {
        std::cerr << "Preview failed: " << errorCodeName(result.error);
        if (result.cause != result.error && result.cause != ErrorCode::None) {
            std::cerr << " (" << errorCodeName(result.cause) << ")";
        }
        std::cerr << std::endl;
        return 1;
    }

    std::cout << "=== " << result.metadata.name << " ===" << std::endl;
    std::cout << "Declared type: " << result.metadata.declaredType << std::endl;
    std::cout << "Detected kind: " << kindName(result.detectedKind)
              << " (confidence " << result.sniffConfidence << ")" << std::endl;
    std::cout << "Size:          " << result.payload.decryptedSize << " bytes" << std::endl;

    int rc = 0;
    if (result.detectedKind == DetectedKind::Text) {
        std::cout << std::endl << result.payload.text << std::endl;
        if (result.payload.truncated) std::cout << "[... truncated]" << std::endl;
        CryptoEngine::cleanse(result.payload.text);
    } else {
        std::cout << "Resource:      " << result.payload.resource.id << std::endl;
        if (!outPath.empty()) {
            bool written = false;
            resources.read(result.payload.resource, [&](const std::vector<unsigned char>& bytes, DetectedKind) {
                std::ofstream out(outPath, std::ios::binary | std::ios::trunc);
                out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
                written = static_cast<bool>(out);
            });
            if (written) {
                std::cout << "Exported to " << outPath << std::endl;
            } else {
                std::cerr << "Error: Could not export to " << outPath << std::endl;
                rc = 1;
            }
        }
    }

    orchestrator.close();
    return rc;
}
