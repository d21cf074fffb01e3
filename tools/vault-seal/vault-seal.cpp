#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <filesystem>
#include "EngineConfig.hpp"
#include "ConfigLocator.hpp"
#include "FileSealer.hpp"
#include "DirectoryStore.hpp"

using namespace Vaultline;

int main(int argc, char* argv[]) {
    std::vector<std::string> args;
    std::string configPath;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else {
            args.push_back(arg);
        }
    }

    if (args.size() < 3) {
        std::cout << "Usage: vault-seal <input_file> <file_id> <user_id> [declared_type] [--config path]\n";
        return 1;
    }

    const std::string& inputPath = args[0];
    const std::string& fileId = args[1];
    const std::string& userId = args[2];
    std::string declaredType = args.size() >= 4 ? args[3] : "application/octet-stream";

    ConfigLocator locator;
    if (!configPath.empty()) locator.setOverridePath(configPath);

    EngineConfig config;
    std::string found = locator.findConfig();
    if (!found.empty() && !config.load(found)) {
        std::cerr << "Refusing to run with a broken config: " << found << std::endl;
        return 1;
    }

    std::ifstream inFile(inputPath, std::ios::binary);
    if (!inFile) {
        std::cerr << "Error: Could not open source file: " << inputPath << std::endl;
        return 1;
    }
    std::vector<unsigned char> body((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
    inFile.close();

    FileMetadata metadata;
    metadata.name = std::filesystem::path(inputPath).filename().string();
    metadata.declaredType = declaredType;

    KeyDerivation kdf;
    FileSealer sealer(kdf, config.chunkSize, config.uploadPolicy());

    int lastShown = -1;
    SealedFile sealed;
    ErrorCode err = sealer.seal(userId, metadata, body, sealed, [&lastShown](const Progress& p) {
        if (p.percentage / 10 != lastShown / 10 || p.percentage == 100) {
            lastShown = p.percentage;
            std::cout << "\r  Sealing: " << p.percentage << "%" << std::flush;
        }
    });
    std::cout << std::endl;

    if (err != ErrorCode::None) {
        std::cerr << "Failed to seal file: " << errorCodeName(err) << std::endl;
        return 1;
    }

    DirectoryStore store(config.storeRoot);
    if (!store.write(fileId, sealed)) {
        std::cerr << "Failed to store sealed file." << std::endl;
        return 1;
    }

    std::cout << "Successfully sealed " << inputPath << " as " << fileId << " in " << store.root() << std::endl;
    return 0;
}
