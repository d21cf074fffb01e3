#include <iostream>
#include <string>
#include "KeyDerivation.hpp"

using namespace Vaultline;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "Usage: vault-key <user_id>\n";
        return 1;
    }

    std::string userId = argv[1];

    KeyDerivation kdf;
    ContentKey key;
    ErrorCode err = kdf.deriveContentKey(userId, key);
    if (err != ErrorCode::None) {
        std::cerr << "Failed to derive key: " << errorCodeName(err) << std::endl;
        return 1;
    }

    std::cout << "=== Vaultline Content Key ===" << std::endl;
    std::cout << "User ID:     " << userId << std::endl;
    std::cout << "Fingerprint: " << KeyDerivation::fingerprint(key) << std::endl;
    std::cout << std::endl;
    std::cout << "Files sealed for this user:" << std::endl;
    std::cout << "./vault-seal input.pdf <file_id> " << userId << std::endl;

    return 0;
}
