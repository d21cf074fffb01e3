#include "ConfigLocator.hpp"
#include <cstdlib>
#include <unistd.h>
#include <linux/limits.h>
#include <iostream>

namespace fs = std::filesystem;

namespace Vaultline {

ConfigLocator::ConfigLocator() {
    char exePath[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exePath, sizeof(exePath) - 1);
    if (len > 0) {
        exePath[len] = '\0';
        m_executableDir = fs::path(exePath).parent_path().string();
    }

    // Order matters
    const char* envPath = std::getenv(VAULTLINE_CONFIG_ENV);
    if (envPath && *envPath) {
        m_searchPaths.push_back(envPath);
    }

    if (!m_executableDir.empty()) {
        fs::path exeDir(m_executableDir);
        m_searchPaths.push_back(m_executableDir);
        // Installed: bin/ -> share/vaultline
        m_searchPaths.push_back((exeDir / "../share/vaultline").string());
        // Build tree: build/ -> project config/
        m_searchPaths.push_back((exeDir / "../config").string());
        m_searchPaths.push_back((exeDir / "../../config").string());
    }

    m_searchPaths.push_back("/etc/vaultline");
    m_searchPaths.push_back("/usr/local/share/vaultline");

    const char* home = std::getenv("HOME");
    if (home) {
        m_searchPaths.push_back(std::string(home) + "/.config/vaultline");
    }
}

void ConfigLocator::setOverridePath(const std::string& path) {
    m_overridePath = path;
}

std::string ConfigLocator::candidate(const fs::path& p) {
    std::error_code ec;
    if (fs::is_regular_file(p, ec)) {
        return fs::canonical(p, ec).string();
    }
    fs::path named = p / VAULTLINE_CONFIG_NAME;
    if (fs::is_regular_file(named, ec)) {
        return fs::canonical(named, ec).string();
    }
    return "";
}

std::string ConfigLocator::findConfig() const {
    if (!m_overridePath.empty()) {
        std::string found = candidate(m_overridePath);
        if (!found.empty()) return found;
        std::cerr << "[ConfigLocator] WARNING: Override not usable: " << m_overridePath << std::endl;
    }

    for (const auto& base : m_searchPaths) {
        std::string found = candidate(base);
        if (!found.empty()) return found;
    }

    std::cerr << "[ConfigLocator] WARNING: " << VAULTLINE_CONFIG_NAME << " not found, using defaults" << std::endl;
    return "";
}

} // namespace Vaultline
