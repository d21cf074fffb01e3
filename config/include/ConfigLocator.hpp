#pragma once
#include <string>
#include <vector>
#include <filesystem>

#define VAULTLINE_CONFIG_ENV "VAULTLINE_CONFIG"
#define VAULTLINE_CONFIG_NAME "vaultline.json"

namespace Vaultline {

/**
 * ConfigLocator - Finds vaultline.json
 *
 * Search order:
 * 1. Explicit override (e.g. --config on the command line)
 * 2. Environment variable (VAULTLINE_CONFIG), file or directory
 * 3. Path relative to executable (and its parents, for build trees)
 * 4. System paths (/etc/vaultline, /usr/local/share/vaultline)
 * 5. User config (~/.config/vaultline)
 */
class ConfigLocator {
public:
    ConfigLocator();

    void setOverridePath(const std::string& path);

    // Empty when nothing was found
    std::string findConfig() const;

    const std::vector<std::string>& searchPaths() const { return m_searchPaths; }
    std::string getExecutableDir() const { return m_executableDir; }

private:
    static std::string candidate(const std::filesystem::path& p);

    std::vector<std::string> m_searchPaths;
    std::string m_overridePath;
    std::string m_executableDir;
};

} // namespace Vaultline
