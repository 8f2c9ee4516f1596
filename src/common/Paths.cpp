#include "vgmtool/common/Paths.hpp"

#include <cstdlib>

#ifdef _WIN32
#include <Windows.h>
#else
#include <unistd.h>

#include <climits>
#endif

namespace vgmtool::common {
namespace {

constexpr const char* kParserConfigFilename = "parser_config.json";

#ifdef _WIN32
std::filesystem::path getExecutablePath() {
    wchar_t buf[MAX_PATH];
    const DWORD len = GetModuleFileNameW(nullptr, buf, MAX_PATH);
    if (len == 0 || len >= MAX_PATH) {
        return {};
    }
    return std::filesystem::path(buf);
}
#else
std::filesystem::path getExecutablePath() {
    char buf[PATH_MAX];
    const ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0) {
        return {};
    }
    buf[len] = '\0';
    return std::filesystem::path(buf);
}

/// Uses $XDG_CONFIG_HOME/vgmtool/ or falls back to ~/.config/vgmtool/.
std::filesystem::path userConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && xdg[0] != '\0') {
        return std::filesystem::path(xdg) / "vgmtool";
    }
    if (const char* home = std::getenv("HOME"); home != nullptr && home[0] != '\0') {
        return std::filesystem::path(home) / ".config" / "vgmtool";
    }
    return {};
}
#endif

}  // namespace

std::filesystem::path executableDir() {
    static const std::filesystem::path dir = getExecutablePath().parent_path();
    return dir;
}

std::filesystem::path userParserConfigPath() {
#ifdef _WIN32
    return {};
#else
    const auto userDir = userConfigDir();
    if (userDir.empty()) {
        return {};
    }
    return userDir / kParserConfigFilename;
#endif
}

std::filesystem::path bundledParserConfigPath() {
    return executableDir() / "config" / kParserConfigFilename;
}

}  // namespace vgmtool::common
