#pragma once

#include <filesystem>
#include <string>

namespace vgmtool::common {

/// Process-wide diagnostic log. Lines are appended to the file given to init();
/// before init() or after shutdown() messages are dropped.
class Logger {
public:
    static bool init(const std::filesystem::path& logPath);
    static void log(const std::string& message);
    static void logError(const std::string& message);
    static void shutdown();
    [[nodiscard]] static bool isOpen();

private:
    Logger() = default;
};

}  // namespace vgmtool::common
