#include "vgmtool/common/Log.hpp"
#include "vgmtool/common/Logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace vgmtool::common {
namespace {

std::filesystem::path tempLogPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("vgmtool_" + name + ".log");
}

std::string readAll(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST(LoggerTest, WritesLevelsAndSessionMarkers) {
    const auto path = tempLogPath("levels");
    std::filesystem::remove(path);

    ASSERT_TRUE(Logger::init(path));
    EXPECT_TRUE(Logger::isOpen());
    Logger::log("decoded 12 commands");
    Logger::logError("bad offset");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isOpen());

    const std::string text = readAll(path);
    EXPECT_NE(text.find("=== vgmtool session"), std::string::npos);
    EXPECT_NE(text.find("[INFO ]"), std::string::npos);
    EXPECT_NE(text.find("decoded 12 commands"), std::string::npos);
    EXPECT_NE(text.find("[ERROR]"), std::string::npos);
    EXPECT_NE(text.find("bad offset"), std::string::npos);
    EXPECT_NE(text.find("session end"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(LoggerTest, MessagesAreDroppedWhenClosed) {
    const auto path = tempLogPath("closed");
    std::filesystem::remove(path);

    Logger::log("nobody is listening");
    ASSERT_TRUE(Logger::init(path));
    Logger::shutdown();
    Logger::log("still nobody");

    const std::string text = readAll(path);
    EXPECT_EQ(text.find("nobody"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(LoggerTest, ConsoleHelpersForwardToFile) {
    const auto path = tempLogPath("forward");
    std::filesystem::remove(path);

    ASSERT_TRUE(Logger::init(path));
    logInfo("forwarded info");
    logError("forwarded error");
    Logger::shutdown();

    const std::string text = readAll(path);
    EXPECT_NE(text.find("forwarded info"), std::string::npos);
    EXPECT_NE(text.find("forwarded error"), std::string::npos);

    std::filesystem::remove(path);
}

TEST(LoggerTest, InitFailsForMissingDirectory) {
    const auto path = std::filesystem::temp_directory_path() / "vgmtool_missing_dir" / "nested" / "log.txt";
    EXPECT_FALSE(Logger::init(path));
    EXPECT_FALSE(Logger::isOpen());
}

}  // namespace vgmtool::common
