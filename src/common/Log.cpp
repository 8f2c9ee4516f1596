#include "vgmtool/common/Log.hpp"

#include "vgmtool/common/Logger.hpp"

#include <iostream>
#include <string>

namespace vgmtool::common {

void logInfo(std::string_view message) {
    std::cout << "[info] " << message << '\n';
    Logger::log(std::string(message));
}

void logError(std::string_view message) {
    std::cerr << "[error] " << message << '\n';
    Logger::logError(std::string(message));
}

}  // namespace vgmtool::common
