#pragma once

#include <string_view>

namespace vgmtool::common {

/// Console output for tools. Both also forward to Logger when it is open.
void logInfo(std::string_view message);
void logError(std::string_view message);

}  // namespace vgmtool::common
