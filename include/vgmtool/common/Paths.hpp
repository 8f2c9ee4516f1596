#pragma once

#include <filesystem>

namespace vgmtool::common {

/// Returns the directory containing the running executable.
std::filesystem::path executableDir();

/// Resolves the optional user parser configuration file.
/// On Linux: $XDG_CONFIG_HOME/vgmtool/parser_config.json or
/// ~/.config/vgmtool/parser_config.json.
/// Returns an empty path when no user config location is available.
std::filesystem::path userParserConfigPath();

/// Resolves <exe_dir>/config/parser_config.json, shipped next to the tools.
std::filesystem::path bundledParserConfigPath();

}  // namespace vgmtool::common
