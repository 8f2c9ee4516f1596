#pragma once

#include "vgmtool/vgm/Gd3Metadata.hpp"
#include "vgmtool/vgm/VgmCommand.hpp"
#include "vgmtool/vgm/VgmFile.hpp"
#include "vgmtool/vgm/VgmHeader.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace vgmtool::vgm {

/// Header fields that are present in the file, keyed by field name, plus the
/// extra header when attached.
nlohmann::json toJson(const VgmHeader& header);
/// {"type": name, "opcode": first byte, ...operands}. Block payloads are summarised by size.
nlohmann::json toJson(const VgmCommand& command);
nlohmann::json toJson(const Gd3Metadata& metadata);
nlohmann::json toJson(const VgmFile& file);

std::string toJsonString(const VgmFile& file, int indent = 2);

}  // namespace vgmtool::vgm
