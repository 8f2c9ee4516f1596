#pragma once

#include "vgmtool/vgm/ParserConfig.hpp"
#include "vgmtool/vgm/VgmError.hpp"
#include "vgmtool/vgm/VgmFile.hpp"
#include "vgmtool/vgm/VgmValidator.hpp"

#include <cstdint>
#include <filesystem>
#include <vector>

namespace vgmtool::vgm {

/// Smallest input accepted as a VGM file (the pre-1.50 header).
constexpr std::size_t kMinVgmFileSize = 64;

VgmResult<std::vector<std::uint8_t>> readFileBytes(const std::filesystem::path& path);
VgmResult<void> writeFileBytes(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);

struct LoadedVgm {
    VgmFile file;
    /// Size of the plain (inflated) VGM data.
    std::size_t byteSize = 0;
    bool wasCompressed = false;
    ResourceUsageSummary usage;
};

/// Reads a .vgm or .vgz file, decodes it under `parserConfig` and validates the
/// result against `validationConfig`.
VgmResult<LoadedVgm> loadVgm(const std::filesystem::path& path, const ParserConfig& parserConfig = ParserConfig{},
                             const ValidationConfig& validationConfig = ValidationConfig{}, bool validate = true);
VgmResult<VgmFile> loadVgmFile(const std::filesystem::path& path, const ParserConfig& parserConfig = ParserConfig{},
                               const ValidationConfig& validationConfig = ValidationConfig{});

/// Encodes `file` and writes it, gzip wrapped when `compress` is set.
VgmResult<void> saveVgmFile(const std::filesystem::path& path, const VgmFile& file, bool compress = false);

}  // namespace vgmtool::vgm
