#pragma once

#include "vgmtool/vgm/VgmError.hpp"
#include "vgmtool/vgm/VgmFile.hpp"
#include "vgmtool/vgm/VgmHeader.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace vgmtool::vgm {

/// Policy limits applied after a successful decode. Versions are decimal (151 = 1.51).
struct ValidationConfig {
    std::uint32_t minVgmVersion = 100;
    std::uint32_t maxVgmVersion = 171;
    std::size_t maxFileSize = 64 * 1024 * 1024;
    std::size_t maxCommands = 1'000'000;
    std::uint32_t maxDataBlockSize = 16 * 1024 * 1024;
    /// Also requires a terminating EndOfSoundData and an eofOffset matching the file size.
    bool strictMode = false;

    bool operator==(const ValidationConfig&) const = default;
};

class VgmValidator {
public:
    explicit VgmValidator(ValidationConfig config = {}) : config_(config) {}

    [[nodiscard]] const ValidationConfig& config() const { return config_; }

    VgmResult<void> validateFile(const VgmFile& file, std::size_t fileSize) const;
    /// Version and chip configuration only; needs no command stream.
    VgmResult<void> quickValidateHeader(const VgmHeader& header) const;

    VgmResult<void> validateVersion(const VgmHeader& header) const;
    static VgmResult<void> validateChipClocks(const VgmHeader& header);
    static VgmResult<void> validateChipVolumes(const VgmHeader& header);
    static VgmResult<void> validateHeaderOffsets(const VgmHeader& header, std::size_t fileSize);
    VgmResult<void> validateCommands(std::span<const VgmCommand> commands) const;
    static VgmResult<void> validateChipUsage(const VgmHeader& header, std::span<const VgmCommand> commands);

private:
    ValidationConfig config_;
};

}  // namespace vgmtool::vgm
