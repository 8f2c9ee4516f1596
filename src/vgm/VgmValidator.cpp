#include "vgmtool/vgm/VgmValidator.hpp"

#include "vgmtool/vgm/Bcd.hpp"
#include "vgmtool/vgm/SoundChip.hpp"

#include <format>
#include <optional>
#include <string_view>
#include <variant>

namespace vgmtool::vgm {
namespace {

constexpr std::uint8_t kMaxVolumeModifier = 64;
constexpr std::string_view kChipUsageContext = "Chip usage validation";

struct ClockRange {
    SoundChip chip;
    std::uint32_t minHz;
    std::uint32_t maxHz;
};

constexpr ClockRange kClockRanges[] = {
    {SoundChip::SN76489, 1'000'000, 8'000'000},
    {SoundChip::YM2612, 6'000'000, 8'000'000},
    {SoundChip::YM2151, 3'000'000, 4'000'000},
};

// The chip whose header clock a command needs; nullopt where usage is not checked.
std::optional<SoundChip> requiredChip(const VgmCommand& command) {
    return std::visit(
        overloaded{
            [](const PSGWrite&) -> std::optional<SoundChip> { return SoundChip::SN76489; },
            [](const GameGearPSGStereo&) -> std::optional<SoundChip> { return SoundChip::SN76489; },
            [](const YM2612Port0Write&) -> std::optional<SoundChip> { return SoundChip::YM2612; },
            [](const YM2612Port1Write&) -> std::optional<SoundChip> { return SoundChip::YM2612; },
            [](const YM2612Port0Address2AWriteWait&) -> std::optional<SoundChip> { return SoundChip::YM2612; },
            [](const YM2151Write&) -> std::optional<SoundChip> { return SoundChip::YM2151; },
            [](const YM2413Write&) -> std::optional<SoundChip> { return SoundChip::YM2413; },
            [](const YM2203Write&) -> std::optional<SoundChip> { return SoundChip::YM2203; },
            [](const YM2608Port0Write&) -> std::optional<SoundChip> { return SoundChip::YM2608; },
            [](const YM2608Port1Write&) -> std::optional<SoundChip> { return SoundChip::YM2608; },
            [](const YM2610Port0Write&) -> std::optional<SoundChip> { return SoundChip::YM2610; },
            [](const YM2610Port1Write&) -> std::optional<SoundChip> { return SoundChip::YM2610; },
            [](const YM3812Write&) -> std::optional<SoundChip> { return SoundChip::YM3812; },
            [](const YM3526Write&) -> std::optional<SoundChip> { return SoundChip::YM3526; },
            [](const Y8950Write&) -> std::optional<SoundChip> { return SoundChip::Y8950; },
            [](const auto&) -> std::optional<SoundChip> { return std::nullopt; },
        },
        command);
}

VgmResult<void> checkOffset(std::string field, std::uint32_t offset, std::uint32_t base, std::size_t fileSize) {
    if (offset == 0) {
        return {};
    }
    if (std::uint64_t{base} + offset >= fileSize) {
        return std::unexpected(VgmError::invalidOffset(std::move(field), std::uint64_t{base} + offset, fileSize));
    }
    return {};
}

}  // namespace

VgmResult<void> VgmValidator::validateFile(const VgmFile& file, std::size_t fileSize) const {
    if (fileSize > config_.maxFileSize) {
        return std::unexpected(VgmError::dataSizeExceedsLimit("file_size", fileSize, config_.maxFileSize));
    }
    if (auto ok = validateVersion(file.header); !ok) {
        return ok;
    }
    if (auto ok = validateChipClocks(file.header); !ok) {
        return ok;
    }
    if (auto ok = validateChipVolumes(file.header); !ok) {
        return ok;
    }
    if (auto ok = validateCommands(file.commands); !ok) {
        return ok;
    }
    if (auto ok = validateHeaderOffsets(file.header, fileSize); !ok) {
        return ok;
    }
    if (auto ok = validateChipUsage(file.header, file.commands); !ok) {
        return ok;
    }

    if (config_.strictMode) {
        if (file.commands.empty() || !std::holds_alternative<EndOfSoundData>(file.commands.back())) {
            return std::unexpected(
                VgmError::inconsistentData("Command stream", "stream does not end with EndOfSoundData"));
        }
        const std::uint64_t declaredSize = std::uint64_t{kEofOffsetBase} + file.header.eofOffset;
        if (declaredSize != fileSize) {
            return std::unexpected(VgmError::inconsistentData(
                "eof_offset", std::format("header declares {} bytes, file has {}", declaredSize, fileSize)));
        }
    }
    return {};
}

VgmResult<void> VgmValidator::quickValidateHeader(const VgmHeader& header) const {
    if (auto ok = validateVersion(header); !ok) {
        return ok;
    }
    if (auto ok = validateChipClocks(header); !ok) {
        return ok;
    }
    return validateChipVolumes(header);
}

VgmResult<void> VgmValidator::validateVersion(const VgmHeader& header) const {
    auto version = decimalVersion(header);
    if (!version) {
        return std::unexpected(version.error());
    }
    if (*version < config_.minVgmVersion || *version > config_.maxVgmVersion) {
        return std::unexpected(VgmError::unsupportedVgmVersion(
            *version,
            std::format("{}-{}", formatVersion(config_.minVgmVersion), formatVersion(config_.maxVgmVersion))));
    }
    return {};
}

VgmResult<void> VgmValidator::validateChipClocks(const VgmHeader& header) {
    for (const auto& range : kClockRanges) {
        const std::uint32_t clock = soundChipClock(header, range.chip) & kChipClockMask;
        if (clock != 0 && (clock < range.minHz || clock > range.maxHz)) {
            return std::unexpected(VgmError::validationFailed(
                std::format("{} clock", soundChipName(range.chip)),
                std::format("Clock {} Hz outside valid range {}-{} Hz", clock, range.minHz, range.maxHz)));
        }
    }
    return {};
}

VgmResult<void> VgmValidator::validateChipVolumes(const VgmHeader& header) {
    if (header.volumeModifier > kMaxVolumeModifier) {
        return std::unexpected(VgmError::validationFailed(
            "volume_modifier",
            std::format("Volume modifier {} exceeds maximum {}", header.volumeModifier, kMaxVolumeModifier)));
    }
    return {};
}

VgmResult<void> VgmValidator::validateHeaderOffsets(const VgmHeader& header, std::size_t fileSize) {
    if (auto ok = checkOffset("vgm_data_offset", header.vgmDataOffset, kDataOffsetBase, fileSize); !ok) {
        return ok;
    }
    if (auto ok = checkOffset("gd3_offset", header.gd3Offset, kGd3OffsetBase, fileSize); !ok) {
        return ok;
    }
    if (auto ok = checkOffset("loop_offset", header.loopOffset, kLoopOffsetBase, fileSize); !ok) {
        return ok;
    }
    return checkOffset("extra_header_offset", header.extraHeaderOffset, kExtraHeaderOffsetBase, fileSize);
}

VgmResult<void> VgmValidator::validateCommands(std::span<const VgmCommand> commands) const {
    if (commands.size() > config_.maxCommands) {
        return std::unexpected(VgmError::dataSizeExceedsLimit("commands", commands.size(), config_.maxCommands));
    }
    for (const auto& command : commands) {
        if (const auto* block = std::get_if<DataBlock>(&command)) {
            const std::uint32_t size = dataBlockSize(block->content);
            if (size > config_.maxDataBlockSize) {
                return std::unexpected(
                    VgmError::dataSizeExceedsLimit("data_block_size", size, config_.maxDataBlockSize));
            }
        }
    }
    return {};
}

VgmResult<void> VgmValidator::validateChipUsage(const VgmHeader& header, std::span<const VgmCommand> commands) {
    for (const auto& command : commands) {
        const auto required = requiredChip(command);
        if (required && soundChipClock(header, *required) == 0) {
            return std::unexpected(VgmError::inconsistentData(
                std::string(kChipUsageContext),
                std::format("{} commands found but no clock configured", soundChipName(*required))));
        }
    }
    return {};
}

}  // namespace vgmtool::vgm
