#include "vgmtool/vgm/VgmFile.hpp"

#include "vgmtool/vgm/CommandCodec.hpp"

#include <algorithm>
#include <utility>

namespace vgmtool::vgm {

bool VgmFile::hasDataBlock() const {
    return std::ranges::any_of(commands, [](const VgmCommand& cmd) { return std::holds_alternative<DataBlock>(cmd); });
}

bool VgmFile::hasPcmRamWrite() const {
    return std::ranges::any_of(commands,
                               [](const VgmCommand& cmd) { return std::holds_alternative<PCMRAMWrite>(cmd); });
}

std::uint64_t VgmFile::totalWaitSamples() const {
    std::uint64_t total = 0;
    for (const auto& cmd : commands) {
        total += commandWaitSamples(cmd);
    }
    return total;
}

VgmResult<VgmFile> decodeFile(std::span<const std::uint8_t> bytes, const ParserConfig& config,
                              ResourceTracker& tracker) {
    auto guard = ParsingContextGuard::enter(tracker, config, 0);
    if (!guard) {
        return std::unexpected(guard.error());
    }

    ByteReader reader(bytes);
    VgmFile file;

    auto header = decodeHeader(reader, config, tracker);
    if (!header) {
        return std::unexpected(header.error());
    }
    file.header = std::move(*header);

    auto commands = decodeCommandStream(reader, config, tracker);
    if (!commands) {
        return std::unexpected(commands.error());
    }
    file.commands = std::move(*commands);

    if (file.header.gd3Offset != 0) {
        const std::uint64_t gd3Pos = std::uint64_t{kGd3OffsetBase} + file.header.gd3Offset;
        if (gd3Pos < reader.position() || gd3Pos > bytes.size()) {
            return std::unexpected(VgmError::invalidOffset("gd3_offset", file.header.gd3Offset, bytes.size()));
        }
        if (auto ok = reader.seek(static_cast<std::size_t>(gd3Pos)); !ok) {
            return std::unexpected(ok.error());
        }
        auto metadata = decodeGd3(reader, config);
        if (!metadata) {
            return std::unexpected(metadata.error());
        }
        file.metadata = std::move(*metadata);
    } else if (hasGd3Magic(bytes.subspan(reader.position()))) {
        auto metadata = decodeGd3(reader, config);
        if (!metadata) {
            return std::unexpected(metadata.error());
        }
        file.metadata = std::move(*metadata);
    }
    return file;
}

VgmResult<VgmFile> decodeFile(std::span<const std::uint8_t> bytes, const ParserConfig& config) {
    ResourceTracker tracker;
    return decodeFile(bytes, config, tracker);
}

VgmResult<std::vector<std::uint8_t>> encodeFile(const VgmFile& file) {
    ByteWriter writer;
    if (auto ok = encodeHeader(file.header, writer); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = encodeCommands(file.commands, writer); !ok) {
        return std::unexpected(ok.error());
    }

    std::uint32_t gd3Offset = 0;
    if (file.metadata) {
        gd3Offset = static_cast<std::uint32_t>(writer.size() - kGd3OffsetBase);
        if (auto ok = encodeGd3(*file.metadata, writer); !ok) {
            return std::unexpected(ok.error());
        }
    }

    if (auto ok = writer.patchU32(kGd3OffsetBase, gd3Offset); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = writer.patchU32(kEofOffsetBase, static_cast<std::uint32_t>(writer.size() - kEofOffsetBase));
        !ok) {
        return std::unexpected(ok.error());
    }
    return writer.take();
}

}  // namespace vgmtool::vgm
