#include "vgmtool/vgm/DataBlock.hpp"

#include "vgmtool/vgm/Compression.hpp"

#include <array>
#include <format>
#include <type_traits>
#include <utility>

namespace vgmtool::vgm {
namespace {

constexpr std::uint8_t kCompressionBitPacking = 0x00;
constexpr std::uint8_t kCompressionDpcm = 0x01;

constexpr std::array<std::string_view, 9> kStreamChipNames = {
    "YM2612", "RF5C68", "RF5C164", "PWM", "OKIM6258", "HuC6280", "SCSP", "NES APU", "Mikey",
};

constexpr std::array<std::string_view, 20> kRomDumpChipNames = {
    "SegaPCM",  "YM2608 DELTA-T", "YM2610 ADPCM", "YM2610 DELTA-T", "YMF278B",       "YMF271", "YMZ280B",
    "YMF278B RAM", "Y8950 DELTA-T", "MultiPCM", "uPD7759",        "OKIM6295",      "K054539", "C140",
    "K053260",  "QSound",         "ES5505/ES5506", "X1-010",       "C352",          "GA20",
};

VgmResult<void> requireHeader(const ByteReader& reader, std::uint32_t headerSize) {
    if (reader.remaining() < headerSize) {
        return std::unexpected(VgmError::bufferUnderflow(reader.position(), headerSize, reader.remaining()));
    }
    return {};
}

VgmResult<std::vector<std::uint8_t>> readPayload(ByteReader& reader, std::uint32_t dataSize, std::uint32_t headerSize) {
    if (dataSize < headerSize) {
        return std::unexpected(VgmError::dataBlockSizeMismatch(dataSize, headerSize));
    }
    return reader.readBytes(dataSize - headerSize);
}

}  // namespace

StreamChipType streamChipFromBlockType(std::uint8_t blockType) {
    const std::uint8_t raw = blockType & 0x3F;
    if (static_cast<std::size_t>(raw) < kStreamChipNames.size()) {
        return StreamChipType{static_cast<StreamChip>(raw), 0};
    }
    return StreamChipType{StreamChip::Reserved, raw};
}

RomDumpChipType romDumpChipFromBlockType(std::uint8_t blockType) {
    if (blockType >= 0x80 && static_cast<std::size_t>(blockType - 0x80) < kRomDumpChipNames.size()) {
        return RomDumpChipType{static_cast<RomDumpChip>(blockType - 0x80), 0};
    }
    return RomDumpChipType{RomDumpChip::Reserved, blockType};
}

RamWriteChipType ramWriteChipFromBlockType(std::uint8_t blockType) {
    switch (blockType) {
    case 0xC0:
        return RamWriteChipType{RamWriteChip::RF5C68, 0};
    case 0xC1:
        return RamWriteChipType{RamWriteChip::RF5C164, 0};
    case 0xC2:
        return RamWriteChipType{RamWriteChip::NESAPU, 0};
    case 0xE0:
        return RamWriteChipType{RamWriteChip::SCSP, 0};
    case 0xE1:
        return RamWriteChipType{RamWriteChip::ES5503, 0};
    default:
        return RamWriteChipType{RamWriteChip::Reserved, blockType};
    }
}

std::string_view chipName(StreamChip chip) {
    const auto index = static_cast<std::size_t>(chip);
    return index < kStreamChipNames.size() ? kStreamChipNames[index] : "Reserved";
}

std::string_view chipName(RomDumpChip chip) {
    const auto index = static_cast<std::size_t>(chip);
    return index < kRomDumpChipNames.size() ? kRomDumpChipNames[index] : "Reserved";
}

std::string_view chipName(RamWriteChip chip) {
    switch (chip) {
    case RamWriteChip::RF5C68:
        return "RF5C68";
    case RamWriteChip::RF5C164:
        return "RF5C164";
    case RamWriteChip::NESAPU:
        return "NES APU";
    case RamWriteChip::SCSP:
        return "SCSP";
    case RamWriteChip::ES5503:
        return "ES5503";
    case RamWriteChip::Reserved:
        break;
    }
    return "Reserved";
}

VgmResult<DataBlockContent> decodeDataBlock(std::uint8_t blockType, std::uint32_t dataSize, ByteReader& reader) {
    if (blockType <= 0x3F) {
        auto data = reader.readBytes(dataSize);
        if (!data) {
            return std::unexpected(data.error());
        }
        return UncompressedStream{streamChipFromBlockType(blockType), std::move(*data)};
    }

    // Fixed-size shape headers are bounds-checked up front, so the reads below cannot fail.
    if (blockType <= 0x7E) {
        if (auto ok = requireHeader(reader, CompressedStream::headerSize); !ok) {
            return std::unexpected(ok.error());
        }
        const std::uint8_t compressionType = *reader.readU8();
        const std::uint32_t uncompressedSize = *reader.readU32();
        const std::uint8_t bitsDecompressed = *reader.readU8();
        const std::uint8_t bitsCompressed = *reader.readU8();
        const std::uint8_t subType = *reader.readU8();
        const std::uint16_t value = *reader.readU16();

        CompressionParams compression;
        if (compressionType == kCompressionBitPacking) {
            compression = BitPackingParams{bitsDecompressed, bitsCompressed, subType, value};
        } else if (compressionType == kCompressionDpcm) {
            compression = DpcmParams{bitsDecompressed, bitsCompressed, subType, value};
        } else {
            return std::unexpected(VgmError::invalidDataFormat(
                "compression_type", std::format("Unknown compression type: 0x{:02X}", compressionType)));
        }

        // Undersized blocks are malformed but still carried with an empty payload.
        const std::uint32_t payloadSize =
            dataSize > CompressedStream::headerSize ? dataSize - CompressedStream::headerSize : 0;
        auto data = reader.readBytes(payloadSize);
        if (!data) {
            return std::unexpected(data.error());
        }
        return CompressedStream{streamChipFromBlockType(blockType), compression, uncompressedSize, std::move(*data)};
    }

    if (blockType == 0x7F) {
        if (auto ok = requireHeader(reader, DecompressionTable::headerSize); !ok) {
            return std::unexpected(ok.error());
        }
        DecompressionTable table;
        table.compressionType = *reader.readU8();
        table.subType = *reader.readU8();
        table.bitsDecompressed = *reader.readU8();
        table.bitsCompressed = *reader.readU8();
        table.valueCount = *reader.readU16();
        auto data = readPayload(reader, dataSize, DecompressionTable::headerSize);
        if (!data) {
            return std::unexpected(data.error());
        }
        table.tableData = std::move(*data);
        return table;
    }

    if (blockType <= 0xBF) {
        if (auto ok = requireHeader(reader, RomDump::headerSize); !ok) {
            return std::unexpected(ok.error());
        }
        const std::uint32_t totalSize = *reader.readU32();
        const std::uint32_t startAddress = *reader.readU32();
        auto data = readPayload(reader, dataSize, RomDump::headerSize);
        if (!data) {
            return std::unexpected(data.error());
        }
        return RomDump{romDumpChipFromBlockType(blockType), totalSize, startAddress, std::move(*data)};
    }

    if (blockType <= 0xDF) {
        auto startAddress = reader.readU16();
        if (!startAddress) {
            return std::unexpected(startAddress.error());
        }
        auto data = readPayload(reader, dataSize, RamWriteSmall::headerSize);
        if (!data) {
            return std::unexpected(data.error());
        }
        return RamWriteSmall{ramWriteChipFromBlockType(blockType), *startAddress, std::move(*data)};
    }

    auto startAddress = reader.readU32();
    if (!startAddress) {
        return std::unexpected(startAddress.error());
    }
    auto data = readPayload(reader, dataSize, RamWriteLarge::headerSize);
    if (!data) {
        return std::unexpected(data.error());
    }
    return RamWriteLarge{ramWriteChipFromBlockType(blockType), *startAddress, std::move(*data)};
}

void encodeDataBlock(const DataBlockContent& content, ByteWriter& writer) {
    std::visit(overloaded{
                   [&](const UncompressedStream& block) { writer.writeBytes(block.data); },
                   [&](const CompressedStream& block) {
                       std::visit(overloaded{
                                      [&](const BitPackingParams& params) {
                                          writer.writeU8(kCompressionBitPacking);
                                          writer.writeU32(block.uncompressedSize);
                                          writer.writeU8(params.bitsDecompressed);
                                          writer.writeU8(params.bitsCompressed);
                                          writer.writeU8(params.subType);
                                          writer.writeU16(params.addValue);
                                      },
                                      [&](const DpcmParams& params) {
                                          writer.writeU8(kCompressionDpcm);
                                          writer.writeU32(block.uncompressedSize);
                                          writer.writeU8(params.bitsDecompressed);
                                          writer.writeU8(params.bitsCompressed);
                                          writer.writeU8(params.reserved);
                                          writer.writeU16(params.startValue);
                                      },
                                  },
                                  block.compression);
                       writer.writeBytes(block.data);
                   },
                   [&](const DecompressionTable& block) {
                       writer.writeU8(block.compressionType);
                       writer.writeU8(block.subType);
                       writer.writeU8(block.bitsDecompressed);
                       writer.writeU8(block.bitsCompressed);
                       writer.writeU16(block.valueCount);
                       writer.writeBytes(block.tableData);
                   },
                   [&](const RomDump& block) {
                       writer.writeU32(block.totalSize);
                       writer.writeU32(block.startAddress);
                       writer.writeBytes(block.data);
                   },
                   [&](const RamWriteSmall& block) {
                       writer.writeU16(block.startAddress);
                       writer.writeBytes(block.data);
                   },
                   [&](const RamWriteLarge& block) {
                       writer.writeU32(block.startAddress);
                       writer.writeBytes(block.data);
                   },
               },
               content);
}

std::uint32_t dataBlockSize(const DataBlockContent& content) {
    return std::visit(
        overloaded{
            [](const DecompressionTable& block) {
                return DecompressionTable::headerSize + static_cast<std::uint32_t>(block.tableData.size());
            },
            [](const auto& block) {
                return std::decay_t<decltype(block)>::headerSize + static_cast<std::uint32_t>(block.data.size());
            },
        },
        content);
}

std::string_view dataBlockShapeName(const DataBlockContent& content) {
    return std::visit([](const auto& block) { return std::decay_t<decltype(block)>::name; }, content);
}

VgmResult<std::vector<std::uint8_t>> decompressDataBlock(const DataBlockContent& content,
                                                         std::optional<std::span<const std::uint8_t>> table) {
    if (const auto* stream = std::get_if<UncompressedStream>(&content)) {
        return stream->data;
    }
    const auto* stream = std::get_if<CompressedStream>(&content);
    if (stream == nullptr) {
        return std::unexpected(VgmError::invalidDataFormat(
            "data_block", std::format("Cannot decompress {} blocks", dataBlockShapeName(content))));
    }

    return std::visit(overloaded{
                          [&](const BitPackingParams& params) {
                              return decompressBitPacking(stream->data, params, stream->uncompressedSize, table);
                          },
                          [&](const DpcmParams& params) {
                              return decompressDpcm(stream->data, params, stream->uncompressedSize, table);
                          },
                      },
                      stream->compression);
}

}  // namespace vgmtool::vgm
