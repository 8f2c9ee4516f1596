#pragma once

#include "vgmtool/vgm/ByteStream.hpp"
#include "vgmtool/vgm/VgmError.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace vgmtool::vgm {

enum class StreamChip : std::uint8_t {
    YM2612,
    RF5C68,
    RF5C164,
    PWM,
    OKIM6258,
    HuC6280,
    SCSP,
    NESAPU,
    Mikey,
    Reserved,
};

enum class RomDumpChip : std::uint8_t {
    SegaPCM,
    YM2608DeltaT,
    YM2610ADPCM,
    YM2610DeltaT,
    YMF278B,
    YMF271,
    YMZ280B,
    YMF278BRAM,
    Y8950DeltaT,
    MultiPCM,
    UPD7759,
    OKIM6295,
    K054539,
    C140,
    K053260,
    QSound,
    ES5505_ES5506,
    X1010,
    C352,
    GA20,
    Reserved,
};

enum class RamWriteChip : std::uint8_t {
    RF5C68,
    RF5C164,
    NESAPU,
    SCSP,
    ES5503,
    Reserved,
};

/// Chip named by a data block type byte. Unknown bytes map to Kind::Reserved
/// and keep the raw byte so nothing is lost.
template <typename Kind>
struct ChipType {
    Kind kind{};
    std::uint8_t reservedValue = 0;

    bool operator==(const ChipType&) const = default;
};

using StreamChipType = ChipType<StreamChip>;
using RomDumpChipType = ChipType<RomDumpChip>;
using RamWriteChipType = ChipType<RamWriteChip>;

StreamChipType streamChipFromBlockType(std::uint8_t blockType);
RomDumpChipType romDumpChipFromBlockType(std::uint8_t blockType);
RamWriteChipType ramWriteChipFromBlockType(std::uint8_t blockType);
std::string_view chipName(StreamChip chip);
std::string_view chipName(RomDumpChip chip);
std::string_view chipName(RamWriteChip chip);

constexpr std::uint8_t kBitPackingCopy = 0x00;
constexpr std::uint8_t kBitPackingShiftLeft = 0x01;
constexpr std::uint8_t kBitPackingTable = 0x02;

struct BitPackingParams {
    std::uint8_t bitsDecompressed = 0;
    std::uint8_t bitsCompressed = 0;
    /// One of kBitPacking*; other values are kept and rejected by decompression.
    std::uint8_t subType = kBitPackingCopy;
    std::uint16_t addValue = 0;

    bool operator==(const BitPackingParams&) const = default;
};

struct DpcmParams {
    std::uint8_t bitsDecompressed = 0;
    std::uint8_t bitsCompressed = 0;
    std::uint8_t reserved = 0;
    std::uint16_t startValue = 0;

    bool operator==(const DpcmParams&) const = default;
};

using CompressionParams = std::variant<BitPackingParams, DpcmParams>;

struct UncompressedStream {
    static constexpr std::string_view name = "UncompressedStream";
    static constexpr std::uint32_t headerSize = 0;
    StreamChipType chipType;
    std::vector<std::uint8_t> data;

    bool operator==(const UncompressedStream&) const = default;
};

struct CompressedStream {
    static constexpr std::string_view name = "CompressedStream";
    static constexpr std::uint32_t headerSize = 10;
    StreamChipType chipType;
    CompressionParams compression;
    std::uint32_t uncompressedSize = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const CompressedStream&) const = default;
};

struct DecompressionTable {
    static constexpr std::string_view name = "DecompressionTable";
    static constexpr std::uint32_t headerSize = 6;
    std::uint8_t compressionType = 0;
    std::uint8_t subType = 0;
    std::uint8_t bitsDecompressed = 0;
    std::uint8_t bitsCompressed = 0;
    std::uint16_t valueCount = 0;
    std::vector<std::uint8_t> tableData;

    bool operator==(const DecompressionTable&) const = default;
};

struct RomDump {
    static constexpr std::string_view name = "ROMDump";
    static constexpr std::uint32_t headerSize = 8;
    RomDumpChipType chipType;
    std::uint32_t totalSize = 0;
    std::uint32_t startAddress = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const RomDump&) const = default;
};

struct RamWriteSmall {
    static constexpr std::string_view name = "RAMWriteSmall";
    static constexpr std::uint32_t headerSize = 2;
    RamWriteChipType chipType;
    std::uint16_t startAddress = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const RamWriteSmall&) const = default;
};

struct RamWriteLarge {
    static constexpr std::string_view name = "RAMWriteLarge";
    static constexpr std::uint32_t headerSize = 4;
    RamWriteChipType chipType;
    std::uint32_t startAddress = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const RamWriteLarge&) const = default;
};

using DataBlockContent =
    std::variant<UncompressedStream, CompressedStream, DecompressionTable, RomDump, RamWriteSmall, RamWriteLarge>;

/// Parses `dataSize` bytes of a 0x67 block body, dispatching on the block type range.
VgmResult<DataBlockContent> decodeDataBlock(std::uint8_t blockType, std::uint32_t dataSize, ByteReader& reader);

/// Writes the shape header and payload; the byte count equals dataBlockSize(content).
void encodeDataBlock(const DataBlockContent& content, ByteWriter& writer);
std::uint32_t dataBlockSize(const DataBlockContent& content);
std::string_view dataBlockShapeName(const DataBlockContent& content);

/// Expands a stream block. Uncompressed streams are returned as is; compressed
/// streams need `table` for table-mode bit packing and DPCM.
VgmResult<std::vector<std::uint8_t>> decompressDataBlock(const DataBlockContent& content,
                                                         std::optional<std::span<const std::uint8_t>> table =
                                                             std::nullopt);

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

}  // namespace vgmtool::vgm
