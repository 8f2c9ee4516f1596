#include "vgmtool/vgm/Compression.hpp"

#include "vgmtool/vgm/BitReader.hpp"

#include <algorithm>
#include <format>

namespace vgmtool::vgm {
namespace {

constexpr std::uint8_t kMaxSymbolBits = 16;
constexpr std::uint8_t kMaxValueBits = 32;

VgmResult<std::size_t> checkWidths(std::uint8_t bitsDecompressed, std::uint8_t bitsCompressed) {
    if (bitsCompressed == 0 || bitsCompressed > kMaxSymbolBits) {
        return std::unexpected(VgmError::invalidDataFormat(
            "bits_compressed", std::format("{} is outside 1-{}", bitsCompressed, kMaxSymbolBits)));
    }
    if (bitsDecompressed == 0 || bitsDecompressed > kMaxValueBits) {
        return std::unexpected(VgmError::invalidDataFormat(
            "bits_decompressed", std::format("{} is outside 1-{}", bitsDecompressed, kMaxValueBits)));
    }
    return (static_cast<std::size_t>(bitsDecompressed) + 7) / 8;
}

void appendValue(std::vector<std::uint8_t>& out, std::uint32_t value, std::size_t bytesPerValue,
                 std::uint32_t uncompressedSize) {
    for (std::size_t i = 0; i < bytesPerValue && out.size() < uncompressedSize; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFFu));
    }
}

VgmResult<std::uint32_t> tableValue(std::span<const std::uint8_t> table, std::uint16_t symbol,
                                    std::size_t bytesPerValue, const char* field) {
    const std::size_t index = static_cast<std::size_t>(symbol) * bytesPerValue;
    if (index + bytesPerValue > table.size()) {
        return std::unexpected(VgmError::invalidDataFormat(
            field, std::format("Table index {} out of bounds (table holds {} bytes)", index, table.size())));
    }
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < bytesPerValue; ++i) {
        value |= static_cast<std::uint32_t>(table[index + i]) << (i * 8);
    }
    return value;
}

// Output the input can actually produce; the declared size alone is untrusted.
std::size_t reserveBound(std::size_t compressedBytes, std::uint8_t bitsCompressed, std::size_t bytesPerValue,
                         std::uint32_t uncompressedSize) {
    const std::size_t symbols = compressedBytes * 8 / bitsCompressed;
    return std::min<std::size_t>(uncompressedSize, symbols * bytesPerValue);
}

}  // namespace

VgmResult<std::vector<std::uint8_t>> decompressBitPacking(std::span<const std::uint8_t> compressed,
                                                          const BitPackingParams& params,
                                                          std::uint32_t uncompressedSize,
                                                          std::optional<std::span<const std::uint8_t>> table) {
    auto bytesPerValue = checkWidths(params.bitsDecompressed, params.bitsCompressed);
    if (!bytesPerValue) {
        return std::unexpected(bytesPerValue.error());
    }

    switch (params.subType) {
    case kBitPackingCopy:
        break;
    case kBitPackingShiftLeft:
        if (params.bitsDecompressed < params.bitsCompressed) {
            return std::unexpected(VgmError::invalidDataFormat(
                "bits_decompressed", std::format("shift mode needs bits_decompressed {} >= bits_compressed {}",
                                                 params.bitsDecompressed, params.bitsCompressed)));
        }
        break;
    case kBitPackingTable:
        if (!table.has_value()) {
            return std::unexpected(VgmError::invalidDataFormat(
                "decompression_table", "Bit packing sub-type 0x02 requires a decompression table"));
        }
        break;
    default:
        return std::unexpected(VgmError::invalidDataFormat(
            "bit_packing_sub_type", std::format("Unknown bit packing sub-type: 0x{:02X}", params.subType)));
    }

    std::vector<std::uint8_t> out;
    out.reserve(reserveBound(compressed.size(), params.bitsCompressed, *bytesPerValue, uncompressedSize));
    BitReader reader(compressed);

    while (out.size() < uncompressedSize) {
        auto symbol = reader.readBits(params.bitsCompressed);
        if (!symbol) {
            return std::unexpected(symbol.error());
        }

        std::uint32_t value = 0;
        if (params.subType == kBitPackingTable) {
            auto looked = tableValue(*table, *symbol, *bytesPerValue, "table_index");
            if (!looked) {
                return std::unexpected(looked.error());
            }
            value = *looked;
        } else {
            const unsigned shift = params.subType == kBitPackingShiftLeft
                                       ? static_cast<unsigned>(params.bitsDecompressed - params.bitsCompressed)
                                       : 0u;
            value = (static_cast<std::uint32_t>(*symbol) << shift) + params.addValue;
        }
        appendValue(out, value, *bytesPerValue, uncompressedSize);
    }

    return out;
}

VgmResult<std::vector<std::uint8_t>> decompressDpcm(std::span<const std::uint8_t> compressed, const DpcmParams& params,
                                                    std::uint32_t uncompressedSize,
                                                    std::optional<std::span<const std::uint8_t>> table) {
    auto bytesPerValue = checkWidths(params.bitsDecompressed, params.bitsCompressed);
    if (!bytesPerValue) {
        return std::unexpected(bytesPerValue.error());
    }
    if (!table.has_value()) {
        return std::unexpected(
            VgmError::invalidDataFormat("decompression_table", "DPCM decompression requires a decompression table"));
    }

    std::vector<std::uint8_t> out;
    out.reserve(reserveBound(compressed.size(), params.bitsCompressed, *bytesPerValue, uncompressedSize));
    BitReader reader(compressed);
    std::uint32_t state = params.startValue;
    const std::size_t valueBits = *bytesPerValue * 8;

    while (out.size() < uncompressedSize) {
        auto symbol = reader.readBits(params.bitsCompressed);
        if (!symbol) {
            return std::unexpected(symbol.error());
        }

        auto delta = tableValue(*table, *symbol, *bytesPerValue, "dpcm_table_index");
        if (!delta) {
            return std::unexpected(delta.error());
        }

        // Sign-extend the delta from its stored width; state wraps modulo 2^32.
        std::uint32_t extended = *delta;
        if (valueBits < 32 && (extended & (1u << (valueBits - 1))) != 0) {
            extended |= ~0u << valueBits;
        }
        state += extended;
        appendValue(out, state, *bytesPerValue, uncompressedSize);
    }

    return out;
}

}  // namespace vgmtool::vgm
