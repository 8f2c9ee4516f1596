#pragma once

#include "vgmtool/vgm/VgmFile.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace vgmtool::vgm::test_helpers {

inline void writeU32(std::vector<std::uint8_t>& bytes, std::size_t position, std::uint32_t value) {
    if (bytes.size() < position + 4) {
        bytes.resize(position + 4, 0);
    }
    bytes[position] = static_cast<std::uint8_t>(value & 0xFFu);
    bytes[position + 1] = static_cast<std::uint8_t>((value >> 8) & 0xFFu);
    bytes[position + 2] = static_cast<std::uint8_t>((value >> 16) & 0xFFu);
    bytes[position + 3] = static_cast<std::uint8_t>((value >> 24) & 0xFFu);
}

inline std::uint32_t readU32(std::span<const std::uint8_t> bytes, std::size_t position) {
    return static_cast<std::uint32_t>(bytes[position]) | (static_cast<std::uint32_t>(bytes[position + 1]) << 8) |
           (static_cast<std::uint32_t>(bytes[position + 2]) << 16) |
           (static_cast<std::uint32_t>(bytes[position + 3]) << 24);
}

inline void appendAscii(std::vector<std::uint8_t>& bytes, std::string_view text) {
    bytes.insert(bytes.end(), text.begin(), text.end());
}

// Header with the given data offset (command stream at 0x34 + dataOffset),
// an SN76489 clock, then `commands`. eofOffset is patched to the final size.
inline std::vector<std::uint8_t> buildVgmBytes(std::span<const std::uint8_t> commands, std::uint32_t dataOffset = 0x0C,
                                               std::uint32_t version = 0x00000151) {
    const std::size_t start = dataOffset == 0 ? 0x40 : 0x34 + static_cast<std::size_t>(dataOffset);
    std::vector<std::uint8_t> bytes(start, 0);
    bytes[0] = 'V';
    bytes[1] = 'g';
    bytes[2] = 'm';
    bytes[3] = ' ';
    writeU32(bytes, 0x08, version);
    writeU32(bytes, 0x0C, 3'579'545);
    writeU32(bytes, 0x34, dataOffset);
    bytes.insert(bytes.end(), commands.begin(), commands.end());
    writeU32(bytes, 0x04, static_cast<std::uint32_t>(bytes.size() - 4));
    return bytes;
}

inline VgmHeader makePsgHeader() {
    VgmHeader header;
    header.version = 0x00000151;
    header.sn76489Clock = 3'579'545;
    header.rate = 60;
    header.sn76489Feedback = 0x0009;
    header.sn76489ShiftWidth = 16;
    header.vgmDataOffset = 0x0C;
    return header;
}

inline Gd3Metadata makeMetadata() {
    Gd3Metadata metadata;
    metadata.english = {"Green Hill Zone", "Sonic the Hedgehog", "Sega Mega Drive", "Masato Nakamura"};
    metadata.japanese = {"\xE3\x82\xB0\xE3\x83\xAA\xE3\x83\xBC\xE3\x83\xB3", "", "", ""};
    metadata.releaseDate = "1991/06/23";
    metadata.creator = "vgmtool";
    metadata.notes = "";
    return metadata;
}

inline VgmFile makePsgFile() {
    VgmFile file;
    file.header = makePsgHeader();
    file.commands = {
        PSGWrite{0x9F, 0},
        WaitNSamples{735},
        PSGWrite{0x80, 0},
        Wait882Samples{},
        WaitNSamplesPlus1{15},
        EndOfSoundData{},
    };
    return file;
}

}  // namespace vgmtool::vgm::test_helpers
