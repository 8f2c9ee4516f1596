#pragma once

#include "vgmtool/vgm/ByteStream.hpp"
#include "vgmtool/vgm/ParserConfig.hpp"
#include "vgmtool/vgm/VgmError.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace vgmtool::vgm {

constexpr std::string_view kGd3Magic = "Gd3 ";
constexpr std::array<std::uint8_t, 4> kGd3Version{0x00, 0x01, 0x00, 0x00};
/// Strings in a GD3 body; extra trailing strings are ignored on decode.
constexpr std::size_t kGd3StringCount = 11;

struct Gd3LocaleData {
    std::string track;
    std::string game;
    std::string system;
    std::string author;

    bool operator==(const Gd3LocaleData&) const = default;
};

struct Gd3Metadata {
    Gd3LocaleData english;
    Gd3LocaleData japanese;
    std::string releaseDate;
    std::string creator;
    std::string notes;

    bool operator==(const Gd3Metadata&) const = default;
};

/// True if `bytes` starts with the GD3 magic.
bool hasGd3Magic(std::span<const std::uint8_t> bytes);

/// Reads one tag at the reader position: magic, version, length, then
/// `length` bytes of NUL-terminated UTF-16LE strings.
VgmResult<Gd3Metadata> decodeGd3(ByteReader& reader, const ParserConfig& config);
VgmResult<Gd3Metadata> decodeGd3(std::span<const std::uint8_t> bytes, const ParserConfig& config = ParserConfig{});

VgmResult<void> encodeGd3(const Gd3Metadata& metadata, ByteWriter& writer);

}  // namespace vgmtool::vgm
