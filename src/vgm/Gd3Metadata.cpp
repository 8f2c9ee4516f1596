#include "vgmtool/vgm/Gd3Metadata.hpp"

#include "vgmtool/vgm/Utf16.hpp"

#include <algorithm>
#include <vector>

namespace vgmtool::vgm {
namespace {

// Wire order interleaves the two locales.
struct Gd3Slot {
    std::string_view field;
    std::string Gd3Metadata::*direct = nullptr;
    Gd3LocaleData Gd3Metadata::*locale = nullptr;
    std::string Gd3LocaleData::*localeField = nullptr;
};

constexpr std::array<Gd3Slot, kGd3StringCount> kSlots{{
    {"English track", nullptr, &Gd3Metadata::english, &Gd3LocaleData::track},
    {"Japanese track", nullptr, &Gd3Metadata::japanese, &Gd3LocaleData::track},
    {"English game", nullptr, &Gd3Metadata::english, &Gd3LocaleData::game},
    {"Japanese game", nullptr, &Gd3Metadata::japanese, &Gd3LocaleData::game},
    {"English system", nullptr, &Gd3Metadata::english, &Gd3LocaleData::system},
    {"Japanese system", nullptr, &Gd3Metadata::japanese, &Gd3LocaleData::system},
    {"English author", nullptr, &Gd3Metadata::english, &Gd3LocaleData::author},
    {"Japanese author", nullptr, &Gd3Metadata::japanese, &Gd3LocaleData::author},
    {"Release date", &Gd3Metadata::releaseDate, nullptr, nullptr},
    {"VGM creator name", &Gd3Metadata::creator, nullptr, nullptr},
    {"Notes", &Gd3Metadata::notes, nullptr, nullptr},
}};

std::string& slotString(Gd3Metadata& metadata, const Gd3Slot& slot) {
    return slot.direct != nullptr ? metadata.*slot.direct : metadata.*slot.locale.*slot.localeField;
}

const std::string& slotString(const Gd3Metadata& metadata, const Gd3Slot& slot) {
    return slot.direct != nullptr ? metadata.*slot.direct : metadata.*slot.locale.*slot.localeField;
}

}  // namespace

bool hasGd3Magic(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= kGd3Magic.size() && std::equal(kGd3Magic.begin(), kGd3Magic.end(), bytes.begin());
}

VgmResult<Gd3Metadata> decodeGd3(ByteReader& reader, const ParserConfig& config) {
    const std::size_t start = reader.position();
    auto magic = reader.readBytes(kGd3Magic.size());
    if (!magic) {
        return std::unexpected(magic.error());
    }
    if (!hasGd3Magic(*magic)) {
        return std::unexpected(VgmError::invalidMagic(kGd3Magic, std::string(magic->begin(), magic->end()), start));
    }

    auto version = reader.readBytes(kGd3Version.size());
    if (!version) {
        return std::unexpected(version.error());
    }
    if (!std::equal(version->begin(), version->end(), kGd3Version.begin())) {
        const std::uint32_t found = static_cast<std::uint32_t>((*version)[0]) |
                                    (static_cast<std::uint32_t>((*version)[1]) << 8) |
                                    (static_cast<std::uint32_t>((*version)[2]) << 16) |
                                    (static_cast<std::uint32_t>((*version)[3]) << 24);
        return std::unexpected(VgmError::unsupportedGd3Version(found, "1.00"));
    }

    auto length = reader.readU32();
    if (!length) {
        return std::unexpected(length.error());
    }
    if (auto ok = config.checkMetadataSize(*length); !ok) {
        return std::unexpected(ok.error());
    }
    if (*length % 2 != 0) {
        return std::unexpected(VgmError::invalidDataFormat("gd3_length", "UTF-16 data must have even byte count"));
    }
    auto body = reader.readBytes(*length);
    if (!body) {
        return std::unexpected(body.error());
    }

    Gd3Metadata metadata;
    std::size_t slot = 0;
    std::size_t stringStart = 0;
    for (std::size_t i = 0; i + 1 < body->size() && slot < kSlots.size(); i += 2) {
        if ((*body)[i] != 0 || (*body)[i + 1] != 0) {
            continue;
        }
        const std::span<const std::uint8_t> units(body->data() + stringStart, i - stringStart);
        auto text = decodeUtf16Le(units, kSlots[slot].field);
        if (!text) {
            return std::unexpected(text.error());
        }
        slotString(metadata, kSlots[slot]) = std::move(*text);
        ++slot;
        stringStart = i + 2;
    }

    if (slot < kSlots.size()) {
        return std::unexpected(VgmError::invalidDataLength("GD3 metadata fields", kSlots.size(), slot));
    }
    return metadata;
}

VgmResult<Gd3Metadata> decodeGd3(std::span<const std::uint8_t> bytes, const ParserConfig& config) {
    ByteReader reader(bytes);
    return decodeGd3(reader, config);
}

VgmResult<void> encodeGd3(const Gd3Metadata& metadata, ByteWriter& writer) {
    std::vector<std::uint8_t> body;
    for (const auto& slot : kSlots) {
        auto units = encodeUtf16Le(slotString(metadata, slot), slot.field);
        if (!units) {
            return std::unexpected(units.error());
        }
        body.insert(body.end(), units->begin(), units->end());
        body.push_back(0);
        body.push_back(0);
    }

    writer.writeBytes(std::span(reinterpret_cast<const std::uint8_t*>(kGd3Magic.data()), kGd3Magic.size()));
    writer.writeBytes(kGd3Version);
    writer.writeU32(static_cast<std::uint32_t>(body.size()));
    writer.writeBytes(body);
    return {};
}

}  // namespace vgmtool::vgm
