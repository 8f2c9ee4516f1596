#include "vgmtool/vgm/VgmHeader.hpp"

#include "vgmtool/vgm/Bcd.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <string>
#include <type_traits>
#include <utility>

namespace vgmtool::vgm {
namespace {

struct FieldDescriptor {
    std::string_view name;
    std::uint32_t offset;
    std::uint8_t width;
    std::uint32_t (*get)(const VgmHeader&);
    void (*set)(VgmHeader&, std::uint32_t);
};

template <auto Member>
constexpr FieldDescriptor field(std::uint32_t offset, std::string_view name) {
    using Value = std::remove_cvref_t<decltype(std::declval<VgmHeader&>().*Member)>;
    return FieldDescriptor{
        name,
        offset,
        static_cast<std::uint8_t>(sizeof(Value)),
        [](const VgmHeader& header) -> std::uint32_t { return header.*Member; },
        [](VgmHeader& header, std::uint32_t value) { header.*Member = static_cast<Value>(value); },
    };
}

// 0x04-0x34, always present.
constexpr std::array kPrefixFields{
    field<&VgmHeader::eofOffset>(0x04, "eofOffset"),
    field<&VgmHeader::version>(0x08, "version"),
    field<&VgmHeader::sn76489Clock>(0x0C, "sn76489Clock"),
    field<&VgmHeader::ym2413Clock>(0x10, "ym2413Clock"),
    field<&VgmHeader::gd3Offset>(0x14, "gd3Offset"),
    field<&VgmHeader::totalSamples>(0x18, "totalSamples"),
    field<&VgmHeader::loopOffset>(0x1C, "loopOffset"),
    field<&VgmHeader::loopSamples>(0x20, "loopSamples"),
    field<&VgmHeader::rate>(0x24, "rate"),
    field<&VgmHeader::sn76489Feedback>(0x28, "sn76489Feedback"),
    field<&VgmHeader::sn76489ShiftWidth>(0x2A, "sn76489ShiftWidth"),
    field<&VgmHeader::sn76489Flags>(0x2B, "sn76489Flags"),
    field<&VgmHeader::ym2612Clock>(0x2C, "ym2612Clock"),
    field<&VgmHeader::ym2151Clock>(0x30, "ym2151Clock"),
    field<&VgmHeader::vgmDataOffset>(0x34, "vgmDataOffset"),
};

// 0x38 onwards, each present only if it ends at or before the stop position.
constexpr std::array kGatedFields{
    field<&VgmHeader::segaPcmClock>(0x38, "segaPcmClock"),
    field<&VgmHeader::segaPcmInterfaceRegister>(0x3C, "segaPcmInterfaceRegister"),
    field<&VgmHeader::rf5c68Clock>(0x40, "rf5c68Clock"),
    field<&VgmHeader::ym2203Clock>(0x44, "ym2203Clock"),
    field<&VgmHeader::ym2608Clock>(0x48, "ym2608Clock"),
    field<&VgmHeader::ym2610Clock>(0x4C, "ym2610Clock"),
    field<&VgmHeader::ym3812Clock>(0x50, "ym3812Clock"),
    field<&VgmHeader::ym3526Clock>(0x54, "ym3526Clock"),
    field<&VgmHeader::y8950Clock>(0x58, "y8950Clock"),
    field<&VgmHeader::ymf262Clock>(0x5C, "ymf262Clock"),
    field<&VgmHeader::ymf278bClock>(0x60, "ymf278bClock"),
    field<&VgmHeader::ymf271Clock>(0x64, "ymf271Clock"),
    field<&VgmHeader::ymz280bClock>(0x68, "ymz280bClock"),
    field<&VgmHeader::rf5c164Clock>(0x6C, "rf5c164Clock"),
    field<&VgmHeader::pwmClock>(0x70, "pwmClock"),
    field<&VgmHeader::ay8910Clock>(0x74, "ay8910Clock"),
    field<&VgmHeader::ay8910ChipType>(0x78, "ay8910ChipType"),
    field<&VgmHeader::ay8910Flags>(0x79, "ay8910Flags"),
    field<&VgmHeader::ym2203AyFlags>(0x7A, "ym2203AyFlags"),
    field<&VgmHeader::ym2608AyFlags>(0x7B, "ym2608AyFlags"),
    field<&VgmHeader::volumeModifier>(0x7C, "volumeModifier"),
    field<&VgmHeader::reserved7D>(0x7D, "reserved7D"),
    field<&VgmHeader::loopBase>(0x7E, "loopBase"),
    field<&VgmHeader::loopModifier>(0x7F, "loopModifier"),
    field<&VgmHeader::gameBoyDmgClock>(0x80, "gameBoyDmgClock"),
    field<&VgmHeader::nesApuClock>(0x84, "nesApuClock"),
    field<&VgmHeader::multiPcmClock>(0x88, "multiPcmClock"),
    field<&VgmHeader::upd7759Clock>(0x8C, "upd7759Clock"),
    field<&VgmHeader::okim6258Clock>(0x90, "okim6258Clock"),
    field<&VgmHeader::okim6258Flags>(0x94, "okim6258Flags"),
    field<&VgmHeader::k054539Flags>(0x95, "k054539Flags"),
    field<&VgmHeader::c140ChipType>(0x96, "c140ChipType"),
    field<&VgmHeader::reserved97>(0x97, "reserved97"),
    field<&VgmHeader::okim6295Clock>(0x98, "okim6295Clock"),
    field<&VgmHeader::k051649Clock>(0x9C, "k051649Clock"),
    field<&VgmHeader::k054539Clock>(0xA0, "k054539Clock"),
    field<&VgmHeader::huc6280Clock>(0xA4, "huc6280Clock"),
    field<&VgmHeader::c140Clock>(0xA8, "c140Clock"),
    field<&VgmHeader::k053260Clock>(0xAC, "k053260Clock"),
    field<&VgmHeader::pokeyClock>(0xB0, "pokeyClock"),
    field<&VgmHeader::qsoundClock>(0xB4, "qsoundClock"),
    field<&VgmHeader::scspClock>(0xB8, "scspClock"),
    field<&VgmHeader::extraHeaderOffset>(0xBC, "extraHeaderOffset"),
    field<&VgmHeader::wonderSwanClock>(0xC0, "wonderSwanClock"),
    field<&VgmHeader::vsuClock>(0xC4, "vsuClock"),
    field<&VgmHeader::saa1099Clock>(0xC8, "saa1099Clock"),
    field<&VgmHeader::es5503Clock>(0xCC, "es5503Clock"),
    field<&VgmHeader::es5506Clock>(0xD0, "es5506Clock"),
    field<&VgmHeader::es5503Channels>(0xD4, "es5503Channels"),
    field<&VgmHeader::es5506Channels>(0xD5, "es5506Channels"),
    field<&VgmHeader::c352ClockDivider>(0xD6, "c352ClockDivider"),
    field<&VgmHeader::reservedD7>(0xD7, "reservedD7"),
    field<&VgmHeader::x1010Clock>(0xD8, "x1010Clock"),
    field<&VgmHeader::c352Clock>(0xDC, "c352Clock"),
    field<&VgmHeader::ga20Clock>(0xE0, "ga20Clock"),
};

template <std::size_t N>
constexpr bool isContiguous(const std::array<FieldDescriptor, N>& fields, std::uint32_t start, std::uint32_t end) {
    std::uint32_t cursor = start;
    for (const auto& f : fields) {
        if (f.offset != cursor) {
            return false;
        }
        cursor += f.width;
    }
    return cursor == end;
}

static_assert(isContiguous(kPrefixFields, 0x04, 0x38));
static_assert(isContiguous(kGatedFields, 0x38, kMaxFieldExtent));

constexpr std::uint64_t kExtraHeaderFixedSize = 12;
constexpr std::uint64_t kChipClockEntrySize = 5;
constexpr std::uint64_t kChipVolumeEntrySize = 4;
constexpr std::string_view kExtraHeaderContext = "Extra header";

VgmResult<std::uint32_t> readField(ByteReader& reader, std::uint8_t width) {
    switch (width) {
    case 1:
        return reader.readU8().transform([](std::uint8_t v) { return static_cast<std::uint32_t>(v); });
    case 2:
        return reader.readU16().transform([](std::uint16_t v) { return static_cast<std::uint32_t>(v); });
    default:
        return reader.readU32();
    }
}

void writeField(ByteWriter& writer, std::uint8_t width, std::uint32_t value) {
    switch (width) {
    case 1:
        writer.writeU8(static_cast<std::uint8_t>(value));
        break;
    case 2:
        writer.writeU16(static_cast<std::uint16_t>(value));
        break;
    default:
        writer.writeU32(value);
        break;
    }
}

struct FieldWalk {
    std::uint64_t cursor = 0;
    std::optional<std::uint64_t> extraPos;
};

// Visits gated fields in order until the next one would cross the stop
// position, or the extra header position once extra_header_offset has been
// visited. Decoder and encoder share this walk so both halt at the same field.
template <typename Header, typename Visit>
VgmResult<FieldWalk> walkGatedFields(Header& header, std::uint64_t stop, Visit&& visit) {
    FieldWalk walk{kGatedFields.front().offset, std::nullopt};
    for (const auto& f : kGatedFields) {
        const std::uint64_t limit = walk.extraPos ? std::min(stop, *walk.extraPos) : stop;
        if (walk.cursor + f.width > limit) {
            break;
        }
        if (auto ok = visit(f); !ok) {
            return std::unexpected(ok.error());
        }
        walk.cursor += f.width;

        if (f.offset == kExtraHeaderOffsetBase && header.extraHeaderOffset != 0) {
            const std::uint64_t extraPos = std::uint64_t{kExtraHeaderOffsetBase} + header.extraHeaderOffset;
            if (extraPos < walk.cursor) {
                return std::unexpected(VgmError::inconsistentData(
                    std::string(kExtraHeaderContext),
                    std::format("extra header at 0x{:X} overlaps the header fields ending at 0x{:X}", extraPos,
                                walk.cursor)));
            }
            if (extraPos + kExtraHeaderFixedSize > stop) {
                return std::unexpected(VgmError::inconsistentData(
                    std::string(kExtraHeaderContext),
                    std::format("extra header at 0x{:X} overruns the command stream start 0x{:X}", extraPos, stop)));
            }
            walk.extraPos = extraPos;
        }
    }
    return walk;
}

enum class ExtraSection { Clocks, Volumes };

// Present sections with their header-relative positions, in ascending order.
std::vector<std::pair<std::uint64_t, ExtraSection>> extraSections(std::uint64_t extraPos, const ExtraHeader& extra) {
    std::vector<std::pair<std::uint64_t, ExtraSection>> sections;
    if (extra.chipClockOffset != 0) {
        sections.emplace_back(extraPos + 4 + extra.chipClockOffset, ExtraSection::Clocks);
    }
    if (extra.chipVolumeOffset != 0) {
        sections.emplace_back(extraPos + 8 + extra.chipVolumeOffset, ExtraSection::Volumes);
    }
    std::sort(sections.begin(), sections.end());
    return sections;
}

VgmError sectionOverlap(std::uint64_t position, std::uint64_t cursor) {
    return VgmError::inconsistentData(
        std::string(kExtraHeaderContext),
        std::format("section at 0x{:X} overlaps data ending at 0x{:X}", position, cursor));
}

VgmError sectionOverrun(std::uint64_t end, std::uint64_t stop) {
    return VgmError::inconsistentData(
        std::string(kExtraHeaderContext),
        std::format("section ending at 0x{:X} overruns the command stream start 0x{:X}", end, stop));
}

VgmResult<ExtraHeader> decodeExtraHeader(ByteReader& reader, std::size_t base, std::uint64_t extraPos,
                                         std::uint64_t stop, const ParserConfig& config) {
    if (auto ok = reader.seek(base + extraPos); !ok) {
        return std::unexpected(ok.error());
    }
    ExtraHeader extra;
    extra.headerSize = *reader.readU32();
    extra.chipClockOffset = *reader.readU32();
    extra.chipVolumeOffset = *reader.readU32();

    std::uint64_t cursor = extraPos + kExtraHeaderFixedSize;
    for (const auto& [position, section] : extraSections(extraPos, extra)) {
        if (position < cursor) {
            return std::unexpected(sectionOverlap(position, cursor));
        }
        if (position + 1 > stop) {
            return std::unexpected(sectionOverrun(position + 1, stop));
        }
        if (auto ok = reader.seek(base + position); !ok) {
            return std::unexpected(ok.error());
        }
        const std::uint8_t count = *reader.readU8();
        const bool clocks = section == ExtraSection::Clocks;
        if (auto ok = config.checkChipEntries(clocks ? count : 0, clocks ? 0 : count); !ok) {
            return std::unexpected(ok.error());
        }
        const std::uint64_t end = position + 1 + count * (clocks ? kChipClockEntrySize : kChipVolumeEntrySize);
        if (end > stop) {
            return std::unexpected(sectionOverrun(end, stop));
        }

        for (std::uint8_t i = 0; i < count; ++i) {
            if (clocks) {
                ChipClockEntry entry;
                entry.chipId = *reader.readU8();
                entry.clock = *reader.readU32();
                extra.chipClocks.push_back(entry);
            } else {
                ChipVolumeEntry entry;
                entry.chipId = *reader.readU8();
                entry.flags = *reader.readU8();
                entry.volume = *reader.readU16();
                extra.chipVolumes.push_back(entry);
            }
        }
        cursor = end;
    }
    return extra;
}

VgmResult<void> encodeExtraHeader(const ExtraHeader& extra, ByteWriter& writer, std::size_t base,
                                  std::uint64_t extraPos, std::uint64_t stop) {
    if (extra.chipClockOffset == 0 && !extra.chipClocks.empty()) {
        return std::unexpected(VgmError::inconsistentData(std::string(kExtraHeaderContext),
                                                          "chip clock entries without a chip clock offset"));
    }
    if (extra.chipVolumeOffset == 0 && !extra.chipVolumes.empty()) {
        return std::unexpected(VgmError::inconsistentData(std::string(kExtraHeaderContext),
                                                          "chip volume entries without a chip volume offset"));
    }
    if (extra.chipClocks.size() > 0xFF || extra.chipVolumes.size() > 0xFF) {
        return std::unexpected(VgmError::invalidDataFormat("extra_header", "more than 255 entries in one section"));
    }

    writer.padTo(base + extraPos);
    writer.writeU32(extra.headerSize);
    writer.writeU32(extra.chipClockOffset);
    writer.writeU32(extra.chipVolumeOffset);

    std::uint64_t cursor = extraPos + kExtraHeaderFixedSize;
    for (const auto& [position, section] : extraSections(extraPos, extra)) {
        if (position < cursor) {
            return std::unexpected(sectionOverlap(position, cursor));
        }
        const bool clocks = section == ExtraSection::Clocks;
        const std::size_t count = clocks ? extra.chipClocks.size() : extra.chipVolumes.size();
        const std::uint64_t end = position + 1 + count * (clocks ? kChipClockEntrySize : kChipVolumeEntrySize);
        if (end > stop) {
            return std::unexpected(sectionOverrun(end, stop));
        }

        writer.padTo(base + position);
        writer.writeU8(static_cast<std::uint8_t>(count));
        if (clocks) {
            for (const auto& entry : extra.chipClocks) {
                writer.writeU8(entry.chipId);
                writer.writeU32(entry.clock);
            }
        } else {
            for (const auto& entry : extra.chipVolumes) {
                writer.writeU8(entry.chipId);
                writer.writeU8(entry.flags);
                writer.writeU16(entry.volume);
            }
        }
        cursor = end;
    }
    return {};
}

}  // namespace

VgmResult<std::uint64_t> commandStreamStart(const VgmHeader& header) {
    if (header.vgmDataOffset == 0) {
        return kLegacyDataStart;
    }
    const std::uint64_t stop = std::uint64_t{kDataOffsetBase} + header.vgmDataOffset;
    if (stop < kGatedFields.front().offset) {
        return std::unexpected(VgmError::invalidOffset("vgm_data_offset", header.vgmDataOffset, stop));
    }
    return stop;
}

VgmResult<VgmHeader> decodeHeader(ByteReader& reader, const ParserConfig& config, ResourceTracker& tracker) {
    const std::size_t base = reader.position();
    auto guard = ParsingContextGuard::enter(tracker, config, base);
    if (!guard) {
        return std::unexpected(guard.error());
    }

    auto magic = reader.readBytes(kVgmMagic.size());
    if (!magic) {
        return std::unexpected(magic.error());
    }
    if (!std::equal(magic->begin(), magic->end(), kVgmMagic.begin())) {
        return std::unexpected(VgmError::invalidMagic(kVgmMagic, std::string(magic->begin(), magic->end()), base));
    }

    VgmHeader header;
    for (const auto& f : kPrefixFields) {
        auto value = readField(reader, f.width);
        if (!value) {
            return std::unexpected(value.error());
        }
        f.set(header, *value);
    }

    auto stop = commandStreamStart(header);
    if (!stop) {
        return std::unexpected(stop.error());
    }
    const std::uint64_t available = reader.size() - base;
    if (*stop > available) {
        return std::unexpected(VgmError::invalidOffset("vgm_data_offset", *stop, available));
    }

    auto walk = walkGatedFields(header, *stop, [&](const FieldDescriptor& f) -> VgmResult<void> {
        auto value = readField(reader, f.width);
        if (!value) {
            return std::unexpected(value.error());
        }
        f.set(header, *value);
        return {};
    });
    if (!walk) {
        return std::unexpected(walk.error());
    }

    if (walk->extraPos) {
        auto extra = decodeExtraHeader(reader, base, *walk->extraPos, *stop, config);
        if (!extra) {
            return std::unexpected(extra.error());
        }
        header.extraHeader = std::move(*extra);
    }

    if (auto ok = reader.seek(base + *stop); !ok) {
        return std::unexpected(ok.error());
    }
    return header;
}

VgmResult<VgmHeader> decodeHeader(std::span<const std::uint8_t> bytes, const ParserConfig& config) {
    ByteReader reader(bytes);
    ResourceTracker tracker;
    return decodeHeader(reader, config, tracker);
}

VgmResult<void> encodeHeader(const VgmHeader& header, ByteWriter& writer) {
    auto stop = commandStreamStart(header);
    if (!stop) {
        return std::unexpected(stop.error());
    }

    const std::size_t base = writer.size();
    writer.writeBytes(std::span(reinterpret_cast<const std::uint8_t*>(kVgmMagic.data()), kVgmMagic.size()));
    for (const auto& f : kPrefixFields) {
        writeField(writer, f.width, f.get(header));
    }

    auto walk = walkGatedFields(header, *stop, [&](const FieldDescriptor& f) -> VgmResult<void> {
        writeField(writer, f.width, f.get(header));
        return {};
    });
    if (!walk) {
        return std::unexpected(walk.error());
    }

    if (walk->extraPos.has_value() != header.extraHeader.has_value()) {
        return std::unexpected(VgmError::inconsistentData(
            std::string(kExtraHeaderContext),
            walk->extraPos ? "extra_header_offset is set but no extra header is attached"
                           : "extra header attached but extra_header_offset is zero or outside the header"));
    }
    if (walk->extraPos) {
        if (auto ok = encodeExtraHeader(*header.extraHeader, writer, base, *walk->extraPos, *stop); !ok) {
            return ok;
        }
    }

    writer.padTo(base + *stop);
    return {};
}

VgmResult<std::vector<HeaderFieldValue>> headerFields(const VgmHeader& header) {
    auto stop = commandStreamStart(header);
    if (!stop) {
        return std::unexpected(stop.error());
    }
    std::vector<HeaderFieldValue> fields;
    for (const auto& f : kPrefixFields) {
        fields.push_back(HeaderFieldValue{f.name, f.offset, f.width, f.get(header), true});
    }
    auto walk = walkGatedFields(header, *stop, [&](const FieldDescriptor& f) -> VgmResult<void> {
        fields.push_back(HeaderFieldValue{f.name, f.offset, f.width, f.get(header), true});
        return {};
    });
    if (!walk) {
        return std::unexpected(walk.error());
    }
    for (std::size_t i = fields.size() - kPrefixFields.size(); i < kGatedFields.size(); ++i) {
        const auto& f = kGatedFields[i];
        fields.push_back(HeaderFieldValue{f.name, f.offset, f.width, f.get(header), false});
    }
    return fields;
}

VgmResult<std::uint32_t> decimalVersion(const VgmHeader& header) {
    const std::array<std::uint8_t, 4> bytes{
        static_cast<std::uint8_t>(header.version & 0xFF),
        static_cast<std::uint8_t>((header.version >> 8) & 0xFF),
        static_cast<std::uint8_t>((header.version >> 16) & 0xFF),
        static_cast<std::uint8_t>((header.version >> 24) & 0xFF),
    };
    return bcdFromBytes(bytes);
}

}  // namespace vgmtool::vgm
