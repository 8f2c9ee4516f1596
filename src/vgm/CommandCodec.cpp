#include "vgmtool/vgm/CommandCodec.hpp"

#include "vgmtool/common/Log.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <utility>

namespace vgmtool::vgm {
namespace {

constexpr std::uint8_t kCompatibilityByte = 0x66;
constexpr std::uint32_t kPcmRamWriteZeroSize = 0x01000000;

template <typename T>
concept SecondChipOpcode = requires { T::secondChipId; };

template <typename T>
concept ChipInRegisterBit = requires { T::chipInRegisterBit; };

template <typename T>
T readOpcodeChipWrite(ByteReader& reader, std::uint8_t chipIndex) {
    T cmd{};
    if constexpr (requires { cmd.reg; }) {
        cmd.reg = *reader.readU8();
    }
    cmd.value = *reader.readU8();
    cmd.chipIndex = chipIndex;
    return cmd;
}

template <typename T>
T readRegisterBitChipWrite(ByteReader& reader) {
    T cmd{};
    const std::uint8_t raw = *reader.readU8();
    cmd.chipIndex = raw >> 7;
    cmd.reg = raw & 0x7F;
    cmd.value = *reader.readU8();
    return cmd;
}

template <typename T>
T readOffsetWrite(ByteReader& reader, bool bigEndianOffset) {
    T cmd{};
    cmd.offset = bigEndianOffset ? *reader.readU16Be() : *reader.readU16();
    cmd.value = *reader.readU8();
    return cmd;
}

template <typename T>
T readPortWrite(ByteReader& reader) {
    T cmd{};
    cmd.port = *reader.readU8();
    cmd.reg = *reader.readU8();
    cmd.value = *reader.readU8();
    return cmd;
}

// D3-D5: register is pp<<8 | aa.
template <typename T>
T readPagedRegisterWrite(ByteReader& reader) {
    T cmd{};
    const std::uint8_t page = *reader.readU8();
    const std::uint8_t low = *reader.readU8();
    cmd.reg = static_cast<std::uint16_t>((page << 8) | low);
    cmd.value = *reader.readU8();
    return cmd;
}

VgmError compatibilityByteError(std::uint8_t opcode, std::size_t position, std::uint8_t found) {
    VgmError error = VgmError::invalidCommandParameters(
        opcode, position,
        std::format("expected compatibility byte 0x{:02X}, found 0x{:02X}", kCompatibilityByte, found));
    error.expected = kCompatibilityByte;
    error.actual = found;
    return error;
}

VgmResult<VgmCommand> readDataBlockCommand(ByteReader& reader, std::size_t position, const ParserConfig& config,
                                           ResourceTracker& tracker) {
    const std::uint8_t compat = *reader.readU8();
    if (compat != kCompatibilityByte) {
        return std::unexpected(compatibilityByteError(DataBlock::id, position, compat));
    }
    const std::uint8_t blockType = *reader.readU8();
    const std::uint32_t dataSize = *reader.readU32();

    if (auto tracked = tracker.trackDataBlock(config, dataSize); !tracked) {
        return std::unexpected(tracked.error());
    }
    if (reader.remaining() < dataSize) {
        return std::unexpected(VgmError::bufferUnderflow(reader.position(), dataSize, reader.remaining()));
    }

    auto content = decodeDataBlock(blockType, dataSize, reader);
    if (!content) {
        return std::unexpected(content.error());
    }
    return DataBlock{blockType, std::move(*content)};
}

VgmResult<VgmCommand> readPcmRamWriteCommand(ByteReader& reader, std::size_t position, const ParserConfig& config,
                                             ResourceTracker& tracker) {
    const std::uint8_t compat = *reader.readU8();
    if (compat != kCompatibilityByte) {
        return std::unexpected(compatibilityByteError(PCMRAMWrite::id, position, compat));
    }
    PCMRAMWrite cmd;
    cmd.chipType = *reader.readU8();
    cmd.readOffset = *reader.readU24();
    cmd.writeOffset = *reader.readU24();
    cmd.size = *reader.readU24();
    if (cmd.size == 0) {
        cmd.size = kPcmRamWriteZeroSize;
    }

    if (auto tracked = tracker.trackDataBlock(config, cmd.size); !tracked) {
        return std::unexpected(tracked.error());
    }
    auto data = reader.readBytes(cmd.size);
    if (!data) {
        return std::unexpected(data.error());
    }
    cmd.data = std::move(*data);
    return cmd;
}

VgmResult<VgmCommand> decodeOperands(std::uint8_t opcode, ByteReader& reader, std::size_t position,
                                     const ParserConfig& config, ResourceTracker& tracker) {
    if (opcode >= WaitNSamplesPlus1::baseId && opcode <= WaitNSamplesPlus1::baseId + 0x0F) {
        return WaitNSamplesPlus1{static_cast<std::uint8_t>(opcode & 0x0F)};
    }
    if (opcode >= YM2612Port0Address2AWriteWait::baseId && opcode <= YM2612Port0Address2AWriteWait::baseId + 0x0F) {
        return YM2612Port0Address2AWriteWait{static_cast<std::uint8_t>(opcode & 0x0F)};
    }

    switch (opcode) {
    case PSGWrite::id: return readOpcodeChipWrite<PSGWrite>(reader, 0);
    case PSGWrite::secondChipId: return readOpcodeChipWrite<PSGWrite>(reader, 1);
    case GameGearPSGStereo::id: return readOpcodeChipWrite<GameGearPSGStereo>(reader, 0);
    case GameGearPSGStereo::secondChipId: return readOpcodeChipWrite<GameGearPSGStereo>(reader, 1);
    case YM2413Write::id: return readOpcodeChipWrite<YM2413Write>(reader, 0);
    case YM2413Write::secondChipId: return readOpcodeChipWrite<YM2413Write>(reader, 1);
    case YM2612Port0Write::id: return readOpcodeChipWrite<YM2612Port0Write>(reader, 0);
    case YM2612Port0Write::secondChipId: return readOpcodeChipWrite<YM2612Port0Write>(reader, 1);
    case YM2612Port1Write::id: return readOpcodeChipWrite<YM2612Port1Write>(reader, 0);
    case YM2612Port1Write::secondChipId: return readOpcodeChipWrite<YM2612Port1Write>(reader, 1);
    case YM2151Write::id: return readOpcodeChipWrite<YM2151Write>(reader, 0);
    case YM2151Write::secondChipId: return readOpcodeChipWrite<YM2151Write>(reader, 1);
    case YM2203Write::id: return readOpcodeChipWrite<YM2203Write>(reader, 0);
    case YM2203Write::secondChipId: return readOpcodeChipWrite<YM2203Write>(reader, 1);
    case YM2608Port0Write::id: return readOpcodeChipWrite<YM2608Port0Write>(reader, 0);
    case YM2608Port0Write::secondChipId: return readOpcodeChipWrite<YM2608Port0Write>(reader, 1);
    case YM2608Port1Write::id: return readOpcodeChipWrite<YM2608Port1Write>(reader, 0);
    case YM2608Port1Write::secondChipId: return readOpcodeChipWrite<YM2608Port1Write>(reader, 1);
    case YM2610Port0Write::id: return readOpcodeChipWrite<YM2610Port0Write>(reader, 0);
    case YM2610Port0Write::secondChipId: return readOpcodeChipWrite<YM2610Port0Write>(reader, 1);
    case YM2610Port1Write::id: return readOpcodeChipWrite<YM2610Port1Write>(reader, 0);
    case YM2610Port1Write::secondChipId: return readOpcodeChipWrite<YM2610Port1Write>(reader, 1);
    case YM3812Write::id: return readOpcodeChipWrite<YM3812Write>(reader, 0);
    case YM3812Write::secondChipId: return readOpcodeChipWrite<YM3812Write>(reader, 1);
    case YM3526Write::id: return readOpcodeChipWrite<YM3526Write>(reader, 0);
    case YM3526Write::secondChipId: return readOpcodeChipWrite<YM3526Write>(reader, 1);
    case Y8950Write::id: return readOpcodeChipWrite<Y8950Write>(reader, 0);
    case Y8950Write::secondChipId: return readOpcodeChipWrite<Y8950Write>(reader, 1);
    case YMZ280BWrite::id: return readOpcodeChipWrite<YMZ280BWrite>(reader, 0);
    case YMZ280BWrite::secondChipId: return readOpcodeChipWrite<YMZ280BWrite>(reader, 1);
    case YMF262Port0Write::id: return readOpcodeChipWrite<YMF262Port0Write>(reader, 0);
    case YMF262Port0Write::secondChipId: return readOpcodeChipWrite<YMF262Port0Write>(reader, 1);
    case YMF262Port1Write::id: return readOpcodeChipWrite<YMF262Port1Write>(reader, 0);
    case YMF262Port1Write::secondChipId: return readOpcodeChipWrite<YMF262Port1Write>(reader, 1);
    case AY8910StereoMask::id: return AY8910StereoMask{*reader.readU8()};

    case AY8910Write::id: return readRegisterBitChipWrite<AY8910Write>(reader);
    case GameBoyDMGWrite::id: return readRegisterBitChipWrite<GameBoyDMGWrite>(reader);
    case NESAPUWrite::id: return readRegisterBitChipWrite<NESAPUWrite>(reader);
    case MultiPCMWrite::id: return readRegisterBitChipWrite<MultiPCMWrite>(reader);
    case UPD7759Write::id: return readRegisterBitChipWrite<UPD7759Write>(reader);
    case OKIM6258Write::id: return readRegisterBitChipWrite<OKIM6258Write>(reader);
    case OKIM6295Write::id: return readRegisterBitChipWrite<OKIM6295Write>(reader);
    case HuC6280Write::id: return readRegisterBitChipWrite<HuC6280Write>(reader);
    case K053260Write::id: return readRegisterBitChipWrite<K053260Write>(reader);
    case PokeyWrite::id: return readRegisterBitChipWrite<PokeyWrite>(reader);
    case WonderSwanWrite::id: return readRegisterBitChipWrite<WonderSwanWrite>(reader);
    case SAA1099Write::id: return readRegisterBitChipWrite<SAA1099Write>(reader);
    case ES5506Write::id: return readRegisterBitChipWrite<ES5506Write>(reader);
    case GA20Write::id: return readRegisterBitChipWrite<GA20Write>(reader);

    case WaitNSamples::id: return WaitNSamples{*reader.readU16()};
    case Wait735Samples::id: return Wait735Samples{};
    case Wait882Samples::id: return Wait882Samples{};
    case EndOfSoundData::id: return EndOfSoundData{};

    case DataBlock::id: return readDataBlockCommand(reader, position, config, tracker);
    case PCMRAMWrite::id: return readPcmRamWriteCommand(reader, position, config, tracker);

    case DACStreamSetupControl::id: {
        DACStreamSetupControl cmd;
        cmd.streamId = *reader.readU8();
        const std::uint8_t chipType = *reader.readU8();
        cmd.chipType = chipType & 0x7F;
        cmd.chipIndex = chipType >> 7;
        cmd.port = *reader.readU8();
        cmd.command = *reader.readU8();
        return cmd;
    }
    case DACStreamSetData::id: {
        DACStreamSetData cmd;
        cmd.streamId = *reader.readU8();
        cmd.dataBankId = *reader.readU8();
        cmd.stepSize = *reader.readU8();
        cmd.stepBase = *reader.readU8();
        return cmd;
    }
    case DACStreamSetFrequency::id: {
        DACStreamSetFrequency cmd;
        cmd.streamId = *reader.readU8();
        cmd.frequency = *reader.readU32();
        return cmd;
    }
    case DACStreamStart::id: {
        DACStreamStart cmd;
        cmd.streamId = *reader.readU8();
        cmd.dataStartOffset = *reader.readU32();
        cmd.lengthMode = *reader.readU8();
        cmd.dataLength = *reader.readU32();
        return cmd;
    }
    case DACStreamStop::id: return DACStreamStop{*reader.readU8()};
    case DACStreamStartFast::id: {
        DACStreamStartFast cmd;
        cmd.streamId = *reader.readU8();
        cmd.blockId = *reader.readU16();
        cmd.flags = *reader.readU8();
        return cmd;
    }

    case RF5C68Write::id: {
        const std::uint8_t reg = *reader.readU8();
        return RF5C68Write{reg, *reader.readU8()};
    }
    case RF5C164Write::id: {
        const std::uint8_t reg = *reader.readU8();
        return RF5C164Write{reg, *reader.readU8()};
    }
    case PWMWrite::id: {
        const std::uint8_t high = *reader.readU8();
        const std::uint8_t low = *reader.readU8();
        return PWMWrite{static_cast<std::uint8_t>(high >> 4), static_cast<std::uint16_t>(((high & 0x0F) << 8) | low)};
    }

    case SegaPCMWrite::id: return readOffsetWrite<SegaPCMWrite>(reader, false);
    case RF5C68MemoryWrite::id: return readOffsetWrite<RF5C68MemoryWrite>(reader, false);
    case RF5C164MemoryWrite::id: return readOffsetWrite<RF5C164MemoryWrite>(reader, false);
    case MultiPCMSetBank::id: {
        MultiPCMSetBank cmd;
        cmd.channel = *reader.readU8();
        cmd.offset = *reader.readU16();
        return cmd;
    }
    case QSoundWrite::id: {
        QSoundWrite cmd;
        cmd.value = *reader.readU16Be();
        cmd.reg = *reader.readU8();
        return cmd;
    }
    case SCSPWrite::id: return readOffsetWrite<SCSPWrite>(reader, true);
    case WonderSwanMemoryWrite::id: return readOffsetWrite<WonderSwanMemoryWrite>(reader, true);
    case VSUWrite::id: return readOffsetWrite<VSUWrite>(reader, true);
    case X1010Write::id: return readOffsetWrite<X1010Write>(reader, true);

    case YMF278BWrite::id: return readPortWrite<YMF278BWrite>(reader);
    case YMF271Write::id: return readPortWrite<YMF271Write>(reader);
    case SCC1Write::id: return readPortWrite<SCC1Write>(reader);
    case K054539Write::id: return readPagedRegisterWrite<K054539Write>(reader);
    case C140Write::id: return readPagedRegisterWrite<C140Write>(reader);
    case ES5503Write::id: return readPagedRegisterWrite<ES5503Write>(reader);
    case ES5506Write16::id: {
        ES5506Write16 cmd;
        cmd.reg = *reader.readU8();
        cmd.value = *reader.readU16Be();
        return cmd;
    }

    case SeekPCM::id: return SeekPCM{*reader.readU32()};
    case C352Write::id: {
        C352Write cmd;
        cmd.reg = *reader.readU16Be();
        cmd.value = *reader.readU16Be();
        return cmd;
    }
    default: break;
    }
    return std::unexpected(VgmError::unknownCommand(opcode, position));
}

// Variant index of the block shape a given block type decodes to.
constexpr std::size_t shapeIndexForBlockType(std::uint8_t blockType) {
    if (blockType <= 0x3F) {
        return 0;
    }
    if (blockType <= 0x7E) {
        return 1;
    }
    if (blockType == 0x7F) {
        return 2;
    }
    if (blockType <= 0xBF) {
        return 3;
    }
    if (blockType <= 0xDF) {
        return 4;
    }
    return 5;
}

VgmResult<void> checkChipIndex(std::string_view name, std::uint8_t chipIndex) {
    if (chipIndex > 1) {
        return std::unexpected(
            VgmError::invalidDataFormat(std::string(name), std::format("chip index {} out of range 0-1", chipIndex)));
    }
    return {};
}

void writeOffsetWrite(const auto& cmd, ByteWriter& writer, bool bigEndianOffset) {
    if (bigEndianOffset) {
        writer.writeU16Be(cmd.offset);
    } else {
        writer.writeU16(cmd.offset);
    }
    writer.writeU8(cmd.value);
}

void writePortWrite(const auto& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.port);
    writer.writeU8(cmd.reg);
    writer.writeU8(cmd.value);
}

void writePagedRegisterWrite(const auto& cmd, ByteWriter& writer) {
    writer.writeU8(static_cast<std::uint8_t>(cmd.reg >> 8));
    writer.writeU8(static_cast<std::uint8_t>(cmd.reg & 0xFF));
    writer.writeU8(cmd.value);
}

VgmResult<void> encodeBody(const WaitNSamples& cmd, ByteWriter& writer) {
    writer.writeU16(cmd.n);
    return {};
}

VgmResult<void> encodeBody(const WaitNSamplesPlus1& cmd, ByteWriter&) {
    if (cmd.n > 0x0F) {
        return std::unexpected(
            VgmError::invalidDataFormat(std::string(WaitNSamplesPlus1::name), std::format("n {} exceeds 15", cmd.n)));
    }
    return {};
}

VgmResult<void> encodeBody(const YM2612Port0Address2AWriteWait& cmd, ByteWriter&) {
    if (cmd.n > 0x0F) {
        return std::unexpected(VgmError::invalidDataFormat(std::string(YM2612Port0Address2AWriteWait::name),
                                                           std::format("n {} exceeds 15", cmd.n)));
    }
    return {};
}

VgmResult<void> encodeBody(const Wait735Samples&, ByteWriter&) { return {}; }
VgmResult<void> encodeBody(const Wait882Samples&, ByteWriter&) { return {}; }
VgmResult<void> encodeBody(const EndOfSoundData&, ByteWriter&) { return {}; }

VgmResult<void> encodeBody(const AY8910StereoMask& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.value);
    return {};
}

VgmResult<void> encodeBody(const DataBlock& cmd, ByteWriter& writer) {
    if (shapeIndexForBlockType(cmd.blockType) != cmd.content.index()) {
        return std::unexpected(VgmError::invalidDataFormat(
            "data_block_type", std::format("block type 0x{:02X} cannot carry a {} payload", cmd.blockType,
                                           dataBlockShapeName(cmd.content))));
    }
    writer.writeU8(kCompatibilityByte);
    writer.writeU8(cmd.blockType);
    writer.writeU32(dataBlockSize(cmd.content));
    encodeDataBlock(cmd.content, writer);
    return {};
}

VgmResult<void> encodeBody(const PCMRAMWrite&, ByteWriter&) {
    return std::unexpected(
        VgmError::featureNotSupported(std::string(PCMRAMWrite::name), "PCM RAM writes cannot be serialized"));
}

VgmResult<void> encodeBody(const DACStreamSetupControl& cmd, ByteWriter& writer) {
    if (auto ok = checkChipIndex(DACStreamSetupControl::name, cmd.chipIndex); !ok) {
        return ok;
    }
    // Bit 7 of the chip type byte carries the chip index.
    if (cmd.chipType > 0x7F) {
        return std::unexpected(VgmError::invalidDataFormat(std::string(DACStreamSetupControl::name),
                                                           std::format("chip type 0x{:02X} does not fit 7 bits",
                                                                       cmd.chipType)));
    }
    writer.writeU8(cmd.streamId);
    writer.writeU8(static_cast<std::uint8_t>(cmd.chipType | (cmd.chipIndex << 7)));
    writer.writeU8(cmd.port);
    writer.writeU8(cmd.command);
    return {};
}

VgmResult<void> encodeBody(const DACStreamSetData& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.streamId);
    writer.writeU8(cmd.dataBankId);
    writer.writeU8(cmd.stepSize);
    writer.writeU8(cmd.stepBase);
    return {};
}

VgmResult<void> encodeBody(const DACStreamSetFrequency& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.streamId);
    writer.writeU32(cmd.frequency);
    return {};
}

VgmResult<void> encodeBody(const DACStreamStart& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.streamId);
    writer.writeU32(cmd.dataStartOffset);
    writer.writeU8(cmd.lengthMode);
    writer.writeU32(cmd.dataLength);
    return {};
}

VgmResult<void> encodeBody(const DACStreamStop& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.streamId);
    return {};
}

VgmResult<void> encodeBody(const DACStreamStartFast& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.streamId);
    writer.writeU16(cmd.blockId);
    writer.writeU8(cmd.flags);
    return {};
}

VgmResult<void> encodeBody(const RF5C68Write& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.reg);
    writer.writeU8(cmd.value);
    return {};
}

VgmResult<void> encodeBody(const RF5C164Write& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.reg);
    writer.writeU8(cmd.value);
    return {};
}

VgmResult<void> encodeBody(const PWMWrite& cmd, ByteWriter& writer) {
    if (cmd.reg > 0x0F || cmd.value > 0x0FFF) {
        return std::unexpected(VgmError::invalidDataFormat(
            std::string(PWMWrite::name), std::format("register {} / value {} exceed 4/12 bits", cmd.reg, cmd.value)));
    }
    writer.writeU8(static_cast<std::uint8_t>((cmd.reg << 4) | (cmd.value >> 8)));
    writer.writeU8(static_cast<std::uint8_t>(cmd.value & 0xFF));
    return {};
}

VgmResult<void> encodeBody(const SegaPCMWrite& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, false);
    return {};
}

VgmResult<void> encodeBody(const RF5C68MemoryWrite& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, false);
    return {};
}

VgmResult<void> encodeBody(const RF5C164MemoryWrite& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, false);
    return {};
}

VgmResult<void> encodeBody(const MultiPCMSetBank& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.channel);
    writer.writeU16(cmd.offset);
    return {};
}

VgmResult<void> encodeBody(const QSoundWrite& cmd, ByteWriter& writer) {
    writer.writeU16Be(cmd.value);
    writer.writeU8(cmd.reg);
    return {};
}

VgmResult<void> encodeBody(const SCSPWrite& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, true);
    return {};
}

VgmResult<void> encodeBody(const WonderSwanMemoryWrite& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, true);
    return {};
}

VgmResult<void> encodeBody(const VSUWrite& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, true);
    return {};
}

VgmResult<void> encodeBody(const X1010Write& cmd, ByteWriter& writer) {
    writeOffsetWrite(cmd, writer, true);
    return {};
}

VgmResult<void> encodeBody(const YMF278BWrite& cmd, ByteWriter& writer) {
    writePortWrite(cmd, writer);
    return {};
}

VgmResult<void> encodeBody(const YMF271Write& cmd, ByteWriter& writer) {
    writePortWrite(cmd, writer);
    return {};
}

VgmResult<void> encodeBody(const SCC1Write& cmd, ByteWriter& writer) {
    writePortWrite(cmd, writer);
    return {};
}

VgmResult<void> encodeBody(const K054539Write& cmd, ByteWriter& writer) {
    writePagedRegisterWrite(cmd, writer);
    return {};
}

VgmResult<void> encodeBody(const C140Write& cmd, ByteWriter& writer) {
    writePagedRegisterWrite(cmd, writer);
    return {};
}

VgmResult<void> encodeBody(const ES5503Write& cmd, ByteWriter& writer) {
    writePagedRegisterWrite(cmd, writer);
    return {};
}

VgmResult<void> encodeBody(const ES5506Write16& cmd, ByteWriter& writer) {
    writer.writeU8(cmd.reg);
    writer.writeU16Be(cmd.value);
    return {};
}

VgmResult<void> encodeBody(const SeekPCM& cmd, ByteWriter& writer) {
    writer.writeU32(cmd.offset);
    return {};
}

VgmResult<void> encodeBody(const C352Write& cmd, ByteWriter& writer) {
    writer.writeU16Be(cmd.reg);
    writer.writeU16Be(cmd.value);
    return {};
}

template <typename T>
constexpr std::uint8_t opcodeOf(const T& cmd) {
    if constexpr (SecondChipOpcode<T>) {
        return cmd.chipIndex == 0 ? T::id : T::secondChipId;
    } else if constexpr (requires { T::baseId; }) {
        return static_cast<std::uint8_t>(T::baseId + (cmd.n & 0x0F));
    } else {
        return T::id;
    }
}

}  // namespace

std::optional<std::size_t> fixedOperandSize(std::uint8_t opcode) {
    if (opcode >= 0x70 && opcode <= 0x8F) {
        return 0;
    }
    if ((opcode >= 0x51 && opcode <= 0x5F) || (opcode >= 0xA0 && opcode <= 0xBF)) {
        return 2;
    }
    if ((opcode >= 0xC0 && opcode <= 0xC8) || (opcode >= 0xD0 && opcode <= 0xD6)) {
        return 3;
    }
    switch (opcode) {
    case 0x30:
    case 0x31:
    case 0x3F:
    case 0x4F:
    case 0x50:
    case 0x94:
        return 1;
    case 0x61:
        return 2;
    case 0x62:
    case 0x63:
    case 0x66:
        return 0;
    case 0x67:
        return 6;
    case 0x68:
        return 11;
    case 0x90:
    case 0x91:
    case 0x95:
    case 0xE0:
    case 0xE1:
        return 4;
    case 0x92:
        return 5;
    case 0x93:
        return 10;
    default:
        return std::nullopt;
    }
}

VgmResult<VgmCommand> decodeCommand(ByteReader& reader, const ParserConfig& config, ResourceTracker& tracker) {
    const std::size_t position = reader.position();
    if (reader.atEnd()) {
        return std::unexpected(VgmError::bufferUnderflow(position, 1, 0));
    }
    if (auto tracked = tracker.trackCommand(config); !tracked) {
        return std::unexpected(tracked.error());
    }

    const std::uint8_t opcode = *reader.readU8();
    const auto operandSize = fixedOperandSize(opcode);
    if (!operandSize) {
        return std::unexpected(VgmError::unknownCommand(opcode, position));
    }
    if (reader.remaining() < *operandSize) {
        return std::unexpected(VgmError::incompleteCommand(opcode, position, *operandSize, reader.remaining()));
    }
    return decodeOperands(opcode, reader, position, config, tracker);
}

VgmResult<std::vector<VgmCommand>> decodeCommandStream(ByteReader& reader, const ParserConfig& config,
                                                       ResourceTracker& tracker) {
    std::vector<VgmCommand> commands;
    while (!reader.atEnd()) {
        auto command = decodeCommand(reader, config, tracker);
        if (!command) {
            return std::unexpected(command.error());
        }
        const bool end = std::holds_alternative<EndOfSoundData>(*command);
        commands.push_back(std::move(*command));
        if (end) {
            break;
        }
    }
    return commands;
}

std::vector<VgmCommand> decodeCommandsOrEmpty(std::span<const std::uint8_t> bytes, const ParserConfig& config) {
    ByteReader reader(bytes);
    ResourceTracker tracker;
    auto commands = decodeCommandStream(reader, config, tracker);
    if (!commands) {
        common::logError(std::format("Command stream decode failed: {}", commands.error().message()));
        return {};
    }
    return std::move(*commands);
}

VgmResult<void> encodeCommand(const VgmCommand& command, ByteWriter& writer) {
    return std::visit(
        [&writer](const auto& cmd) -> VgmResult<void> {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (SecondChipOpcode<T>) {
                if (auto ok = checkChipIndex(T::name, cmd.chipIndex); !ok) {
                    return ok;
                }
                writer.writeU8(opcodeOf(cmd));
                if constexpr (requires { cmd.reg; }) {
                    writer.writeU8(cmd.reg);
                }
                writer.writeU8(cmd.value);
                return {};
            } else if constexpr (ChipInRegisterBit<T>) {
                if (auto ok = checkChipIndex(T::name, cmd.chipIndex); !ok) {
                    return ok;
                }
                if (cmd.reg > 0x7F) {
                    return std::unexpected(VgmError::invalidDataFormat(
                        std::string(T::name), std::format("register 0x{:02X} does not fit 7 bits", cmd.reg)));
                }
                writer.writeU8(T::id);
                writer.writeU8(static_cast<std::uint8_t>(cmd.reg | (cmd.chipIndex << 7)));
                writer.writeU8(cmd.value);
                return {};
            } else {
                // Body first so a rejected command writes nothing.
                ByteWriter body;
                if (auto ok = encodeBody(cmd, body); !ok) {
                    return ok;
                }
                writer.writeU8(opcodeOf(cmd));
                writer.writeBytes(body.bytes());
                return {};
            }
        },
        command);
}

VgmResult<void> encodeCommands(std::span<const VgmCommand> commands, ByteWriter& writer) {
    for (const auto& command : commands) {
        if (auto ok = encodeCommand(command, writer); !ok) {
            return ok;
        }
    }
    return {};
}

std::string_view commandName(const VgmCommand& command) {
    return std::visit([](const auto& cmd) { return std::decay_t<decltype(cmd)>::name; }, command);
}

std::uint8_t commandOpcode(const VgmCommand& command) {
    return std::visit([](const auto& cmd) { return opcodeOf(cmd); }, command);
}

std::uint32_t commandWaitSamples(const VgmCommand& command) {
    return std::visit(overloaded{
                          [](const WaitNSamples& cmd) -> std::uint32_t { return cmd.n; },
                          [](const Wait735Samples&) -> std::uint32_t { return 735; },
                          [](const Wait882Samples&) -> std::uint32_t { return 882; },
                          [](const WaitNSamplesPlus1& cmd) -> std::uint32_t { return cmd.n + 1u; },
                          [](const YM2612Port0Address2AWriteWait& cmd) -> std::uint32_t { return cmd.n; },
                          [](const auto&) -> std::uint32_t { return 0; },
                      },
                      command);
}

}  // namespace vgmtool::vgm
