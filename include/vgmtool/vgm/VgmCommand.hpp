#pragma once

#include "vgmtool/vgm/DataBlock.hpp"

#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

namespace vgmtool::vgm {

// Dual-chip writes addressed by a parallel opcode: `id` targets chip 0 and
// `secondChipId` targets chip 1.

struct PSGWrite {
    static constexpr std::string_view name = "PSGWrite";
    static constexpr std::uint8_t id = 0x50;
    static constexpr std::uint8_t secondChipId = 0x30;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const PSGWrite&) const = default;
};

struct GameGearPSGStereo {
    static constexpr std::string_view name = "GameGearPSGStereo";
    static constexpr std::uint8_t id = 0x4F;
    static constexpr std::uint8_t secondChipId = 0x3F;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const GameGearPSGStereo&) const = default;
};

struct YM2413Write {
    static constexpr std::string_view name = "YM2413Write";
    static constexpr std::uint8_t id = 0x51;
    static constexpr std::uint8_t secondChipId = 0xA1;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2413Write&) const = default;
};

struct YM2612Port0Write {
    static constexpr std::string_view name = "YM2612Port0Write";
    static constexpr std::uint8_t id = 0x52;
    static constexpr std::uint8_t secondChipId = 0xA2;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2612Port0Write&) const = default;
};

struct YM2612Port1Write {
    static constexpr std::string_view name = "YM2612Port1Write";
    static constexpr std::uint8_t id = 0x53;
    static constexpr std::uint8_t secondChipId = 0xA3;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2612Port1Write&) const = default;
};

struct YM2151Write {
    static constexpr std::string_view name = "YM2151Write";
    static constexpr std::uint8_t id = 0x54;
    static constexpr std::uint8_t secondChipId = 0xA4;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2151Write&) const = default;
};

struct YM2203Write {
    static constexpr std::string_view name = "YM2203Write";
    static constexpr std::uint8_t id = 0x55;
    static constexpr std::uint8_t secondChipId = 0xA5;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2203Write&) const = default;
};

struct YM2608Port0Write {
    static constexpr std::string_view name = "YM2608Port0Write";
    static constexpr std::uint8_t id = 0x56;
    static constexpr std::uint8_t secondChipId = 0xA6;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2608Port0Write&) const = default;
};

struct YM2608Port1Write {
    static constexpr std::string_view name = "YM2608Port1Write";
    static constexpr std::uint8_t id = 0x57;
    static constexpr std::uint8_t secondChipId = 0xA7;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2608Port1Write&) const = default;
};

struct YM2610Port0Write {
    static constexpr std::string_view name = "YM2610Port0Write";
    static constexpr std::uint8_t id = 0x58;
    static constexpr std::uint8_t secondChipId = 0xA8;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2610Port0Write&) const = default;
};

struct YM2610Port1Write {
    static constexpr std::string_view name = "YM2610Port1Write";
    static constexpr std::uint8_t id = 0x59;
    static constexpr std::uint8_t secondChipId = 0xA9;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM2610Port1Write&) const = default;
};

struct YM3812Write {
    static constexpr std::string_view name = "YM3812Write";
    static constexpr std::uint8_t id = 0x5A;
    static constexpr std::uint8_t secondChipId = 0xAA;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM3812Write&) const = default;
};

struct YM3526Write {
    static constexpr std::string_view name = "YM3526Write";
    static constexpr std::uint8_t id = 0x5B;
    static constexpr std::uint8_t secondChipId = 0xAB;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YM3526Write&) const = default;
};

struct Y8950Write {
    static constexpr std::string_view name = "Y8950Write";
    static constexpr std::uint8_t id = 0x5C;
    static constexpr std::uint8_t secondChipId = 0xAC;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const Y8950Write&) const = default;
};

struct YMZ280BWrite {
    static constexpr std::string_view name = "YMZ280BWrite";
    static constexpr std::uint8_t id = 0x5D;
    static constexpr std::uint8_t secondChipId = 0xAD;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YMZ280BWrite&) const = default;
};

struct YMF262Port0Write {
    static constexpr std::string_view name = "YMF262Port0Write";
    static constexpr std::uint8_t id = 0x5E;
    static constexpr std::uint8_t secondChipId = 0xAE;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YMF262Port0Write&) const = default;
};

struct YMF262Port1Write {
    static constexpr std::string_view name = "YMF262Port1Write";
    static constexpr std::uint8_t id = 0x5F;
    static constexpr std::uint8_t secondChipId = 0xAF;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const YMF262Port1Write&) const = default;
};

struct AY8910StereoMask {
    static constexpr std::string_view name = "AY8910StereoMask";
    static constexpr std::uint8_t id = 0x31;
    std::uint8_t value = 0;

    bool operator==(const AY8910StereoMask&) const = default;
};

// Dual-chip writes sharing one opcode: bit 7 of the register byte selects chip 1
// and `reg` holds the remaining 7 bits.

struct AY8910Write {
    static constexpr std::string_view name = "AY8910Write";
    static constexpr std::uint8_t id = 0xA0;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const AY8910Write&) const = default;
};

struct GameBoyDMGWrite {
    static constexpr std::string_view name = "GameBoyDMGWrite";
    static constexpr std::uint8_t id = 0xB3;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const GameBoyDMGWrite&) const = default;
};

struct NESAPUWrite {
    static constexpr std::string_view name = "NESAPUWrite";
    static constexpr std::uint8_t id = 0xB4;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const NESAPUWrite&) const = default;
};

struct MultiPCMWrite {
    static constexpr std::string_view name = "MultiPCMWrite";
    static constexpr std::uint8_t id = 0xB5;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const MultiPCMWrite&) const = default;
};

struct UPD7759Write {
    static constexpr std::string_view name = "UPD7759Write";
    static constexpr std::uint8_t id = 0xB6;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const UPD7759Write&) const = default;
};

struct OKIM6258Write {
    static constexpr std::string_view name = "OKIM6258Write";
    static constexpr std::uint8_t id = 0xB7;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const OKIM6258Write&) const = default;
};

struct OKIM6295Write {
    static constexpr std::string_view name = "OKIM6295Write";
    static constexpr std::uint8_t id = 0xB8;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const OKIM6295Write&) const = default;
};

struct HuC6280Write {
    static constexpr std::string_view name = "HuC6280Write";
    static constexpr std::uint8_t id = 0xB9;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const HuC6280Write&) const = default;
};

struct K053260Write {
    static constexpr std::string_view name = "K053260Write";
    static constexpr std::uint8_t id = 0xBA;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const K053260Write&) const = default;
};

struct PokeyWrite {
    static constexpr std::string_view name = "PokeyWrite";
    static constexpr std::uint8_t id = 0xBB;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const PokeyWrite&) const = default;
};

struct WonderSwanWrite {
    static constexpr std::string_view name = "WonderSwanWrite";
    static constexpr std::uint8_t id = 0xBC;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const WonderSwanWrite&) const = default;
};

struct SAA1099Write {
    static constexpr std::string_view name = "SAA1099Write";
    static constexpr std::uint8_t id = 0xBD;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const SAA1099Write&) const = default;
};

struct ES5506Write {
    static constexpr std::string_view name = "ES5506Write";
    static constexpr std::uint8_t id = 0xBE;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const ES5506Write&) const = default;
};

struct GA20Write {
    static constexpr std::string_view name = "GA20Write";
    static constexpr std::uint8_t id = 0xBF;
    static constexpr bool chipInRegisterBit = true;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const GA20Write&) const = default;
};

// Timing

struct WaitNSamples {
    static constexpr std::string_view name = "WaitNSamples";
    static constexpr std::uint8_t id = 0x61;
    std::uint16_t n = 0;

    bool operator==(const WaitNSamples&) const = default;
};

/// One 60 Hz frame. Not interchangeable with WaitNSamples{735}: encodes as the single byte 0x62.
struct Wait735Samples {
    static constexpr std::string_view name = "Wait735Samples";
    static constexpr std::uint8_t id = 0x62;

    bool operator==(const Wait735Samples&) const = default;
};

/// One 50 Hz frame.
struct Wait882Samples {
    static constexpr std::string_view name = "Wait882Samples";
    static constexpr std::uint8_t id = 0x63;

    bool operator==(const Wait882Samples&) const = default;
};

struct EndOfSoundData {
    static constexpr std::string_view name = "EndOfSoundData";
    static constexpr std::uint8_t id = 0x66;

    bool operator==(const EndOfSoundData&) const = default;
};

/// 0x7n: waits n + 1 samples, n in 0-15.
struct WaitNSamplesPlus1 {
    static constexpr std::string_view name = "WaitNSamplesPlus1";
    static constexpr std::uint8_t baseId = 0x70;
    std::uint8_t n = 0;

    bool operator==(const WaitNSamplesPlus1&) const = default;
};

/// 0x8n: writes the next DAC byte from the data bank to YM2612 register 0x2A, then waits n samples.
struct YM2612Port0Address2AWriteWait {
    static constexpr std::string_view name = "YM2612Port0Address2AWriteWait";
    static constexpr std::uint8_t baseId = 0x80;
    std::uint8_t n = 0;

    bool operator==(const YM2612Port0Address2AWriteWait&) const = default;
};

// Escaped opcodes; both carry a 0x66 compatibility byte on the wire.

struct DataBlock {
    static constexpr std::string_view name = "DataBlock";
    static constexpr std::uint8_t id = 0x67;
    std::uint8_t blockType = 0;
    DataBlockContent content;

    bool operator==(const DataBlock&) const = default;
};

struct PCMRAMWrite {
    static constexpr std::string_view name = "PCMRAMWrite";
    static constexpr std::uint8_t id = 0x68;
    std::uint8_t chipType = 0;
    std::uint32_t readOffset = 0;
    std::uint32_t writeOffset = 0;
    /// Effective byte count; a zero on the wire means 0x01000000.
    std::uint32_t size = 0;
    std::vector<std::uint8_t> data;

    bool operator==(const PCMRAMWrite&) const = default;
};

// DAC stream control. Bit 7 of the setup chip type selects chip 1.

struct DACStreamSetupControl {
    static constexpr std::string_view name = "DACStreamSetupControl";
    static constexpr std::uint8_t id = 0x90;
    std::uint8_t streamId = 0;
    std::uint8_t chipType = 0;
    std::uint8_t port = 0;
    std::uint8_t command = 0;
    std::uint8_t chipIndex = 0;

    bool operator==(const DACStreamSetupControl&) const = default;
};

struct DACStreamSetData {
    static constexpr std::string_view name = "DACStreamSetData";
    static constexpr std::uint8_t id = 0x91;
    std::uint8_t streamId = 0;
    std::uint8_t dataBankId = 0;
    std::uint8_t stepSize = 0;
    std::uint8_t stepBase = 0;

    bool operator==(const DACStreamSetData&) const = default;
};

struct DACStreamSetFrequency {
    static constexpr std::string_view name = "DACStreamSetFrequency";
    static constexpr std::uint8_t id = 0x92;
    std::uint8_t streamId = 0;
    std::uint32_t frequency = 0;

    bool operator==(const DACStreamSetFrequency&) const = default;
};

struct DACStreamStart {
    static constexpr std::string_view name = "DACStreamStart";
    static constexpr std::uint8_t id = 0x93;
    std::uint8_t streamId = 0;
    std::uint32_t dataStartOffset = 0;
    std::uint8_t lengthMode = 0;
    std::uint32_t dataLength = 0;

    bool operator==(const DACStreamStart&) const = default;
};

struct DACStreamStop {
    static constexpr std::string_view name = "DACStreamStop";
    static constexpr std::uint8_t id = 0x94;
    std::uint8_t streamId = 0;

    bool operator==(const DACStreamStop&) const = default;
};

struct DACStreamStartFast {
    static constexpr std::string_view name = "DACStreamStartFast";
    static constexpr std::uint8_t id = 0x95;
    std::uint8_t streamId = 0;
    std::uint16_t blockId = 0;
    std::uint8_t flags = 0;

    bool operator==(const DACStreamStartFast&) const = default;
};

struct RF5C68Write {
    static constexpr std::string_view name = "RF5C68Write";
    static constexpr std::uint8_t id = 0xB0;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const RF5C68Write&) const = default;
};

struct RF5C164Write {
    static constexpr std::string_view name = "RF5C164Write";
    static constexpr std::uint8_t id = 0xB1;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const RF5C164Write&) const = default;
};

/// Packed as 4-bit register and 12-bit value.
struct PWMWrite {
    static constexpr std::string_view name = "PWMWrite";
    static constexpr std::uint8_t id = 0xB2;
    std::uint8_t reg = 0;
    std::uint16_t value = 0;

    bool operator==(const PWMWrite&) const = default;
};

struct SegaPCMWrite {
    static constexpr std::string_view name = "SegaPCMWrite";
    static constexpr std::uint8_t id = 0xC0;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const SegaPCMWrite&) const = default;
};

struct RF5C68MemoryWrite {
    static constexpr std::string_view name = "RF5C68MemoryWrite";
    static constexpr std::uint8_t id = 0xC1;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const RF5C68MemoryWrite&) const = default;
};

struct RF5C164MemoryWrite {
    static constexpr std::string_view name = "RF5C164MemoryWrite";
    static constexpr std::uint8_t id = 0xC2;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const RF5C164MemoryWrite&) const = default;
};

struct MultiPCMSetBank {
    static constexpr std::string_view name = "MultiPCMSetBank";
    static constexpr std::uint8_t id = 0xC3;
    std::uint8_t channel = 0;
    std::uint16_t offset = 0;

    bool operator==(const MultiPCMSetBank&) const = default;
};

struct QSoundWrite {
    static constexpr std::string_view name = "QSoundWrite";
    static constexpr std::uint8_t id = 0xC4;
    std::uint16_t value = 0;
    std::uint8_t reg = 0;

    bool operator==(const QSoundWrite&) const = default;
};

struct SCSPWrite {
    static constexpr std::string_view name = "SCSPWrite";
    static constexpr std::uint8_t id = 0xC5;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const SCSPWrite&) const = default;
};

struct WonderSwanMemoryWrite {
    static constexpr std::string_view name = "WonderSwanMemoryWrite";
    static constexpr std::uint8_t id = 0xC6;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const WonderSwanMemoryWrite&) const = default;
};

struct VSUWrite {
    static constexpr std::string_view name = "VSUWrite";
    static constexpr std::uint8_t id = 0xC7;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const VSUWrite&) const = default;
};

struct X1010Write {
    static constexpr std::string_view name = "X1010Write";
    static constexpr std::uint8_t id = 0xC8;
    std::uint16_t offset = 0;
    std::uint8_t value = 0;

    bool operator==(const X1010Write&) const = default;
};

struct YMF278BWrite {
    static constexpr std::string_view name = "YMF278BWrite";
    static constexpr std::uint8_t id = 0xD0;
    std::uint8_t port = 0;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const YMF278BWrite&) const = default;
};

struct YMF271Write {
    static constexpr std::string_view name = "YMF271Write";
    static constexpr std::uint8_t id = 0xD1;
    std::uint8_t port = 0;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const YMF271Write&) const = default;
};

struct SCC1Write {
    static constexpr std::string_view name = "SCC1Write";
    static constexpr std::uint8_t id = 0xD2;
    std::uint8_t port = 0;
    std::uint8_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const SCC1Write&) const = default;
};

struct K054539Write {
    static constexpr std::string_view name = "K054539Write";
    static constexpr std::uint8_t id = 0xD3;
    std::uint16_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const K054539Write&) const = default;
};

struct C140Write {
    static constexpr std::string_view name = "C140Write";
    static constexpr std::uint8_t id = 0xD4;
    std::uint16_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const C140Write&) const = default;
};

struct ES5503Write {
    static constexpr std::string_view name = "ES5503Write";
    static constexpr std::uint8_t id = 0xD5;
    std::uint16_t reg = 0;
    std::uint8_t value = 0;

    bool operator==(const ES5503Write&) const = default;
};

struct ES5506Write16 {
    static constexpr std::string_view name = "ES5506Write16";
    static constexpr std::uint8_t id = 0xD6;
    std::uint8_t reg = 0;
    std::uint16_t value = 0;

    bool operator==(const ES5506Write16&) const = default;
};

struct SeekPCM {
    static constexpr std::string_view name = "SeekPCM";
    static constexpr std::uint8_t id = 0xE0;
    std::uint32_t offset = 0;

    bool operator==(const SeekPCM&) const = default;
};

struct C352Write {
    static constexpr std::string_view name = "C352Write";
    static constexpr std::uint8_t id = 0xE1;
    std::uint16_t reg = 0;
    std::uint16_t value = 0;

    bool operator==(const C352Write&) const = default;
};

using VgmCommand = std::variant<PSGWrite, GameGearPSGStereo, YM2413Write, YM2612Port0Write, YM2612Port1Write,
    YM2151Write, YM2203Write, YM2608Port0Write, YM2608Port1Write, YM2610Port0Write, YM2610Port1Write, YM3812Write,
    YM3526Write, Y8950Write, YMZ280BWrite, YMF262Port0Write, YMF262Port1Write, AY8910StereoMask, AY8910Write,
    GameBoyDMGWrite, NESAPUWrite, MultiPCMWrite, UPD7759Write, OKIM6258Write, OKIM6295Write, HuC6280Write,
    K053260Write, PokeyWrite, WonderSwanWrite, SAA1099Write, ES5506Write, GA20Write, WaitNSamples, Wait735Samples,
    Wait882Samples, EndOfSoundData, WaitNSamplesPlus1, YM2612Port0Address2AWriteWait, DataBlock, PCMRAMWrite,
    DACStreamSetupControl, DACStreamSetData, DACStreamSetFrequency, DACStreamStart, DACStreamStop,
    DACStreamStartFast, RF5C68Write, RF5C164Write, PWMWrite, SegaPCMWrite, RF5C68MemoryWrite, RF5C164MemoryWrite,
    MultiPCMSetBank, QSoundWrite, SCSPWrite, WonderSwanMemoryWrite, VSUWrite, X1010Write, YMF278BWrite,
    YMF271Write, SCC1Write, K054539Write, C140Write, ES5503Write, ES5506Write16, SeekPCM, C352Write>;

}  // namespace vgmtool::vgm
