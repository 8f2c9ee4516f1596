#include "vgmtool/vgm/VgmJson.hpp"

#include "vgmtool/vgm/Bcd.hpp"
#include "vgmtool/vgm/CommandCodec.hpp"
#include "vgmtool/vgm/SoundChip.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace vgmtool::vgm {
namespace {

using json = nlohmann::json;

json chipTypeJson(const auto& chipType) {
    json out{{"name", std::string(chipName(chipType.kind))}};
    if (chipType.reservedValue != 0) {
        out["reservedValue"] = chipType.reservedValue;
    }
    return out;
}

json compressionJson(const CompressionParams& params) {
    return std::visit(overloaded{
                          [](const BitPackingParams& p) {
                              return json{
                                  {"type", "bitPacking"},
                                  {"bitsDecompressed", p.bitsDecompressed},
                                  {"bitsCompressed", p.bitsCompressed},
                                  {"subType", p.subType},
                                  {"addValue", p.addValue},
                              };
                          },
                          [](const DpcmParams& p) {
                              return json{
                                  {"type", "dpcm"},
                                  {"bitsDecompressed", p.bitsDecompressed},
                                  {"bitsCompressed", p.bitsCompressed},
                                  {"startValue", p.startValue},
                              };
                          },
                      },
                      params);
}

json dataBlockContentJson(const DataBlockContent& content) {
    json out = std::visit(overloaded{
                              [](const UncompressedStream& block) {
                                  return json{{"chip", chipTypeJson(block.chipType)}};
                              },
                              [](const CompressedStream& block) {
                                  return json{
                                      {"chip", chipTypeJson(block.chipType)},
                                      {"compression", compressionJson(block.compression)},
                                      {"uncompressedSize", block.uncompressedSize},
                                  };
                              },
                              [](const DecompressionTable& block) {
                                  return json{
                                      {"compressionType", block.compressionType},
                                      {"subType", block.subType},
                                      {"bitsDecompressed", block.bitsDecompressed},
                                      {"bitsCompressed", block.bitsCompressed},
                                      {"valueCount", block.valueCount},
                                  };
                              },
                              [](const RomDump& block) {
                                  return json{
                                      {"chip", chipTypeJson(block.chipType)},
                                      {"totalSize", block.totalSize},
                                      {"startAddress", block.startAddress},
                                  };
                              },
                              [](const RamWriteSmall& block) {
                                  return json{
                                      {"chip", chipTypeJson(block.chipType)},
                                      {"startAddress", block.startAddress},
                                  };
                              },
                              [](const RamWriteLarge& block) {
                                  return json{
                                      {"chip", chipTypeJson(block.chipType)},
                                      {"startAddress", block.startAddress},
                                  };
                              },
                          },
                          content);
    out["shape"] = std::string(dataBlockShapeName(content));
    out["size"] = dataBlockSize(content);
    return out;
}

// Operand members shared by many command structs.
template <typename T>
void addCommonOperands(json& out, const T& cmd) {
    if constexpr (requires { cmd.chipIndex; }) {
        out["chipIndex"] = cmd.chipIndex;
    }
    if constexpr (requires { cmd.port; }) {
        out["port"] = cmd.port;
    }
    if constexpr (requires { cmd.channel; }) {
        out["channel"] = cmd.channel;
    }
    if constexpr (requires { cmd.offset; }) {
        out["offset"] = cmd.offset;
    }
    if constexpr (requires { cmd.reg; }) {
        out["register"] = cmd.reg;
    }
    if constexpr (requires { cmd.value; }) {
        out["value"] = cmd.value;
    }
    if constexpr (requires { cmd.n; }) {
        out["n"] = cmd.n;
    }
}

json operandsJson(const VgmCommand& command) {
    return std::visit(overloaded{
                          [](const DataBlock& cmd) {
                              return json{
                                  {"blockType", cmd.blockType},
                                  {"block", dataBlockContentJson(cmd.content)},
                              };
                          },
                          [](const PCMRAMWrite& cmd) {
                              return json{
                                  {"chipType", cmd.chipType},
                                  {"readOffset", cmd.readOffset},
                                  {"writeOffset", cmd.writeOffset},
                                  {"size", cmd.size},
                              };
                          },
                          [](const DACStreamSetupControl& cmd) {
                              return json{
                                  {"streamId", cmd.streamId},
                                  {"chipType", cmd.chipType},
                                  {"chipIndex", cmd.chipIndex},
                                  {"port", cmd.port},
                                  {"command", cmd.command},
                              };
                          },
                          [](const DACStreamSetData& cmd) {
                              return json{
                                  {"streamId", cmd.streamId},
                                  {"dataBankId", cmd.dataBankId},
                                  {"stepSize", cmd.stepSize},
                                  {"stepBase", cmd.stepBase},
                              };
                          },
                          [](const DACStreamSetFrequency& cmd) {
                              return json{{"streamId", cmd.streamId}, {"frequency", cmd.frequency}};
                          },
                          [](const DACStreamStart& cmd) {
                              return json{
                                  {"streamId", cmd.streamId},
                                  {"dataStartOffset", cmd.dataStartOffset},
                                  {"lengthMode", cmd.lengthMode},
                                  {"dataLength", cmd.dataLength},
                              };
                          },
                          [](const DACStreamStop& cmd) { return json{{"streamId", cmd.streamId}}; },
                          [](const DACStreamStartFast& cmd) {
                              return json{
                                  {"streamId", cmd.streamId},
                                  {"blockId", cmd.blockId},
                                  {"flags", cmd.flags},
                              };
                          },
                          [](const auto& cmd) {
                              json out = json::object();
                              addCommonOperands(out, cmd);
                              return out;
                          },
                      },
                      command);
}

}  // namespace

json toJson(const VgmHeader& header) {
    json out = json::object();
    if (auto version = decimalVersion(header)) {
        out["versionString"] = formatVersion(*version);
    }

    json fields = json::object();
    if (auto values = headerFields(header)) {
        for (const auto& field : *values) {
            if (field.present) {
                fields[std::string(field.name)] = field.value;
            }
        }
    } else {
        out["fieldsError"] = values.error().message();
    }
    out["fields"] = std::move(fields);

    json chips = json::array();
    for (const SoundChip chip : activeSoundChips(header)) {
        chips.push_back(json{
            {"name", std::string(soundChipName(chip))},
            {"clock", soundChipClock(header, chip) & kChipClockMask},
        });
    }
    out["chips"] = std::move(chips);

    if (header.extraHeader) {
        const auto& extra = *header.extraHeader;
        json clocks = json::array();
        for (const auto& entry : extra.chipClocks) {
            json clock{{"chipId", entry.chipId}, {"clock", entry.clock}};
            if (auto chip = soundChipFromId(entry.chipId)) {
                clock["chipName"] = std::string(soundChipName(*chip));
            }
            clocks.push_back(std::move(clock));
        }
        json volumes = json::array();
        for (const auto& entry : extra.chipVolumes) {
            volumes.push_back(json{{"chipId", entry.chipId}, {"flags", entry.flags}, {"volume", entry.volume}});
        }
        out["extraHeader"] = json{
            {"headerSize", extra.headerSize},
            {"chipClockOffset", extra.chipClockOffset},
            {"chipVolumeOffset", extra.chipVolumeOffset},
            {"chipClocks", std::move(clocks)},
            {"chipVolumes", std::move(volumes)},
        };
    }
    return out;
}

json toJson(const VgmCommand& command) {
    json out{
        {"type", std::string(commandName(command))},
        {"opcode", commandOpcode(command)},
    };
    out.update(operandsJson(command));
    return out;
}

json toJson(const Gd3Metadata& metadata) {
    const auto locale = [](const Gd3LocaleData& data) {
        return json{
            {"track", data.track},
            {"game", data.game},
            {"system", data.system},
            {"author", data.author},
        };
    };
    return json{
        {"english", locale(metadata.english)},
        {"japanese", locale(metadata.japanese)},
        {"releaseDate", metadata.releaseDate},
        {"creator", metadata.creator},
        {"notes", metadata.notes},
    };
}

json toJson(const VgmFile& file) {
    json commands = json::array();
    for (const auto& command : file.commands) {
        commands.push_back(toJson(command));
    }
    return json{
        {"header", toJson(file.header)},
        {"commands", std::move(commands)},
        {"metadata", file.metadata ? toJson(*file.metadata) : json(nullptr)},
        {"summary",
         json{
             {"commandCount", file.commands.size()},
             {"totalWaitSamples", file.totalWaitSamples()},
             {"hasDataBlock", file.hasDataBlock()},
         }},
    };
}

std::string toJsonString(const VgmFile& file, int indent) {
    return toJson(file).dump(indent);
}

}  // namespace vgmtool::vgm
