#pragma once

#include "vgmtool/vgm/ByteStream.hpp"
#include "vgmtool/vgm/ParserConfig.hpp"
#include "vgmtool/vgm/VgmCommand.hpp"
#include "vgmtool/vgm/VgmError.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace vgmtool::vgm {

/// Decodes exactly one command at the reader position. The tracker is charged
/// once for the command before any operand is read.
VgmResult<VgmCommand> decodeCommand(ByteReader& reader, const ParserConfig& config, ResourceTracker& tracker);

/// Decodes until EndOfSoundData (kept as the last element) or end of input.
VgmResult<std::vector<VgmCommand>> decodeCommandStream(ByteReader& reader, const ParserConfig& config,
                                                       ResourceTracker& tracker);

/// Convenience for callers without error handling: logs the failure and
/// returns an empty list.
std::vector<VgmCommand> decodeCommandsOrEmpty(std::span<const std::uint8_t> bytes,
                                              const ParserConfig& config = ParserConfig{});

VgmResult<void> encodeCommand(const VgmCommand& command, ByteWriter& writer);
VgmResult<void> encodeCommands(std::span<const VgmCommand> commands, ByteWriter& writer);

/// Number of operand bytes following `opcode` that are always present
/// (for 0x67/0x68 only the fixed prefix). nullopt for unknown opcodes.
std::optional<std::size_t> fixedOperandSize(std::uint8_t opcode);

std::string_view commandName(const VgmCommand& command);
/// First byte this command encodes to.
std::uint8_t commandOpcode(const VgmCommand& command);
/// Samples the command advances playback by; zero for non-wait commands.
std::uint32_t commandWaitSamples(const VgmCommand& command);

}  // namespace vgmtool::vgm
