#pragma once

#include "vgmtool/vgm/VgmError.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace vgmtool::vgm {

/// Ceilings consulted by ResourceTracker while decoding untrusted input.
struct ParserConfig {
    std::size_t maxCommands = 500'000;
    std::uint32_t maxDataBlockSize = 4 * 1024 * 1024;
    std::size_t maxTotalDataBlockMemory = 32 * 1024 * 1024;
    std::size_t maxMetadataSize = 256 * 1024;
    std::uint8_t maxChipClockEntries = 32;
    std::uint8_t maxChipVolumeEntries = 32;
    /// Enables the command-memory estimate check in addition to the count.
    bool strictResourceLimits = false;
    std::size_t maxCommandMemory = 64 * 1024 * 1024;
    std::uint32_t maxParsingDepth = 16;

    static ParserConfig defaults() { return ParserConfig{}; }
    static ParserConfig securityFocused();
    static ParserConfig permissive();

    [[nodiscard]] std::size_t estimateCommandMemory(std::size_t commandCount) const { return commandCount * 100; }

    VgmResult<void> checkCommandCount(std::size_t count) const;
    VgmResult<void> checkCommandMemory(std::size_t count) const;
    VgmResult<void> checkDataBlockSize(std::uint32_t size) const;
    VgmResult<void> checkMetadataSize(std::size_t size) const;
    VgmResult<void> checkChipEntries(std::uint8_t clockEntries, std::uint8_t volumeEntries) const;

    bool operator==(const ParserConfig&) const = default;
};

/// "default", "security_focused" (alias "security") or "permissive".
std::optional<ParserConfig> parserConfigPreset(std::string_view name);

/// Builds a config from a JSON object: an optional "preset" key selects the
/// base, then any snake_case limit key overrides it.
VgmResult<ParserConfig> parserConfigFromJson(const nlohmann::json& value);
VgmResult<ParserConfig> loadParserConfigFile(const std::filesystem::path& path);
nlohmann::json parserConfigToJson(const ParserConfig& config);

struct ResourceUsageSummary {
    std::size_t commandCount = 0;
    double dataBlockMemoryMb = 0.0;
    std::size_t dataBlockCount = 0;
    std::uint32_t parsingDepth = 0;
    /// Deepest nesting reached during the session.
    std::uint32_t maxParsingDepth = 0;

    [[nodiscard]] std::string toString() const;
};

/// Per-session counters. Every track call checks first and only increments on
/// success, so a rejected call leaves the tracker unchanged.
class ResourceTracker {
public:
    VgmResult<void> trackCommand(const ParserConfig& config);
    VgmResult<void> trackDataBlock(const ParserConfig& config, std::uint32_t size);
    VgmResult<void> enterParsingContext(const ParserConfig& config, std::size_t position = 0);
    void exitParsingContext();

    [[nodiscard]] std::size_t commandCount() const { return commandCount_; }
    [[nodiscard]] std::size_t dataBlockMemory() const { return dataBlockMemory_; }
    [[nodiscard]] std::uint32_t parsingDepth() const { return parsingDepth_; }
    [[nodiscard]] std::uint32_t maxParsingDepth() const { return maxParsingDepth_; }
    [[nodiscard]] std::size_t dataBlockCount() const { return dataBlockCount_; }
    [[nodiscard]] ResourceUsageSummary usageSummary() const;

private:
    std::size_t commandCount_ = 0;
    std::size_t dataBlockMemory_ = 0;
    std::uint32_t parsingDepth_ = 0;
    std::uint32_t maxParsingDepth_ = 0;
    std::size_t dataBlockCount_ = 0;
};

/// Holds one level of parsing depth for its lifetime.
class ParsingContextGuard {
public:
    static VgmResult<ParsingContextGuard> enter(ResourceTracker& tracker, const ParserConfig& config,
                                                std::size_t position);

    ParsingContextGuard(ParsingContextGuard&& other) noexcept : tracker_(other.tracker_) { other.tracker_ = nullptr; }
    ParsingContextGuard(const ParsingContextGuard&) = delete;
    ParsingContextGuard& operator=(const ParsingContextGuard&) = delete;
    ParsingContextGuard& operator=(ParsingContextGuard&&) = delete;
    ~ParsingContextGuard();

private:
    explicit ParsingContextGuard(ResourceTracker& tracker) : tracker_(&tracker) {}

    ResourceTracker* tracker_;
};

}  // namespace vgmtool::vgm
