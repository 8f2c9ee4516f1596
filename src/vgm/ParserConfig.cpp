#include "vgmtool/vgm/ParserConfig.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <limits>

namespace vgmtool::vgm {
namespace {

using json = nlohmann::json;

constexpr double kBytesPerMb = 1024.0 * 1024.0;

template <typename T>
VgmResult<void> readLimit(const json& value, const char* key, T& out) {
    const auto it = value.find(key);
    if (it == value.end()) {
        return {};
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<std::int64_t>() >= 0)) {
        return std::unexpected(VgmError::invalidDataFormat(key, "expected a non-negative integer"));
    }
    const auto raw = it->get<std::uint64_t>();
    if (raw > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return std::unexpected(VgmError::invalidDataFormat(key, std::format("value {} is out of range", raw)));
    }
    out = static_cast<T>(raw);
    return {};
}

}  // namespace

ParserConfig ParserConfig::securityFocused() {
    ParserConfig config;
    config.maxCommands = 100'000;
    config.maxDataBlockSize = 1024 * 1024;
    config.maxTotalDataBlockMemory = 8 * 1024 * 1024;
    config.maxMetadataSize = 64 * 1024;
    config.maxChipClockEntries = 16;
    config.maxChipVolumeEntries = 16;
    config.strictResourceLimits = true;
    config.maxCommandMemory = 16 * 1024 * 1024;
    config.maxParsingDepth = 8;
    return config;
}

ParserConfig ParserConfig::permissive() {
    ParserConfig config;
    config.maxCommands = 2'000'000;
    config.maxDataBlockSize = 16 * 1024 * 1024;
    config.maxTotalDataBlockMemory = 128 * 1024 * 1024;
    config.maxMetadataSize = 1024 * 1024;
    config.maxChipClockEntries = 64;
    config.maxChipVolumeEntries = 64;
    config.strictResourceLimits = false;
    config.maxCommandMemory = 256 * 1024 * 1024;
    config.maxParsingDepth = 32;
    return config;
}

VgmResult<void> ParserConfig::checkCommandCount(std::size_t count) const {
    if (count > maxCommands) {
        return std::unexpected(VgmError::dataSizeExceedsLimit("command_count", count, maxCommands));
    }
    return {};
}

VgmResult<void> ParserConfig::checkCommandMemory(std::size_t count) const {
    const std::size_t estimated = estimateCommandMemory(count);
    if (estimated > maxCommandMemory) {
        return std::unexpected(VgmError::dataSizeExceedsLimit("command_memory", estimated, maxCommandMemory));
    }
    return {};
}

VgmResult<void> ParserConfig::checkDataBlockSize(std::uint32_t size) const {
    if (size > maxDataBlockSize) {
        return std::unexpected(VgmError::dataSizeExceedsLimit("data_block_size", size, maxDataBlockSize));
    }
    return {};
}

VgmResult<void> ParserConfig::checkMetadataSize(std::size_t size) const {
    if (size > maxMetadataSize) {
        return std::unexpected(VgmError::dataSizeExceedsLimit("metadata_size", size, maxMetadataSize));
    }
    return {};
}

VgmResult<void> ParserConfig::checkChipEntries(std::uint8_t clockEntries, std::uint8_t volumeEntries) const {
    if (clockEntries > maxChipClockEntries) {
        return std::unexpected(
            VgmError::dataSizeExceedsLimit("chip_clock_entries", clockEntries, maxChipClockEntries));
    }
    if (volumeEntries > maxChipVolumeEntries) {
        return std::unexpected(
            VgmError::dataSizeExceedsLimit("chip_volume_entries", volumeEntries, maxChipVolumeEntries));
    }
    return {};
}

std::optional<ParserConfig> parserConfigPreset(std::string_view name) {
    if (name == "default") {
        return ParserConfig::defaults();
    }
    if (name == "security_focused" || name == "security") {
        return ParserConfig::securityFocused();
    }
    if (name == "permissive") {
        return ParserConfig::permissive();
    }
    return std::nullopt;
}

VgmResult<ParserConfig> parserConfigFromJson(const json& value) {
    if (!value.is_object()) {
        return std::unexpected(VgmError::invalidDataFormat("parser config", "expected a JSON object"));
    }

    ParserConfig config;
    if (const auto it = value.find("preset"); it != value.end()) {
        if (!it->is_string()) {
            return std::unexpected(VgmError::invalidDataFormat("preset", "expected a string"));
        }
        const auto name = it->get<std::string>();
        auto preset = parserConfigPreset(name);
        if (!preset) {
            return std::unexpected(VgmError::invalidDataFormat("preset", std::format("unknown preset '{}'", name)));
        }
        config = *preset;
    }

    VgmResult<void> status;
    status = readLimit(value, "max_commands", config.maxCommands);
    if (status) {
        status = readLimit(value, "max_data_block_size", config.maxDataBlockSize);
    }
    if (status) {
        status = readLimit(value, "max_total_data_block_memory", config.maxTotalDataBlockMemory);
    }
    if (status) {
        status = readLimit(value, "max_metadata_size", config.maxMetadataSize);
    }
    if (status) {
        status = readLimit(value, "max_chip_clock_entries", config.maxChipClockEntries);
    }
    if (status) {
        status = readLimit(value, "max_chip_volume_entries", config.maxChipVolumeEntries);
    }
    if (status) {
        status = readLimit(value, "max_command_memory", config.maxCommandMemory);
    }
    if (status) {
        status = readLimit(value, "max_parsing_depth", config.maxParsingDepth);
    }
    if (!status) {
        return std::unexpected(status.error());
    }

    if (const auto it = value.find("strict_resource_limits"); it != value.end()) {
        if (!it->is_boolean()) {
            return std::unexpected(VgmError::invalidDataFormat("strict_resource_limits", "expected a boolean"));
        }
        config.strictResourceLimits = it->get<bool>();
    }

    return config;
}

VgmResult<ParserConfig> loadParserConfigFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(VgmError::fileNotFound(path.string()));
    }

    json parsed;
    try {
        in >> parsed;
    } catch (const json::parse_error& e) {
        return std::unexpected(VgmError::invalidDataFormat(path.string(), e.what()));
    }
    return parserConfigFromJson(parsed);
}

json parserConfigToJson(const ParserConfig& config) {
    return json{
        {"max_commands", config.maxCommands},
        {"max_data_block_size", config.maxDataBlockSize},
        {"max_total_data_block_memory", config.maxTotalDataBlockMemory},
        {"max_metadata_size", config.maxMetadataSize},
        {"max_chip_clock_entries", config.maxChipClockEntries},
        {"max_chip_volume_entries", config.maxChipVolumeEntries},
        {"strict_resource_limits", config.strictResourceLimits},
        {"max_command_memory", config.maxCommandMemory},
        {"max_parsing_depth", config.maxParsingDepth},
    };
}

std::string ResourceUsageSummary::toString() const {
    return std::format("Commands: {}, Data blocks: {} ({:.2f} MB), Max depth: {}", commandCount, dataBlockCount,
                       dataBlockMemoryMb, maxParsingDepth);
}

VgmResult<void> ResourceTracker::trackCommand(const ParserConfig& config) {
    const std::size_t next = commandCount_ + 1;
    if (auto ok = config.checkCommandCount(next); !ok) {
        return ok;
    }
    if (config.strictResourceLimits) {
        if (auto ok = config.checkCommandMemory(next); !ok) {
            return ok;
        }
    }
    commandCount_ = next;
    return {};
}

VgmResult<void> ResourceTracker::trackDataBlock(const ParserConfig& config, std::uint32_t size) {
    if (auto ok = config.checkDataBlockSize(size); !ok) {
        return ok;
    }
    const std::size_t newTotal = dataBlockMemory_ + size;
    if (newTotal > config.maxTotalDataBlockMemory) {
        return std::unexpected(
            VgmError::dataSizeExceedsLimit("total_data_block_memory", newTotal, config.maxTotalDataBlockMemory));
    }
    dataBlockMemory_ = newTotal;
    ++dataBlockCount_;
    return {};
}

VgmResult<void> ResourceTracker::enterParsingContext(const ParserConfig& config, std::size_t position) {
    if (parsingDepth_ + 1 > config.maxParsingDepth) {
        return std::unexpected(VgmError::parseStackOverflow(position, config.maxParsingDepth));
    }
    ++parsingDepth_;
    maxParsingDepth_ = std::max(maxParsingDepth_, parsingDepth_);
    return {};
}

void ResourceTracker::exitParsingContext() {
    if (parsingDepth_ > 0) {
        --parsingDepth_;
    }
}

ResourceUsageSummary ResourceTracker::usageSummary() const {
    return ResourceUsageSummary{
        .commandCount = commandCount_,
        .dataBlockMemoryMb = static_cast<double>(dataBlockMemory_) / kBytesPerMb,
        .dataBlockCount = dataBlockCount_,
        .parsingDepth = parsingDepth_,
        .maxParsingDepth = maxParsingDepth_,
    };
}

VgmResult<ParsingContextGuard> ParsingContextGuard::enter(ResourceTracker& tracker, const ParserConfig& config,
                                                          std::size_t position) {
    if (auto ok = tracker.enterParsingContext(config, position); !ok) {
        return std::unexpected(ok.error());
    }
    return ParsingContextGuard(tracker);
}

ParsingContextGuard::~ParsingContextGuard() {
    if (tracker_ != nullptr) {
        tracker_->exitParsingContext();
    }
}

}  // namespace vgmtool::vgm
