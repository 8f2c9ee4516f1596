#include "vgmtool/common/Log.hpp"
#include "vgmtool/common/Logger.hpp"
#include "vgmtool/common/Paths.hpp"
#include "vgmtool/vgm/Bcd.hpp"
#include "vgmtool/vgm/CommandCodec.hpp"
#include "vgmtool/vgm/ParserConfig.hpp"
#include "vgmtool/vgm/SoundChip.hpp"
#include "vgmtool/vgm/VgmFileIo.hpp"
#include "vgmtool/vgm/VgmJson.hpp"
#include "vgmtool/vgm/VgmValidator.hpp"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace vgmtool::tools {
namespace {

constexpr double kSampleRate = 44100.0;

struct ToolOptions {
    std::filesystem::path inputPath;
    std::optional<std::string> preset;
    std::optional<std::filesystem::path> configPath;
    std::optional<std::filesystem::path> jsonPath;
    std::optional<std::filesystem::path> rewritePath;
    std::optional<std::filesystem::path> logPath;
    bool gzip = false;
    bool validate = true;
};

void printUsage(std::ostream& out, std::string_view programName) {
    out << "Usage:\n";
    out << "  " << programName
        << " <file.vgm|file.vgz> [--preset <name>] [--config <file.json>] [--json <out.json>] [--rewrite <out.vgm>]"
           " [--gzip] [--no-validate] [--log <file>]\n";
    out << "\nOptions:\n";
    out << "  --preset        Parser limits: default | security | permissive\n";
    out << "  --config        Parser limits from a JSON file (default: user parser_config.json if present)\n";
    out << "  --json          Write a JSON dump of header, commands and metadata\n";
    out << "  --rewrite       Re-encode the parsed file to this path\n";
    out << "  --gzip          Compress the --rewrite output as .vgz\n";
    out << "  --no-validate   Skip post-parse validation\n";
    out << "  --log           Append diagnostics to this file\n";
    out << "  --help, -h      Show this help\n";
}

std::expected<ToolOptions, std::string> parseArgs(int argc, char** argv) {
    ToolOptions options;
    bool hasInput = false;

    auto require_value = [&](int& index, std::string_view flag) -> std::expected<std::string, std::string> {
        if (index + 1 >= argc) {
            return std::unexpected(std::format("Missing value for {}", flag));
        }
        ++index;
        return std::string(argv[index]);
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            printUsage(std::cout, argc > 0 ? argv[0] : "vgmtool_dump");
            std::exit(0);
        }
        if (arg == "--preset" || arg == "--config" || arg == "--json" || arg == "--rewrite" || arg == "--log") {
            auto value = require_value(i, arg);
            if (!value.has_value()) {
                return std::unexpected(value.error());
            }
            if (arg == "--preset") {
                options.preset = *value;
            } else if (arg == "--config") {
                options.configPath = *value;
            } else if (arg == "--json") {
                options.jsonPath = *value;
            } else if (arg == "--rewrite") {
                options.rewritePath = *value;
            } else {
                options.logPath = *value;
            }
            continue;
        }
        if (arg == "--gzip") {
            options.gzip = true;
            continue;
        }
        if (arg == "--no-validate") {
            options.validate = false;
            continue;
        }
        if (arg.starts_with("-")) {
            return std::unexpected(std::format("Unknown option '{}'", arg));
        }
        if (hasInput) {
            return std::unexpected(std::format("Unexpected extra input '{}'", arg));
        }
        options.inputPath = std::string(arg);
        hasInput = true;
    }

    if (!hasInput) {
        return std::unexpected("No input file given");
    }
    if (options.preset.has_value() && options.configPath.has_value()) {
        return std::unexpected("--preset and --config are mutually exclusive");
    }
    if (options.gzip && !options.rewritePath.has_value()) {
        return std::unexpected("--gzip requires --rewrite");
    }
    return options;
}

std::expected<vgm::ParserConfig, std::string> resolveParserConfig(const ToolOptions& options) {
    if (options.preset.has_value()) {
        auto preset = vgm::parserConfigPreset(*options.preset);
        if (!preset.has_value()) {
            return std::unexpected(std::format("Unknown preset '{}'", *options.preset));
        }
        return *preset;
    }

    std::optional<std::filesystem::path> configPath = options.configPath;
    if (!configPath.has_value()) {
        for (const auto& candidate : {common::userParserConfigPath(), common::bundledParserConfigPath()}) {
            std::error_code ec;
            if (!candidate.empty() && std::filesystem::exists(candidate, ec) && !ec) {
                configPath = candidate;
                break;
            }
        }
    }
    if (!configPath.has_value()) {
        return vgm::ParserConfig::defaults();
    }

    auto config = vgm::loadParserConfigFile(*configPath);
    if (!config.has_value()) {
        return std::unexpected(
            std::format("Failed to load parser config '{}': {}", configPath->string(), config.error().message()));
    }
    common::logInfo(std::format("Using parser config '{}'", configPath->string()));
    return *config;
}

void printHeaderSummary(const vgm::VgmHeader& header) {
    const auto version = vgm::decimalVersion(header);
    const std::string versionText =
        version.has_value() ? vgm::formatVersion(*version) : std::format("0x{:08X}", header.version);
    std::cout << std::format("Version:        {}\n", versionText);
    std::cout << std::format("Total samples:  {} ({:.2f} s)\n", header.totalSamples,
                             static_cast<double>(header.totalSamples) / kSampleRate);
    if (header.loopOffset != 0) {
        std::cout << std::format("Loop samples:   {}\n", header.loopSamples);
    }

    std::cout << "Clocks:\n";
    for (const vgm::SoundChip chip : vgm::activeSoundChips(header)) {
        std::cout << std::format("  {:<16} {} Hz\n", vgm::soundChipName(chip),
                                 vgm::soundChipClock(header, chip) & vgm::kChipClockMask);
    }
    if (header.extraHeader.has_value()) {
        std::cout << std::format("Extra header:   {} clock entries, {} volume entries\n",
                                 header.extraHeader->chipClocks.size(), header.extraHeader->chipVolumes.size());
    }
}

void printMetadata(const vgm::Gd3Metadata& metadata) {
    std::cout << std::format("Track:          {}\n", metadata.english.track);
    std::cout << std::format("Game:           {}\n", metadata.english.game);
    std::cout << std::format("System:         {}\n", metadata.english.system);
    std::cout << std::format("Author:         {}\n", metadata.english.author);
    if (!metadata.releaseDate.empty()) {
        std::cout << std::format("Released:       {}\n", metadata.releaseDate);
    }
    if (!metadata.creator.empty()) {
        std::cout << std::format("Ripped by:      {}\n", metadata.creator);
    }
}

void printCommandStatistics(const vgm::VgmFile& file) {
    std::map<std::string_view, std::size_t> counts;
    for (const auto& command : file.commands) {
        ++counts[vgm::commandName(command)];
    }
    const std::uint64_t samples = file.totalWaitSamples();
    std::cout << std::format("Commands:       {} ({} wait samples, {:.2f} s)\n", file.commands.size(), samples,
                             static_cast<double>(samples) / kSampleRate);
    for (const auto& [name, count] : counts) {
        std::cout << std::format("  {:<32} {}\n", name, count);
    }
}

std::expected<void, std::string> writeTextFile(const std::filesystem::path& path, std::string_view text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open '{}' for writing", path.string()));
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out.good()) {
        return std::unexpected(std::format("Failed while writing '{}'", path.string()));
    }
    return {};
}

std::expected<void, std::string> run(const ToolOptions& options) {
    auto parserConfig = resolveParserConfig(options);
    if (!parserConfig.has_value()) {
        return std::unexpected(parserConfig.error());
    }

    auto loaded = vgm::loadVgm(options.inputPath, *parserConfig, vgm::ValidationConfig{}, options.validate);
    if (!loaded.has_value()) {
        const auto& error = loaded.error();
        return std::unexpected(std::format("[{}] {} ({})", error.code(), error.message(), error.suggestedAction()));
    }

    std::cout << std::format("File:           {}{}\n", options.inputPath.string(),
                             loaded->wasCompressed ? " (gzip)" : "");
    std::cout << std::format("Size:           {} bytes\n", loaded->byteSize);
    printHeaderSummary(loaded->file.header);
    if (loaded->file.metadata.has_value()) {
        printMetadata(*loaded->file.metadata);
    }
    printCommandStatistics(loaded->file);
    std::cout << std::format("Resources:      {}\n", loaded->usage.toString());

    if (options.jsonPath.has_value()) {
        if (auto written = writeTextFile(*options.jsonPath, vgm::toJsonString(loaded->file)); !written.has_value()) {
            return written;
        }
        common::logInfo(std::format("JSON dump written to '{}'", options.jsonPath->string()));
    }

    if (options.rewritePath.has_value()) {
        if (auto saved = vgm::saveVgmFile(*options.rewritePath, loaded->file, options.gzip); !saved.has_value()) {
            return std::unexpected(std::format("Failed to write '{}': {}", options.rewritePath->string(),
                                               saved.error().message()));
        }
        common::logInfo(std::format("Re-encoded file written to '{}'", options.rewritePath->string()));
    }
    return {};
}

}  // namespace
}  // namespace vgmtool::tools

int main(int argc, char** argv) {
    auto options = vgmtool::tools::parseArgs(argc, argv);
    if (!options.has_value()) {
        std::cerr << "Error: " << options.error() << '\n';
        vgmtool::tools::printUsage(std::cerr, argc > 0 ? argv[0] : "vgmtool_dump");
        return 1;
    }

    if (options->logPath.has_value() && !vgmtool::common::Logger::init(*options->logPath)) {
        std::cerr << std::format("Warning: could not open log file '{}'\n", options->logPath->string());
    }

    auto result = vgmtool::tools::run(*options);
    vgmtool::common::Logger::shutdown();
    if (!result.has_value()) {
        std::cerr << "Error: " << result.error() << '\n';
        return 1;
    }
    return 0;
}
