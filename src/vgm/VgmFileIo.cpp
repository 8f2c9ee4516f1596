#include "vgmtool/vgm/VgmFileIo.hpp"

#include "vgmtool/common/Logger.hpp"
#include "vgmtool/vgm/Gzip.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace vgmtool::vgm {

VgmResult<std::vector<std::uint8_t>> readFileBytes(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return std::unexpected(VgmError::fileNotFound(path.string()));
    }
    if (std::filesystem::is_directory(status)) {
        return std::unexpected(VgmError::fileReadError(path.string(), "path is a directory"));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        if (errno == EACCES) {
            return std::unexpected(VgmError::permissionDenied(path.string()));
        }
        return std::unexpected(VgmError::fileReadError(path.string(), std::strerror(errno)));
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(VgmError::fileReadError(path.string(), "read failed"));
    }
    return bytes;
}

VgmResult<void> writeFileBytes(const std::filesystem::path& path, std::span<const std::uint8_t> bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        if (errno == EACCES) {
            return std::unexpected(VgmError::permissionDenied(path.string()));
        }
        return std::unexpected(VgmError::fileReadError(path.string(), "failed to open for writing"));
    }
    if (!bytes.empty()) {
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    if (!out.good()) {
        return std::unexpected(VgmError::fileReadError(path.string(), "failed while writing"));
    }
    return {};
}

VgmResult<LoadedVgm> loadVgm(const std::filesystem::path& path, const ParserConfig& parserConfig,
                             const ValidationConfig& validationConfig, bool validate) {
    common::Logger::log(std::format("Loading VGM '{}'", path.string()));

    auto raw = readFileBytes(path);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    const bool wasCompressed = isGzipData(*raw);

    auto bytes = detectAndDecompress(*raw, validationConfig.maxFileSize);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (wasCompressed) {
        common::Logger::log(std::format("Inflated '{}': {} -> {} bytes", path.string(), raw->size(), bytes->size()));
    }

    if (bytes->size() < kMinVgmFileSize) {
        return std::unexpected(VgmError::fileTooSmall(path.string(), bytes->size()));
    }
    if (bytes->size() > validationConfig.maxFileSize) {
        return std::unexpected(
            VgmError::dataSizeExceedsLimit("decompressed_file_size", bytes->size(), validationConfig.maxFileSize));
    }

    ResourceTracker tracker;
    auto file = decodeFile(*bytes, parserConfig, tracker);
    if (!file) {
        return std::unexpected(file.error());
    }

    if (validate) {
        const VgmValidator validator(validationConfig);
        if (auto ok = validator.validateFile(*file, bytes->size()); !ok) {
            return std::unexpected(ok.error());
        }
    }

    LoadedVgm loaded;
    loaded.file = std::move(*file);
    loaded.byteSize = bytes->size();
    loaded.wasCompressed = wasCompressed;
    loaded.usage = tracker.usageSummary();
    common::Logger::log(std::format("Loaded '{}': {}", path.string(), loaded.usage.toString()));
    return loaded;
}

VgmResult<VgmFile> loadVgmFile(const std::filesystem::path& path, const ParserConfig& parserConfig,
                               const ValidationConfig& validationConfig) {
    auto loaded = loadVgm(path, parserConfig, validationConfig);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    return std::move(loaded->file);
}

VgmResult<void> saveVgmFile(const std::filesystem::path& path, const VgmFile& file, bool compress) {
    auto bytes = encodeFile(file);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    if (compress) {
        auto packed = compressGzip(*bytes);
        if (!packed) {
            return std::unexpected(packed.error());
        }
        bytes = std::move(packed);
    }
    if (auto ok = writeFileBytes(path, *bytes); !ok) {
        return ok;
    }
    common::Logger::log(std::format("Wrote '{}' ({} bytes)", path.string(), bytes->size()));
    return {};
}

}  // namespace vgmtool::vgm
