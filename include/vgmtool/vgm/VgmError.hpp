#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace vgmtool::vgm {

enum class VgmErrorKind {
    // I/O
    FileNotFound,
    FileReadError,
    PermissionDenied,
    FileTooSmall,
    // Format
    InvalidMagicBytes,
    CorruptedHeader,
    InvalidOffset,
    TruncatedFile,
    InvalidDataFormat,
    // Data
    InvalidUtf16Encoding,
    InvalidBcdData,
    BufferUnderflow,
    InvalidDataLength,
    // Commands
    UnknownCommand,
    IncompleteCommand,
    InvalidCommandParameters,
    ParseStackOverflow,
    // Versions
    UnsupportedVgmVersion,
    UnsupportedGd3Version,
    FeatureNotSupported,
    // Resources
    MemoryAllocationFailed,
    IntegerOverflow,
    DataSizeExceedsLimit,
    // Logical
    InconsistentData,
    ValidationFailed,
    // Data blocks
    InvalidDataBlockType,
    DataBlockSizeMismatch,
    UnsupportedCompression,
};

enum class ErrorCategory {
    IO,
    FormatValidation,
    DataParsing,
    CommandParsing,
    VersionCompatibility,
    MemoryResource,
    LogicalValidation,
    DataBlock,
};

/// Structured parse/serialize failure. Which context members are meaningful
/// depends on the kind; see the factory functions.
struct VgmError {
    VgmErrorKind kind = VgmErrorKind::InvalidDataFormat;
    std::size_t offset = 0;
    std::string field;
    std::string detail;
    std::uint64_t expected = 0;
    std::uint64_t actual = 0;
    std::uint64_t limit = 0;
    std::uint8_t opcode = 0;

    static VgmError fileNotFound(std::string path);
    static VgmError fileReadError(std::string path, std::string reason);
    static VgmError permissionDenied(std::string path);
    static VgmError fileTooSmall(std::string path, std::size_t size);

    static VgmError invalidMagic(std::string_view expectedMagic, std::string found, std::size_t offset);
    static VgmError corruptedHeader(std::string reason, std::size_t offset);
    static VgmError invalidOffset(std::string field, std::uint64_t offset, std::uint64_t fileSize);
    static VgmError truncatedFile(std::uint64_t expectedSize, std::uint64_t actualSize);
    static VgmError invalidDataFormat(std::string field, std::string details);

    static VgmError invalidUtf16(std::string field, std::string details);
    static VgmError invalidBcd(std::string field, std::string details);
    static VgmError bufferUnderflow(std::size_t offset, std::size_t needed, std::size_t available);
    static VgmError invalidDataLength(std::string field, std::uint64_t expectedLength, std::uint64_t actualLength);

    static VgmError unknownCommand(std::uint8_t opcode, std::size_t position);
    static VgmError incompleteCommand(std::uint8_t opcode, std::size_t position, std::size_t expectedBytes,
                                      std::size_t availableBytes);
    static VgmError invalidCommandParameters(std::uint8_t opcode, std::size_t position, std::string reason);
    static VgmError parseStackOverflow(std::size_t position, std::size_t maxDepth);

    static VgmError unsupportedVgmVersion(std::uint32_t version, std::string supportedRange);
    static VgmError unsupportedGd3Version(std::uint32_t version, std::string supported);
    static VgmError featureNotSupported(std::string feature, std::string reason);

    static VgmError memoryAllocationFailed(std::size_t size, std::string purpose);
    static VgmError integerOverflow(std::string operation, std::string details);
    static VgmError dataSizeExceedsLimit(std::string field, std::uint64_t size, std::uint64_t limit);

    static VgmError inconsistentData(std::string context, std::string reason);
    static VgmError validationFailed(std::string field, std::string reason);

    static VgmError invalidDataBlockType(std::uint8_t blockType, std::size_t offset);
    static VgmError dataBlockSizeMismatch(std::uint64_t headerSize, std::uint64_t actualSize);
    static VgmError unsupportedCompression(std::string algorithm);

    [[nodiscard]] int code() const;
    [[nodiscard]] ErrorCategory category() const;
    [[nodiscard]] bool isRecoverable() const;
    [[nodiscard]] std::string_view suggestedAction() const;
    [[nodiscard]] std::string message() const;
};

template <typename T>
using VgmResult = std::expected<T, VgmError>;

std::string_view categoryName(ErrorCategory category);

}  // namespace vgmtool::vgm
