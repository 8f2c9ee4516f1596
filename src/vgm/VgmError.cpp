#include "vgmtool/vgm/VgmError.hpp"

#include <format>
#include <utility>

namespace vgmtool::vgm {
namespace {

VgmError make(VgmErrorKind kind) {
    VgmError error;
    error.kind = kind;
    return error;
}

}  // namespace

VgmError VgmError::fileNotFound(std::string path) {
    auto error = make(VgmErrorKind::FileNotFound);
    error.field = std::move(path);
    return error;
}

VgmError VgmError::fileReadError(std::string path, std::string reason) {
    auto error = make(VgmErrorKind::FileReadError);
    error.field = std::move(path);
    error.detail = std::move(reason);
    return error;
}

VgmError VgmError::permissionDenied(std::string path) {
    auto error = make(VgmErrorKind::PermissionDenied);
    error.field = std::move(path);
    return error;
}

VgmError VgmError::fileTooSmall(std::string path, std::size_t size) {
    auto error = make(VgmErrorKind::FileTooSmall);
    error.field = std::move(path);
    error.actual = size;
    error.expected = 64;
    return error;
}

VgmError VgmError::invalidMagic(std::string_view expectedMagic, std::string found, std::size_t offset) {
    auto error = make(VgmErrorKind::InvalidMagicBytes);
    error.field = std::string(expectedMagic);
    error.detail = std::move(found);
    error.offset = offset;
    return error;
}

VgmError VgmError::corruptedHeader(std::string reason, std::size_t offset) {
    auto error = make(VgmErrorKind::CorruptedHeader);
    error.detail = std::move(reason);
    error.offset = offset;
    return error;
}

VgmError VgmError::invalidOffset(std::string field, std::uint64_t offset, std::uint64_t fileSize) {
    auto error = make(VgmErrorKind::InvalidOffset);
    error.field = std::move(field);
    error.actual = offset;
    error.limit = fileSize;
    error.offset = static_cast<std::size_t>(offset);
    return error;
}

VgmError VgmError::truncatedFile(std::uint64_t expectedSize, std::uint64_t actualSize) {
    auto error = make(VgmErrorKind::TruncatedFile);
    error.expected = expectedSize;
    error.actual = actualSize;
    return error;
}

VgmError VgmError::invalidDataFormat(std::string field, std::string details) {
    auto error = make(VgmErrorKind::InvalidDataFormat);
    error.field = std::move(field);
    error.detail = std::move(details);
    return error;
}

VgmError VgmError::invalidUtf16(std::string field, std::string details) {
    auto error = make(VgmErrorKind::InvalidUtf16Encoding);
    error.field = std::move(field);
    error.detail = std::move(details);
    return error;
}

VgmError VgmError::invalidBcd(std::string field, std::string details) {
    auto error = make(VgmErrorKind::InvalidBcdData);
    error.field = std::move(field);
    error.detail = std::move(details);
    return error;
}

VgmError VgmError::bufferUnderflow(std::size_t offset, std::size_t needed, std::size_t available) {
    auto error = make(VgmErrorKind::BufferUnderflow);
    error.offset = offset;
    error.expected = needed;
    error.actual = available;
    return error;
}

VgmError VgmError::invalidDataLength(std::string field, std::uint64_t expectedLength, std::uint64_t actualLength) {
    auto error = make(VgmErrorKind::InvalidDataLength);
    error.field = std::move(field);
    error.expected = expectedLength;
    error.actual = actualLength;
    return error;
}

VgmError VgmError::unknownCommand(std::uint8_t opcode, std::size_t position) {
    auto error = make(VgmErrorKind::UnknownCommand);
    error.opcode = opcode;
    error.offset = position;
    return error;
}

VgmError VgmError::incompleteCommand(std::uint8_t opcode, std::size_t position, std::size_t expectedBytes,
                                     std::size_t availableBytes) {
    auto error = make(VgmErrorKind::IncompleteCommand);
    error.opcode = opcode;
    error.offset = position;
    error.expected = expectedBytes;
    error.actual = availableBytes;
    return error;
}

VgmError VgmError::invalidCommandParameters(std::uint8_t opcode, std::size_t position, std::string reason) {
    auto error = make(VgmErrorKind::InvalidCommandParameters);
    error.opcode = opcode;
    error.offset = position;
    error.detail = std::move(reason);
    return error;
}

VgmError VgmError::parseStackOverflow(std::size_t position, std::size_t maxDepth) {
    auto error = make(VgmErrorKind::ParseStackOverflow);
    error.offset = position;
    error.limit = maxDepth;
    return error;
}

VgmError VgmError::unsupportedVgmVersion(std::uint32_t version, std::string supportedRange) {
    auto error = make(VgmErrorKind::UnsupportedVgmVersion);
    error.actual = version;
    error.detail = std::move(supportedRange);
    return error;
}

VgmError VgmError::unsupportedGd3Version(std::uint32_t version, std::string supported) {
    auto error = make(VgmErrorKind::UnsupportedGd3Version);
    error.actual = version;
    error.detail = std::move(supported);
    return error;
}

VgmError VgmError::featureNotSupported(std::string feature, std::string reason) {
    auto error = make(VgmErrorKind::FeatureNotSupported);
    error.field = std::move(feature);
    error.detail = std::move(reason);
    return error;
}

VgmError VgmError::memoryAllocationFailed(std::size_t size, std::string purpose) {
    auto error = make(VgmErrorKind::MemoryAllocationFailed);
    error.actual = size;
    error.field = std::move(purpose);
    return error;
}

VgmError VgmError::integerOverflow(std::string operation, std::string details) {
    auto error = make(VgmErrorKind::IntegerOverflow);
    error.field = std::move(operation);
    error.detail = std::move(details);
    return error;
}

VgmError VgmError::dataSizeExceedsLimit(std::string field, std::uint64_t size, std::uint64_t limit) {
    auto error = make(VgmErrorKind::DataSizeExceedsLimit);
    error.field = std::move(field);
    error.actual = size;
    error.limit = limit;
    return error;
}

VgmError VgmError::inconsistentData(std::string context, std::string reason) {
    auto error = make(VgmErrorKind::InconsistentData);
    error.field = std::move(context);
    error.detail = std::move(reason);
    return error;
}

VgmError VgmError::validationFailed(std::string field, std::string reason) {
    auto error = make(VgmErrorKind::ValidationFailed);
    error.field = std::move(field);
    error.detail = std::move(reason);
    return error;
}

VgmError VgmError::invalidDataBlockType(std::uint8_t blockType, std::size_t offset) {
    auto error = make(VgmErrorKind::InvalidDataBlockType);
    error.opcode = blockType;
    error.offset = offset;
    return error;
}

VgmError VgmError::dataBlockSizeMismatch(std::uint64_t headerSize, std::uint64_t actualSize) {
    auto error = make(VgmErrorKind::DataBlockSizeMismatch);
    error.expected = headerSize;
    error.actual = actualSize;
    return error;
}

VgmError VgmError::unsupportedCompression(std::string algorithm) {
    auto error = make(VgmErrorKind::UnsupportedCompression);
    error.field = std::move(algorithm);
    return error;
}

int VgmError::code() const {
    switch (kind) {
    case VgmErrorKind::FileNotFound:
        return 1001;
    case VgmErrorKind::FileReadError:
        return 1002;
    case VgmErrorKind::PermissionDenied:
        return 1003;
    case VgmErrorKind::FileTooSmall:
        return 1004;
    case VgmErrorKind::InvalidMagicBytes:
        return 2001;
    case VgmErrorKind::CorruptedHeader:
        return 2002;
    case VgmErrorKind::InvalidOffset:
        return 2003;
    case VgmErrorKind::TruncatedFile:
        return 2004;
    case VgmErrorKind::InvalidDataFormat:
        return 2005;
    case VgmErrorKind::InvalidUtf16Encoding:
        return 3001;
    case VgmErrorKind::InvalidBcdData:
        return 3002;
    case VgmErrorKind::BufferUnderflow:
        return 3003;
    case VgmErrorKind::InvalidDataLength:
        return 3004;
    case VgmErrorKind::UnknownCommand:
        return 4001;
    case VgmErrorKind::IncompleteCommand:
        return 4002;
    case VgmErrorKind::InvalidCommandParameters:
        return 4003;
    case VgmErrorKind::ParseStackOverflow:
        return 4004;
    case VgmErrorKind::UnsupportedVgmVersion:
        return 5001;
    case VgmErrorKind::UnsupportedGd3Version:
        return 5002;
    case VgmErrorKind::FeatureNotSupported:
        return 5003;
    case VgmErrorKind::MemoryAllocationFailed:
        return 6001;
    case VgmErrorKind::IntegerOverflow:
        return 6002;
    case VgmErrorKind::DataSizeExceedsLimit:
        return 6003;
    case VgmErrorKind::InconsistentData:
        return 7001;
    case VgmErrorKind::ValidationFailed:
        return 7002;
    case VgmErrorKind::InvalidDataBlockType:
        return 8001;
    case VgmErrorKind::DataBlockSizeMismatch:
        return 8002;
    case VgmErrorKind::UnsupportedCompression:
        return 8003;
    }
    return 0;
}

ErrorCategory VgmError::category() const {
    switch (code() / 1000) {
    case 1:
        return ErrorCategory::IO;
    case 2:
        return ErrorCategory::FormatValidation;
    case 3:
        return ErrorCategory::DataParsing;
    case 4:
        return ErrorCategory::CommandParsing;
    case 5:
        return ErrorCategory::VersionCompatibility;
    case 6:
        return ErrorCategory::MemoryResource;
    case 7:
        return ErrorCategory::LogicalValidation;
    default:
        return ErrorCategory::DataBlock;
    }
}

bool VgmError::isRecoverable() const {
    switch (kind) {
    case VgmErrorKind::UnknownCommand:
    case VgmErrorKind::InvalidCommandParameters:
    case VgmErrorKind::UnsupportedGd3Version:
        return true;
    default:
        return false;
    }
}

std::string_view VgmError::suggestedAction() const {
    switch (kind) {
    case VgmErrorKind::FileNotFound:
        return "Check file path and ensure file exists";
    case VgmErrorKind::PermissionDenied:
        return "Check file permissions and user access rights";
    case VgmErrorKind::InvalidMagicBytes:
        return "Verify this is a valid VGM file";
    case VgmErrorKind::UnsupportedVgmVersion:
        return "Use a VGM file with a supported version";
    case VgmErrorKind::UnknownCommand:
        return "File may use commands from a newer VGM specification";
    case VgmErrorKind::BufferUnderflow:
        return "File appears to be corrupted or truncated";
    case VgmErrorKind::InvalidUtf16Encoding:
        return "Metadata contains invalid text encoding";
    case VgmErrorKind::MemoryAllocationFailed:
        return "Reduce file size or increase available memory";
    case VgmErrorKind::DataSizeExceedsLimit:
    case VgmErrorKind::ParseStackOverflow:
        return "Use a more permissive parser configuration if the file is trusted";
    default:
        return "Check file integrity and VGM format compliance";
    }
}

std::string VgmError::message() const {
    switch (kind) {
    case VgmErrorKind::FileNotFound:
        return std::format("File not found: {}", field);
    case VgmErrorKind::FileReadError:
        return std::format("Failed to read file {}: {}", field, detail);
    case VgmErrorKind::PermissionDenied:
        return std::format("Permission denied accessing file: {}", field);
    case VgmErrorKind::FileTooSmall:
        return std::format("File too small to be valid VGM: {} ({} bytes, minimum {} required)", field, actual,
                           expected);
    case VgmErrorKind::InvalidMagicBytes:
        return std::format("Invalid magic bytes: expected '{}', found '{}' at offset {}", field, detail, offset);
    case VgmErrorKind::CorruptedHeader:
        return std::format("Corrupted VGM header: {} at offset {}", detail, offset);
    case VgmErrorKind::InvalidOffset:
        return std::format("Invalid offset in header: {}={}, file size={}", field, actual, limit);
    case VgmErrorKind::TruncatedFile:
        return std::format("Truncated VGM file: expected {} bytes, file ends at {}", expected, actual);
    case VgmErrorKind::InvalidDataFormat:
        return std::format("Invalid data format for {}: {}", field, detail);
    case VgmErrorKind::InvalidUtf16Encoding:
        return std::format("Invalid UTF-16 encoding in {}: {}", field, detail);
    case VgmErrorKind::InvalidBcdData:
        return std::format("Invalid BCD data for {}: {}", field, detail);
    case VgmErrorKind::BufferUnderflow:
        return std::format("Buffer underflow at offset {}: needed {} bytes, only {} available", offset, expected,
                           actual);
    case VgmErrorKind::InvalidDataLength:
        return std::format("Invalid data length for {}: expected {}, got {}", field, expected, actual);
    case VgmErrorKind::UnknownCommand:
        return std::format("Unknown command opcode 0x{:02X} at position {}", opcode, offset);
    case VgmErrorKind::IncompleteCommand:
        return std::format("Incomplete command 0x{:02X} at position {}: expected {} bytes, only {} available", opcode,
                           offset, expected, actual);
    case VgmErrorKind::InvalidCommandParameters:
        return std::format("Invalid parameters for command 0x{:02X} at position {}: {}", opcode, offset, detail);
    case VgmErrorKind::ParseStackOverflow:
        return std::format("Parsing depth exceeded at position {}: maximum depth {}", offset, limit);
    case VgmErrorKind::UnsupportedVgmVersion:
        return std::format("Unsupported VGM version {} (0x{:08X}): supported versions are {}", actual, actual, detail);
    case VgmErrorKind::UnsupportedGd3Version:
        return std::format("Unsupported GD3 version 0x{:08X}: supported versions are {}", actual, detail);
    case VgmErrorKind::FeatureNotSupported:
        return std::format("Feature '{}' not supported: {}", field, detail);
    case VgmErrorKind::MemoryAllocationFailed:
        return std::format("Memory allocation failed: attempted to allocate {} bytes for {}", actual, field);
    case VgmErrorKind::IntegerOverflow:
        return std::format("Integer overflow in {}: {}", field, detail);
    case VgmErrorKind::DataSizeExceedsLimit:
        return std::format("Data size exceeds limit for {}: {} (limit: {})", field, actual, limit);
    case VgmErrorKind::InconsistentData:
        return std::format("Data inconsistency in {}: {}", field, detail);
    case VgmErrorKind::ValidationFailed:
        return std::format("Validation failed for {}: {}", field, detail);
    case VgmErrorKind::InvalidDataBlockType:
        return std::format("Invalid data block type 0x{:02X} at offset {}", opcode, offset);
    case VgmErrorKind::DataBlockSizeMismatch:
        return std::format("Data block size mismatch: header claims {} bytes, actual block is {} bytes", expected,
                           actual);
    case VgmErrorKind::UnsupportedCompression:
        return std::format("Unsupported compression algorithm in data block: {}", field);
    }
    return "Unknown VGM error";
}

std::string_view categoryName(ErrorCategory category) {
    switch (category) {
    case ErrorCategory::IO:
        return "I/O";
    case ErrorCategory::FormatValidation:
        return "Format Validation";
    case ErrorCategory::DataParsing:
        return "Data Parsing";
    case ErrorCategory::CommandParsing:
        return "Command Parsing";
    case ErrorCategory::VersionCompatibility:
        return "Version Compatibility";
    case ErrorCategory::MemoryResource:
        return "Memory/Resource";
    case ErrorCategory::LogicalValidation:
        return "Logical Validation";
    case ErrorCategory::DataBlock:
        return "Data Block";
    }
    return "Unknown";
}

}  // namespace vgmtool::vgm
