#include "vgmtool/vgm/VgmError.hpp"

#include <gtest/gtest.h>

namespace vgmtool::vgm {

TEST(VgmErrorTest, CodesGroupIntoCategories) {
    EXPECT_EQ(VgmError::fileNotFound("a.vgm").code(), 1001);
    EXPECT_EQ(VgmError::fileNotFound("a.vgm").category(), ErrorCategory::IO);
    EXPECT_EQ(VgmError::invalidMagic("Vgm ", "RIFF", 0).category(), ErrorCategory::FormatValidation);
    EXPECT_EQ(VgmError::bufferUnderflow(0, 4, 1).category(), ErrorCategory::DataParsing);
    EXPECT_EQ(VgmError::unknownCommand(0xFF, 0x40).code(), 4001);
    EXPECT_EQ(VgmError::unknownCommand(0xFF, 0x40).category(), ErrorCategory::CommandParsing);
    EXPECT_EQ(VgmError::unsupportedGd3Version(0x200, "1.00").category(), ErrorCategory::VersionCompatibility);
    EXPECT_EQ(VgmError::dataSizeExceedsLimit("x", 2, 1).category(), ErrorCategory::MemoryResource);
    EXPECT_EQ(VgmError::inconsistentData("x", "y").category(), ErrorCategory::LogicalValidation);
    EXPECT_EQ(VgmError::unsupportedCompression("lz").code(), 8003);
    EXPECT_EQ(VgmError::unsupportedCompression("lz").category(), ErrorCategory::DataBlock);
}

TEST(VgmErrorTest, OnlyLocalFailuresAreRecoverable) {
    EXPECT_TRUE(VgmError::unknownCommand(0xFF, 0).isRecoverable());
    EXPECT_TRUE(VgmError::invalidCommandParameters(0x67, 0, "bad").isRecoverable());
    EXPECT_TRUE(VgmError::unsupportedGd3Version(0x200, "1.00").isRecoverable());
    EXPECT_FALSE(VgmError::bufferUnderflow(0, 4, 1).isRecoverable());
    EXPECT_FALSE(VgmError::invalidMagic("Vgm ", "RIFF", 0).isRecoverable());
}

TEST(VgmErrorTest, MessagesCarryContext) {
    EXPECT_EQ(VgmError::unknownCommand(0xFF, 64).message(), "Unknown command opcode 0xFF at position 64");
    EXPECT_EQ(VgmError::bufferUnderflow(10, 4, 1).message(),
              "Buffer underflow at offset 10: needed 4 bytes, only 1 available");
    EXPECT_EQ(VgmError::invalidMagic("Vgm ", "RIFF", 0).message(),
              "Invalid magic bytes: expected 'Vgm ', found 'RIFF' at offset 0");
    EXPECT_EQ(VgmError::dataSizeExceedsLimit("command_count", 11, 10).message(),
              "Data size exceeds limit for command_count: 11 (limit: 10)");
    EXPECT_EQ(VgmError::inconsistentData("Extra header", "overlap").message(),
              "Data inconsistency in Extra header: overlap");
}

TEST(VgmErrorTest, SuggestedActions) {
    EXPECT_EQ(VgmError::fileNotFound("x").suggestedAction(), "Check file path and ensure file exists");
    EXPECT_EQ(VgmError::dataSizeExceedsLimit("x", 2, 1).suggestedAction(),
              "Use a more permissive parser configuration if the file is trusted");
    EXPECT_FALSE(VgmError::inconsistentData("x", "y").suggestedAction().empty());
}

TEST(VgmErrorTest, CategoryNames) {
    EXPECT_EQ(categoryName(ErrorCategory::IO), "I/O");
    EXPECT_EQ(categoryName(ErrorCategory::CommandParsing), "Command Parsing");
    EXPECT_EQ(categoryName(ErrorCategory::MemoryResource), "Memory/Resource");
}

}  // namespace vgmtool::vgm
