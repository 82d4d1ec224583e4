#include "textnorm/core/file_processor.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace textnorm {

class MockFileSystem : public IFileSystem {
public:
    MOCK_METHOD(std::optional<std::string>, read_bytes, (const std::filesystem::path& path),
                (override));
    MOCK_METHOD(std::error_code, write_bytes_atomic,
                (const std::filesystem::path& path, std::string_view bytes), (override));
};

using ::testing::_;
using ::testing::Return;

class FileProcessorTest : public ::testing::Test {
protected:
    testing::StrictMock<MockFileSystem> filesystem_;

    auto make_processor(ProcessMode mode, std::optional<std::string> legacy = std::nullopt,
                        TabMode tab_mode = TabMode::LEADING) -> FileProcessor {
        ProcessorOptions options;
        options.normalization.tab_mode = tab_mode;
        options.legacy_encoding = std::move(legacy);
        options.mode = mode;
        return FileProcessor(filesystem_, options);
    }
};

TEST_F(FileProcessorTest, UnreadableFileIsSkipped)
{
    EXPECT_CALL(filesystem_, read_bytes(std::filesystem::path("gone.txt")))
        .WillOnce(Return(std::nullopt));

    auto outcome = make_processor(ProcessMode::WRITE).process("gone.txt");

    ASSERT_TRUE(std::holds_alternative<Skipped>(outcome));
    EXPECT_EQ(std::get<Skipped>(outcome).reason, SkipReason::UNREADABLE);
}

TEST_F(FileProcessorTest, BinaryExtensionIsSkippedWithoutWriting)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("text \r\n")));

    auto outcome = make_processor(ProcessMode::WRITE).process("image.PNG");

    ASSERT_TRUE(std::holds_alternative<Skipped>(outcome));
    EXPECT_EQ(std::get<Skipped>(outcome).reason, SkipReason::BINARY_EXTENSION);
}

TEST_F(FileProcessorTest, NulByteIsSkippedAsBinaryContent)
{
    EXPECT_CALL(filesystem_, read_bytes(_))
        .WillOnce(Return(std::string("abc\0def\r\n", 9)));

    auto outcome = make_processor(ProcessMode::WRITE).process("data.txt");

    ASSERT_TRUE(std::holds_alternative<Skipped>(outcome));
    EXPECT_EQ(std::get<Skipped>(outcome).reason, SkipReason::BINARY_CONTENT);
}

TEST_F(FileProcessorTest, UndecodableWithoutFallbackIsSkipped)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("caf\xE9\r\n")));

    auto outcome = make_processor(ProcessMode::WRITE).process("legacy.txt");

    ASSERT_TRUE(std::holds_alternative<Skipped>(outcome));
    EXPECT_EQ(std::get<Skipped>(outcome).reason, SkipReason::UNDECODABLE);
}

TEST_F(FileProcessorTest, AlreadyNormalizedFileIsUnchanged)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("clean\n    indented\n")));

    auto outcome = make_processor(ProcessMode::WRITE).process("clean.txt");

    EXPECT_TRUE(std::holds_alternative<Unchanged>(outcome));
}

TEST_F(FileProcessorTest, WriteModeRewritesWithNormalizedBytes)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("a\r\nb\t\nc  \n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(std::filesystem::path("file.txt"),
                                                std::string_view("a\nb\nc\n")))
        .WillOnce(Return(std::error_code{}));

    auto outcome = make_processor(ProcessMode::WRITE).process("file.txt");

    ASSERT_TRUE(std::holds_alternative<Changed>(outcome));
    EXPECT_TRUE(std::get<Changed>(outcome).written);
    EXPECT_FALSE(std::get<Changed>(outcome).recoded);
}

TEST_F(FileProcessorTest, CheckModeNeverWrites)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("dirty  \n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(_, _)).Times(0);

    auto outcome = make_processor(ProcessMode::CHECK).process("dirty.txt");

    ASSERT_TRUE(std::holds_alternative<Changed>(outcome));
    EXPECT_FALSE(std::get<Changed>(outcome).written);
}

TEST_F(FileProcessorTest, BomOnlyDifferenceCountsAsChange)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("\xEF\xBB\xBFok\n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(_, std::string_view("ok\n")))
        .WillOnce(Return(std::error_code{}));

    auto outcome = make_processor(ProcessMode::WRITE).process("bom.txt");

    EXPECT_TRUE(std::holds_alternative<Changed>(outcome));
}

TEST_F(FileProcessorTest, RecodesFromLegacyEncoding)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("caf\xE9\r\n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(_, std::string_view("caf\xC3\xA9\n")))
        .WillOnce(Return(std::error_code{}));

    auto outcome = make_processor(ProcessMode::WRITE, "latin1").process("legacy.txt");

    ASSERT_TRUE(std::holds_alternative<Changed>(outcome));
    EXPECT_TRUE(std::get<Changed>(outcome).recoded);
}

TEST_F(FileProcessorTest, WriteFailureIsReportedNotSkipped)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("x \n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(_, _))
        .WillOnce(Return(std::make_error_code(std::errc::read_only_file_system)));

    auto outcome = make_processor(ProcessMode::WRITE).process("ro.txt");

    ASSERT_TRUE(std::holds_alternative<WriteFailed>(outcome));
    EXPECT_FALSE(std::get<WriteFailed>(outcome).message.empty());
}

TEST_F(FileProcessorTest, MakefileKeepsTabsEvenInAggressiveMode)
{
    EXPECT_CALL(filesystem_, read_bytes(_))
        .WillOnce(Return(std::string("all:\r\n\tgcc -o\tapp main.c  \r\n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(_, std::string_view("all:\n\tgcc -o\tapp main.c\n")))
        .WillOnce(Return(std::error_code{}));

    auto outcome =
        make_processor(ProcessMode::WRITE, std::nullopt, TabMode::AGGRESSIVE).process("src/Makefile");

    EXPECT_TRUE(std::holds_alternative<Changed>(outcome));
}

TEST_F(FileProcessorTest, AggressiveModeAppliesToOrdinaryFiles)
{
    EXPECT_CALL(filesystem_, read_bytes(_)).WillOnce(Return(std::string("\tfoo\tbar\n")));
    EXPECT_CALL(filesystem_, write_bytes_atomic(_, std::string_view("    foo    bar\n")))
        .WillOnce(Return(std::error_code{}));

    auto outcome =
        make_processor(ProcessMode::WRITE, std::nullopt, TabMode::AGGRESSIVE).process("a.c");

    EXPECT_TRUE(std::holds_alternative<Changed>(outcome));
}

TEST_F(FileProcessorTest, NormalizedBytesIsPure)
{
    auto processor = make_processor(ProcessMode::WRITE);

    auto result = processor.normalized_bytes("x.txt", "\tx\r\n");

    ASSERT_TRUE(std::holds_alternative<DecodedText>(result));
    EXPECT_EQ(std::get<DecodedText>(result).utf8, "    x\n");
}

} // namespace textnorm
