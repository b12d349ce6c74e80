#include "cryptowipe_test.hpp"
#include "errors.hpp"
#include "pattern.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <stdplus/fd/create.hpp>
#include <stdplus/fd/gmock.hpp>
#include <stdplus/fd/managed.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

#include <gmock/gmock-matchers.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace cryptowipe_test
{

using cryptowipe::IOError;
using cryptowipe::Pattern;
using testing::_;
using testing::Return;

class PatternTest : public TempDirTest
{};

TEST_F(PatternTest, patternPass)
{
    std::string testFileName = (dir / "patternPass").string();
    uint64_t size = 4096;
    std::ofstream testFile;
    testFile.open(testFileName,
                  std::ios::out | std::ios::binary | std::ios::trunc);
    testFile.close();

    {
        stdplus::fd::Fd&& writeFd = stdplus::fd::open(
            testFileName, stdplus::fd::OpenAccess::WriteOnly);

        Pattern pass(testFileName);
        EXPECT_NO_THROW(pass.writePattern(size, writeFd));
    }

    std::vector<uint8_t> data = readAll(testFileName);
    ASSERT_EQ(data.size(), size);
    // 4096 random bytes are never all zero
    EXPECT_TRUE(std::any_of(data.begin(), data.end(),
                            [](uint8_t b) { return b != 0; }));
}

/* The correct number of bytes is written even if the size is not divisible
 * by the block size.
 */
TEST_F(PatternTest, patternNotDivisible)
{
    std::string testFileName = (dir / "notDivisible").string();
    uint64_t size = 4097;
    std::ofstream testFile;
    testFile.open(testFileName,
                  std::ios::out | std::ios::binary | std::ios::trunc);
    testFile.close();

    {
        stdplus::fd::Fd&& writeFd = stdplus::fd::open(
            testFileName, stdplus::fd::OpenAccess::WriteOnly);
        Pattern pass(testFileName);
        EXPECT_NO_THROW(pass.writePattern(size, writeFd));
    }
    EXPECT_EQ(std::filesystem::file_size(testFileName), size);
}

TEST_F(PatternTest, passesDiffer)
{
    std::string testFileName = (dir / "passesDiffer").string();
    uint64_t size = 4096;
    Pattern pass(testFileName);

    std::vector<std::vector<uint8_t>> rounds;
    for (int i = 0; i < 2; i++)
    {
        {
            stdplus::fd::Fd&& writeFd = stdplus::fd::open(
                testFileName,
                stdplus::fd::OpenFlags(stdplus::fd::OpenAccess::WriteOnly)
                    .set(stdplus::fd::OpenFlag::Create)
                    .set(stdplus::fd::OpenFlag::Trunc),
                0600);
            EXPECT_NO_THROW(pass.writePattern(size, writeFd));
        }
        rounds.push_back(readAll(testFileName));
    }
    EXPECT_NE(rounds[0], rounds[1]);
}

TEST_F(PatternTest, shortReadWritePass)
{
    std::string testFileName = "testfile_shortRead";

    uint64_t size = 4096;
    size_t shortSize = 128;
    Pattern pass(testFileName);
    auto shortData = std::vector<std::byte>(shortSize, std::byte{0});
    auto restOfData =
        std::vector<std::byte>(size - shortSize * 3, std::byte{0});
    stdplus::fd::FdMock mock;

    // test write pattern with short blocks
    EXPECT_CALL(mock, write(_))
        .WillOnce(Return(shortData))
        .WillOnce(Return(shortData))
        .WillOnce(Return(restOfData))
        .WillOnce(Return(shortData));

    EXPECT_NO_THROW(pass.writePattern(size, mock));
}

TEST_F(PatternTest, shortWriteFail)
{
    std::string testFileName = "testfile_shortWrite";

    uint64_t size = 4096;
    size_t shortSize = 128;
    Pattern tryPattern(testFileName);
    auto shortData = std::vector<std::byte>(shortSize, std::byte{0});
    auto restOfData =
        std::vector<std::byte>(size - shortSize * 3, std::byte{0});

    stdplus::fd::FdMock mock;

    EXPECT_CALL(mock, write(_))
        .WillOnce(Return(shortData))
        .WillOnce(Return(shortData))
        .WillOnce(Return(restOfData))
        .WillOnce(Return(restOfData)); // return too much data!

    EXPECT_THROW(tryPattern.writePattern(size, mock), IOError);
}

TEST_F(PatternTest, deviceStopsAccepting)
{
    Pattern tryPattern("testfile_deviceStops");
    stdplus::fd::FdMock mock;

    EXPECT_CALL(mock, write(_))
        .WillRepeatedly(Return(std::vector<std::byte>{}));
    EXPECT_THROW(tryPattern.writePattern(4096, mock), IOError);
}

} // namespace cryptowipe_test
