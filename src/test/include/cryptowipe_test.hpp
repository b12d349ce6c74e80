#pragma once

#include "certificateSigner.hpp"
#include "cryptsetupInterface.hpp"
#include "wipeToolsInterface.hpp"

#include <unistd.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace cryptowipe_test
{

class MockCryptsetupInterface : public cryptowipe::CryptsetupInterface
{
  public:
    MOCK_METHOD(int, cryptLoad,
                (struct crypt_device * cd, const char* requestedType,
                 void* params),
                (override));

    MOCK_METHOD(const char*, cryptGetType, (struct crypt_device * cd),
                (override));

    MOCK_METHOD(int, cryptKeyslotDestroy,
                (struct crypt_device * cd, const int slot), (override));

    MOCK_METHOD(int, cryptKeySlotMax, (const char* type), (override));

    MOCK_METHOD(crypt_keyslot_info, cryptKeySlotStatus,
                (struct crypt_device * cd, int keyslot), (override));
};

class MockWipeToolsInterface : public cryptowipe::WipeToolsInterface
{
  public:
    MOCK_METHOD(int, runKillSlot, (const std::string& device, int keyslot),
                (override));

    MOCK_METHOD(int, runZeroHeader,
                (const std::string& device, uint64_t bytes), (override));
};

class MockCertificateSignerInterface :
    public cryptowipe::CertificateSignerInterface
{
  public:
    MOCK_METHOD(void, ensureSigningKey, (), (override));

    MOCK_METHOD(cryptowipe::SignedPayload, sign,
                (const cryptowipe::CertificateRecord& record), (override));

    MOCK_METHOD(bool, verifyPayload,
                (std::string_view payload, std::span<const uint8_t> signature),
                (override));

    MOCK_METHOD(std::string, publicKeyPem, (), (override));
};

/** @brief Gives every test its own scratch directory. */
class TempDirTest : public testing::Test
{
  public:
    std::filesystem::path dir;

    void SetUp() override
    {
        const testing::TestInfo* info =
            testing::UnitTest::GetInstance()->current_test_info();
        dir = std::filesystem::temp_directory_path() /
              ("cryptowipe_" + std::string(info->test_suite_name()) + "_" +
               info->name() + "_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

inline std::vector<uint8_t> bytesOf(std::string_view s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

inline std::vector<uint8_t> readAll(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

inline void writeAll(const std::filesystem::path& path,
                     std::span<const uint8_t> data)
{
    std::ofstream out(path,
                      std::ios::out | std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

} // namespace cryptowipe_test
