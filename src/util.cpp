#include "util.hpp"

#include "errors.hpp"

#include <linux/fs.h>
#include <openssl/rand.h>
#include <sys/stat.h>
#include <unistd.h>

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/create.hpp>
#include <stdplus/fd/managed.hpp>

#include <cerrno>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>

namespace cryptowipe
{
namespace util
{

using stdplus::fd::ManagedFd;
using stdplus::fd::OpenAccess;
using stdplus::fd::OpenFlag;
using stdplus::fd::OpenFlags;

namespace
{

constexpr size_t maxRetry = 32;
constexpr std::chrono::duration retryDelay = std::chrono::milliseconds(1);

std::filesystem::path tempSibling(const std::filesystem::path& target)
{
    std::string name = "." + target.filename().string() + ".tmp." +
                       toHex(randomBytes(8));
    return target.parent_path() / name;
}

/* Write data into a fresh temporary sibling of target and sync it. */
std::filesystem::path writeTemp(const std::filesystem::path& target,
                                std::span<const uint8_t> data, mode_t mode)
{
    std::filesystem::path temp = tempSibling(target);
    try
    {
        ManagedFd fd = stdplus::fd::open(temp.string(),
                                         OpenFlags(OpenAccess::WriteOnly)
                                             .set(OpenFlag::Create)
                                             .set(OpenFlag::Excl),
                                         mode);
        writeAll(fd, std::as_bytes(data), temp.string());
        syncFd(fd.get(), temp.string());
    }
    catch (const std::system_error& e)
    {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        throw IOError(temp.string(), e.what());
    }
    catch (const CryptoWipeError&)
    {
        std::error_code ec;
        std::filesystem::remove(temp, ec);
        throw;
    }
    return temp;
}

void syncParentDir(const std::filesystem::path& target)
{
    std::filesystem::path dir = target.parent_path();
    if (dir.empty())
    {
        dir = ".";
    }
    try
    {
        ManagedFd fd = stdplus::fd::open(
            dir.string(),
            OpenFlags(OpenAccess::ReadOnly).set(OpenFlag::Directory));
        if (::fsync(fd.get()) != 0)
        {
            lg2::warning("Failed to sync directory {DIR}", "DIR",
                         dir.string());
        }
    }
    catch (const std::system_error& e)
    {
        lg2::warning("Failed to open directory {DIR} for sync: {ERROR}",
                     "DIR", dir.string(), "ERROR", e.what());
    }
}

} // namespace

uint64_t findSizeOfBlockDevice(const std::string& devPath)
{
    ManagedFd fd;
    uint64_t bytes = 0;
    try
    {
        // open block dev
        fd = stdplus::fd::open(devPath, OpenAccess::ReadOnly);
        // get block size
        fd.ioctl(BLKGETSIZE64, &bytes);
    }
    catch (const std::system_error& e)
    {
        lg2::error("Unable to size block device {DEV}: {ERROR}", "DEV",
                   devPath, "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.DeviceSizeFailure"));
        throw IOError(devPath, e.what());
    }
    return bytes;
}

bool isBlockDevice(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_block_file(path, ec);
}

std::vector<uint8_t> randomBytes(size_t count)
{
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1)
    {
        lg2::error("Failed to draw random bytes", "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.RandomFailure"));
        throw CryptoFailure("RAND_bytes");
    }
    return out;
}

std::string toHex(std::span<const uint8_t> data)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data)
    {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

std::string utcTimestamp(const char* format)
{
    std::time_t now =
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, format);
    return out.str();
}

std::vector<uint8_t> readFile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        throw NotFound(path.string());
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
    {
        throw IOError(path.string(), "unable to open for reading");
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad())
    {
        throw IOError(path.string(), "read failed");
    }
    return data;
}

void writeAll(stdplus::fd::Fd& fd, std::span<const std::byte> data,
              const std::string& name)
{
    size_t written = 0;
    size_t retry = 0;
    while (written < data.size())
    {
        size_t n = 0;
        try
        {
            n = fd.write(data.subspan(written)).size();
        }
        catch (const std::system_error& e)
        {
            throw IOError(name, e.what());
        }
        written += n;
        if (n == 0)
        {
            retry++;
            if (retry > maxRetry)
            {
                lg2::error("Unable to make full write to {FILE}", "FILE",
                           name, "REDFISH_MESSAGE_ID",
                           std::string("CryptoWipe.1.0.WriteFailure"));
                throw IOError(name, "short write");
            }
            std::this_thread::sleep_for(retryDelay);
        }
    }
}

void syncFd(int fd, const std::string& name)
{
    if (::fsync(fd) != 0)
    {
        int err = errno;
        throw IOError(name, std::system_category().message(err));
    }
}

void atomicReplace(const std::filesystem::path& target,
                   std::span<const uint8_t> data, mode_t mode)
{
    std::filesystem::path temp = writeTemp(target, data, mode);
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec)
    {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        lg2::error("Failed to rename {TEMP} over {FILE}: {ERROR}", "TEMP",
                   temp.string(), "FILE", target.string(), "ERROR",
                   ec.message(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.WriteFailure"));
        throw IOError(target.string(), ec.message());
    }
    syncParentDir(target);
}

void publishExclusive(const std::filesystem::path& target,
                      std::span<const uint8_t> data, mode_t mode)
{
    std::filesystem::path temp = writeTemp(target, data, mode);
    std::error_code ec;
    std::filesystem::create_hard_link(temp, target, ec);
    std::error_code ignored;
    std::filesystem::remove(temp, ignored);
    if (ec == std::errc::file_exists)
    {
        throw AlreadyExists(target.string());
    }
    if (ec)
    {
        throw IOError(target.string(), ec.message());
    }
    syncParentDir(target);
}

void appendLine(const std::filesystem::path& path, std::string_view line)
{
    try
    {
        ManagedFd fd = stdplus::fd::open(path.string(),
                                         OpenFlags(OpenAccess::WriteOnly)
                                             .set(OpenFlag::Create)
                                             .set(OpenFlag::Append),
                                         0600);
        std::string buf(line);
        buf.push_back('\n');
        writeAll(fd, std::as_bytes(std::span(buf.data(), buf.size())),
                 path.string());
        syncFd(fd.get(), path.string());
    }
    catch (const std::system_error& e)
    {
        throw IOError(path.string(), e.what());
    }
}

} // namespace util

} // namespace cryptowipe
