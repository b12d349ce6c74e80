#include "zero.hpp"

#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/intf.hpp>

#include <array>
#include <chrono>
#include <cstring>
#include <span>
#include <string>
#include <system_error>
#include <thread>

namespace cryptowipe
{

using stdplus::fd::Fd;

void Zero::writeZero(const uint64_t size, Fd& fd)
{
    uint64_t currentIndex = 0;
    const std::array<const std::byte, blockSize> blockOfZeros{};

    while (currentIndex < size)
    {
        uint32_t writeSize =
            currentIndex + blockSize < size ? blockSize : size - currentIndex;
        try
        {
            size_t written = 0;
            size_t retry = 0;
            while (written < writeSize)
            {
                written += fd.write({blockOfZeros.data() + written,
                                     writeSize - written})
                               .size();
                if (written > writeSize)
                {
                    throw IOError(devPath, "wrote past the requested size");
                }
                if (retry > 0)
                {
                    std::this_thread::sleep_for(delay);
                }
                retry++;
                if (retry > maxRetry)
                {
                    lg2::error("Unable to make full write",
                               "REDFISH_MESSAGE_ID",
                               std::string("CryptoWipe.1.0.EraseFailure"));
                    throw IOError(devPath, "short write");
                }
            }
        }
        catch (const IOError&)
        {
            throw;
        }
        catch (const std::system_error& e)
        {
            lg2::error("Erase zeros unable to write to {DEV}: {ERROR}", "DEV",
                       devPath, "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.EraseFailure"));
            throw IOError(devPath, e.what());
        }
        currentIndex += writeSize;
    }
}

void Zero::verifyZero(uint64_t size, Fd& fd)
{
    uint64_t currentIndex = 0;
    std::array<std::byte, blockSize> readArr{};
    const std::array<const std::byte, blockSize> blockOfZeros{};

    while (currentIndex < size)
    {
        uint32_t readSize =
            currentIndex + blockSize < size ? blockSize : size - currentIndex;
        try
        {
            size_t read = 0;
            size_t retry = 0;
            while (read < readSize)
            {
                read +=
                    fd.read({readArr.data() + read, readSize - read}).size();
                if (read > readSize)
                {
                    throw IOError(devPath, "read past the requested size");
                }
                if (retry > 0)
                {
                    std::this_thread::sleep_for(delay);
                }
                retry++;
                if (retry > maxRetry)
                {
                    lg2::error("Unable to make full read", "REDFISH_MESSAGE_ID",
                               std::string("CryptoWipe.1.0.EraseFailure"));
                    throw IOError(devPath, "short read");
                }
            }
        }
        catch (const IOError&)
        {
            throw;
        }
        catch (const std::system_error& e)
        {
            lg2::error("Erase zeros unable to read {DEV}: {ERROR}", "DEV",
                       devPath, "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.EraseFailure"));
            throw IOError(devPath, e.what());
        }
        if (memcmp(readArr.data(), blockOfZeros.data(), readSize) != 0)
        {
            lg2::error("Erase zeros block at {OFFSET} of {DEV} is not zero",
                       "OFFSET", currentIndex, "DEV", devPath,
                       "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.EraseFailure"));
            throw IOError(devPath, "zero pass did not stick");
        }
        currentIndex += readSize;
    }
}

} // namespace cryptowipe
