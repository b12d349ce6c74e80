#include "pattern.hpp"

#include "errors.hpp"

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/intf.hpp>

#include <array>
#include <span>
#include <string>
#include <system_error>
#include <thread>

namespace cryptowipe
{

using stdplus::fd::Fd;

void Pattern::writePattern(const uint64_t size, Fd& fd)
{
    uint64_t currentIndex = 0;
    std::array<std::byte, blockSize> randArr{};

    while (currentIndex < size)
    {
        // a new block of random data for every block written
        if (RAND_bytes(reinterpret_cast<unsigned char*>(randArr.data()),
                       blockSize) != 1)
        {
            lg2::error("Failed to draw random overwrite data",
                       "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.EraseFailure"));
            throw CryptoFailure("RAND_bytes");
        }
        // if we can write all 4k bytes do that, else write the remainder
        size_t writeSize =
            currentIndex + blockSize < size ? blockSize : size - currentIndex;
        size_t written = 0;
        size_t retry = 0;
        while (written < writeSize)
        {
            try
            {
                written +=
                    fd.write({randArr.data() + written, writeSize - written})
                        .size();
            }
            catch (const std::system_error& e)
            {
                OPENSSL_cleanse(randArr.data(), randArr.size());
                lg2::error("Random pattern unable to write to {DEV}: {ERROR}",
                           "DEV", devPath, "ERROR", e.what(),
                           "REDFISH_MESSAGE_ID",
                           std::string("CryptoWipe.1.0.EraseFailure"));
                throw IOError(devPath, e.what());
            }
            if (written > writeSize)
            {
                throw IOError(devPath, "wrote past the requested size");
            }
            retry++;
            if (retry > maxRetry)
            {
                lg2::error("Unable to do full write", "REDFISH_MESSAGE_ID",
                           std::string("CryptoWipe.1.0.EraseFailure"));
                throw IOError(devPath, "short write");
            }
            if (written < writeSize)
            {
                std::this_thread::sleep_for(delay);
            }
        }
        currentIndex = currentIndex + writeSize;
    }
    OPENSSL_cleanse(randArr.data(), randArr.size());
}

} // namespace cryptowipe
