#include "wipeToolsInterface.hpp"

#include "cryptErase.hpp"
#include "errors.hpp"
#include "util.hpp"
#include "zero.hpp"

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/create.hpp>
#include <stdplus/fd/managed.hpp>

#include <cerrno>
#include <filesystem>
#include <string>
#include <system_error>

namespace cryptowipe
{

using stdplus::fd::ManagedFd;

int WipeTools::runKillSlot(const std::string& device, int keyslot)
{
    try
    {
        CryptErase cryptErase(device, cryptsetupFactory());
        cryptErase.killKeySlot(keyslot);
    }
    catch (const ExternalActionFailed& e)
    {
        lg2::error("Key slot kill on {DEV} failed: {ERROR}", "DEV", device,
                   "ERROR", e.what());
        return -EIO;
    }
    catch (const CryptoWipeError& e)
    {
        lg2::error("Key slot kill on {DEV} failed: {ERROR}", "DEV", device,
                   "ERROR", e.what());
        return -ENODEV;
    }
    return 0;
}

int WipeTools::runZeroHeader(const std::string& device, uint64_t bytes)
{
    std::error_code ec;
    if (!std::filesystem::exists(device, ec))
    {
        lg2::error("Header zero target {DEV} does not exist", "DEV", device,
                   "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.HeaderZeroFailure"));
        return -ENOENT;
    }

    try
    {
        if (util::isBlockDevice(device))
        {
            uint64_t size = util::findSizeOfBlockDevice(device);
            if (size < bytes)
            {
                lg2::error("{DEV} holds {SIZE} bytes, less than the {REGION} "
                           "byte header region",
                           "DEV", device, "SIZE", size, "REGION", bytes,
                           "REDFISH_MESSAGE_ID",
                           std::string("CryptoWipe.1.0.HeaderZeroFailure"));
                return -ENOSPC;
            }
        }

        ManagedFd fd =
            stdplus::fd::open(device, stdplus::fd::OpenAccess::WriteOnly);
        Zero zero(device);
        zero.writeZero(bytes, fd);
        util::syncFd(fd.get(), device);
    }
    catch (const std::system_error& e)
    {
        lg2::error("Unable to open {DEV} for header zero: {ERROR}", "DEV",
                   device, "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.HeaderZeroFailure"));
        return -EIO;
    }
    catch (const CryptoWipeError& e)
    {
        lg2::error("Header zero on {DEV} failed: {ERROR}", "DEV", device,
                   "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.HeaderZeroFailure"));
        return -EIO;
    }

    lg2::info("Zeroed the first {REGION} bytes of {DEV}", "REGION", bytes,
              "DEV", device, "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.HeaderZeroSuccess"));
    return 0;
}

} // namespace cryptowipe
