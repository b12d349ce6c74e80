#include "secureErase.hpp"

#include "errors.hpp"
#include "pattern.hpp"
#include "util.hpp"
#include "zero.hpp"

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/create.hpp>
#include <stdplus/fd/managed.hpp>

#include <filesystem>
#include <string>
#include <system_error>

namespace cryptowipe
{

using stdplus::fd::ManagedFd;

namespace
{

void rewind(stdplus::fd::Fd& fd, const std::string& name)
{
    try
    {
        fd.lseek(0, stdplus::fd::Whence::Set);
    }
    catch (const std::system_error& e)
    {
        throw IOError(name, e.what());
    }
}

} // namespace

void SecureErase::wipeKey(unsigned passes)
{
    std::error_code ec;
    if (!std::filesystem::exists(devPath, ec))
    {
        throw NotFound(devPath);
    }
    uint64_t size = std::filesystem::file_size(devPath, ec);
    if (ec)
    {
        throw IOError(devPath, ec.message());
    }

    lg2::info("Starting secure erase of {FILE} with {PASSES} passes", "FILE",
              devPath, "PASSES", passes, "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.KeyWipe"));

    {
        ManagedFd fd;
        try
        {
            fd = stdplus::fd::open(devPath,
                                   stdplus::fd::OpenAccess::ReadWrite);
        }
        catch (const std::system_error& e)
        {
            throw IOError(devPath, e.what());
        }

        Pattern random(devPath);
        for (unsigned pass = 0; pass < passes; pass++)
        {
            rewind(fd, devPath);
            random.writePattern(size, fd);
            util::syncFd(fd.get(), devPath);
        }

        Zero zero(devPath);
        rewind(fd, devPath);
        zero.writeZero(size, fd);
        util::syncFd(fd.get(), devPath);

        rewind(fd, devPath);
        zero.verifyZero(size, fd);
    }

    if (!std::filesystem::remove(devPath, ec) || ec)
    {
        lg2::error("Failed to remove {FILE} after overwrite", "FILE", devPath,
                   "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeyWipeFailure"));
        throw IOError(devPath, ec ? ec.message() : "file vanished");
    }

    lg2::info("Securely erased {FILE}", "FILE", devPath, "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.KeyWipeSuccess"));
}

} // namespace cryptowipe
