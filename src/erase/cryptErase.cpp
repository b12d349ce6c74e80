#include "cryptErase.hpp"

#include "cryptsetupInterface.hpp"
#include "errors.hpp"

#include <libcryptsetup.h>

#include <phosphor-logging/lg2.hpp>

#include <cerrno>
#include <memory>
#include <string>
#include <string_view>

namespace cryptowipe
{

CryptErase::CryptErase(std::string_view devPathIn,
                       std::unique_ptr<CryptsetupInterface> inCryptIface) :
    Erase(devPathIn), cryptIface(std::move(inCryptIface))
{}

void CryptErase::killKeySlot(int keyslot)
{
    /* get cryptHandle */
    CryptHandle cryptHandle{devPath};
    /* cryptLoad, either LUKS version */
    if (cryptIface->cryptLoad(cryptHandle.get(), CRYPT_LUKS, nullptr) != 0)
    {
        lg2::error("Failed to load the LUKS header of {DEV}", "DEV", devPath,
                   "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeySlotKillFailure"));
        throw NotFound("LUKS header on " + devPath);
    }

    const char* type = cryptIface->cryptGetType(cryptHandle.get());
    if (type == nullptr)
    {
        lg2::error("No LUKS type reported for {DEV}", "DEV", devPath,
                   "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeySlotKillFailure"));
        throw NotFound("LUKS header on " + devPath);
    }

    int nKeySlots = cryptIface->cryptKeySlotMax(type);
    if (nKeySlots <= 0 || keyslot < 0 || keyslot >= nKeySlots)
    {
        lg2::error("Key slot {SLOT} out of range for {DEV}", "SLOT", keyslot,
                   "DEV", devPath, "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeySlotKillFailure"));
        throw ExternalActionFailed("luks_killslot", -EINVAL);
    }

    crypt_keyslot_info ki =
        cryptIface->cryptKeySlotStatus(cryptHandle.get(), keyslot);
    if (ki != CRYPT_SLOT_ACTIVE && ki != CRYPT_SLOT_ACTIVE_LAST)
    {
        lg2::error("Key slot {SLOT} of {DEV} is not active", "SLOT", keyslot,
                   "DEV", devPath, "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeySlotKillFailure"));
        throw ExternalActionFailed("luks_killslot", -ENOENT);
    }

    int retval = cryptIface->cryptKeyslotDestroy(cryptHandle.get(), keyslot);
    if (retval != 0)
    {
        lg2::error("Failed to destroy key slot {SLOT} of {DEV}: {RETVAL}",
                   "SLOT", keyslot, "DEV", devPath, "RETVAL", retval,
                   "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeySlotKillFailure"));
        throw ExternalActionFailed("luks_killslot", retval);
    }

    if (ki == CRYPT_SLOT_ACTIVE_LAST)
    {
        lg2::info("Destroyed the last active key slot of {DEV}", "DEV",
                  devPath);
    }
    lg2::info("Destroyed key slot {SLOT} of {DEV}", "SLOT", keyslot, "DEV",
              devPath, "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.KeySlotKillSuccess"));
}

} // namespace cryptowipe
