#include "cryptsetupInterface.hpp"

#include "errors.hpp"

#include <libcryptsetup.h>

#include <phosphor-logging/lg2.hpp>
#include <stdplus/handle/managed.hpp>

#include <string>

namespace cryptowipe
{

int Cryptsetup::cryptLoad(struct crypt_device* cd, const char* requestedType,
                          void* params)
{
    return crypt_load(cd, requestedType, params);
}

const char* Cryptsetup::cryptGetType(struct crypt_device* cd)
{
    return crypt_get_type(cd);
}

int Cryptsetup::cryptKeyslotDestroy(struct crypt_device* cd, const int keyslot)
{
    return crypt_keyslot_destroy(cd, keyslot);
}

int Cryptsetup::cryptKeySlotMax(const char* type)
{
    return crypt_keyslot_max(type);
}

crypt_keyslot_info Cryptsetup::cryptKeySlotStatus(struct crypt_device* cd,
                                                  int keyslot)
{
    return crypt_keyslot_status(cd, keyslot);
}

struct crypt_device* CryptHandle::get()
{
    if (*handle == nullptr)
    {
        lg2::error("Failed to get crypt device handle", "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.HandleGetFail"));
        throw NotFound("crypt device handle");
    }

    return *handle;
}

struct crypt_device* CryptHandle::init(const std::string& device)
{
    struct crypt_device* cryptDev = nullptr;
    int retval = crypt_init(&cryptDev, device.c_str());
    if (retval < 0)
    {
        lg2::error("Failed to crypt_init {DEV}: {RETVAL}", "DEV", device,
                   "RETVAL", retval, "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.InitFail"));
        throw NotFound(device);
    }

    return cryptDev;
}

void CryptHandle::cryptFree(struct crypt_device*&& cd)
{
    crypt_free(cd);
}

} // namespace cryptowipe
