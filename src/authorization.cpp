#include "authorization.hpp"

#include "errors.hpp"

#include <unistd.h>

#include <phosphor-logging/lg2.hpp>

#include <string>

namespace cryptowipe
{

bool Authorizer::isPrivileged()
{
    return ::geteuid() == 0;
}

KeyWipeAuthorization Authorizer::authorizeKeyWipe(std::string_view token) const
{
    if (token != keyWipeToken)
    {
        lg2::warning("Key wipe rejected: missing confirmation",
                     "REDFISH_MESSAGE_ID",
                     std::string("CryptoWipe.1.0.NotAuthorized"));
        throw NotAuthorized("key wipe requires confirmation token " +
                            std::string(keyWipeToken));
    }
    return KeyWipeAuthorization();
}

DeviceWipeAuthorization
    Authorizer::authorizeDeviceWipe(std::string_view ownerConfirm) const
{
    if (ownerConfirm != ownerConfirmation)
    {
        lg2::warning("Device wipe rejected: missing ownership attestation",
                     "REDFISH_MESSAGE_ID",
                     std::string("CryptoWipe.1.0.NotAuthorized"));
        throw NotAuthorized("device wipe requires ownership confirmation " +
                            std::string(ownerConfirmation));
    }
    if (!privilegeCheck())
    {
        lg2::warning("Device wipe rejected: caller is not privileged",
                     "REDFISH_MESSAGE_ID",
                     std::string("CryptoWipe.1.0.NotAuthorized"));
        throw NotAuthorized("device wipe requires root privileges");
    }
    return DeviceWipeAuthorization();
}

} // namespace cryptowipe
