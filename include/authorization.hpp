#pragma once

#include <functional>
#include <string_view>

namespace cryptowipe
{

class Authorizer;

/** @class KeyWipeAuthorization
 *  @brief Proof that the caller confirmed destruction of a key.
 *  @details Only an Authorizer can produce one.
 */
class KeyWipeAuthorization
{
  private:
    KeyWipeAuthorization() = default;
    friend class Authorizer;
};

/** @class DeviceWipeAuthorization
 *  @brief Proof that the caller attested ownership of the device and holds
 *  the privileges a device wipe needs.
 *  @details Only an Authorizer can produce one.
 */
class DeviceWipeAuthorization
{
  private:
    DeviceWipeAuthorization() = default;
    friend class Authorizer;
};

/** @class Authorizer
 *  @brief Admission checks performed at the service boundary.
 */
class Authorizer
{
  public:
    static constexpr std::string_view keyWipeToken = "CONFIRM_DESTROY";
    static constexpr std::string_view ownerConfirmation = "I-OWN-THIS-DEVICE";

    /** @brief Effective uid is root. */
    static bool isPrivileged();

    explicit Authorizer(std::function<bool()> privilegeCheck = isPrivileged) :
        privilegeCheck(std::move(privilegeCheck))
    {}

    /** @brief Require the key destruction confirmation.
     *  @throws NotAuthorized on any other token.
     */
    KeyWipeAuthorization authorizeKeyWipe(std::string_view token) const;

    /** @brief Require the ownership attestation and privileges.
     *  @throws NotAuthorized if either is missing.
     */
    DeviceWipeAuthorization
        authorizeDeviceWipe(std::string_view ownerConfirm) const;

  private:
    std::function<bool()> privilegeCheck;
};

} // namespace cryptowipe
