#pragma once

#include "cryptsetupInterface.hpp"
#include "erase.hpp"

#include <memory>
#include <string_view>

namespace cryptowipe
{

class CryptErase : public Erase
{
  public:
    /** @brief Creates a CryptErase erase object.
     *
     *  @param[in] inDevPath - the linux device path for the LUKS device.
     *  @param[in](optional) cryptIface - a unique pointer to an cryptsetup
     *  Interface object.
     */
    explicit CryptErase(std::string_view devPath,
                        std::unique_ptr<CryptsetupInterface> inCryptIface =
                            std::make_unique<Cryptsetup>());

    /** @brief destroys one LUKS1 or LUKS2 key slot and throws errors accordingly.
     *  @details Once every slot holding the volume key is gone, the data on
     *    the device can no longer be decrypted.
     *
     *  @param[in] keyslot - the key slot to destroy.
     *
     *  @throws NotFound if the LUKS header cannot be loaded,
     *    ExternalActionFailed if the slot is out of range, not in use, or
     *    libcryptsetup fails to destroy it.
     */
    void killKeySlot(int keyslot);

  private:
    std::unique_ptr<CryptsetupInterface> cryptIface;
};

} // namespace cryptowipe
