#pragma once

#include "cryptsetupInterface.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace cryptowipe
{

/** @class WipeToolsInterface
 *  @brief Interface to the destructive device actions run by wipe jobs.
 *  @details This class is used to mock out the destructive actions, so the
 *    job engine can be exercised without a LUKS device.
 */
class WipeToolsInterface
{
  public:
    virtual ~WipeToolsInterface() = default;

    WipeToolsInterface() = default;
    WipeToolsInterface(const WipeToolsInterface&) = delete;
    WipeToolsInterface& operator=(const WipeToolsInterface&) = delete;

    WipeToolsInterface(WipeToolsInterface&&) = delete;
    WipeToolsInterface& operator=(WipeToolsInterface&&) = delete;

    /** @brief Destroy one key slot of a LUKS2 device.
     *  @details Used for mocking purposes.
     *
     *  @param[in] device - path to the LUKS device.
     *  @param[in] keyslot - the key slot to destroy.
     *
     *  @returns 0 on success, nonzero on failure.
     */
    virtual int runKillSlot(const std::string& device, int keyslot) = 0;

    /** @brief Overwrite the leading bytes of a device with zeros.
     *  @details Used for mocking purposes.
     *
     *  @param[in] device - path to the device or image file.
     *  @param[in] bytes - size of the leading region.
     *
     *  @returns 0 on success, nonzero on failure.
     */
    virtual int runZeroHeader(const std::string& device, uint64_t bytes) = 0;
};

/** @class WipeTools
 *  @brief Implements WipeToolsInterface with libcryptsetup and the zero
 *  overwrite primitive.
 */
class WipeTools : public WipeToolsInterface
{
  public:
    using CryptsetupFactory =
        std::function<std::unique_ptr<CryptsetupInterface>()>;

    explicit WipeTools(CryptsetupFactory factory = [] {
        return std::make_unique<Cryptsetup>();
    }) : cryptsetupFactory(std::move(factory))
    {}

    ~WipeTools() override = default;
    WipeTools(const WipeTools&) = delete;
    WipeTools& operator=(const WipeTools&) = delete;

    WipeTools(WipeTools&&) = delete;
    WipeTools& operator=(WipeTools&&) = delete;

    int runKillSlot(const std::string& device, int keyslot) override;

    /** @details Regular files are accepted, so disk images can be wiped.
     *    A block device smaller than the region is rejected before
     *    anything is written.
     */
    int runZeroHeader(const std::string& device, uint64_t bytes) override;

  private:
    CryptsetupFactory cryptsetupFactory;
};

} // namespace cryptowipe
