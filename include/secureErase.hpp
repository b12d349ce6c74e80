#pragma once

#include "erase.hpp"

#include <string_view>

namespace cryptowipe
{

/** @class SecureErase
 *  @brief Overwrites and unlinks a key file.
 *  @details The file is overwritten with `passes` rounds of fresh random
 *    data, each flushed to stable storage before the next starts, then with
 *    one round of zeros which is flushed and read back, and finally
 *    removed.
 *
 *    This defends against straightforward forensic recovery only. On flash
 *    media with wear leveling, on copy-on-write or journaling-data
 *    filesystems, and on anything snapshotted, the overwrites may land on
 *    different physical blocks than the original key bytes, which then
 *    survive. Keep key files on a filesystem that overwrites in place.
 */
class SecureErase : public Erase
{
  public:
    /** @brief Creates a secure erase object.
     *
     *  @param[in] inDevPath - path of the key file to destroy.
     */
    explicit SecureErase(std::string_view inDevPath) : Erase(inDevPath)
    {}

    /** @brief Overwrite and remove the file.
     *
     *  @param[in] passes - number of random overwrite rounds.
     *
     *  @throws NotFound if the file does not exist, IOError if any pass or
     *    the removal fails.
     */
    void wipeKey(unsigned passes);
};

} // namespace cryptowipe
