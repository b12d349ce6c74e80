#pragma once

#include "erase.hpp"

#include <stdplus/fd/intf.hpp>

#include <chrono>
#include <cstdint>

namespace cryptowipe
{

using stdplus::fd::Fd;

class Zero : public Erase
{
  public:
    /** @brief Creates a zero erase object.
     *
     *  @param[in] inDevPath - the path of the key file or block device.
     */
    explicit Zero(std::string_view inDevPath) : Erase(inDevPath)
    {}

    /** @brief writes size bytes of zero from the current offset of fd
     * and throws errors accordingly.
     *  @param[in] size - number of bytes to overwrite
     *  @param[in] fd - the stdplus file descriptor
     */
    void writeZero(uint64_t size, Fd& fd);

    /** @brief verifies the next size bytes of fd are only zeros,
     * and throws errors accordingly.
     *  @param[in] size - number of bytes to check
     *  @param[in] fd - the stdplus file descriptor
     */
    void verifyZero(uint64_t size, Fd& fd);

  private:
    /* @brief the size of the blocks in bytes used for write and verify. */
    static constexpr size_t blockSize = 4096;
    static constexpr size_t maxRetry = 32;
    static constexpr std::chrono::duration delay = std::chrono::milliseconds(1);
};

} // namespace cryptowipe
