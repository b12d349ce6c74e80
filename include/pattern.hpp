#pragma once

#include "erase.hpp"

#include <stdplus/fd/intf.hpp>

#include <chrono>
#include <cstdint>

namespace cryptowipe
{
using stdplus::fd::Fd;

class Pattern : public Erase
{
  public:
    /** @brief Creates a random pattern erase object.
     *
     *  @param[in] inDevPath - the path of the key file or block device.
     */
    explicit Pattern(std::string_view inDevPath) : Erase(inDevPath)
    {}

    /** @brief writes size bytes of fresh cryptographically random data
     * from the current offset of fd and throws errors accordingly.
     *
     *  @param[in] size - number of bytes to overwrite
     *  @param[in] fd - the stdplus file descriptor
     */
    void writePattern(uint64_t size, Fd& fd);

  private:
    static constexpr size_t blockSize = 4096;
    static constexpr uint16_t maxRetry = 32;
    static constexpr std::chrono::duration delay = std::chrono::milliseconds(1);
};

} // namespace cryptowipe
