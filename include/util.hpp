#pragma once

#include <sys/types.h>

#include <stdplus/fd/intf.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cryptowipe
{
namespace util
{

/** @brief finds the size of the linux block device in bytes
 *  @param[in] devpath - the name of the linux block device
 *  @return size of a block device using the devPath
 */
uint64_t findSizeOfBlockDevice(const std::string& devPath);

/** @brief Check whether a path names a block device. */
bool isBlockDevice(const std::filesystem::path& path);

/** @brief Draw cryptographically random bytes from the OpenSSL DRBG.
 *  @throws CryptoFailure if the generator is not seeded.
 */
std::vector<uint8_t> randomBytes(size_t count);

/** @brief Lower-case hex encoding. */
std::string toHex(std::span<const uint8_t> data);

/** @brief Format the current UTC time with a strftime pattern. */
std::string utcTimestamp(const char* format);

/** @brief Read a whole file into memory.
 *  @throws NotFound if the path does not exist, IOError otherwise.
 */
std::vector<uint8_t> readFile(const std::filesystem::path& path);

/** @brief Write all of data to fd, tolerating short writes.
 *  @param[in] name - path used in the error message.
 *  @throws IOError when the descriptor stops accepting data.
 */
void writeAll(stdplus::fd::Fd& fd, std::span<const std::byte> data,
              const std::string& name);

/** @brief fsync the descriptor.
 *  @throws IOError when the flush fails.
 */
void syncFd(int fd, const std::string& name);

/** @brief Replace target with data so that readers observe either the old
 *  or the new content, never a torn file.
 *  @details The data goes to a temporary sibling which is synced and then
 *    renamed over target.
 */
void atomicReplace(const std::filesystem::path& target,
                   std::span<const uint8_t> data, mode_t mode = 0600);

/** @brief Like atomicReplace, but fails with AlreadyExists instead of
 *  replacing an existing target.
 */
void publishExclusive(const std::filesystem::path& target,
                      std::span<const uint8_t> data, mode_t mode = 0600);

/** @brief Append a line to a file and flush it to stable storage. */
void appendLine(const std::filesystem::path& path, std::string_view line);

} // namespace util

} // namespace cryptowipe
