#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace cryptowipe
{
namespace aead
{

/* AES-256-GCM parameters used for containers. */
constexpr size_t keySize = 32;
constexpr size_t nonceSize = 12;
constexpr size_t tagSize = 16;

/** @brief Encrypt plaintext under key and nonce.
 *  @returns the ciphertext with the authentication tag appended.
 *  @throws CryptoFailure on OpenSSL errors.
 */
std::vector<uint8_t> seal(std::span<const uint8_t> key,
                          std::span<const uint8_t> nonce,
                          std::span<const uint8_t> plaintext);

/** @brief Decrypt a sealed blob and verify its tag.
 *  @param[in] name - container path reported on failure.
 *  @throws AuthenticationFailed if the tag does not verify.
 */
std::vector<uint8_t> open(std::span<const uint8_t> key,
                          std::span<const uint8_t> nonce,
                          std::span<const uint8_t> sealed,
                          std::string_view name);

} // namespace aead
} // namespace cryptowipe
