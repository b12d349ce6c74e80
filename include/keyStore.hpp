#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>

namespace cryptowipe
{

/** @class KeyMaterial
 *  @brief Owns raw symmetric key bytes and cleanses them on destruction.
 */
class KeyMaterial
{
  public:
    /** @brief Size of the AES-256 keys protecting containers. */
    static constexpr size_t keySize = 32;

    explicit KeyMaterial(std::vector<uint8_t> bytes) :
        material(std::move(bytes))
    {}

    ~KeyMaterial();

    KeyMaterial(const KeyMaterial&) = delete;
    KeyMaterial& operator=(const KeyMaterial&) = delete;
    KeyMaterial(KeyMaterial&&) = default;
    KeyMaterial& operator=(KeyMaterial&&) = default;

    std::span<const uint8_t> bytes() const
    {
        return material;
    }

    size_t size() const
    {
        return material.size();
    }

  private:
    std::vector<uint8_t> material;
};

/** @class KeyStore
 *  @brief Persists key material as headerless owner-only files.
 *  @details Key bytes are never written to the journal.
 */
class KeyStore
{
  public:
    /** @brief Draw a fresh 256-bit key from the OpenSSL DRBG. */
    static KeyMaterial generate();

    /** @brief Write material to path with mode 0600.
     *  @details A failure to tighten the permissions is logged but not
     *    fatal, since some filesystems do not carry POSIX modes.
     *
     *  @throws IOError if the file cannot be written.
     */
    static void save(const KeyMaterial& material,
                     const std::filesystem::path& path);

    /** @brief Read raw key bytes.
     *  @throws NotFound if the path does not exist.
     */
    static KeyMaterial load(const std::filesystem::path& path);
};

} // namespace cryptowipe
