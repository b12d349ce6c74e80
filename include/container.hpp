#pragma once

#include "keyStore.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cryptowipe
{

/** @struct FileRecord
 *  @brief One named entry of a container's plaintext.
 */
struct FileRecord
{
    std::string name;
    std::vector<uint8_t> content;
};

/** @struct Envelope
 *  @brief The on-disk parts of a container: nonce and sealed plaintext.
 */
struct Envelope
{
    std::vector<uint8_t> nonce;
    /* AES-256-GCM ciphertext followed by the 16 byte tag. */
    std::vector<uint8_t> sealed;
};

namespace codec
{

/** @brief Tag at the start of every container file. */
constexpr std::string_view magic = "CRYPTOCNT1";

/** @brief Serialize as MAGIC | nonce_len (1 byte) | nonce | sealed. */
std::vector<uint8_t> serializeEnvelope(const Envelope& envelope);

/** @brief Split container bytes into nonce and sealed plaintext.
 *  @param[in] name - path reported on failure.
 *  @throws InvalidContainer on a bad magic tag or a truncated header.
 */
Envelope parseEnvelope(std::span<const uint8_t> bytes, std::string_view name);

/** @brief Append name_len (2 bytes BE) | name | data_len (8 bytes BE) | data.
 */
void appendRecord(std::vector<uint8_t>& plaintext, std::string_view name,
                  std::span<const uint8_t> content);

/** @brief Split a plaintext into its records, in insertion order.
 *  @throws CorruptRecord if a length prefix overruns the plaintext.
 */
std::vector<FileRecord> parseRecords(std::span<const uint8_t> plaintext);

/** @brief Reduce a caller supplied name to its final path segment.
 *  @throws InvalidRecordName if nothing usable remains or the name does not
 *    fit the 16-bit length prefix.
 */
std::string recordName(std::string_view requested);

} // namespace codec

/** @class Container
 *  @brief An encrypted, append-only list of file records.
 *  @details Every mutation decrypts the whole container, appends, draws a
 *    fresh nonce and atomically rewrites the file, so a mutation costs
 *    O(container size). Concurrent mutations of the same container are
 *    not serialized here; see CryptoWipe.
 */
class Container
{
  public:
    explicit Container(std::filesystem::path path) :
        containerPath(std::move(path))
    {}

    /** @brief Create an empty container.
     *  @details The key at keyPath is generated and saved when absent.
     *
     *  @throws AlreadyExists if the container file already exists.
     */
    void create(const std::filesystem::path& keyPath);

    /** @brief Append a record under the final path segment of name. */
    void addFile(const std::filesystem::path& keyPath, std::string_view name,
                 std::span<const uint8_t> content);

    /** @brief Names of all records, in insertion order, duplicates kept. */
    std::vector<std::string> list(const std::filesystem::path& keyPath) const;

    /** @brief Decrypt every record. */
    std::vector<FileRecord>
        records(const std::filesystem::path& keyPath) const;

    /** @brief Write every record to outDir under its stored name.
     *  @details outDir is created when absent. Records are parsed before
     *    anything is written; a later duplicate name replaces the earlier
     *    file. Each file is replaced atomically, but the extraction as a
     *    whole is not: if writing one record fails, the records written
     *    before it stay in outDir.
     */
    void extractAll(const std::filesystem::path& keyPath,
                    const std::filesystem::path& outDir) const;

    /** @brief Read the current nonce and sealed blob without decrypting. */
    Envelope readEnvelope() const;

    const std::filesystem::path& path() const
    {
        return containerPath;
    }

  private:
    std::vector<uint8_t> decrypt(const KeyMaterial& key) const;

    /** @brief Seal plaintext under a fresh nonce. */
    static std::vector<uint8_t> encrypt(const KeyMaterial& key,
                                        std::span<const uint8_t> plaintext);

    static KeyMaterial loadKey(const std::filesystem::path& keyPath);

    std::filesystem::path containerPath;
};

} // namespace cryptowipe
