#pragma once

#include "authorization.hpp"
#include "certificate.hpp"
#include "certificateSigner.hpp"
#include "config.hpp"
#include "container.hpp"
#include "jobEngine.hpp"
#include "wipeJob.hpp"
#include "wipeToolsInterface.hpp"

#include <boost/container/flat_map.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cryptowipe
{

/** @class CryptoWipe
 *  @brief Entry points of the cryptowipe core.
 *  @details Arguments are expected to be validated already. Destructive
 *    operations take an authorization produced by Authorizer. Operations
 *    on the same container, or the same key file, are serialized.
 */
class CryptoWipe
{
  public:
    /** @brief Build the core with the OpenSSL signer and the libcryptsetup
     *  backed wipe tools.
     */
    explicit CryptoWipe(const Config& config);

    CryptoWipe(const Config& config,
               std::unique_ptr<CertificateSignerInterface> signer,
               std::unique_ptr<WipeToolsInterface> tools);

    CryptoWipe(const CryptoWipe&) = delete;
    CryptoWipe& operator=(const CryptoWipe&) = delete;

    /** @brief Create an empty container, generating the key if absent.
     *  @throws AlreadyExists if the container exists.
     */
    void createContainer(const std::filesystem::path& container,
                         const std::filesystem::path& key);

    /** @brief Append a file to a container.
     *  @returns the name the record was stored under.
     */
    std::string addFile(const std::filesystem::path& container,
                        const std::filesystem::path& key,
                        std::string_view name,
                        std::span<const uint8_t> content);

    std::vector<std::string>
        listContainer(const std::filesystem::path& container,
                      const std::filesystem::path& key);

    void extractAll(const std::filesystem::path& container,
                    const std::filesystem::path& key,
                    const std::filesystem::path& outDir);

    /** @brief Overwrite and remove a key file, making every container
     *  sealed under it unrecoverable.
     */
    void wipeKey(const KeyWipeAuthorization& authorization,
                 const std::filesystem::path& key, unsigned passes);

    std::string startJob(const DeviceWipeAuthorization& authorization,
                         JobRequest request);

    JobStatus getJobStatus(const std::string& id) const;

    Certificate getCertificate(const std::string& id) const;

    bool verifyCertificate(const Certificate& certificate);

    std::string publicKeyPem();

    bool waitForJob(const std::string& id, std::chrono::milliseconds timeout);

    const Config& config() const
    {
        return cfg;
    }

  private:
    /** @brief The mutex guarding one container or key file. */
    std::shared_ptr<std::mutex> pathLock(const std::filesystem::path& path);

    const Config cfg;
    std::unique_ptr<CertificateSignerInterface> signer;
    JobEngine engine;

    std::mutex locksMutex;
    boost::container::flat_map<std::string, std::shared_ptr<std::mutex>>
        pathLocks;
};

} // namespace cryptowipe
