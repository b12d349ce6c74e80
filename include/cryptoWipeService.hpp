#pragma once

#include "authorization.hpp"
#include "cryptoWipe.hpp"
#include "errors.hpp"

#include <sdbusplus/asio/object_server.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace cryptowipe
{

/** @brief Interface, bus name and object path of the service. */
constexpr const char* serviceName = "xyz.openbmc_project.CryptoWipe";
constexpr const char* serviceInterface = "xyz.openbmc_project.CryptoWipe";
constexpr const char* serviceObjectPath = "/xyz/openbmc_project/cryptowipe";

/* state, outcome, success, error, log */
using JobStatusReply = std::tuple<std::string, std::string, bool, std::string,
                                  std::vector<std::string>>;

/** @brief Map a plain file name into dir.
 *  @throws InvalidArgument for an empty name, "." or "..", or anything with
 *    a directory part.
 */
std::filesystem::path resolveName(const std::filesystem::path& dir,
                                  std::string_view name);

/** @returns the random pass count for a WipeKey call; 0 selects the
 *  configured default.
 */
unsigned wipePassesFor(uint32_t requested, const Config& config);

/** @brief Log a failed method and rethrow the error being handled as its
 *  xyz.openbmc_project.Common.Error counterpart.
 *  @details Must be called from the catch block that caught e.
 */
[[noreturn]] void rethrowAsDbusError(const std::string& method,
                                     const CryptoWipeError& e);

/** @class CryptoWipeService
 *  @brief D-Bus front end of the cryptowipe core.
 *  @details Performs admission checks and resolves container and key names
 *    inside the state directory before calling the core. Core errors are
 *    reported as xyz.openbmc_project.Common.Error errors.
 */
class CryptoWipeService
{
  public:
    /** @brief Serve core without putting anything on the bus.
     *
     *  @param[in] core - the core to serve; must outlive this object.
     *  @param[in] authorizer - admission checks for destructive methods.
     */
    explicit CryptoWipeService(CryptoWipe& core,
                               Authorizer authorizer = Authorizer());

    /** @brief Serve core and register the interface on server. */
    CryptoWipeService(sdbusplus::asio::object_server& server, CryptoWipe& core,
                      Authorizer authorizer = Authorizer());

    ~CryptoWipeService();

    CryptoWipeService(const CryptoWipeService&) = delete;
    CryptoWipeService& operator=(const CryptoWipeService&) = delete;
    CryptoWipeService(CryptoWipeService&&) = delete;
    CryptoWipeService& operator=(CryptoWipeService&&) = delete;

    void createContainer(const std::string& containerName,
                         const std::string& keyName);

    std::string addFile(const std::string& containerName,
                        const std::string& keyName, const std::string& name,
                        const std::vector<uint8_t>& content);

    std::vector<std::string> listContainer(const std::string& containerName,
                                           const std::string& keyName);

    /** @param[in] outDir - absolute directory to extract into. */
    void extractAll(const std::string& containerName,
                    const std::string& keyName, const std::string& outDir);

    /** @param[in] passes - random overwrite rounds; 0 selects the default. */
    void wipeKey(const std::string& keyName, const std::string& confirmToken,
                 uint32_t passes);

    /** @param[in] keySlot - LUKS key slot; negative selects the default. */
    std::string startJob(const std::string& os, const std::string& target,
                         const std::string& action,
                         const std::string& ownerConfirm, int32_t keySlot);

    JobStatusReply getJobStatus(const std::string& id);

    /* payload, signature */
    std::tuple<std::string, std::vector<uint8_t>>
        getCertificate(const std::string& id);

    std::string getSigningPublicKey();

  private:
    CryptoWipe& core;
    Authorizer authorizer;

    sdbusplus::asio::object_server* objectServer = nullptr;
    std::shared_ptr<sdbusplus::asio::dbus_interface> wipeInterface;
};

} // namespace cryptowipe
