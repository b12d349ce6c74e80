#include "cryptoWipeService.hpp"

#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>
#include <sdbusplus/asio/object_server.hpp>
#include <xyz/openbmc_project/Common/error.hpp>

#include <filesystem>
#include <string>
#include <utility>

namespace cryptowipe
{

using sdbusplus::xyz::openbmc_project::Common::Error::InsufficientPermission;
using sdbusplus::xyz::openbmc_project::Common::Error::InternalFailure;
using sdbusplus::xyz::openbmc_project::Common::Error::InvalidArgument;
using sdbusplus::xyz::openbmc_project::Common::Error::NotAllowed;
using sdbusplus::xyz::openbmc_project::Common::Error::ResourceNotFound;
using sdbusplus::xyz::openbmc_project::Common::Error::UnsupportedRequest;

[[noreturn]] void rethrowAsDbusError(const std::string& method,
                                     const CryptoWipeError& e)
{
    lg2::error("{METHOD} failed: {ERROR}", "METHOD", method, "ERROR",
               e.what(), "REDFISH_MESSAGE_ID",
               std::string("CryptoWipe.1.0.MethodFailed"));
    try
    {
        throw;
    }
    catch (const NotFound&)
    {
        throw ResourceNotFound();
    }
    catch (const AlreadyExists&)
    {
        throw NotAllowed();
    }
    catch (const NotAuthorized&)
    {
        throw InsufficientPermission();
    }
    catch (const AuthenticationFailed&)
    {
        throw InsufficientPermission();
    }
    catch (const InvalidContainer&)
    {
        throw InvalidArgument();
    }
    catch (const InvalidRecordName&)
    {
        throw InvalidArgument();
    }
    catch (const InvalidKeyMaterial&)
    {
        throw InvalidArgument();
    }
    catch (const CorruptRecord&)
    {
        throw InvalidArgument();
    }
    catch (const UnsupportedOS&)
    {
        throw UnsupportedRequest();
    }
    catch (const UnsupportedAction&)
    {
        throw UnsupportedRequest();
    }
    catch (const CryptoWipeError&)
    {
        throw InternalFailure();
    }
}

std::filesystem::path resolveName(const std::filesystem::path& dir,
                                  std::string_view name)
{
    std::filesystem::path p(name);
    if (name.empty() || name == "." || name == ".." ||
        p.filename() != p || p.has_root_path())
    {
        lg2::error("Rejected name '{NAME}'", "NAME", std::string(name),
                   "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.InvalidName"));
        throw InvalidArgument();
    }
    return dir / p;
}

unsigned wipePassesFor(uint32_t requested, const Config& config)
{
    return requested == 0 ? config.wipePasses : requested;
}

CryptoWipeService::CryptoWipeService(CryptoWipe& core, Authorizer authorizer) :
    core(core), authorizer(std::move(authorizer))
{}

CryptoWipeService::CryptoWipeService(sdbusplus::asio::object_server& server,
                                     CryptoWipe& core, Authorizer authorizer) :
    CryptoWipeService(core, std::move(authorizer))
{
    objectServer = &server;
    wipeInterface =
        objectServer->add_interface(serviceObjectPath, serviceInterface);

    wipeInterface->register_method(
        "CreateContainer",
        [this](const std::string& containerName, const std::string& keyName) {
            this->createContainer(containerName, keyName);
        });
    wipeInterface->register_method(
        "AddFile",
        [this](const std::string& containerName, const std::string& keyName,
               const std::string& name, const std::vector<uint8_t>& content) {
            return this->addFile(containerName, keyName, name, content);
        });
    wipeInterface->register_method(
        "ListContainer",
        [this](const std::string& containerName, const std::string& keyName) {
            return this->listContainer(containerName, keyName);
        });
    wipeInterface->register_method(
        "ExtractAll",
        [this](const std::string& containerName, const std::string& keyName,
               const std::string& outDir) {
            this->extractAll(containerName, keyName, outDir);
        });
    wipeInterface->register_method(
        "WipeKey", [this](const std::string& keyName,
                          const std::string& confirmToken, uint32_t passes) {
            this->wipeKey(keyName, confirmToken, passes);
        });
    wipeInterface->register_method(
        "StartJob",
        [this](const std::string& os, const std::string& target,
               const std::string& action, const std::string& ownerConfirm,
               int32_t keySlot) {
            return this->startJob(os, target, action, ownerConfirm, keySlot);
        });
    wipeInterface->register_method(
        "GetJobStatus",
        [this](const std::string& id) { return this->getJobStatus(id); });
    wipeInterface->register_method(
        "GetCertificate",
        [this](const std::string& id) { return this->getCertificate(id); });
    wipeInterface->register_method(
        "GetSigningPublicKey",
        [this]() { return this->getSigningPublicKey(); });

    wipeInterface->initialize();
}

CryptoWipeService::~CryptoWipeService()
{
    if (objectServer != nullptr && wipeInterface)
    {
        objectServer->remove_interface(wipeInterface);
    }
}

void CryptoWipeService::createContainer(const std::string& containerName,
                                        const std::string& keyName)
{
    const Config& config = core.config();
    std::filesystem::path container =
        resolveName(config.containersDir(), containerName);
    std::filesystem::path key = resolveName(config.keysDir(), keyName);
    try
    {
        core.createContainer(container, key);
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("CreateContainer", e);
    }
}

std::string CryptoWipeService::addFile(const std::string& containerName,
                                       const std::string& keyName,
                                       const std::string& name,
                                       const std::vector<uint8_t>& content)
{
    const Config& config = core.config();
    std::filesystem::path container =
        resolveName(config.containersDir(), containerName);
    std::filesystem::path key = resolveName(config.keysDir(), keyName);
    try
    {
        return core.addFile(container, key, name, content);
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("AddFile", e);
    }
}

std::vector<std::string>
    CryptoWipeService::listContainer(const std::string& containerName,
                                     const std::string& keyName)
{
    const Config& config = core.config();
    std::filesystem::path container =
        resolveName(config.containersDir(), containerName);
    std::filesystem::path key = resolveName(config.keysDir(), keyName);
    try
    {
        return core.listContainer(container, key);
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("ListContainer", e);
    }
}

void CryptoWipeService::extractAll(const std::string& containerName,
                                   const std::string& keyName,
                                   const std::string& outDir)
{
    const Config& config = core.config();
    std::filesystem::path container =
        resolveName(config.containersDir(), containerName);
    std::filesystem::path key = resolveName(config.keysDir(), keyName);
    std::filesystem::path out(outDir);
    if (!out.is_absolute())
    {
        throw InvalidArgument();
    }
    try
    {
        core.extractAll(container, key, out);
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("ExtractAll", e);
    }
}

void CryptoWipeService::wipeKey(const std::string& keyName,
                                const std::string& confirmToken,
                                uint32_t passes)
{
    std::filesystem::path key = resolveName(core.config().keysDir(), keyName);
    try
    {
        KeyWipeAuthorization authorization =
            authorizer.authorizeKeyWipe(confirmToken);
        core.wipeKey(authorization, key, wipePassesFor(passes, core.config()));
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("WipeKey", e);
    }
}

std::string CryptoWipeService::startJob(const std::string& os,
                                        const std::string& target,
                                        const std::string& action,
                                        const std::string& ownerConfirm,
                                        int32_t keySlot)
{
    if (os.empty() || target.empty() || action.empty())
    {
        throw InvalidArgument();
    }
    try
    {
        DeviceWipeAuthorization authorization =
            authorizer.authorizeDeviceWipe(ownerConfirm);
        JobRequest request{os, target, action, keySlot};
        return core.startJob(authorization, std::move(request));
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("StartJob", e);
    }
}

JobStatusReply CryptoWipeService::getJobStatus(const std::string& id)
{
    try
    {
        JobStatus status = core.getJobStatus(id);
        return {std::string(toString(status.state)),
                std::string(toString(status.outcome)), status.success,
                status.error, status.log};
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("GetJobStatus", e);
    }
}

std::tuple<std::string, std::vector<uint8_t>>
    CryptoWipeService::getCertificate(const std::string& id)
{
    try
    {
        Certificate certificate = core.getCertificate(id);
        return {certificate.payload, certificate.signature};
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("GetCertificate", e);
    }
}

std::string CryptoWipeService::getSigningPublicKey()
{
    try
    {
        return core.publicKeyPem();
    }
    catch (const CryptoWipeError& e)
    {
        rethrowAsDbusError("GetSigningPublicKey", e);
    }
}

} // namespace cryptowipe
