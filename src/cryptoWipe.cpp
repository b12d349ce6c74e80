#include "cryptoWipe.hpp"

#include "errors.hpp"
#include "secureErase.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>

namespace cryptowipe
{

CryptoWipe::CryptoWipe(const Config& config) :
    CryptoWipe(config,
               std::make_unique<CertificateSigner>(config.signingPrivateKey(),
                                                   config.signingPublicKey()),
               std::make_unique<WipeTools>())
{}

CryptoWipe::CryptoWipe(const Config& config,
                       std::unique_ptr<CertificateSignerInterface> signer,
                       std::unique_ptr<WipeToolsInterface> tools) :
    cfg(config), signer(std::move(signer)),
    engine(cfg, *this->signer, std::move(tools))
{}

std::shared_ptr<std::mutex>
    CryptoWipe::pathLock(const std::filesystem::path& path)
{
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::weakly_canonical(path,
                                                                        ec);
    std::string key = ec ? path.lexically_normal().string()
                         : canonical.string();

    std::lock_guard<std::mutex> lock(locksMutex);
    std::shared_ptr<std::mutex>& entry = pathLocks[key];
    if (!entry)
    {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void CryptoWipe::createContainer(const std::filesystem::path& container,
                                 const std::filesystem::path& key)
{
    auto containerMutex = pathLock(container);
    auto keyMutex = pathLock(key);
    if (containerMutex == keyMutex)
    {
        throw InvalidContainer(container.string(), "same path as its key");
    }
    std::scoped_lock lock(*containerMutex, *keyMutex);

    Container(container).create(key);
}

std::string CryptoWipe::addFile(const std::filesystem::path& container,
                                const std::filesystem::path& key,
                                std::string_view name,
                                std::span<const uint8_t> content)
{
    auto containerMutex = pathLock(container);
    auto keyMutex = pathLock(key);
    if (containerMutex == keyMutex)
    {
        throw InvalidContainer(container.string(), "same path as its key");
    }
    std::scoped_lock lock(*containerMutex, *keyMutex);

    std::string stored = codec::recordName(name);
    Container(container).addFile(key, stored, content);
    return stored;
}

std::vector<std::string>
    CryptoWipe::listContainer(const std::filesystem::path& container,
                              const std::filesystem::path& key)
{
    auto containerMutex = pathLock(container);
    std::lock_guard<std::mutex> lock(*containerMutex);
    return Container(container).list(key);
}

void CryptoWipe::extractAll(const std::filesystem::path& container,
                            const std::filesystem::path& key,
                            const std::filesystem::path& outDir)
{
    auto containerMutex = pathLock(container);
    std::lock_guard<std::mutex> lock(*containerMutex);
    Container(container).extractAll(key, outDir);
}

void CryptoWipe::wipeKey(const KeyWipeAuthorization& /*unused*/,
                         const std::filesystem::path& key, unsigned passes)
{
    auto keyMutex = pathLock(key);
    std::lock_guard<std::mutex> lock(*keyMutex);

    SecureErase secureErase(key.string());
    secureErase.wipeKey(passes);
}

std::string CryptoWipe::startJob(const DeviceWipeAuthorization& authorization,
                                 JobRequest request)
{
    return engine.startJob(authorization, std::move(request));
}

JobStatus CryptoWipe::getJobStatus(const std::string& id) const
{
    return engine.getJobStatus(id);
}

Certificate CryptoWipe::getCertificate(const std::string& id) const
{
    return engine.getCertificate(id);
}

bool CryptoWipe::verifyCertificate(const Certificate& certificate)
{
    return engine.verifyCertificate(certificate);
}

std::string CryptoWipe::publicKeyPem()
{
    return signer->publicKeyPem();
}

bool CryptoWipe::waitForJob(const std::string& id,
                            std::chrono::milliseconds timeout)
{
    return engine.waitForJob(id, timeout);
}

} // namespace cryptowipe
