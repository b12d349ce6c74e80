#include "keyStore.hpp"

#include "errors.hpp"
#include "util.hpp"

#include <openssl/crypto.h>

#include <phosphor-logging/lg2.hpp>
#include <stdplus/fd/create.hpp>
#include <stdplus/fd/managed.hpp>

#include <filesystem>
#include <string>
#include <system_error>

namespace cryptowipe
{

using stdplus::fd::ManagedFd;
using stdplus::fd::OpenAccess;
using stdplus::fd::OpenFlag;
using stdplus::fd::OpenFlags;

KeyMaterial::~KeyMaterial()
{
    if (!material.empty())
    {
        OPENSSL_cleanse(material.data(), material.size());
    }
}

KeyMaterial KeyStore::generate()
{
    return KeyMaterial(util::randomBytes(KeyMaterial::keySize));
}

void KeyStore::save(const KeyMaterial& material,
                    const std::filesystem::path& path)
{
    try
    {
        ManagedFd fd = stdplus::fd::open(path.string(),
                                         OpenFlags(OpenAccess::WriteOnly)
                                             .set(OpenFlag::Create)
                                             .set(OpenFlag::Trunc),
                                         0600);
        util::writeAll(fd, std::as_bytes(material.bytes()), path.string());
        util::syncFd(fd.get(), path.string());
    }
    catch (const std::system_error& e)
    {
        lg2::error("Failed to write key file {FILE}: {ERROR}", "FILE",
                   path.string(), "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.KeySaveFailure"));
        throw IOError(path.string(), e.what());
    }

    /* An existing file keeps its mode through O_TRUNC, so set it again. */
    std::error_code ec;
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read |
                                     std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec)
    {
        lg2::warning("Unable to restrict permissions of {FILE}: {ERROR}",
                     "FILE", path.string(), "ERROR", ec.message());
    }

    lg2::info("Saved key file {FILE}", "FILE", path.string(),
              "REDFISH_MESSAGE_ID", std::string("CryptoWipe.1.0.KeySaved"));
}

KeyMaterial KeyStore::load(const std::filesystem::path& path)
{
    return KeyMaterial(util::readFile(path));
}

} // namespace cryptowipe
