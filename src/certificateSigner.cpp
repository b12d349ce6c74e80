#include "certificateSigner.hpp"

#include "errors.hpp"
#include "sslHandle.hpp"
#include "util.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <phosphor-logging/lg2.hpp>

#include <array>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>

namespace cryptowipe
{

namespace
{

constexpr int rsaBits = 2048;

[[noreturn]] void fail(const std::string& what)
{
    std::array<char, 256> buf{};
    ERR_error_string_n(ERR_get_error(), buf.data(), buf.size());
    ERR_clear_error();
    lg2::error("Certificate signing failure in {WHAT}: {ERROR}", "WHAT", what,
               "ERROR", buf.data(), "REDFISH_MESSAGE_ID",
               std::string("CryptoWipe.1.0.SigningFailure"));
    throw SigningFailed(what);
}

ssl::Bio newMemBio()
{
    BIO* bio = BIO_new(BIO_s_mem());
    if (bio == nullptr)
    {
        fail("BIO_new");
    }
    return ssl::Bio(std::move(bio));
}

std::vector<uint8_t> bioContents(BIO* bio)
{
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len < 0 || (len > 0 && data == nullptr))
    {
        fail("BIO_get_mem_data");
    }
    return std::vector<uint8_t>(data, data + len);
}

std::vector<uint8_t> publicPem(EVP_PKEY* key)
{
    ssl::Bio bio = newMemBio();
    if (PEM_write_bio_PUBKEY(*bio, key) != 1)
    {
        fail("PEM_write_bio_PUBKEY");
    }
    return bioContents(*bio);
}

void writePem(const std::filesystem::path& path,
              std::span<const uint8_t> pem, mode_t mode)
{
    try
    {
        util::atomicReplace(path, pem, mode);
    }
    catch (const CryptoWipeError& e)
    {
        lg2::error("Unable to persist signing key {FILE}: {ERROR}", "FILE",
                   path.string(), "ERROR", e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.SigningFailure"));
        throw SigningFailed(e.what());
    }
}

bool verifyWith(EVP_PKEY* key, std::string_view payload,
                std::span<const uint8_t> signature)
{
    EVP_MD_CTX* raw = EVP_MD_CTX_new();
    if (raw == nullptr)
    {
        fail("EVP_MD_CTX_new");
    }
    ssl::MdCtx ctx(std::move(raw));
    if (EVP_DigestVerifyInit(*ctx, nullptr, EVP_sha256(), nullptr, key) != 1)
    {
        fail("EVP_DigestVerifyInit");
    }
    int rc = EVP_DigestVerify(
        *ctx, signature.data(), signature.size(),
        reinterpret_cast<const unsigned char*>(payload.data()),
        payload.size());
    if (rc != 1)
    {
        ERR_clear_error();
    }
    return rc == 1;
}

} // namespace

void CertificateSigner::ensureSigningKey()
{
    std::lock_guard<std::mutex> lock(keyMutex);
    loadOrGenerate();
}

void CertificateSigner::loadOrGenerate()
{
    if (pkey)
    {
        return;
    }

    std::error_code ec;
    if (std::filesystem::exists(privPath, ec))
    {
        BIO* rawBio = BIO_new_file(privPath.c_str(), "r");
        if (rawBio == nullptr)
        {
            fail("open " + privPath.string());
        }
        ssl::Bio bio(std::move(rawBio));
        EVP_PKEY* loaded =
            PEM_read_bio_PrivateKey(*bio, nullptr, nullptr, nullptr);
        if (loaded == nullptr)
        {
            fail("parse " + privPath.string());
        }
        pkey.emplace(std::move(loaded));

        if (!std::filesystem::exists(pubPath, ec))
        {
            writePem(pubPath, publicPem(key()), 0644);
        }
        lg2::info("Loaded signing key {FILE}", "FILE", privPath.string());
        return;
    }

    EVP_PKEY_CTX* rawCtx = EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr);
    if (rawCtx == nullptr)
    {
        fail("EVP_PKEY_CTX_new_id");
    }
    ssl::PkeyCtx ctx(std::move(rawCtx));
    if (EVP_PKEY_keygen_init(*ctx) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(*ctx, rsaBits) <= 0)
    {
        fail("RSA keygen init");
    }
    EVP_PKEY* generated = nullptr;
    if (EVP_PKEY_keygen(*ctx, &generated) <= 0)
    {
        fail("RSA keygen");
    }
    ssl::Pkey newKey(std::move(generated));

    ssl::Bio bio = newMemBio();
    if (PEM_write_bio_PrivateKey(*bio, *newKey, nullptr, nullptr, 0, nullptr,
                                 nullptr) != 1)
    {
        fail("PEM_write_bio_PrivateKey");
    }
    std::vector<uint8_t> privatePem = bioContents(*bio);
    try
    {
        writePem(privPath, privatePem, 0600);
    }
    catch (const SigningFailed&)
    {
        OPENSSL_cleanse(privatePem.data(), privatePem.size());
        throw;
    }
    OPENSSL_cleanse(privatePem.data(), privatePem.size());
    writePem(pubPath, publicPem(*newKey), 0644);

    pkey.emplace(std::move(newKey));
    lg2::info("Generated signing key {FILE}", "FILE", privPath.string(),
              "REDFISH_MESSAGE_ID",
              std::string("CryptoWipe.1.0.SigningKeyCreated"));
}

EVP_PKEY* CertificateSigner::key()
{
    return **pkey;
}

SignedPayload CertificateSigner::sign(const CertificateRecord& record)
{
    SignedPayload out;
    out.payload = canonicalize(record);

    std::lock_guard<std::mutex> lock(keyMutex);
    loadOrGenerate();

    EVP_MD_CTX* raw = EVP_MD_CTX_new();
    if (raw == nullptr)
    {
        fail("EVP_MD_CTX_new");
    }
    ssl::MdCtx ctx(std::move(raw));
    if (EVP_DigestSignInit(*ctx, nullptr, EVP_sha256(), nullptr, key()) != 1)
    {
        fail("EVP_DigestSignInit");
    }

    const auto* data =
        reinterpret_cast<const unsigned char*>(out.payload.data());
    size_t len = 0;
    if (EVP_DigestSign(*ctx, nullptr, &len, data, out.payload.size()) != 1)
    {
        fail("EVP_DigestSign");
    }
    out.signature.resize(len);
    if (EVP_DigestSign(*ctx, out.signature.data(), &len, data,
                       out.payload.size()) != 1)
    {
        fail("EVP_DigestSign");
    }
    out.signature.resize(len);
    return out;
}

bool CertificateSigner::verifyPayload(std::string_view payload,
                                      std::span<const uint8_t> signature)
{
    std::lock_guard<std::mutex> lock(keyMutex);
    loadOrGenerate();
    return verifyWith(key(), payload, signature);
}

std::string CertificateSigner::publicKeyPem()
{
    std::lock_guard<std::mutex> lock(keyMutex);
    loadOrGenerate();
    std::vector<uint8_t> pem = publicPem(key());
    return std::string(pem.begin(), pem.end());
}

bool CertificateSigner::verifyWithPublicKey(std::string_view pem,
                                            std::string_view payload,
                                            std::span<const uint8_t> signature)
{
    BIO* rawBio = BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size()));
    if (rawBio == nullptr)
    {
        fail("BIO_new_mem_buf");
    }
    ssl::Bio bio(std::move(rawBio));
    EVP_PKEY* loaded = PEM_read_bio_PUBKEY(*bio, nullptr, nullptr, nullptr);
    if (loaded == nullptr)
    {
        fail("parse public key");
    }
    ssl::Pkey publicKey(std::move(loaded));
    return verifyWith(*publicKey, payload, signature);
}

} // namespace cryptowipe
