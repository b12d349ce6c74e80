#pragma once

#include "certificate.hpp"
#include "sslHandle.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cryptowipe
{

/** @struct SignedPayload
 *  @brief The exact bytes that were signed, and their signature.
 */
struct SignedPayload
{
    std::string payload;
    std::vector<uint8_t> signature;
};

/** @class CertificateSignerInterface
 *  @brief Interface to the certificate signing identity.
 *  @details This class is used to mock out signing in the job engine.
 */
class CertificateSignerInterface
{
  public:
    virtual ~CertificateSignerInterface() = default;

    CertificateSignerInterface() = default;
    CertificateSignerInterface(const CertificateSignerInterface&) = delete;
    CertificateSignerInterface&
        operator=(const CertificateSignerInterface&) = delete;

    CertificateSignerInterface(CertificateSignerInterface&&) = delete;
    CertificateSignerInterface&
        operator=(CertificateSignerInterface&&) = delete;

    /** @brief Load the signing key pair, generating and persisting it the
     *  first time.
     *
     *  @throws SigningFailed if the key pair cannot be produced.
     */
    virtual void ensureSigningKey() = 0;

    /** @brief Canonicalize and sign a record.
     *
     *  @throws SigningFailed on any failure.
     */
    virtual SignedPayload sign(const CertificateRecord& record) = 0;

    /** @brief Check a signature over the canonical payload bytes.
     *
     *  @returns true if signature was made by this identity over payload.
     */
    virtual bool verifyPayload(std::string_view payload,
                               std::span<const uint8_t> signature) = 0;

    /** @brief The public half of the signing identity, PEM encoded. */
    virtual std::string publicKeyPem() = 0;

    /** @brief Check a signature over the canonical form of record. */
    bool verify(const CertificateRecord& record,
                std::span<const uint8_t> signature)
    {
        return verifyPayload(canonicalize(record), signature);
    }
};

/** @class CertificateSigner
 *  @brief RSA-2048 PKCS#1 v1.5 SHA-256 signer backed by PEM files.
 *  @details The private key is stored with mode 0600. Once loaded, the
 *    key pair is kept for the lifetime of the object.
 */
class CertificateSigner : public CertificateSignerInterface
{
  public:
    CertificateSigner(std::filesystem::path privateKeyPath,
                      std::filesystem::path publicKeyPath) :
        privPath(std::move(privateKeyPath)), pubPath(std::move(publicKeyPath))
    {}

    void ensureSigningKey() override;

    SignedPayload sign(const CertificateRecord& record) override;

    bool verifyPayload(std::string_view payload,
                       std::span<const uint8_t> signature) override;

    std::string publicKeyPem() override;

    /** @brief Check a signature against an exported public key.
     *
     *  @param[in] pem - output of publicKeyPem().
     *
     *  @throws SigningFailed if the PEM cannot be parsed.
     */
    static bool verifyWithPublicKey(std::string_view pem,
                                    std::string_view payload,
                                    std::span<const uint8_t> signature);

  private:
    /** @brief Caller must hold keyMutex. */
    void loadOrGenerate();

    EVP_PKEY* key();

    std::filesystem::path privPath;
    std::filesystem::path pubPath;

    std::mutex keyMutex;
    std::optional<ssl::Pkey> pkey;
};

} // namespace cryptowipe
