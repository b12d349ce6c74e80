#include "cipher.hpp"

#include "errors.hpp"
#include "sslHandle.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <phosphor-logging/lg2.hpp>

#include <string>

namespace cryptowipe
{
namespace aead
{

namespace
{

ssl::CipherCtx newContext()
{
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (ctx == nullptr)
    {
        throw CryptoFailure("EVP_CIPHER_CTX_new");
    }
    return ssl::CipherCtx(std::move(ctx));
}

void checkKey(std::span<const uint8_t> key)
{
    if (key.size() != keySize)
    {
        throw CryptoFailure("AES-256-GCM needs a 32 byte key, got " +
                            std::to_string(key.size()));
    }
}

} // namespace

std::vector<uint8_t> seal(std::span<const uint8_t> key,
                          std::span<const uint8_t> nonce,
                          std::span<const uint8_t> plaintext)
{
    checkKey(key);
    ssl::CipherCtx ctx = newContext();

    if (EVP_EncryptInit_ex(*ctx, EVP_aes_256_gcm(), nullptr, nullptr,
                           nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(*ctx, EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(*ctx, nullptr, nullptr, key.data(),
                           nonce.data()) != 1)
    {
        throw CryptoFailure("AES-256-GCM encrypt init");
    }

    std::vector<uint8_t> out(plaintext.size() + tagSize);
    int len = 0;
    int total = 0;
    if (!plaintext.empty())
    {
        if (EVP_EncryptUpdate(*ctx, out.data(), &len, plaintext.data(),
                              static_cast<int>(plaintext.size())) != 1)
        {
            throw CryptoFailure("AES-256-GCM encrypt");
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(*ctx, out.data() + total, &len) != 1)
    {
        throw CryptoFailure("AES-256-GCM encrypt final");
    }
    total += len;

    if (EVP_CIPHER_CTX_ctrl(*ctx, EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(tagSize),
                            out.data() + total) != 1)
    {
        throw CryptoFailure("AES-256-GCM get tag");
    }
    out.resize(total + tagSize);
    return out;
}

std::vector<uint8_t> open(std::span<const uint8_t> key,
                          std::span<const uint8_t> nonce,
                          std::span<const uint8_t> sealed,
                          std::string_view name)
{
    checkKey(key);
    if (sealed.size() < tagSize)
    {
        throw InvalidContainer(name, "ciphertext shorter than the tag");
    }
    std::span<const uint8_t> ciphertext =
        sealed.first(sealed.size() - tagSize);
    std::span<const uint8_t> tag = sealed.last(tagSize);

    ssl::CipherCtx ctx = newContext();
    if (EVP_DecryptInit_ex(*ctx, EVP_aes_256_gcm(), nullptr, nullptr,
                           nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(*ctx, EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(*ctx, nullptr, nullptr, key.data(),
                           nonce.data()) != 1)
    {
        throw CryptoFailure("AES-256-GCM decrypt init");
    }

    /* One spare byte keeps data() valid for an empty ciphertext. */
    std::vector<uint8_t> plaintext(ciphertext.size() + 1);
    int len = 0;
    int total = 0;
    if (!ciphertext.empty())
    {
        if (EVP_DecryptUpdate(*ctx, plaintext.data(), &len, ciphertext.data(),
                              static_cast<int>(ciphertext.size())) != 1)
        {
            throw CryptoFailure("AES-256-GCM decrypt");
        }
        total = len;
    }

    // OpenSSL takes a non-const tag buffer but only reads it
    if (EVP_CIPHER_CTX_ctrl(*ctx, EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(tagSize),
                            const_cast<uint8_t*>(tag.data())) != 1)
    {
        throw CryptoFailure("AES-256-GCM set tag");
    }

    if (EVP_DecryptFinal_ex(*ctx, plaintext.data() + total, &len) <= 0)
    {
        OPENSSL_cleanse(plaintext.data(), plaintext.size());
        lg2::error("Authentication tag mismatch for {FILE}", "FILE",
                   std::string(name), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.AuthenticationFailure"));
        throw AuthenticationFailed(name);
    }
    total += len;
    plaintext.resize(total);
    return plaintext;
}

} // namespace aead
} // namespace cryptowipe
