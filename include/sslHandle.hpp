#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>

#include <stdplus/handle/managed.hpp>

namespace cryptowipe
{
namespace ssl
{

/* Drop functions for the OpenSSL objects owned by the handles below. */
inline void cipherCtxFree(EVP_CIPHER_CTX*&& ctx)
{
    EVP_CIPHER_CTX_free(ctx);
}

inline void mdCtxFree(EVP_MD_CTX*&& ctx)
{
    EVP_MD_CTX_free(ctx);
}

inline void pkeyFree(EVP_PKEY*&& key)
{
    EVP_PKEY_free(key);
}

inline void pkeyCtxFree(EVP_PKEY_CTX*&& ctx)
{
    EVP_PKEY_CTX_free(ctx);
}

inline void bioFree(BIO*&& bio)
{
    BIO_free_all(bio);
}

using CipherCtx = stdplus::Managed<EVP_CIPHER_CTX*>::Handle<cipherCtxFree>;
using MdCtx = stdplus::Managed<EVP_MD_CTX*>::Handle<mdCtxFree>;
using Pkey = stdplus::Managed<EVP_PKEY*>::Handle<pkeyFree>;
using PkeyCtx = stdplus::Managed<EVP_PKEY_CTX*>::Handle<pkeyCtxFree>;
using Bio = stdplus::Managed<BIO*>::Handle<bioFree>;

} // namespace ssl
} // namespace cryptowipe
