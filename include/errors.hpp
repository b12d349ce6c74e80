#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace cryptowipe
{

/** @class CryptoWipeError
 *  @brief Base class for every error raised by the cryptowipe core.
 */
class CryptoWipeError : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

class AlreadyExists : public CryptoWipeError
{
  public:
    explicit AlreadyExists(std::string_view path) :
        CryptoWipeError("Already exists: " + std::string(path))
    {}
};

class NotFound : public CryptoWipeError
{
  public:
    explicit NotFound(std::string_view what) :
        CryptoWipeError("Not found: " + std::string(what))
    {}
};

class IOError : public CryptoWipeError
{
  public:
    IOError(std::string_view path, std::string_view msg) :
        CryptoWipeError("I/O error on " + std::string(path) + ": " +
                        std::string(msg))
    {}
};

/** @brief The container does not start with the expected magic tag, or is
 *  too short to hold a nonce and a tag.
 */
class InvalidContainer : public CryptoWipeError
{
  public:
    InvalidContainer(std::string_view path, std::string_view msg) :
        CryptoWipeError("Invalid container " + std::string(path) + ": " +
                        std::string(msg))
    {}
};

/** @brief Tag verification failed: the container was tampered with or the
 *  wrong key was supplied.
 */
class AuthenticationFailed : public CryptoWipeError
{
  public:
    explicit AuthenticationFailed(std::string_view path) :
        CryptoWipeError("Authentication failed for " + std::string(path))
    {}
};

class CorruptRecord : public CryptoWipeError
{
  public:
    explicit CorruptRecord(std::string_view msg) :
        CryptoWipeError("Corrupt record: " + std::string(msg))
    {}
};

class InvalidRecordName : public CryptoWipeError
{
  public:
    explicit InvalidRecordName(std::string_view name) :
        CryptoWipeError("Invalid record name: '" + std::string(name) + "'")
    {}
};

class InvalidKeyMaterial : public CryptoWipeError
{
  public:
    InvalidKeyMaterial(std::string_view path, size_t size) :
        CryptoWipeError("Key " + std::string(path) + " holds " +
                        std::to_string(size) + " bytes, expected 32")
    {}
};

class CryptoFailure : public CryptoWipeError
{
  public:
    explicit CryptoFailure(std::string_view msg) :
        CryptoWipeError("Crypto failure: " + std::string(msg))
    {}
};

class UnsupportedOS : public CryptoWipeError
{
  public:
    explicit UnsupportedOS(std::string_view os) :
        CryptoWipeError("Unsupported OS: " + std::string(os))
    {}
};

class UnsupportedAction : public CryptoWipeError
{
  public:
    UnsupportedAction(std::string_view os, std::string_view action) :
        CryptoWipeError("Unsupported action '" + std::string(action) +
                        "' for " + std::string(os))
    {}
};

class ManualActionRequired : public CryptoWipeError
{
  public:
    explicit ManualActionRequired(std::string_view os) :
        CryptoWipeError(std::string(os) +
                        " destructive actions must be performed manually")
    {}
};

class ExternalActionFailed : public CryptoWipeError
{
  public:
    ExternalActionFailed(std::string_view action, int status) :
        CryptoWipeError(std::string(action) + " exited with status " +
                        std::to_string(status))
    {}
};

class SigningFailed : public CryptoWipeError
{
  public:
    explicit SigningFailed(std::string_view msg) :
        CryptoWipeError("Signing failed: " + std::string(msg))
    {}
};

class NotAuthorized : public CryptoWipeError
{
  public:
    explicit NotAuthorized(std::string_view msg) :
        CryptoWipeError("Not authorized: " + std::string(msg))
    {}
};

class InvalidStateTransition : public CryptoWipeError
{
  public:
    InvalidStateTransition(std::string_view from, std::string_view to) :
        CryptoWipeError("Invalid job state transition " + std::string(from) +
                        " -> " + std::string(to))
    {}
};

} // namespace cryptowipe
