#pragma once

#include <cstdint>
#include <filesystem>

namespace cryptowipe
{

/** @struct Config
 *  @brief Runtime configuration of the cryptowipe core.
 *  @details Defaults come from the build-time cryptowipe_conf.hpp; the
 *    state directory can be overridden through the environment.
 */
struct Config
{
    /** @brief Root of the on-disk layout. */
    std::filesystem::path stateDir;

    /** @brief Random overwrite passes used by WipeKey when unspecified. */
    unsigned wipePasses;

    /** @brief Size of the leading region zeroed by the header-zero action.
     *  @details The region always starts at offset 0. It covers a LUKS2
     *    header with the default layout; operators must confirm that no
     *    other copy of the key material lies beyond it on their targets.
     */
    uint64_t headerZeroBytes;

    /** @brief LUKS key slot destroyed by the key-slot kill action when the
     *  caller does not name one.
     */
    int defaultKeySlot;

    /** @brief Build a configuration from the compiled-in defaults, honoring
     *  the CRYPTOWIPE_STATE_DIR environment variable.
     */
    static Config fromEnvironment();

    /** @brief Build a configuration rooted at stateDir with the compiled-in
     *  defaults for everything else.
     */
    static Config withStateDir(const std::filesystem::path& stateDir);

    std::filesystem::path containersDir() const
    {
        return stateDir / "containers";
    }

    std::filesystem::path keysDir() const
    {
        return stateDir / "keys";
    }

    std::filesystem::path certsDir() const
    {
        return stateDir / "certs";
    }

    std::filesystem::path logsDir() const
    {
        return stateDir / "logs";
    }

    std::filesystem::path signingPrivateKey() const
    {
        return certsDir() / "server_rsa_priv.pem";
    }

    std::filesystem::path signingPublicKey() const
    {
        return certsDir() / "server_rsa_pub.pem";
    }

    /** @brief Create every directory of the layout that does not exist. */
    void createDirectories() const;
};

} // namespace cryptowipe
