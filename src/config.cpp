#include "config.hpp"

#include "cryptowipe_conf.hpp"
#include "errors.hpp"

#include <phosphor-logging/lg2.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace cryptowipe
{

Config Config::withStateDir(const std::filesystem::path& stateDir)
{
    return Config{stateDir, CRYPTOWIPE_WIPE_PASSES,
                  CRYPTOWIPE_HEADER_ZERO_BYTES, CRYPTOWIPE_DEFAULT_KEYSLOT};
}

Config Config::fromEnvironment()
{
    // getenv is only read at startup, before any worker exists
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* override = std::getenv("CRYPTOWIPE_STATE_DIR");
    if (override != nullptr && *override != '\0')
    {
        lg2::info("Using state directory {DIR} from the environment", "DIR",
                  std::string(override));
        return withStateDir(override);
    }
    return withStateDir(CRYPTOWIPE_STATE_DIR);
}

void Config::createDirectories() const
{
    for (const std::filesystem::path& dir :
         {containersDir(), keysDir(), certsDir(), logsDir()})
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            lg2::error("Failed to create {DIR}: {ERROR}", "DIR", dir.string(),
                       "ERROR", ec.message(), "REDFISH_MESSAGE_ID",
                       std::string("CryptoWipe.1.0.SetupFailure"));
            throw IOError(dir.string(), ec.message());
        }
    }
}

} // namespace cryptowipe
