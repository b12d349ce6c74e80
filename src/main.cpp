#include "config.hpp"
#include "cryptoWipe.hpp"
#include "cryptoWipeService.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <phosphor-logging/lg2.hpp>
#include <sdbusplus/asio/connection.hpp>
#include <sdbusplus/asio/object_server.hpp>

#include <csignal>
#include <exception>
#include <memory>
#include <string>

int main(void)
{
    try
    {
        cryptowipe::Config config = cryptowipe::Config::fromEnvironment();
        config.createDirectories();

        cryptowipe::CryptoWipe core(config);
        /* Generate or load the signing identity before serving requests. */
        core.publicKeyPem();

        // setup connection to dbus
        boost::asio::io_context io;
        auto conn = std::make_shared<sdbusplus::asio::connection>(io);
        // request D-Bus server name.
        conn->request_name(cryptowipe::serviceName);
        sdbusplus::asio::object_server server(conn);

        cryptowipe::CryptoWipeService service(server, core);

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait(
            [&io](const boost::system::error_code&, int signalNumber) {
                lg2::info("Stopping on signal {SIGNAL}", "SIGNAL",
                          signalNumber);
                io.stop();
            });

        lg2::info("Crypto wipe service is running", "STATE_DIR",
                  config.stateDir.string(), "REDFISH_MESSAGE_ID",
                  std::string("CryptoWipe.1.0.ServiceStarted"));

        io.run();
        /* core's destructor waits for running wipe jobs */
        return 0;
    }
    catch (const std::exception& e)
    {
        lg2::error(e.what(), "REDFISH_MESSAGE_ID",
                   std::string("CryptoWipe.1.0.ServiceException"));

        return 2;
    }
    return 1;
}
