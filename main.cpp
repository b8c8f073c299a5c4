#include <utility>
#include <boost/asio.hpp>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

#include "api.hpp"
#include "config.hpp"
#include "lib/dockerClient.hpp"
#include "lib/engineFacade.hpp"
#include "lib/logger.hpp"
#include "lib/progressBroadcaster.hpp"
#include "server.hpp"

using namespace Retagger;

int main() {
    try {
        const auto config = Config::fromEnvironment();
        Logger::getInstance().setLevel(config.logLevel);
        logMessage(boost::format("Engine %s, default target domain %s") % config.engineHost % config.defaultTargetDomain,
                   "main", LogLevel::INFO);

        // Outlives the io_context: sessions destroyed with pending handlers still unsubscribe
        ProgressBroadcaster broadcaster;
        net::io_context ioc;
        EngineFacade engine(dockerClientFactory(config.engineHost), ioc, config.engineWorkers);
        Api api(engine, broadcaster, config);

        auto server = std::make_shared<Server>(ioc, tcp::endpoint{net::ip::make_address(config.host), config.port},
                                               api, broadcaster, config.keepAlive);
        server->start();

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&ioc, server](const boost::system::error_code& ec, int signal) {
            if (ec) {
                return;
            }
            logMessage("Stopping on signal " + std::to_string(signal), "main", LogLevel::INFO);
            server->stop();
            ioc.stop();
        });

        ioc.run();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Unhandled exception: " << e.what() << std::endl;
        return 1;
    }
}
