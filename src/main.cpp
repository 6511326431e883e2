#include <exception>
#include <iostream>

#include <boost/system/system_error.hpp>

#include "../include/config/ServerConfig.hpp"
#include "../include/server/IntegrationServer.hpp"
#include "../include/service/RequestHandler.hpp"

int main(int argc, char* argv[]) {
    config::ServerConfig server_config;
    try {
        server_config = config::parse_server_config(argc, argv);
    } catch (const config::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    if (server_config.help_requested) {
        std::cout << server_config.usage << std::endl;
        return 0;
    }

    const service::RequestHandler handler;
    server::IntegrationServer integration_server(server_config, handler);

    try {
        integration_server.run();
    } catch (const boost::system::system_error& e) {
        std::cerr << "Server failed: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
