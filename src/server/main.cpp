#include "tcp_server.hpp"
#include "gatekv/logger.hpp"
#include "gatekv/server_config.hpp"

#include <exception>
#include <iostream>


/*
 * Entry point for gatekvd.
 * parse CLI args
 * start server
 * block until SIGINT / SIGTERM
 */

int main(int argc, char* argv[]) {
    gatekv::ServerConfig config;
    try {
        config = gatekv::ServerConfig::from_args(argc, argv);
    } catch (const gatekv::ConfigError& e) {
        std::cerr << "gatekvd: " << e.what() << "\n"
                  << gatekv::ServerConfig::usage(argv[0]);
        return 2;
    }

    if (config.show_help) {
        std::cout << gatekv::ServerConfig::usage(argv[0]);
        return 0;
    }

    gatekv::Logger::instance().set_level(config.log_level);

    try {
        gatekv::TcpServer server{config};
        server.start();
        server.install_signal_handlers();
        server.serve();
    } catch (const std::exception& e) {
        GATEKV_LOG_ERROR << "Fatal: " << e.what();
        return 1;
    }
    return 0;
}
