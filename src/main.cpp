#include <iostream>
#include <csignal>
#include <string>

#include "HTTPProxyServer.hpp"
#include "Logger.hpp"
#include "ProxyConfig.hpp"


int main(int argc, char* argv[]) {
    ProxyConfig config;
    std::string error;
    if (!parseArguments(argc, argv, config, error)) {
        std::cerr << error << "\n" << usage(argv[0]);
        return 1;
    }
    if (config.show_help) {
        std::cout << usage(argv[0]);
        return 0;
    }

    // A peer that vanishes mid-relay must not kill the process
    std::signal(SIGPIPE, SIG_IGN);

    Logger::configure(config.log_file, config.console_echo);

    HTTPProxyServer server(config);
    if (!server.start()) {
        return 1;
    }

    return 0;
}
