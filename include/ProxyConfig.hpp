#ifndef PROXY_CONFIG_HPP
#define PROXY_CONFIG_HPP

#include <string>

/**
 * ProxyConfig - Runtime settings of the proxy
 *
 * All timeouts are in seconds; 0 disables the timeout.
 */
struct ProxyConfig {
    std::string bind_address = "127.0.0.1";
    int port = 9999;

    int connect_timeout = 10;   // Dialing the origin
    int read_timeout = 30;      // Waiting for the client's request line
    int idle_timeout = 300;     // Relay with no traffic in either direction

    std::string log_file = "logs/log.txt";
    bool console_echo = true;

    bool show_help = false;
};

/**
 * Fill a ProxyConfig from command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument vector (argv[0] is the program name)
 * @param config Output configuration, starting from its defaults
 * @param error Output message when parsing fails
 * @return true on success, false on invalid arguments
 */
bool parseArguments(int argc, char* argv[], ProxyConfig& config, std::string& error);

/**
 * Usage text for the command line
 */
std::string usage(const std::string& program);

#endif // PROXY_CONFIG_HPP
