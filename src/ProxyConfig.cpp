#include "ProxyConfig.hpp"
#include "StringUtils.hpp"

#include <cstring>
#include <stdexcept>

namespace {

bool parseSeconds(const char* text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != std::strlen(text) || value < 0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

bool parseArguments(int argc, char* argv[], ProxyConfig& config, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            config.show_help = true;
            continue;
        }
        if (strcmp(arg, "-q") == 0 || strcmp(arg, "--quiet") == 0) {
            config.console_echo = false;
            continue;
        }

        // Every remaining option takes a value
        bool known = strcmp(arg, "-b") == 0 || strcmp(arg, "--bind") == 0 ||
                     strcmp(arg, "-p") == 0 || strcmp(arg, "--port") == 0 ||
                     strcmp(arg, "--connect-timeout") == 0 ||
                     strcmp(arg, "--read-timeout") == 0 ||
                     strcmp(arg, "--idle-timeout") == 0 ||
                     strcmp(arg, "--log-file") == 0;
        if (!known) {
            error = std::string("Unknown option: ") + arg;
            return false;
        }
        if (i + 1 >= argc) {
            error = std::string("Missing value for ") + arg;
            return false;
        }
        const char* value = argv[++i];

        if (strcmp(arg, "-b") == 0 || strcmp(arg, "--bind") == 0) {
            if (*value == '\0') {
                error = "Bind address must not be empty";
                return false;
            }
            config.bind_address = value;
        } else if (strcmp(arg, "-p") == 0 || strcmp(arg, "--port") == 0) {
            // Port 0 asks the kernel for an ephemeral port
            int port = strcmp(value, "0") == 0 ? 0 : utils::parsePort(value);
            if (port < 0) {
                error = std::string("Invalid port number: ") + value;
                return false;
            }
            config.port = port;
        } else if (strcmp(arg, "--log-file") == 0) {
            config.log_file = value;
        } else {
            int seconds = 0;
            if (!parseSeconds(value, seconds)) {
                error = std::string("Invalid timeout for ") + arg + ": " + value;
                return false;
            }
            if (strcmp(arg, "--connect-timeout") == 0) {
                config.connect_timeout = seconds;
            } else if (strcmp(arg, "--read-timeout") == 0) {
                config.read_timeout = seconds;
            } else {
                config.idle_timeout = seconds;
            }
        }
    }
    return true;
}

std::string usage(const std::string& program) {
    return "Usage:\n"
           "  " + program + " [options]\n"
           "\n"
           "Options:\n"
           "  -b, --bind <addr>          Address to listen on (default 127.0.0.1)\n"
           "  -p, --port <port>          Port to listen on (default 9999)\n"
           "      --connect-timeout <s>  Origin connect timeout, 0 = none (default 10)\n"
           "      --read-timeout <s>     Request line read timeout, 0 = none (default 30)\n"
           "      --idle-timeout <s>     Relay idle timeout, 0 = none (default 300)\n"
           "      --log-file <path>      Log file, empty to disable (default logs/log.txt)\n"
           "  -q, --quiet                Do not echo log lines to the console\n"
           "  -h, --help                 Show this help\n";
}
