#include "gatekv/server_config.hpp"

#include <getopt.h>

#include <charconv>
#include <limits>
#include <string_view>

namespace gatekv {

namespace {

template <typename T>
T parse_number(std::string_view text, const char* option, T min, T max) {
    T value{};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size())
        throw ConfigError{std::string{"invalid value for --"} + option + ": '" + std::string{text} + "'"};
    if (value < min || value > max)
        throw ConfigError{std::string{"--"} + option + " out of range: " + std::string{text}};
    return value;
}

} // namespace

ServerConfig ServerConfig::from_args(int argc, char* argv[]) {
    static const option long_options[] = {
        {"host",            required_argument, nullptr, 'H'},
        {"port",            required_argument, nullptr, 'p'},
        {"max-per-address", required_argument, nullptr, 'a'},
        {"max-total",       required_argument, nullptr, 't'},
        {"log-level",       required_argument, nullptr, 'l'},
        {"help",            no_argument,       nullptr, 'h'},
        {nullptr,           0,                 nullptr, 0},
    };

    ServerConfig cfg;

    // getopt keeps global state; 0 forces a full rescan
    optind = 0;
    opterr = 0;

    int ch;
    while ((ch = getopt_long(argc, argv, ":H:p:a:t:l:h", long_options, nullptr)) != -1) {
        switch (ch) {
            case 'H':
                cfg.host = optarg;
                if (cfg.host.empty())
                    throw ConfigError{"--host must not be empty"};
                break;
            case 'p':
                cfg.port = parse_number<uint16_t>(optarg, "port", 0, std::numeric_limits<uint16_t>::max());
                break;
            case 'a':
                cfg.max_per_address = parse_number<size_t>(optarg, "max-per-address", 1, kMaxPerAddressLimit);
                break;
            case 't':
                cfg.max_total = parse_number<size_t>(optarg, "max-total", 1, kMaxTotalLimit);
                break;
            case 'l': {
                auto level = parse_log_level(optarg);
                if (!level)
                    throw ConfigError{std::string{"unknown log level: "} + optarg};
                cfg.log_level = *level;
                break;
            }
            case 'h':
                cfg.show_help = true;
                break;
            case ':':
                throw ConfigError{"missing value for an option"};
            default:
                throw ConfigError{"unknown option"};
        }
    }

    if (optind < argc)
        throw ConfigError{std::string{"unexpected argument: "} + argv[optind]};

    return cfg;
}

std::string ServerConfig::usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  -H, --host ADDR             listen address (default ::1)\n"
           "  -p, --port PORT             listen port (default 8899)\n"
           "  -a, --max-per-address N     connections allowed per client address (default 1)\n"
           "  -t, --max-total N           connections allowed in total, 1..4096 (default 10);\n"
           "                              one worker thread is started per connection slot\n"
           "  -l, --log-level LEVEL       debug|info|warn|error (default info)\n"
           "  -h, --help                  show this message\n";
}

} // namespace gatekv
