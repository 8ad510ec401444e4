#pragma once

#include "gatekv/logger.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace gatekv {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Startup settings; nothing here changes once the server is built.
struct ServerConfig {
    std::string host{"::1"};
    uint16_t port{8899};           // 0 picks an ephemeral port
    size_t max_per_address{1};
    size_t max_total{10};
    LogLevel log_level{LogLevel::INFO};
    bool show_help{false};

    // The server keeps one worker thread per admission slot
    static constexpr size_t kMaxTotalLimit = 4096;
    static constexpr size_t kMaxPerAddressLimit = 65536;

    // --host, --port, --max-per-address, --max-total, --log-level, --help
    // Throws ConfigError on unknown options or invalid values.
    static ServerConfig from_args(int argc, char* argv[]);

    static std::string usage(const std::string& program);
};

} // namespace gatekv
