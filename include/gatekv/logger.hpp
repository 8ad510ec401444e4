#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace gatekv {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

// Parses "debug", "INFO", ... ; nullopt for anything else
std::optional<LogLevel> parse_log_level(std::string_view text);
const char* to_string(LogLevel level) noexcept;

/*
 * Process-wide logger. Lines from concurrent handlers are serialized
 * so they never interleave on stderr.
 */
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) noexcept;
    LogLevel level() const noexcept;
    bool enabled(LogLevel level) const noexcept;

    void log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::mutex mutex_;
};

// Collects one line, hands it to the logger on destruction:
//   GATEKV_LOG_INFO << "accepted " << peer;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::instance().log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::ostringstream ss_;
};

} // namespace gatekv

#define GATEKV_LOG(lvl) \
    if (!::gatekv::Logger::instance().enabled(lvl)) {} \
    else ::gatekv::LogStream(lvl, __FILE__, __LINE__)

#define GATEKV_LOG_DEBUG GATEKV_LOG(::gatekv::LogLevel::DEBUG)
#define GATEKV_LOG_INFO  GATEKV_LOG(::gatekv::LogLevel::INFO)
#define GATEKV_LOG_WARN  GATEKV_LOG(::gatekv::LogLevel::WARN)
#define GATEKV_LOG_ERROR GATEKV_LOG(::gatekv::LogLevel::ERROR)
