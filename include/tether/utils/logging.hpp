#ifndef TETHER_UTILS_LOGGING_HPP
#define TETHER_UTILS_LOGGING_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace tether {
namespace utils {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    OFF = 4
};

const char* toString(LogLevel level);
std::optional<LogLevel> logLevelFromString(const std::string& name);

/**
 * @brief Process-wide logger used by the TLOG_* macros.
 *
 * Lines are formatted as "[YYYY-MM-DD HH:MM:SS] [LEVEL] message" and handed to
 * the sink, which writes to std::clog unless replaced.
 */
class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string& line)>;

    static Logger& instance();

    void setLevel(LogLevel level);
    LogLevel level() const;
    bool enabled(LogLevel level) const;

    /**
     * @brief Replace the output sink. Passing an empty function restores std::clog.
     */
    void setSink(Sink sink);

    void log(LogLevel level, const std::string& message);

private:
    Logger() = default;

    mutable std::mutex mutex_;
    LogLevel level_{LogLevel::INFO};
    Sink sink_;
};

} // namespace utils
} // namespace tether

#define TLOG(level, message)                                                  \
    do {                                                                      \
        auto& tlogLogger_ = ::tether::utils::Logger::instance();              \
        if (tlogLogger_.enabled(level)) {                                     \
            std::ostringstream tlogStream_;                                   \
            tlogStream_ << message;                                           \
            tlogLogger_.log(level, tlogStream_.str());                        \
        }                                                                     \
    } while (false)

#define TLOG_DEBUG(message) TLOG(::tether::utils::LogLevel::DEBUG, message)
#define TLOG_INFO(message)  TLOG(::tether::utils::LogLevel::INFO, message)
#define TLOG_WARN(message)  TLOG(::tether::utils::LogLevel::WARNING, message)
#define TLOG_ERROR(message) TLOG(::tether::utils::LogLevel::ERROR, message)

#endif // TETHER_UTILS_LOGGING_HPP
