#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <atomic>
#include <ctime>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

/**
 * Process-wide logger with levels DEBUG, INFO, WARNING, ERROR
 *
 * Usage:
 *   Logger::setLevel(LogLevel::INFO);
 *   LOG_DEBUG("index repaired for flow " << id);
 *   LOG_INFO("Loaded " << n << " flows from " << path);
 *   LOG_WARNING("update for unknown flow " << id);
 *   LOG_ERROR("pcap_open_offline failed: " << err);
 *
 * Records are written under a mutex so capture threads and the view thread
 * may log concurrently. ERROR goes to the error stream, everything else to
 * the output stream; both default to std::cerr/std::cout and can be swapped
 * with setOutput() (tests capture log lines that way).
 * LOG_DEBUG compiles to nothing under NDEBUG.
 */

enum class LogLevel
{
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4  // Disable all logging
};

class Logger
{
   public:
    static void setLevel(LogLevel level) { current_level_.store(level, std::memory_order_relaxed); }

    static LogLevel getLevel() { return current_level_.load(std::memory_order_relaxed); }

    static void setShowTimestamp(bool show)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        show_timestamp_ = show;
    }

    // Redirect records. Passing nullptr restores the default stream.
    static void setOutput(std::ostream* out, std::ostream* err = nullptr)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out;
        err_ = err;
    }

    static bool isEnabled(LogLevel level) { return level >= getLevel(); }

    // Accepts "debug", "info", "warning"/"warn", "error", "none" or 0..4
    static std::optional<LogLevel> parseLevel(const std::string& text);

    static const char* levelToString(LogLevel level);

    static void log(LogLevel level, const std::string& message, const char* file = nullptr,
                    int line = 0);

   private:
    static std::atomic<LogLevel> current_level_;
    static bool show_timestamp_;
    static std::ostream* out_;
    static std::ostream* err_;
    static std::mutex mutex_;
};

#define LOG_DEBUG(msg)                                                    \
    do                                                                    \
    {                                                                     \
        if (Logger::isEnabled(LogLevel::DEBUG))                           \
        {                                                                 \
            std::ostringstream oss;                                       \
            oss << msg;                                                   \
            Logger::log(LogLevel::DEBUG, oss.str(), __FILE__, __LINE__);  \
        }                                                                 \
    } while (0)

#define LOG_INFO(msg)                                \
    do                                               \
    {                                                \
        if (Logger::isEnabled(LogLevel::INFO))       \
        {                                            \
            std::ostringstream oss;                  \
            oss << msg;                              \
            Logger::log(LogLevel::INFO, oss.str());  \
        }                                            \
    } while (0)

#define LOG_WARNING(msg)                                \
    do                                                  \
    {                                                   \
        if (Logger::isEnabled(LogLevel::WARNING))       \
        {                                               \
            std::ostringstream oss;                     \
            oss << msg;                                 \
            Logger::log(LogLevel::WARNING, oss.str());  \
        }                                               \
    } while (0)

#define LOG_ERROR(msg)                                                    \
    do                                                                    \
    {                                                                     \
        if (Logger::isEnabled(LogLevel::ERROR))                           \
        {                                                                 \
            std::ostringstream oss;                                       \
            oss << msg;                                                   \
            Logger::log(LogLevel::ERROR, oss.str(), __FILE__, __LINE__);  \
        }                                                                 \
    } while (0)

#ifdef NDEBUG
#undef LOG_DEBUG
#define LOG_DEBUG(msg) \
    do                 \
    {                  \
    } while (0)
#endif

#endif  // LOGGER_HPP
