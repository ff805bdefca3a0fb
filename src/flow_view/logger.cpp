#include "logger.hpp"

#include <algorithm>
#include <cctype>

std::atomic<LogLevel> Logger::current_level_{LogLevel::ERROR};
bool Logger::show_timestamp_ = false;
std::ostream* Logger::out_ = nullptr;
std::ostream* Logger::err_ = nullptr;
std::mutex Logger::mutex_;

std::optional<LogLevel> Logger::parseLevel(const std::string& text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug" || lower == "0")
        return LogLevel::DEBUG;
    if (lower == "info" || lower == "1")
        return LogLevel::INFO;
    if (lower == "warning" || lower == "warn" || lower == "2")
        return LogLevel::WARNING;
    if (lower == "error" || lower == "3")
        return LogLevel::ERROR;
    if (lower == "none" || lower == "4")
        return LogLevel::NONE;
    return std::nullopt;
}

const char* Logger::levelToString(LogLevel level)
{
    switch (level)
    {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARNING:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

void Logger::log(LogLevel level, const std::string& message, const char* file, int line)
{
    if (!isEnabled(level) || level == LogLevel::NONE)
    {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::ostringstream oss;

    if (show_timestamp_)
    {
        time_t now = time(nullptr);
        struct tm tm_buf;
        localtime_r(&now, &tm_buf);
        char buf[32];
        strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
        oss << "[" << buf << "] ";
    }

    oss << "[" << levelToString(level) << "] ";

    // File and line (for DEBUG/ERROR)
    if ((level == LogLevel::DEBUG || level == LogLevel::ERROR) && file)
    {
        oss << file << ":" << line << " - ";
    }

    oss << message << "\n";

    if (level >= LogLevel::ERROR)
    {
        std::ostream& err = err_ ? *err_ : std::cerr;
        err << oss.str() << std::flush;
    }
    else
    {
        std::ostream& out = out_ ? *out_ : std::cout;
        out << oss.str() << std::flush;
    }
}
