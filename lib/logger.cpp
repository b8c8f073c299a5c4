#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>

namespace Retagger {
    LogLevel parseLogLevel(const std::string& name) {
        const auto lowered = boost::algorithm::to_lower_copy(name);
        if (lowered == "debug") return LogLevel::DEBUG;
        if (lowered == "info") return LogLevel::INFO;
        if (lowered == "warn" || lowered == "warning") return LogLevel::WARN;
        if (lowered == "error") return LogLevel::ERROR;
        throw std::invalid_argument("Unknown log level: " + name);
    }

    Logger& Logger::getInstance() {
        static Logger logger;
        return logger;
    }

    void Logger::log(const std::string& message, const std::string& subsystem, LogLevel level,
                     std::ostream& outStream, std::ostream& errStream) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) {
            return;
        }

        auto line = timestamp() + " [" + subsystem + "] " + levelTag(level) + message;

        // WARN and ERROR go to stderr
        if (level == LogLevel::WARN || level == LogLevel::ERROR) {
            errStream << line << std::endl;
        } else {
            outStream << line << std::endl;
        }
    }

    void Logger::log(const boost::format& message, const std::string& subsystem, LogLevel level,
                     std::ostream& outStream, std::ostream& errStream) {
        log(message.str(), subsystem, level, outStream, errStream);
    }

    void Logger::setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
    }

    LogLevel Logger::getLevel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level_;
    }

    std::string Logger::timestamp() {
        const auto now = std::chrono::system_clock::now();
        const auto seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
        return (boost::format("[%s.%03dZ]") % buffer % millis).str();
    }

    const char* Logger::levelTag(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "[DEBUG] ";
            case LogLevel::INFO:  return "[INFO] ";
            case LogLevel::WARN:  return "[WARN] ";
            case LogLevel::ERROR: return "[ERROR] ";
        }
        return "";
    }
}
