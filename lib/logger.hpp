#ifndef RETAGGER_LOGGER_HPP
#define RETAGGER_LOGGER_HPP

#include <iostream>
#include <mutex>
#include <string>

#include <boost/format.hpp>

namespace Retagger {
    enum class LogLevel {DEBUG, INFO, WARN, ERROR};

    LogLevel parseLogLevel(const std::string& name);

    class Logger {
    public:
        static Logger& getInstance();

        void log(const std::string& message, const std::string& subsystem, LogLevel level,
                 std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);
        void log(const boost::format& message, const std::string& subsystem, LogLevel level,
                 std::ostream& outStream = std::cout, std::ostream& errStream = std::cerr);

        void setLevel(LogLevel level);
        LogLevel getLevel() const;

    private:
        Logger() = default;
        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        static std::string timestamp();
        static const char* levelTag(LogLevel level);

        LogLevel level_ = LogLevel::INFO;
        mutable std::mutex mutex_;
    };

    inline void logMessage(const std::string& message, const std::string& subsystem, LogLevel level) {
        Logger::getInstance().log(message, subsystem, level);
    }

    inline void logMessage(const boost::format& message, const std::string& subsystem, LogLevel level) {
        Logger::getInstance().log(message, subsystem, level);
    }
}

#endif // RETAGGER_LOGGER_HPP
