#pragma once
#include <QObject>
#include <string>
#include <memory>
#include <optional>
#include <utility>
#include <sstream>

namespace usb_power {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

enum class LogDestination {
    Console,
    File,
    All
};

class Logger : public QObject {
    Q_OBJECT

public:
    static Logger& instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    // Configuration
    void setLogLevel(LogLevel level);
    LogLevel logLevel() const;
    void setLogDestination(LogDestination dest);
    void setLogFile(const std::string& filename);
    void setMaxFileSize(size_t bytes);
    void enableTimestamps(bool enable);
    void enableSourceInfo(bool enable);

    // Tag prepended to every line, e.g. "elevated" for the helper process
    // so that both processes can share one log file.
    void setProcessTag(const std::string& tag);

    void debug(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void info(const std::string& message,
              const std::string& source = "",
              const std::string& function = "");
    void warning(const std::string& message,
                 const std::string& source = "",
                 const std::string& function = "");
    void error(const std::string& message,
               const std::string& source = "",
               const std::string& function = "");
    void critical(const std::string& message,
                  const std::string& source = "",
                  const std::string& function = "");

    void flush();

    static LogLevel levelFromVerbosity(int verbosity);

signals:
    void logFileRotated(const std::string& oldFile, const std::string& newFile);

private:
    Logger();
    ~Logger();

    void log(LogLevel level,
             const std::string& message,
             const std::string& source,
             const std::string& function);
    std::string formatLogMessage(LogLevel level,
                                 const std::string& message,
                                 const std::string& source,
                                 const std::string& function) const;
    static const char* levelString(LogLevel level);

    class Private;
    std::unique_ptr<Private> d;
};

#define LOG_DEBUG(msg) \
    ::usb_power::Logger::instance().debug(msg, __FILE__, __FUNCTION__)
#define LOG_INFO(msg) \
    ::usb_power::Logger::instance().info(msg, __FILE__, __FUNCTION__)
#define LOG_WARNING(msg) \
    ::usb_power::Logger::instance().warning(msg, __FILE__, __FUNCTION__)
#define LOG_ERROR(msg) \
    ::usb_power::Logger::instance().error(msg, __FILE__, __FUNCTION__)
#define LOG_CRITICAL(msg) \
    ::usb_power::Logger::instance().critical(msg, __FILE__, __FUNCTION__)

} // namespace usb_power
