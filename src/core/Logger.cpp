#include "Logger.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace usb_power {

class Logger::Private {
public:
    LogLevel currentLevel{LogLevel::Info};
    LogDestination destination{LogDestination::Console};
    std::string logFile;
    std::string processTag;
    size_t maxFileSize{10 * 1024 * 1024}; // 10MB default
    bool includeTimestamps{true};
    bool includeSourceInfo{false};

    mutable std::mutex logMutex;
    std::unique_ptr<std::ofstream> fileStream;

    void openLogFile() {
        if (!logFile.empty()) {
            fileStream = std::make_unique<std::ofstream>(logFile, std::ios::app);
        }
    }

    void closeLogFile() {
        if (fileStream) {
            fileStream->close();
            fileStream.reset();
        }
    }

    // stdout belongs to the console front-end's device table.
    void writeToConsole(const std::string& formattedMessage) {
        std::cerr << formattedMessage << std::endl;
    }

    void writeToFile(const std::string& formattedMessage) {
        if (!fileStream || !fileStream->is_open()) {
            openLogFile();
        }

        if (fileStream && fileStream->is_open()) {
            (*fileStream) << formattedMessage << std::endl;
            fileStream->flush();
        }
    }

    bool shouldRotateLogFile() const {
        std::error_code ec;
        if (logFile.empty() || !std::filesystem::exists(logFile, ec)) {
            return false;
        }
        auto fileSize = std::filesystem::file_size(logFile, ec);
        return !ec && fileSize >= maxFileSize;
    }

    // Returns the old and new file names when the file was moved aside.
    std::optional<std::pair<std::string, std::string>> rotateLogFile() {
        closeLogFile();

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&time), "%Y%m%d_%H%M%S");

        std::string oldFile = logFile;
        std::string newFile = oldFile + "." + ss.str();

        std::error_code ec;
        std::filesystem::rename(oldFile, newFile, ec);
        openLogFile();

        if (ec) {
            // The other process may have rotated the shared file already.
            std::cerr << "Failed to rotate log file: " << ec.message() << std::endl;
            return std::nullopt;
        }
        return std::make_pair(oldFile, newFile);
    }
};

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : d(std::make_unique<Private>()) {
}

Logger::~Logger() = default;

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->currentLevel = level;
}

LogLevel Logger::logLevel() const {
    std::lock_guard<std::mutex> lock(d->logMutex);
    return d->currentLevel;
}

void Logger::setLogDestination(LogDestination dest) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->destination = dest;
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->closeLogFile();
    d->logFile = filename;
    d->openLogFile();
}

void Logger::setMaxFileSize(size_t bytes) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->maxFileSize = bytes;
}

void Logger::enableTimestamps(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeTimestamps = enable;
}

void Logger::enableSourceInfo(bool enable) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->includeSourceInfo = enable;
}

void Logger::setProcessTag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(d->logMutex);
    d->processTag = tag;
}

void Logger::debug(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Debug, message, source, function);
}

void Logger::info(const std::string& message,
                  const std::string& source,
                  const std::string& function) {
    log(LogLevel::Info, message, source, function);
}

void Logger::warning(const std::string& message,
                     const std::string& source,
                     const std::string& function) {
    log(LogLevel::Warning, message, source, function);
}

void Logger::error(const std::string& message,
                   const std::string& source,
                   const std::string& function) {
    log(LogLevel::Error, message, source, function);
}

void Logger::critical(const std::string& message,
                      const std::string& source,
                      const std::string& function) {
    log(LogLevel::Critical, message, source, function);
}

void Logger::log(LogLevel level,
                 const std::string& message,
                 const std::string& source,
                 const std::string& function) {
    std::optional<std::pair<std::string, std::string>> rotated;
    {
        std::lock_guard<std::mutex> lock(d->logMutex);

        if (level < d->currentLevel) {
            return;
        }

        std::string formattedMessage = formatLogMessage(level, message, source, function);

        if (d->destination == LogDestination::Console ||
            d->destination == LogDestination::All) {
            d->writeToConsole(formattedMessage);
        }

        if (d->destination == LogDestination::File ||
            d->destination == LogDestination::All) {
            if (d->shouldRotateLogFile()) {
                rotated = d->rotateLogFile();
            }
            d->writeToFile(formattedMessage);
        }
    }

    // Emitted outside the lock; receivers may log themselves.
    if (rotated) {
        emit logFileRotated(rotated->first, rotated->second);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(d->logMutex);
    if (d->fileStream) {
        d->fileStream->flush();
    }
}

LogLevel Logger::levelFromVerbosity(int verbosity) {
    switch (verbosity) {
        case 0: return LogLevel::Debug;
        case 1: return LogLevel::Info;
        case 2: return LogLevel::Warning;
        case 3: return LogLevel::Error;
        case 4: return LogLevel::Critical;
        default: return LogLevel::Info;
    }
}

std::string Logger::formatLogMessage(LogLevel level,
                                     const std::string& message,
                                     const std::string& source,
                                     const std::string& function) const {
    std::stringstream ss;

    if (d->includeTimestamps) {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        ss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << " ";
    }

    if (!d->processTag.empty()) {
        ss << "(" << d->processTag << ") ";
    }

    ss << "[" << levelString(level) << "] ";

    if (d->includeSourceInfo && !source.empty()) {
        ss << std::filesystem::path(source).filename().string();
        if (!function.empty()) {
            ss << ":" << function;
        }
        ss << " - ";
    }

    ss << message;
    return ss.str();
}

const char* Logger::levelString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

} // namespace usb_power
