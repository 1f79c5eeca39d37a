#pragma once
#include <QObject>
#include <QStringList>
#include <memory>
#include <string>
#include <variant>
#include <map>

namespace usb_power {

using ConfigValue = std::variant<bool, int, double, std::string>;

namespace ConfigKeys {
    constexpr const char* REFRESH_INTERVAL_MS = "refreshIntervalMs";
    constexpr const char* ELEVATION_TIMEOUT_SEC = "elevationTimeoutSec";
    constexpr const char* DETECT_PRESENCE = "detectPresence";
    constexpr const char* REGISTRY_FILE = "registryFile";
    constexpr const char* ENUMERATION_ROOT = "enumerationRoot";
    constexpr const char* ELEVATION_PROGRAM = "elevationProgram";
    constexpr const char* LOG_LEVEL = "logLevel";
}

class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager();

    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    void resetToDefaults();

    // Candidate config files, most specific first.
    static QStringList defaultLocations();

    // Absolute path of the file to load: explicitPath when given, otherwise
    // the first existing default location. Empty when there is none.
    static QString locateFile(const QString& explicitPath = QString());

signals:
    void configChanged(const std::string& key);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
