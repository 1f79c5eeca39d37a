#include "ConfigManager.hpp"
#include "../core/Logger.hpp"
#include <usb-power/Constants.hpp>
#include <usb-power/Types.hpp>
#include <QDir>
#include <QFileInfo>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <cmath>

namespace usb_power {

class ConfigManager::Private {
public:
    std::map<std::string, ConfigValue> settings;

    QJsonValue toJsonValue(const ConfigValue& value) const {
        return std::visit(overloaded{
            [](bool b) -> QJsonValue { return b; },
            [](int i) -> QJsonValue { return i; },
            [](double d) -> QJsonValue { return d; },
            [](const std::string& s) -> QJsonValue { return QString::fromStdString(s); }
        }, value);
    }

    std::optional<ConfigValue> fromJsonValue(const QJsonValue& json) const {
        switch (json.type()) {
            case QJsonValue::Bool:
                return ConfigValue{json.toBool()};
            case QJsonValue::Double: {
                double number = json.toDouble();
                if (std::floor(number) == number && std::fabs(number) <= 2147483647.0) {
                    return ConfigValue{static_cast<int>(number)};
                }
                return ConfigValue{number};
            }
            case QJsonValue::String:
                return ConfigValue{json.toString().toStdString()};
            default:
                return std::nullopt;
        }
    }

    void setDefaults() {
        settings = {
            {ConfigKeys::REFRESH_INTERVAL_MS, REFRESH_INTERVAL},
            {ConfigKeys::ELEVATION_TIMEOUT_SEC, ELEVATION_TIMEOUT},
            {ConfigKeys::DETECT_PRESENCE, true},
            {ConfigKeys::REGISTRY_FILE, std::string()},
            {ConfigKeys::ENUMERATION_ROOT, std::string(USB_ENUM_ROOT)},
            {ConfigKeys::ELEVATION_PROGRAM, std::string("pkexec")},
            {ConfigKeys::LOG_LEVEL, 1}
        };
    }

    template<typename T>
    std::optional<T> get(const std::string& key) const {
        auto it = settings.find(key);
        if (it != settings.end() && std::holds_alternative<T>(it->second)) {
            return std::get<T>(it->second);
        }
        return std::nullopt;
    }
};

ConfigManager::ConfigManager(QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->setDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    return d->get<bool>(key).value_or(defaultValue);
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    return d->get<int>(key).value_or(defaultValue);
}

double ConfigManager::getDouble(const std::string& key, double defaultValue) const {
    if (auto value = d->get<double>(key)) {
        return *value;
    }
    // Whole numbers load as int
    if (auto value = d->get<int>(key)) {
        return *value;
    }
    return defaultValue;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    return d->get<std::string>(key).value_or(defaultValue);
}

void ConfigManager::setInt(const std::string& key, int value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setDouble(const std::string& key, double value) {
    d->settings[key] = value;
    emit configChanged(key);
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    d->settings[key] = value;
    emit configChanged(key);
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::ReadOnly)) {
        return false;
    }

    QJsonDocument doc = QJsonDocument::fromJson(file.readAll());
    if (doc.isNull() || !doc.isObject()) {
        return false;
    }

    QJsonObject root = doc.object();
    for (auto it = root.begin(); it != root.end(); ++it) {
        std::string key = it.key().toStdString();
        auto value = d->fromJsonValue(it.value());
        if (!value) {
            LOG_WARNING("Ignoring unsupported config value for " + key);
            continue;
        }
        d->settings[key] = *value;
        emit configChanged(key);
    }

    return true;
}

bool ConfigManager::saveToFile(const std::string& filename) const {
    QJsonObject root;
    for (const auto& [key, value] : d->settings) {
        root[QString::fromStdString(key)] = d->toJsonValue(value);
    }

    QFile file(QString::fromStdString(filename));
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

void ConfigManager::resetToDefaults() {
    d->setDefaults();

    for (const auto& [key, _] : d->settings) {
        emit configChanged(key);
    }
}

QStringList ConfigManager::defaultLocations() {
    return {
        QDir::currentPath() + "/config.json",
        QDir::homePath() + "/.config/usb-power/config.json",
#ifndef Q_OS_WIN
        "/etc/usb-power/config.json"
#endif
    };
}

QString ConfigManager::locateFile(const QString& explicitPath) {
    if (!explicitPath.isEmpty()) {
        return QFileInfo(explicitPath).absoluteFilePath();
    }
    for (const auto& path : defaultLocations()) {
        if (QFileInfo::exists(path)) {
            return QFileInfo(path).absoluteFilePath();
        }
    }
    return QString();
}

}
