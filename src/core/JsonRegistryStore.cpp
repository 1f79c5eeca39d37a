#include "JsonRegistryStore.hpp"
#include "Logger.hpp"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <cmath>
#include <limits>
#include <mutex>

namespace usb_power {

namespace {

const QString KEYS = QStringLiteral("keys");
const QString VALUES = QStringLiteral("values");
const QString READABLE = QStringLiteral("readable");
const QString WRITABLE = QStringLiteral("writable");

// Returns the actual member name matching name case-insensitively.
QString findMember(const QJsonObject& object, const QString& name) {
    if (object.contains(name)) {
        return name;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (it.key().compare(name, Qt::CaseInsensitive) == 0) {
            return it.key();
        }
    }
    return QString();
}

bool setDwordAt(QJsonObject& node, const std::vector<std::string>& parts, size_t index,
                const QString& name, uint32_t value) {
    if (index == parts.size()) {
        QJsonObject values = node.value(VALUES).toObject();
        QString member = findMember(values, name);
        values[member.isEmpty() ? name : member] = static_cast<double>(value);
        node[VALUES] = values;
        return true;
    }

    QJsonObject keys = node.value(KEYS).toObject();
    QString member = findMember(keys, QString::fromStdString(parts[index]));
    if (member.isEmpty()) {
        return false;
    }

    QJsonObject child = keys.value(member).toObject();
    if (!setDwordAt(child, parts, index + 1, name, value)) {
        return false;
    }
    keys[member] = child;
    node[KEYS] = keys;
    return true;
}

}

class JsonRegistryStore::Private {
public:
    QString filePath;
    QJsonObject memoryImage;
    bool fileBacked{false};
    Access access{Access::User};
    mutable std::mutex mutex;

    struct Lookup {
        QJsonObject node;
        bool found{false};
        bool readable{true};
    };

    QJsonObject load() const {
        if (!fileBacked) {
            return memoryImage;
        }

        QFile file(filePath);
        if (!file.open(QIODevice::ReadOnly)) {
            throw RegistryError(RegistryError::Code::IoError, "",
                                "Cannot open registry image " + filePath.toStdString());
        }

        QJsonParseError parseError{};
        QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        if (doc.isNull() || !doc.isObject()) {
            throw RegistryError(RegistryError::Code::IoError, "",
                                "Malformed registry image " + filePath.toStdString() +
                                " (" + parseError.errorString().toStdString() + ")");
        }
        return doc.object();
    }

    void store(const QJsonObject& root) {
        if (!fileBacked) {
            memoryImage = root;
            return;
        }

        if (!fileWritable()) {
            throw RegistryError(RegistryError::Code::AccessDenied, "",
                                "Registry image " + filePath.toStdString() + " is not writable");
        }

        QSaveFile file(filePath);
        if (!file.open(QIODevice::WriteOnly)) {
            throw RegistryError(RegistryError::Code::IoError, "",
                                "Cannot write registry image " + filePath.toStdString() +
                                ": " + file.errorString().toStdString());
        }
        file.write(QJsonDocument(root).toJson());
        if (!file.commit()) {
            throw RegistryError(RegistryError::Code::IoError, "",
                                "Cannot commit registry image " + filePath.toStdString() +
                                ": " + file.errorString().toStdString());
        }
    }

    // QSaveFile replaces the image through a temporary file beside it, so the
    // directory has to be writable as well.
    bool fileWritable() const {
        if (!fileBacked) {
            return true;
        }
        QFileInfo info(filePath);
        return info.isWritable() && QFileInfo(info.absolutePath()).isWritable();
    }

    bool keyWritable(const Lookup& lookup) const {
        if (!lookup.found || !lookup.readable) {
            return false;
        }
        return access == Access::Administrator || lookup.node.value(WRITABLE).toBool(true);
    }

    Lookup find(const QJsonObject& root, const std::string& path) const {
        Lookup result;
        result.node = root;
        result.readable = root.value(READABLE).toBool(true);

        for (const auto& part : registry_path::split(path)) {
            QJsonObject keys = result.node.value(KEYS).toObject();
            QString member = findMember(keys, QString::fromStdString(part));
            if (member.isEmpty()) {
                return result;
            }
            result.node = keys.value(member).toObject();
            result.readable = result.readable && result.node.value(READABLE).toBool(true);
        }

        result.found = true;
        return result;
    }

    std::optional<QJsonValue> value(const std::string& path, const std::string& name) const {
        QJsonObject root;
        try {
            root = load();
        } catch (const RegistryError& e) {
            LOG_DEBUG(std::string("Registry image unavailable: ") + e.what());
            return std::nullopt;
        }

        Lookup lookup = find(root, path);
        if (!lookup.found || !lookup.readable) {
            return std::nullopt;
        }

        QJsonObject values = lookup.node.value(VALUES).toObject();
        QString member = findMember(values, QString::fromStdString(name));
        if (member.isEmpty()) {
            return std::nullopt;
        }
        return values.value(member);
    }
};

JsonRegistryStore::JsonRegistryStore(const QString& filePath, Access access)
    : d(std::make_unique<Private>()) {
    d->filePath = filePath;
    d->fileBacked = true;
    d->access = access;
}

JsonRegistryStore::JsonRegistryStore(const QJsonObject& image, Access access)
    : d(std::make_unique<Private>()) {
    d->memoryImage = image;
    d->access = access;
}

JsonRegistryStore::~JsonRegistryStore() = default;

std::vector<std::string> JsonRegistryStore::subKeys(const std::string& path) const {
    std::lock_guard<std::mutex> lock(d->mutex);

    Private::Lookup lookup = d->find(d->load(), path);
    if (!lookup.found) {
        throw RegistryError(RegistryError::Code::NotFound, path, "Key not found");
    }
    if (!lookup.readable) {
        throw RegistryError(RegistryError::Code::AccessDenied, path, "Access denied");
    }

    std::vector<std::string> result;
    QJsonObject keys = lookup.node.value(KEYS).toObject();
    for (auto it = keys.begin(); it != keys.end(); ++it) {
        result.push_back(it.key().toStdString());
    }
    return result;
}

std::optional<std::string> JsonRegistryStore::readString(const std::string& path,
                                                         const std::string& name) const {
    std::lock_guard<std::mutex> lock(d->mutex);

    auto value = d->value(path, name);
    if (!value || !value->isString()) {
        return std::nullopt;
    }
    return value->toString().toStdString();
}

std::optional<uint32_t> JsonRegistryStore::readDword(const std::string& path,
                                                     const std::string& name) const {
    std::lock_guard<std::mutex> lock(d->mutex);

    auto value = d->value(path, name);
    if (!value || !value->isDouble()) {
        return std::nullopt;
    }

    double number = value->toDouble();
    if (number < 0 || number > std::numeric_limits<uint32_t>::max() ||
        std::floor(number) != number) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(number);
}

void JsonRegistryStore::writeDword(const std::string& path, const std::string& name, uint32_t value) {
    std::lock_guard<std::mutex> lock(d->mutex);

    QJsonObject root = d->load();
    Private::Lookup lookup = d->find(root, path);
    if (!lookup.found) {
        throw RegistryError(RegistryError::Code::NotFound, path, "Key not found");
    }
    if (!d->keyWritable(lookup)) {
        throw RegistryError(RegistryError::Code::AccessDenied, path, "Access denied");
    }

    if (!setDwordAt(root, registry_path::split(path), 0, QString::fromStdString(name), value)) {
        throw RegistryError(RegistryError::Code::NotFound, path, "Key not found");
    }
    d->store(root);
}

bool JsonRegistryStore::canWrite(const std::string& path) const {
    std::lock_guard<std::mutex> lock(d->mutex);

    try {
        return d->keyWritable(d->find(d->load(), path)) && d->fileWritable();
    } catch (const RegistryError& e) {
        LOG_DEBUG(std::string("Write check failed: ") + e.what());
        return false;
    }
}

QString JsonRegistryStore::filePath() const {
    return d->filePath;
}

} // namespace usb_power
