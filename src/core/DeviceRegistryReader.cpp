#include "DeviceRegistryReader.hpp"
#include "Logger.hpp"
#include "RegistryStore.hpp"
#include "UsbPresenceScanner.hpp"
#include <usb-power/Constants.hpp>
#include <QString>
#include <algorithm>
#include <set>

namespace usb_power {

namespace {

struct Entry {
    std::string registryPath;
    DeviceAttributes attributes;
    std::optional<uint32_t> powerValue;
};

bool lessIgnoreCase(const std::string& a, const std::string& b) {
    return QString::fromStdString(a).compare(QString::fromStdString(b), Qt::CaseInsensitive) < 0;
}

}

DeviceRegistryReader::DeviceRegistryReader(const RegistryStore& store, std::string enumerationRoot)
    : m_store(store)
    , m_root(enumerationRoot.empty() ? USB_ENUM_ROOT : std::move(enumerationRoot)) {
}

void DeviceRegistryReader::setPresenceScanner(const UsbPresenceScanner* scanner) {
    m_scanner = scanner;
}

std::string DeviceRegistryReader::cleanRegistryText(const std::string& value) {
    QString text = QString::fromStdString(value).trimmed();
    if (text.isEmpty()) {
        return {};
    }

    // "@usb.inf,%usb.devicedesc%;USB Composite Device"
    int separator = text.indexOf(QLatin1Char(';'));
    if (separator >= 0) {
        QString tail = text.mid(separator + 1).trimmed();
        if (!tail.isEmpty()) {
            return tail.toStdString();
        }
    }

    while (text.startsWith(QLatin1Char('@'))) {
        text.remove(0, 1);
    }
    return text.trimmed().toStdString();
}

std::vector<Device> DeviceRegistryReader::enumerate() const {
    std::vector<std::string> rootChildren;
    try {
        rootChildren = m_store.subKeys(m_root);
    } catch (const RegistryError& e) {
        throw EnumerationUnavailable(std::string("Cannot read device enumeration root: ") + e.what());
    }

    std::vector<std::string> parameterKeys;
    for (const auto& child : rootChildren) {
        std::string childPath = registry_path::join(m_root, child);
        if (registry_path::equalsIgnoreCase(child, DEVICE_PARAMETERS_KEY)) {
            parameterKeys.push_back(childPath);
            continue;
        }
        collectParameterKeys(childPath, parameterKeys);
    }

    std::optional<std::set<UsbHardwareId>> attached;
    if (m_scanner) {
        attached = m_scanner->attachedDevices();
    }

    std::vector<Entry> entries;
    entries.reserve(parameterKeys.size());
    for (const auto& keyPath : parameterKeys) {
        std::string parentPath = registry_path::parent(keyPath);

        Entry entry;
        entry.registryPath = keyPath;
        entry.attributes.friendlyName = resolveName(parentPath, keyPath);
        entry.attributes.manufacturer = readText(parentPath, Attributes::MANUFACTURER);
        entry.attributes.deviceType = resolveType(parentPath);
        entry.powerValue = m_store.readDword(keyPath, Attributes::ENHANCED_POWER_MANAGEMENT);

        if (attached) {
            auto id = parseHardwareId(keyPath);
            entry.attributes.connected = id && attached->count(*id) > 0;
        }
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (lessIgnoreCase(a.attributes.friendlyName, b.attributes.friendlyName)) return true;
        if (lessIgnoreCase(b.attributes.friendlyName, a.attributes.friendlyName)) return false;
        return lessIgnoreCase(a.registryPath, b.registryPath);
    });

    std::vector<Device> devices;
    devices.reserve(entries.size());
    for (auto& entry : entries) {
        devices.emplace_back(std::move(entry.registryPath), std::move(entry.attributes), entry.powerValue);
    }

    LOG_DEBUG("Enumerated " + std::to_string(devices.size()) + " device parameter entries");
    return devices;
}

std::optional<uint32_t> DeviceRegistryReader::readPowerValue(const std::string& registryPath) const {
    return m_store.readDword(registryPath, Attributes::ENHANCED_POWER_MANAGEMENT);
}

void DeviceRegistryReader::collectParameterKeys(const std::string& path,
                                                std::vector<std::string>& out) const {
    std::vector<std::string> children;
    try {
        children = m_store.subKeys(path);
    } catch (const RegistryError& e) {
        // Unreadable subtree: skip it, keep the rest of the pass
        LOG_DEBUG(std::string("Skipping ") + e.what());
        return;
    }

    for (const auto& child : children) {
        std::string childPath = registry_path::join(path, child);
        if (registry_path::equalsIgnoreCase(child, DEVICE_PARAMETERS_KEY)) {
            out.push_back(childPath);
            continue;
        }
        collectParameterKeys(childPath, out);
    }
}

std::string DeviceRegistryReader::readText(const std::string& path, const char* name) const {
    auto value = m_store.readString(path, name);
    return value ? cleanRegistryText(*value) : std::string();
}

std::string DeviceRegistryReader::resolveName(const std::string& parentPath,
                                              const std::string& registryPath) const {
    for (const char* attribute : {Attributes::FRIENDLY_NAME,
                                  Attributes::BUS_REPORTED_DESC,
                                  Attributes::DEVICE_DESC}) {
        std::string text = readText(parentPath, attribute);
        if (!text.empty()) {
            return text;
        }
    }
    return registryPath;
}

std::string DeviceRegistryReader::resolveType(const std::string& parentPath) const {
    std::string type = readText(parentPath, Attributes::CLASS);
    if (!type.empty()) {
        return type;
    }
    type = readText(parentPath, Attributes::SERVICE);
    if (!type.empty()) {
        return type;
    }
    return "Unknown";
}

} // namespace usb_power
