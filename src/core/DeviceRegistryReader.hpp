#pragma once
#include "Device.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace usb_power {

class RegistryStore;
class UsbPresenceScanner;

// The enumeration root itself could not be read; the whole pass is lost.
class EnumerationUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DeviceRegistryReader {
public:
    explicit DeviceRegistryReader(const RegistryStore& store,
                                  std::string enumerationRoot = {});

    // Optional; entries get connected = unknown without a scanner.
    void setPresenceScanner(const UsbPresenceScanner* scanner);

    const std::string& enumerationRoot() const { return m_root; }

    // Sorted by friendly name, then path. Throws EnumerationUnavailable.
    std::vector<Device> enumerate() const;

    // Forced read of the power attribute for write verification.
    std::optional<uint32_t> readPowerValue(const std::string& registryPath) const;

    static std::string cleanRegistryText(const std::string& value);

private:
    void collectParameterKeys(const std::string& path, std::vector<std::string>& out) const;
    std::string readText(const std::string& path, const char* name) const;
    std::string resolveName(const std::string& parentPath, const std::string& registryPath) const;
    std::string resolveType(const std::string& parentPath) const;

    const RegistryStore& m_store;
    std::string m_root;
    const UsbPresenceScanner* m_scanner{nullptr};
};

}
