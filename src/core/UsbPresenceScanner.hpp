#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

struct libusb_context;

namespace usb_power {

struct UsbHardwareId {
    uint16_t vendorId;
    uint16_t productId;

    bool operator==(const UsbHardwareId& other) const {
        return vendorId == other.vendorId && productId == other.productId;
    }
    bool operator<(const UsbHardwareId& other) const {
        return vendorId != other.vendorId ? vendorId < other.vendorId
                                          : productId < other.productId;
    }
};

// Extracts the VID_xxxx&PID_xxxx component of an enumeration path.
std::optional<UsbHardwareId> parseHardwareId(const std::string& registryPath);

// Lists the vendor/product ids of currently attached USB devices.
class UsbPresenceScanner {
public:
    UsbPresenceScanner();
    ~UsbPresenceScanner();

    UsbPresenceScanner(const UsbPresenceScanner&) = delete;
    UsbPresenceScanner& operator=(const UsbPresenceScanner&) = delete;

    bool isAvailable() const;

    // Empty when libusb could not be initialised or listing failed.
    std::optional<std::set<UsbHardwareId>> attachedDevices() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
