#include "UsbPresenceScanner.hpp"
#include "Logger.hpp"
#include <libusb-1.0/libusb.h>
#include <mutex>
#include <regex>

namespace usb_power {

std::optional<UsbHardwareId> parseHardwareId(const std::string& registryPath) {
    static const std::regex pattern("VID_([0-9A-F]{4})&PID_([0-9A-F]{4})", std::regex::icase);

    std::smatch match;
    if (!std::regex_search(registryPath, match, pattern)) {
        return std::nullopt;
    }

    UsbHardwareId id{};
    id.vendorId = static_cast<uint16_t>(std::stoul(match[1].str(), nullptr, 16));
    id.productId = static_cast<uint16_t>(std::stoul(match[2].str(), nullptr, 16));
    return id;
}

class UsbPresenceScanner::Private {
public:
    libusb_context* context{nullptr};
    // libusb_get_device_list is not safe to call concurrently on one context
    mutable std::mutex listMutex;
};

UsbPresenceScanner::UsbPresenceScanner()
    : d(std::make_unique<Private>()) {
    int ret = libusb_init(&d->context);
    if (ret != LIBUSB_SUCCESS) {
        LOG_WARNING("Failed to initialize libusb, presence detection disabled: " +
                    std::string(libusb_error_name(ret)));
        d->context = nullptr;
    }
}

UsbPresenceScanner::~UsbPresenceScanner() {
    if (d->context) {
        libusb_exit(d->context);
        d->context = nullptr;
    }
}

bool UsbPresenceScanner::isAvailable() const {
    return d->context != nullptr;
}

std::optional<std::set<UsbHardwareId>> UsbPresenceScanner::attachedDevices() const {
    if (!d->context) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(d->listMutex);

    libusb_device** list;
    ssize_t count = libusb_get_device_list(d->context, &list);
    if (count < 0) {
        LOG_WARNING("Failed to get USB device list: " +
                    std::string(libusb_error_name(static_cast<int>(count))));
        return std::nullopt;
    }

    std::set<UsbHardwareId> result;
    for (ssize_t i = 0; i < count; i++) {
        libusb_device_descriptor desc;
        if (libusb_get_device_descriptor(list[i], &desc) != LIBUSB_SUCCESS) {
            continue;
        }
        result.insert(UsbHardwareId{desc.idVendor, desc.idProduct});
    }

    libusb_free_device_list(list, 1);
    return result;
}

} // namespace usb_power
