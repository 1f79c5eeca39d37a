#pragma once
#include <cstdint>

namespace usb_power {

constexpr const char* USB_ENUM_ROOT = "SYSTEM\\CurrentControlSet\\Enum\\USB";
constexpr const char* DEVICE_PARAMETERS_KEY = "Device Parameters";

namespace Attributes {
    constexpr const char* FRIENDLY_NAME = "FriendlyName";
    constexpr const char* BUS_REPORTED_DESC = "BusReportedDeviceDesc";
    constexpr const char* DEVICE_DESC = "DeviceDesc";
    constexpr const char* MANUFACTURER = "Mfg";
    constexpr const char* CLASS = "Class";
    constexpr const char* SERVICE = "Service";
    constexpr const char* ENHANCED_POWER_MANAGEMENT = "EnhancedPowerManagementEnabled";
}

constexpr uint32_t EPM_SLEEP_DISABLED = 0;
constexpr uint32_t EPM_SLEEP_ENABLED = 1;

constexpr int REFRESH_INTERVAL = 3000;      // ms
constexpr int ELEVATION_TIMEOUT = 75;       // s
constexpr int PROTOCOL_VERSION = 1;

constexpr const char* ELEVATED_WRITE_OPTION = "elevated-write";
constexpr const char* DEADLINE_OPTION = "deadline";

namespace ExitCodes {
    constexpr int SUCCESS = 0;
    constexpr int PARTIAL_FAILURE = 1;
    constexpr int BAD_REQUEST = 2;
    constexpr int RESPONSE_FAILED = 3;
    constexpr int DEADLINE_PASSED = 4;
}

}
