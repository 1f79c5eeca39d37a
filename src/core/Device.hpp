#pragma once
#include <usb-power/Types.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace usb_power {

struct DeviceAttributes {
    std::string friendlyName;
    std::string manufacturer;
    std::string deviceType;
    std::optional<bool> connected;
};

// One USB device configuration entry. The sleep state only ever comes from a
// read of EnhancedPowerManagementEnabled; write outcomes never change it.
class Device {
public:
    Device(std::string registryPath, DeviceAttributes attributes, std::optional<uint32_t> powerValue);

    const std::string& registryPath() const { return m_registryPath; }
    const std::string& friendlyName() const { return m_attributes.friendlyName; }
    const std::string& manufacturer() const { return m_attributes.manufacturer; }
    const std::string& deviceType() const { return m_attributes.deviceType; }
    std::optional<bool> connected() const { return m_attributes.connected; }

    SleepState sleepState() const;
    std::optional<uint32_t> powerValue() const { return m_powerValue; }
    const WriteOutcome& lastWriteOutcome() const { return m_outcome; }

    bool canToggle() const;
    bool isPending() const { return m_outcome.status == OutcomeStatus::Pending; }
    std::optional<uint32_t> requestedValue() const { return m_requestedValue; }

    // Value that flips the current state. Only meaningful when canToggle().
    uint32_t toggleTarget() const;

    void markPending(uint32_t requestedValue);
    void resolve(const WriteOutcome& outcome);

    // Takes attributes and power value from a fresh enumeration of the same
    // entry. A pending marker survives; a resolved outcome survives exactly
    // one read-back so the pass that publishes it still shows it.
    void mergeFrom(const Device& fresh);

    DeviceSnapshot snapshot() const;

    static SleepState sleepStateFor(std::optional<uint32_t> powerValue);

private:
    const std::string m_registryPath;
    DeviceAttributes m_attributes;
    std::optional<uint32_t> m_powerValue;
    WriteOutcome m_outcome;
    std::optional<uint32_t> m_requestedValue;
    bool m_outcomeUnpublished{false};
};

}
