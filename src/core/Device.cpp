#include "Device.hpp"
#include <usb-power/Constants.hpp>

namespace usb_power {

Device::Device(std::string registryPath, DeviceAttributes attributes, std::optional<uint32_t> powerValue)
    : m_registryPath(std::move(registryPath))
    , m_attributes(std::move(attributes))
    , m_powerValue(powerValue) {
}

SleepState Device::sleepStateFor(std::optional<uint32_t> powerValue) {
    if (!powerValue) {
        return SleepState::Unavailable;
    }
    // Any non-zero value leaves enhanced power management on.
    return *powerValue == EPM_SLEEP_DISABLED ? SleepState::Disabled : SleepState::Enabled;
}

SleepState Device::sleepState() const {
    return sleepStateFor(m_powerValue);
}

bool Device::canToggle() const {
    return sleepState() != SleepState::Unavailable && !isPending();
}

uint32_t Device::toggleTarget() const {
    return sleepState() == SleepState::Disabled ? EPM_SLEEP_ENABLED : EPM_SLEEP_DISABLED;
}

void Device::markPending(uint32_t requestedValue) {
    m_outcome = WriteOutcome::pending();
    m_requestedValue = requestedValue;
    m_outcomeUnpublished = false;
}

void Device::resolve(const WriteOutcome& outcome) {
    m_outcome = outcome;
    m_requestedValue.reset();
    m_outcomeUnpublished = true;
}

void Device::mergeFrom(const Device& fresh) {
    m_attributes = fresh.m_attributes;
    m_powerValue = fresh.m_powerValue;

    if (isPending()) {
        return;
    }
    if (m_outcomeUnpublished) {
        m_outcomeUnpublished = false;
        return;
    }
    m_outcome = WriteOutcome{};
}

DeviceSnapshot Device::snapshot() const {
    DeviceSnapshot snap;
    snap.registryPath = m_registryPath;
    snap.friendlyName = m_attributes.friendlyName;
    snap.manufacturer = m_attributes.manufacturer;
    snap.deviceType = m_attributes.deviceType;
    snap.sleepState = sleepState();
    snap.connected = m_attributes.connected;
    snap.lastWriteOutcome = m_outcome;
    return snap;
}

} // namespace usb_power
