#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usb_power {

enum class SleepState {
    Enabled,        // power saving allowed
    Disabled,       // power saving suppressed
    Unavailable     // attribute absent, no toggle
};

enum class OutcomeStatus {
    None,
    Pending,
    Succeeded,
    Failed
};

enum class FailureReason {
    None,
    WriteDenied,
    WriteError,
    WriteIneffective,
    InvalidRequest,
    ElevationDeclined,
    SpawnError,
    NoResponse
};

struct WriteOutcome {
    OutcomeStatus status{OutcomeStatus::None};
    FailureReason reason{FailureReason::None};
    std::string message;

    static WriteOutcome pending() { return {OutcomeStatus::Pending, FailureReason::None, {}}; }
    static WriteOutcome succeeded() { return {OutcomeStatus::Succeeded, FailureReason::None, {}}; }
    static WriteOutcome failed(FailureReason reason, std::string message = {}) {
        return {OutcomeStatus::Failed, reason, std::move(message)};
    }

    bool isFailed() const { return status == OutcomeStatus::Failed; }

    bool operator==(const WriteOutcome& other) const {
        return status == other.status && reason == other.reason && message == other.message;
    }
    bool operator!=(const WriteOutcome& other) const { return !(*this == other); }
};

struct WriteOp {
    std::string registryPath;
    uint32_t value{0};

    bool operator==(const WriteOp& other) const {
        return registryPath == other.registryPath && value == other.value;
    }
};

// One entry of a broker or executor report, 1:1 with the submitted WriteOp.
struct WriteResult {
    WriteOp op;
    WriteOutcome outcome;
};

struct DeviceSnapshot {
    std::string registryPath;
    std::string friendlyName;
    std::string manufacturer;
    std::string deviceType;
    SleepState sleepState{SleepState::Unavailable};
    std::optional<bool> connected;
    WriteOutcome lastWriteOutcome;

    bool operator==(const DeviceSnapshot& other) const {
        return registryPath == other.registryPath &&
               friendlyName == other.friendlyName &&
               manufacturer == other.manufacturer &&
               deviceType == other.deviceType &&
               sleepState == other.sleepState &&
               connected == other.connected &&
               lastWriteOutcome == other.lastWriteOutcome;
    }
    bool operator!=(const DeviceSnapshot& other) const { return !(*this == other); }
};

struct DeviceDiff {
    std::vector<DeviceSnapshot> added;
    std::vector<DeviceSnapshot> removed;
    std::vector<DeviceSnapshot> changed;

    bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

const char* toString(SleepState state);
const char* toString(OutcomeStatus status);
const char* toString(FailureReason reason);
std::optional<FailureReason> failureReasonFromString(const std::string& text);

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}
