#include <usb-power/Types.hpp>

namespace usb_power {

const char* toString(SleepState state) {
    switch (state) {
        case SleepState::Enabled:     return "Enabled";
        case SleepState::Disabled:    return "Disabled";
        case SleepState::Unavailable: return "Unavailable";
    }
    return "Unknown";
}

const char* toString(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::None:      return "none";
        case OutcomeStatus::Pending:   return "pending";
        case OutcomeStatus::Succeeded: return "succeeded";
        case OutcomeStatus::Failed:    return "failed";
    }
    return "unknown";
}

// These tokens are part of the elevation response format.
const char* toString(FailureReason reason) {
    switch (reason) {
        case FailureReason::None:              return "";
        case FailureReason::WriteDenied:       return "write-denied";
        case FailureReason::WriteError:        return "write-error";
        case FailureReason::WriteIneffective:  return "write-ineffective";
        case FailureReason::InvalidRequest:    return "invalid-request";
        case FailureReason::ElevationDeclined: return "declined";
        case FailureReason::SpawnError:        return "spawn-error";
        case FailureReason::NoResponse:        return "no-response";
    }
    return "unknown";
}

std::optional<FailureReason> failureReasonFromString(const std::string& text) {
    static const FailureReason all[] = {
        FailureReason::None,
        FailureReason::WriteDenied,
        FailureReason::WriteError,
        FailureReason::WriteIneffective,
        FailureReason::InvalidRequest,
        FailureReason::ElevationDeclined,
        FailureReason::SpawnError,
        FailureReason::NoResponse
    };
    for (FailureReason reason : all) {
        if (text == toString(reason)) {
            return reason;
        }
    }
    return std::nullopt;
}

} // namespace usb_power
