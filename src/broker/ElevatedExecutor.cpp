#include "ElevatedExecutor.hpp"
#include "ElevationProtocol.hpp"
#include "../core/Logger.hpp"
#include "../core/RegistryStore.hpp"
#include <usb-power/Constants.hpp>
#include <algorithm>

namespace usb_power {

std::vector<WriteResult> performWrites(RegistryStore& store,
                                       const std::vector<WriteOp>& operations) {
    std::vector<WriteResult> results;
    results.reserve(operations.size());

    for (const auto& op : operations) {
        WriteResult result;
        result.op = op;
        try {
            store.writeDword(op.registryPath, Attributes::ENHANCED_POWER_MANAGEMENT, op.value);
            result.outcome = WriteOutcome::succeeded();
            LOG_INFO("Wrote " + std::to_string(op.value) + " to " + op.registryPath);
        } catch (const RegistryError& e) {
            FailureReason reason = e.code() == RegistryError::Code::AccessDenied
                ? FailureReason::WriteDenied
                : FailureReason::WriteError;
            result.outcome = WriteOutcome::failed(reason, e.what());
            LOG_WARNING(std::string("Write failed: ") + e.what());
        }
        results.push_back(std::move(result));
    }
    return results;
}

ElevatedExecutor::ElevatedExecutor(RegistryStore& store, std::string enumerationRoot)
    : m_store(store)
    , m_root(enumerationRoot.empty() ? USB_ENUM_ROOT : std::move(enumerationRoot)) {
}

void ElevatedExecutor::setDeadline(const QDateTime& deadline) {
    m_deadline = deadline;
}

bool ElevatedExecutor::deadlinePassed() const {
    return m_deadline.isValid() && QDateTime::currentDateTimeUtc() >= m_deadline;
}

int ElevatedExecutor::run(const QString& requestPath, const QString& responsePath) {
    if (deadlinePassed()) {
        LOG_WARNING("Started after the caller's deadline, nothing written");
        return ExitCodes::DEADLINE_PASSED;
    }

    auto payload = protocol::readFile(requestPath);
    if (!payload) {
        LOG_ERROR("Elevation request not readable: " + requestPath.toStdString());
        return ExitCodes::BAD_REQUEST;
    }

    auto operations = protocol::decodeRequest(*payload);
    if (!operations) {
        LOG_ERROR("Elevation request malformed: " + requestPath.toStdString());
        return ExitCodes::BAD_REQUEST;
    }

    LOG_INFO("Executing " + std::to_string(operations->size()) + " elevated write(s)");
    std::vector<WriteResult> results = execute(*operations);

    if (!protocol::writeFile(responsePath, protocol::encodeResponse(results))) {
        LOG_ERROR("Could not write elevation response: " + responsePath.toStdString());
        return ExitCodes::RESPONSE_FAILED;
    }

    bool allSucceeded = std::all_of(results.begin(), results.end(), [](const WriteResult& r) {
        return r.outcome.status == OutcomeStatus::Succeeded;
    });
    return allSucceeded ? ExitCodes::SUCCESS : ExitCodes::PARTIAL_FAILURE;
}

std::vector<WriteResult> ElevatedExecutor::execute(const std::vector<WriteOp>& operations) {
    std::vector<WriteResult> results;
    results.reserve(operations.size());

    for (const auto& op : operations) {
        if (deadlinePassed()) {
            results.push_back({op, WriteOutcome::failed(FailureReason::NoResponse,
                                                        "Deadline passed before this write")});
            continue;
        }

        std::string why;
        if (!isPermitted(op, why)) {
            LOG_WARNING("Refusing elevated write to " + op.registryPath + ": " + why);
            results.push_back({op, WriteOutcome::failed(FailureReason::InvalidRequest, why)});
            continue;
        }
        auto written = performWrites(m_store, {op});
        results.push_back(std::move(written.front()));
    }
    return results;
}

bool ElevatedExecutor::isPermitted(const WriteOp& op, std::string& why) const {
    if (op.value != EPM_SLEEP_DISABLED && op.value != EPM_SLEEP_ENABLED) {
        why = "value " + std::to_string(op.value) + " is not 0 or 1";
        return false;
    }
    if (!registry_path::isUnder(op.registryPath, m_root)) {
        why = "path is outside the device enumeration root";
        return false;
    }
    if (!registry_path::equalsIgnoreCase(registry_path::leaf(op.registryPath), DEVICE_PARAMETERS_KEY)) {
        why = "path is not a Device Parameters key";
        return false;
    }
    return true;
}

} // namespace usb_power
