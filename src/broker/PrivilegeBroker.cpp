#include "PrivilegeBroker.hpp"
#include "ElevatedExecutor.hpp"
#include "ElevationLauncher.hpp"
#include "ElevationProtocol.hpp"
#include "../core/Logger.hpp"
#include "../core/RegistryStore.hpp"
#include <usb-power/Constants.hpp>
#include <QTemporaryDir>
#include <algorithm>
#include <mutex>

namespace usb_power {

class PrivilegeBroker::Private {
public:
    RegistryStore* store{nullptr};
    std::unique_ptr<ElevationLauncher> launcher;
    PrivilegeCheck privilegeCheck{isProcessElevated};
    ConsentHandler consentHandler;
    std::chrono::milliseconds timeout{std::chrono::seconds(ELEVATION_TIMEOUT)};
    mutable std::mutex configMutex;
    std::mutex requestMutex;

    static std::vector<WriteResult> failAll(const std::vector<WriteOp>& operations,
                                            FailureReason reason,
                                            const std::string& message) {
        std::vector<WriteResult> results;
        results.reserve(operations.size());
        for (const auto& op : operations) {
            results.push_back({op, WriteOutcome::failed(reason, message)});
        }
        return results;
    }
};

PrivilegeBroker::PrivilegeBroker(RegistryStore& store, std::unique_ptr<ElevationLauncher> launcher)
    : d(std::make_unique<Private>()) {
    d->store = &store;
    d->launcher = std::move(launcher);
}

PrivilegeBroker::~PrivilegeBroker() = default;

void PrivilegeBroker::setPrivilegeCheck(PrivilegeCheck check) {
    std::lock_guard<std::mutex> lock(d->configMutex);
    d->privilegeCheck = std::move(check);
}

void PrivilegeBroker::setConsentHandler(ConsentHandler handler) {
    std::lock_guard<std::mutex> lock(d->configMutex);
    d->consentHandler = std::move(handler);
}

void PrivilegeBroker::setTimeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(d->configMutex);
    d->timeout = timeout;
}

std::chrono::milliseconds PrivilegeBroker::timeout() const {
    std::lock_guard<std::mutex> lock(d->configMutex);
    return d->timeout;
}

WriteStrategy PrivilegeBroker::selectStrategy(const std::vector<WriteOp>& operations) const {
    PrivilegeCheck check;
    {
        std::lock_guard<std::mutex> lock(d->configMutex);
        check = d->privilegeCheck;
    }

    if (check && check()) {
        return DirectWrite{};
    }

    // Some installations grant the interactive user write access to these
    // keys; probing avoids a needless consent prompt.
    bool allWritable = std::all_of(operations.begin(), operations.end(), [this](const WriteOp& op) {
        return d->store->canWrite(op.registryPath);
    });
    if (allWritable) {
        return DirectWrite{};
    }
    return ElevatedWrite{};
}

std::vector<WriteResult> PrivilegeBroker::requestWrite(const std::vector<WriteOp>& operations) {
    if (operations.empty()) {
        return {};
    }

    std::lock_guard<std::mutex> lock(d->requestMutex);

    WriteStrategy strategy = selectStrategy(operations);
    return std::visit(overloaded{
        [&](const DirectWrite&) { return writeDirect(operations); },
        [&](const ElevatedWrite&) { return writeElevated(operations); }
    }, strategy);
}

std::vector<WriteResult> PrivilegeBroker::writeDirect(const std::vector<WriteOp>& operations) {
    LOG_INFO("Writing " + std::to_string(operations.size()) + " value(s) directly");
    return performWrites(*d->store, operations);
}

std::vector<WriteResult> PrivilegeBroker::writeElevated(const std::vector<WriteOp>& operations) {
    ConsentHandler consent;
    std::chrono::milliseconds timeout;
    {
        std::lock_guard<std::mutex> lock(d->configMutex);
        consent = d->consentHandler;
        timeout = d->timeout;
    }

    if (consent && !consent(operations.size())) {
        LOG_INFO("Elevation declined by operator");
        return Private::failAll(operations, FailureReason::ElevationDeclined,
                                "Elevation declined");
    }

    if (!d->launcher) {
        return Private::failAll(operations, FailureReason::SpawnError,
                                "No elevation mechanism available");
    }

    QTemporaryDir exchangeDir;
    if (!exchangeDir.isValid()) {
        LOG_ERROR("Cannot create elevation exchange directory: " +
                  exchangeDir.errorString().toStdString());
        return Private::failAll(operations, FailureReason::SpawnError,
                                "Cannot create elevation exchange directory");
    }

    const QString requestPath = exchangeDir.filePath(QStringLiteral("request.json"));
    const QString responsePath = exchangeDir.filePath(QStringLiteral("response.json"));
    if (!protocol::writeFile(requestPath, protocol::encodeRequest(operations))) {
        return Private::failAll(operations, FailureReason::SpawnError,
                                "Cannot write elevation request");
    }

    LOG_INFO("Elevating " + std::to_string(operations.size()) + " write(s)");
    LaunchResult launch = d->launcher->run(requestPath, responsePath, timeout);

    switch (launch.status) {
        case LaunchStatus::Declined:
            LOG_WARNING("Elevation declined: " + launch.detail);
            return Private::failAll(operations, FailureReason::ElevationDeclined,
                                    launch.detail.empty() ? "Elevation declined" : launch.detail);
        case LaunchStatus::SpawnFailed:
            LOG_ERROR("Elevated helper could not be started: " + launch.detail);
            return Private::failAll(operations, FailureReason::SpawnError, launch.detail);
        case LaunchStatus::TimedOut:
            LOG_ERROR(launch.detail);
            return Private::failAll(operations, FailureReason::NoResponse, launch.detail);
        case LaunchStatus::Completed:
            break;
    }

    auto payload = protocol::readFile(responsePath);
    if (!payload) {
        std::string message = "Elevated helper exited (code " + std::to_string(launch.exitCode) +
                              ") without a report";
        LOG_ERROR(message);
        return Private::failAll(operations, FailureReason::NoResponse, message);
    }

    auto response = protocol::decodeResponse(*payload);
    if (!response) {
        LOG_ERROR("Elevated helper report is unreadable");
        return Private::failAll(operations, FailureReason::NoResponse,
                                "Elevated helper report is unreadable");
    }

    LOG_DEBUG("Elevated helper exited with code " + std::to_string(launch.exitCode));
    return protocol::matchResponse(operations, *response);
}

} // namespace usb_power
