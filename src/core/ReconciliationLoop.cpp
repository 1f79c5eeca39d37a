#include "ReconciliationLoop.hpp"
#include "Device.hpp"
#include "DeviceRegistryReader.hpp"
#include "Logger.hpp"
#include "WriteDispatcher.hpp"
#include "../broker/PrivilegeBroker.hpp"
#include <QMetaObject>
#include <QTimer>
#include <map>
#include <tuple>
#include <mutex>

namespace usb_power {

class ReconciliationLoop::Private {
public:
    DeviceRegistryReader* reader{nullptr};
    PrivilegeBroker* broker{nullptr};
    QTimer* timer{nullptr};

    std::map<std::string, Device> devices;
    std::vector<std::string> order;
    bool wakeScheduled{false};

    // Batches whose outcomes are resolved, reported once the following pass
    // has published the post-write state.
    std::vector<std::tuple<quint64, int, int>> finishedBatches;

    mutable std::mutex snapshotMutex;
    std::vector<DeviceSnapshot> published;

    // Declared last: its worker must stop before the state above goes away.
    std::unique_ptr<WriteDispatcher> dispatcher;

    static DeviceDiff diff(const std::vector<DeviceSnapshot>& before,
                           const std::vector<DeviceSnapshot>& after) {
        std::map<std::string, const DeviceSnapshot*> previous;
        for (const auto& snap : before) {
            previous[snap.registryPath] = &snap;
        }

        DeviceDiff result;
        for (const auto& snap : after) {
            auto it = previous.find(snap.registryPath);
            if (it == previous.end()) {
                result.added.push_back(snap);
                continue;
            }
            if (*it->second != snap) {
                result.changed.push_back(snap);
            }
            previous.erase(it);
        }
        for (const auto& snap : before) {
            if (previous.count(snap.registryPath)) {
                result.removed.push_back(snap);
            }
        }
        return result;
    }
};

ReconciliationLoop::ReconciliationLoop(DeviceRegistryReader& reader, PrivilegeBroker& broker, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>()) {
    d->reader = &reader;
    d->broker = &broker;
    d->dispatcher = std::make_unique<WriteDispatcher>(broker);

    d->timer = new QTimer(this);
    connect(d->timer, &QTimer::timeout, this, &ReconciliationLoop::reconcile);
}

ReconciliationLoop::~ReconciliationLoop() {
    d->timer->stop();
    d->dispatcher.reset();
}

void ReconciliationLoop::start(std::chrono::milliseconds interval) {
    d->timer->start(static_cast<int>(interval.count()));
    reconcile();
}

void ReconciliationLoop::stop() {
    d->timer->stop();
}

bool ReconciliationLoop::isRunning() const {
    return d->timer->isActive();
}

std::vector<DeviceSnapshot> ReconciliationLoop::snapshot() const {
    std::lock_guard<std::mutex> lock(d->snapshotMutex);
    return d->published;
}

std::optional<DeviceSnapshot> ReconciliationLoop::device(const std::string& registryPath) const {
    std::lock_guard<std::mutex> lock(d->snapshotMutex);
    for (const auto& snap : d->published) {
        if (snap.registryPath == registryPath) {
            return snap;
        }
    }
    return std::nullopt;
}

size_t ReconciliationLoop::outstandingWrites() const {
    return d->dispatcher->outstanding();
}

void ReconciliationLoop::reconcile() {
    std::vector<Device> fresh;
    try {
        fresh = d->reader->enumerate();
    } catch (const EnumerationUnavailable& e) {
        LOG_WARNING(e.what());
        emit enumerationFailed(e.what());
        // Outcomes resolved since the last pass still have to reach the UI
        publish();
        reportFinishedBatches();
        return;
    }

    std::map<std::string, Device> merged;
    std::vector<std::string> order;
    order.reserve(fresh.size());

    for (auto& device : fresh) {
        const std::string path = device.registryPath();
        if (merged.count(path)) {
            continue;
        }

        auto node = d->devices.extract(path);
        if (node) {
            node.mapped().mergeFrom(device);
            merged.insert(std::move(node));
        } else {
            merged.emplace(path, std::move(device));
        }
        order.push_back(path);
    }

    // A device missing from this pass keeps its entry while a write for it is
    // in flight, so the outcome lands on the same record and no second write
    // can be queued for it.
    for (auto& [path, device] : d->devices) {
        if (device.isPending()) {
            LOG_DEBUG("Keeping device with a pending write that was not enumerated: " + path);
            merged.emplace(path, std::move(device));
            order.push_back(path);
        }
    }

    d->devices = std::move(merged);
    d->order = std::move(order);
    publish();
    reportFinishedBatches();
}

void ReconciliationLoop::wake() {
    if (d->wakeScheduled) {
        return;
    }
    d->wakeScheduled = true;

    QMetaObject::invokeMethod(this, [this]() {
        d->wakeScheduled = false;
        if (d->timer->isActive()) {
            d->timer->start();  // next tick one full interval from now
        }
        reconcile();
    }, Qt::QueuedConnection);
}

bool ReconciliationLoop::toggle(const std::string& registryPath) {
    return requestValue(registryPath, 0, true);
}

bool ReconciliationLoop::setSleepDisabled(const std::string& registryPath, bool disabled) {
    return requestValue(registryPath, disabled ? EPM_SLEEP_DISABLED : EPM_SLEEP_ENABLED, false);
}

size_t ReconciliationLoop::disableAllSleep() {
    std::vector<WriteOp> operations;
    for (const auto& path : d->order) {
        const Device& device = d->devices.at(path);
        if (device.sleepState() == SleepState::Unavailable || device.isPending()) {
            continue;
        }
        operations.push_back({path, EPM_SLEEP_DISABLED});
    }

    if (operations.empty()) {
        LOG_INFO("No eligible devices for disable-all");
        return 0;
    }

    size_t count = operations.size();
    submit(std::move(operations));
    return count;
}

bool ReconciliationLoop::requestValue(const std::string& registryPath, uint32_t value, bool flip) {
    auto it = d->devices.find(registryPath);
    if (it == d->devices.end()) {
        emit toggleRejected(registryPath, "Unknown device");
        return false;
    }

    const Device& device = it->second;
    if (device.sleepState() == SleepState::Unavailable) {
        emit toggleRejected(registryPath, "Power management setting is not available for this device");
        return false;
    }
    if (device.isPending()) {
        emit toggleRejected(registryPath, "A write for this device is already pending");
        return false;
    }

    submit({WriteOp{registryPath, flip ? device.toggleTarget() : value}});
    return true;
}

quint64 ReconciliationLoop::submit(std::vector<WriteOp> operations) {
    for (const auto& op : operations) {
        d->devices.at(op.registryPath).markPending(op.value);
    }
    publish();

    return d->dispatcher->submit(std::move(operations),
        [this](uint64_t ticket, std::vector<WriteResult> results) {
            // Worker thread: hand the results to the owning thread
            QMetaObject::invokeMethod(this, [this, ticket, results = std::move(results)]() {
                handleResults(ticket, results);
            }, Qt::QueuedConnection);
        });
}

void ReconciliationLoop::handleResults(quint64 ticket, const std::vector<WriteResult>& results) {
    int succeeded = 0;
    int failed = 0;

    for (const auto& result : results) {
        const std::string& path = result.op.registryPath;
        WriteOutcome outcome = result.outcome;

        // Some keys accept the write call and silently keep the old value
        if (outcome.status == OutcomeStatus::Succeeded) {
            auto readBack = d->reader->readPowerValue(path);
            if (!readBack || *readBack != result.op.value) {
                std::string observed = readBack ? std::to_string(*readBack) : "no value";
                outcome = WriteOutcome::failed(FailureReason::WriteIneffective,
                    "Write reported success but read-back shows " + observed +
                    " instead of " + std::to_string(result.op.value));
                LOG_WARNING(outcome.message + ": " + path);
            }
        }

        if (outcome.status == OutcomeStatus::Succeeded) {
            ++succeeded;
        } else {
            ++failed;
        }

        auto it = d->devices.find(path);
        if (it != d->devices.end()) {
            it->second.resolve(outcome);
        } else {
            LOG_WARNING("Write outcome for a device no longer listed: " + path);
        }
        emit writeResolved(path, outcome);
    }

    LOG_INFO("Write batch " + std::to_string(ticket) + " finished: " +
             std::to_string(succeeded) + " succeeded, " + std::to_string(failed) + " failed");
    d->finishedBatches.emplace_back(ticket, succeeded, failed);

    wake();
}

void ReconciliationLoop::reportFinishedBatches() {
    auto finished = std::move(d->finishedBatches);
    d->finishedBatches.clear();
    for (const auto& [ticket, succeeded, failed] : finished) {
        emit batchCompleted(ticket, succeeded, failed);
    }
}

void ReconciliationLoop::publish() {
    std::vector<DeviceSnapshot> next;
    next.reserve(d->order.size());
    for (const auto& path : d->order) {
        next.push_back(d->devices.at(path).snapshot());
    }

    DeviceDiff changes;
    {
        std::lock_guard<std::mutex> lock(d->snapshotMutex);
        changes = Private::diff(d->published, next);
        d->published = next;
    }

    if (!changes.empty()) {
        emit devicesChanged(changes);
    }
    emit snapshotUpdated(next);
}

} // namespace usb_power
