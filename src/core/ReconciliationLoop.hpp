#pragma once
#include <usb-power/Constants.hpp>
#include <usb-power/Types.hpp>
#include <QObject>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace usb_power {

class DeviceRegistryReader;
class PrivilegeBroker;

// Owns the device set. All mutation happens on the thread this object lives
// on; everything else sees published snapshots. A timer tick, an explicit
// wake() and the completion of any write all run the same reconcile().
class ReconciliationLoop : public QObject {
    Q_OBJECT

public:
    ReconciliationLoop(DeviceRegistryReader& reader, PrivilegeBroker& broker, QObject* parent = nullptr);
    ~ReconciliationLoop() override;

    void start(std::chrono::milliseconds interval = std::chrono::milliseconds(REFRESH_INTERVAL));
    void stop();
    bool isRunning() const;

    // Safe from any thread.
    std::vector<DeviceSnapshot> snapshot() const;
    std::optional<DeviceSnapshot> device(const std::string& registryPath) const;
    size_t outstandingWrites() const;

public slots:
    void reconcile();
    void wake();

    // Flip the current state. Rejected (false, toggleRejected emitted) for
    // unknown or Unavailable devices and for devices with a pending write.
    bool toggle(const std::string& registryPath);
    bool setSleepDisabled(const std::string& registryPath, bool disabled);

    // One batch, one elevation, value 0 for every available, non-pending
    // device. Returns the number of operations submitted.
    size_t disableAllSleep();

signals:
    void devicesChanged(const DeviceDiff& diff);
    void snapshotUpdated(const std::vector<DeviceSnapshot>& devices);
    void enumerationFailed(const std::string& reason);
    void toggleRejected(const std::string& registryPath, const std::string& reason);
    void writeResolved(const std::string& registryPath, const WriteOutcome& outcome);
    // Emitted after the post-write pass has published the new state.
    void batchCompleted(quint64 ticket, int succeeded, int failed);

private:
    bool requestValue(const std::string& registryPath, uint32_t value, bool flip);
    quint64 submit(std::vector<WriteOp> operations);
    void handleResults(quint64 ticket, const std::vector<WriteResult>& results);
    void reportFinishedBatches();
    void publish();

    class Private;
    std::unique_ptr<Private> d;
};

}
