#pragma once
#include <usb-power/Types.hpp>
#include <QObject>
#include <QString>
#include <memory>
#include <vector>

class QTextStream;

namespace usb_power {

class ReconciliationLoop;

// Text rendering of the device list for the command line front-end.
class ConsoleView : public QObject {
    Q_OBJECT

public:
    explicit ConsoleView(QTextStream& out, QObject* parent = nullptr);
    ~ConsoleView();

    void setLoop(ReconciliationLoop* loop);

    // Print diffs as they arrive instead of only on request.
    void setFollowChanges(bool follow);

    void printTable(const std::vector<DeviceSnapshot>& devices);
    void printDevice(const DeviceSnapshot& device);

    static QString stateLabel(const DeviceSnapshot& device);
    static QString outcomeLabel(const WriteOutcome& outcome);
    static QString connectedLabel(const std::optional<bool>& connected);

public slots:
    void handleDevicesChanged(const DeviceDiff& diff);
    void handleEnumerationFailed(const std::string& reason);
    void handleToggleRejected(const std::string& registryPath, const std::string& reason);
    void handleWriteResolved(const std::string& registryPath, const WriteOutcome& outcome);

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
