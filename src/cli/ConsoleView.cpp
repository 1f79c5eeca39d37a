#include "ConsoleView.hpp"
#include "../core/ReconciliationLoop.hpp"
#include <QTextStream>
#include <algorithm>

namespace usb_power {

class ConsoleView::Private {
public:
    explicit Private(QTextStream& stream) : out(stream) {}

    QTextStream& out;
    ReconciliationLoop* loop{nullptr};
    bool follow{false};

    void line(const QString& text) {
        out << text << '\n';
        out.flush();
    }
};

ConsoleView::ConsoleView(QTextStream& out, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<Private>(out)) {
}

ConsoleView::~ConsoleView() = default;

void ConsoleView::setLoop(ReconciliationLoop* loop) {
    if (d->loop) {
        disconnect(d->loop, nullptr, this, nullptr);
    }

    d->loop = loop;

    if (loop) {
        connect(loop, &ReconciliationLoop::devicesChanged,
                this, &ConsoleView::handleDevicesChanged);
        connect(loop, &ReconciliationLoop::enumerationFailed,
                this, &ConsoleView::handleEnumerationFailed);
        connect(loop, &ReconciliationLoop::toggleRejected,
                this, &ConsoleView::handleToggleRejected);
        connect(loop, &ReconciliationLoop::writeResolved,
                this, &ConsoleView::handleWriteResolved);
    }
}

void ConsoleView::setFollowChanges(bool follow) {
    d->follow = follow;
}

void ConsoleView::printTable(const std::vector<DeviceSnapshot>& devices) {
    if (devices.empty()) {
        d->line("No USB devices found.");
        return;
    }

    int nameWidth = 6;
    int typeWidth = 4;
    for (const auto& device : devices) {
        nameWidth = std::max(nameWidth, static_cast<int>(QString::fromStdString(device.friendlyName).size()));
        typeWidth = std::max(typeWidth, static_cast<int>(QString::fromStdString(device.deviceType).size()));
    }
    nameWidth = std::min(nameWidth, 48);
    typeWidth = std::min(typeWidth, 20);

    d->line(QString("%1  %2  %3  %4  %5")
        .arg(QStringLiteral("Device"), -nameWidth)
        .arg(QStringLiteral("Type"), -typeWidth)
        .arg(QStringLiteral("Sleep"), -11)
        .arg(QStringLiteral("Connected"), -9)
        .arg(QStringLiteral("Last write")));

    for (const auto& device : devices) {
        d->line(QString("%1  %2  %3  %4  %5")
            .arg(QString::fromStdString(device.friendlyName).left(nameWidth), -nameWidth)
            .arg(QString::fromStdString(device.deviceType).left(typeWidth), -typeWidth)
            .arg(stateLabel(device), -11)
            .arg(connectedLabel(device.connected), -9)
            .arg(outcomeLabel(device.lastWriteOutcome)));
        d->line("    " + QString::fromStdString(device.registryPath));
    }

    d->line(QString("%1 device(s)").arg(devices.size()));
}

void ConsoleView::printDevice(const DeviceSnapshot& device) {
    d->line(QString::fromStdString(device.friendlyName));
    d->line("  Path:         " + QString::fromStdString(device.registryPath));
    d->line("  Type:         " + QString::fromStdString(device.deviceType));
    if (!device.manufacturer.empty()) {
        d->line("  Manufacturer: " + QString::fromStdString(device.manufacturer));
    }
    d->line("  Sleep:        " + stateLabel(device));
    d->line("  Connected:    " + connectedLabel(device.connected));
    d->line("  Last write:   " + outcomeLabel(device.lastWriteOutcome));
}

QString ConsoleView::stateLabel(const DeviceSnapshot& device) {
    if (device.lastWriteOutcome.status == OutcomeStatus::Pending) {
        return "Pending";
    }
    switch (device.sleepState) {
        case SleepState::Enabled:     return "Enabled";
        case SleepState::Disabled:    return "Disabled";
        case SleepState::Unavailable: return "Unavailable";
    }
    return "Unavailable";
}

QString ConsoleView::outcomeLabel(const WriteOutcome& outcome) {
    switch (outcome.status) {
        case OutcomeStatus::None:
            return "-";
        case OutcomeStatus::Pending:
            return "pending";
        case OutcomeStatus::Succeeded:
            return "ok";
        case OutcomeStatus::Failed:
            break;
    }

    QString label = QString("failed (%1)").arg(QLatin1String(toString(outcome.reason)));
    if (!outcome.message.empty()) {
        label += ": " + QString::fromStdString(outcome.message);
    }
    return label;
}

QString ConsoleView::connectedLabel(const std::optional<bool>& connected) {
    if (!connected) {
        return "?";
    }
    return *connected ? "yes" : "no";
}

void ConsoleView::handleDevicesChanged(const DeviceDiff& diff) {
    if (!d->follow) {
        return;
    }

    for (const auto& device : diff.added) {
        d->line(QString("+ %1 [%2]").arg(QString::fromStdString(device.friendlyName), stateLabel(device)));
    }
    for (const auto& device : diff.removed) {
        d->line(QString("- %1").arg(QString::fromStdString(device.friendlyName)));
    }
    for (const auto& device : diff.changed) {
        d->line(QString("~ %1 [%2] %3")
            .arg(QString::fromStdString(device.friendlyName), stateLabel(device),
                 outcomeLabel(device.lastWriteOutcome)));
    }
}

void ConsoleView::handleEnumerationFailed(const std::string& reason) {
    d->line("Device enumeration failed: " + QString::fromStdString(reason));
}

void ConsoleView::handleToggleRejected(const std::string& registryPath, const std::string& reason) {
    d->line(QString("Cannot change %1: %2")
        .arg(QString::fromStdString(registryPath), QString::fromStdString(reason)));
}

void ConsoleView::handleWriteResolved(const std::string& registryPath, const WriteOutcome& outcome) {
    d->line(QString("%1: %2")
        .arg(QString::fromStdString(registryPath), outcomeLabel(outcome)));
}

}
