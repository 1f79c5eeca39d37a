// tests/test_ReconciliationLoop.cpp
#include <gtest/gtest.h>
#include "DeviceRegistryReader.hpp"
#include "JsonRegistryStore.hpp"
#include "PrivilegeBroker.hpp"
#include "ReconciliationLoop.hpp"
#include "TestSupport.hpp"
#include <QJsonDocument>
#include <QTemporaryDir>

namespace usb_power {
namespace testing {

class ReconciliationLoopTest : public QtTest {
protected:
    void SetUp() override {
        QtTest::SetUp();
        image.device("VID_1&PID_1\\A", "Mouse", 1u)
             .device("VID_2&PID_2\\B", "Keyboard", 1u)
             .device("VID_3&PID_3\\C", "Camera", 0u)
             .device("VID_4&PID_4\\D", "Hub", std::nullopt);
    }

    void TearDown() override {
        gate.open();
        loop.reset();
        broker.reset();
        reader.reset();
        frontEnd.reset();
        backing.reset();
        QtTest::TearDown();
    }

    // Standard user: reads through to the image, writes need the helper.
    void startAsStandardUser(std::unique_ptr<ElevationLauncher> launcher = nullptr) {
        if (!backing) {
            backing = std::make_unique<JsonRegistryStore>(image.build());
        }
        frontEnd = std::make_unique<UnprivilegedStore>(*backing);
        if (!launcher) {
            auto inProcess = std::make_unique<InProcessLauncher>(*backing, &gate);
            helper = inProcess.get();
            launcher = std::move(inProcess);
        }
        build(*frontEnd, std::move(launcher), false);
    }

    void build(RegistryStore& store, std::unique_ptr<ElevationLauncher> launcher, bool elevated) {
        reader = std::make_unique<DeviceRegistryReader>(store);
        broker = std::make_unique<PrivilegeBroker>(store, std::move(launcher));
        broker->setPrivilegeCheck([elevated]() { return elevated; });
        loop = std::make_unique<ReconciliationLoop>(*reader, *broker);

        QObject::connect(loop.get(), &ReconciliationLoop::batchCompleted,
            [this](quint64 ticket, int succeeded, int failed) {
                batches.push_back(ticket);
                succeededCount += succeeded;
                failedCount += failed;
            });
        QObject::connect(loop.get(), &ReconciliationLoop::writeResolved,
            [this](const std::string& path, const WriteOutcome& outcome) {
                resolved.emplace_back(path, outcome);
            });
        QObject::connect(loop.get(), &ReconciliationLoop::toggleRejected,
            [this](const std::string& path, const std::string&) {
                rejected.push_back(path);
            });

        loop->reconcile();
    }

    bool waitForBatches(size_t count) {
        return waitUntil([this, count]() { return batches.size() >= count; });
    }

    DeviceSnapshot snapshotOf(const std::string& instance) const {
        auto snap = loop->device(parametersPath(instance));
        EXPECT_TRUE(snap.has_value()) << instance;
        return snap.value_or(DeviceSnapshot{});
    }

    RegistryImage image;
    Gate gate;
    std::unique_ptr<JsonRegistryStore> backing;
    std::unique_ptr<RegistryStore> frontEnd;
    std::unique_ptr<DeviceRegistryReader> reader;
    std::unique_ptr<PrivilegeBroker> broker;
    std::unique_ptr<ReconciliationLoop> loop;
    InProcessLauncher* helper{nullptr};

    std::vector<quint64> batches;
    int succeededCount{0};
    int failedCount{0};
    std::vector<std::pair<std::string, WriteOutcome>> resolved;
    std::vector<std::string> rejected;
};

TEST_F(ReconciliationLoopTest, FirstPassPublishesEveryDevice) {
    DeviceDiff firstDiff;
    backing = std::make_unique<JsonRegistryStore>(image.build());
    reader = std::make_unique<DeviceRegistryReader>(*backing);
    broker = std::make_unique<PrivilegeBroker>(*backing, nullptr);
    loop = std::make_unique<ReconciliationLoop>(*reader, *broker);
    QObject::connect(loop.get(), &ReconciliationLoop::devicesChanged,
        [&firstDiff](const DeviceDiff& diff) { firstDiff = diff; });

    loop->reconcile();

    auto devices = loop->snapshot();
    ASSERT_EQ(devices.size(), 4u);
    EXPECT_EQ(devices[0].friendlyName, "Camera");
    EXPECT_EQ(devices[1].friendlyName, "Hub");
    EXPECT_EQ(devices[1].sleepState, SleepState::Unavailable);
    EXPECT_EQ(firstDiff.added.size(), 4u);
    EXPECT_TRUE(firstDiff.removed.empty());
}

TEST_F(ReconciliationLoopTest, UnchangedPassEmitsNoDiff) {
    startAsStandardUser();
    int diffs = 0;
    QObject::connect(loop.get(), &ReconciliationLoop::devicesChanged,
        [&diffs](const DeviceDiff&) { ++diffs; });

    loop->reconcile();
    loop->reconcile();
    EXPECT_EQ(diffs, 0);
}

TEST_F(ReconciliationLoopTest, UnavailableDeviceCannotBeToggled) {
    startAsStandardUser();

    EXPECT_FALSE(loop->toggle(parametersPath("VID_4&PID_4\\D")));
    EXPECT_FALSE(loop->toggle(parametersPath("VID_9&PID_9\\unknown")));

    ASSERT_EQ(rejected.size(), 2u);
    EXPECT_EQ(loop->outstandingWrites(), 0u);
    EXPECT_EQ(helper->calls(), 0);
}

TEST_F(ReconciliationLoopTest, DirectWriteIsConfirmedByReadBack) {
    backing = std::make_unique<JsonRegistryStore>(image.build());
    build(*backing, nullptr, true);

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    ASSERT_TRUE(waitForBatches(1));

    DeviceSnapshot mouse = snapshotOf("VID_1&PID_1\\A");
    EXPECT_EQ(mouse.sleepState, SleepState::Disabled);
    EXPECT_EQ(mouse.lastWriteOutcome.status, OutcomeStatus::Succeeded);
    EXPECT_EQ(succeededCount, 1);
}

TEST_F(ReconciliationLoopTest, ElevatedToggleFlipsState) {
    startAsStandardUser();

    ASSERT_TRUE(loop->toggle(parametersPath("VID_3&PID_3\\C")));
    ASSERT_TRUE(waitForBatches(1));

    EXPECT_EQ(helper->calls(), 1);
    EXPECT_EQ(snapshotOf("VID_3&PID_3\\C").sleepState, SleepState::Enabled);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].second.status, OutcomeStatus::Succeeded);
}

TEST_F(ReconciliationLoopTest, DisableAllUsesOneElevation) {
    startAsStandardUser();

    EXPECT_EQ(loop->disableAllSleep(), 3u);
    ASSERT_TRUE(waitForBatches(1));

    EXPECT_EQ(helper->calls(), 1);
    auto requests = helper->requests();
    ASSERT_EQ(requests.size(), 1u);
    const auto& ops = requests[0];
    ASSERT_EQ(ops.size(), 3u);
    for (const auto& op : ops) {
        EXPECT_EQ(op.value, EPM_SLEEP_DISABLED);
        EXPECT_NE(op.registryPath, parametersPath("VID_4&PID_4\\D"));
    }

    EXPECT_EQ(resolved.size(), 3u);
    EXPECT_EQ(succeededCount, 3);
    for (const auto& device : loop->snapshot()) {
        if (device.sleepState != SleepState::Unavailable) {
            EXPECT_EQ(device.sleepState, SleepState::Disabled) << device.friendlyName;
        }
    }
}

TEST_F(ReconciliationLoopTest, DisableAllWithNothingEligibleSubmitsNothing) {
    image = RegistryImage();
    image.device("VID_4&PID_4\\D", "Hub", std::nullopt);
    startAsStandardUser();

    EXPECT_EQ(loop->disableAllSleep(), 0u);
    EXPECT_EQ(loop->outstandingWrites(), 0u);
    EXPECT_EQ(helper->calls(), 0);
}

TEST_F(ReconciliationLoopTest, IgnoredWriteIsReportedAsIneffective) {
    backing = std::make_unique<JsonRegistryStore>(image.build());
    frontEnd = std::make_unique<IgnoringStore>(*backing);
    build(*frontEnd, nullptr, false);

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    ASSERT_TRUE(waitForBatches(1));

    DeviceSnapshot mouse = snapshotOf("VID_1&PID_1\\A");
    EXPECT_EQ(mouse.sleepState, SleepState::Enabled);
    EXPECT_EQ(mouse.lastWriteOutcome.reason, FailureReason::WriteIneffective);
    EXPECT_EQ(failedCount, 1);
}

TEST_F(ReconciliationLoopTest, PendingDeviceRejectsSecondToggle) {
    gate.close();
    startAsStandardUser();

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").lastWriteOutcome.status, OutcomeStatus::Pending);

    // Timer passes during the write keep the pending marker
    loop->reconcile();
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").lastWriteOutcome.status, OutcomeStatus::Pending);

    EXPECT_FALSE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    EXPECT_EQ(rejected.size(), 1u);

    gate.open();
    ASSERT_TRUE(waitForBatches(1));
    EXPECT_EQ(helper->calls(), 1);
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").sleepState, SleepState::Disabled);
}

TEST_F(ReconciliationLoopTest, PendingDeviceSurvivesAPassThatMissesIt) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("registry.json");
    ASSERT_TRUE(protocol::writeFile(file, QJsonDocument(image.build()).toJson()));

    gate.close();
    backing = std::make_unique<JsonRegistryStore>(file);
    startAsStandardUser();

    const std::string mouse = parametersPath("VID_1&PID_1\\A");
    ASSERT_TRUE(loop->toggle(mouse));

    RegistryImage hidden = image;
    hidden.unreadable(registry_path::join(USB_ENUM_ROOT, "VID_1&PID_1"));
    ASSERT_TRUE(protocol::writeFile(file, QJsonDocument(hidden.build()).toJson()));
    loop->reconcile();
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").lastWriteOutcome.status, OutcomeStatus::Pending);

    ASSERT_TRUE(protocol::writeFile(file, QJsonDocument(image.build()).toJson()));
    loop->reconcile();
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").lastWriteOutcome.status, OutcomeStatus::Pending);
    EXPECT_FALSE(loop->toggle(mouse));
    EXPECT_EQ(rejected.size(), 1u);

    gate.open();
    ASSERT_TRUE(waitForBatches(1));
    EXPECT_EQ(helper->calls(), 1);
    ASSERT_EQ(resolved.size(), 1u);
    EXPECT_EQ(resolved[0].second.status, OutcomeStatus::Succeeded);
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").sleepState, SleepState::Disabled);
    EXPECT_EQ(loop->outstandingWrites(), 0u);
}

TEST_F(ReconciliationLoopTest, BatchIsReportedAfterThePostWritePass) {
    startAsStandardUser();
    loop->start(std::chrono::hours(1));

    SleepState stateAtReport = SleepState::Unavailable;
    QObject::connect(loop.get(), &ReconciliationLoop::batchCompleted,
        [this, &stateAtReport](quint64, int, int) {
            stateAtReport = snapshotOf("VID_1&PID_1\\A").sleepState;
        });

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    ASSERT_TRUE(waitForBatches(1));

    EXPECT_EQ(stateAtReport, SleepState::Disabled);
    EXPECT_TRUE(loop->isRunning());
}

TEST_F(ReconciliationLoopTest, QueuedRequestsCompleteInOrderOnce) {
    gate.close();
    startAsStandardUser();

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    ASSERT_TRUE(loop->toggle(parametersPath("VID_2&PID_2\\B")));
    ASSERT_TRUE(loop->toggle(parametersPath("VID_3&PID_3\\C")));
    EXPECT_EQ(loop->outstandingWrites(), 3u);

    gate.open();
    ASSERT_TRUE(waitForBatches(3));
    // Let any stray completion arrive
    waitUntil([]() { return false; }, 100);

    ASSERT_EQ(batches.size(), 3u);
    EXPECT_LT(batches[0], batches[1]);
    EXPECT_LT(batches[1], batches[2]);
    ASSERT_EQ(resolved.size(), 3u);
    EXPECT_EQ(resolved[0].first, parametersPath("VID_1&PID_1\\A"));
    EXPECT_EQ(resolved[1].first, parametersPath("VID_2&PID_2\\B"));
    EXPECT_EQ(resolved[2].first, parametersPath("VID_3&PID_3\\C"));
    EXPECT_EQ(helper->calls(), 3);
    EXPECT_TRUE(waitUntil([this]() { return loop->outstandingWrites() == 0; }));
}

TEST_F(ReconciliationLoopTest, MissingReportLeavesStateUnchanged) {
    LaunchResult exited;
    exited.status = LaunchStatus::Completed;
    exited.exitCode = 0;
    startAsStandardUser(std::make_unique<ScriptedLauncher>(exited));

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    ASSERT_TRUE(waitForBatches(1));

    DeviceSnapshot mouse = snapshotOf("VID_1&PID_1\\A");
    EXPECT_EQ(mouse.sleepState, SleepState::Enabled);
    EXPECT_EQ(mouse.lastWriteOutcome.reason, FailureReason::NoResponse);
}

TEST_F(ReconciliationLoopTest, DeclinedElevationIsVisible) {
    startAsStandardUser();
    broker->setConsentHandler([](size_t) { return false; });

    ASSERT_TRUE(loop->setSleepDisabled(parametersPath("VID_2&PID_2\\B"), true));
    ASSERT_TRUE(waitForBatches(1));

    DeviceSnapshot keyboard = snapshotOf("VID_2&PID_2\\B");
    EXPECT_EQ(keyboard.sleepState, SleepState::Enabled);
    EXPECT_EQ(keyboard.lastWriteOutcome.reason, FailureReason::ElevationDeclined);
    EXPECT_EQ(helper->calls(), 0);
}

TEST_F(ReconciliationLoopTest, OutcomeClearsOnTheFollowingPass) {
    startAsStandardUser();

    ASSERT_TRUE(loop->toggle(parametersPath("VID_1&PID_1\\A")));
    ASSERT_TRUE(waitForBatches(1));
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").lastWriteOutcome.status, OutcomeStatus::Succeeded);

    loop->reconcile();
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").lastWriteOutcome.status, OutcomeStatus::None);
    EXPECT_EQ(snapshotOf("VID_1&PID_1\\A").sleepState, SleepState::Disabled);
}

TEST_F(ReconciliationLoopTest, ExternalChangesAppearInDiff) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString file = dir.filePath("registry.json");
    ASSERT_TRUE(protocol::writeFile(file, QJsonDocument(image.build()).toJson()));

    backing = std::make_unique<JsonRegistryStore>(file);
    build(*backing, nullptr, true);

    DeviceDiff lastDiff;
    QObject::connect(loop.get(), &ReconciliationLoop::devicesChanged,
        [&lastDiff](const DeviceDiff& diff) { lastDiff = diff; });

    RegistryImage changed;
    changed.device("VID_1&PID_1\\A", "Mouse", 0u)
           .device("VID_2&PID_2\\B", "Keyboard", 1u)
           .device("VID_3&PID_3\\C", "Camera", 0u)
           .device("VID_5&PID_5\\E", "Headset", 1u);
    ASSERT_TRUE(protocol::writeFile(file, QJsonDocument(changed.build()).toJson()));

    loop->reconcile();

    ASSERT_EQ(lastDiff.added.size(), 1u);
    EXPECT_EQ(lastDiff.added[0].friendlyName, "Headset");
    ASSERT_EQ(lastDiff.removed.size(), 1u);
    EXPECT_EQ(lastDiff.removed[0].friendlyName, "Hub");
    ASSERT_EQ(lastDiff.changed.size(), 1u);
    EXPECT_EQ(lastDiff.changed[0].sleepState, SleepState::Disabled);
}

TEST_F(ReconciliationLoopTest, UnreadableRootIsReported) {
    image.unreadable(USB_ENUM_ROOT);
    backing = std::make_unique<JsonRegistryStore>(image.build());
    reader = std::make_unique<DeviceRegistryReader>(*backing);
    broker = std::make_unique<PrivilegeBroker>(*backing, nullptr);
    loop = std::make_unique<ReconciliationLoop>(*reader, *broker);

    std::string failure;
    QObject::connect(loop.get(), &ReconciliationLoop::enumerationFailed,
        [&failure](const std::string& reason) { failure = reason; });

    loop->reconcile();
    EXPECT_FALSE(failure.empty());
    EXPECT_TRUE(loop->snapshot().empty());
}

TEST_F(ReconciliationLoopTest, WakeRunsAPass) {
    startAsStandardUser();
    int passes = 0;
    QObject::connect(loop.get(), &ReconciliationLoop::snapshotUpdated,
        [&passes](const std::vector<DeviceSnapshot>&) { ++passes; });

    loop->wake();
    loop->wake();
    EXPECT_EQ(passes, 0);

    waitUntil([&passes]() { return passes > 0; }, 1000);
    waitUntil([]() { return false; }, 50);
    EXPECT_EQ(passes, 1);
}

TEST_F(ReconciliationLoopTest, TimerDrivesPasses) {
    startAsStandardUser();
    int passes = 0;
    QObject::connect(loop.get(), &ReconciliationLoop::snapshotUpdated,
        [&passes](const std::vector<DeviceSnapshot>&) { ++passes; });

    loop->start(std::chrono::milliseconds(20));
    EXPECT_TRUE(loop->isRunning());
    EXPECT_TRUE(waitUntil([&passes]() { return passes >= 3; }));

    loop->stop();
    EXPECT_FALSE(loop->isRunning());
}

} // namespace testing
} // namespace usb_power
