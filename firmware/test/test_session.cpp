/**
 * Hydrolink - Session Coordinator Tests
 * Drives the coordinator through a scripted transport
 */

#include <gtest/gtest.h>
#include <stdio.h>
#include <string>
#include <thread>
#include <vector>
#include "commands.h"
#include "config.h"
#include "fake_transport.h"
#include "hydrolink.h"
#include "session.h"
#include "test_support.h"

namespace {

const char* kBottle = "a4:cf:12:9b:30:e2";
const int64_t kEpoch = 1767225600000LL;

struct ObservedReading {
    SensorReading reading;
    LevelEstimate level;
};

std::string distancePayload(double distance_mm) {
    char buffer[48];
    snprintf(buffer, sizeof(buffer), "{\"distance\":%.1f}", distance_mm);
    return buffer;
}

bool containsText(const std::vector<std::string>& lines, const std::string& text) {
    for (size_t i = 0; i < lines.size(); i++) {
        if (lines[i].find(text) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

class SessionTest : public ::testing::Test {
protected:
    SessionTest()
        : session(transport, store, &sink, FakeClock::monotonic, FakeClock::epoch) {}

    void SetUp() override {
        FakeClock::now_ms = 1000;
        FakeClock::epoch_ms = kEpoch;
        session.begin();
        session.subscribe([this](const SensorReading& r, const LevelEstimate& l) {
            ObservedReading observed;
            observed.reading = r;
            observed.level = l;
            readings.push_back(observed);
        });
        session.subscribeConnection([this](const ConnectionState& s) { phases.push_back(s.phase); });
        session.subscribeCalibration([this](const CalibrationEvent& e) { calibration_events.push_back(e); });
        session.subscribeDevices([this](const std::vector<PeripheralHandle>& d) { device_lists.push_back(d); });
    }

    void connectBottle() {
        ASSERT_TRUE(session.connect(kBottle).ok());
        ASSERT_EQ(CONN_CONNECTED, session.state().phase);
        session.update();
    }

    void sendDistances(double distance_mm, size_t count) {
        for (size_t i = 0; i < count; i++) {
            transport.notify(distancePayload(distance_mm));
        }
    }

    bool sawCalibrationEvent(CalibrationEventKind kind) const {
        for (size_t i = 0; i < calibration_events.size(); i++) {
            if (calibration_events[i].kind == kind) {
                return true;
            }
        }
        return false;
    }

    FakeTransport transport;
    MemoryCalibrationStore store;
    RecordingSink sink;
    SessionCoordinator session;

    std::vector<ObservedReading> readings;
    std::vector<ConnectionPhase> phases;
    std::vector<CalibrationEvent> calibration_events;
    std::vector<std::vector<PeripheralHandle> > device_lists;
};

// ==================== Discovery ====================

TEST_F(SessionTest, ScanCollectsDevicesAndReturnsToIdle) {
    ASSERT_TRUE(session.startScan().ok());
    EXPECT_EQ(CONN_SCANNING, session.state().phase);
    EXPECT_EQ((uint32_t)BLE_SCAN_TIMEOUT_MS, transport.last_scan_timeout_ms);

    transport.discover(kBottle, HYDROLINK_BOTTLE_NAME, -60);
    transport.discover("11:22:33:44:55:66", "", -80);
    transport.discover(kBottle, HYDROLINK_BOTTLE_NAME, -52);

    std::vector<PeripheralHandle> found = session.devices();
    ASSERT_EQ(2u, found.size());
    EXPECT_EQ(kBottle, found[0].id);
    EXPECT_EQ(-52, found[0].rssi);

    transport.finishScan();
    session.update();
    EXPECT_EQ(CONN_IDLE, session.state().phase);
    ASSERT_FALSE(device_lists.empty());
    EXPECT_EQ(2u, device_lists.back().size());
    EXPECT_EQ(0u, session.diagnostics().scan_timeouts);
}

TEST_F(SessionTest, ScanIsIdempotentWhileScanning) {
    ASSERT_TRUE(session.startScan().ok());
    ASSERT_TRUE(session.startScan().ok());
    EXPECT_EQ(1, transport.scan_calls.load());
}

TEST_F(SessionTest, EmptyScanIsNotAFault) {
    ASSERT_TRUE(session.startScan().ok());
    transport.finishScan();

    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(1u, session.diagnostics().scan_timeouts);
}

TEST_F(SessionTest, NewScanClearsPreviousDevices) {
    session.startScan();
    transport.discover(kBottle, HYDROLINK_BOTTLE_NAME, -60);
    transport.finishScan();
    ASSERT_EQ(1u, session.devices().size());

    session.startScan();
    EXPECT_TRUE(session.devices().empty());
}

TEST_F(SessionTest, ScanFailureFaultsAndNextScanClearsIt) {
    transport.scan_error = LinkError(ERR_RADIO_UNAVAILABLE, "radio off");
    EXPECT_EQ(ERR_RADIO_UNAVAILABLE, session.startScan().kind);
    EXPECT_EQ(CONN_FAULTED, session.state().phase);
    EXPECT_EQ(ERR_RADIO_UNAVAILABLE, session.state().error.kind);

    transport.scan_error = LinkError();
    ASSERT_TRUE(session.startScan().ok());
    EXPECT_EQ(CONN_SCANNING, session.state().phase);
    EXPECT_EQ(ERR_NONE, session.state().error.kind);
}

TEST_F(SessionTest, StopScanReturnsToIdle) {
    session.startScan();
    session.stopScan();
    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_FALSE(transport.isScanning());
    EXPECT_EQ(0u, session.diagnostics().scan_timeouts);
}

TEST_F(SessionTest, AdvertisementsOutsideScanAreIgnored) {
    PeripheralHandle stray(kBottle, HYDROLINK_BOTTLE_NAME, -40);
    session.onPeripheralFound(stray);
    EXPECT_TRUE(session.devices().empty());
}

TEST(PeripheralFilter, RecognisesServiceOrBottleName) {
    EXPECT_TRUE(peripheralIsBottle(true, ""));
    EXPECT_TRUE(peripheralIsBottle(true, "Kitchen Sensor"));
    EXPECT_TRUE(peripheralIsBottle(false, HYDROLINK_BOTTLE_NAME));

    EXPECT_FALSE(peripheralIsBottle(false, ""));
    EXPECT_FALSE(peripheralIsBottle(false, "Galaxy Buds"));
    EXPECT_FALSE(peripheralIsBottle(false, "smartwaterbottle"));
}

// ==================== Link ====================

TEST_F(SessionTest, ConnectSubscribesAndReportsPhases) {
    connectBottle();

    EXPECT_EQ(1, transport.connect_calls.load());
    EXPECT_EQ(1, transport.subscribe_calls.load());
    EXPECT_EQ((uint32_t)BLE_CONNECT_TIMEOUT_MS, transport.last_connect_timeout_ms);
    EXPECT_EQ(kBottle, session.state().peripheral.id);

    ASSERT_EQ(2u, phases.size());
    EXPECT_EQ(CONN_CONNECTING, phases[0]);
    EXPECT_EQ(CONN_CONNECTED, phases[1]);
}

TEST_F(SessionTest, ConnectFromScanStopsScanFirst) {
    session.startScan();
    transport.discover(kBottle, HYDROLINK_BOTTLE_NAME, -60);

    ASSERT_TRUE(session.connect(kBottle).ok());
    EXPECT_EQ(1, transport.stop_scan_calls.load());
    EXPECT_EQ(HYDROLINK_BOTTLE_NAME, session.state().peripheral.name);
}

TEST_F(SessionTest, ScanRejectedWhileConnected) {
    connectBottle();
    EXPECT_EQ(ERR_BUSY, session.startScan().kind);
    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
}

TEST_F(SessionTest, SecondConnectWhileConnectedIsBusy) {
    connectBottle();
    EXPECT_EQ(ERR_BUSY, session.connect(kBottle).kind);
    EXPECT_EQ(1, transport.connect_calls.load());
}

TEST_F(SessionTest, ConcurrentConnectIsRejectedWithoutSecondRadioCall) {
    transport.block_connect = true;

    LinkError first;
    std::thread worker([&] { first = session.connect(kBottle); });
    transport.waitForConnect();

    LinkError second = session.connect(kBottle);
    EXPECT_EQ(ERR_BUSY, second.kind);
    EXPECT_EQ(1, transport.connect_calls.load());

    transport.releaseConnect();
    worker.join();
    EXPECT_TRUE(first.ok());
    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
}

TEST_F(SessionTest, DisconnectDuringConnectCancelsIt) {
    transport.block_connect = true;

    LinkError result;
    std::thread worker([&] { result = session.connect(kBottle); });
    transport.waitForConnect();

    session.disconnect();
    worker.join();

    EXPECT_EQ(ERR_CANCELLED, result.kind);
    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(0, transport.subscribe_calls.load());
}

TEST_F(SessionTest, LinkThatComesUpAfterCancelIsReleased) {
    transport.block_connect = true;
    transport.succeed_after_cancel = true;

    LinkError result;
    std::thread worker([&] { result = session.connect(kBottle); });
    transport.waitForConnect();

    session.disconnect();
    worker.join();

    EXPECT_EQ(ERR_CANCELLED, result.kind);
    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(2, transport.disconnect_calls.load());
    EXPECT_FALSE(transport.isConnected());
}

TEST_F(SessionTest, ConnectFailureFaultsAndRetryClearsIt) {
    transport.connect_error = LinkError(ERR_CONNECT_TIMEOUT, "no response");
    EXPECT_EQ(ERR_CONNECT_TIMEOUT, session.connect(kBottle).kind);

    ConnectionState state = session.state();
    EXPECT_EQ(CONN_FAULTED, state.phase);
    EXPECT_EQ(ERR_CONNECT_TIMEOUT, state.error.kind);

    transport.connect_error = LinkError();
    ASSERT_TRUE(session.connect(kBottle).ok());
    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
    EXPECT_EQ(ERR_NONE, session.state().error.kind);
}

TEST_F(SessionTest, SubscribeFailureFaultsAndDropsLink) {
    transport.subscribe_error = LinkError(ERR_CHARACTERISTIC_NOT_FOUND, "no telemetry");
    EXPECT_EQ(ERR_CHARACTERISTIC_NOT_FOUND, session.connect(kBottle).kind);

    EXPECT_EQ(CONN_FAULTED, session.state().phase);
    EXPECT_EQ(1, transport.disconnect_calls.load());
}

TEST_F(SessionTest, DisconnectFromFaultedReturnsToIdle) {
    transport.connect_error = LinkError(ERR_SERVICE_NOT_FOUND, "wrong device");
    session.connect(kBottle);

    session.disconnect();
    EXPECT_EQ(CONN_IDLE, session.state().phase);
}

TEST_F(SessionTest, DisconnectWhenIdleIsNoop) {
    session.disconnect();
    EXPECT_EQ(0, transport.disconnect_calls.load());
    EXPECT_EQ(CONN_IDLE, session.state().phase);
}

TEST_F(SessionTest, PeripheralDropReturnsToIdle) {
    connectBottle();
    transport.dropLink("peer closed");
    session.update();

    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(0, transport.disconnect_calls.load());
    EXPECT_EQ(CONN_IDLE, phases.back());
}

TEST_F(SessionTest, StaleLinkLossIsIgnored) {
    connectBottle();
    ConnectionHandle old = transport.link();
    session.disconnect();
    connectBottle();

    session.onLinkLost(old, "late callback");
    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
}

// ==================== Telemetry ====================

TEST_F(SessionTest, ReadingBelowMinimumIsNoBottle) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("alice");
    connectBottle();

    transport.notify("{\"distance\":30}");
    session.update();

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(LEVEL_NO_BOTTLE, readings[0].level.source);
    EXPECT_DOUBLE_EQ(0.0, readings[0].level.level_pct);
    EXPECT_DOUBLE_EQ(0.0, readings[0].level.volume_ml);
    EXPECT_EQ(1u, session.diagnostics().no_bottle_readings);

    ASSERT_EQ(1u, sink.samples.size());
    EXPECT_EQ("alice", sink.samples[0].subject_id);
    EXPECT_DOUBLE_EQ(0.0, sink.samples[0].volume_ml);
}

TEST_F(SessionTest, CalibratedReadingFeedsAccounting) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("alice");
    connectBottle();

    FakeClock::epoch_ms = kEpoch + 5000;
    transport.notify("{\"distance\":75}");
    session.update();

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(LEVEL_CALIBRATED, readings[0].level.source);
    EXPECT_DOUBLE_EQ(50.0, readings[0].level.level_pct);
    EXPECT_DOUBLE_EQ(250.0, readings[0].level.volume_ml);
    EXPECT_EQ(kBottle, readings[0].reading.source_id);

    ASSERT_EQ(1u, sink.samples.size());
    EXPECT_DOUBLE_EQ(250.0, sink.samples[0].volume_ml);
    EXPECT_DOUBLE_EQ(50.0, sink.samples[0].level_pct);
    EXPECT_EQ(kEpoch + 5000, sink.samples[0].timestamp_ms);
}

TEST_F(SessionTest, UncalibratedFallsBackToDeviceLevel) {
    session.setActiveSubject("bob");
    connectBottle();

    transport.notify("{\"p\":87,\"d\":52.5}");
    session.update();

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(LEVEL_DEVICE_REPORTED, readings[0].level.source);
    EXPECT_DOUBLE_EQ(87.0, readings[0].level.level_pct);
    EXPECT_DOUBLE_EQ(870.0, readings[0].level.volume_ml);
    EXPECT_EQ(1u, sink.samples.size());
}

TEST_F(SessionTest, DeviceLevelIsClamped) {
    session.setActiveSubject("bob");
    connectBottle();

    transport.notify("{\"p\":140,\"d\":50}");
    session.update();

    ASSERT_EQ(1u, readings.size());
    EXPECT_DOUBLE_EQ(100.0, readings[0].level.level_pct);
}

TEST_F(SessionTest, NoLevelWithoutCalibrationOrDeviceLevel) {
    session.setActiveSubject("bob");
    connectBottle();

    transport.notify("120");
    session.update();

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(LEVEL_UNAVAILABLE, readings[0].level.source);
    EXPECT_FALSE(readings[0].level.hasLevel());
    EXPECT_TRUE(sink.samples.empty());
}

TEST_F(SessionTest, GarbagePayloadChangesNothing) {
    connectBottle();
    size_t phase_events = phases.size();

    transport.notify("hello");
    transport.notify("{\"foo\":1}");
    session.update();

    EXPECT_TRUE(readings.empty());
    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
    EXPECT_EQ(phase_events, phases.size());
    EXPECT_EQ(2u, session.diagnostics().payloads_dropped);
    EXPECT_FALSE(session.diagnostics().has_reading);
}

TEST_F(SessionTest, ReadingWithoutSubjectIsNotAccounted) {
    connectBottle();

    transport.notify("{\"p\":50,\"d\":80}");
    session.update();

    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(LEVEL_DEVICE_REPORTED, readings[0].level.source);
    EXPECT_TRUE(sink.samples.empty());
    EXPECT_EQ(1u, session.diagnostics().unattributed_readings);
}

TEST_F(SessionTest, PayloadFromStaleLinkIsIgnored) {
    connectBottle();
    ConnectionHandle old = transport.link();
    session.disconnect();

    transport.notifyOn(old, "{\"distance\":75}");
    session.update();
    EXPECT_TRUE(readings.empty());
    EXPECT_EQ(0u, session.diagnostics().readings);
}

TEST_F(SessionTest, SubjectSwitchReloadsCalibration) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    store.records["carol"] = makeCalibration(200.0, 50.0, 750);
    session.setActiveSubject("alice");
    connectBottle();

    transport.notify("{\"distance\":75}");
    session.setActiveSubject("carol");
    transport.notify("{\"distance\":125}");
    session.update();

    ASSERT_EQ(2u, readings.size());
    EXPECT_DOUBLE_EQ(50.0, readings[0].level.level_pct);
    EXPECT_DOUBLE_EQ(250.0, readings[0].level.volume_ml);
    EXPECT_DOUBLE_EQ(50.0, readings[1].level.level_pct);
    EXPECT_DOUBLE_EQ(375.0, readings[1].level.volume_ml);

    ASSERT_EQ(2u, sink.samples.size());
    EXPECT_EQ("alice", sink.samples[0].subject_id);
    EXPECT_EQ("carol", sink.samples[1].subject_id);
    EXPECT_DOUBLE_EQ(200.0, session.activeCalibration().empty_baseline_mm);
}

TEST_F(SessionTest, UnknownSubjectStartsUncalibrated) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("alice");
    EXPECT_TRUE(session.isCalibrated());

    session.setActiveSubject("dave");
    EXPECT_FALSE(session.isCalibrated());
    EXPECT_EQ((uint32_t)CAL_DEFAULT_CAPACITY_ML, session.activeCalibration().bottle_capacity_ml);
    EXPECT_EQ("dave", session.activeSubject());

    session.clearActiveSubject();
    EXPECT_FALSE(session.hasActiveSubject());
}

TEST_F(SessionTest, FreshnessFollowsLastReading) {
    connectBottle();
    EXPECT_FALSE(session.isDataFresh());
    EXPECT_EQ(UINT32_MAX, session.millisSinceLastReading());

    transport.notify("90");
    EXPECT_TRUE(session.isDataFresh());

    FakeClock::now_ms += SESSION_DATA_FRESH_MS - 1;
    EXPECT_TRUE(session.isDataFresh());
    FakeClock::now_ms += 1;
    EXPECT_FALSE(session.isDataFresh());
    EXPECT_EQ((uint32_t)SESSION_DATA_FRESH_MS, session.millisSinceLastReading());
}

// ==================== Calibration ====================

TEST_F(SessionTest, FullRitualCompletesAndSaves) {
    session.setActiveSubject("bob");
    connectBottle();

    ASSERT_TRUE(session.beginCalibration(CAL_STEP_EMPTY).ok());
    EXPECT_EQ(CAL_STEP_EMPTY, session.calibrationStep());
    sendDistances(120.0, CAL_SAMPLES_PER_STEP - 1);
    sendDistances(123.0, 1);
    EXPECT_EQ(CAL_STEP_NONE, session.calibrationStep());
    EXPECT_TRUE(session.isEmptyCalibrated());
    EXPECT_FALSE(session.isCalibrated());

    FakeClock::epoch_ms = kEpoch + 60000;
    ASSERT_TRUE(session.beginCalibration(CAL_STEP_FULL).ok());
    sendDistances(27.0, 1);
    sendDistances(30.0, CAL_SAMPLES_PER_STEP - 1);
    session.update();

    EXPECT_TRUE(session.isCalibrated());
    EXPECT_TRUE(session.isFullCalibrated());
    ASSERT_EQ(1u, store.records.count("bob"));
    const Calibration& saved = store.records["bob"];
    EXPECT_DOUBLE_EQ(123.0, saved.empty_baseline_mm);
    EXPECT_DOUBLE_EQ(27.0, saved.full_baseline_mm);
    EXPECT_TRUE(saved.is_complete);
    EXPECT_EQ(kEpoch + 60000, saved.calibrated_at);

    std::vector<std::string> writes = transport.writtenCommands();
    ASSERT_EQ(3u, writes.size());
    EXPECT_TRUE(containsText(writes, "\"step\":\"start_empty\""));
    EXPECT_TRUE(containsText(writes, "\"step\":\"start_full\""));
    EXPECT_EQ(commandCalibration(CAL_CMD_COMPLETE, kEpoch + 60000), writes[2]);

    ASSERT_EQ(4u, calibration_events.size());
    EXPECT_EQ(CAL_EVENT_STEP_STARTED, calibration_events[0].kind);
    EXPECT_EQ(CAL_EVENT_STEP_DONE, calibration_events[1].kind);
    EXPECT_EQ(CAL_EVENT_STEP_STARTED, calibration_events[2].kind);
    EXPECT_EQ(CAL_EVENT_COMPLETE, calibration_events[3].kind);
    EXPECT_TRUE(calibration_events[3].error.ok());
    EXPECT_EQ("bob", calibration_events[3].subject_id);

    // Readings after completion use the new calibration
    readings.clear();
    transport.notify("{\"distance\":75}");
    session.update();
    ASSERT_EQ(1u, readings.size());
    EXPECT_EQ(LEVEL_CALIBRATED, readings[0].level.source);
    EXPECT_DOUBLE_EQ(50.0, readings[0].level.level_pct);
}

TEST_F(SessionTest, InvertedRitualLeavesStoreUntouched) {
    store.records["bob"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("bob");
    connectBottle();

    session.beginCalibration(CAL_STEP_EMPTY);
    sendDistances(45.0, CAL_SAMPLES_PER_STEP);
    session.beginCalibration(CAL_STEP_FULL);
    sendDistances(100.0, CAL_SAMPLES_PER_STEP);
    session.update();

    EXPECT_TRUE(sawCalibrationEvent(CAL_EVENT_INVALID));
    EXPECT_FALSE(sawCalibrationEvent(CAL_EVENT_COMPLETE));
    EXPECT_EQ(0, store.save_calls);
    EXPECT_DOUBLE_EQ(123.0, store.records["bob"].empty_baseline_mm);

    // Active calibration is still the stored one
    EXPECT_TRUE(session.isCalibrated());
    EXPECT_DOUBLE_EQ(27.0, session.activeCalibration().full_baseline_mm);

    EXPECT_EQ(ERR_CALIBRATION_INVALID, session.completeCalibration().kind);
}

TEST_F(SessionTest, DisconnectWhileArmedKeepsCalibration) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("alice");
    connectBottle();

    ASSERT_TRUE(session.beginCalibration(CAL_STEP_EMPTY).ok());
    sendDistances(150.0, 5);
    session.disconnect();
    session.update();

    EXPECT_EQ(CAL_STEP_NONE, session.calibrationStep());
    EXPECT_TRUE(sawCalibrationEvent(CAL_EVENT_CANCELLED));
    EXPECT_EQ(0, store.save_calls);

    Calibration active = session.activeCalibration();
    EXPECT_DOUBLE_EQ(123.0, active.empty_baseline_mm);
    EXPECT_DOUBLE_EQ(27.0, active.full_baseline_mm);
    EXPECT_TRUE(session.isCalibrated());
}

TEST_F(SessionTest, LinkLossWhileArmedCancelsStep) {
    session.setActiveSubject("alice");
    connectBottle();

    session.beginCalibration(CAL_STEP_FULL);
    transport.dropLink("peer closed");
    session.update();

    EXPECT_EQ(CAL_STEP_NONE, session.calibrationStep());
    EXPECT_TRUE(sawCalibrationEvent(CAL_EVENT_CANCELLED));
}

TEST_F(SessionTest, CalibrationNeedsLink) {
    EXPECT_EQ(ERR_NOT_CONNECTED, session.beginCalibration(CAL_STEP_EMPTY).kind);
    EXPECT_EQ(CAL_STEP_NONE, session.calibrationStep());
}

TEST_F(SessionTest, CompleteWhileCollectingIsBusy) {
    connectBottle();
    session.beginCalibration(CAL_STEP_EMPTY);
    EXPECT_EQ(ERR_BUSY, session.completeCalibration().kind);
}

TEST_F(SessionTest, CompleteWithoutSubjectActivatesButDoesNotSave) {
    connectBottle();

    session.beginCalibration(CAL_STEP_EMPTY);
    sendDistances(123.0, CAL_SAMPLES_PER_STEP);
    session.beginCalibration(CAL_STEP_FULL);
    sendDistances(27.0, CAL_SAMPLES_PER_STEP);
    session.update();

    EXPECT_TRUE(session.isCalibrated());
    EXPECT_EQ(0, store.save_calls);
    ASSERT_TRUE(sawCalibrationEvent(CAL_EVENT_COMPLETE));
    EXPECT_EQ(ERR_NO_ACTIVE_SUBJECT, calibration_events.back().error.kind);
}

TEST_F(SessionTest, StorageFailureIsReportedOnComplete) {
    store.fail_writes = true;
    session.setActiveSubject("bob");
    connectBottle();

    session.beginCalibration(CAL_STEP_EMPTY);
    sendDistances(123.0, CAL_SAMPLES_PER_STEP);
    session.beginCalibration(CAL_STEP_FULL);
    sendDistances(27.0, CAL_SAMPLES_PER_STEP);
    session.update();

    EXPECT_TRUE(session.isCalibrated());
    EXPECT_EQ(1, store.save_calls);
    ASSERT_TRUE(sawCalibrationEvent(CAL_EVENT_COMPLETE));
    EXPECT_EQ(ERR_STORAGE_FAILED, calibration_events.back().error.kind);
}

TEST_F(SessionTest, RitualCompletionWaitsForLoopTask) {
    store.callback_flag = &transport.in_callback;
    session.setActiveSubject("bob");
    connectBottle();

    ASSERT_TRUE(session.beginCalibration(CAL_STEP_EMPTY).ok());
    sendDistances(123.0, CAL_SAMPLES_PER_STEP);
    ASSERT_TRUE(session.beginCalibration(CAL_STEP_FULL).ok());
    sendDistances(27.0, CAL_SAMPLES_PER_STEP);

    // Collected, but nothing saved or written from the notification path
    EXPECT_TRUE(session.isFullCalibrated());
    EXPECT_FALSE(session.isCalibrated());
    EXPECT_EQ(0, store.save_calls);
    EXPECT_EQ(2u, transport.writtenCommands().size());

    session.update();
    EXPECT_TRUE(session.isCalibrated());
    EXPECT_EQ(1, store.save_calls);
    EXPECT_EQ(0, store.saves_during_callback);
    EXPECT_EQ(3u, transport.writtenCommands().size());
    EXPECT_EQ(0, transport.writes_during_callback.load());
    EXPECT_TRUE(sawCalibrationEvent(CAL_EVENT_COMPLETE));

    session.update();
    EXPECT_EQ(1, store.save_calls);
    EXPECT_EQ(3u, transport.writtenCommands().size());
}

TEST_F(SessionTest, CompletionWriteFailureDropsLinkFromLoopTask) {
    session.setActiveSubject("bob");
    connectBottle();

    session.beginCalibration(CAL_STEP_EMPTY);
    sendDistances(123.0, CAL_SAMPLES_PER_STEP);
    ASSERT_TRUE(session.beginCalibration(CAL_STEP_FULL).ok());
    transport.write_error = LinkError(ERR_WRITE_FAILED, "gatt error");
    sendDistances(27.0, CAL_SAMPLES_PER_STEP);

    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
    EXPECT_EQ(0, transport.disconnect_calls.load());

    session.update();
    EXPECT_EQ(CONN_FAULTED, session.state().phase);
    EXPECT_EQ(1, transport.disconnect_calls.load());
    EXPECT_EQ(0, transport.disconnects_during_callback.load());
    EXPECT_EQ(1u, store.records.count("bob"));
}

TEST_F(SessionTest, ExplicitCompleteTakesOverFinishedRitual) {
    session.setActiveSubject("bob");
    connectBottle();

    session.beginCalibration(CAL_STEP_EMPTY);
    sendDistances(123.0, CAL_SAMPLES_PER_STEP);
    session.beginCalibration(CAL_STEP_FULL);
    sendDistances(27.0, CAL_SAMPLES_PER_STEP);

    ASSERT_TRUE(session.completeCalibration().ok());
    session.update();

    EXPECT_EQ(1, store.save_calls);
    EXPECT_EQ(3u, transport.writtenCommands().size());
    size_t completes = 0;
    for (size_t i = 0; i < calibration_events.size(); i++) {
        if (calibration_events[i].kind == CAL_EVENT_COMPLETE) {
            completes++;
        }
    }
    EXPECT_EQ(1u, completes);
}

TEST_F(SessionTest, FinishedRitualIsSavedForSubjectThatCollectedIt) {
    session.setActiveSubject("bob");
    connectBottle();

    session.beginCalibration(CAL_STEP_EMPTY);
    sendDistances(123.0, CAL_SAMPLES_PER_STEP);
    session.beginCalibration(CAL_STEP_FULL);
    sendDistances(27.0, CAL_SAMPLES_PER_STEP);
    session.setActiveSubject("carol");
    session.update();

    ASSERT_EQ(1u, store.records.count("bob"));
    EXPECT_DOUBLE_EQ(123.0, store.records["bob"].empty_baseline_mm);
    EXPECT_EQ(0u, store.records.count("carol"));
    EXPECT_EQ(1, store.save_calls);
    EXPECT_FALSE(session.isCalibrated());
}

TEST_F(SessionTest, SubjectSwitchWhileArmedCancelsStep) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    store.records["carol"] = makeCalibration(200.0, 50.0, 750);
    session.setActiveSubject("alice");
    connectBottle();

    ASSERT_TRUE(session.beginCalibration(CAL_STEP_EMPTY).ok());
    sendDistances(150.0, 5);
    session.setActiveSubject("carol");

    // Readings after the switch no longer feed the abandoned step
    sendDistances(150.0, CAL_SAMPLES_PER_STEP);
    session.update();

    EXPECT_EQ(CAL_STEP_NONE, session.calibrationStep());
    ASSERT_TRUE(sawCalibrationEvent(CAL_EVENT_CANCELLED));
    EXPECT_FALSE(sawCalibrationEvent(CAL_EVENT_STEP_DONE));
    for (size_t i = 0; i < calibration_events.size(); i++) {
        if (calibration_events[i].kind == CAL_EVENT_CANCELLED) {
            EXPECT_EQ(CAL_STEP_EMPTY, calibration_events[i].step);
            EXPECT_EQ("alice", calibration_events[i].subject_id);
        }
    }

    EXPECT_EQ(0, store.save_calls);
    EXPECT_DOUBLE_EQ(123.0, store.records["alice"].empty_baseline_mm);
    EXPECT_DOUBLE_EQ(27.0, store.records["alice"].full_baseline_mm);
    EXPECT_DOUBLE_EQ(200.0, store.records["carol"].empty_baseline_mm);
    EXPECT_DOUBLE_EQ(50.0, store.records["carol"].full_baseline_mm);
    EXPECT_DOUBLE_EQ(200.0, session.activeCalibration().empty_baseline_mm);
    EXPECT_TRUE(session.isCalibrated());
}

TEST_F(SessionTest, ReplayedReadingsFeedTheRitual) {
    connectBottle();
    session.beginCalibration(CAL_STEP_EMPTY);

    SensorReading reading;
    reading.distance_mm = 110.0;
    for (size_t i = 0; i + 1 < CAL_SAMPLES_PER_STEP; i++) {
        EXPECT_EQ(CAL_FEED_COLLECTING, session.feedReadingToCalibration(reading));
    }
    EXPECT_EQ(CAL_FEED_STEP_DONE, session.feedReadingToCalibration(reading));
    EXPECT_EQ(CAL_FEED_IGNORED, session.feedReadingToCalibration(reading));
    EXPECT_TRUE(session.isEmptyCalibrated());
    EXPECT_EQ(CAL_IDLE, session.diagnostics().calibration_state);
}

TEST_F(SessionTest, StartWriteFailureAbandonsStep) {
    connectBottle();
    transport.write_error = LinkError(ERR_WRITE_FAILED, "gatt error");

    EXPECT_EQ(ERR_WRITE_FAILED, session.beginCalibration(CAL_STEP_EMPTY).kind);
    EXPECT_EQ(CAL_STEP_NONE, session.calibrationStep());
}

TEST_F(SessionTest, ClearCalibrationForgetsStoredRecord) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("alice");

    ASSERT_TRUE(session.clearCalibration().ok());
    EXPECT_FALSE(session.isCalibrated());
    EXPECT_EQ(0u, store.records.count("alice"));
    session.update();
    EXPECT_TRUE(sawCalibrationEvent(CAL_EVENT_CLEARED));
}

TEST_F(SessionTest, CapacityIsRangeCheckedAndSaved) {
    store.records["alice"] = makeCalibration(123.0, 27.0, 500);
    session.setActiveSubject("alice");

    EXPECT_EQ(ERR_INVALID_ARGUMENT, session.setBottleCapacity(CAL_MIN_CAPACITY_ML - 1).kind);
    EXPECT_EQ(ERR_INVALID_ARGUMENT, session.setBottleCapacity(CAL_MAX_CAPACITY_ML + 1).kind);
    EXPECT_EQ(0, store.save_calls);

    ASSERT_TRUE(session.setBottleCapacity(750).ok());
    EXPECT_EQ(750u, session.activeCalibration().bottle_capacity_ml);
    EXPECT_EQ(750u, store.records["alice"].bottle_capacity_ml);
    EXPECT_TRUE(store.records["alice"].is_complete);
}

// ==================== Control Writes ====================

TEST_F(SessionTest, WritesNeedConnectedLink) {
    EXPECT_EQ(ERR_NOT_CONNECTED, session.wake().kind);
    EXPECT_EQ(ERR_NOT_CONNECTED, session.enterSleep(30).kind);
    EXPECT_EQ(ERR_NOT_CONNECTED, session.sendRawCommand("ping").kind);
    EXPECT_TRUE(transport.writtenCommands().empty());
}

TEST_F(SessionTest, WakeAndConfigEnvelopes) {
    connectBottle();

    ASSERT_TRUE(session.wake().ok());
    ASSERT_TRUE(session.sendConfigUpdate("{\"interval\":5}").ok());
    EXPECT_EQ(ERR_INVALID_ARGUMENT, session.sendConfigUpdate("[1,2]").kind);
    EXPECT_EQ(ERR_INVALID_ARGUMENT, session.sendRawCommand("").kind);

    std::vector<std::string> writes = transport.writtenCommands();
    ASSERT_EQ(2u, writes.size());
    EXPECT_EQ(commandWake(kEpoch), writes[0]);
    EXPECT_EQ("{\"action\":\"config_update\",\"config\":{\"interval\":5},\"timestamp\":1767225600000}",
              writes[1]);
}

TEST_F(SessionTest, SleepReleasesLinkAfterGrace) {
    connectBottle();

    ASSERT_TRUE(session.enterSleep(30).ok());
    EXPECT_EQ(commandDeepSleep(30, kEpoch), transport.writtenCommands().back());

    FakeClock::now_ms += SESSION_SLEEP_GRACE_MS - 1;
    session.update();
    EXPECT_EQ(CONN_CONNECTED, session.state().phase);
    EXPECT_EQ(0, transport.disconnect_calls.load());

    FakeClock::now_ms += 1;
    session.update();
    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(1, transport.disconnect_calls.load());
}

TEST_F(SessionTest, SleepGraceEndsEarlyWhenBottleDrops) {
    connectBottle();
    session.enterSleep(30);

    transport.dropLink("bottle asleep");
    FakeClock::now_ms += SESSION_SLEEP_GRACE_MS;
    session.update();

    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(0, transport.disconnect_calls.load());
}

TEST_F(SessionTest, SleepDurationIsRangeChecked) {
    connectBottle();
    EXPECT_EQ(ERR_INVALID_ARGUMENT, session.enterSleep(0).kind);
    EXPECT_EQ(ERR_INVALID_ARGUMENT, session.enterSleep(SESSION_SLEEP_MAX_MINUTES + 1).kind);
    EXPECT_TRUE(transport.writtenCommands().empty());
}

TEST_F(SessionTest, WriteFailureFaultsAndDropsLink) {
    connectBottle();
    transport.write_error = LinkError(ERR_WRITE_FAILED, "gatt error");

    EXPECT_EQ(ERR_WRITE_FAILED, session.wake().kind);
    EXPECT_EQ(CONN_FAULTED, session.state().phase);
    EXPECT_EQ(ERR_WRITE_FAILED, session.state().error.kind);
    EXPECT_EQ(1, transport.disconnect_calls.load());
    EXPECT_EQ(1u, session.diagnostics().write_failures);

    transport.write_error = LinkError();
    ASSERT_TRUE(session.connect(kBottle).ok());
}

// ==================== Observers ====================

TEST_F(SessionTest, ObserverMayUnsubscribeDuringDelivery) {
    int calls = 0;
    SubscriptionHandle handle = INVALID_SUBSCRIPTION;
    handle = session.subscribe([&](const SensorReading&, const LevelEstimate&) {
        calls++;
        session.unsubscribe(handle);
    });
    connectBottle();

    transport.notify("90");
    session.update();
    transport.notify("91");
    session.update();

    EXPECT_EQ(1, calls);
    EXPECT_EQ(2u, readings.size());
}

TEST_F(SessionTest, ObserverMayCallBackIntoCoordinator) {
    std::vector<ConnectionPhase> seen;
    session.subscribeConnection([&](const ConnectionState&) {
        seen.push_back(session.state().phase);
        session.diagnostics();
    });

    connectBottle();
    ASSERT_EQ(2u, seen.size());
    EXPECT_EQ(CONN_CONNECTED, seen[1]);
}

TEST_F(SessionTest, UnsubscribeUnknownHandle) {
    EXPECT_FALSE(session.unsubscribe(INVALID_SUBSCRIPTION));
    EXPECT_FALSE(session.unsubscribe(0xFFFFFFF0u));
}

TEST_F(SessionTest, QueueOverflowDropsOldestReadings) {
    SessionConfig config = session.config();
    config.event_queue_depth = 4;
    session.setConfig(config);
    connectBottle();

    for (int i = 0; i < 10; i++) {
        transport.notify(distancePayload(60.0 + i));
    }
    session.update();

    ASSERT_EQ(4u, readings.size());
    EXPECT_DOUBLE_EQ(66.0, readings[0].reading.distance_mm);
    EXPECT_DOUBLE_EQ(69.0, readings[3].reading.distance_mm);
    EXPECT_EQ(6u, session.diagnostics().events_dropped);
    EXPECT_EQ(10u, session.diagnostics().readings);
}

TEST_F(SessionTest, StateChangesSurviveOverflow) {
    SessionConfig config = session.config();
    config.event_queue_depth = 2;
    session.setConfig(config);
    connectBottle();

    sendDistances(80.0, 5);
    session.disconnect();
    session.update();

    EXPECT_EQ(CONN_IDLE, phases.back());
    EXPECT_EQ(CONN_DISCONNECTING, phases[phases.size() - 2]);
}

// ==================== Lifecycle ====================

TEST_F(SessionTest, ShutdownDropsLinkAndObservers) {
    connectBottle();
    session.shutdown();

    EXPECT_EQ(nullptr, transport.listener);
    EXPECT_EQ(CONN_IDLE, session.state().phase);
    EXPECT_EQ(1, transport.disconnect_calls.load());

    size_t before = phases.size();
    session.begin();
    session.connect(kBottle);
    session.update();
    EXPECT_EQ(before, phases.size());
}

TEST_F(SessionTest, DiagnosticsReportNamesState) {
    LogCapture capture;
    session.setActiveSubject("alice");
    connectBottle();
    transport.notify("90");

    std::string report = session.diagnosticsReport();
    EXPECT_NE(std::string::npos, report.find("State: CONNECTED"));
    EXPECT_NE(std::string::npos, report.find("Subject: alice"));
    EXPECT_NE(std::string::npos, report.find("Last reading: 90.0mm"));
    EXPECT_TRUE(capture.contains("Connected to"));
}
