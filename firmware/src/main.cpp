/**
 * Hydrolink - Smart Bottle Link Hub Firmware
 * Main entry point
 */

#include <Arduino.h>
#include <nvs_flash.h>
#include <sys/time.h>
#include <map>
#include "hydrolink.h"
#include "config.h"

#include "ble_central.h"
#include "session.h"
#include "storage.h"

// Serial console (conditional)
#if ENABLE_SERIAL_COMMANDS
#include "serial_commands.h"
#endif

// Volume drop treated as a sip rather than sensor jitter
#define CONSUMPTION_MIN_DROP_ML     15.0

// Log output goes to USB serial
static void serialLogSink(const char* message) {
    Serial.print(message);
}

static uint32_t hubMillis() {
    return millis();
}

// Unix time in ms; runs from 1970 until something sets the clock
static int64_t hubEpochMs() {
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return (int64_t)tv.tv_sec * 1000 + tv.tv_usec / 1000;
}

// Consumption accounting: logs sips (volume drops) per subject
class SerialConsumptionLog : public ConsumptionSink {
public:
    void onVolumeSample(const std::string& subject_id, double volume_ml,
                        double level_pct, int64_t timestamp_ms) {
        std::map<std::string, double>::iterator it = m_last_volume.find(subject_id);
        if (it == m_last_volume.end()) {
            m_last_volume[subject_id] = volume_ml;
            return;
        }

        double drop = it->second - volume_ml;
        if (drop >= CONSUMPTION_MIN_DROP_ML) {
            m_total_ml[subject_id] += drop;
            LOG_PRINTF("Consumption: '%s' drank %.0fml (total %.0fml, now %.0f%%) at %lld\n",
                       subject_id.c_str(), drop, m_total_ml[subject_id], level_pct,
                       (long long)timestamp_ms);
            it->second = volume_ml;
        } else if (drop < 0.0) {
            // Refill (or level rising back after a tilt)
            it->second = volume_ml;
        }
    }

private:
    std::map<std::string, double> m_last_volume;
    std::map<std::string, double> m_total_ml;
};

// Hub objects
static BleCentral g_ble;
static NvsCalibrationStore g_store;
static SerialConsumptionLog g_consumption;
static SessionCoordinator g_session(g_ble, g_store, &g_consumption, hubMillis, hubEpochMs);

static void onConnectionChanged(const ConnectionState& state) {
    if (state.phase == CONN_FAULTED) {
        Serial.printf(">> %s: %s\n", errorKindName(state.error.kind), errorRemediation(state.error.kind));
    } else if (state.phase == CONN_CONNECTED) {
        Serial.printf(">> Connected to %s\n",
                      state.peripheral.name.empty() ? state.peripheral.id.c_str() : state.peripheral.name.c_str());
    } else if (state.phase == CONN_IDLE) {
        Serial.println(">> Idle");
    }
}

static void onDevicesChanged(const std::vector<PeripheralHandle>& devices) {
    if (!devices.empty()) {
        const PeripheralHandle& latest = devices.back();
        Serial.printf(">> [%u] %s %s\n", (unsigned)(devices.size() - 1), latest.id.c_str(),
                      latest.name.c_str());
    }
}

static void onReading(const SensorReading& reading, const LevelEstimate& level) {
    DEBUG_PRINTF(g_debug_telemetry, ">> %.1fmm -> %.0f%% %.0fml (%s)\n", reading.distance_mm,
                 level.level_pct, level.volume_ml, levelSourceName(level.source));
}

static void onCalibrationEvent(const CalibrationEvent& event) {
    switch (event.kind) {
        case CAL_EVENT_STEP_DONE:
            Serial.printf(">> Empty baseline %.1fmm captured. Now fill the bottle and run CAL FULL\n",
                          event.calibration.empty_baseline_mm);
            break;
        case CAL_EVENT_COMPLETE:
            Serial.printf(">> Calibration complete for '%s'%s\n", event.subject_id.c_str(),
                          event.error.ok() ? "" : " (not saved)");
            break;
        case CAL_EVENT_INVALID:
            Serial.printf(">> Calibration invalid: %s\n", errorRemediation(ERR_CALIBRATION_INVALID));
            break;
        case CAL_EVENT_CANCELLED:
            Serial.println(">> Calibration step cancelled");
            break;
        default:
            break;
    }
}

void setup() {
    Serial.begin(115200);
    delay(1000);  // Let USB serial come up
    logSetSink(serialLogSink);

    Serial.println("\n=================================");
    Serial.printf("Hydrolink Hub v%s\n", HYDROLINK_VERSION);
    Serial.println("=================================");

    // NVS (erase and retry if the partition layout changed)
    esp_err_t nvs_err = nvs_flash_init();
    if (nvs_err == ESP_ERR_NVS_NO_FREE_PAGES || nvs_err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        Serial.println("NVS: Erasing and reinitializing");
        nvs_flash_erase();
        nvs_flash_init();
    }

    if (!storageInit()) {
        Serial.println("WARNING: Storage unavailable, calibrations will not persist");
    }

    SessionConfig config;
    if (!storageLoadSessionConfig(config)) {
        Serial.println("Using default hub settings");
    }
    g_session.setConfig(config);

    if (!g_ble.init(HYDROLINK_HUB_NAME)) {
        Serial.println("ERROR: BLE init failed");
    }

    g_session.begin();
    g_session.subscribeConnection(onConnectionChanged);
    g_session.subscribeDevices(onDevicesChanged);
    g_session.subscribe(onReading);
    g_session.subscribeCalibration(onCalibrationEvent);
    g_session.setActiveSubject(storageLoadActiveSubject());

#if ENABLE_SERIAL_COMMANDS
    serialCommandsInit(&g_session);
    Serial.println("Type HELP for commands, SCAN to find bottles");
#endif
}

void loop() {
    // Check for serial commands (conditional)
#if ENABLE_SERIAL_COMMANDS
    serialCommandsUpdate();
    if (serialCommandsShutdownRequested()) {
        delay(100);
        return;
    }
#endif

    // Radio housekeeping, sleep grace timer, observer delivery
    g_session.update();

    delay(10);
}
