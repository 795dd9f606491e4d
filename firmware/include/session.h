/**
 * Hydrolink - Session Coordinator
 * Owns the connection state machine and routes telemetry
 *
 * One coordinator per hub. It drives the transport (scan, connect, subscribe,
 * write, disconnect), decodes every payload, feeds the calibration engine,
 * turns readings into level estimates and fans everything out to observers.
 *
 * Threading: transport callbacks run on the radio stack's task and only
 * decode, update state and enqueue. Anything that blocks (saving a
 * calibration, control writes, tearing a link down) runs from update().
 * Observers and the consumption sink are
 * called from update(), on the loop task, with no coordinator lock held, so
 * a callback may call straight back into the coordinator.
 */

#ifndef SESSION_H
#define SESSION_H

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "calibration.h"
#include "observers.h"
#include "storage.h"
#include "telemetry.h"
#include "transport.h"
#include "types.h"

// ==================== Collaborators ====================

// Consumption accounting (owned by the application). Receives the current
// volume for the active subject on every reading that produced a level.
class ConsumptionSink {
public:
    virtual ~ConsumptionSink() {}
    virtual void onVolumeSample(const std::string& subject_id, double volume_ml,
                                double level_pct, int64_t timestamp_ms) = 0;
};

// Clocks are injected so tests can drive time
typedef uint32_t (*MonotonicClockFn)();     // ms, wraps
typedef int64_t (*EpochClockFn)();          // Unix time in ms

// Runtime settings, persisted by storage.cpp; defaults from config.h
struct SessionConfig {
    uint32_t scan_timeout_ms;
    uint32_t connect_timeout_ms;
    double min_valid_distance_mm;   // Readings closer than this mean "no bottle"
    uint32_t sleep_grace_ms;        // Wait after deep_sleep before dropping the link
    uint32_t data_fresh_ms;
    uint32_t default_capacity_ml;   // Used when no calibration carries one
    size_t event_queue_depth;
};

SessionConfig sessionDefaultConfig();

// ==================== Level Estimate ====================

enum LevelSource {
    LEVEL_CALIBRATED,       // Computed from the subject's calibration
    LEVEL_DEVICE_REPORTED,  // Bottle's own percentage, not calibrated (low confidence)
    LEVEL_NO_BOTTLE,        // Distance below the valid minimum, reported as empty
    LEVEL_UNAVAILABLE,      // No calibration and no device percentage
};

struct LevelEstimate {
    LevelSource source;
    double level_pct;       // 0-100, meaningful unless LEVEL_UNAVAILABLE
    double volume_ml;       // level_pct scaled by bottle capacity

    LevelEstimate() : source(LEVEL_UNAVAILABLE), level_pct(0.0), volume_ml(0.0) {}
    bool hasLevel() const { return source != LEVEL_UNAVAILABLE; }
};

const char* levelSourceName(LevelSource source);

// ==================== Calibration Events ====================

enum CalibrationEventKind {
    CAL_EVENT_STEP_STARTED,
    CAL_EVENT_STEP_DONE,        // Empty step finished (baseline captured)
    CAL_EVENT_COMPLETE,         // Full step finished, valid, saved and active
    CAL_EVENT_INVALID,          // Full step finished but empty <= full; nothing saved
    CAL_EVENT_CANCELLED,
    CAL_EVENT_CLEARED,
};

struct CalibrationEvent {
    CalibrationEventKind kind;
    CalibrationStep step;
    std::string subject_id;
    Calibration calibration;    // Working copy at the time of the event
    LinkError error;            // Set for CAL_EVENT_INVALID (and save failures)

    CalibrationEvent() : kind(CAL_EVENT_CANCELLED), step(CAL_STEP_NONE) {}
};

const char* calibrationEventName(CalibrationEventKind kind);

// ==================== Diagnostics ====================

struct SessionDiagnostics {
    ConnectionState state;
    std::string subject_id;
    bool calibrated;
    CalibrationState calibration_state;
    size_t calibration_samples;
    uint32_t payloads_decoded;
    uint32_t payloads_dropped;
    uint32_t readings;
    uint32_t no_bottle_readings;
    uint32_t unattributed_readings;     // Level computed but no active subject
    uint32_t events_dropped;            // Queue overflow
    uint32_t scan_timeouts;
    uint32_t write_failures;
    bool has_reading;
    uint32_t last_reading_age_ms;
    double last_distance_mm;
};

// ==================== Coordinator ====================

class SessionCoordinator : public TransportListener {
public:
    typedef std::function<void(const SensorReading&, const LevelEstimate&)> ReadingCallback;
    typedef std::function<void(const ConnectionState&)> ConnectionCallback;
    typedef std::function<void(const std::vector<PeripheralHandle>&)> DevicesCallback;
    typedef std::function<void(const CalibrationEvent&)> CalibrationCallback;

    // sink may be null (no accounting)
    SessionCoordinator(BottleTransport& transport, CalibrationStore& store, ConsumptionSink* sink,
                       MonotonicClockFn monotonic_ms, EpochClockFn epoch_ms,
                       const SessionConfig& config = sessionDefaultConfig());
    ~SessionCoordinator();

    // Attach to the transport. Call once before any other operation.
    void begin();

    // Stop scanning, drop the link, detach from the transport and remove
    // every observer. The coordinator can be begun again afterwards.
    void shutdown();

    // Drain queued events to observers and run timers (sleep grace).
    // Call from the application loop.
    void update();

    // --- Discovery ---
    LinkError startScan();
    void stopScan();
    std::vector<PeripheralHandle> devices() const;

    // --- Link ---

    // Blocking for up to the connect timeout. Rejected with ERR_BUSY while
    // another connect, a live link or a disconnect is in progress. Stops an
    // active scan first. A FAULTED state is cleared by the attempt.
    LinkError connect(const std::string& peripheral_id);

    // Valid from any state. Cancels an in-flight connect (it returns
    // ERR_CANCELLED) and abandons an armed calibration step without saving.
    void disconnect();

    ConnectionState state() const;
    bool isConnected() const;

    // --- Subject ---

    // Reloads that subject's calibration; an armed step is cancelled
    void setActiveSubject(const std::string& subject_id);
    void clearActiveSubject();
    std::string activeSubject() const;
    bool hasActiveSubject() const;

    // --- Calibration ---

    // Arm the engine for a step and tell the bottle (start_empty/start_full).
    // Needs a live link since readings only arrive over it.
    LinkError beginCalibration(CalibrationStep step);

    // Push one reading into the engine (readings from the link are routed
    // automatically; this is for replayed or simulated readings)
    CalFeedResult feedReadingToCalibration(const SensorReading& reading);

    // Validate the working copy. Valid: stamp, save, activate and send
    // "complete". Invalid: ERR_CALIBRATION_INVALID, stored record untouched.
    // Runs from the next update() when the full step collects its last reading.
    LinkError completeCalibration();

    void cancelCalibration();

    // Forget the active subject's calibration (stored record included)
    LinkError clearCalibration();

    // Capacity in ml (CAL_MIN_CAPACITY_ML..CAL_MAX_CAPACITY_ML), saved for the subject
    LinkError setBottleCapacity(uint32_t capacity_ml);

    Calibration activeCalibration() const;
    bool isCalibrated() const;
    bool isEmptyCalibrated() const;
    bool isFullCalibrated() const;
    CalibrationStep calibrationStep() const;

    // --- Control writes (need CONNECTED) ---

    // deep_sleep, then drop the link once the grace period has passed
    LinkError enterSleep(uint32_t duration_minutes);
    LinkError wake();
    LinkError sendRawCommand(const std::string& text);
    LinkError sendConfigUpdate(const std::string& config_json);

    // --- Observers ---
    SubscriptionHandle subscribe(const ReadingCallback& callback);
    SubscriptionHandle subscribeConnection(const ConnectionCallback& callback);
    SubscriptionHandle subscribeDevices(const DevicesCallback& callback);
    SubscriptionHandle subscribeCalibration(const CalibrationCallback& callback);

    // Works for a handle from any subscribe call
    bool unsubscribe(SubscriptionHandle handle);

    // --- Status ---
    bool isDataFresh() const;
    uint32_t millisSinceLastReading() const;
    SessionDiagnostics diagnostics() const;
    std::string diagnosticsReport() const;

    SessionConfig config() const;
    void setConfig(const SessionConfig& config);

    // --- TransportListener (radio context) ---
    void onPeripheralFound(const PeripheralHandle& peripheral) override;
    void onScanComplete(size_t found) override;
    void onPayload(const ConnectionHandle& link, const uint8_t* data, size_t length) override;
    void onLinkLost(const ConnectionHandle& link, const std::string& reason) override;

private:
    enum PendingKind {
        PENDING_READING,
        PENDING_CONNECTION,
        PENDING_DEVICES,
        PENDING_CALIBRATION,
    };

    struct PendingEvent {
        PendingKind kind;
        SensorReading reading;
        LevelEstimate level;
        std::string subject_id;         // Reading: attributed subject (may be empty)
        int64_t epoch_ms;
        ConnectionState connection;
        std::vector<PeripheralHandle> devices;
        CalibrationEvent calibration;

        PendingEvent() : kind(PENDING_READING), epoch_ms(0) {}
    };

    void onReading(const SensorReading& reading);
    LevelEstimate estimateLevel(const SensorReading& reading, const Calibration& cal,
                                double min_valid_mm, uint32_t default_capacity_ml) const;
    void handleFeedResult(CalFeedResult result, CalibrationStep finished);
    void finishPendingCalibration();
    void reloadCalibration(const std::string& subject_id);
    LinkError writeCommand(const std::string& text);
    void abandonCalibration();

    // m_mutex must be held
    void setStateLocked(ConnectionPhase phase, const PeripheralHandle& peripheral, const LinkError& error);

    void enqueue(const PendingEvent& event);
    void publishCalibration(CalibrationEventKind kind, CalibrationStep step, const LinkError& error);
    void dispatchPending();

    BottleTransport& m_transport;
    CalibrationStore& m_store;
    ConsumptionSink* m_sink;
    MonotonicClockFn m_monotonic_ms;
    EpochClockFn m_epoch_ms;

    TelemetryDecoder m_decoder;
    CalibrationEngine m_engine;

    // Connection, subject, active calibration and timers
    mutable std::mutex m_mutex;
    SessionConfig m_config;
    ConnectionState m_state;
    ConnectionHandle m_link;
    uint32_t m_attempt;                 // Bumped by disconnect() to cancel a connect
    std::vector<PeripheralHandle> m_devices;
    std::string m_subject;
    Calibration m_active;
    bool m_sleep_pending;
    uint32_t m_sleep_deadline_ms;
    bool m_completion_pending;          // Full step done on the radio task, complete from update()
    bool m_has_reading;
    uint32_t m_last_reading_ms;
    double m_last_distance_mm;
    bool m_attached;

    // Observer delivery queue
    std::mutex m_queue_mutex;
    std::deque<PendingEvent> m_queue;
    std::atomic<size_t> m_queue_depth;

    ObserverRegistry<const SensorReading&, const LevelEstimate&> m_reading_observers;
    ObserverRegistry<const ConnectionState&> m_connection_observers;
    ObserverRegistry<const std::vector<PeripheralHandle>&> m_device_observers;
    ObserverRegistry<const CalibrationEvent&> m_calibration_observers;

    std::atomic<uint32_t> m_readings;
    std::atomic<uint32_t> m_no_bottle;
    std::atomic<uint32_t> m_unattributed;
    std::atomic<uint32_t> m_events_dropped;
    std::atomic<uint32_t> m_scan_timeouts;
    std::atomic<uint32_t> m_write_failures;

    SessionCoordinator(const SessionCoordinator&);
    SessionCoordinator& operator=(const SessionCoordinator&);
};

#endif // SESSION_H
