/**
 * Hydrolink - Session Coordinator
 * Implementation
 */

#include "session.h"
#include "commands.h"
#include "config.h"

#include <stdio.h>

// ==================== Names ====================

SessionConfig sessionDefaultConfig() {
    SessionConfig config;
    config.scan_timeout_ms = BLE_SCAN_TIMEOUT_MS;
    config.connect_timeout_ms = BLE_CONNECT_TIMEOUT_MS;
    config.min_valid_distance_mm = MIN_VALID_DISTANCE_MM;
    config.sleep_grace_ms = SESSION_SLEEP_GRACE_MS;
    config.data_fresh_ms = SESSION_DATA_FRESH_MS;
    config.default_capacity_ml = CAL_DEFAULT_CAPACITY_ML;
    config.event_queue_depth = SESSION_EVENT_QUEUE_DEPTH;
    return config;
}

const char* levelSourceName(LevelSource source) {
    switch (source) {
        case LEVEL_CALIBRATED: return "CALIBRATED";
        case LEVEL_DEVICE_REPORTED: return "DEVICE_REPORTED";
        case LEVEL_NO_BOTTLE: return "NO_BOTTLE";
        case LEVEL_UNAVAILABLE: return "UNAVAILABLE";
        default: return "UNKNOWN";
    }
}

const char* calibrationEventName(CalibrationEventKind kind) {
    switch (kind) {
        case CAL_EVENT_STEP_STARTED: return "STEP_STARTED";
        case CAL_EVENT_STEP_DONE: return "STEP_DONE";
        case CAL_EVENT_COMPLETE: return "COMPLETE";
        case CAL_EVENT_INVALID: return "INVALID";
        case CAL_EVENT_CANCELLED: return "CANCELLED";
        case CAL_EVENT_CLEARED: return "CLEARED";
        default: return "UNKNOWN";
    }
}

// ==================== Lifecycle ====================

SessionCoordinator::SessionCoordinator(BottleTransport& transport, CalibrationStore& store,
                                       ConsumptionSink* sink, MonotonicClockFn monotonic_ms,
                                       EpochClockFn epoch_ms, const SessionConfig& config)
    : m_transport(transport),
      m_store(store),
      m_sink(sink),
      m_monotonic_ms(monotonic_ms),
      m_epoch_ms(epoch_ms),
      m_config(config),
      m_attempt(0),
      m_sleep_pending(false),
      m_sleep_deadline_ms(0),
      m_completion_pending(false),
      m_has_reading(false),
      m_last_reading_ms(0),
      m_last_distance_mm(0.0),
      m_attached(false),
      m_queue_depth(config.event_queue_depth == 0 ? 1 : config.event_queue_depth),
      m_readings(0),
      m_no_bottle(0),
      m_unattributed(0),
      m_events_dropped(0),
      m_scan_timeouts(0),
      m_write_failures(0) {
    m_active.bottle_capacity_ml = config.default_capacity_ml;
    m_engine.load(m_active);
}

SessionCoordinator::~SessionCoordinator() {
    shutdown();
}

void SessionCoordinator::begin() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_attached) {
            return;
        }
        m_attached = true;
    }
    m_transport.setListener(this);
    DEBUG_PRINTF(g_debug_session, "Session: Attached to transport\n");
}

void SessionCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_attached) {
            return;
        }
    }

    stopScan();
    disconnect();
    m_transport.setListener(nullptr);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_attached = false;
        m_completion_pending = false;
    }

    m_reading_observers.clear();
    m_connection_observers.clear();
    m_device_observers.clear();
    m_calibration_observers.clear();
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_queue.clear();
    }
    DEBUG_PRINTF(g_debug_session, "Session: Shut down\n");
}

void SessionCoordinator::update() {
    uint32_t now = m_monotonic_ms();
    m_transport.update(now);

    bool sleep_elapsed = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sleep_pending && (int32_t)(now - m_sleep_deadline_ms) >= 0) {
            m_sleep_pending = false;
            if (m_state.phase == CONN_CONNECTED) {
                m_attempt++;
                setStateLocked(CONN_DISCONNECTING, m_state.peripheral, LinkError());
                sleep_elapsed = true;
            }
        }
    }

    if (sleep_elapsed) {
        LOG_PRINTF("Session: Sleep grace elapsed, releasing link\n");
        abandonCalibration();
        m_transport.disconnect();

        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase == CONN_DISCONNECTING) {
            m_link = ConnectionHandle();
            setStateLocked(CONN_IDLE, PeripheralHandle(), LinkError());
        }
    }

    finishPendingCalibration();
    dispatchPending();
}

// ==================== Discovery ====================

LinkError SessionCoordinator::startScan() {
    uint32_t timeout_ms;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (m_state.phase) {
            case CONN_SCANNING:
                return LinkError();
            case CONN_CONNECTING:
            case CONN_CONNECTED:
            case CONN_DISCONNECTING:
                return LinkError(ERR_BUSY, "Cannot scan while a bottle link is in use");
            default:
                break;
        }
        m_devices.clear();
        timeout_ms = m_config.scan_timeout_ms;
        setStateLocked(CONN_SCANNING, PeripheralHandle(), LinkError());
    }

    PendingEvent event;
    event.kind = PENDING_DEVICES;
    enqueue(event);

    LinkError err = m_transport.startScan(timeout_ms);
    if (!err.ok()) {
        LOG_PRINTF("Session: Scan failed - %s (%s)\n", errorKindName(err.kind), err.message.c_str());
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase == CONN_SCANNING) {
            setStateLocked(CONN_FAULTED, PeripheralHandle(), err);
        }
        return err;
    }

    DEBUG_PRINTF(g_debug_session, "Session: Scanning for %ums\n", (unsigned)timeout_ms);
    return err;
}

void SessionCoordinator::stopScan() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase == CONN_SCANNING) {
            setStateLocked(CONN_IDLE, PeripheralHandle(), LinkError());
        }
    }
    m_transport.stopScan();
}

std::vector<PeripheralHandle> SessionCoordinator::devices() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_devices;
}

void SessionCoordinator::onPeripheralFound(const PeripheralHandle& peripheral) {
    PendingEvent event;
    event.kind = PENDING_DEVICES;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase != CONN_SCANNING) {
            return;
        }

        bool known = false;
        for (size_t i = 0; i < m_devices.size(); i++) {
            if (m_devices[i].id == peripheral.id) {
                m_devices[i].rssi = peripheral.rssi;
                if (!peripheral.name.empty()) {
                    m_devices[i].name = peripheral.name;
                }
                known = true;
                break;
            }
        }
        if (!known) {
            if (m_devices.size() >= BLE_MAX_SCAN_RESULTS) {
                return;
            }
            m_devices.push_back(peripheral);
            DEBUG_PRINTF(g_debug_session, "Session: Found %s '%s' (%d dBm)\n",
                         peripheral.id.c_str(), peripheral.name.c_str(), peripheral.rssi);
        }
        event.devices = m_devices;
    }
    enqueue(event);
}

void SessionCoordinator::onScanComplete(size_t found) {
    bool empty;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase != CONN_SCANNING) {
            return;
        }
        empty = m_devices.empty();
        setStateLocked(CONN_IDLE, PeripheralHandle(), LinkError());
    }

    if (empty) {
        // Not a fault: the user just needs to wake the bottle and retry
        m_scan_timeouts++;
        LOG_PRINTF("Session: Scan finished, no bottles found - %s\n", errorRemediation(ERR_SCAN_TIMEOUT));
    } else {
        DEBUG_PRINTF(g_debug_session, "Session: Scan finished (%u advertisers seen)\n", (unsigned)found);
    }
}

// ==================== Link ====================

LinkError SessionCoordinator::connect(const std::string& peripheral_id) {
    uint32_t attempt;
    uint32_t timeout_ms;
    bool was_scanning;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (m_state.phase) {
            case CONN_CONNECTING:
                return LinkError(ERR_BUSY, "A connection attempt is already in progress");
            case CONN_CONNECTED:
                return LinkError(ERR_BUSY, "Already connected - disconnect first");
            case CONN_DISCONNECTING:
                return LinkError(ERR_BUSY, "Disconnect in progress");
            default:
                break;
        }

        PeripheralHandle target(peripheral_id, "", 0);
        for (size_t i = 0; i < m_devices.size(); i++) {
            if (m_devices[i].id == peripheral_id) {
                target = m_devices[i];
                break;
            }
        }

        was_scanning = (m_state.phase == CONN_SCANNING);
        attempt = ++m_attempt;
        timeout_ms = m_config.connect_timeout_ms;
        m_sleep_pending = false;
        setStateLocked(CONN_CONNECTING, target, LinkError());
    }

    if (was_scanning) {
        m_transport.stopScan();
    }

    LOG_PRINTF("Session: Connecting to %s\n", peripheral_id.c_str());

    ConnectionHandle link;
    LinkError err = m_transport.connect(peripheral_id, timeout_ms, link);

    std::string subject;
    bool cancelled = false;
    bool newer_attempt = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_attempt != attempt) {
            cancelled = true;
            newer_attempt = (m_state.phase == CONN_CONNECTING || m_state.phase == CONN_CONNECTED);
        } else if (!err.ok()) {
            setStateLocked(CONN_FAULTED, m_state.peripheral, err);
        } else {
            m_link = link;
            subject = m_subject;
        }
    }

    if (cancelled) {
        // disconnect() ran while the radio was busy; make sure nothing stays up
        if (err.ok() && !newer_attempt) {
            m_transport.disconnect();
        }
        LOG_PRINTF("Session: Connect to %s cancelled\n", peripheral_id.c_str());
        return LinkError(ERR_CANCELLED, "Connect cancelled by disconnect");
    }
    if (!err.ok()) {
        LOG_PRINTF("Session: Connect failed - %s (%s)\n", errorKindName(err.kind), err.message.c_str());
        return err;
    }

    reloadCalibration(subject);

    LinkError sub = m_transport.subscribe(link);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_attempt != attempt) {
            cancelled = true;
        } else if (!sub.ok()) {
            m_link = ConnectionHandle();
            setStateLocked(CONN_FAULTED, m_state.peripheral, sub);
        } else {
            setStateLocked(CONN_CONNECTED, m_state.peripheral, LinkError());
        }
    }

    if (cancelled) {
        LOG_PRINTF("Session: Connect to %s cancelled\n", peripheral_id.c_str());
        return LinkError(ERR_CANCELLED, "Link dropped before telemetry started");
    }
    if (!sub.ok()) {
        LOG_PRINTF("Session: Subscribe failed - %s (%s)\n", errorKindName(sub.kind), sub.message.c_str());
        m_transport.disconnect();
        return sub;
    }

    LOG_PRINTF("Session: Connected to %s (link %u)\n", peripheral_id.c_str(), (unsigned)link.link_id);
    return LinkError();
}

void SessionCoordinator::disconnect() {
    ConnectionPhase previous;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        previous = m_state.phase;
        m_sleep_pending = false;

        switch (previous) {
            case CONN_IDLE:
            case CONN_DISCONNECTING:
                return;
            case CONN_SCANNING:
            case CONN_FAULTED:
                setStateLocked(CONN_IDLE, PeripheralHandle(), LinkError());
                break;
            case CONN_CONNECTING:
            case CONN_CONNECTED:
                m_attempt++;
                setStateLocked(CONN_DISCONNECTING, m_state.peripheral, LinkError());
                break;
        }
    }

    if (previous == CONN_SCANNING) {
        m_transport.stopScan();
        return;
    }

    abandonCalibration();
    m_transport.disconnect();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_link = ConnectionHandle();
        if (m_state.phase == CONN_DISCONNECTING) {
            setStateLocked(CONN_IDLE, PeripheralHandle(), LinkError());
        }
    }

    if (previous != CONN_FAULTED) {
        LOG_PRINTF("Session: Disconnected\n");
    }
}

ConnectionState SessionCoordinator::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool SessionCoordinator::isConnected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.phase == CONN_CONNECTED;
}

void SessionCoordinator::onLinkLost(const ConnectionHandle& link, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_link.valid() || link.link_id != m_link.link_id) {
            return;
        }
        m_link = ConnectionHandle();
        m_sleep_pending = false;
        if (m_state.phase == CONN_CONNECTING) {
            // connect() is still subscribing; it reports the cancellation
            m_attempt++;
        }
        setStateLocked(CONN_IDLE, PeripheralHandle(), LinkError());
    }

    LOG_PRINTF("Session: Link lost (%s)\n", reason.c_str());
    abandonCalibration();
}

// ==================== Telemetry ====================

void SessionCoordinator::onPayload(const ConnectionHandle& link, const uint8_t* data, size_t length) {
    std::string source_id;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_link.valid() || link.link_id != m_link.link_id) {
            return;
        }
        if (m_state.phase != CONN_CONNECTED && m_state.phase != CONN_CONNECTING) {
            return;
        }
        source_id = m_state.peripheral.id;
    }

    SensorReading reading;
    if (!m_decoder.decode(data, length, source_id, m_monotonic_ms(), reading)) {
        return;
    }
    onReading(reading);
}

void SessionCoordinator::onReading(const SensorReading& reading) {
    m_readings++;

    CalibrationStep finished = CAL_STEP_NONE;
    CalFeedResult result = m_engine.feed(reading.distance_mm, &finished);
    if (result == CAL_FEED_STEP_DONE && finished == CAL_STEP_FULL) {
        // Saving and the "complete" write block the radio task; update() does both
        std::lock_guard<std::mutex> lock(m_mutex);
        m_completion_pending = true;
    } else {
        handleFeedResult(result, finished);
    }

    PendingEvent event;
    event.kind = PENDING_READING;
    event.reading = reading;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_has_reading = true;
        m_last_reading_ms = reading.timestamp_ms;
        m_last_distance_mm = reading.distance_mm;
        event.level = estimateLevel(reading, m_active, m_config.min_valid_distance_mm,
                                    m_config.default_capacity_ml);
        if (event.level.hasLevel()) {
            event.subject_id = m_subject;
        }
    }
    event.epoch_ms = m_epoch_ms();

    if (event.level.source == LEVEL_NO_BOTTLE) {
        m_no_bottle++;
    }
    if (event.level.hasLevel() && event.subject_id.empty()) {
        m_unattributed++;
        DEBUG_PRINTF(g_debug_session, "Session: Reading not attributed - %s\n",
                     errorKindName(ERR_NO_ACTIVE_SUBJECT));
    }

    DEBUG_PRINTF(g_debug_telemetry, "Session: d=%.1fmm level=%.1f%% (%s) vol=%.0fml\n",
                 reading.distance_mm, event.level.level_pct, levelSourceName(event.level.source),
                 event.level.volume_ml);

    enqueue(event);
}

LevelEstimate SessionCoordinator::estimateLevel(const SensorReading& reading, const Calibration& cal,
                                                double min_valid_mm, uint32_t default_capacity_ml) const {
    LevelEstimate estimate;
    uint32_t capacity = cal.bottle_capacity_ml > 0 ? cal.bottle_capacity_ml : default_capacity_ml;

    if (reading.distance_mm < min_valid_mm) {
        // Sensor sees something right against it: treat as no bottle on the base
        estimate.source = LEVEL_NO_BOTTLE;
        estimate.level_pct = 0.0;
        estimate.volume_ml = 0.0;
        return estimate;
    }

    if (cal.is_complete && calibrationIsValid(cal)) {
        estimate.source = LEVEL_CALIBRATED;
        estimate.level_pct = calibrationComputeLevelPct(reading.distance_mm, cal);
    } else if (reading.has_raw_level) {
        estimate.source = LEVEL_DEVICE_REPORTED;
        estimate.level_pct = reading.raw_level_pct;
        if (estimate.level_pct < 0.0) estimate.level_pct = 0.0;
        if (estimate.level_pct > 100.0) estimate.level_pct = 100.0;
    } else {
        return estimate;
    }

    estimate.volume_ml = estimate.level_pct / 100.0 * (double)capacity;
    return estimate;
}

// ==================== Subject ====================

void SessionCoordinator::setActiveSubject(const std::string& subject_id) {
    // A finished ritual belongs to the subject it was collected for
    finishPendingCalibration();
    abandonCalibration();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subject = subject_id;
    }
    reloadCalibration(subject_id);

    if (subject_id.empty()) {
        LOG_PRINTF("Session: No active subject\n");
    } else {
        LOG_PRINTF("Session: Active subject = '%s'\n", subject_id.c_str());
    }
}

void SessionCoordinator::clearActiveSubject() {
    setActiveSubject(std::string());
}

std::string SessionCoordinator::activeSubject() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subject;
}

bool SessionCoordinator::hasActiveSubject() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_subject.empty();
}

void SessionCoordinator::reloadCalibration(const std::string& subject_id) {
    Calibration cal;
    bool found = !subject_id.empty() && m_store.load(subject_id, cal);
    if (!found) {
        cal = Calibration();
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (cal.bottle_capacity_ml == 0) {
            cal.bottle_capacity_ml = m_config.default_capacity_ml;
        }
        m_active = cal;
    }
    m_engine.load(cal);

    DEBUG_PRINTF(g_debug_calibration, "Session: Calibration for '%s' %s\n", subject_id.c_str(),
                 cal.is_complete ? "loaded" : (found ? "incomplete" : "not found"));
}

// ==================== Calibration ====================

LinkError SessionCoordinator::beginCalibration(CalibrationStep step) {
    if (step == CAL_STEP_NONE) {
        abandonCalibration();
        return LinkError();
    }
    if (!isConnected()) {
        return LinkError(ERR_NOT_CONNECTED, "Calibration needs a connected bottle");
    }

    finishPendingCalibration();
    m_engine.begin(step);
    publishCalibration(CAL_EVENT_STEP_STARTED, step, LinkError());

    CalibrationCommandStep command = (step == CAL_STEP_EMPTY) ? CAL_CMD_START_EMPTY : CAL_CMD_START_FULL;
    LinkError err = writeCommand(commandCalibration(command, m_epoch_ms()));
    if (!err.ok()) {
        abandonCalibration();
        return err;
    }

    LOG_PRINTF("Session: Calibration %s step started\n", step == CAL_STEP_EMPTY ? "empty" : "full");
    return err;
}

CalFeedResult SessionCoordinator::feedReadingToCalibration(const SensorReading& reading) {
    CalibrationStep finished = CAL_STEP_NONE;
    CalFeedResult result = m_engine.feed(reading.distance_mm, &finished);
    handleFeedResult(result, finished);
    return result;
}

void SessionCoordinator::handleFeedResult(CalFeedResult result, CalibrationStep finished) {
    switch (result) {
        case CAL_FEED_STEP_DONE:
            if (finished == CAL_STEP_FULL) {
                LinkError err = completeCalibration();
                if (!err.ok()) {
                    LOG_PRINTF("Session: Calibration complete with warning - %s\n", err.message.c_str());
                }
            } else {
                publishCalibration(CAL_EVENT_STEP_DONE, finished, LinkError());
            }
            break;
        case CAL_FEED_INVALID:
            publishCalibration(CAL_EVENT_INVALID, CAL_STEP_FULL,
                               LinkError(ERR_CALIBRATION_INVALID,
                                         "Empty baseline must be greater than full baseline"));
            break;
        default:
            break;
    }
}

void SessionCoordinator::finishPendingCalibration() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_completion_pending) {
            return;
        }
    }
    handleFeedResult(CAL_FEED_STEP_DONE, CAL_STEP_FULL);
}

LinkError SessionCoordinator::completeCalibration() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_completion_pending = false;
    }
    if (m_engine.isArmed()) {
        return LinkError(ERR_BUSY, "Calibration step still collecting");
    }
    if (m_engine.validate() != ERR_NONE) {
        LinkError err(ERR_CALIBRATION_INVALID, "Empty baseline must be greater than full baseline");
        publishCalibration(CAL_EVENT_INVALID, CAL_STEP_FULL, err);
        return err;
    }

    m_engine.setCalibratedAt(m_epoch_ms());
    Calibration cal = m_engine.current();

    std::string subject;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        subject = m_subject;
        m_active = cal;
    }

    LinkError result;
    if (subject.empty()) {
        result = LinkError(ERR_NO_ACTIVE_SUBJECT, "Calibration active but not saved (no subject)");
    } else if (!m_store.save(subject, cal)) {
        result = LinkError(ERR_STORAGE_FAILED, "Calibration active but could not be saved");
    }

    LOG_PRINTF("Session: Calibration complete for '%s' - empty=%.1fmm full=%.1fmm\n",
               subject.c_str(), cal.empty_baseline_mm, cal.full_baseline_mm);
    publishCalibration(CAL_EVENT_COMPLETE, CAL_STEP_FULL, result);

    if (isConnected()) {
        LinkError err = writeCommand(commandCalibration(CAL_CMD_COMPLETE, m_epoch_ms()));
        if (!err.ok()) {
            LOG_PRINTF("Session: Bottle not told calibration is complete - %s\n", err.message.c_str());
        }
    }
    return result;
}

void SessionCoordinator::cancelCalibration() {
    abandonCalibration();
}

void SessionCoordinator::abandonCalibration() {
    CalibrationStep step = m_engine.armedStep();
    if (step == CAL_STEP_NONE) {
        return;
    }
    m_engine.cancel();
    publishCalibration(CAL_EVENT_CANCELLED, step, LinkError());
}

LinkError SessionCoordinator::clearCalibration() {
    abandonCalibration();

    std::string subject;
    Calibration cleared;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        subject = m_subject;
        cleared.bottle_capacity_ml = m_config.default_capacity_ml;
        m_active = cleared;
        m_completion_pending = false;
    }
    m_engine.load(cleared);

    LinkError result;
    if (!subject.empty() && !m_store.clear(subject)) {
        result = LinkError(ERR_STORAGE_FAILED, "Stored calibration could not be removed");
    }

    LOG_PRINTF("Session: Calibration cleared for '%s'\n", subject.c_str());
    publishCalibration(CAL_EVENT_CLEARED, CAL_STEP_NONE, result);
    return result;
}

LinkError SessionCoordinator::setBottleCapacity(uint32_t capacity_ml) {
    if (capacity_ml < CAL_MIN_CAPACITY_ML || capacity_ml > CAL_MAX_CAPACITY_ML) {
        return LinkError(ERR_INVALID_ARGUMENT, "Capacity out of range");
    }

    m_engine.setCapacity(capacity_ml);

    std::string subject;
    Calibration cal;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_active.bottle_capacity_ml = capacity_ml;
        cal = m_active;
        subject = m_subject;
    }

    DEBUG_PRINTF(g_debug_calibration, "Session: Bottle capacity = %uml\n", (unsigned)capacity_ml);
    if (!subject.empty() && !m_store.save(subject, cal)) {
        return LinkError(ERR_STORAGE_FAILED, "Capacity could not be saved");
    }
    return LinkError();
}

Calibration SessionCoordinator::activeCalibration() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

bool SessionCoordinator::isCalibrated() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active.is_complete && calibrationIsValid(m_active);
}

bool SessionCoordinator::isEmptyCalibrated() const {
    return m_engine.isEmptyCalibrated();
}

bool SessionCoordinator::isFullCalibrated() const {
    return m_engine.isFullCalibrated();
}

CalibrationStep SessionCoordinator::calibrationStep() const {
    return m_engine.armedStep();
}

// ==================== Control Writes ====================

LinkError SessionCoordinator::writeCommand(const std::string& text) {
    ConnectionHandle link;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase != CONN_CONNECTED) {
            return LinkError(ERR_NOT_CONNECTED, "No bottle connected");
        }
        link = m_link;
    }

    LinkError err = m_transport.write(link, reinterpret_cast<const uint8_t*>(text.data()), text.size());
    if (err.ok()) {
        DEBUG_PRINTF(g_debug_session, "Session: Sent %s\n", text.c_str());
        return err;
    }

    m_write_failures++;
    bool faulted = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.phase == CONN_CONNECTED && m_link.link_id == link.link_id) {
            m_attempt++;
            m_link = ConnectionHandle();
            m_sleep_pending = false;
            setStateLocked(CONN_FAULTED, m_state.peripheral, err);
            faulted = true;
        }
    }

    LOG_PRINTF("Session: Write failed - %s (%s)\n", errorKindName(err.kind), err.message.c_str());
    if (faulted) {
        abandonCalibration();
        m_transport.disconnect();
    }
    return err;
}

LinkError SessionCoordinator::enterSleep(uint32_t duration_minutes) {
    if (duration_minutes == 0 || duration_minutes > SESSION_SLEEP_MAX_MINUTES) {
        return LinkError(ERR_INVALID_ARGUMENT, "Sleep duration out of range");
    }

    LinkError err = writeCommand(commandDeepSleep(duration_minutes, m_epoch_ms()));
    if (!err.ok()) {
        return err;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.phase == CONN_CONNECTED) {
        m_sleep_pending = true;
        m_sleep_deadline_ms = m_monotonic_ms() + m_config.sleep_grace_ms;
        LOG_PRINTF("Session: Bottle sleeping for %u min, releasing link in %ums\n",
                   (unsigned)duration_minutes, (unsigned)m_config.sleep_grace_ms);
    }
    return err;
}

LinkError SessionCoordinator::wake() {
    return writeCommand(commandWake(m_epoch_ms()));
}

LinkError SessionCoordinator::sendRawCommand(const std::string& text) {
    if (text.empty()) {
        return LinkError(ERR_INVALID_ARGUMENT, "Empty command");
    }
    return writeCommand(text);
}

LinkError SessionCoordinator::sendConfigUpdate(const std::string& config_json) {
    std::string envelope;
    if (!commandConfigUpdate(config_json, m_epoch_ms(), envelope)) {
        return LinkError(ERR_INVALID_ARGUMENT, "Config must be a JSON object");
    }
    return writeCommand(envelope);
}

// ==================== Observers ====================

SubscriptionHandle SessionCoordinator::subscribe(const ReadingCallback& callback) {
    return m_reading_observers.add(callback);
}

SubscriptionHandle SessionCoordinator::subscribeConnection(const ConnectionCallback& callback) {
    return m_connection_observers.add(callback);
}

SubscriptionHandle SessionCoordinator::subscribeDevices(const DevicesCallback& callback) {
    return m_device_observers.add(callback);
}

SubscriptionHandle SessionCoordinator::subscribeCalibration(const CalibrationCallback& callback) {
    return m_calibration_observers.add(callback);
}

bool SessionCoordinator::unsubscribe(SubscriptionHandle handle) {
    if (handle == INVALID_SUBSCRIPTION) {
        return false;
    }
    return m_reading_observers.remove(handle) ||
           m_connection_observers.remove(handle) ||
           m_device_observers.remove(handle) ||
           m_calibration_observers.remove(handle);
}

void SessionCoordinator::setStateLocked(ConnectionPhase phase, const PeripheralHandle& peripheral,
                                        const LinkError& error) {
    m_state.phase = phase;
    m_state.peripheral = peripheral;
    m_state.error = error;

    if (phase == CONN_FAULTED) {
        LOG_PRINTF("Session: FAULTED - %s: %s\n", errorKindName(error.kind), errorRemediation(error.kind));
    } else {
        DEBUG_PRINTF(g_debug_session, "Session: State -> %s\n", connectionPhaseName(phase));
    }

    PendingEvent event;
    event.kind = PENDING_CONNECTION;
    event.connection = m_state;
    enqueue(event);
}

void SessionCoordinator::publishCalibration(CalibrationEventKind kind, CalibrationStep step,
                                            const LinkError& error) {
    PendingEvent event;
    event.kind = PENDING_CALIBRATION;
    event.calibration.kind = kind;
    event.calibration.step = step;
    event.calibration.subject_id = activeSubject();
    event.calibration.calibration = m_engine.current();
    event.calibration.error = error;

    DEBUG_PRINTF(g_debug_calibration, "Session: Calibration event %s\n", calibrationEventName(kind));
    enqueue(event);
}

void SessionCoordinator::enqueue(const PendingEvent& event) {
    std::lock_guard<std::mutex> lock(m_queue_mutex);

    if (m_queue.size() >= m_queue_depth.load()) {
        // Readings are superseded by the next one; state changes are not
        bool dropped = false;
        for (std::deque<PendingEvent>::iterator it = m_queue.begin(); it != m_queue.end(); ++it) {
            if (it->kind == PENDING_READING) {
                m_queue.erase(it);
                dropped = true;
                break;
            }
        }
        if (!dropped && event.kind == PENDING_READING) {
            m_events_dropped++;
            return;
        }
        if (dropped) {
            m_events_dropped++;
        }
    }

    m_queue.push_back(event);
}

void SessionCoordinator::dispatchPending() {
    std::deque<PendingEvent> pending;
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        pending.swap(m_queue);
    }

    for (size_t i = 0; i < pending.size(); i++) {
        const PendingEvent& event = pending[i];
        switch (event.kind) {
            case PENDING_READING:
                m_reading_observers.notify(event.reading, event.level);
                if (m_sink != nullptr && !event.subject_id.empty() && event.level.hasLevel()) {
                    m_sink->onVolumeSample(event.subject_id, event.level.volume_ml,
                                           event.level.level_pct, event.epoch_ms);
                }
                break;
            case PENDING_CONNECTION:
                m_connection_observers.notify(event.connection);
                break;
            case PENDING_DEVICES:
                m_device_observers.notify(event.devices);
                break;
            case PENDING_CALIBRATION:
                m_calibration_observers.notify(event.calibration);
                break;
        }
    }
}

// ==================== Status ====================

bool SessionCoordinator::isDataFresh() const {
    uint32_t now = m_monotonic_ms();
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_has_reading && (now - m_last_reading_ms) < m_config.data_fresh_ms;
}

uint32_t SessionCoordinator::millisSinceLastReading() const {
    uint32_t now = m_monotonic_ms();
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_has_reading) {
        return UINT32_MAX;
    }
    return now - m_last_reading_ms;
}

SessionDiagnostics SessionCoordinator::diagnostics() const {
    SessionDiagnostics diag;
    uint32_t now = m_monotonic_ms();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        diag.state = m_state;
        diag.subject_id = m_subject;
        diag.calibrated = m_active.is_complete && calibrationIsValid(m_active);
        diag.has_reading = m_has_reading;
        diag.last_reading_age_ms = m_has_reading ? now - m_last_reading_ms : 0;
        diag.last_distance_mm = m_last_distance_mm;
    }
    diag.calibration_state = m_engine.state();
    diag.calibration_samples = m_engine.collected();
    diag.payloads_decoded = m_decoder.decodedCount();
    diag.payloads_dropped = m_decoder.droppedCount();
    diag.readings = m_readings.load();
    diag.no_bottle_readings = m_no_bottle.load();
    diag.unattributed_readings = m_unattributed.load();
    diag.events_dropped = m_events_dropped.load();
    diag.scan_timeouts = m_scan_timeouts.load();
    diag.write_failures = m_write_failures.load();
    return diag;
}

std::string SessionCoordinator::diagnosticsReport() const {
    SessionDiagnostics diag = diagnostics();
    char line[128];
    std::string report;

    snprintf(line, sizeof(line), "State: %s", connectionPhaseName(diag.state.phase));
    report += line;
    if (!diag.state.peripheral.id.empty()) {
        snprintf(line, sizeof(line), " (%s)", diag.state.peripheral.id.c_str());
        report += line;
    }
    if (diag.state.phase == CONN_FAULTED) {
        snprintf(line, sizeof(line), " - %s", errorKindName(diag.state.error.kind));
        report += line;
    }
    report += "\n";

    snprintf(line, sizeof(line), "Subject: %s\n", diag.subject_id.empty() ? "(none)" : diag.subject_id.c_str());
    report += line;
    snprintf(line, sizeof(line), "Calibrated: %s  Ritual: %s (%u samples)\n",
             diag.calibrated ? "yes" : "no", calibrationGetStateName(diag.calibration_state),
             (unsigned)diag.calibration_samples);
    report += line;
    snprintf(line, sizeof(line), "Payloads: %u decoded, %u dropped\n",
             (unsigned)diag.payloads_decoded, (unsigned)diag.payloads_dropped);
    report += line;
    snprintf(line, sizeof(line), "Readings: %u (no bottle %u, unattributed %u, queue drops %u)\n",
             (unsigned)diag.readings, (unsigned)diag.no_bottle_readings,
             (unsigned)diag.unattributed_readings, (unsigned)diag.events_dropped);
    report += line;
    if (diag.has_reading) {
        snprintf(line, sizeof(line), "Last reading: %.1fmm, %ums ago\n",
                 diag.last_distance_mm, (unsigned)diag.last_reading_age_ms);
    } else {
        snprintf(line, sizeof(line), "Last reading: none\n");
    }
    report += line;
    snprintf(line, sizeof(line), "Scan timeouts: %u  Write failures: %u\n",
             (unsigned)diag.scan_timeouts, (unsigned)diag.write_failures);
    report += line;
    return report;
}

SessionConfig SessionCoordinator::config() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

void SessionCoordinator::setConfig(const SessionConfig& config) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = config;
    m_queue_depth.store(config.event_queue_depth == 0 ? 1 : config.event_queue_depth);
}
