/**
 * Hydrolink - Core Data Model
 * Values shared by the transport, decoder, calibration engine and session
 */

#ifndef TYPES_H
#define TYPES_H

#include <stdint.h>
#include <string>

// ==================== Errors ====================

enum ErrorKind {
    ERR_NONE = 0,
    ERR_RADIO_UNAVAILABLE,      // Radio off, not initialised or unsupported
    ERR_PERMISSION_DENIED,      // Platform refused radio access
    ERR_SCAN_TIMEOUT,           // Scan window ended with nothing found (not fatal)
    ERR_CONNECT_TIMEOUT,        // Link not established within the connect timeout
    ERR_SERVICE_NOT_FOUND,      // Bottle service missing from the GATT table
    ERR_CHARACTERISTIC_NOT_FOUND, // No usable telemetry characteristic
    ERR_WRITE_FAILED,           // Control write rejected or link gone
    ERR_UNPARSEABLE_PAYLOAD,    // Notification matched no known shape
    ERR_CALIBRATION_INVALID,    // Empty baseline <= full baseline
    ERR_NO_ACTIVE_SUBJECT,      // Reading arrived with nobody to attribute it to
    ERR_BUSY,                   // Operation rejected: another one is in flight
    ERR_CANCELLED,              // Operation overtaken by a disconnect
    ERR_NOT_CONNECTED,          // Operation needs a live link
    ERR_STORAGE_FAILED,         // Persistence collaborator refused a write
    ERR_INVALID_ARGUMENT,       // Value out of range or malformed
};

// Error value carried by every fallible transport/session operation
struct LinkError {
    ErrorKind kind;
    std::string message;

    LinkError() : kind(ERR_NONE) {}
    LinkError(ErrorKind k, const std::string& msg) : kind(k), message(msg) {}

    bool ok() const { return kind == ERR_NONE; }
};

// Short stable name ("CONNECT_TIMEOUT")
const char* errorKindName(ErrorKind kind);

// One-line prompt telling the user what to do about it
const char* errorRemediation(ErrorKind kind);

// ==================== Peripherals ====================

// One discovered bottle. Only meaningful inside the scan session that found it.
struct PeripheralHandle {
    std::string id;             // Address string, e.g. "a4:cf:12:9b:30:e2"
    std::string name;           // Advertised name (may be empty)
    int rssi;                   // Last seen signal strength (dBm)

    PeripheralHandle() : rssi(0) {}
    PeripheralHandle(const std::string& i, const std::string& n, int r) : id(i), name(n), rssi(r) {}
};

// True when an advertisement is a bottle: it carries the bottle service UUID,
// or it is an older bottle advertising only the bottle name
bool peripheralIsBottle(bool advertises_service, const std::string& name);

// ==================== Readings ====================

// Decoded telemetry value. Immutable once built by the decoder.
struct SensorReading {
    double distance_mm;         // Sensor to water surface (or bottom when empty)
    bool has_raw_level;         // Peripheral reported its own percentage
    double raw_level_pct;       // Valid only when has_raw_level
    uint32_t timestamp_ms;      // Monotonic receive time
    std::string source_id;      // Peripheral id the payload came from

    SensorReading() : distance_mm(0.0), has_raw_level(false), raw_level_pct(0.0), timestamp_ms(0) {}
};

// ==================== Calibration ====================

struct Calibration {
    double empty_baseline_mm;   // Longest echo: bottle empty
    double full_baseline_mm;    // Shortest echo: bottle full
    uint32_t bottle_capacity_ml;
    int64_t calibrated_at;      // Unix time (ms) of the completing ritual, 0 if never
    bool is_complete;           // Both baselines captured and empty > full > 0

    Calibration()
        : empty_baseline_mm(0.0), full_baseline_mm(0.0), bottle_capacity_ml(0),
          calibrated_at(0), is_complete(false) {}
};

enum CalibrationStep {
    CAL_STEP_NONE,
    CAL_STEP_EMPTY,
    CAL_STEP_FULL,
};

// ==================== Connection ====================

enum ConnectionPhase {
    CONN_IDLE,
    CONN_SCANNING,
    CONN_CONNECTING,
    CONN_CONNECTED,
    CONN_DISCONNECTING,
    CONN_FAULTED,
};

// Single owned instance lives in the session coordinator; observers get copies
struct ConnectionState {
    ConnectionPhase phase;
    PeripheralHandle peripheral;    // Set for CONNECTING / CONNECTED
    LinkError error;                // Set for FAULTED

    ConnectionState() : phase(CONN_IDLE) {}
};

const char* connectionPhaseName(ConnectionPhase phase);

#endif // TYPES_H
