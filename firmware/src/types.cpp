/**
 * Hydrolink - Core Data Model
 * Names and remediation text for UI collaborators
 */

#include "types.h"
#include "hydrolink.h"

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ERR_NONE: return "NONE";
        case ERR_RADIO_UNAVAILABLE: return "RADIO_UNAVAILABLE";
        case ERR_PERMISSION_DENIED: return "PERMISSION_DENIED";
        case ERR_SCAN_TIMEOUT: return "SCAN_TIMEOUT";
        case ERR_CONNECT_TIMEOUT: return "CONNECT_TIMEOUT";
        case ERR_SERVICE_NOT_FOUND: return "SERVICE_NOT_FOUND";
        case ERR_CHARACTERISTIC_NOT_FOUND: return "CHARACTERISTIC_NOT_FOUND";
        case ERR_WRITE_FAILED: return "WRITE_FAILED";
        case ERR_UNPARSEABLE_PAYLOAD: return "UNPARSEABLE_PAYLOAD";
        case ERR_CALIBRATION_INVALID: return "CALIBRATION_INVALID";
        case ERR_NO_ACTIVE_SUBJECT: return "NO_ACTIVE_SUBJECT";
        case ERR_BUSY: return "BUSY";
        case ERR_CANCELLED: return "CANCELLED";
        case ERR_NOT_CONNECTED: return "NOT_CONNECTED";
        case ERR_STORAGE_FAILED: return "STORAGE_FAILED";
        case ERR_INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        default: return "UNKNOWN";
    }
}

const char* errorRemediation(ErrorKind kind) {
    switch (kind) {
        case ERR_NONE:
            return "";
        case ERR_RADIO_UNAVAILABLE:
            return "Turn Bluetooth on and try again";
        case ERR_PERMISSION_DENIED:
            return "Allow Bluetooth access in settings";
        case ERR_SCAN_TIMEOUT:
            return "Make sure the bottle is powered on and nearby";
        case ERR_CONNECT_TIMEOUT:
            return "Move closer to the bottle and retry";
        case ERR_SERVICE_NOT_FOUND:
        case ERR_CHARACTERISTIC_NOT_FOUND:
            return "This device is not a supported smart bottle";
        case ERR_WRITE_FAILED:
            return "Command not delivered - reconnect and retry";
        case ERR_UNPARSEABLE_PAYLOAD:
            return "Bottle sent unreadable data - check firmware version";
        case ERR_CALIBRATION_INVALID:
            return "Empty reading must be farther than full - redo calibration";
        case ERR_NO_ACTIVE_SUBJECT:
            return "Select whose bottle this is";
        case ERR_BUSY:
            return "Wait for the current operation to finish";
        case ERR_CANCELLED:
            return "Operation cancelled by disconnect";
        case ERR_NOT_CONNECTED:
            return "Connect to a bottle first";
        case ERR_STORAGE_FAILED:
            return "Could not save settings - retry";
        case ERR_INVALID_ARGUMENT:
            return "Check the value and try again";
        default:
            return "Unexpected error";
    }
}

const char* connectionPhaseName(ConnectionPhase phase) {
    switch (phase) {
        case CONN_IDLE: return "IDLE";
        case CONN_SCANNING: return "SCANNING";
        case CONN_CONNECTING: return "CONNECTING";
        case CONN_CONNECTED: return "CONNECTED";
        case CONN_DISCONNECTING: return "DISCONNECTING";
        case CONN_FAULTED: return "FAULTED";
        default: return "UNKNOWN";
    }
}

bool peripheralIsBottle(bool advertises_service, const std::string& name) {
    return advertises_service || name == HYDROLINK_BOTTLE_NAME;
}
