/**
 * Hydrolink - Storage Module
 * Implementation
 */

#include "storage.h"
#include "calibration.h"
#include "config.h"
#include "hydrolink.h"
#include "session.h"
#include <Arduino.h>
#include <Preferences.h>

// Static variables
static Preferences g_preferences;
static bool g_initialized = false;

// NVS keys
static const char* KEY_CAL_PREFIX = "cal_";
static const char* KEY_SCAN_TIMEOUT = "scan_tmo_ms";
static const char* KEY_CONNECT_TIMEOUT = "conn_tmo_ms";
static const char* KEY_MIN_DISTANCE = "min_dist_mm";
static const char* KEY_SLEEP_GRACE = "sleep_grace";
static const char* KEY_DATA_FRESH = "fresh_ms";
static const char* KEY_DEFAULT_CAPACITY = "def_cap_ml";
static const char* KEY_SUBJECT = "subject";

// On-flash calibration record
#define CAL_RECORD_MAGIC 0x4843     // "HC"
#define CAL_RECORD_VERSION 1

struct __attribute__((packed)) StoredCalibration {
    uint16_t magic;
    uint8_t version;
    uint8_t complete;
    double empty_baseline_mm;
    double full_baseline_mm;
    uint32_t capacity_ml;
    int64_t calibrated_at;
};

bool storageInit() {
    if (g_initialized) {
        return true; // Already initialized
    }

    // Open NVS namespace in read-write mode
    bool success = g_preferences.begin(NVS_NAMESPACE, false);
    if (success) {
        g_initialized = true;
        DEBUG_PRINTF(g_debug_calibration, "Storage: NVS initialized\n");
    } else {
        LOG_PRINTF("Storage: Failed to initialize NVS\n");
    }

    return success;
}

std::string storageCalibrationKey(const std::string& subject_id) {
    // FNV-1a, 32-bit
    uint32_t hash = 2166136261u;
    for (size_t i = 0; i < subject_id.size(); i++) {
        hash ^= (uint8_t)subject_id[i];
        hash *= 16777619u;
    }

    char key[16];
    snprintf(key, sizeof(key), "%s%08x", KEY_CAL_PREFIX, (unsigned)hash);
    return std::string(key);
}

// ==================== Calibration Records ====================

bool NvsCalibrationStore::load(const std::string& subject_id, Calibration& out) {
    if (!g_initialized) {
        LOG_PRINTF("Storage: Not initialized\n");
        return false;
    }

    std::string key = storageCalibrationKey(subject_id);
    StoredCalibration record;
    size_t length = g_preferences.getBytesLength(key.c_str());
    if (length == 0) {
        DEBUG_PRINTF(g_debug_calibration, "Storage: No calibration for '%s'\n", subject_id.c_str());
        return false;
    }
    if (length != sizeof(record)) {
        LOG_PRINTF("Storage: WARNING - calibration record for '%s' has size %u (expected %u), ignoring\n",
                   subject_id.c_str(), (unsigned)length, (unsigned)sizeof(record));
        return false;
    }

    g_preferences.getBytes(key.c_str(), &record, sizeof(record));
    if (record.magic != CAL_RECORD_MAGIC || record.version != CAL_RECORD_VERSION) {
        LOG_PRINTF("Storage: WARNING - calibration record for '%s' is corrupt, ignoring\n",
                   subject_id.c_str());
        return false;
    }

    out = Calibration();
    out.empty_baseline_mm = record.empty_baseline_mm;
    out.full_baseline_mm = record.full_baseline_mm;
    out.bottle_capacity_ml = record.capacity_ml;
    out.calibrated_at = record.calibrated_at;
    out.is_complete = record.complete != 0;

    if (out.bottle_capacity_ml < CAL_MIN_CAPACITY_ML || out.bottle_capacity_ml > CAL_MAX_CAPACITY_ML) {
        LOG_PRINTF("Storage: WARNING - capacity %uml out of range [%d-%d], using %dml\n",
                   (unsigned)out.bottle_capacity_ml, CAL_MIN_CAPACITY_ML, CAL_MAX_CAPACITY_ML,
                   CAL_DEFAULT_CAPACITY_ML);
        out.bottle_capacity_ml = CAL_DEFAULT_CAPACITY_ML;
    }

    // A record flagged complete must still satisfy empty > full > 0
    if (out.is_complete && !calibrationIsValid(out)) {
        LOG_PRINTF("Storage: WARNING - calibration for '%s' fails validation (empty=%.1f full=%.1f), marking incomplete\n",
                   subject_id.c_str(), out.empty_baseline_mm, out.full_baseline_mm);
        out.is_complete = false;
    }

    DEBUG_PRINTF(g_debug_calibration, "Storage: Loaded calibration '%s' empty=%.1fmm full=%.1fmm cap=%uml complete=%d\n",
                 subject_id.c_str(), out.empty_baseline_mm, out.full_baseline_mm,
                 (unsigned)out.bottle_capacity_ml, out.is_complete ? 1 : 0);
    return true;
}

bool NvsCalibrationStore::save(const std::string& subject_id, const Calibration& cal) {
    if (!g_initialized) {
        LOG_PRINTF("Storage: Not initialized\n");
        return false;
    }

    StoredCalibration record;
    record.magic = CAL_RECORD_MAGIC;
    record.version = CAL_RECORD_VERSION;
    record.complete = cal.is_complete ? 1 : 0;
    record.empty_baseline_mm = cal.empty_baseline_mm;
    record.full_baseline_mm = cal.full_baseline_mm;
    record.capacity_ml = cal.bottle_capacity_ml;
    record.calibrated_at = cal.calibrated_at;

    std::string key = storageCalibrationKey(subject_id);
    size_t written = g_preferences.putBytes(key.c_str(), &record, sizeof(record));
    if (written != sizeof(record)) {
        LOG_PRINTF("Storage: Failed to save calibration for '%s'\n", subject_id.c_str());
        return false;
    }

    DEBUG_PRINTF(g_debug_calibration, "Storage: Saved calibration '%s' (%s)\n",
                 subject_id.c_str(), key.c_str());
    return true;
}

bool NvsCalibrationStore::clear(const std::string& subject_id) {
    if (!g_initialized) {
        LOG_PRINTF("Storage: Not initialized\n");
        return false;
    }

    std::string key = storageCalibrationKey(subject_id);
    if (!g_preferences.isKey(key.c_str())) {
        return true;
    }
    if (!g_preferences.remove(key.c_str())) {
        LOG_PRINTF("Storage: Failed to clear calibration for '%s'\n", subject_id.c_str());
        return false;
    }

    DEBUG_PRINTF(g_debug_calibration, "Storage: Calibration '%s' cleared\n", subject_id.c_str());
    return true;
}

// ==================== Hub Settings ====================

bool storageSaveSessionConfig(const SessionConfig& config) {
    if (!g_initialized) {
        LOG_PRINTF("Storage: Not initialized\n");
        return false;
    }

    bool ok = true;
    ok &= g_preferences.putUInt(KEY_SCAN_TIMEOUT, config.scan_timeout_ms) > 0;
    ok &= g_preferences.putUInt(KEY_CONNECT_TIMEOUT, config.connect_timeout_ms) > 0;
    ok &= g_preferences.putFloat(KEY_MIN_DISTANCE, (float)config.min_valid_distance_mm) > 0;
    ok &= g_preferences.putUInt(KEY_SLEEP_GRACE, config.sleep_grace_ms) > 0;
    ok &= g_preferences.putUInt(KEY_DATA_FRESH, config.data_fresh_ms) > 0;
    ok &= g_preferences.putUInt(KEY_DEFAULT_CAPACITY, config.default_capacity_ml) > 0;

    if (!ok) {
        LOG_PRINTF("Storage: Failed to save hub settings\n");
        return false;
    }

    DEBUG_PRINTF(g_debug_session, "Storage: Saved settings scan=%ums connect=%ums min_dist=%.1fmm\n",
                 (unsigned)config.scan_timeout_ms, (unsigned)config.connect_timeout_ms,
                 config.min_valid_distance_mm);
    return true;
}

bool storageLoadSessionConfig(SessionConfig& config) {
    config = sessionDefaultConfig();
    if (!g_initialized) {
        LOG_PRINTF("Storage: Not initialized\n");
        return false;
    }

    config.scan_timeout_ms = g_preferences.getUInt(KEY_SCAN_TIMEOUT, BLE_SCAN_TIMEOUT_MS);
    config.connect_timeout_ms = g_preferences.getUInt(KEY_CONNECT_TIMEOUT, BLE_CONNECT_TIMEOUT_MS);
    config.min_valid_distance_mm = g_preferences.getFloat(KEY_MIN_DISTANCE, (float)MIN_VALID_DISTANCE_MM);
    config.sleep_grace_ms = g_preferences.getUInt(KEY_SLEEP_GRACE, SESSION_SLEEP_GRACE_MS);
    config.data_fresh_ms = g_preferences.getUInt(KEY_DATA_FRESH, SESSION_DATA_FRESH_MS);
    config.default_capacity_ml = g_preferences.getUInt(KEY_DEFAULT_CAPACITY, CAL_DEFAULT_CAPACITY_ML);

    // Validate ranges
    if (config.scan_timeout_ms < 1000 || config.scan_timeout_ms > 120000) {
        LOG_PRINTF("Storage: WARNING - scan timeout %ums out of range, using default\n",
                   (unsigned)config.scan_timeout_ms);
        config.scan_timeout_ms = BLE_SCAN_TIMEOUT_MS;
        g_preferences.putUInt(KEY_SCAN_TIMEOUT, config.scan_timeout_ms);
    }
    if (config.connect_timeout_ms < 1000 || config.connect_timeout_ms > 60000) {
        LOG_PRINTF("Storage: WARNING - connect timeout %ums out of range, using default\n",
                   (unsigned)config.connect_timeout_ms);
        config.connect_timeout_ms = BLE_CONNECT_TIMEOUT_MS;
        g_preferences.putUInt(KEY_CONNECT_TIMEOUT, config.connect_timeout_ms);
    }
    if (config.min_valid_distance_mm < 0.0 || config.min_valid_distance_mm > 500.0) {
        LOG_PRINTF("Storage: WARNING - min distance %.1fmm out of range, using default\n",
                   config.min_valid_distance_mm);
        config.min_valid_distance_mm = MIN_VALID_DISTANCE_MM;
        g_preferences.putFloat(KEY_MIN_DISTANCE, (float)config.min_valid_distance_mm);
    }
    if (config.default_capacity_ml < CAL_MIN_CAPACITY_ML || config.default_capacity_ml > CAL_MAX_CAPACITY_ML) {
        config.default_capacity_ml = CAL_DEFAULT_CAPACITY_ML;
        g_preferences.putUInt(KEY_DEFAULT_CAPACITY, config.default_capacity_ml);
    }

    DEBUG_PRINTF(g_debug_session, "Storage: Loaded settings scan=%ums connect=%ums min_dist=%.1fmm grace=%ums\n",
                 (unsigned)config.scan_timeout_ms, (unsigned)config.connect_timeout_ms,
                 config.min_valid_distance_mm, (unsigned)config.sleep_grace_ms);
    return true;
}

bool storageSaveActiveSubject(const std::string& subject_id) {
    if (!g_initialized) {
        LOG_PRINTF("Storage: Not initialized\n");
        return false;
    }

    if (g_preferences.putString(KEY_SUBJECT, subject_id.c_str()) == 0 && !subject_id.empty()) {
        LOG_PRINTF("Storage: Failed to save subject\n");
        return false;
    }
    DEBUG_PRINTF(g_debug_session, "Storage: Saved subject = '%s'\n", subject_id.c_str());
    return true;
}

std::string storageLoadActiveSubject() {
    if (!g_initialized) {
        return std::string(HYDROLINK_DEFAULT_SUBJECT);
    }

    String subject = g_preferences.getString(KEY_SUBJECT, HYDROLINK_DEFAULT_SUBJECT);
    return std::string(subject.c_str());
}
