/**
 * Hydrolink - Storage Module
 * Per-subject calibration persistence and hub settings
 */

#ifndef STORAGE_H
#define STORAGE_H

#include <stdint.h>
#include <string>
#include "types.h"

struct SessionConfig;

// Persistence collaborator for calibrations, one record per subject.
// The session coordinator owns no storage of its own; it loads through this
// on connect and subject switch, and saves after a valid ritual.
class CalibrationStore {
public:
    virtual ~CalibrationStore() {}

    // Returns false if nothing is stored for the subject
    virtual bool load(const std::string& subject_id, Calibration& out) = 0;

    virtual bool save(const std::string& subject_id, const Calibration& cal) = 0;

    // Returns true if the record is gone afterwards (including never stored)
    virtual bool clear(const std::string& subject_id) = 0;
};

// ==================== NVS Backend (firmware) ====================

// Initialize storage module (opens NVS namespace)
bool storageInit();

// Calibrations in NVS. Keys are "cal_" plus an 8-digit hash of the subject id
// so any subject fits the 15-character NVS key limit.
class NvsCalibrationStore : public CalibrationStore {
public:
    bool load(const std::string& subject_id, Calibration& out) override;
    bool save(const std::string& subject_id, const Calibration& cal) override;
    bool clear(const std::string& subject_id) override;
};

// Build the NVS key used for a subject's calibration record
std::string storageCalibrationKey(const std::string& subject_id);

// Save hub settings (timeouts, distance gate, grace period) to NVS
bool storageSaveSessionConfig(const SessionConfig& config);

// Load hub settings; missing or out-of-range values fall back to config.h defaults
// Returns false if storage is not initialized (config is left at defaults)
bool storageLoadSessionConfig(SessionConfig& config);

// Save the subject the hub attributes consumption to
bool storageSaveActiveSubject(const std::string& subject_id);

// Load the active subject (default: HYDROLINK_DEFAULT_SUBJECT)
std::string storageLoadActiveSubject();

#endif // STORAGE_H
