/**
 * Hydrolink - Calibration Engine
 * Two-point calibration using empty + full bottle distance readings
 */

#ifndef CALIBRATION_H
#define CALIBRATION_H

#include <stddef.h>
#include <stdint.h>
#include <mutex>
#include <vector>
#include "config.h"
#include "types.h"

// Calibration states
enum CalibrationState {
    CAL_IDLE,               // Not collecting (baselines may or may not be set)
    CAL_COLLECTING_EMPTY,   // Consuming readings for the empty baseline
    CAL_COLLECTING_FULL,    // Consuming readings for the full baseline
};

// Outcome of pushing one reading into the engine
enum CalFeedResult {
    CAL_FEED_IGNORED,       // Engine not armed, reading not consumed
    CAL_FEED_COLLECTING,    // Consumed, step still needs more readings
    CAL_FEED_STEP_DONE,     // Consumed, step finished (empty done, or full done and valid)
    CAL_FEED_INVALID,       // Consumed, full step finished but empty <= full
};

// ==================== Calibration Ritual ====================

// Owns the working calibration for one subject while the user runs the
// empty-then-full ritual. All methods are safe to call from the radio
// callback and the loop task concurrently.
class CalibrationEngine {
public:
    explicit CalibrationEngine(size_t samples_per_step = CAL_SAMPLES_PER_STEP);

    // Replace the working copy (on connect or subject switch); disarms any step
    void load(const Calibration& cal);

    // Drop the working copy back to an empty, uncalibrated record
    void reset();

    // Arm for a step: clears the sample buffer
    // Returns false for CAL_STEP_NONE
    bool begin(CalibrationStep step);

    // Disarm and discard collected samples; baselines are left untouched
    void cancel();

    // Consume one distance if armed. On the last sample of a step the buffer is
    // reduced (empty: max, full: min) and the engine returns to CAL_IDLE.
    // finished_step (optional) receives the step that just completed
    CalFeedResult feed(double distance_mm, CalibrationStep* finished_step = nullptr);

    // Check the working copy; sets is_complete accordingly
    // Returns ERR_CALIBRATION_INVALID unless empty > full > 0
    ErrorKind validate();

    // Set the bottle capacity on the working copy
    void setCapacity(uint32_t capacity_ml);

    // Stamp completion time on the working copy
    void setCalibratedAt(int64_t epoch_ms);

    Calibration current() const;
    CalibrationState state() const;
    CalibrationStep armedStep() const;
    bool isArmed() const;
    size_t collected() const;
    size_t samplesPerStep() const { return m_samples_per_step; }

    // Which halves of the working copy have been captured
    bool isEmptyCalibrated() const;
    bool isFullCalibrated() const;

private:
    void finishStepLocked(CalibrationStep step);
    ErrorKind validateLocked();

    mutable std::mutex m_mutex;
    const size_t m_samples_per_step;
    CalibrationState m_state;
    std::vector<double> m_buffer;
    Calibration m_working;
};

// Get state name as string (for debugging)
const char* calibrationGetStateName(CalibrationState state);

// ==================== Core Calibration Functions ====================
// Pure functions, usable from any thread once a valid calibration exists

// empty > full > 0
bool calibrationIsValid(const Calibration& cal);

// Convert a distance to fill level (0-100%)
// 100 at or below the full baseline, 0 at or beyond the empty baseline,
// linear in between
double calibrationComputeLevelPct(double distance_mm, const Calibration& cal);

// Fill level scaled by bottle capacity
double calibrationComputeVolumeMl(double distance_mm, const Calibration& cal);

#endif // CALIBRATION_H
