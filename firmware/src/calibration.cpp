/**
 * Hydrolink - Calibration Engine
 * Implementation
 */

#include "calibration.h"
#include "config.h"

#include <algorithm>

// ==================== Calibration Ritual ====================

CalibrationEngine::CalibrationEngine(size_t samples_per_step)
    : m_samples_per_step(samples_per_step == 0 ? 1 : samples_per_step),
      m_state(CAL_IDLE) {
    m_buffer.reserve(m_samples_per_step);
    m_working.bottle_capacity_ml = CAL_DEFAULT_CAPACITY_ML;
}

void CalibrationEngine::load(const Calibration& cal) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_working = cal;
    if (m_working.bottle_capacity_ml == 0) {
        m_working.bottle_capacity_ml = CAL_DEFAULT_CAPACITY_ML;
    }
    m_state = CAL_IDLE;
    m_buffer.clear();
}

void CalibrationEngine::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    uint32_t capacity = m_working.bottle_capacity_ml;
    m_working = Calibration();
    m_working.bottle_capacity_ml = capacity == 0 ? CAL_DEFAULT_CAPACITY_ML : capacity;
    m_state = CAL_IDLE;
    m_buffer.clear();
}

bool CalibrationEngine::begin(CalibrationStep step) {
    std::lock_guard<std::mutex> lock(m_mutex);

    switch (step) {
        case CAL_STEP_EMPTY:
            m_state = CAL_COLLECTING_EMPTY;
            break;
        case CAL_STEP_FULL:
            m_state = CAL_COLLECTING_FULL;
            break;
        default:
            return false;
    }

    m_buffer.clear();
    DEBUG_PRINTF(g_debug_calibration, "Calibration: %s - collecting %u readings\n",
                 calibrationGetStateName(m_state), (unsigned)m_samples_per_step);
    return true;
}

void CalibrationEngine::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state != CAL_IDLE) {
        DEBUG_PRINTF(g_debug_calibration, "Calibration: Cancelled during %s (%u readings discarded)\n",
                     calibrationGetStateName(m_state), (unsigned)m_buffer.size());
    }
    m_state = CAL_IDLE;
    m_buffer.clear();
}

CalFeedResult CalibrationEngine::feed(double distance_mm, CalibrationStep* finished_step) {
    std::lock_guard<std::mutex> lock(m_mutex);

    CalibrationStep step;
    switch (m_state) {
        case CAL_COLLECTING_EMPTY:
            step = CAL_STEP_EMPTY;
            break;
        case CAL_COLLECTING_FULL:
            step = CAL_STEP_FULL;
            break;
        default:
            return CAL_FEED_IGNORED;
    }

    m_buffer.push_back(distance_mm);
    if (m_buffer.size() < m_samples_per_step) {
        return CAL_FEED_COLLECTING;
    }

    finishStepLocked(step);
    if (finished_step != nullptr) {
        *finished_step = step;
    }

    if (step == CAL_STEP_FULL && !m_working.is_complete) {
        return CAL_FEED_INVALID;
    }
    return CAL_FEED_STEP_DONE;
}

void CalibrationEngine::finishStepLocked(CalibrationStep step) {
    if (step == CAL_STEP_EMPTY) {
        // Empty bottle gives the longest echo path; a hand or splash can only
        // shorten it, so the farthest reading is the true baseline
        double max_distance = *std::max_element(m_buffer.begin(), m_buffer.end());
        m_working.empty_baseline_mm = max_distance;
        m_working.is_complete = false;
        DEBUG_PRINTF(g_debug_calibration, "Calibration: Empty baseline = %.1fmm (max of %u)\n",
                     max_distance, (unsigned)m_buffer.size());
    } else {
        // Full bottle: closest echo is the water surface
        double min_distance = *std::min_element(m_buffer.begin(), m_buffer.end());
        m_working.full_baseline_mm = min_distance;
        DEBUG_PRINTF(g_debug_calibration, "Calibration: Full baseline = %.1fmm (min of %u)\n",
                     min_distance, (unsigned)m_buffer.size());

        if (validateLocked() != ERR_NONE) {
            LOG_PRINTF("Calibration: Invalid - empty (%.1fmm) must be greater than full (%.1fmm)\n",
                       m_working.empty_baseline_mm, m_working.full_baseline_mm);
        } else {
            DEBUG_PRINTF(g_debug_calibration, "Calibration: Complete - empty=%.1fmm full=%.1fmm\n",
                         m_working.empty_baseline_mm, m_working.full_baseline_mm);
        }
    }

    m_buffer.clear();
    m_state = CAL_IDLE;
}

ErrorKind CalibrationEngine::validateLocked() {
    m_working.is_complete = calibrationIsValid(m_working);
    return m_working.is_complete ? ERR_NONE : ERR_CALIBRATION_INVALID;
}

ErrorKind CalibrationEngine::validate() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return validateLocked();
}

void CalibrationEngine::setCapacity(uint32_t capacity_ml) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_working.bottle_capacity_ml = capacity_ml;
}

void CalibrationEngine::setCalibratedAt(int64_t epoch_ms) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_working.calibrated_at = epoch_ms;
}

Calibration CalibrationEngine::current() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_working;
}

CalibrationState CalibrationEngine::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

CalibrationStep CalibrationEngine::armedStep() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    switch (m_state) {
        case CAL_COLLECTING_EMPTY: return CAL_STEP_EMPTY;
        case CAL_COLLECTING_FULL: return CAL_STEP_FULL;
        default: return CAL_STEP_NONE;
    }
}

bool CalibrationEngine::isArmed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state != CAL_IDLE;
}

size_t CalibrationEngine::collected() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffer.size();
}

bool CalibrationEngine::isEmptyCalibrated() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_working.empty_baseline_mm > 0.0;
}

bool CalibrationEngine::isFullCalibrated() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_working.full_baseline_mm > 0.0;
}

const char* calibrationGetStateName(CalibrationState state) {
    switch (state) {
        case CAL_IDLE: return "IDLE";
        case CAL_COLLECTING_EMPTY: return "COLLECTING_EMPTY";
        case CAL_COLLECTING_FULL: return "COLLECTING_FULL";
        default: return "UNKNOWN";
    }
}

// ==================== Core Calibration Functions ====================

bool calibrationIsValid(const Calibration& cal) {
    return cal.full_baseline_mm > 0.0 && cal.empty_baseline_mm > cal.full_baseline_mm;
}

double calibrationComputeLevelPct(double distance_mm, const Calibration& cal) {
    // Distance shrinks as the bottle fills
    if (distance_mm <= cal.full_baseline_mm) {
        return 100.0;
    }
    if (distance_mm >= cal.empty_baseline_mm) {
        return 0.0;
    }

    double span = cal.empty_baseline_mm - cal.full_baseline_mm;
    if (span <= 0.0) {
        return 0.0;
    }
    return ((cal.empty_baseline_mm - distance_mm) / span) * 100.0;
}

double calibrationComputeVolumeMl(double distance_mm, const Calibration& cal) {
    return calibrationComputeLevelPct(distance_mm, cal) / 100.0 * (double)cal.bottle_capacity_ml;
}
