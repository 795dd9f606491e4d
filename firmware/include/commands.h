/**
 * Hydrolink - Control Envelopes
 * JSON commands written to the bottle's control characteristic
 */

#ifndef COMMANDS_H
#define COMMANDS_H

#include <stdint.h>
#include <string>

// Calibration envelope steps ("step" field)
enum CalibrationCommandStep {
    CAL_CMD_START_EMPTY,
    CAL_CMD_START_FULL,
    CAL_CMD_COMPLETE,
};

// {"action":"deep_sleep","duration_minutes":N,"timestamp":T}
std::string commandDeepSleep(uint32_t duration_minutes, int64_t timestamp_ms);

// {"action":"wake","timestamp":T}
std::string commandWake(int64_t timestamp_ms);

// {"action":"calibration","step":"start_empty"|"start_full"|"complete","timestamp":T}
std::string commandCalibration(CalibrationCommandStep step, int64_t timestamp_ms);

// {"action":"config_update","config":{...},"timestamp":T}
// config_json must be a JSON object; returns false (out untouched) otherwise
bool commandConfigUpdate(const std::string& config_json, int64_t timestamp_ms, std::string& out);

const char* calibrationCommandStepName(CalibrationCommandStep step);

#endif // COMMANDS_H
