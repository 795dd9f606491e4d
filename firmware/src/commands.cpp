/**
 * Hydrolink - Control Envelopes
 * Implementation
 */

#include "commands.h"
#include "config.h"

#include <ArduinoJson.h>

// Nesting accepted inside a config_update payload
#define CONFIG_JSON_NESTING 4

const char* calibrationCommandStepName(CalibrationCommandStep step) {
    switch (step) {
        case CAL_CMD_START_EMPTY: return "start_empty";
        case CAL_CMD_START_FULL: return "start_full";
        case CAL_CMD_COMPLETE: return "complete";
        default: return "unknown";
    }
}

std::string commandDeepSleep(uint32_t duration_minutes, int64_t timestamp_ms) {
    JsonDocument doc;
    doc["action"] = "deep_sleep";
    doc["duration_minutes"] = duration_minutes;
    doc["timestamp"] = timestamp_ms;

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string commandWake(int64_t timestamp_ms) {
    JsonDocument doc;
    doc["action"] = "wake";
    doc["timestamp"] = timestamp_ms;

    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string commandCalibration(CalibrationCommandStep step, int64_t timestamp_ms) {
    JsonDocument doc;
    doc["action"] = "calibration";
    doc["step"] = calibrationCommandStepName(step);
    doc["timestamp"] = timestamp_ms;

    std::string out;
    serializeJson(doc, out);
    return out;
}

bool commandConfigUpdate(const std::string& config_json, int64_t timestamp_ms, std::string& out) {
    JsonDocument config;
    DeserializationError err = deserializeJson(config, config_json,
                                               DeserializationOption::NestingLimit(CONFIG_JSON_NESTING));
    if (err) {
        LOG_PRINTF("Commands: config_update rejected - %s\n", err.c_str());
        return false;
    }
    if (!config.is<JsonObjectConst>()) {
        LOG_PRINTF("Commands: config_update rejected - config must be a JSON object\n");
        return false;
    }

    JsonDocument doc;
    doc["action"] = "config_update";
    doc["config"] = config.as<JsonObjectConst>();
    doc["timestamp"] = timestamp_ms;

    out.clear();
    serializeJson(doc, out);
    return true;
}
