/**
 * Hydrolink - Telemetry Decoder
 * Implementation
 */

#include "telemetry.h"
#include "config.h"

#include <ArduinoJson.h>
#include <ctype.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

// Fields extracted by a shape parser before the reading is built
struct DecodedFields {
    double distance_mm;
    bool has_level;
    double level_pct;
};

// Payload as seen by the shape parsers. JSON is parsed once up front.
struct PayloadView {
    const char* text;
    size_t length;
    bool is_object;
    JsonObjectConst object;
};

typedef bool (*ShapeParser)(const PayloadView& view, DecodedFields& out);

static bool isNumberChar(char c) {
    return (c >= '0' && c <= '9') || c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E';
}

// Trim surrounding whitespace and trailing NULs (C-string sends include the terminator)
static void trimPayloadText(const char*& text, size_t& length) {
    while (length > 0 && isspace((unsigned char)text[0])) {
        text++;
        length--;
    }
    while (length > 0 && (text[length - 1] == '\0' || isspace((unsigned char)text[length - 1]))) {
        length--;
    }
}

// Parse the numeric run at the start of text. consumed is how many characters strtod used.
static bool parseLeadingRun(const char* text, size_t length, double& out, size_t& consumed) {
    size_t run = 0;
    while (run < length && isNumberChar(text[run])) {
        run++;
    }

    char buffer[32];
    if (run == 0 || run >= sizeof(buffer)) {
        return false;
    }
    memcpy(buffer, text, run);
    buffer[run] = '\0';

    char* endptr = nullptr;
    double value = strtod(buffer, &endptr);
    if (endptr == buffer || !isfinite(value)) {
        return false;
    }

    out = value;
    consumed = (size_t)(endptr - buffer);
    return true;
}

bool telemetryParseNumber(const char* text, size_t length, double& out) {
    trimPayloadText(text, length);

    double value;
    size_t consumed = 0;
    if (!parseLeadingRun(text, length, value, consumed) || consumed != length) {
        return false;
    }

    out = value;
    return true;
}

bool telemetryParseLeadingNumber(const char* text, size_t length, double& out) {
    trimPayloadText(text, length);

    double value;
    size_t consumed = 0;
    if (!parseLeadingRun(text, length, value, consumed)) {
        return false;
    }

    // A unit or label may follow; more numeric text or a hex prefix may not
    size_t i = consumed;
    while (i < length && isspace((unsigned char)text[i])) {
        i++;
    }
    if (i < length) {
        char c = text[i];
        if (isNumberChar(c) || c == 'x' || c == 'X' || c == ',') {
            return false;
        }
    }

    out = value;
    return true;
}

// JSON number, or a string holding one
static bool readNumber(JsonVariantConst value, double& out) {
    if (value.isNull()) {
        return false;
    }
    if (value.is<double>()) {
        double v = value.as<double>();
        if (!isfinite(v)) {
            return false;
        }
        out = v;
        return true;
    }
    if (value.is<const char*>()) {
        const char* s = value.as<const char*>();
        return telemetryParseNumber(s, strlen(s), out);
    }
    return false;
}

// Shape 1: {"p": percent, "d": distance_mm}
static bool parseCompactShape(const PayloadView& view, DecodedFields& out) {
    if (!view.is_object) {
        return false;
    }

    double distance;
    double level;
    if (!readNumber(view.object["d"], distance) || !readNumber(view.object["p"], level)) {
        return false;
    }
    if (distance < 0.0) {
        return false;
    }

    out.distance_mm = distance;
    out.has_level = true;
    out.level_pct = level;
    return true;
}

// Shape 2: {"distance": distance_mm, ...}
static bool parseDistanceShape(const PayloadView& view, DecodedFields& out) {
    if (!view.is_object) {
        return false;
    }

    double distance;
    if (!readNumber(view.object["distance"], distance) || distance < 0.0) {
        return false;
    }

    out.distance_mm = distance;
    out.has_level = false;

    // Optional self-reported level; a present but broken field fails the shape
    JsonVariantConst level = view.object["waterLevel"];
    if (!level.isNull()) {
        double pct;
        if (!readNumber(level, pct)) {
            return false;
        }
        out.has_level = true;
        out.level_pct = pct;
    }
    return true;
}

// Shape 3: bare number as ASCII, optionally followed by a unit ("87", "87mm", "87\0")
static bool parseBareNumber(const PayloadView& view, DecodedFields& out) {
    double distance;
    if (!telemetryParseLeadingNumber(view.text, view.length, distance) || distance < 0.0) {
        return false;
    }

    out.distance_mm = distance;
    out.has_level = false;
    return true;
}

// Order matters: first match wins
static const ShapeParser kShapeParsers[] = {
    parseCompactShape,
    parseDistanceShape,
    parseBareNumber,
};

TelemetryDecoder::TelemetryDecoder() : m_decoded(0), m_dropped(0) {
}

void TelemetryDecoder::resetCounters() {
    m_decoded.store(0);
    m_dropped.store(0);
}

bool TelemetryDecoder::decode(const uint8_t* payload, size_t length, const std::string& source_id,
                              uint32_t now_ms, SensorReading& out) {
    if (payload == nullptr || length == 0 || length > TELEMETRY_MAX_PAYLOAD) {
        m_dropped++;
        DEBUG_PRINTF(g_debug_telemetry, "Telemetry: Dropped payload (length %u)\n", (unsigned)length);
        return false;
    }

    PayloadView view;
    view.text = reinterpret_cast<const char*>(payload);
    view.length = length;
    view.is_object = false;

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, view.text, view.length,
                                               DeserializationOption::NestingLimit(TELEMETRY_JSON_NESTING));
    if (!err && doc.is<JsonObjectConst>()) {
        view.is_object = true;
        view.object = doc.as<JsonObjectConst>();
    }

    DecodedFields fields;
    fields.distance_mm = 0.0;
    fields.has_level = false;
    fields.level_pct = 0.0;

    bool matched = false;
    for (size_t i = 0; i < sizeof(kShapeParsers) / sizeof(kShapeParsers[0]); i++) {
        if (kShapeParsers[i](view, fields)) {
            matched = true;
            break;
        }
    }

    if (!matched) {
        m_dropped++;
        // Payload is not NUL-terminated; print at most what fits
        DEBUG_PRINTF(g_debug_telemetry, "Telemetry: Unparseable payload from %s: %.*s\n",
                     source_id.c_str(), (int)(length > 48 ? 48 : length), view.text);
        return false;
    }

    SensorReading reading;
    reading.distance_mm = fields.distance_mm;
    reading.has_raw_level = fields.has_level;
    reading.raw_level_pct = fields.level_pct;
    reading.timestamp_ms = now_ms;
    reading.source_id = source_id;
    out = reading;

    m_decoded++;
    DEBUG_PRINTF(g_debug_telemetry, "Telemetry: distance=%.1fmm level=%s\n",
                 reading.distance_mm, reading.has_raw_level ? "reported" : "none");
    return true;
}
