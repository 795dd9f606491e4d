/**
 * Hydrolink - Telemetry Decoder
 * Turns raw bottle notifications into SensorReading values
 *
 * Bottle firmware revisions disagree on payload shape. Shapes are tried in
 * order and the first that parses wins:
 *   1. {"p": percent, "d": distance_mm}
 *   2. {"distance": distance_mm, "waterLevel": percent (optional), ...}
 *   3. bare ASCII number, e.g. "87" or " 87.5\n"
 * Anything else is counted, logged and dropped.
 */

#ifndef TELEMETRY_H
#define TELEMETRY_H

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <string>
#include "types.h"

class TelemetryDecoder {
public:
    TelemetryDecoder();

    /**
     * Decode one notification payload
     * @param payload Raw bytes as received (not NUL-terminated)
     * @param length Payload size in bytes
     * @param source_id Peripheral the payload came from
     * @param now_ms Monotonic receive time stamped on the reading
     * @param out Filled only on success
     * @return true if a shape matched, false if the payload was dropped
     */
    bool decode(const uint8_t* payload, size_t length, const std::string& source_id,
                uint32_t now_ms, SensorReading& out);

    uint32_t decodedCount() const { return m_decoded.load(); }
    uint32_t droppedCount() const { return m_dropped.load(); }
    void resetCounters();

private:
    std::atomic<uint32_t> m_decoded;
    std::atomic<uint32_t> m_dropped;
};

// Strict numeric text parse (digits, sign, point, exponent; surrounding whitespace
// and trailing NULs allowed). Rejects NaN, infinity, hex and trailing garbage.
bool telemetryParseNumber(const char* text, size_t length, double& out);

// Leading number of a bare payload. Trailing text such as a unit is ignored
// ("87mm" -> 87) unless it continues the number ("1.2.3", "12 34", "0x10").
bool telemetryParseLeadingNumber(const char* text, size_t length, double& out);

#endif // TELEMETRY_H
