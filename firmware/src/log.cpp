/**
 * Hydrolink - Debug Output
 * Implementation
 */

#include "log.h"
#include "config.h"

#include <stdarg.h>
#include <stdio.h>
#include <atomic>

// Runtime debug control (non-persistent, reset on boot)
bool g_debug_enabled = DEBUG_ENABLED;
bool g_debug_ble = DEBUG_BLE;
bool g_debug_telemetry = DEBUG_TELEMETRY;
bool g_debug_calibration = DEBUG_CALIBRATION;
bool g_debug_session = DEBUG_SESSION;

// Messages are produced from the loop task and the NimBLE host task
static std::atomic<LogSink> g_sink(nullptr);

#define LOG_BUFFER_SIZE 256

void logSetSink(LogSink sink) {
    g_sink.store(sink);
}

void logPrintf(const char* fmt, ...) {
    LogSink sink = g_sink.load();
    if (sink == nullptr) {
        return;
    }

    char buffer[LOG_BUFFER_SIZE];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    sink(buffer);
}
