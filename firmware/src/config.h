/**
 * Hydrolink - Configuration Constants
 * Centralized configuration for the link hub and its session core
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>  // For uint8_t, uint32_t types

// ==================== Feature Flags ====================

// Serial console (USB) for driving the hub without a companion app.
// The console is the hub's "UI collaborator": scan, connect, calibrate, sleep.
#define ENABLE_SERIAL_COMMANDS          1

// ==================== Debug Configuration ====================

// Debug levels (runtime control via serial commands '0', '1', '2', '9')
// Level 0: All debug output OFF (quiet mode)
// Level 1: Session events (state changes, calibration steps, subject switches)
// Level 2: + Telemetry (every decoded reading, dropped payloads)
// Level 9: All debug ON (adds BLE scan/connect/GATT details)

// Default debug flags (can be overridden at runtime via serial commands)
#define DEBUG_ENABLED                   1   // 0 = quiet mode, 1 = verbose debug output
#define DEBUG_BLE                       1   // 0 = disable BLE debug, 1 = enable BLE debug
#define DEBUG_TELEMETRY                 0   // 0 = disable per-reading messages
#define DEBUG_CALIBRATION               1   // 0 = disable calibration debug
#define DEBUG_SESSION                   1   // 0 = disable session state messages

// Runtime debug control - these extern declarations allow runtime debug control
// Use these macros in your code instead of #if DEBUG_* for runtime control
#ifndef CONFIG_H_GLOBALS_ONLY
#include "log.h"

extern bool g_debug_enabled;
extern bool g_debug_ble;
extern bool g_debug_telemetry;
extern bool g_debug_calibration;
extern bool g_debug_session;

// Helper macros for conditional debug output (runtime control)
#define DEBUG_PRINTF(category, ...) \
    do { \
        if (g_debug_enabled && category) { \
            logPrintf(__VA_ARGS__); \
        } \
    } while(0)

// Unconditional output (errors, warnings, console replies)
#define LOG_PRINTF(...) logPrintf(__VA_ARGS__)
#endif

// ==================== Transport (BLE central) ====================

#define BLE_SCAN_TIMEOUT_MS             15000   // Default discovery window
#define BLE_SCAN_INTERVAL               100     // Scan interval (0.625ms units)
#define BLE_SCAN_WINDOW                 99      // Scan window (0.625ms units)
#define BLE_CONNECT_TIMEOUT_MS          10000   // Connect attempt fails fast after 10s
#define BLE_READ_POLL_INTERVAL_MS       1000    // Poll period for read-only telemetry characteristics
#define BLE_MTU_SIZE                    185     // Requested MTU (JSON payloads fit in one notification)
#define BLE_MAX_SCAN_RESULTS            16      // Cap on peripherals kept per scan session

// ==================== Telemetry ====================

#define TELEMETRY_MAX_PAYLOAD           128     // Longer payloads are rejected outright
#define TELEMETRY_JSON_NESTING          4       // Max nesting accepted from firmware payloads

// ==================== Calibration ====================

// Two-point calibration: empty bottle (longest echo) then full bottle (shortest echo)
#define CAL_SAMPLES_PER_STEP            10      // Readings reduced per calibration step
#define CAL_DEFAULT_CAPACITY_ML         1000    // Capacity used before the user sets one
#define CAL_MIN_CAPACITY_ML             100     // Smallest capacity accepted from the console
#define CAL_MAX_CAPACITY_ML             5000    // Largest capacity accepted from the console

// Physical sanity gate: anything closer than this is not a bottle on the sensor
#define MIN_VALID_DISTANCE_MM           40.0

// ==================== Session ====================

#define SESSION_SLEEP_GRACE_MS          3000    // Wait for the bottle to drop the link after deep_sleep
#define SESSION_DATA_FRESH_MS           10000   // Reading older than this is stale
#define SESSION_EVENT_QUEUE_DEPTH       32      // Pending observer events before oldest reading is dropped
#define SESSION_SLEEP_MAX_MINUTES       1440    // Longest deep sleep the console will request

// NVS Storage
#define NVS_NAMESPACE                   "hydrolink"  // NVS namespace for calibrations and settings

#endif // CONFIG_H
