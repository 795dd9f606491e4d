// serial_commands.cpp
// Serial command parser for scanning, connecting, calibrating and
// configuring the hub from a USB terminal

#include "config.h"

#if ENABLE_SERIAL_COMMANDS

#include "serial_commands.h"
#include "session.h"
#include "storage.h"
#include <stdlib.h>
#include <string.h>

// Command buffer for serial input
#define CMD_BUFFER_SIZE 256
static char cmdBuffer[CMD_BUFFER_SIZE];
static uint16_t cmdBufferPos = 0;

static SessionCoordinator* g_session = nullptr;
static bool g_shutdown_requested = false;

// Initialize serial command handler
void serialCommandsInit(SessionCoordinator* session) {
    g_session = session;
    g_shutdown_requested = false;
    cmdBufferPos = 0;
    cmdBuffer[0] = '\0';
}

bool serialCommandsShutdownRequested() {
    return g_shutdown_requested;
}

// Parse unsigned integer from string
// Returns true if successful, false otherwise
static bool parseUInt(const char* str, uint32_t& value) {
    if (str == nullptr || *str == '\0' || *str == '-') {
        return false;
    }
    char* endptr;
    unsigned long result = strtoul(str, &endptr, 10);
    if (endptr == str || *endptr != '\0') {
        return false;
    }
    value = (uint32_t)result;
    return true;
}

// Parse decimal from string
static bool parseDouble(const char* str, double& value) {
    if (str == nullptr || *str == '\0') {
        return false;
    }
    char* endptr;
    double result = strtod(str, &endptr);
    if (endptr == str || *endptr != '\0') {
        return false;
    }
    value = result;
    return true;
}

static void printError(const LinkError& err) {
    Serial.printf("ERROR: %s - %s\n", errorKindName(err.kind),
                  err.message.empty() ? errorRemediation(err.kind) : err.message.c_str());
}

static void printResult(const LinkError& err, const char* ok_message) {
    if (err.ok()) {
        Serial.println(ok_message);
    } else {
        printError(err);
    }
}

// ==================== Discovery / Link ====================

static void handleScan() {
    LinkError err = g_session->startScan();
    if (err.ok()) {
        Serial.printf("Scanning for %us... (DEVICES to list, STOP SCAN to end)\n",
                      (unsigned)(g_session->config().scan_timeout_ms / 1000));
    } else {
        printError(err);
    }
}

static void handleStopScan() {
    g_session->stopScan();
    Serial.println("Scan stopped");
}

static void handleDevices() {
    std::vector<PeripheralHandle> devices = g_session->devices();
    if (devices.empty()) {
        Serial.println("No bottles found (run SCAN)");
        return;
    }
    Serial.println("=== Bottles ===");
    for (size_t i = 0; i < devices.size(); i++) {
        Serial.printf("  [%u] %s  %-20s %d dBm\n", (unsigned)i, devices[i].id.c_str(),
                      devices[i].name.empty() ? "(unnamed)" : devices[i].name.c_str(),
                      devices[i].rssi);
    }
}

// Format: CONNECT <index|address>
static void handleConnect(const char* args) {
    if (args == nullptr) {
        Serial.println("ERROR: Usage: CONNECT <index|address>");
        return;
    }

    std::string target(args);
    uint32_t index;
    if (parseUInt(args, index)) {
        std::vector<PeripheralHandle> devices = g_session->devices();
        if (index >= devices.size()) {
            Serial.printf("ERROR: No device at index %u (run DEVICES)\n", (unsigned)index);
            return;
        }
        target = devices[index].id;
    }

    Serial.printf("Connecting to %s...\n", target.c_str());
    printResult(g_session->connect(target), "Connected");
}

static void handleDisconnect() {
    g_session->disconnect();
    Serial.println("Disconnected");
}

// ==================== Subject / Calibration ====================

// Format: SUBJECT <id>   (no id: show current)
static void handleSubject(const char* args) {
    if (args == nullptr) {
        std::string subject = g_session->activeSubject();
        Serial.printf("Subject: %s\n", subject.empty() ? "(none)" : subject.c_str());
        return;
    }
    g_session->setActiveSubject(args);
    if (!storageSaveActiveSubject(args)) {
        Serial.println("WARNING: Subject not saved");
    }
    Serial.printf("Subject set to '%s' (%s)\n", args,
                  g_session->isCalibrated() ? "calibrated" : "not calibrated");
}

static void handleCalibrationStep(CalibrationStep step) {
    LinkError err = g_session->beginCalibration(step);
    if (!err.ok()) {
        printError(err);
        return;
    }
    if (step == CAL_STEP_EMPTY) {
        Serial.println("Place the EMPTY bottle on the hub and keep it still...");
    } else {
        Serial.println("Fill the bottle to the top and keep it still...");
    }
}

static void handleCalibrationComplete() {
    LinkError err = g_session->completeCalibration();
    if (err.ok()) {
        Calibration cal = g_session->activeCalibration();
        Serial.printf("Calibration saved: empty=%.1fmm full=%.1fmm capacity=%uml\n",
                      cal.empty_baseline_mm, cal.full_baseline_mm, (unsigned)cal.bottle_capacity_ml);
    } else {
        printError(err);
    }
}

static void handleCalibrationCancel() {
    g_session->cancelCalibration();
    Serial.println("Calibration cancelled");
}

static void handleCalibrationClear() {
    printResult(g_session->clearCalibration(), "Calibration cleared");
}

// Format: SET CAPACITY <ml>
static void handleSetCapacity(const char* args) {
    uint32_t ml;
    if (!parseUInt(args, ml)) {
        Serial.printf("ERROR: Usage: SET CAPACITY <ml> (%d-%d)\n", CAL_MIN_CAPACITY_ML, CAL_MAX_CAPACITY_ML);
        return;
    }
    LinkError err = g_session->setBottleCapacity(ml);
    if (err.ok()) {
        Serial.printf("Bottle capacity set to %uml\n", (unsigned)ml);
    } else {
        printError(err);
    }
}

// ==================== Control Writes ====================

// Format: SLEEP <minutes>
static void handleSleep(const char* args) {
    uint32_t minutes;
    if (!parseUInt(args, minutes)) {
        Serial.printf("ERROR: Usage: SLEEP <minutes> (1-%d)\n", SESSION_SLEEP_MAX_MINUTES);
        return;
    }
    LinkError err = g_session->enterSleep(minutes);
    if (err.ok()) {
        Serial.printf("Bottle sleeping for %u min, link will drop shortly\n", (unsigned)minutes);
    } else {
        printError(err);
    }
}

static void handleWake() {
    printResult(g_session->wake(), "Wake sent");
}

// Format: SEND <text>   (written verbatim)
static void handleSend(const char* args) {
    if (args == nullptr) {
        Serial.println("ERROR: Usage: SEND <text>");
        return;
    }
    printResult(g_session->sendRawCommand(args), "Sent");
}

// Format: CONFIG {"key":value,...}
static void handleConfig(const char* args) {
    if (args == nullptr) {
        Serial.println("ERROR: Usage: CONFIG <json object>");
        return;
    }
    printResult(g_session->sendConfigUpdate(args), "Config update sent");
}

// ==================== Hub Settings ====================

static void saveConfig(const SessionConfig& config) {
    g_session->setConfig(config);
    if (!storageSaveSessionConfig(config)) {
        Serial.println("WARNING: Settings applied but not saved");
    }
}

// Format: SET SCAN TIMEOUT <seconds>
static void handleSetScanTimeout(const char* args) {
    uint32_t seconds;
    if (!parseUInt(args, seconds) || seconds < 1 || seconds > 120) {
        Serial.println("ERROR: Scan timeout must be 1-120 seconds");
        return;
    }
    SessionConfig config = g_session->config();
    config.scan_timeout_ms = seconds * 1000;
    saveConfig(config);
    Serial.printf("Scan timeout set to %us\n", (unsigned)seconds);
}

// Format: SET CONNECT TIMEOUT <seconds>
static void handleSetConnectTimeout(const char* args) {
    uint32_t seconds;
    if (!parseUInt(args, seconds) || seconds < 1 || seconds > 60) {
        Serial.println("ERROR: Connect timeout must be 1-60 seconds");
        return;
    }
    SessionConfig config = g_session->config();
    config.connect_timeout_ms = seconds * 1000;
    saveConfig(config);
    Serial.printf("Connect timeout set to %us\n", (unsigned)seconds);
}

// Format: SET MIN DISTANCE <mm>
static void handleSetMinDistance(const char* args) {
    double mm;
    if (!parseDouble(args, mm) || mm < 0.0 || mm > 500.0) {
        Serial.println("ERROR: Minimum distance must be 0-500 mm");
        return;
    }
    SessionConfig config = g_session->config();
    config.min_valid_distance_mm = mm;
    saveConfig(config);
    Serial.printf("Minimum valid distance set to %.1fmm\n", mm);
}

static void handleGetStatus() {
    SessionConfig config = g_session->config();
    Calibration cal = g_session->activeCalibration();

    Serial.println("\n=== HUB STATUS ===");
    Serial.print(g_session->diagnosticsReport().c_str());
    Serial.printf("Data fresh: %s\n", g_session->isDataFresh() ? "yes" : "no");

    Serial.println("\n--- Calibration ---");
    Serial.printf("Empty: %.1fmm%s  Full: %.1fmm%s  Capacity: %uml\n",
                  cal.empty_baseline_mm, g_session->isEmptyCalibrated() ? "" : " (not set)",
                  cal.full_baseline_mm, g_session->isFullCalibrated() ? "" : " (not set)",
                  (unsigned)cal.bottle_capacity_ml);

    Serial.println("\n--- Settings ---");
    Serial.printf("Scan timeout: %us  Connect timeout: %us\n",
                  (unsigned)(config.scan_timeout_ms / 1000), (unsigned)(config.connect_timeout_ms / 1000));
    Serial.printf("Min distance: %.1fmm  Sleep grace: %ums\n",
                  config.min_valid_distance_mm, (unsigned)config.sleep_grace_ms);

    Serial.println("\n--- Debug ---");
    Serial.printf("Debug: %s (ble=%d telemetry=%d calibration=%d session=%d)\n",
                  g_debug_enabled ? "ON" : "OFF", g_debug_ble, g_debug_telemetry,
                  g_debug_calibration, g_debug_session);
    Serial.println("==================\n");
}

static void handleShutdown() {
    Serial.println("Shutting down session...");
    g_session->shutdown();
    g_shutdown_requested = true;
    Serial.println("Session stopped. Reset the hub to restart.");
}

// Handle debug level command (0-2, 9)
static void handleDebugLevel(char level) {
    switch (level) {
        case '0':  // Level 0: All OFF
            g_debug_enabled = false;
            g_debug_ble = false;
            g_debug_telemetry = false;
            g_debug_calibration = false;
            g_debug_session = false;
            Serial.println("Debug Level 0: All debug OFF");
            break;

        case '1':  // Level 1: Session + calibration events
            g_debug_enabled = true;
            g_debug_ble = false;
            g_debug_telemetry = false;
            g_debug_calibration = true;
            g_debug_session = true;
            Serial.println("Debug Level 1: Events (connection, calibration)");
            break;

        case '2':  // Level 2: + Telemetry
            g_debug_enabled = true;
            g_debug_ble = false;
            g_debug_telemetry = true;
            g_debug_calibration = true;
            g_debug_session = true;
            Serial.println("Debug Level 2: + Telemetry (every reading, dropped payloads)");
            break;

        case '9':  // Level 9: All ON
            g_debug_enabled = true;
            g_debug_ble = true;
            g_debug_telemetry = true;
            g_debug_calibration = true;
            g_debug_session = true;
            Serial.println("Debug Level 9: All debug ON (adds BLE scan/GATT)");
            break;

        default:
            Serial.println("ERROR: Invalid debug level (use 0-2 or 9)");
            break;
    }
}

// Helper: Parse command into words (space-separated)
// Modifies input string in-place, null-terminates words and uppercases them
// Returns number of words parsed
static int parseCommandWords(char* input, char* words[], int max_words) {
    int word_count = 0;
    char* start = input;
    bool in_word = false;

    for (char* p = input; *p && word_count < max_words; p++) {
        if (*p == ' ' || *p == '\t') {
            if (in_word) {
                *p = '\0';  // Null-terminate word
                words[word_count++] = start;
                in_word = false;
            }
        } else {
            if (!in_word) {
                start = p;
                in_word = true;
            }
            *p = toupper((unsigned char)*p);
        }
    }

    // Handle last word
    if (in_word && word_count < max_words) {
        words[word_count++] = start;
    }
    return word_count;
}

// Helper: Check if first N words match a pattern (allows extra words for arguments)
static bool matchWordsPrefix(char* words[], int word_count, const char* pattern[], int pattern_count) {
    if (word_count < pattern_count) return false;  // Not enough words
    for (int i = 0; i < pattern_count; i++) {
        if (strcmp(words[i], pattern[i]) != 0) return false;
    }
    return true;
}

// Helper: Arguments after the first N words, case preserved (JSON, subject ids)
// Returns nullptr if there are none
static const char* rawArgs(const char* original, int skip_words) {
    const char* p = original;
    for (int i = 0; i < skip_words; i++) {
        while (*p == ' ' || *p == '\t') p++;
        while (*p && *p != ' ' && *p != '\t') p++;
    }
    while (*p == ' ' || *p == '\t') p++;
    return (*p == '\0') ? nullptr : p;
}

static void printHelp() {
    Serial.println("\nAvailable commands:");
    Serial.println("Debug Control:");
    Serial.println("  0-2, 9                - Set debug level (0=OFF, 1=Events, 2=+Telemetry, 9=All)");
    Serial.println("\nBottle Link:");
    Serial.println("  SCAN                  - Look for bottles");
    Serial.println("  STOP SCAN             - End the scan early");
    Serial.println("  DEVICES               - List bottles found");
    Serial.println("  CONNECT <n|address>   - Connect by list index or address");
    Serial.println("  DISCONNECT            - Drop the link");
    Serial.println("\nCalibration:");
    Serial.println("  SUBJECT [id]          - Show or set whose bottle this is");
    Serial.println("  CAL EMPTY             - Capture the empty baseline");
    Serial.println("  CAL FULL              - Capture the full baseline (completes calibration)");
    Serial.println("  CAL COMPLETE          - Validate and save without waiting");
    Serial.println("  CAL CANCEL            - Abandon the current step");
    Serial.println("  CAL CLEAR             - Forget this subject's calibration");
    Serial.println("  SET CAPACITY <ml>     - Bottle capacity");
    Serial.println("\nBottle Control:");
    Serial.println("  SLEEP <minutes>       - Put the bottle into deep sleep");
    Serial.println("  WAKE                  - Send wake");
    Serial.println("  SEND <text>           - Write raw text to the control characteristic");
    Serial.println("  CONFIG <json>         - Send a config_update");
    Serial.println("\nHub Settings:");
    Serial.println("  SET SCAN TIMEOUT <s>     - Scan window (default 15)");
    Serial.println("  SET CONNECT TIMEOUT <s>  - Connect timeout (default 10)");
    Serial.println("  SET MIN DISTANCE <mm>    - Below this the bottle is treated as absent (default 40)");
    Serial.println("\nSystem:");
    Serial.println("  GET STATUS            - Show session status and settings");
    Serial.println("  SHUTDOWN              - Stop the session");
}

// Process a complete command
static void processCommand(char* cmd) {
    // Trim leading whitespace
    while (*cmd == ' ' || *cmd == '\t') cmd++;

    // Check for empty command
    if (*cmd == '\0') return;

    // Check for single-character debug level commands ('0'-'2', '9')
    if (strlen(cmd) == 1 && ((cmd[0] >= '0' && cmd[0] <= '2') || cmd[0] == '9')) {
        handleDebugLevel(cmd[0]);
        return;
    }

    if (g_session == nullptr || g_shutdown_requested) {
        Serial.println("ERROR: Session not running");
        return;
    }

    // Keep the original text for case-sensitive arguments
    char original[CMD_BUFFER_SIZE];
    strncpy(original, cmd, sizeof(original) - 1);
    original[sizeof(original) - 1] = '\0';

    char* words[8];
    int word_count = parseCommandWords(cmd, words, 8);
    if (word_count == 0) return;

    // Three-word commands
    if (word_count >= 3) {
        const char* pattern1[] = {"SET", "SCAN", "TIMEOUT"};
        if (matchWordsPrefix(words, word_count, pattern1, 3)) {
            handleSetScanTimeout(rawArgs(original, 3));
            return;
        }
        const char* pattern2[] = {"SET", "CONNECT", "TIMEOUT"};
        if (matchWordsPrefix(words, word_count, pattern2, 3)) {
            handleSetConnectTimeout(rawArgs(original, 3));
            return;
        }
        const char* pattern3[] = {"SET", "MIN", "DISTANCE"};
        if (matchWordsPrefix(words, word_count, pattern3, 3)) {
            handleSetMinDistance(rawArgs(original, 3));
            return;
        }
    }

    // Two-word commands
    if (word_count >= 2) {
        const char* pattern1[] = {"STOP", "SCAN"};
        if (matchWordsPrefix(words, word_count, pattern1, 2)) {
            handleStopScan();
            return;
        }
        const char* pattern2[] = {"CAL", "EMPTY"};
        if (matchWordsPrefix(words, word_count, pattern2, 2)) {
            handleCalibrationStep(CAL_STEP_EMPTY);
            return;
        }
        const char* pattern3[] = {"CAL", "FULL"};
        if (matchWordsPrefix(words, word_count, pattern3, 2)) {
            handleCalibrationStep(CAL_STEP_FULL);
            return;
        }
        const char* pattern4[] = {"CAL", "COMPLETE"};
        if (matchWordsPrefix(words, word_count, pattern4, 2)) {
            handleCalibrationComplete();
            return;
        }
        const char* pattern5[] = {"CAL", "CANCEL"};
        if (matchWordsPrefix(words, word_count, pattern5, 2)) {
            handleCalibrationCancel();
            return;
        }
        const char* pattern6[] = {"CAL", "CLEAR"};
        if (matchWordsPrefix(words, word_count, pattern6, 2)) {
            handleCalibrationClear();
            return;
        }
        const char* pattern7[] = {"SET", "CAPACITY"};
        if (matchWordsPrefix(words, word_count, pattern7, 2)) {
            handleSetCapacity(rawArgs(original, 2));
            return;
        }
        const char* pattern8[] = {"GET", "STATUS"};
        if (matchWordsPrefix(words, word_count, pattern8, 2)) {
            handleGetStatus();
            return;
        }
    }

    // One-word commands (arguments follow, case preserved)
    const char* word = words[0];
    if (strcmp(word, "SCAN") == 0) {
        handleScan();
    } else if (strcmp(word, "DEVICES") == 0) {
        handleDevices();
    } else if (strcmp(word, "CONNECT") == 0) {
        handleConnect(rawArgs(original, 1));
    } else if (strcmp(word, "DISCONNECT") == 0) {
        handleDisconnect();
    } else if (strcmp(word, "SUBJECT") == 0) {
        handleSubject(rawArgs(original, 1));
    } else if (strcmp(word, "SLEEP") == 0) {
        handleSleep(rawArgs(original, 1));
    } else if (strcmp(word, "WAKE") == 0) {
        handleWake();
    } else if (strcmp(word, "SEND") == 0) {
        handleSend(rawArgs(original, 1));
    } else if (strcmp(word, "CONFIG") == 0) {
        handleConfig(rawArgs(original, 1));
    } else if (strcmp(word, "SHUTDOWN") == 0) {
        handleShutdown();
    } else if (strcmp(word, "HELP") == 0) {
        printHelp();
    } else {
        Serial.print("ERROR: Unknown command: ");
        for (int i = 0; i < word_count; i++) {
            if (i > 0) Serial.print(" ");
            Serial.print(words[i]);
        }
        Serial.println();
        printHelp();
    }
}

// Update serial command handler (call in loop())
void serialCommandsUpdate() {
    while (Serial.available() > 0) {
        char c = Serial.read();

        // Handle newline (command complete)
        if (c == '\n' || c == '\r') {
            if (cmdBufferPos > 0) {
                cmdBuffer[cmdBufferPos] = '\0';
                processCommand(cmdBuffer);
                cmdBufferPos = 0;
            }
        }
        // Add character to buffer
        else if (cmdBufferPos < CMD_BUFFER_SIZE - 1) {
            cmdBuffer[cmdBufferPos++] = c;
        }
        // Buffer overflow - reset
        else {
            Serial.println("ERROR: Command too long");
            cmdBufferPos = 0;
        }
    }
}

#endif // ENABLE_SERIAL_COMMANDS
