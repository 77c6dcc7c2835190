/**
 * PillBridge - Configuration Constants
 * Centralized configuration for scanning, sync and session timing
 */

#ifndef CONFIG_H
#define CONFIG_H

#include <stdint.h>  // For uint8_t, uint32_t types

// ==================== Feature Flags ====================

// Serial console for WiFi/MeadTools/session configuration over USB
#define ENABLE_SERIAL_COMMANDS          1

// NimBLE passive scanner for RAPT Pill advertisements
#define ENABLE_BLE_SCANNER              1

// ==================== Debug Configuration ====================

// Debug levels (runtime control via serial commands '0'-'4', '9')
// Level 0: All debug output OFF (quiet mode)
// Level 1: Session events (start/stop, publish results)
// Level 2: + MeadTools protocol (requests, responses, token handling)
// Level 3: + Decoded advertisements
// Level 4: + Scanner activity (scan windows, raw manufacturer data)
// Level 9: All debug ON

// Default debug flags (can be overridden at runtime via serial commands)
#define DEBUG_ENABLED                   1   // 0 = quiet mode, 1 = verbose debug output
#define DEBUG_SESSION                   1   // 0 = disable session lifecycle messages
#define DEBUG_SYNC                      1   // 0 = disable MeadTools protocol messages
#define DEBUG_DECODER                   0   // 0 = disable per-advertisement decode output
#define DEBUG_SCANNER                   0   // 0 = disable scan window messages
#define DEBUG_STORAGE                   1   // 0 = disable NVS messages

// Runtime debug control - these extern declarations allow runtime debug control
// Use these macros in your code instead of #if DEBUG_* for runtime control
#ifndef CONFIG_H_GLOBALS_ONLY
extern bool g_debug_enabled;
extern bool g_debug_session;
extern bool g_debug_sync;
extern bool g_debug_decoder;
extern bool g_debug_scanner;
extern bool g_debug_storage;

// Helper macros for conditional debug output (runtime control)
// Serial-backed: only usable from firmware modules that include Arduino.h
#define DEBUG_PRINT(category, ...) \
    do { \
        if (g_debug_enabled && category) { \
            Serial.print(__VA_ARGS__); \
        } \
    } while(0)

#define DEBUG_PRINTLN(category, ...) \
    do { \
        if (g_debug_enabled && category) { \
            Serial.println(__VA_ARGS__); \
        } \
    } while(0)

#define DEBUG_PRINTF(category, ...) \
    do { \
        if (g_debug_enabled && category) { \
            Serial.printf(__VA_ARGS__); \
        } \
    } while(0)
#endif

// ==================== RAPT Pill Advertisement ====================

// Manufacturer data vendor id carried by the Pill ("RA" little-endian)
#define PILL_VENDOR_ID                  16722
#define PILL_PAYLOAD_LENGTH             23      // Bytes after the vendor id
#define PILL_SENTINEL_PAYLOAD           "PTdPillG1"  // Non-data broadcast, ignored

// ==================== Sessions ====================

#define PILLBRIDGE_MAX_SESSIONS         4       // NVS slots and registry capacity
#define SESSION_POLL_INTERVAL_DEFAULT_S 120     // Listening window when none configured
#define SESSION_POLL_INTERVAL_MIN_S     5
#define SESSION_POLL_INTERVAL_MAX_S     3600
#define SESSION_SCAN_PAUSE_MS           10000   // Pause between listening windows
#define SESSION_PUBLISH_MIN_INTERVAL_MS 5000    // MeadTools rate limit
#define SESSION_RECIPE_UNSET            -1      // No recipe linked

// Session worker (one FreeRTOS task + queue per session)
#define SESSION_QUEUE_DEPTH             8
#define SESSION_TASK_STACK_BYTES        8192
#define SESSION_TASK_PRIORITY           1
#define SESSION_TASK_EXIT_TIMEOUT_MS    3000

// ==================== BLE Scanner ====================

#define SCANNER_WINDOW_MS               1000    // Single NimBLE scan window
#define SCANNER_IDLE_POLL_MS            250     // Re-check interval when no session listens
#define SCANNER_TASK_STACK_BYTES        4096
#define SCANNER_TASK_PRIORITY           1

// ==================== MeadTools / HTTP ====================

#define MT_DEFAULT_BASE_URL             "https://meadtools.com/api"
#define MT_HTTP_TIMEOUT_MS              10000   // Regular requests
#define MT_END_BREW_TIMEOUT_MS          4000    // Bounded teardown request

// ==================== WiFi ====================

#define WIFI_CONNECT_TIMEOUT_MS         15000
#define WIFI_RECONNECT_INTERVAL_MS      30000
#define WIFI_NTP_SERVER                 "pool.ntp.org"

// NVS Storage
#define NVS_NAMESPACE                   "pillbridge"

#endif // CONFIG_H
