/**
 * PillBridge - Status & Log Sink
 * Implementation
 */

#include "status_log.h"
#include "config.h"

#include <mutex>
#include <stdarg.h>
#include <stdio.h>

// Runtime debug control (non-persistent, reset on boot)
bool g_debug_enabled = DEBUG_ENABLED;
bool g_debug_session = DEBUG_SESSION;
bool g_debug_sync = DEBUG_SYNC;
bool g_debug_decoder = DEBUG_DECODER;
bool g_debug_scanner = DEBUG_SCANNER;
bool g_debug_storage = DEBUG_STORAGE;

#define STATUS_LINE_MAX 256

static LogSinkCallback g_sink = nullptr;
static std::mutex g_log_mutex;
static std::string g_last_status;

static bool categoryEnabled(LogCategory category) {
    switch (category) {
        case LOG_SESSION: return g_debug_session;
        case LOG_SYNC:    return g_debug_sync;
        case LOG_DECODER: return g_debug_decoder;
        case LOG_SCANNER: return g_debug_scanner;
        case LOG_STORAGE: return g_debug_storage;
    }
    return false;
}

static const char* categoryTag(LogCategory category) {
    switch (category) {
        case LOG_SESSION: return "[SESSION] ";
        case LOG_SYNC:    return "[SYNC] ";
        case LOG_DECODER: return "[DECODE] ";
        case LOG_SCANNER: return "[SCAN] ";
        case LOG_STORAGE: return "[NVS] ";
    }
    return "";
}

void statusLogSetSink(LogSinkCallback sink) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_sink = sink;
}

void statusLogf(LogCategory category, const char* fmt, ...) {
    if (!g_debug_enabled || !categoryEnabled(category)) {
        return;
    }

    char line[STATUS_LINE_MAX];
    int prefix = snprintf(line, sizeof(line), "%s", categoryTag(category));
    va_list args;
    va_start(args, fmt);
    vsnprintf(line + prefix, sizeof(line) - prefix, fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_sink) {
        g_sink(line);
    }
}

void statusReportf(const char* fmt, ...) {
    char line[STATUS_LINE_MAX];
    va_list args;
    va_start(args, fmt);
    vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_last_status = line;
    if (g_sink) {
        g_sink(line);
    }
}

std::string statusLastMessage() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_last_status;
}

bool statusLogSetLevel(char level) {
    switch (level) {
        case '0':  // Level 0: All OFF
            g_debug_enabled = false;
            g_debug_session = false;
            g_debug_sync = false;
            g_debug_decoder = false;
            g_debug_scanner = false;
            g_debug_storage = false;
            return true;

        case '1':  // Level 1: Session events
            g_debug_enabled = true;
            g_debug_session = true;
            g_debug_sync = false;
            g_debug_decoder = false;
            g_debug_scanner = false;
            g_debug_storage = false;
            return true;

        case '2':  // Level 2: + MeadTools protocol
            g_debug_enabled = true;
            g_debug_session = true;
            g_debug_sync = true;
            g_debug_decoder = false;
            g_debug_scanner = false;
            g_debug_storage = true;
            return true;

        case '3':  // Level 3: + Decoded advertisements
            g_debug_enabled = true;
            g_debug_session = true;
            g_debug_sync = true;
            g_debug_decoder = true;
            g_debug_scanner = false;
            g_debug_storage = true;
            return true;

        case '4':  // Level 4: + Scanner
        case '9':  // Level 9: All ON
            g_debug_enabled = true;
            g_debug_session = true;
            g_debug_sync = true;
            g_debug_decoder = true;
            g_debug_scanner = true;
            g_debug_storage = true;
            return true;

        default:
            return false;
    }
}
