/**
 * PillBridge - Status & Log Sink
 * Category-gated debug logging and user-facing status lines for the
 * platform-independent modules (decoder, sync client, sessions)
 */

#ifndef STATUS_LOG_H
#define STATUS_LOG_H

#include <string>

// Debug categories, each gated by its g_debug_* runtime flag
enum LogCategory {
    LOG_SESSION,    // g_debug_session
    LOG_SYNC,       // g_debug_sync
    LOG_DECODER,    // g_debug_decoder
    LOG_SCANNER,    // g_debug_scanner
    LOG_STORAGE,    // g_debug_storage
};

// Receives one complete line (no trailing newline)
typedef void (*LogSinkCallback)(const char* line);

// Register the output sink (nullptr drops all output)
void statusLogSetSink(LogSinkCallback sink);

// Debug output, emitted only when g_debug_enabled and the category flag are set
// Lines are prefixed with the category tag, e.g. "[SYNC] "
void statusLogf(LogCategory category, const char* fmt, ...)
    __attribute__((format(printf, 2, 3)));

// Status output, always emitted and remembered as the last status line
void statusReportf(const char* fmt, ...)
    __attribute__((format(printf, 1, 2)));

// Most recent statusReportf() line (empty if none yet)
std::string statusLastMessage();

// Apply a debug level preset ('0'-'4', '9')
// Returns false for an unknown level (flags unchanged)
bool statusLogSetLevel(char level);

#endif // STATUS_LOG_H
