/**
 * PillBridge - Session Engine
 * Lifecycle of one tracked Pill: remote setup, advertisement handling,
 * rate-limited publication and teardown
 *
 * Lifecycle: CREATED -> INITIALIZING -> RUNNING -> STOPPED (restartable)
 *
 * A start whose remote setup fails after login returns the session to the
 * state it left: CREATED if it never ran, STOPPED if it ran before. A start
 * that finds a stop already requested does no remote work and ends STOPPED.
 *
 * All mutating calls (start, stop, onAdvertisement) are made from the
 * session's own worker. Snapshots may be taken from any task.
 */

#ifndef SESSION_ENGINE_H
#define SESSION_ENGINE_H

#include <stdint.h>
#include <time.h>
#include <mutex>
#include <string>

#include "config.h"
#include "meadtools_client.h"
#include "pill_metrics.h"
#include "session_config.h"

enum SessionState {
    SESSION_CREATED = 0,
    SESSION_INITIALIZING,
    SESSION_RUNNING,
    SESSION_STOPPED,
};

enum StartResult {
    START_OK = 0,           // Running with remote sync
    START_LOCAL_ONLY,       // Running, telemetry is not published
    START_FAILED,           // Remote setup failed, session not running
    START_IGNORED,          // Already initializing or running
    START_CANCELLED,        // A stop was requested before the start ran
};

enum StopResult {
    STOP_OK = 0,
    STOP_REMOTE_END_FAILED, // Stopped, but the remote brew could not be ended
    STOP_NOT_RUNNING,
};

// Latest derived values (overwritten by every accepted advertisement)
struct LiveTelemetry {
    bool valid = false;
    uint8_t api_version = 0;
    bool has_gravity_velocity = false;
    double gravity_velocity = 0.0;
    double current_gravity = 0.0;
    double abv = 0.0;
    double temperature = 0.0;
    int battery_percent = 0;
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    std::string last_event;     // ISO-8601 UTC
};

// Copy of an engine's state for console/status readers
struct SessionSnapshot {
    SessionState state;
    bool remote_sync;
    SessionConfig config;
    LiveTelemetry telemetry;
    bool calibrated;
    double starting_gravity;
    std::string hydrometer_id;
    std::string brew_id;
    uint32_t advertisements;
    uint32_t decode_failures;
    uint32_t publishes;
    uint32_t publish_failures;
};

// Time sources, injected so the engine runs off-target
struct SessionClock {
    uint32_t (*millis)();       // Monotonic milliseconds
    time_t (*now)();            // Wall-clock UTC seconds
};

// Work item for a session worker
enum SessionCommandType {
    CMD_START = 0,
    CMD_STOP,
    CMD_ADVERTISEMENT,
};

struct SessionCommand {
    SessionCommandType type;
    uint8_t payload[PILL_PAYLOAD_LENGTH];
    uint8_t length;             // Valid bytes in payload (advertisement only)
};

class SessionEngine {
public:
    SessionEngine(const SessionConfig& config, HttpTransport& transport,
                  MeadToolsAccount& account, const SessionClock& clock);

    // Called by the poster before queueing CMD_START / CMD_STOP
    // A stop posted after a start cancels that start if it has not run yet
    void requestStart();
    void requestStop();

    // Replace the configuration; refused while initializing or running
    bool setConfig(const SessionConfig& config);

    StartResult start();
    StopResult stop();

    /**
     * Handle one advertisement payload from this session's Pill
     * Ignored unless running. Malformed payloads are counted and dropped.
     * @return true if the payload was decoded and applied
     */
    bool onAdvertisement(const uint8_t* data, size_t length);

    // True while running and inside a listening window
    bool isListening(uint32_t now_ms) const;

    SessionState state() const;
    bool matchesAddress(const std::string& address) const;
    SessionSnapshot snapshot() const;

private:
    void publish(const LiveTelemetry& telemetry, uint32_t now_ms);
    std::string timestamp() const;

    mutable std::mutex mutex_;
    SessionConfig config_;
    SessionClock clock_;
    MeadToolsAccount& account_;
    MeadToolsClient client_;

    SessionState state_;
    bool stop_requested_;
    bool remote_sync_;
    std::string hydrometer_id_;
    std::string brew_id_;
    GravityAnchor anchor_;
    LiveTelemetry telemetry_;

    uint32_t listen_started_ms_;
    bool published_once_;
    uint32_t last_publish_ms_;

    uint32_t advertisements_;
    uint32_t decode_failures_;
    uint32_t publishes_;
    uint32_t publish_failures_;
};

// Run one queued command against the engine
void sessionExecute(SessionEngine& engine, const SessionCommand& command);

const char* sessionStateName(SessionState state);
const char* startResultName(StartResult result);
const char* stopResultName(StopResult result);

#endif // SESSION_ENGINE_H
