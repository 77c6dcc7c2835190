/**
 * PillBridge - Session Engine
 * Implementation
 */

#include "session_engine.h"
#include "pill_decoder.h"
#include "status_log.h"

#include <strings.h>

SessionEngine::SessionEngine(const SessionConfig& config, HttpTransport& transport,
                             MeadToolsAccount& account, const SessionClock& clock)
    : config_(config),
      clock_(clock),
      account_(account),
      client_(transport),
      state_(SESSION_CREATED),
      stop_requested_(false),
      remote_sync_(false),
      listen_started_ms_(0),
      published_once_(false),
      last_publish_ms_(0),
      advertisements_(0),
      decode_failures_(0),
      publishes_(0),
      publish_failures_(0) {
}

void SessionEngine::requestStart() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
}

void SessionEngine::requestStop() {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
}

bool SessionEngine::setConfig(const SessionConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SESSION_INITIALIZING || state_ == SESSION_RUNNING) {
        return false;
    }
    config_ = config;
    return true;
}

StartResult SessionEngine::start() {
    SessionState previous;
    SessionConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SESSION_INITIALIZING || state_ == SESSION_RUNNING) {
            return START_IGNORED;
        }
        if (stop_requested_) {
            state_ = SESSION_STOPPED;
            statusReportf("%s: start cancelled by stop", config_.brew_name.c_str());
            return START_CANCELLED;
        }
        previous = state_;
        state_ = SESSION_INITIALIZING;
        config = config_;
    }

    statusReportf("Starting session: %s", config.brew_name.c_str());

    bool remote = false;
    if (!account_.settings().sync_enabled) {
        statusLogf(LOG_SESSION, "%s: MeadTools sync disabled", config.brew_name.c_str());
    } else {
        SyncResult login = account_.ensureLoggedIn();
        if (!login.ok()) {
            statusReportf("%s: not logged in (%s), will only print to output",
                          config.brew_name.c_str(), syncStatusName(login.status));
        } else {
            SyncResult result = account_.ensureDeviceToken();
            if (result.ok()) {
                account_.applyTo(client_);
                result = client_.resolveHydrometer(config.effectivePillName());
            }
            if (result.ok()) {
                result = client_.resolveBrew(config.brew_name, config.recipe_id);
            }
            if (!result.ok()) {
                std::lock_guard<std::mutex> lock(mutex_);
                state_ = previous;
                statusReportf("%s: MeadTools setup failed (%s, HTTP %d)", config.brew_name.c_str(),
                              syncStatusName(result.status), result.http_status);
                return START_FAILED;
            }
            remote = true;
        }
    }

    std::string hydrometer_id = remote ? client_.identity().hydrometer_id : "";
    std::string brew_id = remote ? client_.identity().brew_id : "";
    uint32_t now_ms = clock_.millis();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SESSION_RUNNING;
        remote_sync_ = remote;
        hydrometer_id_ = hydrometer_id;
        brew_id_ = brew_id;
        listen_started_ms_ = now_ms;
        published_once_ = false;
    }

    if (remote) {
        statusReportf("%s: running (hydrometer %s, brew %s)", config.brew_name.c_str(),
                      hydrometer_id.c_str(), brew_id.c_str());
        return START_OK;
    }
    statusReportf("%s: running local-only", config.brew_name.c_str());
    return START_LOCAL_ONLY;
}

StopResult SessionEngine::stop() {
    bool remote;
    std::string hydrometer_id;
    std::string brew_id;
    std::string brew_name;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SESSION_RUNNING) {
            return STOP_NOT_RUNNING;
        }
        state_ = SESSION_STOPPED;
        remote = remote_sync_;
        hydrometer_id = hydrometer_id_;
        brew_id = brew_id_;
        brew_name = config_.brew_name;
    }

    statusReportf("Stopping session: %s", brew_name.c_str());
    if (remote) {
        SyncResult result = client_.endBrew(hydrometer_id, brew_id);
        if (!result.ok()) {
            statusReportf("%s: stopped, but brew %s was not ended remotely (%s)",
                          brew_name.c_str(), brew_id.c_str(), syncStatusName(result.status));
            return STOP_REMOTE_END_FAILED;
        }
    }
    statusReportf("Ended session: %s", brew_name.c_str());
    return STOP_OK;
}

bool SessionEngine::onAdvertisement(const uint8_t* data, size_t length) {
    bool celsius;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SESSION_RUNNING) {
            return false;
        }
        celsius = config_.celsius;
    }

    PillMetrics metrics;
    DecodeResult decoded = pillDecode(data, length, metrics);
    if (decoded != DECODE_OK) {
        std::lock_guard<std::mutex> lock(mutex_);
        decode_failures_++;
        statusReportf("%s: dropped malformed advertisement (%s, %u bytes)",
                      config_.brew_name.c_str(), pillDecodeResultName(decoded), (unsigned)length);
        return false;
    }

    LiveTelemetry telemetry;
    telemetry.valid = true;
    telemetry.api_version = metrics.version;
    telemetry.has_gravity_velocity = metrics.has_gravity_velocity;
    telemetry.gravity_velocity = metrics.gravity_velocity;
    telemetry.current_gravity = metricsGravity(metrics.gravity_raw);
    telemetry.temperature = metricsTemperature(metrics.temperature_raw, celsius);
    telemetry.battery_percent = metricsBatteryPercent(metrics.battery_raw);
    telemetry.x = metricsAccel(metrics.x_raw);
    telemetry.y = metricsAccel(metrics.y_raw);
    telemetry.z = metricsAccel(metrics.z_raw);
    telemetry.last_event = timestamp();

    uint32_t now_ms = clock_.millis();
    bool publish_now = false;
    double starting_gravity;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (anchor_.anchor(telemetry.current_gravity)) {
            statusLogf(LOG_SESSION, "%s: starting gravity %.4f", config_.brew_name.c_str(),
                       telemetry.current_gravity);
        }
        starting_gravity = anchor_.value();
        telemetry.abv = metricsAbv(starting_gravity, telemetry.current_gravity);
        telemetry_ = telemetry;
        advertisements_++;

        if (remote_sync_ &&
            (!published_once_ || now_ms - last_publish_ms_ >= SESSION_PUBLISH_MIN_INTERVAL_MS)) {
            published_once_ = true;
            last_publish_ms_ = now_ms;
            publish_now = true;
        }
    }

    statusLogf(LOG_DECODER, "v%u SG %.4f (start %.4f) ABV %.2f%% T %.2f%c bat %d%% x %.2f y %.2f z %.2f",
               (unsigned)telemetry.api_version, telemetry.current_gravity, starting_gravity, telemetry.abv,
               telemetry.temperature, celsius ? 'C' : 'F', telemetry.battery_percent,
               telemetry.x, telemetry.y, telemetry.z);

    if (publish_now) {
        publish(telemetry, now_ms);
    }
    return true;
}

void SessionEngine::publish(const LiveTelemetry& telemetry, uint32_t now_ms) {
    std::string name;
    bool celsius;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        name = config_.effectivePillName();
        celsius = config_.celsius;
    }

    SyncResult result = client_.publishDataPoint(client_.identity().device_token, name,
                                                 telemetry.current_gravity, telemetry.temperature,
                                                 celsius, telemetry.battery_percent);

    std::lock_guard<std::mutex> lock(mutex_);
    if (result.ok()) {
        publishes_++;
        statusLogf(LOG_SESSION, "%s: published SG %.4f at %lu ms", config_.brew_name.c_str(),
                   telemetry.current_gravity, (unsigned long)now_ms);
    } else {
        publish_failures_++;
    }
}

bool SessionEngine::isListening(uint32_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SESSION_RUNNING) {
        return false;
    }
    uint32_t poll_s = config_.poll_interval_s ? config_.poll_interval_s : SESSION_POLL_INTERVAL_DEFAULT_S;
    uint32_t window_ms = poll_s * 1000;
    uint32_t cycle_ms = window_ms + SESSION_SCAN_PAUSE_MS;
    return ((now_ms - listen_started_ms_) % cycle_ms) < window_ms;
}

SessionState SessionEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool SessionEngine::matchesAddress(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strcasecmp(config_.mac_address.c_str(), address.c_str()) == 0;
}

SessionSnapshot SessionEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snap;
    snap.state = state_;
    snap.remote_sync = remote_sync_;
    snap.config = config_;
    snap.telemetry = telemetry_;
    snap.calibrated = anchor_.isCalibrated();
    snap.starting_gravity = anchor_.value();
    snap.hydrometer_id = hydrometer_id_;
    snap.brew_id = brew_id_;
    snap.advertisements = advertisements_;
    snap.decode_failures = decode_failures_;
    snap.publishes = publishes_;
    snap.publish_failures = publish_failures_;
    return snap;
}

std::string SessionEngine::timestamp() const {
    time_t now = clock_.now();
    struct tm utc;
    gmtime_r(&now, &utc);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buffer;
}

void sessionExecute(SessionEngine& engine, const SessionCommand& command) {
    switch (command.type) {
        case CMD_START: {
            StartResult result = engine.start();
            statusLogf(LOG_SESSION, "Start -> %s", startResultName(result));
            break;
        }
        case CMD_STOP: {
            StopResult result = engine.stop();
            statusLogf(LOG_SESSION, "Stop -> %s", stopResultName(result));
            break;
        }
        case CMD_ADVERTISEMENT:
            if (!engine.onAdvertisement(command.payload, command.length)) {
                statusLogf(LOG_DECODER, "Advertisement not applied");
            }
            break;
    }
}

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SESSION_CREATED:      return "CREATED";
        case SESSION_INITIALIZING: return "INITIALIZING";
        case SESSION_RUNNING:      return "RUNNING";
        case SESSION_STOPPED:      return "STOPPED";
    }
    return "UNKNOWN";
}

const char* startResultName(StartResult result) {
    switch (result) {
        case START_OK:         return "OK";
        case START_LOCAL_ONLY: return "LOCAL_ONLY";
        case START_FAILED:     return "FAILED";
        case START_IGNORED:    return "IGNORED";
        case START_CANCELLED:  return "CANCELLED";
    }
    return "UNKNOWN";
}

const char* stopResultName(StopResult result) {
    switch (result) {
        case STOP_OK:                return "OK";
        case STOP_REMOTE_END_FAILED: return "REMOTE_END_FAILED";
        case STOP_NOT_RUNNING:       return "NOT_RUNNING";
    }
    return "UNKNOWN";
}
