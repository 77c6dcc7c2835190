/**
 * PillBridge - MeadTools Sync Client
 * Implementation
 */

#include "meadtools_client.h"
#include "status_log.h"
#include "config.h"

#include <ArduinoJson.h>

#include <stdlib.h>

// API paths (appended to the configured base URL)
static const char* PATH_LOGIN = "/auth/login";
static const char* PATH_REFRESH = "/auth/refresh";
static const char* PATH_HYDROMETERS = "/hydrometer";
static const char* PATH_REGISTER_PILL = "/hydrometer/rapt-pill/register";
static const char* PATH_DEVICE_TOKEN = "/hydrometer/token";
static const char* PATH_BREWS = "/hydrometer/brew";
static const char* PATH_DATA_POINT = "/hydrometer/rapt-pill";

#define HTTP_OK 200

static SyncResult makeResult(SyncStatus status, int http_status) {
    SyncResult result;
    result.status = status;
    result.http_status = http_status;
    return result;
}

// Status for a failed (non-200) response
static SyncResult failureFor(const HttpResponse& response) {
    return makeResult(SYNC_REMOTE_UNAVAILABLE, response.status);
}

// Ids arrive as numbers or strings; keep them as strings
static bool readId(JsonVariantConst value, std::string& out) {
    if (value.is<const char*>()) {
        out = value.as<const char*>();
        return !out.empty();
    }
    if (value.is<long>()) {
        out = std::to_string(value.as<long>());
        return true;
    }
    return false;
}

// Send numeric ids back as numbers
static void writeId(JsonDocument& doc, const char* key, const std::string& id) {
    bool numeric = !id.empty() && id.size() < 10;
    for (size_t i = 0; numeric && i < id.size(); i++) {
        if (id[i] < '0' || id[i] > '9') {
            numeric = false;
        }
    }
    if (numeric) {
        doc[key] = strtol(id.c_str(), nullptr, 10);
    } else {
        doc[key] = id;
    }
}

static std::string trimTrailingSlash(const std::string& url) {
    std::string out = url;
    while (!out.empty() && out[out.size() - 1] == '/') {
        out.erase(out.size() - 1);
    }
    return out;
}

const char* syncStatusName(SyncStatus status) {
    switch (status) {
        case SYNC_OK:                    return "OK";
        case SYNC_AUTH_ERROR:            return "AUTH_ERROR";
        case SYNC_NOT_CONFIGURED:        return "NOT_CONFIGURED";
        case SYNC_REMOTE_UNAVAILABLE:    return "REMOTE_UNAVAILABLE";
        case SYNC_REGISTRATION_CONFLICT: return "REGISTRATION_CONFLICT";
        case SYNC_REFUSED:               return "REFUSED";
    }
    return "UNKNOWN";
}

MeadToolsClient::MeadToolsClient(HttpTransport& transport)
    : transport_(transport),
      logged_in_(false),
      identity_callback_(nullptr),
      identity_ctx_(nullptr) {
}

void MeadToolsClient::configure(const MeadToolsSettings& settings) {
    settings_ = settings;
    settings_.base_url = trimTrailingSlash(settings.base_url);
    identity_.device_token = settings.device_token;
    identity_.access_token = settings.access_token;
    identity_.refresh_token = settings.refresh_token;
    logged_in_ = false;
}

void MeadToolsClient::setIdentityCallback(IdentityChangedCallback callback, void* ctx) {
    identity_callback_ = callback;
    identity_ctx_ = ctx;
}

void MeadToolsClient::notifyIdentityChanged() {
    if (identity_callback_) {
        identity_callback_(identity_, identity_ctx_);
    }
}

HttpResponse MeadToolsClient::request(HttpMethod method, const std::string& path,
                                      const std::string& body, bool authenticated,
                                      uint32_t timeout_ms) {
    HttpRequest req;
    req.method = method;
    req.url = settings_.base_url + path;
    if (authenticated) {
        req.bearer_token = identity_.access_token;
    }
    req.body = body;
    req.timeout_ms = timeout_ms;

    statusLogf(LOG_SYNC, "%s %s", httpMethodName(method), req.url.c_str());
    HttpResponse response = transport_.send(req);
    statusLogf(LOG_SYNC, "%s %s -> %d", httpMethodName(method), path.c_str(), response.status);
    return response;
}

// ==================== Authentication ====================

SyncResult MeadToolsClient::login(const std::string& email, const std::string& password) {
    JsonDocument doc;
    doc["email"] = email;
    doc["password"] = password;
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Post, PATH_LOGIN, body, false, MT_HTTP_TIMEOUT_MS);
    if (response.status <= 0) {
        statusReportf("MeadTools login failed: service unreachable");
        return makeResult(SYNC_REMOTE_UNAVAILABLE, response.status);
    }
    if (response.status != HTTP_OK) {
        statusReportf("MeadTools login rejected (HTTP %d)", response.status);
        return makeResult(SYNC_AUTH_ERROR, response.status);
    }

    JsonDocument reply;
    if (deserializeJson(reply, response.body)) {
        statusReportf("MeadTools login: unreadable response");
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    const char* access = reply["accessToken"] | "";
    const char* refresh_token = reply["refreshToken"] | "";
    if (access[0] == '\0') {
        statusReportf("MeadTools login: no access token in response");
        return makeResult(SYNC_AUTH_ERROR, response.status);
    }

    identity_.access_token = access;
    identity_.refresh_token = refresh_token;
    logged_in_ = true;
    notifyIdentityChanged();
    statusLogf(LOG_SYNC, "Logged in as %s", email.c_str());
    return makeResult(SYNC_OK, response.status);
}

bool MeadToolsClient::refresh(const std::string& email, const std::string& refresh_token) {
    JsonDocument doc;
    doc["email"] = email;
    doc["refreshToken"] = refresh_token;
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Post, PATH_REFRESH, body, false, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusLogf(LOG_SYNC, "Token refresh failed (HTTP %d)", response.status);
        return false;
    }

    JsonDocument reply;
    if (deserializeJson(reply, response.body)) {
        statusLogf(LOG_SYNC, "Token refresh: unreadable response");
        return false;
    }
    const char* access = reply["accessToken"] | "";
    if (access[0] == '\0') {
        return false;
    }

    identity_.access_token = access;
    logged_in_ = true;
    notifyIdentityChanged();
    statusLogf(LOG_SYNC, "Access token refreshed");
    return true;
}

SyncResult MeadToolsClient::ensureLoggedIn() {
    bool have_password = !settings_.email.empty() && !settings_.password.empty();

    if (!identity_.access_token.empty() && !identity_.refresh_token.empty()) {
        if (refresh(settings_.email, identity_.refresh_token)) {
            return makeResult(SYNC_OK, HTTP_OK);
        }
        if (have_password) {
            return login(settings_.email, settings_.password);
        }
    } else if (have_password) {
        return login(settings_.email, settings_.password);
    }

    if (!settings_.oauth_token.empty()) {
        identity_.access_token = settings_.oauth_token;
        logged_in_ = true;
        notifyIdentityChanged();
        statusLogf(LOG_SYNC, "Using external OAuth token");
        return makeResult(SYNC_OK, 0);
    }

    statusReportf("Not able to log in: set MeadTools email and password");
    return makeResult(SYNC_NOT_CONFIGURED, 0);
}

// ==================== Device token ====================

SyncResult MeadToolsClient::generateDeviceToken(std::string& token) {
    HttpResponse response = request(HttpMethod::Post, PATH_DEVICE_TOKEN, "", true, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Couldn't generate MeadTools device token (HTTP %d)", response.status);
        return failureFor(response);
    }

    JsonDocument reply;
    if (deserializeJson(reply, response.body)) {
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    token = reply["token"] | "";
    if (token.empty()) {
        statusReportf("MeadTools returned an empty device token");
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }

    identity_.device_token = token;
    settings_.device_token = token;
    notifyIdentityChanged();
    statusLogf(LOG_SYNC, "Generated device token");
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::ensureDeviceToken() {
    if (!identity_.device_token.empty()) {
        return makeResult(SYNC_OK, 0);
    }

    std::string token;
    SyncResult result = generateDeviceToken(token);
    if (!result.ok()) {
        return result;
    }
    if (identity_.device_token.empty()) {
        statusReportf("MeadTools device token not set");
        return makeResult(SYNC_NOT_CONFIGURED, result.http_status);
    }
    return result;
}

// ==================== Hydrometers ====================

SyncResult MeadToolsClient::listHydrometers(std::vector<HydrometerRecord>& out) {
    out.clear();
    HttpResponse response = request(HttpMethod::Get, PATH_HYDROMETERS, "", true, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to list hydrometers (HTTP %d)", response.status);
        return failureFor(response);
    }

    JsonDocument reply;
    if (deserializeJson(reply, response.body)) {
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    JsonArrayConst devices = reply["devices"].as<JsonArrayConst>();
    if (devices.isNull()) {
        statusLogf(LOG_SYNC, "Hydrometer list has no devices array");
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }

    for (JsonVariantConst device : devices) {
        HydrometerRecord record;
        if (!readId(device["id"], record.id)) {
            continue;
        }
        record.device_name = device["device_name"] | "";
        out.push_back(record);
    }
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::registerHydrometer(const std::string& name, std::string& hydrometer_id) {
    JsonDocument doc;
    doc["token"] = identity_.device_token;
    doc["name"] = name;
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Post, PATH_REGISTER_PILL, body, false, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to register hydrometer %s (HTTP %d)", name.c_str(), response.status);
        return failureFor(response);
    }

    JsonDocument reply;
    if (deserializeJson(reply, response.body) || !readId(reply["id"], hydrometer_id)) {
        statusReportf("Hydrometer registration returned no id");
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    statusLogf(LOG_SYNC, "Registered hydrometer %s -> %s", name.c_str(), hydrometer_id.c_str());
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::resolveHydrometer(const std::string& name) {
    std::vector<HydrometerRecord> hydrometers;
    SyncResult result = listHydrometers(hydrometers);
    if (result.status == SYNC_REMOTE_UNAVAILABLE) {
        return result;
    }

    for (size_t i = 0; i < hydrometers.size(); i++) {
        if (hydrometers[i].device_name == name) {
            identity_.hydrometer_id = hydrometers[i].id;
            statusLogf(LOG_SYNC, "Found hydrometer %s (id %s)", name.c_str(),
                       identity_.hydrometer_id.c_str());
            return makeResult(SYNC_OK, result.http_status);
        }
    }

    std::string id;
    result = registerHydrometer(name, id);
    if (!result.ok()) {
        return result;
    }
    identity_.hydrometer_id = id;
    return result;
}

// ==================== Brews ====================

SyncResult MeadToolsClient::listBrews(std::vector<BrewRecord>& out) {
    out.clear();
    HttpResponse response = request(HttpMethod::Get, PATH_BREWS, "", true, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to list brews (HTTP %d)", response.status);
        return failureFor(response);
    }

    JsonDocument reply;
    if (deserializeJson(reply, response.body)) {
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    JsonArrayConst brews = reply.as<JsonArrayConst>();
    if (brews.isNull()) {
        statusLogf(LOG_SYNC, "Brew list is not an array");
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }

    for (JsonVariantConst brew : brews) {
        BrewRecord record;
        if (!readId(brew["id"], record.id)) {
            continue;
        }
        if (brew["name"].is<const char*>()) {
            record.name = brew["name"].as<const char*>();
        } else {
            record.name = brew["brew_name"] | "";
        }
        record.ended = !brew["end_date"].isNull();
        out.push_back(record);
    }
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::registerBrew(const std::string& brew_name,
                                         const std::string& hydrometer_id,
                                         std::string& brew_id) {
    JsonDocument doc;
    writeId(doc, "device_id", hydrometer_id);
    doc["brew_name"] = brew_name;
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Post, PATH_BREWS, body, true, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Couldn't register brew %s (HTTP %d)", brew_name.c_str(), response.status);
        return failureFor(response);
    }

    // Response is the brew object, or a single-element array holding it
    JsonDocument reply;
    if (deserializeJson(reply, response.body)) {
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    JsonVariantConst brew = reply.as<JsonVariantConst>();
    if (brew.is<JsonArrayConst>()) {
        brew = brew[0];
    }
    if (!readId(brew["id"], brew_id)) {
        statusReportf("Brew registration returned no id");
        return makeResult(SYNC_REGISTRATION_CONFLICT, response.status);
    }
    statusLogf(LOG_SYNC, "Registered brew %s -> %s", brew_name.c_str(), brew_id.c_str());
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::linkRecipe(const std::string& brew_id, int32_t recipe_id) {
    if (recipe_id == SESSION_RECIPE_UNSET) {
        statusLogf(LOG_SYNC, "No recipe set, not linking");
        return makeResult(SYNC_OK, 0);
    }

    JsonDocument doc;
    doc["recipe_id"] = recipe_id;
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Patch, std::string(PATH_BREWS) + "/" + brew_id,
                                    body, true, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to link brew %s to recipe %ld (HTTP %d)", brew_id.c_str(),
                      (long)recipe_id, response.status);
        return failureFor(response);
    }
    statusLogf(LOG_SYNC, "Linked brew %s to recipe %ld", brew_id.c_str(), (long)recipe_id);
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::resolveBrew(const std::string& brew_name, int32_t recipe_id) {
    if (identity_.hydrometer_id.empty()) {
        statusReportf("Hydrometer not resolved, can't set up brew %s", brew_name.c_str());
        return makeResult(SYNC_NOT_CONFIGURED, 0);
    }

    std::vector<BrewRecord> brews;
    SyncResult result = listBrews(brews);
    if (result.status == SYNC_REMOTE_UNAVAILABLE) {
        return result;
    }

    std::string brew_id;
    for (size_t i = 0; i < brews.size(); i++) {
        if (brews[i].name == brew_name && !brews[i].ended) {
            brew_id = brews[i].id;
            statusLogf(LOG_SYNC, "Found ongoing brew %s (id %s)", brew_name.c_str(), brew_id.c_str());
            break;
        }
    }

    if (brew_id.empty()) {
        statusLogf(LOG_SYNC, "No ongoing brew named %s, registering", brew_name.c_str());
        result = registerBrew(brew_name, identity_.hydrometer_id, brew_id);
        if (!result.ok()) {
            return result;
        }
    }
    identity_.brew_id = brew_id;

    return linkRecipe(brew_id, recipe_id);
}

SyncResult MeadToolsClient::endBrew(const std::string& hydrometer_id, const std::string& brew_id) {
    if (hydrometer_id.empty() || brew_id.empty()) {
        statusReportf("Hydrometer or brew id not set, can't end the brew");
        return makeResult(SYNC_NOT_CONFIGURED, 0);
    }

    JsonDocument doc;
    writeId(doc, "device_id", hydrometer_id);
    writeId(doc, "brew_id", brew_id);
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Patch, PATH_BREWS, body, true, MT_END_BREW_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to end brew %s (HTTP %d)", brew_id.c_str(), response.status);
        return failureFor(response);
    }
    statusLogf(LOG_SYNC, "Ended brew %s", brew_id.c_str());
    return makeResult(SYNC_OK, response.status);
}

SyncResult MeadToolsClient::deleteBrew(const std::string& brew_id) {
    std::vector<BrewRecord> brews;
    SyncResult result = listBrews(brews);
    if (!result.ok()) {
        return result;
    }

    const BrewRecord* target = nullptr;
    for (size_t i = 0; i < brews.size(); i++) {
        if (brews[i].id == brew_id) {
            target = &brews[i];
            break;
        }
    }
    if (target == nullptr) {
        statusReportf("Brew %s not found", brew_id.c_str());
        return makeResult(SYNC_REFUSED, result.http_status);
    }
    if (!target->ended) {
        statusReportf("Brew %s is not ended, can't delete", target->name.c_str());
        return makeResult(SYNC_REFUSED, result.http_status);
    }

    HttpResponse response = request(HttpMethod::Delete, std::string(PATH_BREWS) + "/" + brew_id,
                                    "", true, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to delete brew %s (HTTP %d)", brew_id.c_str(), response.status);
        return failureFor(response);
    }
    statusReportf("Deleted brew %s", target->name.c_str());
    return makeResult(SYNC_OK, response.status);
}

// ==================== Data ====================

SyncResult MeadToolsClient::publishDataPoint(const std::string& device_token, const std::string& name,
                                             double gravity, double temperature, bool celsius,
                                             int battery) {
    JsonDocument doc;
    doc["token"] = device_token;
    doc["name"] = name;
    doc["gravity"] = gravity;
    doc["temperature"] = temperature;
    doc["temp_units"] = celsius ? "C" : "F";
    doc["battery"] = battery;
    std::string body;
    serializeJson(doc, body);

    HttpResponse response = request(HttpMethod::Post, PATH_DATA_POINT, body, false, MT_HTTP_TIMEOUT_MS);
    if (response.status != HTTP_OK) {
        statusReportf("Failed to log data to MeadTools (HTTP %d)", response.status);
        return failureFor(response);
    }
    return makeResult(SYNC_OK, response.status);
}

// ==================== Shared account ====================

MeadToolsAccount::MeadToolsAccount(HttpTransport& transport)
    : auth_(transport) {
}

void MeadToolsAccount::configure(const MeadToolsSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_.configure(settings);
}

MeadToolsSettings MeadToolsAccount::settings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MeadToolsSettings settings = auth_.settings();
    settings.device_token = auth_.identity().device_token;
    settings.access_token = auth_.identity().access_token;
    settings.refresh_token = auth_.identity().refresh_token;
    return settings;
}

void MeadToolsAccount::setIdentityCallback(IdentityChangedCallback callback, void* ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    auth_.setIdentityCallback(callback, ctx);
}

SyncResult MeadToolsAccount::ensureLoggedIn() {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_.ensureLoggedIn();
}

SyncResult MeadToolsAccount::ensureDeviceToken() {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_.ensureDeviceToken();
}

SyncResult MeadToolsAccount::generateDeviceToken(std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    return auth_.generateDeviceToken(token);
}

void MeadToolsAccount::applyTo(MeadToolsClient& client) const {
    MeadToolsSettings settings = this->settings();
    client.configure(settings);
}
