/**
 * PillBridge - NVS Storage Module
 * Implementation
 */

#include "storage.h"
#include "config.h"
#include <Preferences.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Static variables
static Preferences g_preferences;
static bool g_initialized = false;
static SemaphoreHandle_t g_storage_mutex = nullptr;

// NVS keys (max 15 characters)
static const char* KEY_WIFI_SSID = "wifi_ssid";
static const char* KEY_WIFI_PASS = "wifi_pass";
static const char* KEY_MT_URL = "mt_url";
static const char* KEY_MT_EMAIL = "mt_email";
static const char* KEY_MT_PASSWORD = "mt_password";
static const char* KEY_MT_OAUTH = "mt_oauth";
static const char* KEY_MT_DEVICE_TOKEN = "mt_dev_token";
static const char* KEY_MT_ACCESS = "mt_access";
static const char* KEY_MT_REFRESH = "mt_refresh";
static const char* KEY_MT_SYNC = "mt_sync";

// Per-slot keys are "s<slot>_<field>"
static const char* FIELD_USED = "used";
static const char* FIELD_BREW = "brew";
static const char* FIELD_PILL = "pill";
static const char* FIELD_MAC = "mac";
static const char* FIELD_POLL = "poll";
static const char* FIELD_CELSIUS = "celsius";
static const char* FIELD_RECIPE = "recipe";
static const char* FIELD_ACTIVE = "active";

// Serializes NVS access between the console and session tasks
class StorageLock {
public:
    StorageLock() { xSemaphoreTake(g_storage_mutex, portMAX_DELAY); }
    ~StorageLock() { xSemaphoreGive(g_storage_mutex); }
};

static String slotKey(uint8_t slot, const char* field) {
    char key[16];
    snprintf(key, sizeof(key), "s%u_%s", (unsigned)slot, field);
    return String(key);
}

static std::string loadString(const char* key, const char* fallback) {
    String value = g_preferences.getString(key, fallback);
    return std::string(value.c_str());
}

bool storageInit() {
    if (g_initialized) {
        return true; // Already initialized
    }

    g_storage_mutex = xSemaphoreCreateMutex();
    if (g_storage_mutex == nullptr) {
        Serial.println("Storage: Failed to create mutex");
        return false;
    }

    // Open NVS namespace in read-write mode
    bool success = g_preferences.begin(NVS_NAMESPACE, false);
    if (success) {
        g_initialized = true;
        DEBUG_PRINTLN(g_debug_storage, "Storage: NVS initialized");
    } else {
        Serial.println("Storage: Failed to initialize NVS");
    }

    return success;
}

bool storageSaveWifi(const std::string& ssid, const std::string& password) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }

    StorageLock lock;
    g_preferences.putString(KEY_WIFI_SSID, ssid.c_str());
    g_preferences.putString(KEY_WIFI_PASS, password.c_str());
    DEBUG_PRINTF(g_debug_storage, "Storage: Saved WiFi SSID = %s\n", ssid.c_str());
    return true;
}

bool storageLoadWifi(std::string& ssid, std::string& password) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }

    StorageLock lock;
    ssid = loadString(KEY_WIFI_SSID, "");
    password = loadString(KEY_WIFI_PASS, "");
    DEBUG_PRINTF(g_debug_storage, "Storage: Loaded WiFi SSID = %s\n", ssid.c_str());
    return !ssid.empty();
}

bool storageSaveMeadTools(const MeadToolsSettings& settings) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }

    StorageLock lock;
    g_preferences.putString(KEY_MT_URL, settings.base_url.c_str());
    g_preferences.putString(KEY_MT_EMAIL, settings.email.c_str());
    g_preferences.putString(KEY_MT_PASSWORD, settings.password.c_str());
    g_preferences.putString(KEY_MT_OAUTH, settings.oauth_token.c_str());
    g_preferences.putString(KEY_MT_DEVICE_TOKEN, settings.device_token.c_str());
    g_preferences.putString(KEY_MT_ACCESS, settings.access_token.c_str());
    g_preferences.putString(KEY_MT_REFRESH, settings.refresh_token.c_str());
    g_preferences.putBool(KEY_MT_SYNC, settings.sync_enabled);

    DEBUG_PRINTF(g_debug_storage, "Storage: Saved MeadTools url = %s\n", settings.base_url.c_str());
    DEBUG_PRINTF(g_debug_storage, "Storage: Saved MeadTools email = %s\n", settings.email.c_str());
    DEBUG_PRINTF(g_debug_storage, "Storage: Sync = %s\n", settings.sync_enabled ? "ON" : "OFF");
    return true;
}

MeadToolsSettings storageLoadMeadTools() {
    MeadToolsSettings settings;
    if (!g_initialized) {
        Serial.println("Storage: Not initialized, using default MeadTools settings");
        return settings;
    }

    StorageLock lock;
    settings.base_url = loadString(KEY_MT_URL, MT_DEFAULT_BASE_URL);
    settings.email = loadString(KEY_MT_EMAIL, "");
    settings.password = loadString(KEY_MT_PASSWORD, "");
    settings.oauth_token = loadString(KEY_MT_OAUTH, "");
    settings.device_token = loadString(KEY_MT_DEVICE_TOKEN, "");
    settings.access_token = loadString(KEY_MT_ACCESS, "");
    settings.refresh_token = loadString(KEY_MT_REFRESH, "");
    settings.sync_enabled = g_preferences.getBool(KEY_MT_SYNC, true);

    DEBUG_PRINTF(g_debug_storage, "Storage: Loaded MeadTools url = %s\n", settings.base_url.c_str());
    DEBUG_PRINTF(g_debug_storage, "Storage: Device token %s\n",
                 settings.device_token.empty() ? "not set" : "set");
    return settings;
}

bool storageSaveIdentity(const RemoteIdentity& identity) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }

    StorageLock lock;
    if (!identity.device_token.empty()) {
        g_preferences.putString(KEY_MT_DEVICE_TOKEN, identity.device_token.c_str());
    }
    if (!identity.access_token.empty()) {
        g_preferences.putString(KEY_MT_ACCESS, identity.access_token.c_str());
    }
    if (!identity.refresh_token.empty()) {
        g_preferences.putString(KEY_MT_REFRESH, identity.refresh_token.c_str());
    }
    DEBUG_PRINTLN(g_debug_storage, "Storage: Saved MeadTools tokens");
    return true;
}

bool storageSaveSession(uint8_t slot, const SessionConfig& config, bool active) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }
    if (slot >= PILLBRIDGE_MAX_SESSIONS) {
        Serial.printf("Storage: Invalid session slot %u\n", (unsigned)slot);
        return false;
    }

    StorageLock lock;
    g_preferences.putString(slotKey(slot, FIELD_BREW).c_str(), config.brew_name.c_str());
    g_preferences.putString(slotKey(slot, FIELD_PILL).c_str(), config.pill_name.c_str());
    g_preferences.putString(slotKey(slot, FIELD_MAC).c_str(), config.mac_address.c_str());
    g_preferences.putUInt(slotKey(slot, FIELD_POLL).c_str(), config.poll_interval_s);
    g_preferences.putBool(slotKey(slot, FIELD_CELSIUS).c_str(), config.celsius);
    g_preferences.putInt(slotKey(slot, FIELD_RECIPE).c_str(), config.recipe_id);
    g_preferences.putBool(slotKey(slot, FIELD_ACTIVE).c_str(), active);
    g_preferences.putBool(slotKey(slot, FIELD_USED).c_str(), true);

    DEBUG_PRINTF(g_debug_storage, "Storage: Saved session %u: %s (%s)\n", (unsigned)slot,
                 config.brew_name.c_str(), config.mac_address.c_str());
    return true;
}

bool storageLoadSession(uint8_t slot, SessionConfig& config, bool& active) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }
    if (slot >= PILLBRIDGE_MAX_SESSIONS) {
        return false;
    }

    StorageLock lock;
    if (!g_preferences.getBool(slotKey(slot, FIELD_USED).c_str(), false)) {
        return false;
    }

    config.brew_name = loadString(slotKey(slot, FIELD_BREW).c_str(), "");
    config.pill_name = loadString(slotKey(slot, FIELD_PILL).c_str(), "");
    config.mac_address = loadString(slotKey(slot, FIELD_MAC).c_str(), "");
    config.poll_interval_s = g_preferences.getUInt(slotKey(slot, FIELD_POLL).c_str(),
                                                   SESSION_POLL_INTERVAL_DEFAULT_S);
    config.celsius = g_preferences.getBool(slotKey(slot, FIELD_CELSIUS).c_str(), true);
    config.recipe_id = g_preferences.getInt(slotKey(slot, FIELD_RECIPE).c_str(), SESSION_RECIPE_UNSET);
    active = g_preferences.getBool(slotKey(slot, FIELD_ACTIVE).c_str(), false);

    // Sanity check: a slot without a MAC cannot be tracked
    if (config.mac_address.empty()) {
        Serial.printf("Storage: WARNING - session %u has no MAC, ignoring\n", (unsigned)slot);
        return false;
    }

    DEBUG_PRINTF(g_debug_storage, "Storage: Loaded session %u: %s (%s) active=%d\n", (unsigned)slot,
                 config.brew_name.c_str(), config.mac_address.c_str(), active);
    return true;
}

bool storageSetSessionActive(uint8_t slot, bool active) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }
    if (slot >= PILLBRIDGE_MAX_SESSIONS) {
        return false;
    }

    StorageLock lock;
    g_preferences.putBool(slotKey(slot, FIELD_ACTIVE).c_str(), active);
    DEBUG_PRINTF(g_debug_storage, "Storage: Session %u active = %s\n", (unsigned)slot,
                 active ? "true" : "false");
    return true;
}

bool storageClearSession(uint8_t slot) {
    if (!g_initialized) {
        Serial.println("Storage: Not initialized");
        return false;
    }
    if (slot >= PILLBRIDGE_MAX_SESSIONS) {
        return false;
    }

    StorageLock lock;
    const char* fields[] = {FIELD_USED, FIELD_BREW, FIELD_PILL, FIELD_MAC,
                            FIELD_POLL, FIELD_CELSIUS, FIELD_RECIPE, FIELD_ACTIVE};
    for (size_t i = 0; i < sizeof(fields) / sizeof(fields[0]); i++) {
        g_preferences.remove(slotKey(slot, fields[i]).c_str());
    }
    DEBUG_PRINTF(g_debug_storage, "Storage: Cleared session %u\n", (unsigned)slot);
    return true;
}
