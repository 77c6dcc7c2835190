/**
 * PillBridge - RAPT Pill to MeadTools Gateway Firmware
 * Main entry point
 */

#include <Arduino.h>
#include <mutex>
#include <time.h>
#include "pillbridge.h"
#include "config.h"

#include "status_log.h"
#include "storage.h"
#include "wifi_link.h"
#include "http_transport_esp32.h"
#include "session_registry.h"
#include "session_task.h"

#if ENABLE_BLE_SCANNER
#include "pill_scanner.h"
#endif

#if ENABLE_SERIAL_COMMANDS
#include "serial_commands.h"
#endif

// Shared gateway state (used by serial_commands.cpp)
HttpTransport* g_http_transport = nullptr;
SessionRegistry* g_registry = nullptr;

static Esp32HttpTransport g_transport;
static FreeRtosSessionRunner* g_runner = nullptr;

// MeadTools settings; tokens are rewritten by session workers
static MeadToolsSettings g_mt_settings;
static std::mutex g_mt_mutex;

static uint32_t clockMillis() {
    return millis();
}

static time_t clockNow() {
    return time(nullptr);
}

static const SessionClock g_clock = { clockMillis, clockNow };

// Log sink: every status line goes to the USB console
static void serialLogSink(const char* line) {
    Serial.println(line);
}

MeadToolsSettings meadToolsSettingsGet() {
    std::lock_guard<std::mutex> lock(g_mt_mutex);
    return g_mt_settings;
}

void meadToolsSettingsSet(const MeadToolsSettings& settings) {
    {
        std::lock_guard<std::mutex> lock(g_mt_mutex);
        g_mt_settings = settings;
    }
    if (!storageSaveMeadTools(settings)) {
        Serial.println("Main: Failed to save MeadTools settings");
    }
    if (g_registry != nullptr) {
        g_registry->setSyncSettings(settings);
    }
}

// Called under the account lock when shared tokens change
// The account already holds the new tokens, so only the copy here and NVS follow
static void meadToolsIdentityChanged(const RemoteIdentity& identity, void* ctx) {
    (void)ctx;
    {
        std::lock_guard<std::mutex> lock(g_mt_mutex);
        if (!identity.device_token.empty()) g_mt_settings.device_token = identity.device_token;
        if (!identity.access_token.empty()) g_mt_settings.access_token = identity.access_token;
        if (!identity.refresh_token.empty()) g_mt_settings.refresh_token = identity.refresh_token;
    }
    if (!storageSaveIdentity(identity)) {
        Serial.println("Main: Failed to persist MeadTools tokens");
    }
}

#if ENABLE_SERIAL_COMMANDS
// Callback when WiFi credentials are changed via serial command
static void onWifiChanged(const std::string& ssid, const std::string& password) {
    Serial.printf("Main: Connecting to %s\n", ssid.c_str());
    if (!wifiLinkBegin(ssid, password)) {
        Serial.println("Main: WiFi not connected yet, will keep retrying");
    }
}
#endif

// Rebuild sessions from NVS; sessions that were running are started again
static void restoreSessions() {
    for (uint8_t slot = 0; slot < PILLBRIDGE_MAX_SESSIONS; slot++) {
        SessionConfig config;
        bool active = false;
        if (!storageLoadSession(slot, config, active)) {
            continue;
        }

        SessionHandle handle = (SessionHandle)(slot + 1);
        RegistryStatus status = g_registry->addAt(handle, config);
        if (status != REGISTRY_OK) {
            Serial.printf("Main: Session %u not restored: %s\n", (unsigned)handle, registryStatusName(status));
            continue;
        }
        Serial.printf("Main: Session %u restored: %s (%s)\n", (unsigned)handle,
                      config.brew_name.c_str(), config.mac_address.c_str());

        if (active) {
            status = g_registry->start(handle);
            if (status != REGISTRY_OK) {
                Serial.printf("Main: Session %u restart failed: %s\n", (unsigned)handle,
                              registryStatusName(status));
            }
        }
    }
}

void setup() {
    Serial.begin(PILLBRIDGE_SERIAL_BAUD);
    delay(1000);

    Serial.println("=================================");
    Serial.printf("PillBridge v%d.%d.%d | RAPT Pill -> MeadTools\n",
                  PILLBRIDGE_VERSION_MAJOR, PILLBRIDGE_VERSION_MINOR, PILLBRIDGE_VERSION_PATCH);
    Serial.println("=================================");

    statusLogSetSink(serialLogSink);

    if (!storageInit()) {
        Serial.println("Main: NVS init failed, settings will not persist");
    }

    g_mt_settings = storageLoadMeadTools();

    std::string ssid;
    std::string password;
    if (storageLoadWifi(ssid, password)) {
        Serial.printf("Main: Connecting to %s\n", ssid.c_str());
        if (!wifiLinkBegin(ssid, password)) {
            Serial.println("Main: WiFi not connected yet, will keep retrying");
        }
    } else {
        Serial.println("Main: No WiFi credentials (use SET WIFI)");
    }

    g_http_transport = &g_transport;
    g_runner = new FreeRtosSessionRunner();
    g_registry = new SessionRegistry(g_transport, *g_runner, g_clock);
    g_registry->setSyncSettings(meadToolsSettingsGet());
    g_registry->setIdentityCallback(meadToolsIdentityChanged, nullptr);

    restoreSessions();

#if ENABLE_BLE_SCANNER
    if (!pillScannerInit(*g_registry)) {
        Serial.println("Main: Scanner unavailable, no readings will be received");
    }
#endif

#if ENABLE_SERIAL_COMMANDS
    serialCommandsInit();
    serialCommandsSetWifiCallback(onWifiChanged);
    Serial.println("Type HELP for commands");
#endif
}

void loop() {
    // Check for serial commands (conditional)
#if ENABLE_SERIAL_COMMANDS
    serialCommandsUpdate();
#endif

    wifiLinkUpdate();

    delay(20);
}
