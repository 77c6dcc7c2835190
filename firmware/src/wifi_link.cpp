/**
 * PillBridge - WiFi Station Link
 * Implementation
 */

#include "wifi_link.h"
#include "config.h"

#include <WiFi.h>
#include <time.h>

// Anything before 2024-01-01 means SNTP has not synced yet
#define WIFI_TIME_VALID_AFTER   1704067200

static std::string g_ssid;
static std::string g_password;
static bool g_configured = false;
static bool g_time_configured = false;
static unsigned long g_last_attempt_ms = 0;

static void startTimeSync() {
    if (g_time_configured) {
        return;
    }
    configTime(0, 0, WIFI_NTP_SERVER);
    g_time_configured = true;
    DEBUG_PRINTLN(g_debug_session, "WiFi: SNTP started");
}

bool wifiLinkBegin(const std::string& ssid, const std::string& password) {
    g_ssid = ssid;
    g_password = password;
    g_configured = !ssid.empty();

    if (!g_configured) {
        Serial.println("WiFi: No SSID configured (use SET WIFI)");
        return false;
    }

    WiFi.mode(WIFI_STA);
    WiFi.setAutoReconnect(true);
    WiFi.disconnect();
    WiFi.begin(g_ssid.c_str(), g_password.c_str());
    g_last_attempt_ms = millis();

    Serial.printf("WiFi: Connecting to %s", g_ssid.c_str());
    while (WiFi.status() != WL_CONNECTED && millis() - g_last_attempt_ms < WIFI_CONNECT_TIMEOUT_MS) {
        delay(250);
        Serial.print(".");
    }
    Serial.println();

    if (WiFi.status() != WL_CONNECTED) {
        Serial.println("WiFi: Connect timed out, will retry in background");
        return false;
    }

    Serial.printf("WiFi: Connected, IP %s\n", WiFi.localIP().toString().c_str());
    startTimeSync();
    return true;
}

void wifiLinkUpdate() {
    if (!g_configured) {
        return;
    }
    if (WiFi.status() == WL_CONNECTED) {
        startTimeSync();
        return;
    }

    unsigned long now = millis();
    if (now - g_last_attempt_ms < WIFI_RECONNECT_INTERVAL_MS) {
        return;
    }
    g_last_attempt_ms = now;
    DEBUG_PRINTF(g_debug_session, "WiFi: Reconnecting to %s\n", g_ssid.c_str());
    WiFi.disconnect();
    WiFi.begin(g_ssid.c_str(), g_password.c_str());
}

bool wifiLinkConnected() {
    return WiFi.status() == WL_CONNECTED;
}

bool wifiLinkTimeValid() {
    return time(nullptr) > WIFI_TIME_VALID_AFTER;
}

void wifiLinkPrintStatus() {
    Serial.print("WiFi: ");
    if (!g_configured) {
        Serial.println("NOT CONFIGURED");
        return;
    }
    if (WiFi.status() != WL_CONNECTED) {
        Serial.printf("DISCONNECTED (%s)\n", g_ssid.c_str());
        return;
    }
    Serial.printf("CONNECTED to %s, IP %s, RSSI %d dBm\n", g_ssid.c_str(),
                  WiFi.localIP().toString().c_str(), WiFi.RSSI());
    Serial.print("Time synced: ");
    Serial.println(wifiLinkTimeValid() ? "YES" : "NO");
}
