/**
 * PillBridge - WiFi Station Link
 * Station connect/reconnect and SNTP time for event timestamps
 */

#ifndef WIFI_LINK_H
#define WIFI_LINK_H

#include <Arduino.h>
#include <string>

// Configure credentials and connect (waits up to WIFI_CONNECT_TIMEOUT_MS)
// Returns true if connected
bool wifiLinkBegin(const std::string& ssid, const std::string& password);

// Reconnect when the link dropped (call in loop())
void wifiLinkUpdate();

bool wifiLinkConnected();

// True once SNTP has set the wall clock
bool wifiLinkTimeValid();

// Print SSID, IP and RSSI to Serial
void wifiLinkPrintStatus();

#endif // WIFI_LINK_H
