/**
 * PillBridge - NVS Storage Module
 * Persistent storage for WiFi credentials, MeadTools settings/tokens and
 * session slots
 */

#ifndef STORAGE_H
#define STORAGE_H

#include <Arduino.h>
#include <string>

#include "session_config.h"

// Initialize storage module (opens NVS namespace)
bool storageInit();

// Save WiFi station credentials
bool storageSaveWifi(const std::string& ssid, const std::string& password);

// Load WiFi station credentials (returns false if no SSID stored)
bool storageLoadWifi(std::string& ssid, std::string& password);

// Save all MeadTools settings, including tokens
bool storageSaveMeadTools(const MeadToolsSettings& settings);

// Load MeadTools settings (defaults for anything not stored)
MeadToolsSettings storageLoadMeadTools();

// Save the tokens held in a remote identity (device, access, refresh)
// Empty tokens leave the stored value untouched
bool storageSaveIdentity(const RemoteIdentity& identity);

// Save a session configuration into slot (0 to PILLBRIDGE_MAX_SESSIONS-1)
bool storageSaveSession(uint8_t slot, const SessionConfig& config, bool active);

// Load a session slot (returns false if the slot is empty)
bool storageLoadSession(uint8_t slot, SessionConfig& config, bool& active);

// Update only the active flag of a stored session
bool storageSetSessionActive(uint8_t slot, bool active);

// Erase a session slot
bool storageClearSession(uint8_t slot);

#endif // STORAGE_H
