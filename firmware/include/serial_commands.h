// serial_commands.h
// Serial command interface for WiFi, MeadTools and session configuration
// Part of PillBridge gateway operation

#ifndef SERIAL_COMMANDS_H
#define SERIAL_COMMANDS_H

#include "config.h"

#if ENABLE_SERIAL_COMMANDS

#include <Arduino.h>
#include <string>

// Callback function type for WiFi credential changes
// Called after SET WIFI stored new credentials
typedef void (*OnWifiChangedCallback)(const std::string& ssid, const std::string& password);

// Initialize serial command handler
// Must be called once in setup() after Serial.begin()
void serialCommandsInit();

// Update serial command handler (call in loop())
// Checks for incoming serial data and processes commands
void serialCommandsUpdate();

// Register callback for WiFi credential changes
// callback: Function to call when credentials are saved
void serialCommandsSetWifiCallback(OnWifiChangedCallback callback);

#endif // ENABLE_SERIAL_COMMANDS

#endif // SERIAL_COMMANDS_H
