/**
 * PillBridge - BLE Pill Scanner
 * Passive NimBLE scanning that feeds manufacturer data into the session
 * registry while at least one session is inside its listening window
 */

#ifndef PILL_SCANNER_H
#define PILL_SCANNER_H

#include "config.h"

#if ENABLE_BLE_SCANNER

#include <Arduino.h>

#include "session_registry.h"

// Initialize NimBLE and start the scanner task
// Must be called once in setup() after the registry exists
bool pillScannerInit(SessionRegistry& registry);

// True while a scan window is active
bool pillScannerIsScanning();

// Number of Pill advertisements handed to the registry since boot
uint32_t pillScannerAdvertisementCount();

#endif // ENABLE_BLE_SCANNER

#endif // PILL_SCANNER_H
