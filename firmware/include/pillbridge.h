/**
 * PillBridge - RAPT Pill to MeadTools Gateway Firmware
 * Common definitions
 */

#ifndef PILLBRIDGE_H
#define PILLBRIDGE_H

// Version info
#define PILLBRIDGE_VERSION_MAJOR  0
#define PILLBRIDGE_VERSION_MINOR  1
#define PILLBRIDGE_VERSION_PATCH  0
#define PILLBRIDGE_VERSION        "0.1.0"

// Serial console
#define PILLBRIDGE_SERIAL_BAUD    115200

// BLE configuration
#define PILLBRIDGE_BLE_NAME       "PillBridge"

#endif // PILLBRIDGE_H
