/**
 * PillBridge - BLE Pill Scanner
 * Implementation
 */

#include "config.h"

#if ENABLE_BLE_SCANNER

#include "pill_scanner.h"
#include "pillbridge.h"

#include <NimBLEDevice.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static SessionRegistry* g_scan_registry = nullptr;
static TaskHandle_t g_scanner_task = nullptr;
static volatile uint32_t g_pill_adverts = 0;

// Scan callbacks only enqueue; registry routing never blocks on HTTP
class PillScanCallbacks : public NimBLEScanCallbacks {
    void onResult(const NimBLEAdvertisedDevice* advertisedDevice) override {
        if (g_scan_registry == nullptr) {
            return;
        }

        uint8_t count = advertisedDevice->getManufacturerDataCount();
        if (count == 0) {
            return;
        }

        // Split each entry into company id (little-endian) and payload
        ManufacturerData data;
        for (uint8_t i = 0; i < count; i++) {
            std::string entry = advertisedDevice->getManufacturerData(i);
            if (entry.size() < 2) {
                continue;
            }
            uint16_t vendor = (uint16_t)((uint8_t)entry[0] | ((uint8_t)entry[1] << 8));
            data[vendor] = entry.substr(2);
        }

        std::string address = advertisedDevice->getAddress().toString();
        if (g_scan_registry->onAdvertisement(address, data)) {
            g_pill_adverts++;
        }
    }

    void onScanEnd(const NimBLEScanResults& results, int reason) override {
        DEBUG_PRINTF(g_debug_scanner, "Scanner: window ended (reason %d)\n", reason);
    }
};

static PillScanCallbacks g_scan_callbacks;

static void scannerTask(void* param) {
    NimBLEScan* scan = NimBLEDevice::getScan();

    for (;;) {
        bool listening = g_scan_registry->anyListening(millis());

        if (listening && !scan->isScanning()) {
            DEBUG_PRINTLN(g_debug_scanner, "Scanner: starting window");
            if (!scan->start(SCANNER_WINDOW_MS, false, true)) {
                Serial.println("Scanner: Failed to start scan");
            }
        } else if (!listening && scan->isScanning()) {
            DEBUG_PRINTLN(g_debug_scanner, "Scanner: no session listening, stopping");
            scan->stop();
        }

        vTaskDelay(pdMS_TO_TICKS(SCANNER_IDLE_POLL_MS));
    }
}

bool pillScannerInit(SessionRegistry& registry) {
    g_scan_registry = &registry;

    NimBLEDevice::init(PILLBRIDGE_BLE_NAME);

    NimBLEScan* scan = NimBLEDevice::getScan();
    // Duplicates wanted: every Pill broadcast is a new reading
    scan->setScanCallbacks(&g_scan_callbacks, true);
    scan->setActiveScan(false);
    scan->setInterval(100);
    scan->setWindow(100);
    scan->setMaxResults(0);
    scan->setDuplicateFilter(false);

    BaseType_t ok = xTaskCreate(scannerTask, "pill_scan", SCANNER_TASK_STACK_BYTES, nullptr,
                                SCANNER_TASK_PRIORITY, &g_scanner_task);
    if (ok != pdPASS) {
        Serial.println("Scanner: Failed to create task");
        return false;
    }

    Serial.println("Scanner: NimBLE passive scanner ready");
    return true;
}

bool pillScannerIsScanning() {
    return NimBLEDevice::getScan()->isScanning();
}

uint32_t pillScannerAdvertisementCount() {
    return g_pill_adverts;
}

#endif // ENABLE_BLE_SCANNER
