/**
 * PillBridge - Derived Metrics
 * Implementation
 */

#include "pill_metrics.h"

#include <cmath>
#include <stdio.h>
#include <stdlib.h>

#define KELVIN_OFFSET       273.15
#define ABV_FACTOR          131.25

// printf rounds the exact binary value (ties to even), so a double stored
// just above or below a decimal tie rounds the same way as on the desktop tool
double metricsRound(double value, int decimals) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return strtod(buffer, nullptr);
}

double metricsTemperature(uint16_t raw, bool celsius) {
    double kelvin = raw / 128.0;
    if (celsius) {
        return metricsRound(kelvin - KELVIN_OFFSET, 2);
    }
    return (kelvin - KELVIN_OFFSET) * (9.0 / 5.0) + 32.0;
}

double metricsGravity(float raw) {
    return metricsRound(raw / 1000.0, 4);
}

double metricsAbv(double starting_gravity, double current_gravity) {
    return metricsRound((starting_gravity - current_gravity) * ABV_FACTOR, 4);
}

double metricsAccel(int16_t raw) {
    return raw / 16.0;
}

int metricsBatteryPercent(int32_t raw) {
    return (int)std::nearbyint(raw / 256.0);
}
