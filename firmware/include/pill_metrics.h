/**
 * PillBridge - Derived Metrics
 * Unit conversion, ABV estimate and the per-session starting gravity anchor
 */

#ifndef PILL_METRICS_H
#define PILL_METRICS_H

#include <stdint.h>
#include <optional>

// Round the exact binary value to a number of decimal places, ties to even
double metricsRound(double value, int decimals);

// Temperature from Kelvin*128 fixed point
// Celsius is rounded to 2 decimals, Fahrenheit is left unrounded
double metricsTemperature(uint16_t raw, bool celsius);

// Specific gravity from gravity*1000, rounded to 4 decimals
double metricsGravity(float raw);

// ABV estimate: (starting - current) * 131.25, rounded to 4 decimals
double metricsAbv(double starting_gravity, double current_gravity);

// Acceleration in g from raw/16
double metricsAccel(int16_t raw);

// Battery percent from raw/256, rounded to nearest integer (ties to even)
int metricsBatteryPercent(int32_t raw);

// Write-once starting gravity of a session
class GravityAnchor {
public:
    // Set the anchor if not yet calibrated
    // Returns true if this call set it
    bool anchor(double gravity) {
        if (value_) {
            return false;
        }
        value_ = gravity;
        return true;
    }

    bool isCalibrated() const { return value_.has_value(); }

    // 0 while uncalibrated
    double value() const { return value_.value_or(0.0); }

private:
    std::optional<double> value_;
};

#endif // PILL_METRICS_H
