/**
 * PillBridge - RAPT Pill Advertisement Decoder
 * Decodes the 23-byte manufacturer payload broadcast by the RAPT Pill
 * hydrometer (wire versions 1 and 2, big-endian)
 */

#ifndef PILL_DECODER_H
#define PILL_DECODER_H

#include <stddef.h>
#include <stdint.h>
#include <map>
#include <string>

// Raw telemetry fields, unscaled
struct PillMetrics {
    uint8_t version;            // 1 or 2 (any non-1 version decodes as 2)
    uint16_t temperature_raw;   // Kelvin * 128
    float gravity_raw;          // Specific gravity * 1000
    bool has_gravity_velocity;  // Version 2 flag byte
    float gravity_velocity;     // Version 2 only, 0 for version 1
    int16_t x_raw;              // g * 16
    int16_t y_raw;
    int16_t z_raw;
    int32_t battery_raw;        // Percent * 256 (signed in v1, unsigned in v2)
};

enum DecodeResult {
    DECODE_OK = 0,
    DECODE_BAD_LENGTH,      // Payload is not exactly PILL_PAYLOAD_LENGTH bytes
    DECODE_BAD_PREFIX,      // First two bytes are not "PT"
};

/**
 * Decode a Pill payload
 * @param data Manufacturer data following the vendor id
 * @param length Number of bytes in data
 * @param out Decoded metrics (only written on DECODE_OK)
 * @return DECODE_OK, or the reason the payload was rejected
 */
DecodeResult pillDecode(const uint8_t* data, size_t length, PillMetrics& out);

// Human-readable name of a decode result
const char* pillDecodeResultName(DecodeResult result);

// Manufacturer data entries keyed by vendor (company) id
typedef std::map<uint16_t, std::string> ManufacturerData;

/**
 * Pick the Pill telemetry payload out of a manufacturer data map
 * Ignores entries from other vendors and the "PTdPillG1" sentinel broadcast
 * @param data Manufacturer data of one advertisement
 * @param payload Set to the vendor entry bytes when found
 * @return true if the advertisement carries a candidate telemetry payload
 */
bool pillExtractPayload(const ManufacturerData& data, std::string& payload);

#endif // PILL_DECODER_H
