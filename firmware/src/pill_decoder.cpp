/**
 * PillBridge - RAPT Pill Advertisement Decoder
 * Implementation
 */

#include "pill_decoder.h"
#include "config.h"

#include <string.h>

// Big-endian field readers
static uint16_t readU16(const uint8_t* p) {
    return (uint16_t)((p[0] << 8) | p[1]);
}

static int16_t readI16(const uint8_t* p) {
    return (int16_t)readU16(p);
}

static float readF32(const uint8_t* p) {
    uint32_t bits = ((uint32_t)p[0] << 24) | ((uint32_t)p[1] << 16) |
                    ((uint32_t)p[2] << 8) | (uint32_t)p[3];
    float value;
    memcpy(&value, &bits, sizeof(value));
    return value;
}

DecodeResult pillDecode(const uint8_t* data, size_t length, PillMetrics& out) {
    if (data == nullptr || length != PILL_PAYLOAD_LENGTH) {
        return DECODE_BAD_LENGTH;
    }

    if (data[0] != 'P' || data[1] != 'T') {
        return DECODE_BAD_PREFIX;
    }

    PillMetrics m;
    m.version = data[2];

    if (m.version == 1) {
        // [2] version, [3..8] MAC (ignored), [9..10] temp, [11..14] gravity,
        // [15..20] x/y/z, [21..22] battery (signed)
        m.has_gravity_velocity = false;
        m.gravity_velocity = 0.0f;
        m.temperature_raw = readU16(data + 9);
        m.gravity_raw = readF32(data + 11);
        m.x_raw = readI16(data + 15);
        m.y_raw = readI16(data + 17);
        m.z_raw = readI16(data + 19);
        m.battery_raw = readI16(data + 21);
    } else {
        // [3] reserved, [4] velocity flag, [5..8] velocity, [9..10] temp,
        // [11..14] gravity, [15..20] x/y/z, [21..22] battery (unsigned)
        m.has_gravity_velocity = data[4] != 0;
        m.gravity_velocity = readF32(data + 5);
        m.temperature_raw = readU16(data + 9);
        m.gravity_raw = readF32(data + 11);
        m.x_raw = readI16(data + 15);
        m.y_raw = readI16(data + 17);
        m.z_raw = readI16(data + 19);
        m.battery_raw = readU16(data + 21);
    }

    out = m;
    return DECODE_OK;
}

const char* pillDecodeResultName(DecodeResult result) {
    switch (result) {
        case DECODE_OK:         return "OK";
        case DECODE_BAD_LENGTH: return "BAD_LENGTH";
        case DECODE_BAD_PREFIX: return "BAD_PREFIX";
    }
    return "UNKNOWN";
}

bool pillExtractPayload(const ManufacturerData& data, std::string& payload) {
    ManufacturerData::const_iterator it = data.find(PILL_VENDOR_ID);
    if (it == data.end()) {
        return false;
    }
    if (it->second == PILL_SENTINEL_PAYLOAD) {
        return false;
    }
    payload = it->second;
    return true;
}
