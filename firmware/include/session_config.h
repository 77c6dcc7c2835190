/**
 * PillBridge - Session & MeadTools Settings
 * Plain configuration records shared by the session engine, storage and
 * the serial console
 */

#ifndef SESSION_CONFIG_H
#define SESSION_CONFIG_H

#include <stdint.h>
#include <string>

#include "config.h"

// One tracked brew/Pill pairing
struct SessionConfig {
    std::string brew_name;
    std::string pill_name;          // Remote hydrometer name, empty = use MAC
    std::string mac_address;
    uint32_t poll_interval_s = SESSION_POLL_INTERVAL_DEFAULT_S;
    bool celsius = true;
    int32_t recipe_id = SESSION_RECIPE_UNSET;

    // Hydrometer name used when registering/publishing
    const std::string& effectivePillName() const {
        return pill_name.empty() ? mac_address : pill_name;
    }
};

// Account-wide MeadTools settings
struct MeadToolsSettings {
    std::string base_url = MT_DEFAULT_BASE_URL;
    std::string email;
    std::string password;
    std::string oauth_token;        // Bearer token obtained outside the device
    std::string device_token;       // Hydrometer ingest token
    std::string access_token;
    std::string refresh_token;
    bool sync_enabled = true;
};

// Remote identifiers resolved for one session
struct RemoteIdentity {
    std::string device_token;
    std::string hydrometer_id;
    std::string brew_id;
    std::string access_token;
    std::string refresh_token;
};

#endif // SESSION_CONFIG_H
