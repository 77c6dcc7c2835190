/**
 * PillBridge - MeadTools Sync Client
 * Authentication, hydrometer/brew registration and data point publication
 * against the MeadTools hydrometer API
 *
 * Every call returns a SyncResult carrying the HTTP status. MeadToolsAccount
 * owns the shared credentials and the bearer token lifecycle; each session
 * runs its own MeadToolsClient seeded from it. Changes to persisted tokens
 * are reported through the identity callback.
 */

#ifndef MEADTOOLS_CLIENT_H
#define MEADTOOLS_CLIENT_H

#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>

#include "http_transport.h"
#include "session_config.h"

enum SyncStatus {
    SYNC_OK = 0,
    SYNC_AUTH_ERROR,                // Credentials rejected (non-200 from auth endpoints)
    SYNC_NOT_CONFIGURED,            // Missing credentials, device token or ids
    SYNC_REMOTE_UNAVAILABLE,        // Transport failure or non-200 response
    SYNC_REGISTRATION_CONFLICT,     // Unexpected payload shape from the service
    SYNC_REFUSED,                   // Request refused locally (e.g. brew still ongoing)
};

struct SyncResult {
    SyncStatus status;
    int http_status;                // Last HTTP status seen, <= 0 if no response

    bool ok() const { return status == SYNC_OK; }
};

// Entry of GET /hydrometer {devices:[...]}
struct HydrometerRecord {
    std::string id;
    std::string device_name;
};

// Entry of GET /hydrometer/brew
struct BrewRecord {
    std::string id;
    std::string name;
    bool ended;                     // end_date set
};

// Called after a persisted identity field changed (tokens)
typedef void (*IdentityChangedCallback)(const RemoteIdentity& identity, void* ctx);

class MeadToolsClient {
public:
    explicit MeadToolsClient(HttpTransport& transport);

    // Replace settings; seeds device/access/refresh tokens from them
    void configure(const MeadToolsSettings& settings);
    const MeadToolsSettings& settings() const { return settings_; }

    void setIdentityCallback(IdentityChangedCallback callback, void* ctx);
    const RemoteIdentity& identity() const { return identity_; }
    bool isLoggedIn() const { return logged_in_; }

    // ---- Authentication ----

    /**
     * POST /auth/login
     * On 200 stores access and refresh tokens; otherwise leaves them untouched
     * @return SYNC_OK, SYNC_AUTH_ERROR (non-200) or SYNC_REMOTE_UNAVAILABLE
     */
    SyncResult login(const std::string& email, const std::string& password);

    /**
     * POST /auth/refresh
     * On 200 updates only the access token
     * @return true if a new access token was stored
     */
    bool refresh(const std::string& email, const std::string& refresh_token);

    /**
     * Establish a bearer token
     * Refresh when both tokens are held (falling back to login), else
     * login with email/password, else adopt the external OAuth token
     * @return SYNC_OK, or SYNC_NOT_CONFIGURED when no credentials exist
     */
    SyncResult ensureLoggedIn();

    // ---- Device token ----

    // POST /hydrometer/token, stores the returned token
    SyncResult generateDeviceToken(std::string& token);

    // Generate a device token if none is configured
    SyncResult ensureDeviceToken();

    // ---- Hydrometers ----

    SyncResult listHydrometers(std::vector<HydrometerRecord>& out);

    // POST /hydrometer/rapt-pill/register {token, name} (no bearer)
    SyncResult registerHydrometer(const std::string& name, std::string& hydrometer_id);

    // Adopt the hydrometer named `name`, registering it if absent
    SyncResult resolveHydrometer(const std::string& name);

    // ---- Brews ----

    SyncResult listBrews(std::vector<BrewRecord>& out);

    // POST /hydrometer/brew {device_id, brew_name}
    SyncResult registerBrew(const std::string& brew_name, const std::string& hydrometer_id,
                            std::string& brew_id);

    // PATCH /hydrometer/brew/{id} {recipe_id}; no request when recipe_id is unset
    SyncResult linkRecipe(const std::string& brew_id, int32_t recipe_id);

    /**
     * Adopt the ongoing brew named `brew_name`, registering one if none exists,
     * then link the recipe if configured
     * Requires a resolved hydrometer id
     */
    SyncResult resolveBrew(const std::string& brew_name, int32_t recipe_id);

    // PATCH /hydrometer/brew {device_id, brew_id}, bounded timeout
    SyncResult endBrew(const std::string& hydrometer_id, const std::string& brew_id);

    // DELETE /hydrometer/brew/{id}; refused unless the brew has ended
    SyncResult deleteBrew(const std::string& brew_id);

    // ---- Data ----

    // POST /hydrometer/rapt-pill {token, name, gravity, temperature, temp_units, battery}
    SyncResult publishDataPoint(const std::string& device_token, const std::string& name,
                                double gravity, double temperature, bool celsius,
                                int battery);

private:
    HttpResponse request(HttpMethod method, const std::string& path,
                         const std::string& body, bool authenticated,
                         uint32_t timeout_ms);
    void notifyIdentityChanged();

    HttpTransport& transport_;
    MeadToolsSettings settings_;
    RemoteIdentity identity_;
    bool logged_in_;
    IdentityChangedCallback identity_callback_;
    void* identity_ctx_;
};

/**
 * Account-wide login state shared by every session
 *
 * Holds the bearer and device tokens behind one mutex so concurrent session
 * starts log in and mint the device token one at a time. Each call runs its
 * HTTP requests with the account lock held; the identity callback is invoked
 * under that lock and must not call back into the account.
 */
class MeadToolsAccount {
public:
    explicit MeadToolsAccount(HttpTransport& transport);

    // Replace settings and tokens
    void configure(const MeadToolsSettings& settings);

    // Settings with the latest tokens folded in
    MeadToolsSettings settings() const;

    void setIdentityCallback(IdentityChangedCallback callback, void* ctx);

    // See MeadToolsClient::ensureLoggedIn
    SyncResult ensureLoggedIn();

    // Generate a device token unless one is already held
    SyncResult ensureDeviceToken();

    // Always mint a new device token
    SyncResult generateDeviceToken(std::string& token);

    // Point a session client at the current settings and tokens
    void applyTo(MeadToolsClient& client) const;

private:
    mutable std::mutex mutex_;
    MeadToolsClient auth_;
};

// Human-readable name of a sync status
const char* syncStatusName(SyncStatus status);

#endif // MEADTOOLS_CLIENT_H
