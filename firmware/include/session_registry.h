/**
 * PillBridge - Session Registry
 * Owns the tracked sessions, routes advertisements to them by device
 * address and hands start/stop/advertisement work to each session's worker
 */

#ifndef SESSION_REGISTRY_H
#define SESSION_REGISTRY_H

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "config.h"
#include "pill_decoder.h"
#include "session_engine.h"

// Registry handle (1-based slot number, 0 = invalid)
typedef uint16_t SessionHandle;
#define SESSION_HANDLE_INVALID  0

enum RegistryStatus {
    REGISTRY_OK = 0,
    REGISTRY_NOT_FOUND,     // Unknown handle
    REGISTRY_BUSY,          // Session must be stopped first
    REGISTRY_FULL,          // No free slot
    REGISTRY_DUPLICATE,     // Another session already tracks this MAC
    REGISTRY_QUEUE_FULL,    // Worker queue rejected the command
    REGISTRY_WORKER_FAILED, // Worker could not be created
};

// Executes queued commands for each engine (one worker per engine)
class SessionRunner {
public:
    virtual ~SessionRunner() {}

    // Create the worker for a newly added engine
    virtual bool attach(SessionEngine& engine) = 0;

    // Stop the worker and wait until it no longer touches the engine
    virtual void detach(SessionEngine& engine) = 0;

    // Queue a command; urgent commands jump ahead of queued advertisements
    virtual bool post(SessionEngine& engine, const SessionCommand& command, bool urgent) = 0;
};

class SessionRegistry {
public:
    SessionRegistry(HttpTransport& transport, SessionRunner& runner, const SessionClock& clock,
                    size_t capacity = PILLBRIDGE_MAX_SESSIONS);
    ~SessionRegistry();

    // MeadTools settings applied to sessions when they start
    void setSyncSettings(const MeadToolsSettings& settings);

    // Called with the account lock held whenever shared tokens change
    void setIdentityCallback(IdentityChangedCallback callback, void* ctx);

    // Login and device token state shared by every session
    MeadToolsAccount& account() { return account_; }

    // Add a session in the lowest free slot (state CREATED)
    RegistryStatus add(const SessionConfig& config, SessionHandle& handle);

    // Add a session into a specific slot (restoring persisted sessions)
    RegistryStatus addAt(SessionHandle handle, const SessionConfig& config);

    RegistryStatus start(SessionHandle handle);

    // Jumps ahead of queued advertisements and cancels a start still queued
    RegistryStatus stop(SessionHandle handle);

    // Only stopped or never-started sessions can be removed
    RegistryStatus remove(SessionHandle handle);

    // Replace a stopped session's configuration
    RegistryStatus updateConfig(SessionHandle handle, const SessionConfig& config);

    /**
     * Route a Pill payload to the running session tracking `address`
     * Address comparison is case-insensitive; unmatched addresses are ignored
     * @return true if the payload was queued for a session
     */
    bool dispatch(const std::string& address, const uint8_t* data, size_t length);

    // Scanner entry point: vendor filter, then dispatch
    bool onAdvertisement(const std::string& address, const ManufacturerData& manufacturer_data);

    // True if any running session is inside its listening window
    bool anyListening(uint32_t now_ms) const;

    bool snapshot(SessionHandle handle, SessionSnapshot& out) const;
    std::vector<SessionHandle> handles() const;
    size_t capacity() const { return slots_.size(); }

private:
    SessionEngine* find(SessionHandle handle) const;
    RegistryStatus insert(size_t index, const SessionConfig& config);
    RegistryStatus post(SessionHandle handle, SessionCommandType type, bool urgent);

    HttpTransport& transport_;
    SessionRunner& runner_;
    SessionClock clock_;
    MeadToolsAccount account_;

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<SessionEngine>> slots_;
};

const char* registryStatusName(RegistryStatus status);

#endif // SESSION_REGISTRY_H
