/**
 * PillBridge - Session Registry
 * Implementation
 */

#include "session_registry.h"
#include "status_log.h"

#include <string.h>
#include <strings.h>

SessionRegistry::SessionRegistry(HttpTransport& transport, SessionRunner& runner,
                                 const SessionClock& clock, size_t capacity)
    : transport_(transport),
      runner_(runner),
      clock_(clock),
      account_(transport),
      slots_(capacity) {
}

SessionRegistry::~SessionRegistry() {
    for (size_t i = 0; i < slots_.size(); i++) {
        if (slots_[i]) {
            runner_.detach(*slots_[i]);
        }
    }
}

void SessionRegistry::setSyncSettings(const MeadToolsSettings& settings) {
    account_.configure(settings);
}

void SessionRegistry::setIdentityCallback(IdentityChangedCallback callback, void* ctx) {
    account_.setIdentityCallback(callback, ctx);
}

SessionEngine* SessionRegistry::find(SessionHandle handle) const {
    if (handle == SESSION_HANDLE_INVALID || handle > slots_.size()) {
        return nullptr;
    }
    return slots_[handle - 1].get();
}

// Caller holds mutex_
RegistryStatus SessionRegistry::insert(size_t index, const SessionConfig& config) {
    for (size_t i = 0; i < slots_.size(); i++) {
        if (slots_[i] && slots_[i]->matchesAddress(config.mac_address)) {
            statusReportf("Pill %s is already tracked by session %u", config.mac_address.c_str(),
                          (unsigned)(i + 1));
            return REGISTRY_DUPLICATE;
        }
    }

    std::unique_ptr<SessionEngine> engine(new SessionEngine(config, transport_, account_, clock_));
    if (!runner_.attach(*engine)) {
        statusReportf("Failed to create worker for %s", config.brew_name.c_str());
        return REGISTRY_WORKER_FAILED;
    }
    slots_[index] = std::move(engine);
    statusLogf(LOG_SESSION, "Added session %u: %s (%s)", (unsigned)(index + 1),
               config.brew_name.c_str(), config.mac_address.c_str());
    return REGISTRY_OK;
}

RegistryStatus SessionRegistry::add(const SessionConfig& config, SessionHandle& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < slots_.size(); i++) {
        if (!slots_[i]) {
            RegistryStatus status = insert(i, config);
            if (status == REGISTRY_OK) {
                handle = (SessionHandle)(i + 1);
            }
            return status;
        }
    }
    return REGISTRY_FULL;
}

RegistryStatus SessionRegistry::addAt(SessionHandle handle, const SessionConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle == SESSION_HANDLE_INVALID || handle > slots_.size()) {
        return REGISTRY_NOT_FOUND;
    }
    if (slots_[handle - 1]) {
        return REGISTRY_BUSY;
    }
    return insert(handle - 1, config);
}

// Caller holds mutex_
RegistryStatus SessionRegistry::post(SessionHandle handle, SessionCommandType type, bool urgent) {
    SessionEngine* engine = find(handle);
    if (engine == nullptr) {
        return REGISTRY_NOT_FOUND;
    }

    SessionCommand command;
    memset(&command, 0, sizeof(command));
    command.type = type;
    if (!runner_.post(*engine, command, urgent)) {
        statusReportf("Session %u: command queue full", (unsigned)handle);
        return REGISTRY_QUEUE_FULL;
    }
    return REGISTRY_OK;
}

RegistryStatus SessionRegistry::start(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEngine* engine = find(handle);
    if (engine == nullptr) {
        return REGISTRY_NOT_FOUND;
    }
    engine->requestStart();
    return post(handle, CMD_START, false);
}

RegistryStatus SessionRegistry::stop(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEngine* engine = find(handle);
    if (engine == nullptr) {
        return REGISTRY_NOT_FOUND;
    }
    // A start still queued would otherwise run after this stop
    engine->requestStop();
    return post(handle, CMD_STOP, true);
}

RegistryStatus SessionRegistry::remove(SessionHandle handle) {
    std::unique_ptr<SessionEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        SessionEngine* found = find(handle);
        if (found == nullptr) {
            return REGISTRY_NOT_FOUND;
        }
        SessionState state = found->state();
        if (state != SESSION_CREATED && state != SESSION_STOPPED) {
            return REGISTRY_BUSY;
        }
        engine = std::move(slots_[handle - 1]);
    }

    runner_.detach(*engine);
    statusLogf(LOG_SESSION, "Removed session %u", (unsigned)handle);
    return REGISTRY_OK;
}

RegistryStatus SessionRegistry::updateConfig(SessionHandle handle, const SessionConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEngine* engine = find(handle);
    if (engine == nullptr) {
        return REGISTRY_NOT_FOUND;
    }
    for (size_t i = 0; i < slots_.size(); i++) {
        if (i != (size_t)(handle - 1) && slots_[i] && slots_[i]->matchesAddress(config.mac_address)) {
            return REGISTRY_DUPLICATE;
        }
    }
    return engine->setConfig(config) ? REGISTRY_OK : REGISTRY_BUSY;
}

bool SessionRegistry::dispatch(const std::string& address, const uint8_t* data, size_t length) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < slots_.size(); i++) {
        SessionEngine* engine = slots_[i].get();
        if (engine == nullptr || !engine->matchesAddress(address)) {
            continue;
        }
        if (engine->state() != SESSION_RUNNING) {
            return false;
        }

        SessionCommand command;
        memset(&command, 0, sizeof(command));
        command.type = CMD_ADVERTISEMENT;
        memcpy(command.payload, data, length < PILL_PAYLOAD_LENGTH ? length : PILL_PAYLOAD_LENGTH);
        command.length = (uint8_t)(length < 0xFF ? length : 0xFF);
        if (!runner_.post(*engine, command, false)) {
            statusLogf(LOG_SCANNER, "Session %u queue full, advertisement dropped", (unsigned)(i + 1));
            return false;
        }
        return true;
    }
    return false;
}

bool SessionRegistry::onAdvertisement(const std::string& address,
                                      const ManufacturerData& manufacturer_data) {
    std::string payload;
    if (!pillExtractPayload(manufacturer_data, payload)) {
        return false;
    }
    statusLogf(LOG_SCANNER, "Pill advertisement from %s (%u bytes)", address.c_str(),
               (unsigned)payload.size());
    return dispatch(address, reinterpret_cast<const uint8_t*>(payload.data()), payload.size());
}

bool SessionRegistry::anyListening(uint32_t now_ms) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < slots_.size(); i++) {
        if (slots_[i] && slots_[i]->isListening(now_ms)) {
            return true;
        }
    }
    return false;
}

bool SessionRegistry::snapshot(SessionHandle handle, SessionSnapshot& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionEngine* engine = find(handle);
    if (engine == nullptr) {
        return false;
    }
    out = engine->snapshot();
    return true;
}

std::vector<SessionHandle> SessionRegistry::handles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SessionHandle> out;
    for (size_t i = 0; i < slots_.size(); i++) {
        if (slots_[i]) {
            out.push_back((SessionHandle)(i + 1));
        }
    }
    return out;
}

const char* registryStatusName(RegistryStatus status) {
    switch (status) {
        case REGISTRY_OK:            return "OK";
        case REGISTRY_NOT_FOUND:     return "NOT_FOUND";
        case REGISTRY_BUSY:          return "BUSY";
        case REGISTRY_FULL:          return "FULL";
        case REGISTRY_DUPLICATE:     return "DUPLICATE";
        case REGISTRY_QUEUE_FULL:    return "QUEUE_FULL";
        case REGISTRY_WORKER_FAILED: return "WORKER_FAILED";
    }
    return "UNKNOWN";
}
