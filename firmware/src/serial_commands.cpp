// serial_commands.cpp
// Serial command parser for WiFi, MeadTools and session configuration
// Keywords are case-insensitive, arguments keep their case

#include "config.h"

#if ENABLE_SERIAL_COMMANDS

#include "serial_commands.h"
#include "pillbridge.h"
#include "storage.h"
#include "status_log.h"
#include "session_registry.h"
#include "meadtools_client.h"
#include "wifi_link.h"
#if ENABLE_BLE_SCANNER
#include "pill_scanner.h"
#endif
#include <strings.h>

// Command buffer for serial input
#define CMD_BUFFER_SIZE 192
static char cmdBuffer[CMD_BUFFER_SIZE];
static uint8_t cmdBufferPos = 0;

// Callback for WiFi credential changes
static OnWifiChangedCallback g_onWifiChangedCallback = nullptr;

// Shared state (managed in main.cpp)
extern SessionRegistry* g_registry;
extern HttpTransport* g_http_transport;
extern MeadToolsSettings meadToolsSettingsGet();
extern void meadToolsSettingsSet(const MeadToolsSettings& settings);

// Initialize serial command handler
void serialCommandsInit() {
    cmdBufferPos = 0;
    cmdBuffer[0] = '\0';
}

// Register callback for WiFi credential changes
void serialCommandsSetWifiCallback(OnWifiChangedCallback callback) {
    g_onWifiChangedCallback = callback;
}

// Parse integer from string
// Returns true if successful, false otherwise
static bool parseInt(const char* str, long& value) {
    if (str == nullptr || *str == '\0') {
        return false;
    }
    char* endptr;
    long result = strtol(str, &endptr, 10);
    if (endptr == str || *endptr != '\0') {
        return false;
    }
    value = result;
    return true;
}

// Split the next whitespace-delimited token off the cursor
// Returns nullptr when no token is left
static char* nextToken(char*& cursor) {
    while (*cursor == ' ' || *cursor == '\t') cursor++;
    if (*cursor == '\0') return nullptr;

    char* start = cursor;
    while (*cursor && *cursor != ' ' && *cursor != '\t') cursor++;
    if (*cursor) {
        *cursor = '\0';
        cursor++;
    }
    return start;
}

// Remaining text after the cursor, leading whitespace trimmed
static char* restOf(char* cursor) {
    while (*cursor == ' ' || *cursor == '\t') cursor++;
    return cursor;
}

// Validate MAC address format AA:BB:CC:DD:EE:FF
static bool validateMac(const char* mac) {
    if (strlen(mac) != 17) return false;
    for (int i = 0; i < 17; i++) {
        if (i % 3 == 2) {
            if (mac[i] != ':') return false;
        } else if (!isxdigit((unsigned char)mac[i])) {
            return false;
        }
    }
    return true;
}

// Parse a session id argument, printing an error if invalid
static bool parseSessionId(const char* arg, SessionHandle& handle) {
    long value;
    if (!parseInt(arg, value) || value < 1 || value > PILLBRIDGE_MAX_SESSIONS) {
        Serial.printf("ERROR: Session id must be 1-%d\n", PILLBRIDGE_MAX_SESSIONS);
        return false;
    }
    handle = (SessionHandle)value;
    return true;
}

// Print a registry error in a consistent form
static void printRegistryError(SessionHandle handle, RegistryStatus status) {
    Serial.printf("ERROR: Session %u: %s\n", (unsigned)handle, registryStatusName(status));
}

// Log in through the shared account so sessions reuse the console's tokens
static bool consoleLogin() {
    SyncResult result = g_registry->account().ensureLoggedIn();
    if (!result.ok()) {
        Serial.printf("ERROR: MeadTools login failed: %s (HTTP %d)\n",
                      syncStatusName(result.status), result.http_status);
        return false;
    }
    return true;
}

// Handle SET WIFI command
// Format: SET WIFI ssid [password]
static void handleSetWifi(char* args) {
    char* cursor = args;
    char* ssid = nextToken(cursor);
    if (ssid == nullptr) {
        Serial.println("ERROR: Invalid format");
        Serial.println("Usage: SET WIFI ssid [password]");
        return;
    }
    char* password = restOf(cursor);

    if (!storageSaveWifi(ssid, password)) {
        Serial.println("ERROR: Failed to save WiFi credentials");
        return;
    }
    Serial.printf("WiFi credentials saved (SSID: %s)\n", ssid);

    if (g_onWifiChangedCallback != nullptr) {
        g_onWifiChangedCallback(ssid, password);
    }
}

// Handle SET MT <field> command
// Format: SET MT URL|EMAIL|PASSWORD|TOKEN|OAUTH value, SET MT SYNC ON|OFF
static void handleSetMeadTools(char* args) {
    char* cursor = args;
    char* field = nextToken(cursor);
    char* value = field ? restOf(cursor) : nullptr;
    if (field == nullptr || value == nullptr || *value == '\0') {
        Serial.println("ERROR: Invalid format");
        Serial.println("Usage: SET MT URL|EMAIL|PASSWORD|TOKEN|OAUTH value");
        Serial.println("       SET MT SYNC ON|OFF");
        return;
    }

    MeadToolsSettings settings = meadToolsSettingsGet();
    if (strcasecmp(field, "URL") == 0) {
        settings.base_url = value;
        Serial.printf("MeadTools URL: %s\n", value);
    } else if (strcasecmp(field, "EMAIL") == 0) {
        settings.email = value;
        // New account, old tokens no longer apply
        settings.access_token.clear();
        settings.refresh_token.clear();
        Serial.printf("MeadTools email: %s\n", value);
    } else if (strcasecmp(field, "PASSWORD") == 0) {
        settings.password = value;
        Serial.println("MeadTools password set");
    } else if (strcasecmp(field, "TOKEN") == 0) {
        settings.device_token = value;
        Serial.println("MeadTools device token set");
    } else if (strcasecmp(field, "OAUTH") == 0) {
        settings.oauth_token = value;
        Serial.println("MeadTools OAuth token set");
    } else if (strcasecmp(field, "SYNC") == 0) {
        if (strcasecmp(value, "ON") == 0) {
            settings.sync_enabled = true;
        } else if (strcasecmp(value, "OFF") == 0) {
            settings.sync_enabled = false;
        } else {
            Serial.println("ERROR: Use SET MT SYNC ON or OFF");
            return;
        }
        Serial.printf("MeadTools sync: %s (applies to sessions started from now)\n",
                      settings.sync_enabled ? "ON" : "OFF");
    } else {
        Serial.printf("ERROR: Unknown MeadTools setting: %s\n", field);
        return;
    }

    meadToolsSettingsSet(settings);
}

// Handle GEN TOKEN command - generate and store a new device token
static void handleGenerateToken() {
    if (!consoleLogin()) {
        return;
    }

    std::string token;
    SyncResult result = g_registry->account().generateDeviceToken(token);
    if (!result.ok()) {
        Serial.printf("ERROR: Token generation failed: %s (HTTP %d)\n",
                      syncStatusName(result.status), result.http_status);
        return;
    }
    Serial.println("Device token generated and saved");
}

// Handle LOGIN command - verify MeadTools credentials
static void handleLogin() {
    if (!consoleLogin()) {
        return;
    }
    Serial.println("MeadTools login OK");
}

// Handle DELETE BREW command
// Format: DELETE BREW brew_id
static void handleDeleteBrew(char* args) {
    char* cursor = args;
    char* brew_id = nextToken(cursor);
    if (brew_id == nullptr) {
        Serial.println("Usage: DELETE BREW brew_id");
        return;
    }

    if (!consoleLogin()) {
        return;
    }

    MeadToolsClient client(*g_http_transport);
    g_registry->account().applyTo(client);
    SyncResult result = client.deleteBrew(brew_id);
    if (!result.ok()) {
        Serial.printf("ERROR: Delete failed: %s (HTTP %d)\n",
                      syncStatusName(result.status), result.http_status);
        return;
    }
    Serial.printf("Brew %s deleted\n", brew_id);
}

// Handle ADD SESSION command
// Format: ADD SESSION mac poll_s C|F recipe|- brew name...
static void handleAddSession(char* args) {
    char* cursor = args;
    char* mac = nextToken(cursor);
    char* poll = nextToken(cursor);
    char* unit = nextToken(cursor);
    char* recipe = nextToken(cursor);
    char* brew = restOf(cursor);

    if (mac == nullptr || poll == nullptr || unit == nullptr || recipe == nullptr || *brew == '\0') {
        Serial.println("ERROR: Invalid format");
        Serial.println("Usage: ADD SESSION mac poll_s C|F recipe|- brew name");
        Serial.println("Example: ADD SESSION 78:E3:6D:29:0A:12 120 C - Spring Melomel");
        return;
    }

    SessionConfig config;
    if (!validateMac(mac)) {
        Serial.println("ERROR: MAC must be AA:BB:CC:DD:EE:FF");
        return;
    }
    config.mac_address = mac;

    long poll_s;
    if (!parseInt(poll, poll_s) || poll_s < SESSION_POLL_INTERVAL_MIN_S || poll_s > SESSION_POLL_INTERVAL_MAX_S) {
        Serial.printf("ERROR: Poll interval must be %d-%d seconds\n",
                      SESSION_POLL_INTERVAL_MIN_S, SESSION_POLL_INTERVAL_MAX_S);
        return;
    }
    config.poll_interval_s = (uint32_t)poll_s;

    if (strcasecmp(unit, "C") == 0) {
        config.celsius = true;
    } else if (strcasecmp(unit, "F") == 0) {
        config.celsius = false;
    } else {
        Serial.println("ERROR: Temperature unit must be C or F");
        return;
    }

    if (strcmp(recipe, "-") == 0) {
        config.recipe_id = SESSION_RECIPE_UNSET;
    } else {
        long recipe_id;
        if (!parseInt(recipe, recipe_id) || recipe_id < 0) {
            Serial.println("ERROR: Recipe id must be a number or -");
            return;
        }
        config.recipe_id = (int32_t)recipe_id;
    }
    config.brew_name = brew;

    SessionHandle handle = SESSION_HANDLE_INVALID;
    RegistryStatus status = g_registry->add(config, handle);
    if (status != REGISTRY_OK) {
        Serial.printf("ERROR: Could not add session: %s\n", registryStatusName(status));
        return;
    }
    if (!storageSaveSession(handle - 1, config, false)) {
        Serial.println("WARNING: Failed to save session to NVS");
    }
    Serial.printf("Session %u added: %s (%s)\n", (unsigned)handle, config.brew_name.c_str(),
                  config.mac_address.c_str());
}

// Handle SET PILL NAME command
// Format: SET PILL NAME id name...
static void handleSetPillName(char* args) {
    char* cursor = args;
    char* id = nextToken(cursor);
    char* name = restOf(cursor);
    if (id == nullptr || *name == '\0') {
        Serial.println("Usage: SET PILL NAME id name");
        return;
    }

    SessionHandle handle;
    if (!parseSessionId(id, handle)) return;

    SessionSnapshot snap;
    if (!g_registry->snapshot(handle, snap)) {
        printRegistryError(handle, REGISTRY_NOT_FOUND);
        return;
    }

    SessionConfig config = snap.config;
    config.pill_name = name;
    RegistryStatus status = g_registry->updateConfig(handle, config);
    if (status != REGISTRY_OK) {
        printRegistryError(handle, status);
        if (status == REGISTRY_BUSY) {
            Serial.println("Stop the session before renaming the Pill");
        }
        return;
    }

    bool active = snap.state == SESSION_RUNNING;
    if (!storageSaveSession(handle - 1, config, active)) {
        Serial.println("WARNING: Failed to save session to NVS");
    }
    Serial.printf("Session %u Pill name: %s\n", (unsigned)handle, name);
}

// Start or stop one session and record the active flag
static void startStopOne(SessionHandle handle, bool start) {
    RegistryStatus status = start ? g_registry->start(handle) : g_registry->stop(handle);
    if (status != REGISTRY_OK) {
        printRegistryError(handle, status);
        return;
    }
    if (!storageSetSessionActive(handle - 1, start)) {
        Serial.println("WARNING: Failed to save session state to NVS");
    }
    Serial.printf("Session %u: %s requested\n", (unsigned)handle, start ? "start" : "stop");
}

// Handle START / STOP command
// Format: START id|ALL, STOP id|ALL
static void handleStartStop(char* args, bool start) {
    char* cursor = args;
    char* id = nextToken(cursor);
    if (id == nullptr) {
        Serial.printf("Usage: %s id|ALL\n", start ? "START" : "STOP");
        return;
    }

    if (strcasecmp(id, "ALL") == 0) {
        std::vector<SessionHandle> handles = g_registry->handles();
        if (handles.empty()) {
            Serial.println("No sessions configured");
            return;
        }
        for (size_t i = 0; i < handles.size(); i++) {
            startStopOne(handles[i], start);
        }
        return;
    }

    SessionHandle handle;
    if (!parseSessionId(id, handle)) return;
    startStopOne(handle, start);
}

// Handle REMOVE command
// Format: REMOVE id
static void handleRemove(char* args) {
    char* cursor = args;
    char* id = nextToken(cursor);
    SessionHandle handle;
    if (id == nullptr) {
        Serial.println("Usage: REMOVE id");
        return;
    }
    if (!parseSessionId(id, handle)) return;

    RegistryStatus status = g_registry->remove(handle);
    if (status != REGISTRY_OK) {
        printRegistryError(handle, status);
        if (status == REGISTRY_BUSY) {
            Serial.println("Stop the session before removing it");
        }
        return;
    }
    if (!storageClearSession(handle - 1)) {
        Serial.println("WARNING: Failed to clear session from NVS");
    }
    Serial.printf("Session %u removed\n", (unsigned)handle);
}

// Handle LIST SESSIONS command - one line per session
static void handleListSessions() {
    std::vector<SessionHandle> handles = g_registry->handles();
    if (handles.empty()) {
        Serial.println("No sessions configured (use ADD SESSION)");
        return;
    }

    Serial.println("\n=== SESSIONS ===");
    for (size_t i = 0; i < handles.size(); i++) {
        SessionSnapshot snap;
        if (!g_registry->snapshot(handles[i], snap)) {
            continue;
        }
        Serial.printf("%u: %-12s %s  %s", (unsigned)handles[i], sessionStateName(snap.state),
                      snap.config.mac_address.c_str(), snap.config.brew_name.c_str());
        if (snap.state == SESSION_RUNNING) {
            Serial.print(snap.remote_sync ? "  [sync]" : "  [local]");
        }
        if (snap.telemetry.valid) {
            Serial.printf("  SG %.4f  ABV %.2f%%", snap.telemetry.current_gravity, snap.telemetry.abv);
        }
        Serial.println();
    }
    Serial.println("================\n");
}

// Handle GET SESSION command - full detail for one session
// Format: GET SESSION id
static void handleGetSession(char* args) {
    char* cursor = args;
    char* id = nextToken(cursor);
    SessionHandle handle;
    if (id == nullptr) {
        Serial.println("Usage: GET SESSION id");
        return;
    }
    if (!parseSessionId(id, handle)) return;

    SessionSnapshot snap;
    if (!g_registry->snapshot(handle, snap)) {
        printRegistryError(handle, REGISTRY_NOT_FOUND);
        return;
    }

    const SessionConfig& cfg = snap.config;
    const LiveTelemetry& t = snap.telemetry;
    char unit = cfg.celsius ? 'C' : 'F';

    Serial.printf("\n=== SESSION %u ===\n", (unsigned)handle);
    Serial.printf("Brew: %s\n", cfg.brew_name.c_str());
    Serial.printf("Pill: %s (%s)\n", cfg.effectivePillName().c_str(), cfg.mac_address.c_str());
    Serial.printf("Poll interval: %u s\n", (unsigned)cfg.poll_interval_s);
    Serial.printf("Units: %c\n", unit);
    if (cfg.recipe_id == SESSION_RECIPE_UNSET) {
        Serial.println("Recipe: none");
    } else {
        Serial.printf("Recipe: %ld\n", (long)cfg.recipe_id);
    }
    Serial.printf("State: %s", sessionStateName(snap.state));
    if (snap.state == SESSION_RUNNING) {
        Serial.print(snap.remote_sync ? " (MeadTools sync)" : " (local only)");
    }
    Serial.println();
    if (snap.remote_sync) {
        Serial.printf("Hydrometer id: %s\n", snap.hydrometer_id.c_str());
        Serial.printf("Brew id: %s\n", snap.brew_id.c_str());
    }

    if (snap.calibrated) {
        Serial.printf("Starting gravity: %.4f\n", snap.starting_gravity);
    } else {
        Serial.println("Starting gravity: waiting for first reading");
    }

    if (t.valid) {
        Serial.printf("Last reading: %s (API v%u)\n", t.last_event.c_str(), (unsigned)t.api_version);
        Serial.printf("Gravity: %.4f", t.current_gravity);
        if (t.has_gravity_velocity) {
            Serial.printf("  velocity %.2f", t.gravity_velocity);
        }
        Serial.println();
        Serial.printf("ABV: %.4f%%\n", t.abv);
        Serial.printf("Temperature: %.2f %c\n", t.temperature, unit);
        Serial.printf("Battery: %d%%\n", t.battery_percent);
        Serial.printf("Accel: x=%.2f y=%.2f z=%.2f\n", t.x, t.y, t.z);
    }

    Serial.printf("Advertisements: %lu  Decode failures: %lu\n",
                  (unsigned long)snap.advertisements, (unsigned long)snap.decode_failures);
    Serial.printf("Published: %lu  Publish failures: %lu\n",
                  (unsigned long)snap.publishes, (unsigned long)snap.publish_failures);
    Serial.println("==================\n");
}

// Handle GET STATUS command - show all system status
static void handleGetStatus() {
    MeadToolsSettings settings = meadToolsSettingsGet();

    Serial.println("\n=== SYSTEM STATUS ===");
    Serial.printf("PillBridge v%s\n", PILLBRIDGE_VERSION);

    wifiLinkPrintStatus();

    Serial.printf("MeadTools URL: %s\n", settings.base_url.c_str());
    Serial.printf("MeadTools email: %s\n", settings.email.empty() ? "NOT SET" : settings.email.c_str());
    Serial.printf("MeadTools password: %s\n", settings.password.empty() ? "NOT SET" : "set");
    Serial.printf("OAuth token: %s\n", settings.oauth_token.empty() ? "NOT SET" : "set");
    Serial.printf("Device token: %s\n", settings.device_token.empty() ? "NOT SET" : "set");
    Serial.printf("Sync: %s\n", settings.sync_enabled ? "ON" : "OFF");

#if ENABLE_BLE_SCANNER
    Serial.printf("Scanner: %s, %lu Pill advertisements\n",
                  pillScannerIsScanning() ? "SCANNING" : "IDLE",
                  (unsigned long)pillScannerAdvertisementCount());
#endif

    Serial.printf("Sessions: %u of %u\n", (unsigned)g_registry->handles().size(),
                  (unsigned)g_registry->capacity());

    std::string last = statusLastMessage();
    Serial.printf("Last status: %s\n", last.empty() ? "-" : last.c_str());
    Serial.printf("Uptime: %lu s\n", millis() / 1000);
    Serial.println("=====================\n");
}

// Handle debug level change (single character '0'-'4', '9')
static void handleDebugLevel(char level) {
    if (!statusLogSetLevel(level)) {
        Serial.println("ERROR: Invalid debug level (use 0-4 or 9)");
        return;
    }

    switch (level) {
        case '0': Serial.println("Debug Level 0: All debug output OFF"); break;
        case '1': Serial.println("Debug Level 1: Session events"); break;
        case '2': Serial.println("Debug Level 2: + MeadTools protocol, NVS"); break;
        case '3': Serial.println("Debug Level 3: + Decoded advertisements"); break;
        case '4': Serial.println("Debug Level 4: + Scanner activity"); break;
        default:  Serial.println("Debug Level 9: All debug ON (all categories)"); break;
    }
}

static void printHelp() {
    Serial.println("\nAvailable commands:");
    Serial.println("Debug Control:");
    Serial.println("  0-4, 9                - Set debug level (single character)");
    Serial.println("                          0=OFF, 1=Sessions, 2=+MeadTools,");
    Serial.println("                          3=+Decoder, 4=+Scanner, 9=All ON");
    Serial.println("\nNetwork:");
    Serial.println("  SET WIFI ssid [password]              - Save WiFi credentials and connect");
    Serial.println("\nMeadTools:");
    Serial.println("  SET MT URL url                        - API base URL");
    Serial.println("  SET MT EMAIL email                    - Account email");
    Serial.println("  SET MT PASSWORD password              - Account password");
    Serial.println("  SET MT TOKEN token                    - Hydrometer device token");
    Serial.println("  SET MT OAUTH token                    - Bearer token from OAuth login");
    Serial.println("  SET MT SYNC ON|OFF                    - Enable/disable publishing");
    Serial.println("  LOGIN                                 - Test MeadTools login");
    Serial.println("  GEN TOKEN                             - Generate a new device token");
    Serial.println("  DELETE BREW brew_id                   - Delete an ended brew");
    Serial.println("\nSessions:");
    Serial.println("  ADD SESSION mac poll_s C|F recipe|- brew name");
    Serial.println("  SET PILL NAME id name                 - Hydrometer name (default: MAC)");
    Serial.println("  START id|ALL                          - Start session(s)");
    Serial.println("  STOP id|ALL                           - Stop session(s), ends the brew");
    Serial.println("  REMOVE id                             - Remove a stopped session");
    Serial.println("  LIST SESSIONS                         - One line per session");
    Serial.println("  GET SESSION id                        - Session detail and telemetry");
    Serial.println("\nSystem Status:");
    Serial.println("  GET STATUS            - Show all system status and settings");
    Serial.println("  HELP                  - Show this list");
}

// Helper: Parse command into words (space-separated)
// Modifies input string in-place, null-terminates words
// Returns number of words parsed, sets args pointer to remaining string
static int parseCommandWords(char* input, char* words[], int max_words, char** args) {
    // Trim leading whitespace
    while (*input == ' ' || *input == '\t') input++;

    if (*input == '\0') {
        *args = input;
        return 0;
    }

    // Find end of original string before we modify it
    char* original_end = input + strlen(input);

    int word_count = 0;
    char* start = input;
    bool in_word = false;

    // Parse words (case preserved, matching is case-insensitive)
    for (char* p = input; *p && word_count < max_words; p++) {
        if (*p == ' ' || *p == '\t') {
            if (in_word) {
                *p = '\0';  // Null-terminate word
                words[word_count++] = start;
                in_word = false;
            }
        } else if (!in_word) {
            start = p;
            in_word = true;
        }
    }

    // Handle last word
    if (in_word && word_count < max_words) {
        words[word_count++] = start;
    }

    if (word_count == 0) {
        *args = input;
        return 0;
    }

    // Skip null terminators we added and whitespace to find arguments
    char* p = words[word_count - 1] + strlen(words[word_count - 1]);
    while (p < original_end && (*p == '\0' || *p == ' ' || *p == '\t')) {
        p++;
    }
    *args = (p >= original_end) ? original_end : p;

    return word_count;
}

// Helper: Check if first N words match a pattern (allows extra words for arguments)
static bool matchWordsPrefix(char* words[], int word_count, const char* pattern[], int pattern_count) {
    if (word_count < pattern_count) return false;  // Not enough words
    for (int i = 0; i < pattern_count; i++) {
        if (strcasecmp(words[i], pattern[i]) != 0) return false;
    }
    return true;
}

// Helper: Reconstruct args string from remaining words (for multi-word arguments)
// Returns pointer to static buffer containing the words after the pattern
static char* reconstructArgs(char* words[], int word_count, int pattern_count, char* original_args) {
    static char args_buffer[CMD_BUFFER_SIZE];
    size_t pos = 0;
    for (int i = pattern_count; i < word_count; i++) {
        size_t len = strlen(words[i]);
        if (pos + len + 2 >= sizeof(args_buffer)) break;
        if (i > pattern_count) {
            args_buffer[pos++] = ' ';  // Add space between words
        }
        memcpy(args_buffer + pos, words[i], len);
        pos += len;
    }
    // Text past the word limit is kept as-is
    if (original_args != nullptr && *original_args != '\0' &&
        pos + strlen(original_args) + 2 < sizeof(args_buffer)) {
        if (pos > 0) args_buffer[pos++] = ' ';
        memcpy(args_buffer + pos, original_args, strlen(original_args));
        pos += strlen(original_args);
    }
    args_buffer[pos] = '\0';
    return args_buffer;
}

#define MAX_COMMAND_WORDS 16

// Process a complete command
static void processCommand(char* cmd) {
    // Trim leading whitespace
    while (*cmd == ' ' || *cmd == '\t') cmd++;

    // Check for empty command
    if (*cmd == '\0') return;

    // Check for single-character debug level commands ('0'-'4', '9')
    if (strlen(cmd) == 1 && ((cmd[0] >= '0' && cmd[0] <= '4') || cmd[0] == '9')) {
        handleDebugLevel(cmd[0]);
        return;
    }

    // Parse command words
    char* words[MAX_COMMAND_WORDS];
    char* args;
    int word_count = parseCommandWords(cmd, words, MAX_COMMAND_WORDS, &args);

    if (word_count == 0) return;

    // One-word commands
    {
        const char* pattern1[] = {"HELP"};
        if (matchWordsPrefix(words, word_count, pattern1, 1)) {
            printHelp();
            return;
        }
        const char* pattern2[] = {"LOGIN"};
        if (matchWordsPrefix(words, word_count, pattern2, 1)) {
            handleLogin();
            return;
        }
        const char* pattern3[] = {"START"};
        if (matchWordsPrefix(words, word_count, pattern3, 1)) {
            handleStartStop(reconstructArgs(words, word_count, 1, args), true);
            return;
        }
        const char* pattern4[] = {"STOP"};
        if (matchWordsPrefix(words, word_count, pattern4, 1)) {
            handleStartStop(reconstructArgs(words, word_count, 1, args), false);
            return;
        }
        const char* pattern5[] = {"REMOVE"};
        if (matchWordsPrefix(words, word_count, pattern5, 1)) {
            handleRemove(reconstructArgs(words, word_count, 1, args));
            return;
        }
    }

    // Two-word commands (check if first 2 words match, even if more words present for arguments)
    if (word_count >= 2) {
        const char* pattern1[] = {"SET", "WIFI"};
        if (matchWordsPrefix(words, word_count, pattern1, 2)) {
            handleSetWifi(reconstructArgs(words, word_count, 2, args));
            return;
        }
        const char* pattern2[] = {"SET", "MT"};
        if (matchWordsPrefix(words, word_count, pattern2, 2)) {
            handleSetMeadTools(reconstructArgs(words, word_count, 2, args));
            return;
        }
        const char* pattern3[] = {"GEN", "TOKEN"};
        if (matchWordsPrefix(words, word_count, pattern3, 2)) {
            handleGenerateToken();
            return;
        }
        const char* pattern4[] = {"ADD", "SESSION"};
        if (matchWordsPrefix(words, word_count, pattern4, 2)) {
            handleAddSession(reconstructArgs(words, word_count, 2, args));
            return;
        }
        const char* pattern5[] = {"LIST", "SESSIONS"};
        if (matchWordsPrefix(words, word_count, pattern5, 2)) {
            handleListSessions();
            return;
        }
        const char* pattern6[] = {"GET", "SESSION"};
        if (matchWordsPrefix(words, word_count, pattern6, 2)) {
            handleGetSession(reconstructArgs(words, word_count, 2, args));
            return;
        }
        const char* pattern7[] = {"GET", "STATUS"};
        if (matchWordsPrefix(words, word_count, pattern7, 2)) {
            handleGetStatus();
            return;
        }
        const char* pattern8[] = {"DELETE", "BREW"};
        if (matchWordsPrefix(words, word_count, pattern8, 2)) {
            handleDeleteBrew(reconstructArgs(words, word_count, 2, args));
            return;
        }
    }

    // Three-word commands
    if (word_count >= 3) {
        const char* pattern1[] = {"SET", "PILL", "NAME"};
        if (matchWordsPrefix(words, word_count, pattern1, 3)) {
            handleSetPillName(reconstructArgs(words, word_count, 3, args));
            return;
        }
    }

    // Command not found
    Serial.print("ERROR: Unknown command: ");
    for (int i = 0; i < word_count; i++) {
        if (i > 0) Serial.print(" ");
        Serial.print(words[i]);
    }
    Serial.println();
    printHelp();
}

// Update serial command handler (call in loop())
void serialCommandsUpdate() {
    while (Serial.available() > 0) {
        char c = Serial.read();

        // Handle newline (command complete)
        if (c == '\n' || c == '\r') {
            if (cmdBufferPos > 0) {
                cmdBuffer[cmdBufferPos] = '\0';
                processCommand(cmdBuffer);
                cmdBufferPos = 0;
            }
        }
        // Add character to buffer
        else if (cmdBufferPos < CMD_BUFFER_SIZE - 1) {
            cmdBuffer[cmdBufferPos++] = c;
        }
        // Buffer overflow - reset
        else {
            Serial.println("ERROR: Command too long");
            cmdBufferPos = 0;
        }
    }
}

#endif // ENABLE_SERIAL_COMMANDS
