#undef NDEBUG
#include "session_registry.h"
#include "test_support.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

const char* const kMacA = "78:E3:6D:29:0A:12";
const char* const kMacB = "78:E3:6D:29:0B:34";

MeadToolsSettings localSettings() {
  MeadToolsSettings settings;
  settings.sync_enabled = false;
  return settings;
}

ManufacturerData pillAdvert(float gravity_times_1000) {
  ManufacturerData data;
  data[PILL_VENDOR_ID] = test::gravityPayload(gravity_times_1000);
  return data;
}

void countIdentity(const RemoteIdentity& identity, void* ctx) {
  (void)identity;
  int* counter = static_cast<int*>(ctx);
  (*counter)++;
}

void test_add_assigns_lowest_free_slot() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 3);

  SessionHandle a = SESSION_HANDLE_INVALID;
  SessionHandle b = SESSION_HANDLE_INVALID;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.add(test::pillConfig(kMacB, "Cyser"), b) == REGISTRY_OK);
  assert(a == 1);
  assert(b == 2);
  assert(runner.attached.size() == 2);
  assert(registry.capacity() == 3);

  assert(registry.remove(a) == REGISTRY_OK);
  assert(runner.attached.size() == 1);

  SessionHandle c = SESSION_HANDLE_INVALID;
  assert(registry.add(test::pillConfig(kMacA, "Braggot"), c) == REGISTRY_OK);
  assert(c == 1);

  std::vector<SessionHandle> handles = registry.handles();
  assert(handles.size() == 2);
  assert(handles[0] == 1);
  assert(handles[1] == 2);
}

void test_duplicate_and_full() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);

  SessionHandle handle;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), handle) == REGISTRY_OK);
  // Same Pill, different case
  assert(registry.add(test::pillConfig("78:e3:6d:29:0a:12", "Other"), handle) == REGISTRY_DUPLICATE);
  assert(registry.add(test::pillConfig(kMacB, "Cyser"), handle) == REGISTRY_OK);
  assert(registry.add(test::pillConfig("78:E3:6D:29:0C:56", "Third"), handle) == REGISTRY_FULL);
}

void test_add_at_restores_slot() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 4);

  assert(registry.addAt(3, test::pillConfig(kMacA, "Melomel")) == REGISTRY_OK);
  assert(registry.addAt(3, test::pillConfig(kMacB, "Cyser")) == REGISTRY_BUSY);
  assert(registry.addAt(5, test::pillConfig(kMacB, "Cyser")) == REGISTRY_NOT_FOUND);
  assert(registry.addAt(SESSION_HANDLE_INVALID, test::pillConfig(kMacB, "Cyser")) == REGISTRY_NOT_FOUND);

  SessionSnapshot snap;
  assert(registry.snapshot(3, snap));
  assert(snap.config.brew_name == "Melomel");
  assert(snap.state == SESSION_CREATED);
  assert(!registry.snapshot(1, snap));
}

void test_worker_failure_leaves_slot_free() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  runner.fail_attach = true;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);

  SessionHandle handle = SESSION_HANDLE_INVALID;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), handle) == REGISTRY_WORKER_FAILED);
  assert(handle == SESSION_HANDLE_INVALID);
  assert(registry.handles().empty());
}

void test_unknown_handles_not_found() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);

  assert(registry.start(1) == REGISTRY_NOT_FOUND);
  assert(registry.stop(2) == REGISTRY_NOT_FOUND);
  assert(registry.remove(9) == REGISTRY_NOT_FOUND);
  assert(registry.updateConfig(1, test::pillConfig(kMacA, "Melomel")) == REGISTRY_NOT_FOUND);
  assert(std::string(registryStatusName(REGISTRY_NOT_FOUND)) == "NOT_FOUND");
}

void test_advertisements_routed_to_running_session() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  SessionHandle b;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.add(test::pillConfig(kMacB, "Cyser"), b) == REGISTRY_OK);

  // Not running yet
  assert(!registry.onAdvertisement(kMacA, pillAdvert(1050.0f)));

  assert(registry.start(a) == REGISTRY_OK);
  assert(runner.runPending() == 1);

  // Address match is case-insensitive
  assert(registry.onAdvertisement("78:e3:6d:29:0a:12", pillAdvert(1050.0f)));
  assert(!registry.onAdvertisement(kMacB, pillAdvert(1040.0f)));
  assert(!registry.onAdvertisement("AA:BB:CC:DD:EE:FF", pillAdvert(1040.0f)));
  assert(runner.runPending() == 1);

  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.state == SESSION_RUNNING);
  assert(!snap.remote_sync);
  assert(snap.telemetry.valid);
  assert(std::fabs(snap.telemetry.current_gravity - 1.05) < 1e-9);

  assert(registry.snapshot(b, snap));
  assert(!snap.telemetry.valid);
  assert(http.requests.empty());
}

void test_non_pill_advertisements_ignored() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 1);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();

  ManufacturerData sentinel;
  sentinel[PILL_VENDOR_ID] = PILL_SENTINEL_PAYLOAD;
  assert(!registry.onAdvertisement(kMacA, sentinel));

  ManufacturerData other;
  other[0x0059] = test::gravityPayload(1050.0f);
  assert(!registry.onAdvertisement(kMacA, other));
  assert(runner.pending() == 0);
}

void test_malformed_payload_counted_by_session() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 1);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();

  ManufacturerData shortData;
  shortData[PILL_VENDOR_ID] = std::string("PT\x02short", 8);
  assert(registry.onAdvertisement(kMacA, shortData));
  runner.runPending();

  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.decode_failures == 1);
  assert(!snap.telemetry.valid);
}

void test_queue_full_drops_advertisement() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 1);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();

  runner.queue_limit = 1;
  assert(registry.onAdvertisement(kMacA, pillAdvert(1050.0f)));
  assert(!registry.onAdvertisement(kMacA, pillAdvert(1049.0f)));
  assert(registry.stop(a) == REGISTRY_QUEUE_FULL);
  runner.runPending();
}

void test_stop_jumps_ahead_of_queued_advertisements() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 1);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();

  assert(registry.onAdvertisement(kMacA, pillAdvert(1050.0f)));
  assert(registry.stop(a) == REGISTRY_OK);
  runner.runPending();

  // The queued advertisement ran after the stop and was ignored
  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.state == SESSION_STOPPED);
  assert(snap.advertisements == 0);
}

void test_stop_cancels_queued_start() {
  test::FakeHttpTransport http;
  test::scriptHappyStart(http);
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 1);
  registry.setSyncSettings(test::syncSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  assert(registry.stop(a) == REGISTRY_OK);
  assert(runner.runPending() == 2);

  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.state == SESSION_STOPPED);
  assert(!registry.anyListening(0));
  assert(http.requests.empty());
  assert(!registry.onAdvertisement(kMacA, pillAdvert(1050.0f)));

  // Starting again after the cancelled start works normally
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();
  assert(registry.snapshot(a, snap));
  assert(snap.state == SESSION_RUNNING);
  assert(snap.remote_sync);
}

void test_sessions_share_one_device_token() {
  test::FakeHttpTransport http;
  test::scriptHappyStart(http);
  http.on(HttpMethod::Post, "/auth/refresh", 200, "{\"accessToken\":\"acc-2\"}");
  http.on(HttpMethod::Post, "/hydrometer/token", 200, "{\"token\":\"minted\"}");
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);
  MeadToolsSettings settings = test::syncSettings();
  settings.device_token.clear();
  registry.setSyncSettings(settings);

  SessionHandle a;
  SessionHandle b;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.add(test::pillConfig(kMacB, "Cyser"), b) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  assert(registry.start(b) == REGISTRY_OK);
  runner.runPending();

  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.state == SESSION_RUNNING && snap.remote_sync);
  assert(registry.snapshot(b, snap));
  assert(snap.state == SESSION_RUNNING && snap.remote_sync);

  // The second start reused the first one's login and device token
  assert(http.count(HttpMethod::Post, "/hydrometer/token") == 1);
  assert(http.count(HttpMethod::Post, "/auth/login") == 1);
  assert(http.count(HttpMethod::Post, "/auth/refresh") == 1);
  assert(http.last(HttpMethod::Get, "/hydrometer")->bearer_token == "acc-2");
  assert(registry.account().settings().device_token == "minted");

  assert(registry.onAdvertisement(kMacA, pillAdvert(1050.0f)));
  assert(registry.onAdvertisement(kMacB, pillAdvert(1040.0f)));
  runner.runPending();
  size_t published = 0;
  for (size_t i = 0; i < http.requests.size(); i++) {
    const HttpRequest& request = http.requests[i];
    if (request.method == HttpMethod::Post && request.url == std::string(test::kBaseUrl) + "/hydrometer/rapt-pill") {
      assert(request.body.find("\"token\":\"minted\"") != std::string::npos);
      published++;
    }
  }
  assert(published == 2);
}

void test_remove_requires_stopped_session() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();

  assert(registry.remove(a) == REGISTRY_BUSY);
  SessionConfig renamed = test::pillConfig(kMacA, "Melomel");
  renamed.pill_name = "Cellar";
  assert(registry.updateConfig(a, renamed) == REGISTRY_BUSY);

  assert(registry.stop(a) == REGISTRY_OK);
  runner.runPending();
  assert(registry.updateConfig(a, renamed) == REGISTRY_OK);
  assert(registry.remove(a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_NOT_FOUND);
  assert(runner.attached.empty());

  SessionSnapshot snap;
  assert(!registry.snapshot(a, snap));
}

void test_update_config_rejects_tracked_address() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);

  SessionHandle a;
  SessionHandle b;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.add(test::pillConfig(kMacB, "Cyser"), b) == REGISTRY_OK);

  assert(registry.updateConfig(b, test::pillConfig(kMacA, "Cyser")) == REGISTRY_DUPLICATE);
  assert(registry.updateConfig(a, test::pillConfig(kMacA, "Melomel 2")) == REGISTRY_OK);

  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.config.brew_name == "Melomel 2");
}

void test_any_listening_follows_running_sessions() {
  test::FakeHttpTransport http;
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 2);
  registry.setSyncSettings(localSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(!registry.anyListening(0));

  test::nowMs() = 20000;
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();
  assert(registry.anyListening(21000));
  assert(!registry.anyListening(26000));
  assert(registry.anyListening(35000));
}

void test_start_uses_current_sync_settings() {
  test::FakeHttpTransport http;
  test::scriptHappyStart(http);
  test::ManualSessionRunner runner;
  SessionRegistry registry(http, runner, test::fakeClock(), 1);
  int identity_calls = 0;
  registry.setIdentityCallback(countIdentity, &identity_calls);
  registry.setSyncSettings(test::syncSettings());

  SessionHandle a;
  assert(registry.add(test::pillConfig(kMacA, "Melomel"), a) == REGISTRY_OK);
  assert(registry.start(a) == REGISTRY_OK);
  runner.runPending();

  SessionSnapshot snap;
  assert(registry.snapshot(a, snap));
  assert(snap.state == SESSION_RUNNING);
  assert(snap.remote_sync);
  assert(snap.brew_id == "42");
  // Login stored new tokens
  assert(identity_calls >= 1);

  assert(registry.stop(a) == REGISTRY_OK);
  runner.runPending();
  assert(http.count(HttpMethod::Patch, "/hydrometer/brew") == 1);
}

}  // namespace

int main() {
  test_add_assigns_lowest_free_slot();
  test_duplicate_and_full();
  test_add_at_restores_slot();
  test_worker_failure_leaves_slot_free();
  test_unknown_handles_not_found();
  test_advertisements_routed_to_running_session();
  test_non_pill_advertisements_ignored();
  test_malformed_payload_counted_by_session();
  test_queue_full_drops_advertisement();
  test_stop_jumps_ahead_of_queued_advertisements();
  test_stop_cancels_queued_start();
  test_sessions_share_one_device_token();
  test_remove_requires_stopped_session();
  test_update_config_rejects_tracked_address();
  test_any_listening_follows_running_sessions();
  test_start_uses_current_sync_settings();
  std::cout << "All tests passed\n";
  return 0;
}
