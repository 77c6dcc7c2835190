#undef NDEBUG
#include "meadtools_client.h"
#include "status_log.h"
#include "test_support.h"

#include <ArduinoJson.h>

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace {

int g_identity_calls = 0;
RemoteIdentity g_last_identity;

void recordIdentity(const RemoteIdentity& identity, void* ctx) {
  (void)ctx;
  g_identity_calls++;
  g_last_identity = identity;
}

JsonDocument parseBody(const HttpRequest* request) {
  assert(request != nullptr);
  JsonDocument doc;
  DeserializationError error = deserializeJson(doc, request->body);
  assert(!error);
  return doc;
}

void test_login_stores_tokens_and_reports_identity() {
  test::FakeHttpTransport http;
  test::scriptLogin(http);
  MeadToolsClient client(http);
  client.configure(test::syncSettings());
  client.setIdentityCallback(recordIdentity, nullptr);
  g_identity_calls = 0;

  SyncResult result = client.login("brewer@example.com", "hunter2");
  assert(result.ok());
  assert(result.http_status == 200);
  assert(client.isLoggedIn());
  assert(client.identity().access_token == "acc-1");
  assert(client.identity().refresh_token == "ref-1");
  assert(g_identity_calls == 1);
  assert(g_last_identity.access_token == "acc-1");

  // Trailing slash of the base URL is dropped
  const HttpRequest* request = http.last(HttpMethod::Post, "/auth/login");
  assert(request != nullptr);
  assert(request->url == "https://mt.test/api/auth/login");
  assert(request->bearer_token.empty());
  JsonDocument body = parseBody(request);
  assert(std::string(body["email"] | "") == "brewer@example.com");
  assert(std::string(body["password"] | "") == "hunter2");
}

void test_login_rejected_is_auth_error() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Post, "/auth/login", 401, "{\"error\":\"bad\"}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  SyncResult result = client.login("brewer@example.com", "wrong");
  assert(result.status == SYNC_AUTH_ERROR);
  assert(result.http_status == 401);
  assert(!client.isLoggedIn());
  assert(client.identity().access_token.empty());
}

void test_login_transport_failure_is_unavailable() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Post, "/auth/login", -1, "");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  SyncResult result = client.login("brewer@example.com", "hunter2");
  assert(result.status == SYNC_REMOTE_UNAVAILABLE);
}

void test_ensure_logged_in_prefers_refresh() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Post, "/auth/refresh", 200, "{\"accessToken\":\"acc-2\"}");
  MeadToolsSettings settings = test::syncSettings();
  settings.access_token = "acc-old";
  settings.refresh_token = "ref-1";
  MeadToolsClient client(http);
  client.configure(settings);

  assert(client.ensureLoggedIn().ok());
  assert(client.identity().access_token == "acc-2");
  assert(client.identity().refresh_token == "ref-1");
  assert(http.count(HttpMethod::Post, "/auth/login") == 0);

  JsonDocument body = parseBody(http.last(HttpMethod::Post, "/auth/refresh"));
  assert(std::string(body["refreshToken"] | "") == "ref-1");
}

void test_ensure_logged_in_falls_back_to_login() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Post, "/auth/refresh", 401, "");
  test::scriptLogin(http);
  MeadToolsSettings settings = test::syncSettings();
  settings.access_token = "acc-old";
  settings.refresh_token = "ref-old";
  MeadToolsClient client(http);
  client.configure(settings);

  assert(client.ensureLoggedIn().ok());
  assert(client.identity().access_token == "acc-1");
  assert(http.count(HttpMethod::Post, "/auth/login") == 1);
}

void test_ensure_logged_in_uses_oauth_token() {
  test::FakeHttpTransport http;
  MeadToolsSettings settings = test::syncSettings();
  settings.email.clear();
  settings.password.clear();
  settings.oauth_token = "oauth-bearer";
  MeadToolsClient client(http);
  client.configure(settings);

  assert(client.ensureLoggedIn().ok());
  assert(client.identity().access_token == "oauth-bearer");
  assert(http.requests.empty());
}

void test_ensure_logged_in_without_credentials() {
  test::FakeHttpTransport http;
  MeadToolsSettings settings = test::syncSettings();
  settings.password.clear();
  MeadToolsClient client(http);
  client.configure(settings);

  assert(client.ensureLoggedIn().status == SYNC_NOT_CONFIGURED);
  assert(http.requests.empty());
  assert(!statusLastMessage().empty());
}

void test_device_token_generated_when_missing() {
  test::FakeHttpTransport http;
  test::scriptLogin(http);
  http.on(HttpMethod::Post, "/hydrometer/token", 200, "{\"token\":\"fresh-token\"}");
  MeadToolsSettings settings = test::syncSettings();
  settings.device_token.clear();
  MeadToolsClient client(http);
  client.configure(settings);
  client.setIdentityCallback(recordIdentity, nullptr);

  assert(client.ensureLoggedIn().ok());
  g_identity_calls = 0;
  assert(client.ensureDeviceToken().ok());
  assert(client.identity().device_token == "fresh-token");
  assert(g_identity_calls == 1);
  assert(g_last_identity.device_token == "fresh-token");
  assert(http.last(HttpMethod::Post, "/hydrometer/token")->bearer_token == "acc-1");

  // Existing token: no request
  assert(client.ensureDeviceToken().ok());
  assert(http.count(HttpMethod::Post, "/hydrometer/token") == 1);
}

void test_resolve_hydrometer_adopts_existing() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 200,
          "{\"devices\":[{\"id\":3,\"device_name\":\"Other\"},{\"id\":7,\"device_name\":\"Pill-A\"}]}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.resolveHydrometer("Pill-A").ok());
  assert(client.identity().hydrometer_id == "7");
  assert(http.count(HttpMethod::Post, "/hydrometer/rapt-pill/register") == 0);
}

void test_resolve_hydrometer_registers_missing() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 200, "{\"devices\":[]}");
  http.on(HttpMethod::Post, "/hydrometer/rapt-pill/register", 200, "{\"id\":\"h-9\"}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.resolveHydrometer("Pill-B").ok());
  assert(client.identity().hydrometer_id == "h-9");

  const HttpRequest* request = http.last(HttpMethod::Post, "/hydrometer/rapt-pill/register");
  assert(request->bearer_token.empty());
  JsonDocument body = parseBody(request);
  assert(std::string(body["token"] | "") == "dev-token");
  assert(std::string(body["name"] | "") == "Pill-B");
}

void test_resolve_hydrometer_unexpected_shape_registers() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 200, "{\"devices\":\"none\"}");
  http.on(HttpMethod::Post, "/hydrometer/rapt-pill/register", 200, "{\"id\":11}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.resolveHydrometer("Pill-A").ok());
  assert(client.identity().hydrometer_id == "11");
}

void test_resolve_hydrometer_list_failure_is_fatal() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 500, "");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  SyncResult result = client.resolveHydrometer("Pill-A");
  assert(result.status == SYNC_REMOTE_UNAVAILABLE);
  assert(result.http_status == 500);
  assert(http.count(HttpMethod::Post, "/hydrometer/rapt-pill/register") == 0);
  assert(client.identity().hydrometer_id.empty());
}

void test_registration_without_id_is_conflict() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 200, "{\"devices\":[]}");
  http.on(HttpMethod::Post, "/hydrometer/rapt-pill/register", 200, "{\"ok\":true}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.resolveHydrometer("Pill-A").status == SYNC_REGISTRATION_CONFLICT);
}

void test_resolve_brew_is_idempotent() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 200, "{\"devices\":[{\"id\":7,\"device_name\":\"Pill-A\"}]}");
  http.on(HttpMethod::Get, "/hydrometer/brew", 200,
          "[{\"id\":40,\"name\":\"Melomel\",\"end_date\":\"2024-01-02\"},"
          "{\"id\":41,\"name\":\"Melomel\",\"end_date\":null}]");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());
  assert(client.resolveHydrometer("Pill-A").ok());

  assert(client.resolveBrew("Melomel", SESSION_RECIPE_UNSET).ok());
  assert(client.identity().brew_id == "41");
  assert(client.resolveBrew("Melomel", SESSION_RECIPE_UNSET).ok());
  assert(client.identity().brew_id == "41");

  assert(http.count(HttpMethod::Post, "/hydrometer/brew") == 0);
  assert(http.count(HttpMethod::Patch, "/hydrometer/brew/41") == 0);
}

void test_resolve_brew_registers_and_links_recipe() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer", 200, "{\"devices\":[{\"id\":7,\"device_name\":\"Pill-A\"}]}");
  // Ended brew of the same name is not reused; brew_name is accepted as the name field
  http.on(HttpMethod::Get, "/hydrometer/brew", 200,
          "[{\"id\":40,\"brew_name\":\"Cyser\",\"end_date\":\"2024-01-02\"}]");
  http.on(HttpMethod::Post, "/hydrometer/brew", 200, "[{\"id\":55,\"name\":\"Cyser\"}]");
  http.on(HttpMethod::Patch, "/hydrometer/brew/55", 200, "{}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());
  assert(client.resolveHydrometer("Pill-A").ok());

  assert(client.resolveBrew("Cyser", 1234).ok());
  assert(client.identity().brew_id == "55");

  JsonDocument reg = parseBody(http.last(HttpMethod::Post, "/hydrometer/brew"));
  assert(reg["device_id"].as<long>() == 7);
  assert(std::string(reg["brew_name"] | "") == "Cyser");

  JsonDocument link = parseBody(http.last(HttpMethod::Patch, "/hydrometer/brew/55"));
  assert(link["recipe_id"].as<long>() == 1234);
}

void test_resolve_brew_requires_hydrometer() {
  test::FakeHttpTransport http;
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.resolveBrew("Melomel", SESSION_RECIPE_UNSET).status == SYNC_NOT_CONFIGURED);
  assert(http.requests.empty());
}

void test_end_brew_uses_bounded_timeout() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Patch, "/hydrometer/brew", 200, "{}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.endBrew("7", "42").ok());
  const HttpRequest* request = http.last(HttpMethod::Patch, "/hydrometer/brew");
  assert(request->timeout_ms == MT_END_BREW_TIMEOUT_MS);
  JsonDocument body = parseBody(request);
  assert(body["device_id"].as<long>() == 7);
  assert(body["brew_id"].as<long>() == 42);

  assert(client.endBrew("", "42").status == SYNC_NOT_CONFIGURED);
}

void test_delete_brew_refuses_ongoing_and_unknown() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Get, "/hydrometer/brew", 200,
          "[{\"id\":40,\"name\":\"Old\",\"end_date\":\"2024-01-02\"},"
          "{\"id\":41,\"name\":\"Current\",\"end_date\":null}]");
  http.on(HttpMethod::Delete, "/hydrometer/brew/40", 200, "{}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.deleteBrew("41").status == SYNC_REFUSED);
  assert(client.deleteBrew("99").status == SYNC_REFUSED);
  assert(http.count(HttpMethod::Delete, "/hydrometer/brew/41") == 0);

  assert(client.deleteBrew("40").ok());
  assert(http.count(HttpMethod::Delete, "/hydrometer/brew/40") == 1);
}

void test_publish_data_point_body() {
  test::FakeHttpTransport http;
  http.on(HttpMethod::Post, "/hydrometer/rapt-pill", 200, "{}");
  MeadToolsClient client(http);
  client.configure(test::syncSettings());

  assert(client.publishDataPoint("dev-token", "Pill-A", 1.0421, 68.5, false, 87).ok());
  const HttpRequest* request = http.last(HttpMethod::Post, "/hydrometer/rapt-pill");
  assert(request->bearer_token.empty());
  JsonDocument body = parseBody(request);
  assert(std::string(body["token"] | "") == "dev-token");
  assert(std::string(body["name"] | "") == "Pill-A");
  assert(std::fabs(body["gravity"].as<double>() - 1.0421) < 1e-6);
  assert(std::fabs(body["temperature"].as<double>() - 68.5) < 1e-6);
  assert(std::string(body["temp_units"] | "") == "F");
  assert(body["battery"].as<int>() == 87);

  http.clear();
  http.on(HttpMethod::Post, "/hydrometer/rapt-pill", 503, "");
  SyncResult result = client.publishDataPoint("dev-token", "Pill-A", 1.0, 20.0, true, 50);
  assert(result.status == SYNC_REMOTE_UNAVAILABLE);
  assert(result.http_status == 503);
}

void test_account_hands_shared_tokens_to_sessions() {
  test::FakeHttpTransport http;
  test::scriptLogin(http);
  http.on(HttpMethod::Post, "/hydrometer/token", 200, "{\"token\":\"minted\"}");
  MeadToolsAccount account(http);
  MeadToolsSettings settings = test::syncSettings();
  settings.device_token.clear();
  account.configure(settings);
  account.setIdentityCallback(recordIdentity, nullptr);
  g_identity_calls = 0;

  assert(account.ensureLoggedIn().ok());
  assert(account.ensureDeviceToken().ok());
  assert(account.ensureDeviceToken().ok());
  assert(http.count(HttpMethod::Post, "/hydrometer/token") == 1);
  assert(g_identity_calls == 2);
  assert(g_last_identity.device_token == "minted");

  MeadToolsSettings current = account.settings();
  assert(current.base_url == "https://mt.test/api");
  assert(current.device_token == "minted");
  assert(current.access_token == "acc-1");
  assert(current.refresh_token == "ref-1");

  MeadToolsClient session(http);
  account.applyTo(session);
  assert(session.identity().device_token == "minted");
  assert(session.identity().access_token == "acc-1");

  // Reconfiguring replaces the tokens
  account.configure(test::syncSettings());
  assert(account.settings().device_token == "dev-token");
  assert(account.settings().access_token.empty());
}

}  // namespace

int main() {
  test_login_stores_tokens_and_reports_identity();
  test_login_rejected_is_auth_error();
  test_login_transport_failure_is_unavailable();
  test_ensure_logged_in_prefers_refresh();
  test_ensure_logged_in_falls_back_to_login();
  test_ensure_logged_in_uses_oauth_token();
  test_ensure_logged_in_without_credentials();
  test_device_token_generated_when_missing();
  test_resolve_hydrometer_adopts_existing();
  test_resolve_hydrometer_registers_missing();
  test_resolve_hydrometer_unexpected_shape_registers();
  test_resolve_hydrometer_list_failure_is_fatal();
  test_registration_without_id_is_conflict();
  test_resolve_brew_is_idempotent();
  test_resolve_brew_registers_and_links_recipe();
  test_resolve_brew_requires_hydrometer();
  test_end_brew_uses_bounded_timeout();
  test_delete_brew_refuses_ongoing_and_unknown();
  test_publish_data_point_body();
  test_account_hands_shared_tokens_to_sessions();
  std::cout << "All tests passed\n";
  return 0;
}
