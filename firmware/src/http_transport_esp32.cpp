/**
 * PillBridge - ESP32 HTTP Transport
 * Implementation
 */

#include "http_transport_esp32.h"
#include "config.h"
#include "pillbridge.h"

#include <Arduino.h>
#include <HTTPClient.h>
#include <WiFi.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>

static bool isHttps(const std::string& url) {
    return url.compare(0, 8, "https://") == 0;
}

HttpResponse Esp32HttpTransport::send(const HttpRequest& request) {
    HttpResponse response;
    response.status = HTTPC_ERROR_CONNECTION_REFUSED;

    if (WiFi.status() != WL_CONNECTED) {
        response.status = HTTPC_ERROR_NOT_CONNECTED;
        DEBUG_PRINTLN(g_debug_sync, "HTTP: WiFi not connected");
        return response;
    }

    HTTPClient http;
    WiFiClientSecure secure_client;
    WiFiClient plain_client;

    // MeadTools certificate is not pinned
    bool began;
    if (isHttps(request.url)) {
        secure_client.setInsecure();
        began = http.begin(secure_client, request.url.c_str());
    } else {
        began = http.begin(plain_client, request.url.c_str());
    }
    if (!began) {
        Serial.printf("HTTP: Invalid URL %s\n", request.url.c_str());
        return response;
    }

    http.setConnectTimeout(request.timeout_ms);
    http.setTimeout(request.timeout_ms);
    http.addHeader("User-Agent", "PillBridge/" PILLBRIDGE_VERSION);
    if (!request.bearer_token.empty()) {
        http.addHeader("Authorization", String("Bearer ") + request.bearer_token.c_str());
    }

    uint8_t* body = (uint8_t*)request.body.data();
    size_t body_len = request.body.size();
    if (body_len > 0) {
        http.addHeader("Content-Type", "application/json");
    }

    int code;
    switch (request.method) {
        case HttpMethod::Get:
            code = http.GET();
            break;
        case HttpMethod::Post:
            code = http.POST(body, body_len);
            break;
        case HttpMethod::Patch:
            code = http.PATCH(body, body_len);
            break;
        case HttpMethod::Delete:
            code = http.sendRequest("DELETE", body, body_len);
            break;
        default:
            code = HTTPC_ERROR_CONNECTION_REFUSED;
            break;
    }

    response.status = code;
    if (code > 0) {
        response.body = http.getString().c_str();
    } else {
        DEBUG_PRINTF(g_debug_sync, "HTTP: %s failed: %s\n", httpMethodName(request.method),
                     HTTPClient::errorToString(code).c_str());
    }
    http.end();

    return response;
}
