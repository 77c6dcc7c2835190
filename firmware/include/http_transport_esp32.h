/**
 * PillBridge - ESP32 HTTP Transport
 * HttpTransport over the Arduino HTTPClient (TLS via WiFiClientSecure)
 */

#ifndef HTTP_TRANSPORT_ESP32_H
#define HTTP_TRANSPORT_ESP32_H

#include "http_transport.h"

// Stateless: each send() uses its own client, so one instance may be
// shared by all session tasks
class Esp32HttpTransport : public HttpTransport {
public:
    HttpResponse send(const HttpRequest& request) override;
};

#endif // HTTP_TRANSPORT_ESP32_H
