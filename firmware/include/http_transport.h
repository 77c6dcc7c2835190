/**
 * PillBridge - HTTP Transport Interface
 * Request/response seam between the MeadTools client and the network stack
 */

#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include <stdint.h>
#include <string>

enum class HttpMethod {
    Get,
    Post,
    Patch,
    Delete,
};

struct HttpRequest {
    HttpMethod method;
    std::string url;
    std::string bearer_token;   // Empty = no Authorization header
    std::string body;           // JSON, empty = no body
    uint32_t timeout_ms;
};

struct HttpResponse {
    int status;                 // HTTP status code, <= 0 on transport failure
    std::string body;
};

// Blocking HTTP transport (one request at a time per instance)
class HttpTransport {
public:
    virtual ~HttpTransport() {}

    // Perform the request; never throws, failures are reported via status <= 0
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

const char* httpMethodName(HttpMethod method);

#endif // HTTP_TRANSPORT_H
