/**
 * PillBridge - HTTP Transport Interface
 * Shared helpers
 */

#include "http_transport.h"

const char* httpMethodName(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Patch:  return "PATCH";
        case HttpMethod::Delete: return "DELETE";
    }
    return "?";
}
