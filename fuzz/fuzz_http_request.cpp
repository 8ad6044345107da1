// Fuzz target for HTTP request parsing
// Tests ParseHttpRequest, UrlDecode and ParseQueryString
//
// The status server reads requests from anyone who can reach its port.
// Bugs in this code can:
// - Crash the daemon (out-of-range reads on truncated requests)
// - Accept a body longer than its Content-Length
// - Route requests to the wrong handler (bad percent-decoding)
//
// Target code:
// - src/network/status_server.cpp (ParseHttpRequest, UrlDecode, ParseQueryString)

#include "network/status_server.hpp"
#include <cstdint>
#include <cstddef>
#include <string>

using namespace lanwake::network;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size > MAX_HTTP_HEADER_SIZE + MAX_HTTP_BODY_SIZE) return 0;

    std::string raw(reinterpret_cast<const char*>(data), size);

    try {
        auto request = ParseHttpRequest(raw);
        if (request) {
            // CRITICAL: target always starts with '/', and so does the decoded path
            if (request->target.empty() || request->target[0] != '/') {
                __builtin_trap();
            }
            if (request->path.empty() || request->path[0] != '/') {
                __builtin_trap();
            }

            // CRITICAL: header names are lowercased
            for (const auto& [name, value] : request->headers) {
                for (char c : name) {
                    if (c >= 'A' && c <= 'Z') {
                        __builtin_trap();
                    }
                }
            }

            // Parsing must be deterministic
            auto again = ParseHttpRequest(raw);
            if (!again || again->body != request->body || again->path != request->path) {
                __builtin_trap();
            }
        }

        // UrlDecode never grows its input
        auto decoded = UrlDecode(raw);
        if (decoded && decoded->size() > raw.size()) {
            __builtin_trap();
        }

        for (const auto& [key, value] : ParseQueryString(raw)) {
            if (key.empty()) {
                __builtin_trap();
            }
        }
    } catch (...) {
        // Parsers return nullopt on malformed input and never throw
        __builtin_trap();
    }

    return 0;
}
