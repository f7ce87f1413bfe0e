#pragma once

#include "tracing/attribute_resolver.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace reqtrace {

// ============================================================================
// Configuration Types
// ============================================================================

struct ServerConfig {
    std::string host;
    uint16_t port;
    size_t thread_pool_size;

    ServerConfig()
        : host("0.0.0.0"),
          port(8080),
          thread_pool_size(4) {}
};

struct LoggingConfig {
    std::string level = "info";
};

struct TracingConfig {
    bool enabled = true;
    bool log_spans = true;                  // Export finished spans as JSON log lines
    size_t max_finished_spans = 1024;       // Ring size for GET /spans
    bool spans_endpoint = false;            // Expose GET /spans
    std::vector<AttributeSpec> attributes;  // Resolved per request, in order
};

} // namespace reqtrace
