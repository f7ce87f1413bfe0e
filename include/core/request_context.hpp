#pragma once

#include "core/utils.hpp"
#include "tracing/trace_context.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reqtrace {

struct HeaderField {
    std::string name;
    std::string value;
};

/// Ordered header list; lookups are case-insensitive on the name
using Headers = std::vector<HeaderField>;

struct RequestContext;

/// Runs after the response is determined, before it is written to the client
using BeforeSendCallback = std::function<void(RequestContext&)>;

/**
 * @brief Request context - carries one HTTP exchange through the pipeline
 *
 * The pipeline owns it. Stages read the request fields, append response
 * headers and register before-send callbacks; the handler fills in the
 * response.
 */
struct RequestContext {
    // Input
    std::string request_id;
    std::string method;
    std::string path;           // No query string, no host
    std::string query_string;   // Without leading '?'
    std::string host;
    std::string remote_addr;
    Headers request_headers;
    std::unordered_map<std::string, std::string> query_params;

    // Output
    int status = 200;
    std::string body;
    std::string content_type;
    Headers response_headers;

    // Distributed tracing (W3C Trace Context)
    TraceContext trace_context;                 // Context of the span serving this request
    std::optional<TraceContext> parent_context; // Decoded from the inbound header, if any

    // Timestamps
    std::chrono::system_clock::time_point received_at;
    std::chrono::steady_clock::time_point started_at;

    RequestContext()
        : request_id(utils::generate_uuid()),
          received_at(std::chrono::system_clock::now()),
          started_at(std::chrono::steady_clock::now()) {}

    RequestContext(const RequestContext&) = delete;
    RequestContext& operator=(const RequestContext&) = delete;

    /// All values of a request header, in arrival order
    [[nodiscard]] std::vector<std::string> get_req_header(std::string_view name) const;

    /// First value of a request header
    [[nodiscard]] std::optional<std::string> req_header(std::string_view name) const;

    void add_req_header(std::string name, std::string value);

    /**
     * @brief Set a response header, replacing every existing value whose name
     * matches case-insensitively. The name is stored lower-case.
     */
    void put_resp_header(std::string_view name, std::string value);

    [[nodiscard]] std::optional<std::string> resp_header(std::string_view name) const;
    [[nodiscard]] size_t resp_header_count(std::string_view name) const;

    /**
     * @brief Register a callback to run once the response is ready.
     * Callbacks run in reverse registration order.
     */
    void register_before_send(BeforeSendCallback callback);

    /**
     * @brief Run and discard all registered before-send callbacks.
     *
     * Safe to call more than once; callbacks run at most once. A throwing
     * callback is logged and the remaining callbacks still run.
     */
    void run_before_send() noexcept;

    [[nodiscard]] size_t pending_before_send() const { return before_send_.size(); }

private:
    std::vector<BeforeSendCallback> before_send_;
};

} // namespace reqtrace
