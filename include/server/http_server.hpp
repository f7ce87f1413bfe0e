#pragma once

#include "core/pipeline.hpp"
#include "config/config_types.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace reqtrace {

class LocalSpanBackend;

/**
 * @brief HTTP front end: every route runs through the Pipeline
 *
 * Each httplib request is converted to a RequestContext, executed through
 * the pipeline (tracing first), and the resulting status, headers and body
 * are copied back. A handler exception becomes a 500 JSON error after the
 * pipeline has finished the request's span. Requests matching no route are
 * answered 404 by a catch-all route, so they are traced as well.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<Pipeline> pipeline, ServerConfig config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Register a route; must be called before start()
     * @param method GET, POST, PUT, PATCH or DELETE
     * @throws std::invalid_argument on an unsupported method
     */
    void route(const std::string& method, const std::string& pattern, Handler handler);

    /// Expose GET /spans backed by this backend's recent finished spans
    void enable_spans_endpoint(std::shared_ptr<LocalSpanBackend> backend);

    /// Blocks until stop() is called
    void start();
    void stop();

    /// Block until start() is listening; false if listening failed
    bool wait_until_ready() const;

    /// Fallback for paths no route matches: 404 JSON body
    static void not_found(RequestContext& ctx);

    /// Copy an httplib request into a fresh context
    static void to_request_context(const httplib::Request& req, RequestContext& ctx);

    /// Copy the context's response fields into an httplib response
    static void apply_response(const RequestContext& ctx, httplib::Response& res);

    struct HttpStats {
        uint64_t requests_handled;
        uint64_t handler_errors;
    };

    [[nodiscard]] HttpStats get_http_stats() const {
        return {
            requests_handled_.load(std::memory_order_relaxed),
            handler_errors_.load(std::memory_order_relaxed),
        };
    }

private:
    // ── Route registration (called from start()) ────────────────────────
    void register_builtin_routes();

    // ── Handlers ────────────────────────────────────────────────────────
    void dispatch(const httplib::Request& req, httplib::Response& res, const Handler& handler);
    void handle_health(RequestContext& ctx);
    void handle_spans(RequestContext& ctx);

    // ── Members ─────────────────────────────────────────────────────────
    std::shared_ptr<Pipeline> pipeline_;
    const ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
    std::shared_ptr<LocalSpanBackend> span_backend_;

    std::atomic<uint64_t> requests_handled_{0};
    std::atomic<uint64_t> handler_errors_{0};
};

} // namespace reqtrace
