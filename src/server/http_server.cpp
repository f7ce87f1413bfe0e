#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "tracing/local_span_backend.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; suppress its internal deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <nlohmann/json.hpp>

#include <format>
#include <stdexcept>
#include <string_view>

namespace reqtrace {

// ============================================================================
// Anonymous namespace helpers
// ============================================================================

namespace {

std::string json_error(std::string_view error, std::string_view message) {
    nlohmann::json j;
    j["error"] = error;
    j["message"] = message;
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // anonymous namespace

// ============================================================================
// HttpServer
// ============================================================================

HttpServer::HttpServer(std::shared_ptr<Pipeline> pipeline, ServerConfig config)
    : pipeline_(std::move(pipeline)),
      config_(std::move(config)),
      server_(std::make_unique<httplib::Server>()) {
    if (!pipeline_) {
        throw std::invalid_argument("HttpServer requires a pipeline");
    }

    // Configure thread pool size for high throughput
    const size_t pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };
}

HttpServer::~HttpServer() = default;

void HttpServer::route(const std::string& method, const std::string& pattern, Handler handler) {
    auto fn = [this, handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
        dispatch(req, res, handler);
    };

    const std::string m = utils::to_lower(method);
    if (m == "get") {
        server_->Get(pattern, std::move(fn));
    } else if (m == "post") {
        server_->Post(pattern, std::move(fn));
    } else if (m == "put") {
        server_->Put(pattern, std::move(fn));
    } else if (m == "patch") {
        server_->Patch(pattern, std::move(fn));
    } else if (m == "delete") {
        server_->Delete(pattern, std::move(fn));
    } else {
        throw std::invalid_argument(std::format("Unsupported HTTP method: {}", method));
    }
}

void HttpServer::enable_spans_endpoint(std::shared_ptr<LocalSpanBackend> backend) {
    span_backend_ = std::move(backend);
}

void HttpServer::start() {
    register_builtin_routes();

    utils::log::info(std::format("Starting reqtrace server on {}:{} ({} threads)",
        config_.host, config_.port, config_.thread_pool_size));

    if (!server_->listen(config_.host, config_.port)) {
        throw std::runtime_error("Failed to start HTTP server");
    }
}

bool HttpServer::wait_until_ready() const {
    server_->wait_until_ready();
    return server_->is_running();
}

void HttpServer::stop() {
    server_->stop();
    utils::log::info("Server stopped");
}

// ============================================================================
// Route registration
// ============================================================================

void HttpServer::register_builtin_routes() {
    route("GET", std::string(http::kHealthPath), [this](RequestContext& ctx) {
        handle_health(ctx);
    });
    if (span_backend_) {
        route("GET", std::string(http::kSpansPath), [this](RequestContext& ctx) {
            handle_spans(ctx);
        });
    }

    // Last, so it only matches what no other route claimed; unmatched
    // requests still run through the pipeline and get traced
    for (const char* method : {"GET", "POST", "PUT", "PATCH", "DELETE"}) {
        route(method, std::string(http::kCatchAllPattern), &HttpServer::not_found);
    }
}

// ============================================================================
// Request conversion
// ============================================================================

void HttpServer::to_request_context(const httplib::Request& req, RequestContext& ctx) {
    ctx.method = req.method;
    ctx.path = req.path;
    ctx.remote_addr = req.remote_addr;
    ctx.host = req.get_header_value(http::kHostHeader);

    const auto q = req.target.find('?');
    if (q != std::string::npos) {
        ctx.query_string = req.target.substr(q + 1);
    }

    for (const auto& [name, value] : req.headers) {
        ctx.add_req_header(name, value);
    }
    for (const auto& [name, value] : req.params) {
        ctx.query_params.emplace(name, value);  // First value wins
    }
}

void HttpServer::apply_response(const RequestContext& ctx, httplib::Response& res) {
    res.status = ctx.status;
    for (const auto& h : ctx.response_headers) {
        res.set_header(h.name, h.value);
    }
    if (!ctx.body.empty() || !ctx.content_type.empty()) {
        res.set_content(ctx.body, ctx.content_type.empty() ? http::kTextContentType
                                                           : ctx.content_type.c_str());
    }
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::dispatch(const httplib::Request& req, httplib::Response& res,
                          const Handler& handler) {
    RequestContext ctx;
    to_request_context(req, ctx);

    const utils::Timer timer;
    try {
        pipeline_->execute(ctx, handler);
    } catch (const std::exception& e) {
        // Span already finished by the pipeline; only the reply remains
        handler_errors_.fetch_add(1, std::memory_order_relaxed);
        ctx.status = 500;
        ctx.body = json_error("internal_error", e.what());
        ctx.content_type = http::kJsonContentType;
    } catch (...) {
        handler_errors_.fetch_add(1, std::memory_order_relaxed);
        utils::log::error(std::format("{} {} failed with a non-standard exception",
            ctx.method, ctx.path));
        ctx.status = 500;
        ctx.body = json_error("internal_error", "unknown error");
        ctx.content_type = http::kJsonContentType;
    }
    requests_handled_.fetch_add(1, std::memory_order_relaxed);

    utils::log::debug(std::format("{} {} -> {} in {}us",
        ctx.method, ctx.path, ctx.status, timer.elapsed_us().count()));

    apply_response(ctx, res);
}

void HttpServer::not_found(RequestContext& ctx) {
    ctx.status = 404;
    ctx.body = json_error("not_found", std::format("No route for {} {}", ctx.method, ctx.path));
    ctx.content_type = http::kJsonContentType;
}

void HttpServer::handle_health(RequestContext& ctx) {
    ctx.body = R"({"status":"healthy","service":"reqtrace"})";
    ctx.content_type = http::kJsonContentType;
}

void HttpServer::handle_spans(RequestContext& ctx) {
    size_t limit = 100;
    const auto it = ctx.query_params.find("limit");
    if (it != ctx.query_params.end()) {
        const auto parsed = utils::try_parse_int<size_t>(it->second);
        if (!parsed) {
            ctx.status = 400;
            ctx.body = json_error("invalid_argument", "limit must be a non-negative integer");
            ctx.content_type = http::kJsonContentType;
            return;
        }
        limit = *parsed;
    }

    std::string body = "[";
    bool first = true;
    for (const auto& record : span_backend_->recent_spans(limit)) {
        if (!first) body += ',';
        body += LocalSpanBackend::to_json(record);
        first = false;
    }
    body += ']';

    ctx.body = std::move(body);
    ctx.content_type = http::kJsonContentType;
}

} // namespace reqtrace
