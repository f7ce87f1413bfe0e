#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "server/http_constants.hpp"
#include "server/http_server.hpp"
#include "tracing/attribute_resolver.hpp"
#include "tracing/local_span_backend.hpp"
#include "tracing/trace_middleware.hpp"

#include <memory>
#include <csignal>
#include <cstdlib>
#include <format>

using namespace reqtrace;

// Global instance for signal handling
std::shared_ptr<HttpServer> g_server;

void signal_handler(int signal) {
    utils::log::info(std::format("Received signal {}, shutting down...", signal));
    if (g_server) {
        g_server->stop();
    }
    exit(0);
}

// Functions the service itself exposes to LocalFunction attribute specs
static std::shared_ptr<AttributeModule> make_app_module() {
    auto app = std::make_shared<AttributeModule>("app");
    app->define("method", [](const RequestContext& req) { return req.method; });
    app->define("route", [](const RequestContext& req) { return req.path; });
    app->define("client", [](const RequestContext& req) {
        return req.req_header("x-client-id").value_or("anonymous");
    });
    return app;
}

static void register_sample_routes(HttpServer& server) {
    server.route("GET", "/hello", [](RequestContext& ctx) {
        utils::log::info("handling hello");
        ctx.body = R"({"message":"hello"})";
        ctx.content_type = http::kJsonContentType;
    });

    server.route("GET", R"(/users/(\d+))", [](RequestContext& ctx) {
        const auto id = ctx.path.substr(ctx.path.rfind('/') + 1);
        utils::log::info(std::format("looking up user {}", id));
        ctx.body = std::format(R"({{"id":{}}})", id);
        ctx.content_type = http::kJsonContentType;
    });

    server.route("POST", "/echo", [](RequestContext& ctx) {
        ctx.body = ctx.req_header("x-echo").value_or("");
        ctx.content_type = http::kTextContentType;
    });

    server.route("GET", "/fail", [](RequestContext&) {
        throw std::runtime_error("requested failure");
    });
}

int main(int argc, char* argv[]) {
    try {
        utils::log::info("reqtrace starting...");

        // Setup signal handlers
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        // Configuration
        std::string config_file = "config/reqtrace.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        ServiceConfig config;
        if (config_result.success) {
            config = std::move(config_result.config);
        } else {
            utils::log::warn(std::format("Config: {}, using defaults", config_result.error_message));
        }

        if (const auto level = utils::log::parse_level(config.logging.level)) {
            utils::log::set_level(*level);
        }

        // =====================================================================
        // [2/3] Tracing
        // =====================================================================
        utils::log::info("[2/3] Tracing initializing...");

        auto backend = std::make_shared<LocalSpanBackend>(LocalSpanBackend::Config{
            .max_finished_spans = config.tracing.max_finished_spans,
            .log_spans = config.tracing.log_spans,
        });

        PipelineBuilder builder;
        if (config.tracing.enabled) {
            builder.with_tracing(TraceMiddlewareBuilder()
                .with_backend(backend)
                .with_owner(make_app_module())
                .with_attributes(config.tracing.attributes)
                .build());
            utils::log::info(std::format("Tracing: enabled ({} attributes)",
                config.tracing.attributes.size()));
        } else {
            utils::log::info("Tracing: disabled");
        }
        auto pipeline = builder.build();

        // =====================================================================
        // [3/3] HTTP server
        // =====================================================================
        utils::log::info("[3/3] HTTP server initializing...");

        g_server = std::make_shared<HttpServer>(pipeline, config.server);
        if (config.tracing.spans_endpoint) {
            g_server->enable_spans_endpoint(backend);
        }
        register_sample_routes(*g_server);

        utils::log::info(std::format("Server ready on http://{}:{}",
            config.server.host, config.server.port));

        // Start HTTP server (blocking)
        g_server->start();

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return 1;
    }

    return 0;
}
