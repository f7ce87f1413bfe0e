#include <catch2/catch_test_macros.hpp>
#include "tracing/trace_middleware.hpp"
#include "mocks/mock_span_backend.hpp"
#include <stdexcept>

using namespace reqtrace;
using reqtrace::testing::MockSpanBackend;

namespace {

constexpr const char* kParentHeader = "00-4bf92f3577b34da6a3ce929d0e0e4736-00f067aa0ba902b7-01";

std::unique_ptr<TraceMiddleware> make_middleware(std::shared_ptr<MockSpanBackend> backend) {
    return TraceMiddlewareBuilder().with_backend(std::move(backend)).build();
}

} // namespace

TEST_CASE("TraceMiddleware: requires a backend", "[middleware]") {
    CHECK_THROWS_AS(TraceMiddlewareBuilder().build(), std::invalid_argument);
}

TEST_CASE("TraceMiddleware: writes exactly one traceparent response header", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = make_middleware(backend);

    RequestContext ctx;
    ctx.path = "/a";
    ctx.response_headers.push_back({"TraceParent", "stale"});

    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    CHECK(ctx.resp_header_count("traceparent") == 1);

    const auto header = ctx.resp_header("traceparent");
    REQUIRE(header.has_value());
    auto decoded = TraceContext::decode(*header);
    REQUIRE(decoded.has_value());
    CHECK(*decoded == ctx.trace_context);
    CHECK(*decoded == backend->started().at(0).handle.context);

    ctx.run_before_send();
}

TEST_CASE("TraceMiddleware: inbound header makes the span a child", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = make_middleware(backend);

    RequestContext ctx;
    ctx.path = "/orders";
    ctx.add_req_header("Traceparent", kParentHeader);

    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);

    const auto parent = TraceContext::decode(kParentHeader);
    REQUIRE(ctx.parent_context.has_value());
    CHECK(*ctx.parent_context == *parent);

    const auto started = backend->started();
    REQUIRE(started.size() == 1);
    REQUIRE(started[0].parent.has_value());
    CHECK(*started[0].parent == *parent);
    CHECK(ctx.trace_context.trace_id == parent->trace_id);
    CHECK(ctx.trace_context.span_id != parent->span_id);

    ctx.run_before_send();
}

TEST_CASE("TraceMiddleware: absent or malformed header starts a new trace", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = make_middleware(backend);

    SECTION("absent") {
        RequestContext ctx;
        REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
        CHECK_FALSE(ctx.parent_context.has_value());
        ctx.run_before_send();
    }
    SECTION("malformed") {
        RequestContext ctx;
        ctx.add_req_header("traceparent", "not-a-trace");
        REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
        CHECK_FALSE(ctx.parent_context.has_value());
        ctx.run_before_send();
    }
    SECTION("repeated header") {
        RequestContext ctx;
        ctx.add_req_header("traceparent", kParentHeader);
        ctx.add_req_header("traceparent", kParentHeader);
        REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
        CHECK_FALSE(ctx.parent_context.has_value());
        ctx.run_before_send();
    }

    const auto started = backend->started();
    REQUIRE(started.size() == 1);
    CHECK_FALSE(started[0].parent.has_value());
}

TEST_CASE("TraceMiddleware: default span name is the path without query", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = make_middleware(backend);

    RequestContext ctx;
    ctx.path = "/users/42?x=1";
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    ctx.run_before_send();

    CHECK(backend->started().at(0).name == "/users/42");
}

TEST_CASE("TraceMiddleware: finishes once with the mapped status", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = make_middleware(backend);

    RequestContext ctx;
    ctx.path = "/missing";
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    CHECK(backend->finished().empty());

    ctx.status = 404;
    ctx.run_before_send();
    ctx.run_before_send();

    const auto finished = backend->finished();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].status == SpanStatus(StatusCode::NOT_FOUND, ""));
}

TEST_CASE("TraceMiddleware: custom callbacks name and classify the span", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_callbacks(std::make_shared<CustomSpanCallbacks>(
            [](const RequestContext& r) { return r.method + " " + r.path; },
            [](const RequestContext& r) {
                return r.status == 202 ? SpanStatus(StatusCode::ABORTED, "queued")
                                       : SpanStatus(StatusCode::OK);
            }))
        .build();

    RequestContext ctx;
    ctx.method = "PUT";
    ctx.path = "/jobs";
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    ctx.status = 202;
    ctx.run_before_send();

    CHECK(backend->started().at(0).name == "PUT /jobs");
    CHECK(backend->finished().at(0).status == SpanStatus(StatusCode::ABORTED, "queued"));
}

TEST_CASE("TraceMiddleware: throwing status callback still finishes the span", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_callbacks(std::make_shared<CustomSpanCallbacks>(
            nullptr,
            [](const RequestContext&) -> SpanStatus { throw std::runtime_error("bad status"); }))
        .build();

    RequestContext ctx;
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    ctx.run_before_send();

    const auto finished = backend->finished();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].status.code == static_cast<int32_t>(StatusCode::UNKNOWN));
    CHECK(utils::log::metadata().empty());
}

TEST_CASE("TraceMiddleware: resolved attributes are attached at start", "[middleware]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto owner = std::make_shared<AttributeModule>("app");
    owner->define("method", [](const RequestContext& r) { return r.method; });

    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_owner(owner)
        .with_attribute(AttributeSpec::local("method"))
        .with_attribute(AttributeSpec::remote_with_args("request", "header", {"x-client"}))
        .build();

    RequestContext ctx;
    ctx.method = "DELETE";
    ctx.add_req_header("X-Client", "cli");
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    ctx.run_before_send();

    const auto attrs = backend->started().at(0).attributes;
    REQUIRE(attrs.size() == 2);
    CHECK(attrs.at("method") == "DELETE");
    CHECK(attrs.at("header") == "cli");
}

TEST_CASE("TraceMiddleware: unknown attribute function fails at build time", "[middleware]") {
    auto builder = TraceMiddlewareBuilder()
        .with_backend(std::make_shared<MockSpanBackend>())
        .with_attribute(AttributeSpec::remote("request", "no_such_function"));
    CHECK_THROWS_AS(builder.build(), std::invalid_argument);
}

TEST_CASE("TraceMiddleware: failing attribute function finishes with INTERNAL and rethrows", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>();
    auto owner = std::make_shared<AttributeModule>("app");
    owner->define("boom", [](const RequestContext&) -> std::string {
        throw std::runtime_error("attribute lookup failed");
    });

    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_owner(owner)
        .with_attribute(AttributeSpec::local("boom"))
        .build();

    RequestContext ctx;
    ctx.path = "/x";
    CHECK_THROWS_AS(mw->process(ctx), std::runtime_error);

    const auto started = backend->started();
    const auto finished = backend->finished();
    REQUIRE(started.size() == 1);
    CHECK(started[0].attributes.empty());
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].status == SpanStatus(StatusCode::INTERNAL, "attribute lookup failed"));
    CHECK(ctx.resp_header_count("traceparent") == 1);
    CHECK(ctx.pending_before_send() == 0);
    CHECK(utils::log::metadata().empty());
}

TEST_CASE("TraceMiddleware: backend failure still propagates a context", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>(MockSpanBackend::Failure::THROW);
    auto mw = make_middleware(backend);

    RequestContext ctx;
    ctx.add_req_header("traceparent", kParentHeader);
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);

    const auto parent = TraceContext::decode(kParentHeader);
    CHECK(ctx.trace_context.trace_id == parent->trace_id);
    CHECK(ctx.resp_header_count("traceparent") == 1);
    CHECK(utils::log::metadata_value("trace_id") == parent->trace_id_hex());

    ctx.run_before_send();
    CHECK(backend->finished().empty());
    CHECK_FALSE(utils::log::metadata_value("trace_id").has_value());
}

TEST_CASE("TraceMiddleware: log metadata is bound until before-send", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = make_middleware(backend);

    RequestContext ctx;
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);

    CHECK(utils::log::metadata_value("trace_id") == ctx.trace_context.trace_id_hex());
    CHECK(utils::log::metadata_value("span_id") == ctx.trace_context.span_id_hex());
    CHECK(utils::log::metadata_value("trace_options") == "1");

    ctx.run_before_send();
    CHECK(utils::log::metadata().empty());
}

TEST_CASE("TraceMiddleware: status callback throwing a non-exception type finishes UNKNOWN", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>();
    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_callbacks(std::make_shared<CustomSpanCallbacks>(
            nullptr,
            [](const RequestContext&) -> SpanStatus { throw 42; }))
        .build();

    RequestContext ctx;
    ctx.path = "/int";
    REQUIRE(mw->process(ctx) == IPipelineStage::Result::CONTINUE);
    ctx.run_before_send();

    const auto finished = backend->finished();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].status == SpanStatus(StatusCode::UNKNOWN, "non-standard exception"));
    CHECK(utils::log::metadata().empty());
}

TEST_CASE("TraceMiddleware: attribute function throwing a non-exception type finishes INTERNAL", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>();
    auto owner = std::make_shared<AttributeModule>("app");
    owner->define("boom", [](const RequestContext&) -> std::string { throw 42; });

    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_owner(owner)
        .with_attribute(AttributeSpec::local("boom"))
        .build();

    RequestContext ctx;
    CHECK_THROWS_AS(mw->process(ctx), int);

    const auto finished = backend->finished();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].status == SpanStatus(StatusCode::INTERNAL, "non-standard exception"));
    CHECK(ctx.resp_header_count("traceparent") == 1);
}

TEST_CASE("TraceMiddleware: attribute failure with an unavailable backend still writes the header", "[middleware]") {
    utils::log::clear_metadata();
    auto backend = std::make_shared<MockSpanBackend>(MockSpanBackend::Failure::THROW);
    auto owner = std::make_shared<AttributeModule>("app");
    owner->define("boom", [](const RequestContext&) -> std::string {
        throw std::runtime_error("attribute lookup failed");
    });

    auto mw = TraceMiddlewareBuilder()
        .with_backend(backend)
        .with_owner(owner)
        .with_attribute(AttributeSpec::local("boom"))
        .build();

    RequestContext ctx;
    ctx.add_req_header("traceparent", kParentHeader);
    CHECK_THROWS_AS(mw->process(ctx), std::runtime_error);

    CHECK(backend->finished().empty());
    REQUIRE(ctx.resp_header_count("traceparent") == 1);

    const auto header = TraceContext::decode(ctx.resp_header("traceparent").value());
    REQUIRE(header.has_value());
    CHECK(*header == ctx.trace_context);
    CHECK(header->trace_id == TraceContext::decode(kParentHeader)->trace_id);
    CHECK(utils::log::metadata().empty());
}
