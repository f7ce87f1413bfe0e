#include <catch2/catch_test_macros.hpp>
#include "tracing/span_lifecycle.hpp"
#include "mocks/mock_span_backend.hpp"

using namespace reqtrace;
using reqtrace::testing::MockSpanBackend;

TEST_CASE("SpanLifecycle: requires a backend", "[lifecycle]") {
    CHECK_THROWS_AS(SpanLifecycle(nullptr), std::invalid_argument);
}

TEST_CASE("SpanLifecycle: start without parent creates a root span", "[lifecycle]") {
    auto backend = std::make_shared<MockSpanBackend>();
    SpanLifecycle lifecycle(backend);

    auto span = lifecycle.start_span("/root", {{"k", "v"}}, std::nullopt);
    REQUIRE(span.has_value());
    CHECK(span->context.is_valid());
    CHECK_FALSE(span->parent.has_value());

    const auto started = backend->started();
    REQUIRE(started.size() == 1);
    CHECK(started[0].name == "/root");
    CHECK(started[0].attributes.at("k") == "v");
}

TEST_CASE("SpanLifecycle: start with parent stays in the parent's trace", "[lifecycle]") {
    auto backend = std::make_shared<MockSpanBackend>();
    SpanLifecycle lifecycle(backend);
    const auto parent = TraceContext::generate();

    auto span = lifecycle.start_span("/child", {}, parent);
    REQUIRE(span.has_value());
    CHECK(span->context.trace_id == parent.trace_id);
    CHECK(span->context.span_id != parent.span_id);
    REQUIRE(span->parent.has_value());
    CHECK(*span->parent == parent);
}

TEST_CASE("SpanLifecycle: backend failure yields no span", "[lifecycle]") {
    SECTION("error result") {
        SpanLifecycle lifecycle(std::make_shared<MockSpanBackend>(MockSpanBackend::Failure::ERROR_RESULT));
        CHECK_FALSE(lifecycle.start_span("/x", {}, std::nullopt).has_value());
    }
    SECTION("exception") {
        SpanLifecycle lifecycle(std::make_shared<MockSpanBackend>(MockSpanBackend::Failure::THROW));
        CHECK_FALSE(lifecycle.start_span("/x", {}, std::nullopt).has_value());
    }
}

TEST_CASE("SpanLifecycle: finish sets status then closes the span", "[lifecycle]") {
    auto backend = std::make_shared<MockSpanBackend>();
    SpanLifecycle lifecycle(backend);

    auto span = lifecycle.start_span("/x", {}, std::nullopt);
    REQUIRE(span.has_value());
    CHECK(backend->current_context().has_value());

    lifecycle.finish(*span, SpanStatus(StatusCode::NOT_FOUND));

    const auto finished = backend->finished();
    REQUIRE(finished.size() == 1);
    CHECK(finished[0].handle.id == span->id);
    CHECK(finished[0].status == SpanStatus(StatusCode::NOT_FOUND));
    CHECK_FALSE(backend->current_context().has_value());
}

TEST_CASE("SpanLifecycle: logging metadata uses hex ids and decimal options", "[lifecycle]") {
    TraceContext ctx;
    ctx.trace_id = {0x4bf92f3577b34da6ULL, 0xa3ce929d0e0e4736ULL};
    ctx.span_id = 0xabcULL;
    ctx.trace_options = 1;

    const auto md = SpanLifecycle::logging_metadata(ctx);
    REQUIRE(md.size() == 3);
    CHECK(md[0] == std::pair<std::string, std::string>{"trace_id", "4bf92f3577b34da6a3ce929d0e0e4736"});
    CHECK(md[1] == std::pair<std::string, std::string>{"span_id", "0000000000000abc"});
    CHECK(md[2] == std::pair<std::string, std::string>{"trace_options", "1"});
}

TEST_CASE("SpanLifecycle: bound logging context is removed on release", "[lifecycle]") {
    utils::log::clear_metadata();
    const auto ctx = TraceContext::generate();

    {
        auto scope = SpanLifecycle::bind_logging_context(ctx);
        CHECK(utils::log::metadata_value("trace_id") == ctx.trace_id_hex());
        CHECK(utils::log::metadata_value("span_id") == ctx.span_id_hex());
    }

    CHECK_FALSE(utils::log::metadata_value("trace_id").has_value());
    CHECK(utils::log::metadata().empty());
}
