#include <catch2/catch_test_macros.hpp>
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "tracing/trace_middleware.hpp"
#include "mocks/mock_span_backend.hpp"
#include <barrier>
#include <thread>

using namespace reqtrace;
using reqtrace::testing::MockSpanBackend;

TEST_CASE("LogMetadata: scope installs and restores entries", "[logging]") {
    utils::log::clear_metadata();
    utils::log::set_metadata("service", "reqtrace");

    {
        const utils::log::Metadata entries{{"trace_id", "abc"}, {"service", "override"}};
        utils::log::MetadataScope scope(entries);
        CHECK(scope.active());
        CHECK(utils::log::metadata_value("trace_id") == "abc");
        CHECK(utils::log::metadata_value("service") == "override");
    }

    CHECK_FALSE(utils::log::metadata_value("trace_id").has_value());
    CHECK(utils::log::metadata_value("service") == "reqtrace");
    utils::log::clear_metadata();
}

TEST_CASE("LogMetadata: release is idempotent and moves transfer ownership", "[logging]") {
    utils::log::clear_metadata();

    const utils::log::Metadata entries{{"k", "v"}};
    utils::log::MetadataScope outer(entries);
    utils::log::MetadataScope moved(std::move(outer));
    CHECK_FALSE(outer.active());
    CHECK(moved.active());

    moved.release();
    moved.release();
    CHECK_FALSE(moved.active());
    CHECK(utils::log::metadata().empty());
}

TEST_CASE("LogMetadata: level names parse case-insensitively", "[logging]") {
    CHECK(utils::log::parse_level("DEBUG") == utils::log::Level::DEBUG);
    CHECK(utils::log::parse_level("warning") == utils::log::Level::WARN);
    CHECK(utils::log::parse_level("Error") == utils::log::Level::ERROR);
    CHECK_FALSE(utils::log::parse_level("verbose").has_value());
}

TEST_CASE("LogMetadata: concurrent requests never see each other's trace ids", "[logging][concurrency]") {
    auto backend = std::make_shared<MockSpanBackend>();
    auto pipeline = PipelineBuilder()
        .with_tracing(TraceMiddlewareBuilder().with_backend(backend).build())
        .build();

    // Both handlers observe their metadata while the other request is in flight
    std::barrier sync(2);
    struct Observed {
        std::string bound_trace_id;
        std::string own_trace_id;
        bool clean_after = false;
    };
    Observed results[2];

    auto worker = [&](int i) {
        RequestContext ctx;
        ctx.path = i == 0 ? "/left" : "/right";
        pipeline->execute(ctx, [&](RequestContext& c) {
            sync.arrive_and_wait();
            results[i].bound_trace_id = utils::log::metadata_value("trace_id").value_or("");
            results[i].own_trace_id = c.trace_context.trace_id_hex();
            sync.arrive_and_wait();
        });
        results[i].clean_after = utils::log::metadata().empty();
    };

    std::thread t0(worker, 0);
    std::thread t1(worker, 1);
    t0.join();
    t1.join();

    for (const auto& r : results) {
        CHECK(r.bound_trace_id == r.own_trace_id);
        CHECK(r.clean_after);
    }
    CHECK(results[0].own_trace_id != results[1].own_trace_id);
    CHECK(backend->finished().size() == 2);
}
