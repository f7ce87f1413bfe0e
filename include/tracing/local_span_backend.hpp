#pragma once

#include "tracing/ispan_backend.hpp"
#include <atomic>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace reqtrace {

/**
 * @brief In-process span backend
 *
 * Keeps open spans in a registry, retains the most recent finished spans
 * in a bounded ring and optionally exports each finished span as one JSON
 * log line.
 */
class LocalSpanBackend : public ISpanBackend {
public:
    struct Config {
        size_t max_finished_spans = 1024;
        bool log_spans = true;
    };

    LocalSpanBackend() : LocalSpanBackend(Config{}) {}
    explicit LocalSpanBackend(const Config& config);

    [[nodiscard]] Result<SpanHandle> start_span(
        const std::string& name,
        const AttributeMap& attributes,
        const std::optional<TraceContext>& parent) override;

    [[nodiscard]] std::optional<TraceContext> current_context() const override;

    bool set_status(const SpanHandle& span, const SpanStatus& status) override;
    bool finish_span(const SpanHandle& span) override;

    /**
     * @brief Most recent finished spans, oldest first
     * @param limit Max entries to return (0 = all)
     */
    [[nodiscard]] std::vector<SpanRecord> recent_spans(size_t limit = 0) const;

    [[nodiscard]] size_t open_span_count() const;

    struct Stats {
        uint64_t spans_started;
        uint64_t spans_finished;
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            .spans_started = spans_started_.load(std::memory_order_relaxed),
            .spans_finished = spans_finished_.load(std::memory_order_relaxed),
        };
    }

    /// JSON line for a finished span (also used by the /spans endpoint)
    [[nodiscard]] static std::string to_json(const SpanRecord& record);

    /// Threads that currently have at least one open span
    [[nodiscard]] size_t active_thread_count() const;

private:
    struct OpenSpan {
        SpanRecord record;
        std::thread::id owner;  // Thread that started the span
    };

    // Both require mutex_ held
    void push_current(uint64_t id, std::thread::id owner);
    void pop_current(uint64_t id, std::thread::id owner);

    Config config_;
    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, OpenSpan> open_spans_;
    // Open span ids per starting thread, innermost last
    std::unordered_map<std::thread::id, std::vector<uint64_t>> current_;
    std::deque<SpanRecord> finished_;
    std::atomic<uint64_t> next_id_{1};
    std::atomic<uint64_t> spans_started_{0};
    std::atomic<uint64_t> spans_finished_{0};
};

} // namespace reqtrace
