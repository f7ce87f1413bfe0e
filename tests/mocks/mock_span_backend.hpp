#pragma once

#include "tracing/ispan_backend.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace reqtrace::testing {

/**
 * @brief Mock span backend recording every call for later inspection
 */
class MockSpanBackend : public ISpanBackend {
public:
    enum class Failure { NONE, ERROR_RESULT, THROW };

    struct Started {
        std::string name;
        AttributeMap attributes;
        std::optional<TraceContext> parent;
        SpanHandle handle;
    };

    struct Finished {
        SpanHandle handle;
        SpanStatus status;
    };

    explicit MockSpanBackend(Failure failure = Failure::NONE) : failure_(failure) {}

    [[nodiscard]] Result<SpanHandle> start_span(
        const std::string& name,
        const AttributeMap& attributes,
        const std::optional<TraceContext>& parent) override {
        if (failure_ == Failure::THROW) {
            throw std::runtime_error("mock backend unavailable");
        }
        if (failure_ == Failure::ERROR_RESULT) {
            return Result<SpanHandle>::error(ErrorCategory::BACKEND_ERROR, "mock backend unavailable");
        }

        SpanHandle handle;
        handle.id = next_id_.fetch_add(1, std::memory_order_relaxed);
        handle.context = parent ? TraceContext::child_of(*parent) : TraceContext::generate();
        handle.parent = parent;

        std::lock_guard lock(mutex_);
        started_.push_back({name, attributes, parent, handle});
        return Result<SpanHandle>::ok(handle);
    }

    [[nodiscard]] std::optional<TraceContext> current_context() const override {
        std::lock_guard lock(mutex_);
        if (started_.size() == finished_.size()) return std::nullopt;
        return started_.back().handle.context;
    }

    bool set_status(const SpanHandle& span, const SpanStatus& status) override {
        std::lock_guard lock(mutex_);
        statuses_.push_back({span, status});
        return true;
    }

    bool finish_span(const SpanHandle& span) override {
        std::lock_guard lock(mutex_);
        SpanStatus status;
        for (const auto& s : statuses_) {
            if (s.handle.id == span.id) status = s.status;
        }
        finished_.push_back({span, status});
        return true;
    }

    [[nodiscard]] std::vector<Started> started() const {
        std::lock_guard lock(mutex_);
        return started_;
    }

    [[nodiscard]] std::vector<Finished> finished() const {
        std::lock_guard lock(mutex_);
        return finished_;
    }

    [[nodiscard]] size_t finish_count(uint64_t id) const {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& f : finished_) {
            if (f.handle.id == id) ++n;
        }
        return n;
    }

    void set_failure(Failure failure) { failure_ = failure; }

private:
    Failure failure_;
    mutable std::mutex mutex_;
    std::atomic<uint64_t> next_id_{1};
    std::vector<Started> started_;
    std::vector<Finished> statuses_;
    std::vector<Finished> finished_;
};

} // namespace reqtrace::testing
