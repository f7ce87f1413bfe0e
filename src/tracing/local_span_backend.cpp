#include "tracing/local_span_backend.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <format>

namespace reqtrace {

namespace {

int64_t to_epoch_us(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()).count();
}

} // anonymous namespace

LocalSpanBackend::LocalSpanBackend(const Config& config)
    : config_(config) {}

Result<SpanHandle> LocalSpanBackend::start_span(
        const std::string& name,
        const AttributeMap& attributes,
        const std::optional<TraceContext>& parent) {
    if (parent && !parent->is_valid()) {
        return Result<SpanHandle>::error(ErrorCategory::BACKEND_ERROR,
            "parent context has an all-zero trace or span id");
    }

    SpanHandle handle;
    handle.id = next_id_.fetch_add(1, std::memory_order_relaxed);
    handle.context = parent ? TraceContext::child_of(*parent) : TraceContext::generate();
    handle.parent = parent;

    SpanRecord record;
    record.name = name;
    record.context = handle.context;
    record.parent = parent;
    record.attributes = attributes;
    record.start_time = std::chrono::system_clock::now();

    {
        std::lock_guard lock(mutex_);
        const auto owner = std::this_thread::get_id();
        open_spans_.emplace(handle.id, OpenSpan{std::move(record), owner});
        push_current(handle.id, owner);
    }
    spans_started_.fetch_add(1, std::memory_order_relaxed);

    return Result<SpanHandle>::ok(std::move(handle));
}

std::optional<TraceContext> LocalSpanBackend::current_context() const {
    std::lock_guard lock(mutex_);
    const auto it = current_.find(std::this_thread::get_id());
    if (it == current_.end() || it->second.empty()) return std::nullopt;
    return open_spans_.at(it->second.back()).record.context;
}

bool LocalSpanBackend::set_status(const SpanHandle& span, const SpanStatus& status) {
    std::lock_guard lock(mutex_);
    const auto it = open_spans_.find(span.id);
    if (it == open_spans_.end()) return false;
    it->second.record.status = status;
    return true;
}

bool LocalSpanBackend::finish_span(const SpanHandle& span) {
    SpanRecord record;
    {
        std::lock_guard lock(mutex_);
        auto node = open_spans_.extract(span.id);
        if (node.empty()) return false;
        pop_current(span.id, node.mapped().owner);
        record = std::move(node.mapped().record);
        record.end_time = std::chrono::system_clock::now();

        finished_.push_back(record);
        while (finished_.size() > config_.max_finished_spans) {
            finished_.pop_front();
        }
    }
    spans_finished_.fetch_add(1, std::memory_order_relaxed);

    if (config_.log_spans) {
        utils::log::info(std::format("span finished: {}", to_json(record)));
    }
    return true;
}

std::vector<SpanRecord> LocalSpanBackend::recent_spans(size_t limit) const {
    std::lock_guard lock(mutex_);

    if (limit == 0 || limit >= finished_.size()) {
        return {finished_.begin(), finished_.end()};
    }

    const auto start = finished_.end() - static_cast<std::ptrdiff_t>(limit);
    return {start, finished_.end()};
}

size_t LocalSpanBackend::open_span_count() const {
    std::lock_guard lock(mutex_);
    return open_spans_.size();
}

size_t LocalSpanBackend::active_thread_count() const {
    std::lock_guard lock(mutex_);
    return current_.size();
}

std::string LocalSpanBackend::to_json(const SpanRecord& record) {
    nlohmann::json j;
    j["name"] = record.name;
    j["trace_id"] = record.context.trace_id_hex();
    j["span_id"] = record.context.span_id_hex();
    j["trace_options"] = record.context.trace_options;
    j["parent_span_id"] = record.parent ? nlohmann::json(record.parent->span_id_hex())
                                        : nlohmann::json(nullptr);
    j["attributes"] = record.attributes;
    j["status"] = {
        {"code", record.status.code},
        {"message", record.status.message},
    };
    j["start_time_us"] = to_epoch_us(record.start_time);
    j["duration_us"] = record.duration_us();
    // Attribute values and names are client-controlled and may not be valid UTF-8
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void LocalSpanBackend::push_current(uint64_t id, std::thread::id owner) {
    current_[owner].push_back(id);
}

void LocalSpanBackend::pop_current(uint64_t id, std::thread::id owner) {
    // Finishing may happen on another thread or out of order
    const auto it = current_.find(owner);
    if (it == current_.end()) return;
    std::erase(it->second, id);
    if (it->second.empty()) {
        current_.erase(it);
    }
}

} // namespace reqtrace
