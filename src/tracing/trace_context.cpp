#include "tracing/trace_context.hpp"
#include <format>
#include <random>

namespace reqtrace {

namespace {

[[nodiscard]] int hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Parses exactly s.size() hex digits (at most 16) into out
[[nodiscard]] bool parse_hex_u64(std::string_view s, uint64_t& out) noexcept {
    uint64_t value = 0;
    for (char c : s) {
        const int d = hex_digit(c);
        if (d < 0) return false;
        value = (value << 4) | static_cast<uint64_t>(d);
    }
    out = value;
    return true;
}

uint64_t random_u64() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;
    return dis(gen);
}

} // anonymous namespace

std::string TraceContext::trace_id_hex() const {
    return std::format("{:016x}{:016x}", trace_id.high, trace_id.low);
}

std::string TraceContext::span_id_hex() const {
    return std::format("{:016x}", span_id);
}

std::string TraceContext::encode() const {
    return std::format("00-{:016x}{:016x}-{:016x}-{:02x}",
        trace_id.high, trace_id.low, span_id, trace_options);
}

std::optional<TraceContext> TraceContext::decode(std::string_view header) noexcept {
    // Format: "VV-TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-PPPPPPPPPPPPPPPP-FF"
    if (header.size() != kEncodedSize) return std::nullopt;

    if (header[2] != '-' || header[35] != '-' || header[52] != '-') {
        return std::nullopt;
    }

    if (header.substr(0, 2) != "00") return std::nullopt;

    TraceContext ctx;
    uint64_t options = 0;
    if (!parse_hex_u64(header.substr(3, 16), ctx.trace_id.high) ||
        !parse_hex_u64(header.substr(19, 16), ctx.trace_id.low) ||
        !parse_hex_u64(header.substr(36, 16), ctx.span_id) ||
        !parse_hex_u64(header.substr(53, 2), options)) {
        return std::nullopt;
    }
    ctx.trace_options = static_cast<uint8_t>(options);

    // All-zero IDs encode the undefined context
    if (!ctx.is_valid()) return std::nullopt;

    return ctx;
}

TraceContext TraceContext::generate() {
    TraceContext ctx;
    ctx.trace_id = generate_trace_id();
    ctx.span_id = generate_span_id();
    ctx.trace_options = kSampledFlag;
    return ctx;
}

TraceContext TraceContext::child_of(const TraceContext& parent) {
    TraceContext ctx;
    ctx.trace_id = parent.trace_id;
    ctx.span_id = generate_span_id();
    ctx.trace_options = parent.trace_options;
    return ctx;
}

uint64_t TraceContext::generate_span_id() {
    uint64_t id = 0;
    while (id == 0) {
        id = random_u64();
    }
    return id;
}

TraceId TraceContext::generate_trace_id() {
    TraceId id;
    while (id.is_zero()) {
        id.high = random_u64();
        id.low = random_u64();
    }
    return id;
}

} // namespace reqtrace
