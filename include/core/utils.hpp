#pragma once

#include <string>
#include <string_view>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <random>
#include <type_traits>
#include <format>
#include <ctime>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace reqtrace::utils {

// ============================================================================
// UUID Generation
// ============================================================================

inline std::string generate_uuid() {
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
        static_cast<uint32_t>(high >> 32),
        static_cast<uint16_t>((high >> 16) & 0xFFFF),
        static_cast<uint16_t>(high & 0xFFFF),
        static_cast<uint16_t>(low >> 48),
        low & 0xFFFFFFFFFFFF);
}

// ============================================================================
// Type-Safe Range Check (eliminates impossible comparisons at compile time)
// ============================================================================

template<auto Lo, auto Hi, typename T>
constexpr bool in_range(T value) {
    using Common = std::common_type_t<T, decltype(Lo), decltype(Hi)>;
    bool below = false;
    bool above = false;
    if constexpr (static_cast<Common>(std::numeric_limits<T>::min()) >= static_cast<Common>(Lo)) {
        (void)value; // T can never be below Lo
    } else {
        below = static_cast<Common>(value) < static_cast<Common>(Lo);
    }
    if constexpr (static_cast<Common>(std::numeric_limits<T>::max()) <= static_cast<Common>(Hi)) {
        (void)value; // T can never exceed Hi
    } else {
        above = static_cast<Common>(value) > static_cast<Common>(Hi);
    }
    return !below && !above;
}

// ============================================================================
// String Utilities
// ============================================================================

inline std::string to_lower(std::string_view str) {
    std::string result(str);
    for (char& c : result) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return result;
}

// Case-insensitive ASCII comparison (HTTP header names)
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Numeric Parsing (std::from_chars, locale-independent)
// ============================================================================

// Parse integer, returns std::nullopt on failure or trailing garbage
template<typename T>
    requires std::is_integral_v<T>
[[nodiscard]] inline std::optional<T> try_parse_int(std::string_view sv) {
    T result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    return result;
}

// ============================================================================
// Performance Timer
// ============================================================================

class Timer {
public:
    Timer() : start_(std::chrono::steady_clock::now()) {}

    template<typename Duration = std::chrono::microseconds>
    Duration elapsed() const {
        const auto end = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<Duration>(end - start_);
    }

    std::chrono::microseconds elapsed_us() const {
        return elapsed<std::chrono::microseconds>();
    }

private:
    std::chrono::steady_clock::time_point start_;
};

// ============================================================================
// Logging (thread-safe, stderr, level-tagged, request-scoped metadata)
// ============================================================================

namespace log {

enum class Level { DEBUG, INFO, WARN, ERROR };

/// Ordered key/value pairs appended to every line logged on the current thread
using Metadata = std::vector<std::pair<std::string, std::string>>;

namespace detail {
    inline std::mutex& log_mutex() {
        static std::mutex m;
        return m;
    }

    inline std::atomic<Level>& min_level() {
        static std::atomic<Level> level{Level::INFO};
        return level;
    }

    // Thread-local: each request runs on its own worker thread, so metadata
    // installed by one request is never visible to another.
    inline Metadata& thread_metadata() {
        static thread_local Metadata metadata;
        return metadata;
    }

    inline void write(Level level, const std::string& msg) {
        if (level < min_level().load(std::memory_order_relaxed)) return;

        const char* tag = "";
        switch (level) {
            case Level::DEBUG: tag = "DEBUG"; break;
            case Level::INFO:  tag = "INFO "; break;
            case Level::WARN:  tag = "WARN "; break;
            case Level::ERROR: tag = "ERROR"; break;
        }

        const auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        ::localtime_r(&time, &tm_buf);

        char time_buf[16];
        std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &tm_buf);

        std::string formatted = std::format("{}.{:03d} [{}] {}",
            time_buf, static_cast<int>(ms.count()), tag, msg);
        for (const auto& [key, value] : thread_metadata()) {
            formatted += std::format(" {}={}", key, value);
        }
        formatted += '\n';

        std::lock_guard<std::mutex> lock(log_mutex());
        std::cerr << formatted;
    }
} // namespace detail

inline void set_level(Level level) {
    detail::min_level().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline std::optional<Level> parse_level(std::string_view name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::DEBUG;
    if (lower == "info") return Level::INFO;
    if (lower == "warn" || lower == "warning") return Level::WARN;
    if (lower == "error") return Level::ERROR;
    return std::nullopt;
}

/// Insert or replace one metadata entry for the current thread
inline void set_metadata(const std::string& key, std::string value) {
    auto& md = detail::thread_metadata();
    for (auto& [k, v] : md) {
        if (k == key) {
            v = std::move(value);
            return;
        }
    }
    md.emplace_back(key, std::move(value));
}

[[nodiscard]] inline const Metadata& metadata() {
    return detail::thread_metadata();
}

[[nodiscard]] inline std::optional<std::string> metadata_value(std::string_view key) {
    for (const auto& [k, v] : detail::thread_metadata()) {
        if (k == key) return v;
    }
    return std::nullopt;
}

inline void clear_metadata() {
    detail::thread_metadata().clear();
}

/**
 * @brief RAII metadata binding for the duration of one request
 *
 * Installs the given entries on construction and restores the previous
 * thread metadata on destruction. Must be destroyed on the thread that
 * created it.
 */
class MetadataScope {
public:
    MetadataScope() = default;

    explicit MetadataScope(const Metadata& entries)
        : saved_(detail::thread_metadata()), active_(true) {
        for (const auto& [key, value] : entries) {
            set_metadata(key, value);
        }
    }

    ~MetadataScope() { release(); }

    MetadataScope(MetadataScope&& other) noexcept
        : saved_(std::move(other.saved_)), active_(other.active_) {
        other.active_ = false;
    }

    MetadataScope& operator=(MetadataScope&& other) noexcept {
        if (this != &other) {
            release();
            saved_ = std::move(other.saved_);
            active_ = other.active_;
            other.active_ = false;
        }
        return *this;
    }

    MetadataScope(const MetadataScope&) = delete;
    MetadataScope& operator=(const MetadataScope&) = delete;

    /// Restore the previous metadata now (idempotent)
    void release() {
        if (!active_) return;
        detail::thread_metadata() = std::move(saved_);
        active_ = false;
    }

    [[nodiscard]] bool active() const { return active_; }

private:
    Metadata saved_;
    bool active_ = false;
};

inline void debug(const std::string& msg) {
    detail::write(Level::DEBUG, msg);
}

inline void info(const std::string& msg) {
    detail::write(Level::INFO, msg);
}

inline void warn(const std::string& msg) {
    detail::write(Level::WARN, msg);
}

inline void error(const std::string& msg) {
    detail::write(Level::ERROR, msg);
}

} // namespace log

} // namespace reqtrace::utils
