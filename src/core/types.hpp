#pragma once

#include <array>
#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <string_view>

namespace docsync {

/**
 * Uuid - 128-bit random identifier (RFC 4122 version 4).
 *
 * Used for sync identifiers, conflict ids and queued operation ids.
 */
class Uuid {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr Uuid() noexcept : bytes_{} {}
    explicit constexpr Uuid(Bytes bytes) noexcept : bytes_(bytes) {}

    [[nodiscard]] static Uuid generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes{};
        for (size_t half = 0; half < 2; ++half) {
            uint64_t word = dist(gen);
            for (size_t i = 0; i < 8; ++i) {
                bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
            }
        }
        bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
        bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
        return Uuid(bytes);
    }

    /**
     * Parse the canonical 8-4-4-4-12 hex form (either case).
     */
    [[nodiscard]] static std::optional<Uuid> parse(std::string_view str) {
        if (str.size() != 36) return std::nullopt;

        Bytes bytes{};
        size_t out = 0;
        for (size_t i = 0; i < str.size();) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                if (str[i] != '-') return std::nullopt;
                ++i;
                continue;
            }
            const int hi = hex_value(str[i]);
            const int lo = hex_value(str[i + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            bytes[out++] = static_cast<uint8_t>((hi << 4) | lo);
            i += 2;
        }
        return Uuid(bytes);
    }

    /**
     * Hyphenated, lowercase.
     */
    [[nodiscard]] std::string to_string() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(36);
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
            out += digits[bytes_[i] >> 4];
            out += digits[bytes_[i] & 0x0F];
        }
        return out;
    }

    [[nodiscard]] constexpr int version() const noexcept { return bytes_[6] >> 4; }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    auto operator<=>(const Uuid&) const = default;
    bool operator==(const Uuid&) const = default;

private:
    static constexpr int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    Bytes bytes_;
};

/**
 * Timestamp - milliseconds since the Unix epoch (UTC).
 *
 * Stored as INTEGER in SQLite and as ISO-8601 text in JSON snapshots.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using SystemClock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<SystemClock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}
    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        const auto tp = std::chrono::time_point_cast<Duration>(SystemClock::now());
        return Timestamp(tp.time_since_epoch().count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept { return millis_; }

    [[nodiscard]] std::string to_iso_string() const {
        const auto secs = static_cast<std::time_t>(floor_div(millis_, 1000));
        std::tm tm{};
        gmtime_r(&secs, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
            << std::setw(3) << (millis_ - floor_div(millis_, 1000) * 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const { return Timestamp(millis_ + d.count()); }
    Timestamp operator-(Duration d) const { return Timestamp(millis_ - d.count()); }
    Duration operator-(const Timestamp& other) const { return Duration(millis_ - other.millis_); }

private:
    static constexpr int64_t floor_div(int64_t a, int64_t b) noexcept {
        return (a >= 0) ? a / b : -((-a + b - 1) / b);
    }

    int64_t millis_;
};

/**
 * Clock - injectable time source. Production code uses system_clock();
 * tests pass a lambda over a mutable Timestamp.
 */
using Clock = std::function<Timestamp()>;

[[nodiscard]] inline Clock system_clock() {
    return [] { return Timestamp::now(); };
}

} // namespace docsync
