#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace hostlink::domain {

/**
 * @brief Момент времени UTC
 *
 * На диске (devices.json, *.meta) хранится как unix-секунды,
 * в JSON-ответах - как ISO 8601.
 */
struct Timestamp {
    using Clock = std::chrono::system_clock;

    Clock::time_point at = Clock::now();

    static Timestamp now() { return Timestamp{Clock::now()}; }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp{Clock::from_time_t(static_cast<std::time_t>(seconds))};
    }

    int64_t toUnixSeconds() const {
        return static_cast<int64_t>(Clock::to_time_t(at));
    }

    /// "2024-05-01T12:00:00Z"
    std::string toString() const {
        std::time_t seconds = Clock::to_time_t(at);
        std::tm utc{};
        gmtime_r(&seconds, &utc);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
        return buf;
    }

    int64_t secondsAgo() const {
        return std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - at).count();
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp{at + std::chrono::seconds(seconds)};
    }

    bool operator<(const Timestamp& other) const { return at < other.at; }
};

} // namespace hostlink::domain
