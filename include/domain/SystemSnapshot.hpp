#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace hostlink::domain {

/**
 * @brief Полный снимок телеметрии хоста (рассылается целиком, не дельтой)
 */
struct SystemSnapshot {
    std::string hostname;
    std::string osRelease;
    int cpuCores = 0;
    double loadAverage1m = 0.0;
    std::uint64_t memoryTotalBytes = 0;
    std::uint64_t memoryUsedBytes = 0;
    int64_t uptimeSeconds = 0;

    double memoryPercent() const {
        if (memoryTotalBytes == 0) {
            return 0.0;
        }
        return static_cast<double>(memoryUsedBytes) * 100.0 / static_cast<double>(memoryTotalBytes);
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["hostname"] = hostname;
        j["os"] = osRelease;
        j["cpu"] = {{"cores", cpuCores}, {"load_1m", loadAverage1m}};
        j["memory"] = {
            {"total", memoryTotalBytes},
            {"used", memoryUsedBytes},
            {"percent", memoryPercent()}
        };
        j["uptime_seconds"] = uptimeSeconds;
        return j;
    }
};

} // namespace hostlink::domain
