#pragma once

#include "ports/output/ITelemetrySource.hpp"

#include <cstdint>
#include <istream>

namespace hostlink::adapters::secondary {

/**
 * @brief Телеметрия Linux из /proc и uname()
 */
class ProcTelemetrySource : public ports::output::ITelemetrySource {
public:
    ProcTelemetrySource();

    domain::SystemSnapshot snapshot() override;

    /**
     * @brief Разобрать /proc/meminfo: MemTotal и MemAvailable (в байтах)
     */
    static void parseMeminfo(std::istream& in, std::uint64_t& totalBytes, std::uint64_t& availableBytes);

    /**
     * @brief Первое поле /proc/loadavg
     */
    static double parseLoadavg(std::istream& in);
};

} // namespace hostlink::adapters::secondary
