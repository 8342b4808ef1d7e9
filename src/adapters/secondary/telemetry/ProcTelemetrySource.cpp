#include "adapters/secondary/telemetry/ProcTelemetrySource.hpp"

#include <sys/utsname.h>
#include <unistd.h>

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

namespace hostlink::adapters::secondary {

ProcTelemetrySource::ProcTelemetrySource()
{
    std::cout << "[ProcTelemetrySource] Created" << std::endl;
}

domain::SystemSnapshot ProcTelemetrySource::snapshot()
{
    domain::SystemSnapshot snap;

    char host[256] = {0};
    if (gethostname(host, sizeof(host) - 1) == 0) {
        snap.hostname = host;
    }

    utsname uts{};
    if (uname(&uts) == 0) {
        snap.osRelease = std::string(uts.sysname) + " " + uts.release;
    }

    snap.cpuCores = static_cast<int>(std::thread::hardware_concurrency());

    std::ifstream loadavg("/proc/loadavg");
    if (loadavg) {
        snap.loadAverage1m = parseLoadavg(loadavg);
    }

    std::ifstream meminfo("/proc/meminfo");
    if (meminfo) {
        std::uint64_t available = 0;
        parseMeminfo(meminfo, snap.memoryTotalBytes, available);
        snap.memoryUsedBytes = snap.memoryTotalBytes > available ? snap.memoryTotalBytes - available : 0;
    }

    std::ifstream uptime("/proc/uptime");
    double seconds = 0.0;
    if (uptime >> seconds) {
        snap.uptimeSeconds = static_cast<int64_t>(seconds);
    }

    return snap;
}

void ProcTelemetrySource::parseMeminfo(std::istream& in, std::uint64_t& totalBytes, std::uint64_t& availableBytes)
{
    totalBytes = 0;
    availableBytes = 0;

    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::string key;
        std::uint64_t kb = 0;
        if (!(ss >> key >> kb)) {
            continue;
        }
        if (key == "MemTotal:") {
            totalBytes = kb * 1024;
        } else if (key == "MemAvailable:") {
            availableBytes = kb * 1024;
        }
    }
}

double ProcTelemetrySource::parseLoadavg(std::istream& in)
{
    double load = 0.0;
    in >> load;
    return in ? load : 0.0;
}

} // namespace hostlink::adapters::secondary
