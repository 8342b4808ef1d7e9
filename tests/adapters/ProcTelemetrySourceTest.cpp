/**
 * @file ProcTelemetrySourceTest.cpp
 * @brief Тесты разбора /proc и снимка телеметрии
 */

#include <gtest/gtest.h>

#include "adapters/secondary/telemetry/ProcTelemetrySource.hpp"
#include "application/TelemetryPublisher.hpp"
#include "mocks/RecordingBroadcaster.hpp"

#include <sstream>

using namespace hostlink;
using namespace hostlink::adapters::secondary;
using namespace hostlink::tests;

TEST(ProcTelemetrySourceTest, ParseMeminfo_TotalAndAvailable) {
    std::istringstream in(
        "MemTotal:       16318412 kB\n"
        "MemFree:         1204000 kB\n"
        "MemAvailable:    8159206 kB\n"
        "Buffers:          300000 kB\n");

    std::uint64_t total = 0;
    std::uint64_t available = 0;
    ProcTelemetrySource::parseMeminfo(in, total, available);

    EXPECT_EQ(total, 16318412ull * 1024);
    EXPECT_EQ(available, 8159206ull * 1024);
}

TEST(ProcTelemetrySourceTest, ParseMeminfo_MissingFields_Zero) {
    std::istringstream in("garbage\nSwapTotal: 100 kB\n");

    std::uint64_t total = 1;
    std::uint64_t available = 1;
    ProcTelemetrySource::parseMeminfo(in, total, available);

    EXPECT_EQ(total, 0u);
    EXPECT_EQ(available, 0u);
}

TEST(ProcTelemetrySourceTest, ParseLoadavg_FirstField) {
    std::istringstream in("0.52 0.61 0.70 2/1203 48211\n");
    EXPECT_DOUBLE_EQ(ProcTelemetrySource::parseLoadavg(in), 0.52);

    std::istringstream bad("n/a");
    EXPECT_DOUBLE_EQ(ProcTelemetrySource::parseLoadavg(bad), 0.0);
}

TEST(ProcTelemetrySourceTest, Snapshot_ReadsThisHost) {
    ProcTelemetrySource source;
    auto snapshot = source.snapshot();

    EXPECT_FALSE(snapshot.hostname.empty());
    EXPECT_GT(snapshot.cpuCores, 0);
    EXPECT_GT(snapshot.memoryTotalBytes, 0u);
    EXPECT_LE(snapshot.memoryUsedBytes, snapshot.memoryTotalBytes);
    EXPECT_GE(snapshot.memoryPercent(), 0.0);
    EXPECT_LE(snapshot.memoryPercent(), 100.0);
}

TEST(ProcTelemetrySourceTest, Publisher_BroadcastsFullSnapshotAsUpdate) {
    auto source = std::make_shared<ProcTelemetrySource>();
    auto broadcaster = std::make_shared<RecordingBroadcaster>();
    application::TelemetryPublisher publisher(source, broadcaster);

    publisher.publish();
    publisher.publish();

    auto updates = broadcaster->eventsOfType("update");
    ASSERT_EQ(updates.size(), 2u);
    const auto& system = updates[1].data["system"];
    EXPECT_TRUE(system.contains("hostname"));
    EXPECT_TRUE(system["memory"].contains("percent"));
    EXPECT_TRUE(system["cpu"].contains("cores"));
}
