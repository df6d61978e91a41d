#pragma once

#include "Clock.hpp"
#include "ProcessControl.hpp"
#include "SystemMetrics.hpp"

#include <chrono>
#include <optional>
#include <string>

struct MetricsSources {
    std::string procStatPath = "/proc/stat";
    std::string memInfoPath = "/proc/meminfo";
    std::string thermalRoot = "/sys/class/thermal";
    std::string diskPath = "/";
};

class MetricsCollector : public MetricsSource {
public:
    MetricsCollector(
        ProcessControl& processes,
        std::chrono::milliseconds cpuSampleInterval,
        MetricsSources sources = {},
        NowFunction now = SystemNow(),
        SleepFunction sleep = ThreadSleep());

    // Never throws. A reading that cannot be taken is reported as 0 (or no
    // temperature) for this tick.
    SystemMetrics Collect() override;

private:
    double SampleCpuPct();
    void ReadMemory(SystemMetrics& metrics) const;
    double ReadDiskPct() const;
    std::optional<double> ReadTemperature() const;

    ProcessControl& processes_;
    std::chrono::milliseconds cpuSampleInterval_;
    MetricsSources sources_;
    NowFunction now_;
    SleepFunction sleep_;
    unsigned long long prevIdle_ = 0;
    unsigned long long prevTotal_ = 0;
};
