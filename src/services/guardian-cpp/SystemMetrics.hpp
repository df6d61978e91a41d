#pragma once

#include "Clock.hpp"

#include <optional>
#include <vector>

// One snapshot per tick. Not modified after the tick that created it; the
// derived flags are stamped on a copy once the state for that tick is known.
struct SystemMetrics {
    TimePoint timestamp{};
    double ramPct = 0.0;
    double ramGb = 0.0;
    double cpuPct = 0.0;
    double diskPct = 0.0;
    std::optional<double> tempC;
    std::vector<int> backendPids;
    bool degraded = false;
    bool intakeBlocked = false;
    bool emergencyMode = false;
};

class MetricsSource {
public:
    virtual ~MetricsSource() = default;

    virtual SystemMetrics Collect() = 0;
};
