#pragma once

#include "Clock.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>

struct KillRateSettings {
    std::chrono::milliseconds shortCooldown{300000};
    std::chrono::milliseconds longWindow{1800000};
    std::size_t maxKillsPerWindow = 3;
};

enum class KillDecision {
    Allowed,
    ShortCooldown,
    WindowCapReached
};

const char* ToString(KillDecision decision);

// Ledger of executed kills, oldest first, never holding entries older than
// the long window.
class KillRateLimiter {
public:
    explicit KillRateLimiter(KillRateSettings settings);

    KillDecision Check(TimePoint now);
    void RecordKill(TimePoint when);

    std::size_t KillsInWindow(TimePoint now);
    std::optional<TimePoint> LastKill() const;

private:
    void Prune(TimePoint now);

    KillRateSettings settings_;
    std::deque<TimePoint> ledger_;
};
