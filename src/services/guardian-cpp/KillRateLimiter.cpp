#include "KillRateLimiter.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

const char* ToString(KillDecision decision) {
    switch (decision) {
        case KillDecision::Allowed:
            return "allowed";
        case KillDecision::ShortCooldown:
            return "short cooldown active";
        case KillDecision::WindowCapReached:
            return "kill cap reached for window";
    }
    return "unknown";
}

KillRateLimiter::KillRateLimiter(KillRateSettings settings)
    : settings_(std::move(settings)) {}

KillDecision KillRateLimiter::Check(TimePoint now) {
    Prune(now);

    if (!ledger_.empty() && now - ledger_.back() < settings_.shortCooldown) {
        return KillDecision::ShortCooldown;
    }

    if (ledger_.size() >= settings_.maxKillsPerWindow) {
        return KillDecision::WindowCapReached;
    }

    return KillDecision::Allowed;
}

void KillRateLimiter::RecordKill(TimePoint when) {
    // A wall clock stepped backwards must not break the ordering.
    ledger_.insert(std::upper_bound(ledger_.begin(), ledger_.end(), when), when);
    Prune(when);
    std::cout << "[RateLimiter] kill recorded, " << ledger_.size() << " in window" << std::endl;
}

std::size_t KillRateLimiter::KillsInWindow(TimePoint now) {
    Prune(now);
    return ledger_.size();
}

std::optional<TimePoint> KillRateLimiter::LastKill() const {
    if (ledger_.empty()) {
        return std::nullopt;
    }
    return ledger_.back();
}

void KillRateLimiter::Prune(TimePoint now) {
    const TimePoint cutoff = now - settings_.longWindow;
    while (!ledger_.empty() && ledger_.front() <= cutoff) {
        ledger_.pop_front();
    }
}
