#include "KillRateLimiter.hpp"
#include "Fakes.hpp"

#include <chrono>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}
} // namespace

int main() {
    using std::chrono::seconds;

    FakeClock clock;
    const TimePoint start = clock.Now();

    {
        KillRateLimiter limiter(KillRateSettings{});
        if (limiter.Check(start) != KillDecision::Allowed) {
            return Fail("First kill should be allowed.");
        }
        limiter.RecordKill(start);

        if (limiter.Check(start + seconds(100)) != KillDecision::ShortCooldown) {
            return Fail("Kill 100s after the last one should hit the short cooldown.");
        }
        if (limiter.Check(start + seconds(300)) != KillDecision::Allowed) {
            return Fail("Kill exactly at the end of the cooldown should be allowed.");
        }
    }

    {
        KillRateLimiter limiter(KillRateSettings{});
        limiter.RecordKill(start);
        limiter.RecordKill(start + seconds(400));
        limiter.RecordKill(start + seconds(800));

        if (limiter.KillsInWindow(start + seconds(1200)) != 3) {
            return Fail("Three kills should be counted in the window.");
        }
        if (limiter.Check(start + seconds(1200)) != KillDecision::WindowCapReached) {
            return Fail("Fourth kill within the long window should be rejected.");
        }
        if (limiter.Check(start + seconds(1799)) != KillDecision::WindowCapReached) {
            return Fail("Fourth kill just inside 1800s of the earliest should be rejected.");
        }
        if (limiter.Check(start + seconds(1800)) != KillDecision::Allowed) {
            return Fail("Earliest kill should age out after the long window.");
        }
        if (limiter.KillsInWindow(start + seconds(1800)) != 2) {
            return Fail("Pruning should drop kills older than the long window.");
        }
    }

    {
        KillRateSettings settings;
        settings.shortCooldown = std::chrono::milliseconds(0);
        settings.maxKillsPerWindow = 1;
        KillRateLimiter limiter(settings);
        limiter.RecordKill(start + seconds(50));
        // Out-of-order record from a clock step keeps the ledger sorted.
        limiter.RecordKill(start + seconds(10));
        const auto last = limiter.LastKill();
        if (!last || *last != start + seconds(50)) {
            return Fail("LastKill should report the most recent kill.");
        }
    }

    {
        KillRateLimiter limiter(KillRateSettings{});
        if (limiter.LastKill()) {
            return Fail("Empty ledger should have no last kill.");
        }
    }

    std::cout << "Kill rate limiter tests passed." << std::endl;
    return 0;
}
