#include "Clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

NowFunction SystemNow() {
    return [] { return WallClock::now(); };
}

SleepFunction ThreadSleep() {
    return [](std::chrono::milliseconds duration) {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    };
}

std::string FormatIso8601(TimePoint timePoint) {
    const auto asTime = WallClock::to_time_t(timePoint);
    std::tm utcTime = {};
    gmtime_r(&asTime, &utcTime);

    std::ostringstream output;
    output << std::put_time(&utcTime, "%Y-%m-%dT%H:%M:%SZ");
    return output.str();
}

double SecondsBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

std::chrono::milliseconds SecondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}
