#pragma once

#include <chrono>
#include <functional>
#include <string>

using WallClock = std::chrono::system_clock;
using TimePoint = WallClock::time_point;

// Injected into every component that reads time or sleeps, so tests can drive
// the state machine and the kill sequence without waiting.
using NowFunction = std::function<TimePoint()>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

NowFunction SystemNow();
SleepFunction ThreadSleep();

std::string FormatIso8601(TimePoint timePoint);
double SecondsBetween(TimePoint from, TimePoint to);
std::chrono::milliseconds SecondsToMillis(double seconds);
