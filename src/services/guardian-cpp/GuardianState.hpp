#pragma once

#include "Clock.hpp"
#include "SystemMetrics.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

enum class GuardianState {
    NORMAL,
    BROWNOUT,
    DEGRADED,
    EMERGENCY,
    LOCKDOWN
};

const char* ToString(GuardianState state);

struct HysteresisSettings {
    double ramSoftPct = 80.0;
    double ramHardPct = 92.0;
    double ramRecoveryPct = 70.0;
    double cpuSoftPct = 80.0;
    double cpuHardPct = 92.0;
    double cpuRecoveryPct = 75.0;
    double diskHardPct = 95.0;
    double tempHardC = 90.0;
    std::size_t measurementWindow = 3;
    std::chrono::milliseconds recoveryWindow{45000};
    std::chrono::milliseconds lockdownDuration{3600000};
    bool killEnabled = true;
};

// Everything the transition function needs besides the incoming sample.
// Owned by the control loop and replaced wholesale on every tick.
struct MachineState {
    GuardianState state = GuardianState::NORMAL;
    GuardianState previous = GuardianState::NORMAL;
    TimePoint enteredAt{};
    std::deque<bool> softWindow;
    std::optional<TimePoint> recoveryStart;
    std::optional<TimePoint> lockdownUntil;
};

enum class SideEffect {
    ActivateModerateBrownout,
    ActivateHeavyBrownout,
    DeactivateBrownout,
    ResumeIntake,
    RunKillSequence
};

const char* ToString(SideEffect effect);

struct Transition {
    MachineState next;
    std::vector<SideEffect> effects;
    bool changed = false;
};

enum class KillOutcome {
    Succeeded,
    Failed,
    RateLimited
};

MachineState InitialMachineState(TimePoint now);

bool IsHardTrigger(const SystemMetrics& metrics, const HysteresisSettings& settings);
bool IsSoftTrigger(const SystemMetrics& metrics, const HysteresisSettings& settings);
bool IsRecovery(const SystemMetrics& metrics, const HysteresisSettings& settings);

// Pure: decides the state for one tick and lists the actions the caller must
// perform. While in LOCKDOWN the sample is ignored and only expiry is checked.
Transition EvaluateTick(
    const MachineState& current,
    const SystemMetrics& metrics,
    const HysteresisSettings& settings,
    TimePoint now);

// Leaves EMERGENCY once the kill attempt has an outcome: NORMAL on success,
// LOCKDOWN for lockdownDuration otherwise.
Transition ResolveEmergency(
    const MachineState& current,
    KillOutcome outcome,
    const HysteresisSettings& settings,
    TimePoint now);

SystemMetrics WithStateFlags(SystemMetrics metrics, GuardianState state);
