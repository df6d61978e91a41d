#include "GuardianState.hpp"

#include <algorithm>
#include <utility>

namespace {
MachineState Enter(const MachineState& current, GuardianState next, TimePoint now) {
    MachineState entered;
    entered.state = next;
    entered.previous = current.state;
    entered.enteredAt = now;
    return entered;
}

Transition Move(const MachineState& current, GuardianState next, TimePoint now, std::vector<SideEffect> effects) {
    Transition transition;
    transition.next = Enter(current, next, now);
    transition.effects = std::move(effects);
    transition.changed = true;
    return transition;
}

bool CanRecover(GuardianState state, const HysteresisSettings& settings) {
    if (state == GuardianState::BROWNOUT || state == GuardianState::DEGRADED) {
        return true;
    }
    // Without a kill EMERGENCY has no exit of its own.
    return state == GuardianState::EMERGENCY && !settings.killEnabled;
}
} // namespace

const char* ToString(GuardianState state) {
    switch (state) {
        case GuardianState::NORMAL:
            return "NORMAL";
        case GuardianState::BROWNOUT:
            return "BROWNOUT";
        case GuardianState::DEGRADED:
            return "DEGRADED";
        case GuardianState::EMERGENCY:
            return "EMERGENCY";
        case GuardianState::LOCKDOWN:
            return "LOCKDOWN";
    }
    return "NORMAL";
}

const char* ToString(SideEffect effect) {
    switch (effect) {
        case SideEffect::ActivateModerateBrownout:
            return "activate_moderate_brownout";
        case SideEffect::ActivateHeavyBrownout:
            return "activate_heavy_brownout";
        case SideEffect::DeactivateBrownout:
            return "deactivate_brownout";
        case SideEffect::ResumeIntake:
            return "resume_intake";
        case SideEffect::RunKillSequence:
            return "run_kill_sequence";
    }
    return "unknown";
}

MachineState InitialMachineState(TimePoint now) {
    MachineState initial;
    initial.enteredAt = now;
    return initial;
}

bool IsHardTrigger(const SystemMetrics& metrics, const HysteresisSettings& settings) {
    return metrics.ramPct >= settings.ramHardPct
        || metrics.cpuPct >= settings.cpuHardPct
        || metrics.diskPct >= settings.diskHardPct
        || (metrics.tempC && *metrics.tempC >= settings.tempHardC);
}

bool IsSoftTrigger(const SystemMetrics& metrics, const HysteresisSettings& settings) {
    return metrics.ramPct >= settings.ramSoftPct || metrics.cpuPct >= settings.cpuSoftPct;
}

bool IsRecovery(const SystemMetrics& metrics, const HysteresisSettings& settings) {
    return metrics.ramPct <= settings.ramRecoveryPct && metrics.cpuPct <= settings.cpuRecoveryPct;
}

Transition EvaluateTick(
    const MachineState& current,
    const SystemMetrics& metrics,
    const HysteresisSettings& settings,
    TimePoint now) {
    if (current.state == GuardianState::LOCKDOWN) {
        if (current.lockdownUntil && now < *current.lockdownUntil) {
            Transition stay;
            stay.next = current;
            return stay;
        }
        return Move(current, GuardianState::NORMAL, now,
                    {SideEffect::DeactivateBrownout, SideEffect::ResumeIntake});
    }

    if (IsHardTrigger(metrics, settings)) {
        if (current.state == GuardianState::EMERGENCY) {
            Transition stay;
            stay.next = current;
            stay.next.recoveryStart.reset();
            return stay;
        }

        std::vector<SideEffect> effects;
        if (settings.killEnabled) {
            effects.push_back(SideEffect::RunKillSequence);
        }
        return Move(current, GuardianState::EMERGENCY, now, std::move(effects));
    }

    MachineState next = current;
    const std::size_t window = std::max<std::size_t>(settings.measurementWindow, 1);
    next.softWindow.push_back(IsSoftTrigger(metrics, settings));
    while (next.softWindow.size() > window) {
        next.softWindow.pop_front();
    }

    const bool sustained = next.softWindow.size() == window
        && std::all_of(next.softWindow.begin(), next.softWindow.end(), [](bool soft) { return soft; });
    if (sustained) {
        if (current.state == GuardianState::NORMAL) {
            return Move(current, GuardianState::BROWNOUT, now, {SideEffect::ActivateModerateBrownout});
        }
        if (current.state == GuardianState::BROWNOUT) {
            return Move(current, GuardianState::DEGRADED, now, {SideEffect::ActivateHeavyBrownout});
        }
    }

    if (!IsRecovery(metrics, settings)) {
        next.recoveryStart.reset();
    } else if (!next.recoveryStart) {
        next.recoveryStart = now;
    } else if (now - *next.recoveryStart >= settings.recoveryWindow && CanRecover(current.state, settings)) {
        return Move(current, GuardianState::NORMAL, now, {SideEffect::DeactivateBrownout});
    }

    Transition stay;
    stay.next = std::move(next);
    return stay;
}

Transition ResolveEmergency(
    const MachineState& current,
    KillOutcome outcome,
    const HysteresisSettings& settings,
    TimePoint now) {
    if (outcome == KillOutcome::Succeeded) {
        return Move(current, GuardianState::NORMAL, now, {SideEffect::DeactivateBrownout});
    }

    Transition transition = Move(current, GuardianState::LOCKDOWN, now, {});
    transition.next.lockdownUntil = now + settings.lockdownDuration;
    return transition;
}

SystemMetrics WithStateFlags(SystemMetrics metrics, GuardianState state) {
    metrics.degraded = state == GuardianState::DEGRADED
        || state == GuardianState::EMERGENCY
        || state == GuardianState::LOCKDOWN;
    metrics.intakeBlocked = state == GuardianState::EMERGENCY || state == GuardianState::LOCKDOWN;
    metrics.emergencyMode = metrics.intakeBlocked;
    return metrics;
}
