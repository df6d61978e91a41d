#include "Guardian.hpp"

#include "Tracing.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <utility>

namespace {
std::size_t HistoryLimit(const HysteresisSettings& settings) {
    return std::max<std::size_t>(settings.measurementWindow, 1);
}

bool Contains(const std::vector<SideEffect>& effects, SideEffect effect) {
    return std::find(effects.begin(), effects.end(), effect) != effects.end();
}

nlohmann::json MetricsToJson(const SystemMetrics& metrics) {
    nlohmann::json json = {
        {"timestamp", FormatIso8601(metrics.timestamp)},
        {"ram_pct", metrics.ramPct},
        {"ram_gb", metrics.ramGb},
        {"cpu_pct", metrics.cpuPct},
        {"disk_pct", metrics.diskPct},
        {"temp_c", nullptr},
        {"backend_pids", metrics.backendPids},
        {"degraded", metrics.degraded},
        {"intake_blocked", metrics.intakeBlocked},
        {"emergency_mode", metrics.emergencyMode}
    };
    if (metrics.tempC) {
        json["temp_c"] = *metrics.tempC;
    }
    return json;
}
} // namespace

Guardian::Guardian(
    GuardianConfig config,
    MetricsSource& metrics,
    ServingApi& serving,
    BackendApi& backend,
    ProcessControl& processes,
    NowFunction now,
    SleepFunction sleep)
    : config_(std::move(config)),
      metrics_(metrics),
      serving_(serving),
      now_(std::move(now)),
      brownout_(serving, config_.brownout, now_),
      killSequence_(serving, backend, processes, config_.killSequence, now_, std::move(sleep)),
      rateLimiter_(config_.killRate) {
    startedAt_ = now_();
    machine_ = InitialMachineState(startedAt_);
    status_ = BuildStatus();
}

void Guardian::Tick() {
    try {
        const SystemMetrics sample = metrics_.Collect();
        Evaluate(sample);

        const SystemMetrics stamped = WithStateFlags(sample, machine_.state);
        Remember(stamped);
        if (config_.metricsLogEnabled) {
            LogMetrics(stamped);
        }
    } catch (const std::exception& ex) {
        std::cerr << "[Guardian] tick failed: " << ex.what() << std::endl;
    } catch (...) {
        std::cerr << "[Guardian] tick failed: unknown error" << std::endl;
    }

    try {
        PublishStatus();
    } catch (const std::exception& ex) {
        std::cerr << "[Guardian] status publish failed: " << ex.what() << std::endl;
    } catch (...) {
        std::cerr << "[Guardian] status publish failed: unknown error" << std::endl;
    }
}

void Guardian::Run(CancellationToken& token) {
    std::cout << "[Guardian] control loop started, polling every "
              << std::chrono::duration<double>(config_.pollInterval).count() << "s" << std::endl;

    while (!token.IsCancelled()) {
        const TimePoint tickStart = now_();
        Tick();

        // A wall-clock step during the tick must not stretch the wait past one interval.
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - tickStart);
        const auto remaining = std::clamp(
            config_.pollInterval - elapsed, std::chrono::milliseconds(0), config_.pollInterval);
        if (token.WaitFor(remaining)) {
            break;
        }
    }

    std::cout << "[Guardian] control loop stopped in state " << ToString(machine_.state) << std::endl;
}

GuardianState Guardian::State() const {
    return machine_.state;
}

const std::deque<SystemMetrics>& Guardian::History() const {
    return history_;
}

nlohmann::json Guardian::GetStatus() const {
    std::lock_guard<std::mutex> lock(statusMutex_);
    return status_;
}

void Guardian::Evaluate(const SystemMetrics& metrics) {
    const Transition transition = EvaluateTick(machine_, metrics, config_.hysteresis, now_());
    if (!transition.changed) {
        machine_ = transition.next;
        ReconcileBrownout();
        return;
    }

    if (transition.next.state == GuardianState::EMERGENCY) {
        std::cerr << "[Guardian] EMERGENCY: RAM=" << std::fixed << std::setprecision(1) << metrics.ramPct
                  << "% CPU=" << metrics.cpuPct << "% disk=" << metrics.diskPct << "%" << std::defaultfloat
                  << std::endl;
    }
    if (Contains(transition.effects, SideEffect::RunKillSequence)) {
        // EMERGENCY with kills enabled has no exit except ResolveEmergency.
        try {
            Apply(transition);
        } catch (const std::exception& ex) {
            std::cerr << "[Guardian] entering EMERGENCY failed: " << ex.what() << std::endl;
        }
        HandleEmergency(metrics);
        return;
    }

    Apply(transition);
    if (machine_.state == GuardianState::EMERGENCY) {
        std::cerr << "[Guardian] kill sequence disabled, holding EMERGENCY" << std::endl;
    }
}

void Guardian::Apply(const Transition& transition) {
    std::cout << "[Guardian] state transition: " << ToString(machine_.state) << " -> "
              << ToString(transition.next.state) << std::endl;
    machine_ = transition.next;
    RunEffects(transition.effects);
}

void Guardian::RunEffects(const std::vector<SideEffect>& effects) {
    for (const SideEffect effect : effects) {
        switch (effect) {
            case SideEffect::ActivateModerateBrownout:
                ApplyBrownoutLevel(BrownoutLevel::MODERATE);
                break;
            case SideEffect::ActivateHeavyBrownout:
                ApplyBrownoutLevel(BrownoutLevel::HEAVY);
                break;
            case SideEffect::DeactivateBrownout:
                ApplyBrownoutLevel(BrownoutLevel::NONE);
                break;
            case SideEffect::ResumeIntake:
                if (!serving_.ResumeIntake()) {
                    std::cerr << "[Guardian] resume intake failed" << std::endl;
                }
                break;
            case SideEffect::RunKillSequence:
                break;
        }
    }
}

void Guardian::HandleEmergency(const SystemMetrics& trigger) {
    // Operators and the aggregator see EMERGENCY while the sequence runs.
    try {
        PublishStatus();
    } catch (const std::exception& ex) {
        std::cerr << "[Guardian] status publish failed: " << ex.what() << std::endl;
    }

    ScopedSpan span("guardian.emergency");
    Tracer::Instance().SetAttribute(span.Handle(), "guardian.ram_pct", trigger.ramPct);
    Tracer::Instance().SetAttribute(span.Handle(), "guardian.cpu_pct", trigger.cpuPct);
    Tracer::Instance().SetAttribute(span.Handle(), "guardian.disk_pct", trigger.diskPct);

    KillOutcome outcome = KillOutcome::Failed;
    try {
        outcome = AttemptKill();
    } catch (const std::exception& ex) {
        std::cerr << "[Guardian] emergency handling failed: " << ex.what() << std::endl;
        outcome = KillOutcome::Failed;
    } catch (...) {
        std::cerr << "[Guardian] emergency handling failed: unknown error" << std::endl;
        outcome = KillOutcome::Failed;
    }

    Apply(ResolveEmergency(machine_, outcome, config_.hysteresis, now_()));
    Tracer::Instance().SetAttribute(span.Handle(), "guardian.outcome", std::string(ToString(machine_.state)));
    if (outcome == KillOutcome::Succeeded) {
        span.Succeed();
    }
    if (machine_.state == GuardianState::LOCKDOWN) {
        std::cerr << "[Guardian] LOCKDOWN for "
                  << std::chrono::duration<double>(config_.hysteresis.lockdownDuration).count()
                  << "s, manual intervention required" << std::endl;
    }
}

KillOutcome Guardian::AttemptKill() {
    const TimePoint attemptAt = now_();
    const KillDecision decision = rateLimiter_.Check(attemptAt);
    if (decision != KillDecision::Allowed) {
        std::cerr << "[Guardian] kill rejected (" << ToString(decision) << "), entering lockdown" << std::endl;
        return KillOutcome::RateLimited;
    }

    rateLimiter_.RecordKill(attemptAt);
    if (!killSequence_.Execute()) {
        std::cerr << "[Guardian] emergency kill sequence failed" << std::endl;
        return KillOutcome::Failed;
    }
    std::cout << "[Guardian] emergency kill sequence completed" << std::endl;
    return KillOutcome::Succeeded;
}

void Guardian::ReconcileBrownout() {
    if (!config_.enableBrownout) {
        return;
    }

    BrownoutLevel desired = BrownoutLevel::NONE;
    switch (machine_.state) {
        case GuardianState::NORMAL:
            desired = BrownoutLevel::NONE;
            break;
        case GuardianState::BROWNOUT:
            desired = BrownoutLevel::MODERATE;
            break;
        case GuardianState::DEGRADED:
            desired = BrownoutLevel::HEAVY;
            break;
        default:
            return;
    }

    const BrownoutState current = brownout_.GetState();
    if (desired == BrownoutLevel::NONE) {
        if (current.active || current.partial) {
            std::cout << "[Guardian] retrying brownout deactivation" << std::endl;
            brownout_.Deactivate();
        }
        return;
    }

    if (!current.active || current.level != desired) {
        std::cout << "[Guardian] retrying brownout level " << ToString(desired) << std::endl;
        brownout_.Activate(desired);
    }
}

void Guardian::ApplyBrownoutLevel(BrownoutLevel level) {
    if (!config_.enableBrownout) {
        std::cout << "[Guardian] brownout disabled, skipping level " << ToString(level) << std::endl;
        return;
    }

    const bool ok = level == BrownoutLevel::NONE ? brownout_.Deactivate() : brownout_.Activate(level);
    if (!ok) {
        std::cerr << "[Guardian] brownout change to " << ToString(level) << " incomplete, retrying next tick"
                  << std::endl;
    }
}

void Guardian::Remember(const SystemMetrics& metrics) {
    history_.push_back(metrics);
    while (history_.size() > HistoryLimit(config_.hysteresis)) {
        history_.pop_front();
    }
}

void Guardian::LogMetrics(const SystemMetrics& metrics) const {
    const BrownoutState brownout = brownout_.GetState();
    nlohmann::json line = {
        {"timestamp", FormatIso8601(metrics.timestamp)},
        {"guardian_state", ToString(machine_.state)},
        {"state_duration_s", SecondsBetween(machine_.enteredAt, now_())},
        {"ram_pct", metrics.ramPct},
        {"cpu_pct", metrics.cpuPct},
        {"disk_pct", metrics.diskPct},
        {"temp_c", nullptr},
        {"backend_pids", metrics.backendPids.size()},
        {"brownout_active", brownout.active},
        {"brownout_level", ToString(brownout.level)}
    };
    if (metrics.tempC) {
        line["temp_c"] = *metrics.tempC;
    }
    std::cout << "[Metrics] " << line.dump() << std::endl;
}

void Guardian::PublishStatus() {
    nlohmann::json status = BuildStatus();
    if (!config_.statusFilePath.empty()) {
        WriteStatusFile(status);
    }

    std::lock_guard<std::mutex> lock(statusMutex_);
    status_ = std::move(status);
}

nlohmann::json Guardian::BuildStatus() {
    const TimePoint now = now_();

    double lockdownRemaining = 0.0;
    if (machine_.state == GuardianState::LOCKDOWN && machine_.lockdownUntil) {
        lockdownRemaining = std::max(0.0, SecondsBetween(now, *machine_.lockdownUntil));
    }

    const KillSequenceStatus kill = killSequence_.GetStatus();
    nlohmann::json killswitch = {
        {"loaded", config_.hysteresis.killEnabled},
        {"last_execution", nullptr},
        {"restart_attempts", kill.restartAttempts},
        {"max_attempts", kill.maxAttempts},
        {"kills_in_window", rateLimiter_.KillsInWindow(now)},
        {"last_kill", nullptr}
    };
    if (kill.lastSuccess) {
        killswitch["last_execution"] = FormatIso8601(*kill.lastSuccess);
    }
    if (const auto lastKill = rateLimiter_.LastKill()) {
        killswitch["last_kill"] = FormatIso8601(*lastKill);
    }

    const BrownoutState brownoutState = brownout_.GetState();
    const BrownoutSettings& settings = brownout_.Settings();
    nlohmann::json brownout = {
        {"active", brownoutState.active},
        {"level", ToString(brownoutState.level)},
        {"activation_time", nullptr},
        {"duration_s", brownoutState.durationS},
        {"partial", brownoutState.partial},
        {"failed_calls", brownout_.FailedCalls()},
        {"config", {
            {"model_primary", settings.modelPrimary},
            {"model_fallback", settings.modelFallback},
            {"context_window_normal", settings.contextWindowNormal},
            {"context_window_reduced", settings.contextWindowReduced},
            {"rag_top_k_normal", settings.ragTopKNormal},
            {"rag_top_k_reduced", settings.ragTopKReduced},
            {"tools_moderate", settings.toolsModerate},
            {"tools_heavy", settings.toolsHeavy}
        }}
    };
    if (brownoutState.activationTime) {
        brownout["activation_time"] = FormatIso8601(*brownoutState.activationTime);
    }

    nlohmann::json status = {
        {"status", ToString(machine_.state)},
        {"previous_state", ToString(machine_.previous)},
        {"uptime_s", SecondsBetween(startedAt_, now)},
        {"state_duration_s", SecondsBetween(machine_.enteredAt, now)},
        {"lockdown_remaining_s", lockdownRemaining},
        {"metrics", nullptr},
        {"killswitch", killswitch},
        {"brownout", brownout}
    };
    if (!history_.empty()) {
        status["metrics"] = MetricsToJson(history_.back());
    }
    return status;
}

void Guardian::WriteStatusFile(const nlohmann::json& status) const {
    const std::string tempPath = config_.statusFilePath + ".tmp";
    {
        std::ofstream output(tempPath, std::ios::trunc);
        if (!output) {
            std::cerr << "[Guardian] cannot write status file " << tempPath << std::endl;
            return;
        }
        output << status.dump(2) << '\n';
        if (!output) {
            std::cerr << "[Guardian] short write to status file " << tempPath << std::endl;
            return;
        }
    }

    std::error_code error;
    std::filesystem::rename(tempPath, config_.statusFilePath, error);
    if (error) {
        std::cerr << "[Guardian] cannot publish status file: " << error.message() << std::endl;
    }
}
