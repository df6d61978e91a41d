#pragma once

#include "BrownoutManager.hpp"
#include "CancellationToken.hpp"
#include "Clock.hpp"
#include "GuardianConfig.hpp"
#include "GuardianState.hpp"
#include "KillRateLimiter.hpp"
#include "KillSequence.hpp"
#include "ProcessControl.hpp"
#include "ServingApi.hpp"
#include "SystemMetrics.hpp"

#include <nlohmann/json.hpp>

#include <deque>
#include <mutex>
#include <optional>

// The control loop. Every mutable member except the published status is
// touched only from the thread running Tick()/Run().
class Guardian {
public:
    Guardian(
        GuardianConfig config,
        MetricsSource& metrics,
        ServingApi& serving,
        BackendApi& backend,
        ProcessControl& processes,
        NowFunction now = SystemNow(),
        SleepFunction sleep = ThreadSleep());

    // One full iteration: collect, decide, act, publish. Never throws.
    void Tick();

    // Ticks every poll interval until the token is cancelled. The tick in
    // progress, including any kill sequence, always runs to completion.
    void Run(CancellationToken& token);

    GuardianState State() const;
    const std::deque<SystemMetrics>& History() const;

    // Safe from any thread.
    nlohmann::json GetStatus() const;

private:
    void Evaluate(const SystemMetrics& metrics);
    void Apply(const Transition& transition);
    void RunEffects(const std::vector<SideEffect>& effects);
    void HandleEmergency(const SystemMetrics& trigger);
    KillOutcome AttemptKill();
    void ReconcileBrownout();
    void ApplyBrownoutLevel(BrownoutLevel level);
    void Remember(const SystemMetrics& metrics);
    void LogMetrics(const SystemMetrics& metrics) const;
    void PublishStatus();
    nlohmann::json BuildStatus();
    void WriteStatusFile(const nlohmann::json& status) const;

    GuardianConfig config_;
    MetricsSource& metrics_;
    ServingApi& serving_;
    NowFunction now_;
    BrownoutManager brownout_;
    GracefulKillSequence killSequence_;
    KillRateLimiter rateLimiter_;

    TimePoint startedAt_;
    MachineState machine_;
    std::deque<SystemMetrics> history_;

    mutable std::mutex statusMutex_;
    nlohmann::json status_;
};
