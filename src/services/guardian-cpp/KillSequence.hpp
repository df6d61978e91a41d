#pragma once

#include "Clock.hpp"
#include "ProcessControl.hpp"
#include "ServingApi.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

struct KillSequenceSettings {
    std::chrono::milliseconds drainTimeout{8000};
    std::chrono::milliseconds sigtermGrace{5000};
    std::chrono::milliseconds forceKillWait{1000};
    // Fixed schedule; attempts past its end reuse the last entry.
    std::vector<std::chrono::milliseconds> restartDelays{
        std::chrono::milliseconds(5000),
        std::chrono::milliseconds(15000),
        std::chrono::milliseconds(60000)};
    int maxRestartAttempts = 3;
    std::chrono::milliseconds startupWait{2000};
    std::string pidFilePath = "/tmp/guardian_backend.pid";
    bool smokeTestEnabled = true;
    std::string smokeTestModel = "llama3.2:3b";
};

struct KillSequenceStatus {
    std::optional<TimePoint> lastSuccess;
    int restartAttempts = 0;
    int maxAttempts = 0;
};

// Stop intake, terminate, restart, health gate, resume intake. Only the
// terminate and restart phases can fail the sequence as a whole. Runs to
// completion once started.
class GracefulKillSequence {
public:
    GracefulKillSequence(
        ServingApi& serving,
        BackendApi& backend,
        ProcessControl& processes,
        KillSequenceSettings settings,
        NowFunction now = SystemNow(),
        SleepFunction sleep = ThreadSleep());

    bool Execute();
    KillSequenceStatus GetStatus() const;

    static std::chrono::milliseconds RestartDelayFor(int attempt, const std::vector<std::chrono::milliseconds>& schedule);

private:
    bool StopIntakeAndDrain();
    bool TerminateBackend();
    void StopSessions();
    bool RestartWithBackoff();
    bool StartBackend();
    bool HealthGate();
    bool ResumeIntake();

    ServingApi& serving_;
    BackendApi& backend_;
    ProcessControl& processes_;
    KillSequenceSettings settings_;
    NowFunction now_;
    SleepFunction sleep_;
    int restartAttempts_ = 0;
    std::optional<TimePoint> lastSuccess_;
};
