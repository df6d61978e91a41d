#include "KillSequence.hpp"

#include "Tracing.hpp"

#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace {
std::string JoinPids(const std::vector<int>& pids) {
    std::ostringstream output;
    for (std::size_t i = 0; i < pids.size(); ++i) {
        if (i > 0) {
            output << ", ";
        }
        output << pids[i];
    }
    return output.str();
}

double ToSeconds(std::chrono::milliseconds duration) {
    return std::chrono::duration<double>(duration).count();
}
} // namespace

GracefulKillSequence::GracefulKillSequence(
    ServingApi& serving,
    BackendApi& backend,
    ProcessControl& processes,
    KillSequenceSettings settings,
    NowFunction now,
    SleepFunction sleep)
    : serving_(serving),
      backend_(backend),
      processes_(processes),
      settings_(std::move(settings)),
      now_(std::move(now)),
      sleep_(std::move(sleep)) {}

bool GracefulKillSequence::Execute() {
    std::cout << "[KillSequence] starting graceful kill sequence" << std::endl;
    const TimePoint started = now_();
    ScopedSpan span("kill_sequence");

    try {
        if (!StopIntakeAndDrain()) {
            std::cerr << "[KillSequence] intake not stopped cleanly, continuing" << std::endl;
        }

        if (!TerminateBackend()) {
            std::cerr << "[KillSequence] backend termination failed" << std::endl;
            return false;
        }

        if (!RestartWithBackoff()) {
            std::cerr << "[KillSequence] backend restart failed" << std::endl;
            return false;
        }

        if (!HealthGate()) {
            std::cerr << "[KillSequence] health gate failed" << std::endl;
            return false;
        }

        if (!ResumeIntake()) {
            std::cerr << "[KillSequence] intake not resumed, manual intervention may be needed" << std::endl;
        }
    } catch (const std::exception& ex) {
        std::cerr << "[KillSequence] aborted: " << ex.what() << std::endl;
        return false;
    }

    lastSuccess_ = started;
    span.Succeed();
    std::cout << "[KillSequence] completed in " << std::fixed << std::setprecision(1)
              << SecondsBetween(started, now_()) << "s" << std::defaultfloat << std::endl;
    return true;
}

KillSequenceStatus GracefulKillSequence::GetStatus() const {
    KillSequenceStatus status;
    status.lastSuccess = lastSuccess_;
    status.restartAttempts = restartAttempts_;
    status.maxAttempts = settings_.maxRestartAttempts;
    return status;
}

std::chrono::milliseconds GracefulKillSequence::RestartDelayFor(
    int attempt,
    const std::vector<std::chrono::milliseconds>& schedule) {
    if (schedule.empty()) {
        return std::chrono::milliseconds(0);
    }
    const auto index = static_cast<std::size_t>(std::max(attempt, 0));
    return schedule[std::min(index, schedule.size() - 1)];
}

bool GracefulKillSequence::StopIntakeAndDrain() {
    ScopedSpan span("kill_sequence.stop_intake");

    const bool stopped = serving_.StopIntake();
    if (!stopped) {
        std::cerr << "[KillSequence] stop-intake request failed" << std::endl;
    }

    std::cout << "[KillSequence] draining for " << ToSeconds(settings_.drainTimeout) << "s" << std::endl;
    sleep_(settings_.drainTimeout);

    if (stopped) {
        span.Succeed();
    }
    return stopped;
}

bool GracefulKillSequence::TerminateBackend() {
    ScopedSpan span("kill_sequence.terminate");

    const std::vector<int> pids = processes_.FindBackendPids();
    const auto hint = ReadPidFile(settings_.pidFilePath);
    if (hint && std::find(pids.begin(), pids.end(), *hint) == pids.end()) {
        std::cout << "[KillSequence] PID file hint " << *hint << " does not match a live backend" << std::endl;
    }

    if (pids.empty()) {
        std::cout << "[KillSequence] no backend processes found" << std::endl;
        span.Succeed();
        return true;
    }

    Tracer::Instance().SetAttribute(span.Handle(), "backend.pid_count", static_cast<int64_t>(pids.size()));
    std::cout << "[KillSequence] backend processes: " << JoinPids(pids) << std::endl;

    StopSessions();

    for (const int pid : pids) {
        std::string error;
        if (!processes_.Signal(pid, false, error)) {
            std::cerr << "[KillSequence] SIGTERM to " << pid << " failed: " << error << std::endl;
        } else if (!error.empty()) {
            std::cout << "[KillSequence] SIGTERM to " << pid << ": " << error << std::endl;
        }
    }

    std::cout << "[KillSequence] waiting " << ToSeconds(settings_.sigtermGrace) << "s for graceful shutdown" << std::endl;
    sleep_(settings_.sigtermGrace);

    std::vector<int> remaining = processes_.FindBackendPids();
    if (!remaining.empty()) {
        std::cerr << "[KillSequence] force killing: " << JoinPids(remaining) << std::endl;
        for (const int pid : remaining) {
            std::string error;
            if (!processes_.Signal(pid, true, error)) {
                std::cerr << "[KillSequence] SIGKILL to " << pid << " failed: " << error << std::endl;
            }
        }

        sleep_(settings_.forceKillWait);
        remaining = processes_.FindBackendPids();
    }

    if (!remaining.empty()) {
        std::cerr << "[KillSequence] backend still running after SIGKILL: " << JoinPids(remaining) << std::endl;
        return false;
    }

    span.Succeed();
    return true;
}

void GracefulKillSequence::StopSessions() {
    std::vector<std::string> models;
    if (!backend_.ListLoadedModels(models)) {
        std::cout << "[KillSequence] could not list backend sessions, skipping session stop" << std::endl;
        return;
    }

    for (const auto& model : models) {
        if (backend_.UnloadModel(model)) {
            std::cout << "[KillSequence] unloaded session " << model << std::endl;
        } else {
            std::cout << "[KillSequence] could not unload session " << model << std::endl;
        }
    }
}

bool GracefulKillSequence::RestartWithBackoff() {
    ScopedSpan span("kill_sequence.restart");

    for (int attempt = 0; attempt < settings_.maxRestartAttempts; ++attempt) {
        const auto delay = RestartDelayFor(attempt, settings_.restartDelays);
        std::cout << "[KillSequence] restart attempt " << (attempt + 1) << "/" << settings_.maxRestartAttempts
                  << " after " << ToSeconds(delay) << "s" << std::endl;
        sleep_(delay);

        if (StartBackend()) {
            restartAttempts_ = 0;
            Tracer::Instance().SetAttribute(span.Handle(), "restart.attempt", static_cast<int64_t>(attempt + 1));
            span.Succeed();
            return true;
        }

        ++restartAttempts_;
        std::cerr << "[KillSequence] restart attempt " << (attempt + 1) << " failed" << std::endl;
    }

    std::cerr << "[KillSequence] all restart attempts failed" << std::endl;
    return false;
}

bool GracefulKillSequence::StartBackend() {
    const int pid = processes_.SpawnBackend();
    if (pid <= 0) {
        return false;
    }

    if (!WritePidFile(settings_.pidFilePath, pid)) {
        std::cerr << "[KillSequence] could not write PID file " << settings_.pidFilePath << std::endl;
    }

    sleep_(settings_.startupWait);
    if (!processes_.IsAlive(pid)) {
        std::cerr << "[KillSequence] backend " << pid << " exited during startup" << std::endl;
        return false;
    }

    std::cout << "[KillSequence] backend started with PID " << pid << std::endl;
    return true;
}

bool GracefulKillSequence::HealthGate() {
    ScopedSpan span("kill_sequence.health_gate");

    if (!backend_.CheckHealth()) {
        return false;
    }

    // Smoke-test failures are tolerated: the model may not be loaded yet
    // right after a cold start.
    if (settings_.smokeTestEnabled) {
        if (backend_.SmokeTest(settings_.smokeTestModel)) {
            std::cout << "[KillSequence] smoke test passed" << std::endl;
        } else {
            std::cout << "[KillSequence] smoke test failed (non-fatal)" << std::endl;
        }
    }

    span.Succeed();
    return true;
}

bool GracefulKillSequence::ResumeIntake() {
    ScopedSpan span("kill_sequence.resume_intake");

    if (!serving_.ResumeIntake()) {
        return false;
    }

    std::cout << "[KillSequence] intake resumed" << std::endl;
    span.Succeed();
    return true;
}
