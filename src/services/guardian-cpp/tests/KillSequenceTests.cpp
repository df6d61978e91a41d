#include "KillSequence.hpp"
#include "Fakes.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

using std::chrono::milliseconds;

KillSequenceSettings TestSettings(const std::string& pidFile) {
    KillSequenceSettings settings;
    settings.pidFilePath = pidFile;
    return settings;
}

bool Contains(const std::vector<int>& values, int value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}
} // namespace

int main() {
    const std::string pidFile = (std::filesystem::temp_directory_path()
        / ("guardian_kill_test_" + std::to_string(getpid()) + ".pid")).string();
    FakeClock clock;

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        processes.live = {100, 101};
        backend.loadedModels = {"llama3.2:3b"};
        std::vector<milliseconds> sleeps;

        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn(&sleeps));
        const TimePoint started = clock.Now();
        if (!sequence.Execute()) {
            return Fail("Sequence should succeed when the backend stops and restarts.");
        }
        if (serving.calls.empty() || serving.calls.front() != "stop_intake" || serving.calls.back() != "resume_intake") {
            return Fail("Intake should be stopped first and resumed last.");
        }
        if (backend.unloaded.size() != 1 || backend.unloaded.front() != "llama3.2:3b") {
            return Fail("Loaded sessions should be stopped before signalling.");
        }
        if (!Contains(processes.signals, 100) || !Contains(processes.signals, 101)) {
            return Fail("Every backend PID should receive SIGTERM.");
        }
        if (Contains(processes.signals, -100) || Contains(processes.signals, -101)) {
            return Fail("No SIGKILL expected when SIGTERM is honoured.");
        }
        if (processes.live.count(100) != 0 || processes.live.count(101) != 0 || processes.live.size() != 1) {
            return Fail("Only the replacement backend should be alive.");
        }
        const auto hint = ReadPidFile(pidFile);
        if (!hint || *hint != *processes.live.begin()) {
            return Fail("PID file should hold the replacement PID.");
        }
        const std::vector<milliseconds> expected{milliseconds(8000), milliseconds(5000), milliseconds(5000),
                                                 milliseconds(2000)};
        if (sleeps != expected) {
            return Fail("Unexpected wait sequence for drain, grace, backoff and startup.");
        }
        if (backend.healthChecks != 1 || backend.smokeModels.size() != 1) {
            return Fail("Health gate should check health and run one smoke test.");
        }
        const KillSequenceStatus status = sequence.GetStatus();
        if (!status.lastSuccess || *status.lastSuccess != started || status.restartAttempts != 0
            || status.maxAttempts != 3) {
            return Fail("Status should record the successful run.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        processes.live = {200, 201};
        processes.ignoreTerm = {200};
        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn());
        if (!sequence.Execute()) {
            return Fail("Sequence should force-kill a survivor and continue.");
        }
        if (!Contains(processes.signals, -200) || Contains(processes.signals, -201)) {
            return Fail("Only the SIGTERM survivor should receive SIGKILL.");
        }
        if (processes.live.count(200) != 0) {
            return Fail("No backend-matching process should survive termination.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        processes.live = {300};
        processes.ignoreTerm = {300};
        processes.unkillable = {300};
        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn());
        if (sequence.Execute()) {
            return Fail("Sequence should fail when termination cannot be confirmed.");
        }
        if (processes.spawnAttempts != 0) {
            return Fail("No restart should be attempted after a failed termination.");
        }
        if (serving.CountPrefix("resume_intake") != 0) {
            return Fail("Intake should stay stopped after an aborted sequence.");
        }
        if (sequence.GetStatus().lastSuccess) {
            return Fail("Failed run must not record a success time.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        processes.spawnFailuresLeft = 2;
        std::vector<milliseconds> sleeps;
        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn(&sleeps));
        if (!sequence.Execute()) {
            return Fail("Third restart attempt should succeed.");
        }
        if (processes.spawnAttempts != 3) {
            return Fail("Expected three spawn attempts.");
        }
        if (sleeps.size() != 5) {
            return Fail("Expected drain, three backoff waits and one startup wait.");
        }
        if (sleeps[1] != milliseconds(5000) || sleeps[2] != milliseconds(15000) || sleeps[3] != milliseconds(60000)) {
            return Fail("Backoff should follow the fixed schedule.");
        }
        if (sequence.GetStatus().restartAttempts != 0) {
            return Fail("Restart counter should reset after a successful restart.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        processes.spawnFailuresLeft = 10;
        KillSequenceSettings settings = TestSettings(pidFile);
        settings.maxRestartAttempts = 4;
        std::vector<milliseconds> sleeps;
        GracefulKillSequence sequence(serving, backend, processes, settings, clock.NowFn(), clock.SleepFn(&sleeps));
        if (sequence.Execute()) {
            return Fail("Exhausted restarts should fail the sequence.");
        }
        const std::vector<milliseconds> expected{milliseconds(8000), milliseconds(5000), milliseconds(15000),
                                                 milliseconds(60000), milliseconds(60000)};
        if (sleeps != expected) {
            return Fail("Attempts past the schedule should reuse its last delay.");
        }
        if (sequence.GetStatus().restartAttempts != 4) {
            return Fail("Status should count every failed restart attempt.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        processes.diesOnStart = true;
        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn());
        if (sequence.Execute()) {
            return Fail("A backend that dies during startup is not a successful restart.");
        }
        if (processes.spawnAttempts != 3) {
            return Fail("Each early exit should consume a restart attempt.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        backend.healthy = false;
        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn());
        if (sequence.Execute()) {
            return Fail("Failed health check should fail the sequence.");
        }
        if (serving.CountPrefix("resume_intake") != 0) {
            return Fail("Intake must not resume after a failed health gate.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        backend.smokeOk = false;
        serving.failing = {"stop_intake", "resume_intake"};
        backend.listOk = false;
        GracefulKillSequence sequence(serving, backend, processes, TestSettings(pidFile), clock.NowFn(),
                                      clock.SleepFn());
        if (!sequence.Execute()) {
            return Fail("Smoke test, intake and session failures are warnings only.");
        }
    }

    {
        FakeServingApi serving;
        FakeBackendApi backend;
        FakeProcessControl processes;
        KillSequenceSettings settings = TestSettings(pidFile);
        settings.smokeTestEnabled = false;
        GracefulKillSequence sequence(serving, backend, processes, settings, clock.NowFn(), clock.SleepFn());
        if (!sequence.Execute() || !backend.smokeModels.empty()) {
            return Fail("Disabled smoke test should not be issued.");
        }
    }

    {
        const std::vector<milliseconds> schedule{milliseconds(1), milliseconds(2)};
        if (GracefulKillSequence::RestartDelayFor(0, schedule) != milliseconds(1)
            || GracefulKillSequence::RestartDelayFor(1, schedule) != milliseconds(2)
            || GracefulKillSequence::RestartDelayFor(7, schedule) != milliseconds(2)) {
            return Fail("RestartDelayFor should clamp to the last scheduled delay.");
        }
        if (GracefulKillSequence::RestartDelayFor(0, {}) != milliseconds(0)) {
            return Fail("Empty schedule should mean no delay.");
        }
    }

    std::error_code ignored;
    std::filesystem::remove(pidFile, ignored);

    std::cout << "Kill sequence tests passed." << std::endl;
    return 0;
}
