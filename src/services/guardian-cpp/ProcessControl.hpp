#pragma once

#include <optional>
#include <string>
#include <vector>

// Process-level port used by the metrics collector and the kill sequence.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    virtual std::vector<int> FindBackendPids() = 0;

    // Sends SIGTERM (or SIGKILL when force is set). Returns true when the
    // signal was delivered or the process no longer needs one; error carries
    // the reason whenever delivery did not happen.
    virtual bool Signal(int pid, bool force, std::string& error) = 0;

    virtual bool IsAlive(int pid) = 0;

    // Launches the backend detached from this process. Returns the new PID,
    // or -1 when the launch could not be started.
    virtual int SpawnBackend() = 0;
};

class LinuxProcessControl : public ProcessControl {
public:
    LinuxProcessControl(
        std::vector<std::string> backendCommand,
        std::string outputPath = "/dev/null",
        std::string procRoot = "/proc");

    std::vector<int> FindBackendPids() override;
    bool Signal(int pid, bool force, std::string& error) override;
    bool IsAlive(int pid) override;
    int SpawnBackend() override;

    // True only for the exact canonical invocation: argv[0] names the same
    // executable as command[0] (compared by basename) and the remaining
    // command words follow it verbatim. Extra trailing arguments are allowed.
    static bool MatchesInvocation(const std::vector<std::string>& argv, const std::vector<std::string>& command);
    static std::vector<std::string> ParseCmdline(const std::string& raw);

private:
    std::vector<std::string> backendCommand_;
    std::string outputPath_;
    std::string procRoot_;
};

bool WritePidFile(const std::string& path, int pid);
std::optional<int> ReadPidFile(const std::string& path);
