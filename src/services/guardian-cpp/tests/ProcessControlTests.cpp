#include "ProcessControl.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

void WriteProc(const fs::path& root, int pid, const std::string& cmdline, const std::string& stat) {
    const fs::path dir = root / std::to_string(pid);
    fs::create_directories(dir);
    std::ofstream(dir / "cmdline", std::ios::binary) << cmdline;
    if (!stat.empty()) {
        std::ofstream(dir / "stat") << stat;
    }
}

std::string Cmdline(const std::vector<std::string>& argv) {
    std::string raw;
    for (const auto& arg : argv) {
        raw += arg;
        raw.push_back('\0');
    }
    return raw;
}
} // namespace

int main() {
    const std::vector<std::string> command{"ollama", "serve"};

    if (!LinuxProcessControl::MatchesInvocation({"ollama", "serve"}, command)) {
        return Fail("Canonical invocation should match.");
    }
    if (!LinuxProcessControl::MatchesInvocation({"/usr/local/bin/ollama", "serve", "--verbose"}, command)) {
        return Fail("Absolute path and trailing flags should still match.");
    }
    if (LinuxProcessControl::MatchesInvocation({"ollama", "run", "llama3"}, command)) {
        return Fail("A different sub-command must not match.");
    }
    if (LinuxProcessControl::MatchesInvocation({"python", "tool.py", "ollama", "serve"}, command)) {
        return Fail("Tools that merely mention the backend must not match.");
    }
    if (LinuxProcessControl::MatchesInvocation({"ollama-helper", "serve"}, command)) {
        return Fail("Executable names must match exactly.");
    }
    if (LinuxProcessControl::MatchesInvocation({"ollama"}, command) || LinuxProcessControl::MatchesInvocation({}, command)) {
        return Fail("Short argument lists must not match.");
    }

    const auto parsed = LinuxProcessControl::ParseCmdline(Cmdline({"ollama", "serve", ""}));
    if (parsed.size() != 3 || parsed[0] != "ollama" || parsed[1] != "serve" || !parsed[2].empty()) {
        return Fail("ParseCmdline should split on NUL and keep empty arguments.");
    }
    if (!LinuxProcessControl::ParseCmdline("").empty()) {
        return Fail("Empty cmdline should parse to no arguments.");
    }

    const fs::path root = fs::temp_directory_path() / ("guardian_proc_test_" + std::to_string(getpid()));
    fs::remove_all(root);
    WriteProc(root, 10, Cmdline({"ollama", "serve"}), "10 (ollama) S 1 10 10 0");
    WriteProc(root, 11, Cmdline({"/usr/bin/ollama", "serve", "--verbose"}), "11 (ollama) R 1 11 11 0");
    WriteProc(root, 12, Cmdline({"ollama", "run", "llama3"}), "12 (my) proc) Z 1 12 12 0");
    WriteProc(root, 13, Cmdline({"python", "watch.py", "ollama", "serve"}), "");
    WriteProc(root, 14, "", "14 (kworker/0:1) I 2 0 0 0");
    WriteProc(root, getpid(), Cmdline({"ollama", "serve"}), "");
    fs::create_directories(root / "self");
    fs::create_directories(root / "sys");

    {
        LinuxProcessControl processes(command, "/dev/null", root.string());
        const std::vector<int> pids = processes.FindBackendPids();
        if (pids != std::vector<int>{10, 11}) {
            return Fail("Enumeration should return only exact invocations, excluding this process.");
        }
        if (!processes.IsAlive(10) || !processes.IsAlive(11)) {
            return Fail("Sleeping and running processes are alive.");
        }
        if (processes.IsAlive(12)) {
            return Fail("Zombie process should not be reported alive.");
        }
        if (processes.IsAlive(99) || processes.IsAlive(0)) {
            return Fail("Missing processes are not alive.");
        }

        std::string error;
        if (processes.Signal(0, false, error) || error.empty()) {
            return Fail("Signalling an invalid PID should fail with a reason.");
        }
    }

    {
        LinuxProcessControl processes(command, "/dev/null", (root / "missing").string());
        if (!processes.FindBackendPids().empty()) {
            return Fail("Unreadable process root should yield no PIDs.");
        }
    }

    {
        const std::string pidFile = (root / "backend.pid").string();
        if (ReadPidFile(pidFile)) {
            return Fail("Missing PID file should read as empty.");
        }
        if (!WritePidFile(pidFile, 4242)) {
            return Fail("PID file should be writable.");
        }
        const auto pid = ReadPidFile(pidFile);
        if (!pid || *pid != 4242) {
            return Fail("PID file should read back the written PID.");
        }
        std::ofstream(pidFile, std::ios::trunc) << "not-a-pid\n";
        if (ReadPidFile(pidFile)) {
            return Fail("Garbage PID file should be ignored.");
        }
        if (WritePidFile(pidFile, 0)) {
            return Fail("Invalid PID must not be written.");
        }
    }

    {
        LinuxProcessControl processes({"sleep", "31.5"}, (root / "spawn.log").string());
        const int pid = processes.SpawnBackend();
        if (pid <= 0) {
            return Fail("Spawning a detached process should report its PID.");
        }

        bool found = false;
        for (int attempt = 0; attempt < 50 && !found; ++attempt) {
            const auto pids = processes.FindBackendPids();
            found = std::find(pids.begin(), pids.end(), pid) != pids.end();
            if (!found) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
        if (!found || !processes.IsAlive(pid)) {
            return Fail("Spawned process should be found by its invocation.");
        }
        if (getsid(pid) == getsid(0)) {
            return Fail("Spawned process should run in a detached session.");
        }

        std::string error;
        if (!processes.Signal(pid, true, error)) {
            return Fail("SIGKILL to the spawned process failed: " + error);
        }
        bool gone = false;
        for (int attempt = 0; attempt < 100 && !gone; ++attempt) {
            gone = !processes.IsAlive(pid);
            if (!gone) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
        if (!gone) {
            return Fail("Killed process should stop being alive.");
        }
    }

    {
        LinuxProcessControl processes({"guardian-test-no-such-binary"}, "/dev/null");
        const int pid = processes.SpawnBackend();
        if (pid > 0) {
            bool exited = false;
            for (int attempt = 0; attempt < 100 && !exited; ++attempt) {
                exited = !processes.IsAlive(pid);
                if (!exited) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                }
            }
            if (!exited) {
                return Fail("Missing executable should exit right after spawn.");
            }
        }
    }

    fs::remove_all(root);
    std::cout << "Process control tests passed." << std::endl;
    return 0;
}
