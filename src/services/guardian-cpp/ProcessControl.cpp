#include "ProcessControl.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
std::string Basename(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::string ReadWholeFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return {};
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

bool ParsePid(const std::string& name, int& pid) {
    if (name.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), pid);
    return ec == std::errc{} && ptr == name.data() + name.size() && pid > 0;
}

// Format: pid (comm) state ppid ...; comm may contain spaces or parens.
char ReadProcessState(const fs::path& statPath) {
    const std::string content = ReadWholeFile(statPath);
    const auto commEnd = content.rfind(')');
    if (commEnd == std::string::npos || commEnd + 2 >= content.size()) {
        return '\0';
    }
    return content[commEnd + 2];
}

std::string DescribeKillError(int err) {
    switch (err) {
        case EPERM:
            return "permission denied";
        case ESRCH:
            return "process already exited";
        case EINVAL:
            return "invalid signal";
        default:
            return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
    }
}
} // namespace

LinuxProcessControl::LinuxProcessControl(
    std::vector<std::string> backendCommand,
    std::string outputPath,
    std::string procRoot)
    : backendCommand_(std::move(backendCommand)),
      outputPath_(std::move(outputPath)),
      procRoot_(std::move(procRoot)) {}

std::vector<int> LinuxProcessControl::FindBackendPids() {
    std::vector<int> pids;
    const int selfPid = static_cast<int>(getpid());

    std::error_code error;
    fs::directory_iterator it(procRoot_, error);
    if (error) {
        std::cerr << "[Process] cannot enumerate " << procRoot_ << ": " << error.message() << std::endl;
        return pids;
    }

    fs::directory_iterator end;
    for (; !error && it != end; it.increment(error)) {
        int pid = 0;
        if (!ParsePid(it->path().filename().string(), pid) || pid == selfPid) {
            continue;
        }

        // Processes can exit between listing and reading; an empty cmdline
        // (kernel thread, zombie, vanished) simply does not match.
        const auto argv = ParseCmdline(ReadWholeFile(it->path() / "cmdline"));
        if (MatchesInvocation(argv, backendCommand_)) {
            pids.push_back(pid);
        }
    }

    std::sort(pids.begin(), pids.end());
    return pids;
}

bool LinuxProcessControl::Signal(int pid, bool force, std::string& error) {
    error.clear();
    if (pid <= 0) {
        error = "invalid PID";
        return false;
    }

    if (kill(pid, force ? SIGKILL : SIGTERM) == 0) {
        return true;
    }

    const int err = errno;
    error = DescribeKillError(err);
    return err == ESRCH;
}

bool LinuxProcessControl::IsAlive(int pid) {
    if (pid <= 0) {
        return false;
    }

    const char state = ReadProcessState(fs::path(procRoot_) / std::to_string(pid) / "stat");
    return state != '\0' && state != 'Z' && state != 'X';
}

int LinuxProcessControl::SpawnBackend() {
    if (backendCommand_.empty()) {
        return -1;
    }

    // Everything the children need is prepared before fork.
    std::vector<char*> argv;
    argv.reserve(backendCommand_.size() + 1);
    for (auto& word : backendCommand_) {
        argv.push_back(word.data());
    }
    argv.push_back(nullptr);
    const char* outputPath = outputPath_.empty() ? "/dev/null" : outputPath_.c_str();

    int pipeFds[2]{};
    if (pipe2(pipeFds, O_CLOEXEC) != 0) {
        std::cerr << "[Process] pipe failed: " << std::strerror(errno) << std::endl;
        return -1;
    }

    const pid_t child = fork();
    if (child < 0) {
        std::cerr << "[Process] fork failed: " << std::strerror(errno) << std::endl;
        close(pipeFds[0]);
        close(pipeFds[1]);
        return -1;
    }

    if (child == 0) {
        close(pipeFds[0]);
        if (setsid() < 0) {
            _exit(1);
        }

        const pid_t grandchild = fork();
        if (grandchild < 0) {
            _exit(1);
        }

        if (grandchild > 0) {
            const int reported = static_cast<int>(grandchild);
            const ssize_t written = write(pipeFds[1], &reported, sizeof(reported));
            _exit(written == static_cast<ssize_t>(sizeof(reported)) ? 0 : 1);
        }

        // The daemon blocks its shutdown signals; the backend must not inherit that.
        sigset_t emptySet;
        sigemptyset(&emptySet);
        sigprocmask(SIG_SETMASK, &emptySet, nullptr);
        signal(SIGTERM, SIG_DFL);
        signal(SIGINT, SIG_DFL);

        const int inputFd = open("/dev/null", O_RDONLY);
        int outputFd = open(outputPath, O_WRONLY | O_CREAT | O_APPEND, 0644);
        if (outputFd < 0) {
            outputFd = open("/dev/null", O_WRONLY);
        }
        if (inputFd >= 0) {
            dup2(inputFd, STDIN_FILENO);
        }
        if (outputFd >= 0) {
            dup2(outputFd, STDOUT_FILENO);
            dup2(outputFd, STDERR_FILENO);
        }

        execvp(argv[0], argv.data());
        _exit(127);
    }

    close(pipeFds[1]);

    int spawnedPid = -1;
    ssize_t bytesRead = -1;
    do {
        bytesRead = read(pipeFds[0], &spawnedPid, sizeof(spawnedPid));
    } while (bytesRead < 0 && errno == EINTR);
    close(pipeFds[0]);

    int status = 0;
    while (waitpid(child, &status, 0) < 0 && errno == EINTR) {
    }

    if (bytesRead != static_cast<ssize_t>(sizeof(spawnedPid)) || spawnedPid <= 0) {
        std::cerr << "[Process] spawn of " << backendCommand_.front() << " did not report a PID" << std::endl;
        return -1;
    }

    return spawnedPid;
}

bool LinuxProcessControl::MatchesInvocation(
    const std::vector<std::string>& argv,
    const std::vector<std::string>& command) {
    if (command.empty() || argv.size() < command.size()) {
        return false;
    }

    if (Basename(argv.front()) != Basename(command.front())) {
        return false;
    }

    return std::equal(command.begin() + 1, command.end(), argv.begin() + 1);
}

std::vector<std::string> LinuxProcessControl::ParseCmdline(const std::string& raw) {
    std::vector<std::string> argv;
    std::string current;
    for (const char ch : raw) {
        if (ch == '\0') {
            argv.push_back(current);
            current.clear();
        } else {
            current.push_back(ch);
        }
    }
    if (!current.empty()) {
        argv.push_back(current);
    }
    return argv;
}

bool WritePidFile(const std::string& path, int pid) {
    if (path.empty() || pid <= 0) {
        return false;
    }

    std::ofstream output(path, std::ios::trunc);
    if (!output) {
        return false;
    }

    output << pid << '\n';
    return output.good();
}

std::optional<int> ReadPidFile(const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }

    std::ifstream input(path);
    if (!input) {
        return std::nullopt;
    }

    std::string line;
    std::getline(input, line);
    int pid = 0;
    if (!ParsePid(line, pid)) {
        return std::nullopt;
    }
    return pid;
}
