#include "MetricsCollector.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <sys/statvfs.h>

namespace {
bool ReadCpuTimes(const std::string& path, unsigned long long& idle, unsigned long long& total) {
    std::ifstream statFile(path);
    if (!statFile.is_open()) {
        return false;
    }

    std::string line;
    if (!std::getline(statFile, line)) {
        return false;
    }

    std::istringstream iss(line);
    std::string label;
    iss >> label;
    if (label != "cpu") {
        return false;
    }

    unsigned long long user = 0;
    unsigned long long nice = 0;
    unsigned long long system = 0;
    unsigned long long idleVal = 0;
    unsigned long long iowait = 0;
    unsigned long long irq = 0;
    unsigned long long softirq = 0;
    unsigned long long steal = 0;

    iss >> user >> nice >> system >> idleVal >> iowait >> irq >> softirq >> steal;
    if (iss.fail() && !iss.eof()) {
        return false;
    }

    // guest and guest_nice are already counted in user and nice.
    idle = idleVal + iowait;
    total = user + nice + system + idleVal + iowait + irq + softirq + steal;
    return total > 0;
}

double BusyPct(unsigned long long idleDelta, unsigned long long totalDelta) {
    if (totalDelta == 0) {
        return 0.0;
    }
    const double busy = static_cast<double>(totalDelta - std::min(idleDelta, totalDelta));
    return std::clamp(busy / static_cast<double>(totalDelta) * 100.0, 0.0, 100.0);
}

bool ReadMemInfo(const std::string& path, unsigned long long& totalKb, unsigned long long& availableKb) {
    std::ifstream memFile(path);
    if (!memFile.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(memFile, line)) {
        std::istringstream iss(line);
        std::string key;
        unsigned long long value = 0;
        if (!(iss >> key >> value)) {
            continue;
        }

        if (key == "MemTotal:") {
            totalKb = value;
        } else if (key == "MemAvailable:") {
            availableKb = value;
        }

        if (totalKb > 0 && availableKb > 0) {
            return true;
        }
    }

    return totalKb > 0;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool ReadZoneTempC(const std::filesystem::path& tempPath, double& tempC) {
    std::ifstream input(tempPath);
    long long milliC = 0;
    if (!(input >> milliC)) {
        return false;
    }
    tempC = static_cast<double>(milliC) / 1000.0;
    return true;
}
} // namespace

MetricsCollector::MetricsCollector(
    ProcessControl& processes,
    std::chrono::milliseconds cpuSampleInterval,
    MetricsSources sources,
    NowFunction now,
    SleepFunction sleep)
    : processes_(processes),
      cpuSampleInterval_(cpuSampleInterval),
      sources_(std::move(sources)),
      now_(std::move(now)),
      sleep_(std::move(sleep)) {}

SystemMetrics MetricsCollector::Collect() {
    SystemMetrics metrics;
    metrics.timestamp = now_();

    try {
        ReadMemory(metrics);
    } catch (const std::exception& ex) {
        std::cerr << "[Metrics] memory read failed: " << ex.what() << std::endl;
    }

    try {
        metrics.cpuPct = SampleCpuPct();
    } catch (const std::exception& ex) {
        std::cerr << "[Metrics] cpu read failed: " << ex.what() << std::endl;
    }

    try {
        metrics.diskPct = ReadDiskPct();
    } catch (const std::exception& ex) {
        std::cerr << "[Metrics] disk read failed: " << ex.what() << std::endl;
    }

    try {
        metrics.tempC = ReadTemperature();
    } catch (const std::exception& ex) {
        std::cerr << "[Metrics] temperature read failed: " << ex.what() << std::endl;
    }

    try {
        metrics.backendPids = processes_.FindBackendPids();
    } catch (const std::exception& ex) {
        std::cerr << "[Metrics] backend process scan failed: " << ex.what() << std::endl;
    }

    return metrics;
}

double MetricsCollector::SampleCpuPct() {
    unsigned long long idle = 0;
    unsigned long long total = 0;

    if (cpuSampleInterval_.count() > 0) {
        if (!ReadCpuTimes(sources_.procStatPath, idle, total)) {
            return 0.0;
        }
        prevIdle_ = idle;
        prevTotal_ = total;
        sleep_(cpuSampleInterval_);
    }

    if (!ReadCpuTimes(sources_.procStatPath, idle, total)) {
        return 0.0;
    }

    double pct = 0.0;
    if (prevTotal_ > 0 && total >= prevTotal_ && idle >= prevIdle_) {
        pct = BusyPct(idle - prevIdle_, total - prevTotal_);
    }

    prevIdle_ = idle;
    prevTotal_ = total;
    return pct;
}

void MetricsCollector::ReadMemory(SystemMetrics& metrics) const {
    unsigned long long totalKb = 0;
    unsigned long long availableKb = 0;
    if (!ReadMemInfo(sources_.memInfoPath, totalKb, availableKb) || totalKb == 0) {
        return;
    }

    const unsigned long long usedKb = totalKb > availableKb ? (totalKb - availableKb) : 0;
    metrics.ramPct = (static_cast<double>(usedKb) / static_cast<double>(totalKb)) * 100.0;
    metrics.ramGb = static_cast<double>(usedKb) / (1024.0 * 1024.0);
}

double MetricsCollector::ReadDiskPct() const {
    struct statvfs info {};
    if (statvfs(sources_.diskPath.c_str(), &info) != 0) {
        return 0.0;
    }

    const unsigned long long blockSize = info.f_frsize != 0 ? info.f_frsize : info.f_bsize;
    const unsigned long long used = (info.f_blocks - info.f_bfree) * blockSize;
    const unsigned long long available = info.f_bavail * blockSize;
    if (used + available == 0) {
        return 0.0;
    }

    return static_cast<double>(used) / static_cast<double>(used + available) * 100.0;
}

std::optional<double> MetricsCollector::ReadTemperature() const {
    namespace fs = std::filesystem;

    std::error_code error;
    if (!fs::exists(sources_.thermalRoot, error)) {
        return std::nullopt;
    }

    std::vector<fs::path> zones;
    for (fs::directory_iterator it(sources_.thermalRoot, error), end; !error && it != end; it.increment(error)) {
        if (it->path().filename().string().rfind("thermal_zone", 0) == 0) {
            zones.push_back(it->path());
        }
    }
    std::sort(zones.begin(), zones.end());

    std::optional<double> fallback;
    for (const auto& zone : zones) {
        double tempC = 0.0;
        if (!ReadZoneTempC(zone / "temp", tempC)) {
            continue;
        }

        std::string type;
        std::ifstream typeFile(zone / "type");
        std::getline(typeFile, type);
        type = ToLower(type);

        // Prefer a CPU package sensor; otherwise the first readable zone.
        if (type.find("cpu") != std::string::npos || type.find("x86_pkg") != std::string::npos) {
            return tempC;
        }
        if (!fallback) {
            fallback = tempC;
        }
    }

    return fallback;
}
