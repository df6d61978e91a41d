#pragma once

#include "BrownoutManager.hpp"
#include "GuardianState.hpp"
#include "KillRateLimiter.hpp"
#include "KillSequence.hpp"
#include "NetworkClient.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct GuardianConfig {
    std::chrono::milliseconds pollInterval{1000};
    HysteresisSettings hysteresis;
    KillRateSettings killRate;
    BrownoutSettings brownout;
    KillSequenceSettings killSequence;

    std::string servingBaseUrl = "http://localhost:8000";
    std::string backendBaseUrl = "http://localhost:11434";
    std::string backendHealthPath = "/api/health";
    std::vector<std::string> backendCommand{"ollama", "serve"};
    std::string backendLogPath = "/dev/null";
    std::chrono::milliseconds servingTimeout{5000};
    std::chrono::milliseconds healthTimeout{10000};
    std::chrono::milliseconds cpuSampleInterval{100};
    std::string apiKey;
    TlsSettings tls;

    bool enableBrownout = true;
    bool metricsLogEnabled = true;
    std::string statusFilePath;
    TraceConfig trace;
};

using EnvLookup = std::function<const char*(const char*)>;

EnvLookup ProcessEnvironment();

// Overlays GUARDIAN_* variables on the defaults already in config. A value
// that does not parse fails the load and names the variable in error.
bool LoadGuardianConfig(const EnvLookup& lookup, GuardianConfig& config, std::string& error);
bool ValidateGuardianConfig(const GuardianConfig& config, std::string& error);

std::vector<std::string> SplitList(const std::string& value, char separator);
