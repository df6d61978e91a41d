#include "GuardianConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace {
std::string GetEnvOrDefault(const EnvLookup& lookup, const char* name, const std::string& defaultValue) {
    const char* value = lookup(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const EnvLookup& lookup, const char* name, bool defaultValue) {
    const char* value = lookup(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

bool ParseDouble(const std::string& text, double& out) {
    try {
        std::size_t consumed = 0;
        const double value = std::stod(text, &consumed);
        if (consumed != text.size() || !std::isfinite(value)) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool ParseInt(const std::string& text, int& out) {
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool ReadDouble(const EnvLookup& lookup, const char* name, double& out, std::string& error) {
    const char* value = lookup(name);
    if (!value) {
        return true;
    }
    if (!ParseDouble(value, out)) {
        error = std::string(name) + " is not a number: " + value;
        return false;
    }
    return true;
}

bool ReadInt(const EnvLookup& lookup, const char* name, int& out, std::string& error) {
    const char* value = lookup(name);
    if (!value) {
        return true;
    }
    if (!ParseInt(value, out)) {
        error = std::string(name) + " is not an integer: " + value;
        return false;
    }
    return true;
}

bool ReadCount(const EnvLookup& lookup, const char* name, std::size_t& out, std::string& error) {
    int value = static_cast<int>(out);
    if (!ReadInt(lookup, name, value, error)) {
        return false;
    }
    if (value < 1) {
        error = std::string(name) + " must be at least 1";
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

// Ten years; anything longer is a typo and would overflow the millisecond count.
constexpr double kMaxSeconds = 10.0 * 365.0 * 24.0 * 3600.0;

bool InSecondsRange(double seconds) {
    return std::fabs(seconds) <= kMaxSeconds;
}

bool ReadSeconds(const EnvLookup& lookup, const char* name, std::chrono::milliseconds& out, std::string& error) {
    double seconds = std::chrono::duration<double>(out).count();
    if (!ReadDouble(lookup, name, seconds, error)) {
        return false;
    }
    if (!InSecondsRange(seconds)) {
        error = std::string(name) + " is out of range: " + lookup(name);
        return false;
    }
    out = SecondsToMillis(seconds);
    return true;
}

bool ReadDelaySchedule(
    const EnvLookup& lookup,
    const char* name,
    std::vector<std::chrono::milliseconds>& out,
    std::string& error) {
    const char* value = lookup(name);
    if (!value) {
        return true;
    }

    std::vector<std::chrono::milliseconds> schedule;
    for (const auto& item : SplitList(value, ',')) {
        double seconds = 0.0;
        if (!ParseDouble(item, seconds)) {
            error = std::string(name) + " has a non-numeric delay: " + item;
            return false;
        }
        if (!InSecondsRange(seconds)) {
            error = std::string(name) + " has an out-of-range delay: " + item;
            return false;
        }
        schedule.push_back(SecondsToMillis(seconds));
    }
    out = schedule;
    return true;
}

void ReadList(const EnvLookup& lookup, const char* name, char separator, std::vector<std::string>& out) {
    const char* value = lookup(name);
    if (value) {
        out = SplitList(value, separator);
    }
}

bool IsPercent(double value) {
    return value > 0.0 && value <= 100.0;
}

bool CheckTiers(const char* resource, double recovery, double soft, double hard, std::string& error) {
    if (!IsPercent(recovery) || !IsPercent(soft) || !IsPercent(hard)) {
        error = std::string(resource) + " thresholds must be within (0, 100]";
        return false;
    }
    if (!(recovery < soft && soft < hard)) {
        error = std::string(resource) + " thresholds must satisfy recovery < soft < hard";
        return false;
    }
    return true;
}
} // namespace

EnvLookup ProcessEnvironment() {
    return [](const char* name) -> const char* { return std::getenv(name); };
}

std::vector<std::string> SplitList(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, separator)) {
        const auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        const auto last = item.find_last_not_of(" \t");
        items.push_back(item.substr(first, last - first + 1));
    }
    return items;
}

bool LoadGuardianConfig(const EnvLookup& lookup, GuardianConfig& config, std::string& error) {
    HysteresisSettings& hysteresis = config.hysteresis;
    const bool thresholdsOk = ReadSeconds(lookup, "GUARDIAN_POLL_INTERVAL_S", config.pollInterval, error)
        && ReadDouble(lookup, "GUARDIAN_RAM_SOFT_PCT", hysteresis.ramSoftPct, error)
        && ReadDouble(lookup, "GUARDIAN_RAM_HARD_PCT", hysteresis.ramHardPct, error)
        && ReadDouble(lookup, "GUARDIAN_RAM_RECOVERY_PCT", hysteresis.ramRecoveryPct, error)
        && ReadDouble(lookup, "GUARDIAN_CPU_SOFT_PCT", hysteresis.cpuSoftPct, error)
        && ReadDouble(lookup, "GUARDIAN_CPU_HARD_PCT", hysteresis.cpuHardPct, error)
        && ReadDouble(lookup, "GUARDIAN_CPU_RECOVERY_PCT", hysteresis.cpuRecoveryPct, error)
        && ReadDouble(lookup, "GUARDIAN_DISK_HARD_PCT", hysteresis.diskHardPct, error)
        && ReadDouble(lookup, "GUARDIAN_TEMP_HARD_C", hysteresis.tempHardC, error)
        && ReadCount(lookup, "GUARDIAN_MEASUREMENT_WINDOW", hysteresis.measurementWindow, error)
        && ReadSeconds(lookup, "GUARDIAN_RECOVERY_WINDOW_S", hysteresis.recoveryWindow, error)
        && ReadSeconds(lookup, "GUARDIAN_LOCKDOWN_DURATION_S", hysteresis.lockdownDuration, error);
    if (!thresholdsOk) {
        return false;
    }

    const bool rateOk = ReadSeconds(lookup, "GUARDIAN_KILL_COOLDOWN_SHORT_S", config.killRate.shortCooldown, error)
        && ReadSeconds(lookup, "GUARDIAN_KILL_COOLDOWN_LONG_S", config.killRate.longWindow, error)
        && ReadCount(lookup, "GUARDIAN_MAX_KILLS_PER_WINDOW", config.killRate.maxKillsPerWindow, error);
    if (!rateOk) {
        return false;
    }

    BrownoutSettings& brownout = config.brownout;
    brownout.modelPrimary = GetEnvOrDefault(lookup, "GUARDIAN_MODEL_PRIMARY", brownout.modelPrimary);
    brownout.modelFallback = GetEnvOrDefault(lookup, "GUARDIAN_MODEL_FALLBACK", brownout.modelFallback);
    ReadList(lookup, "GUARDIAN_TOOLS_MODERATE", ',', brownout.toolsModerate);
    ReadList(lookup, "GUARDIAN_TOOLS_HEAVY", ',', brownout.toolsHeavy);
    const bool brownoutOk = ReadInt(lookup, "GUARDIAN_CONTEXT_WINDOW_NORMAL", brownout.contextWindowNormal, error)
        && ReadInt(lookup, "GUARDIAN_CONTEXT_WINDOW_REDUCED", brownout.contextWindowReduced, error)
        && ReadInt(lookup, "GUARDIAN_RAG_TOP_K_NORMAL", brownout.ragTopKNormal, error)
        && ReadInt(lookup, "GUARDIAN_RAG_TOP_K_REDUCED", brownout.ragTopKReduced, error);
    if (!brownoutOk) {
        return false;
    }

    KillSequenceSettings& kill = config.killSequence;
    const bool killOk = ReadSeconds(lookup, "GUARDIAN_DRAIN_TIMEOUT_S", kill.drainTimeout, error)
        && ReadSeconds(lookup, "GUARDIAN_SIGTERM_GRACE_S", kill.sigtermGrace, error)
        && ReadSeconds(lookup, "GUARDIAN_FORCE_KILL_WAIT_S", kill.forceKillWait, error)
        && ReadDelaySchedule(lookup, "GUARDIAN_RESTART_DELAYS_S", kill.restartDelays, error)
        && ReadInt(lookup, "GUARDIAN_MAX_RESTART_ATTEMPTS", kill.maxRestartAttempts, error)
        && ReadSeconds(lookup, "GUARDIAN_STARTUP_WAIT_S", kill.startupWait, error);
    if (!killOk) {
        return false;
    }
    kill.pidFilePath = GetEnvOrDefault(lookup, "GUARDIAN_PID_FILE", kill.pidFilePath);
    kill.smokeTestEnabled = GetEnvBool(lookup, "GUARDIAN_SMOKE_TEST_ENABLED", kill.smokeTestEnabled);
    kill.smokeTestModel = GetEnvOrDefault(lookup, "GUARDIAN_SMOKE_TEST_MODEL", kill.smokeTestModel);

    config.servingBaseUrl = GetEnvOrDefault(lookup, "ALICE_API_URL", config.servingBaseUrl);
    config.servingBaseUrl = GetEnvOrDefault(lookup, "GUARDIAN_SERVING_URL", config.servingBaseUrl);
    config.backendBaseUrl = GetEnvOrDefault(lookup, "OLLAMA_API_URL", config.backendBaseUrl);
    config.backendBaseUrl = GetEnvOrDefault(lookup, "GUARDIAN_BACKEND_URL", config.backendBaseUrl);
    config.backendHealthPath = GetEnvOrDefault(lookup, "GUARDIAN_BACKEND_HEALTH_PATH", config.backendHealthPath);
    ReadList(lookup, "GUARDIAN_BACKEND_COMMAND", ' ', config.backendCommand);
    config.backendLogPath = GetEnvOrDefault(lookup, "GUARDIAN_BACKEND_LOG", config.backendLogPath);
    config.apiKey = GetEnvOrDefault(lookup, "GUARDIAN_API_KEY", config.apiKey);

    const bool clientOk = ReadSeconds(lookup, "GUARDIAN_SERVING_TIMEOUT_S", config.servingTimeout, error)
        && ReadSeconds(lookup, "GUARDIAN_HEALTH_TIMEOUT_S", config.healthTimeout, error)
        && ReadSeconds(lookup, "GUARDIAN_CPU_SAMPLE_S", config.cpuSampleInterval, error);
    if (!clientOk) {
        return false;
    }

    config.tls.enabled = GetEnvBool(lookup, "GUARDIAN_TLS_ENABLED", config.tls.enabled);
    if (config.tls.enabled) {
        config.tls.certPath = GetEnvOrDefault(lookup, "GUARDIAN_TLS_CERT_PATH", config.tls.certPath);
        config.tls.keyPath = GetEnvOrDefault(lookup, "GUARDIAN_TLS_KEY_PATH", config.tls.keyPath);
        config.tls.caPath = GetEnvOrDefault(lookup, "GUARDIAN_TLS_CA_PATH", config.tls.caPath);
        config.tls.verifyPeer = GetEnvBool(lookup, "GUARDIAN_TLS_VERIFY_PEER", config.tls.verifyPeer);
        config.tls.verifyHost = GetEnvBool(lookup, "GUARDIAN_TLS_VERIFY_HOST", config.tls.verifyHost);
    }

    config.enableBrownout = GetEnvBool(lookup, "GUARDIAN_ENABLE_BROWNOUT", config.enableBrownout);
    hysteresis.killEnabled = GetEnvBool(lookup, "GUARDIAN_ENABLE_KILL", hysteresis.killEnabled);
    config.metricsLogEnabled = GetEnvBool(lookup, "GUARDIAN_METRICS_LOG_ENABLED", config.metricsLogEnabled);
    config.statusFilePath = GetEnvOrDefault(lookup, "GUARDIAN_STATUS_FILE", config.statusFilePath);

    config.trace.enabled = GetEnvBool(lookup, "GUARDIAN_OTEL_ENABLED", config.trace.enabled);
    config.trace.endpoint = GetEnvOrDefault(lookup, "GUARDIAN_OTEL_ENDPOINT", config.trace.endpoint);
    config.trace.serviceName = GetEnvOrDefault(lookup, "GUARDIAN_OTEL_SERVICE_NAME", "guardian");
    return true;
}

bool ValidateGuardianConfig(const GuardianConfig& config, std::string& error) {
    const HysteresisSettings& hysteresis = config.hysteresis;
    if (!CheckTiers("RAM", hysteresis.ramRecoveryPct, hysteresis.ramSoftPct, hysteresis.ramHardPct, error)
        || !CheckTiers("CPU", hysteresis.cpuRecoveryPct, hysteresis.cpuSoftPct, hysteresis.cpuHardPct, error)) {
        return false;
    }
    if (!IsPercent(hysteresis.diskHardPct)) {
        error = "disk hard threshold must be within (0, 100]";
        return false;
    }
    if (hysteresis.tempHardC <= 0.0) {
        error = "temperature hard threshold must be positive";
        return false;
    }
    if (hysteresis.measurementWindow < 1) {
        error = "measurement window must be at least 1";
        return false;
    }

    const std::chrono::milliseconds zero(0);
    if (config.pollInterval <= zero || hysteresis.recoveryWindow <= zero || hysteresis.lockdownDuration <= zero
        || config.killRate.shortCooldown <= zero || config.killRate.longWindow <= zero
        || config.servingTimeout <= zero || config.healthTimeout <= zero) {
        error = "durations must be positive";
        return false;
    }
    if (config.killRate.maxKillsPerWindow < 1) {
        error = "max kills per window must be at least 1";
        return false;
    }

    const KillSequenceSettings& kill = config.killSequence;
    if (kill.drainTimeout < zero || kill.sigtermGrace < zero || kill.forceKillWait < zero
        || kill.startupWait < zero || config.cpuSampleInterval < zero) {
        error = "wait times must not be negative";
        return false;
    }
    if (kill.restartDelays.empty()) {
        error = "restart delay schedule must not be empty";
        return false;
    }
    for (const auto& delay : kill.restartDelays) {
        if (delay < zero) {
            error = "restart delays must not be negative";
            return false;
        }
    }
    if (kill.maxRestartAttempts < 1) {
        error = "max restart attempts must be at least 1";
        return false;
    }
    if (config.backendCommand.empty()) {
        error = "backend command must not be empty";
        return false;
    }

    const BrownoutSettings& brownout = config.brownout;
    if (brownout.contextWindowNormal < 1 || brownout.contextWindowReduced < 1
        || brownout.ragTopKNormal < 1 || brownout.ragTopKReduced < 1) {
        error = "context window and RAG top-k must be at least 1";
        return false;
    }
    for (const auto& tool : brownout.toolsModerate) {
        if (std::find(brownout.toolsHeavy.begin(), brownout.toolsHeavy.end(), tool) == brownout.toolsHeavy.end()) {
            error = "heavy tool list must include moderate tool " + tool;
            return false;
        }
    }

    if (config.tls.enabled) {
        if (config.tls.certPath.empty() || config.tls.keyPath.empty() || config.tls.caPath.empty()) {
            error = "TLS enabled but certificate paths are missing";
            return false;
        }
        if (config.servingBaseUrl.rfind("https://", 0) != 0) {
            error = "TLS enabled but the serving URL is not https";
            return false;
        }
    }
    return true;
}
