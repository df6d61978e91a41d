#include "GuardianConfig.hpp"

#include <chrono>
#include <iostream>
#include <map>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

EnvLookup MapLookup(const std::map<std::string, std::string>& values) {
    return [&values](const char* name) -> const char* {
        const auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

bool LoadAndValidate(const std::map<std::string, std::string>& env, GuardianConfig& config, std::string& error) {
    config = GuardianConfig{};
    return LoadGuardianConfig(MapLookup(env), config, error) && ValidateGuardianConfig(config, error);
}
} // namespace

int main() {
    using std::chrono::milliseconds;

    std::string error;
    GuardianConfig config;

    {
        const std::map<std::string, std::string> env;
        if (!LoadAndValidate(env, config, error)) {
            return Fail("Defaults should load and validate: " + error);
        }
        const HysteresisSettings& h = config.hysteresis;
        if (h.ramSoftPct != 80.0 || h.ramHardPct != 92.0 || h.ramRecoveryPct != 70.0
            || h.cpuSoftPct != 80.0 || h.cpuHardPct != 92.0 || h.cpuRecoveryPct != 75.0
            || h.diskHardPct != 95.0 || h.tempHardC != 90.0 || h.measurementWindow != 3) {
            return Fail("Unexpected default thresholds.");
        }
        if (config.pollInterval != milliseconds(1000) || h.recoveryWindow != milliseconds(45000)
            || h.lockdownDuration != milliseconds(3600000)) {
            return Fail("Unexpected default timings.");
        }
        if (config.killRate.shortCooldown != milliseconds(300000) || config.killRate.longWindow != milliseconds(1800000)
            || config.killRate.maxKillsPerWindow != 3) {
            return Fail("Unexpected default kill limits.");
        }
        if (config.backendCommand != std::vector<std::string>{"ollama", "serve"}) {
            return Fail("Default backend command should be the serve invocation.");
        }
        if (config.killSequence.restartDelays.size() != 3 || config.killSequence.restartDelays[2] != milliseconds(60000)) {
            return Fail("Default restart schedule should be 5, 15, 60 seconds.");
        }
    }

    {
        const std::map<std::string, std::string> env{
            {"GUARDIAN_POLL_INTERVAL_S", "0.5"},
            {"GUARDIAN_RAM_SOFT_PCT", "75"},
            {"GUARDIAN_MEASUREMENT_WINDOW", "5"},
            {"GUARDIAN_RESTART_DELAYS_S", "1, 2,4"},
            {"GUARDIAN_BACKEND_COMMAND", "/opt/bin/ollama serve --host 0.0.0.0"},
            {"GUARDIAN_TOOLS_MODERATE", "web_search"},
            {"GUARDIAN_TOOLS_HEAVY", "web_search,email"},
            {"GUARDIAN_ENABLE_KILL", "false"},
            {"GUARDIAN_ENABLE_BROWNOUT", "no"},
            {"GUARDIAN_STATUS_FILE", "/run/guardian/status.json"},
            {"ALICE_API_URL", "http://alice:9000"},
            {"OLLAMA_API_URL", "http://ollama:11434"},
            {"GUARDIAN_BACKEND_URL", "http://override:11434"}
        };
        if (!LoadAndValidate(env, config, error)) {
            return Fail("Overrides should load: " + error);
        }
        if (config.pollInterval != milliseconds(500) || config.hysteresis.ramSoftPct != 75.0
            || config.hysteresis.measurementWindow != 5) {
            return Fail("Numeric overrides were not applied.");
        }
        const std::vector<milliseconds> delays{milliseconds(1000), milliseconds(2000), milliseconds(4000)};
        if (config.killSequence.restartDelays != delays) {
            return Fail("Restart schedule should parse a comma list.");
        }
        if (config.backendCommand.size() != 5 || config.backendCommand[0] != "/opt/bin/ollama") {
            return Fail("Backend command should split on spaces.");
        }
        if (config.hysteresis.killEnabled || config.enableBrownout) {
            return Fail("Feature switches should be read as booleans.");
        }
        if (config.servingBaseUrl != "http://alice:9000" || config.backendBaseUrl != "http://override:11434") {
            return Fail("URL aliases should apply, with GUARDIAN_* taking precedence.");
        }
        if (config.statusFilePath != "/run/guardian/status.json") {
            return Fail("Status file path should be read.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_RAM_HARD_PCT", "lots"}};
        if (LoadAndValidate(env, config, error) || error.find("GUARDIAN_RAM_HARD_PCT") == std::string::npos) {
            return Fail("Non-numeric threshold should fail and name the variable.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_MEASUREMENT_WINDOW", "0"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Zero measurement window should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_RAM_RECOVERY_PCT", "85"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Recovery above soft should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_CPU_HARD_PCT", "120"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Threshold above 100% should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_TOOLS_HEAVY", "email"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Heavy tools that do not cover moderate tools should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_RESTART_DELAYS_S", " , "}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Empty restart schedule should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_BACKEND_COMMAND", "   "}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Blank backend command should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_TLS_ENABLED", "1"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("TLS without certificate paths should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_KILL_COOLDOWN_SHORT_S", "-5"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Negative cooldown should be rejected.");
        }
    }

    for (const char* bad : {"nan", "inf", "-inf", "1e300"}) {
        const std::map<std::string, std::string> env{{"GUARDIAN_POLL_INTERVAL_S", bad}};
        if (LoadAndValidate(env, config, error)) {
            return Fail(std::string("Poll interval '") + bad + "' should be rejected.");
        }
        if (error.find("GUARDIAN_POLL_INTERVAL_S") == std::string::npos) {
            return Fail("Rejected duration should name its variable: " + error);
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_RESTART_DELAYS_S", "5,inf"}};
        if (LoadAndValidate(env, config, error) || error.find("GUARDIAN_RESTART_DELAYS_S") == std::string::npos) {
            return Fail("Non-finite restart delay should be rejected by name.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_RESTART_DELAYS_S", "5,1e300"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("Huge restart delay should be rejected.");
        }
    }

    {
        const std::map<std::string, std::string> env{{"GUARDIAN_RAM_SOFT_PCT", "nan"}};
        if (LoadAndValidate(env, config, error)) {
            return Fail("NaN threshold should be rejected.");
        }
    }

    const auto items = SplitList(" a ,b,, c ", ',');
    if (items != std::vector<std::string>{"a", "b", "c"}) {
        return Fail("SplitList should trim items and drop empty ones.");
    }

    std::cout << "Guardian config tests passed." << std::endl;
    return 0;
}
