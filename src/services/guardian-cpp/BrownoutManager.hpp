#pragma once

#include "Clock.hpp"
#include "ServingApi.hpp"

#include <optional>
#include <string>
#include <vector>

enum class BrownoutLevel {
    NONE = 0,
    LIGHT = 1,
    MODERATE = 2,
    HEAVY = 3
};

const char* ToString(BrownoutLevel level);

struct BrownoutSettings {
    std::string modelPrimary = "gpt-oss:20b";
    std::string modelFallback = "gpt-oss:7b";
    int contextWindowNormal = 8;
    int contextWindowReduced = 3;
    int ragTopKNormal = 8;
    int ragTopKReduced = 3;
    std::vector<std::string> toolsModerate{"code_interpreter", "file_search", "web_search"};
    std::vector<std::string> toolsHeavy{"code_interpreter", "file_search", "web_search", "calendar", "email"};
};

struct BrownoutState {
    bool active = false;
    BrownoutLevel level = BrownoutLevel::NONE;
    std::optional<TimePoint> activationTime;
    double durationS = 0.0;
    // Some degradation call went through but the level was never fully applied.
    bool partial = false;
};

// Applies cumulative degradation levels through the serving system. Levels
// are cumulative: LIGHT swaps the model, MODERATE adds the context/RAG shrink
// and the moderate tool list, HEAVY adds the heavy tool list on top.
class BrownoutManager {
public:
    BrownoutManager(ServingApi& serving, BrownoutSettings settings, NowFunction now = SystemNow());

    // Issues every call the level requires, even after one fails, and
    // succeeds only if all of them did. Nothing is retried here.
    bool Activate(BrownoutLevel level);

    // Restores primary model, normal context and top-k, and all tools. A
    // no-op success when nothing was ever applied.
    bool Deactivate();

    BrownoutState GetState() const;
    const BrownoutSettings& Settings() const;
    int FailedCalls() const;

    static std::vector<std::string> DisabledToolsFor(BrownoutLevel level, const BrownoutSettings& settings);

private:
    bool Track(bool callOk, const char* action);

    ServingApi& serving_;
    BrownoutSettings settings_;
    NowFunction now_;
    BrownoutState state_;
    int failedCalls_ = 0;
};
