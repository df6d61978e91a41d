#include "BrownoutManager.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <utility>

const char* ToString(BrownoutLevel level) {
    switch (level) {
        case BrownoutLevel::NONE:
            return "NONE";
        case BrownoutLevel::LIGHT:
            return "LIGHT";
        case BrownoutLevel::MODERATE:
            return "MODERATE";
        case BrownoutLevel::HEAVY:
            return "HEAVY";
    }
    return "NONE";
}

BrownoutManager::BrownoutManager(ServingApi& serving, BrownoutSettings settings, NowFunction now)
    : serving_(serving),
      settings_(std::move(settings)),
      now_(std::move(now)) {}

bool BrownoutManager::Activate(BrownoutLevel level) {
    if (level == BrownoutLevel::NONE) {
        return Deactivate();
    }

    std::cout << "[Brownout] activating level " << ToString(level) << std::endl;

    bool success = true;
    bool anyApplied = false;
    auto apply = [&](bool callOk, const char* action) {
        const bool ok = Track(callOk, action);
        success = success && ok;
        anyApplied = anyApplied || ok;
    };

    if (level >= BrownoutLevel::LIGHT) {
        apply(serving_.SwitchModel(settings_.modelFallback), "switch model");
    }

    if (level >= BrownoutLevel::MODERATE) {
        apply(serving_.SetContextWindow(settings_.contextWindowReduced), "reduce context window");
        apply(serving_.SetRagTopK(settings_.ragTopKReduced), "reduce RAG top-k");
        apply(serving_.DisableTools(settings_.toolsModerate), "disable moderate tools");
    }

    if (level >= BrownoutLevel::HEAVY) {
        apply(serving_.DisableTools(settings_.toolsHeavy), "disable heavy tools");
    }

    if (!success) {
        state_.partial = state_.partial || anyApplied;
        std::cerr << "[Brownout] failed to fully activate level " << ToString(level) << std::endl;
        return false;
    }

    if (!state_.active) {
        state_.activationTime = now_();
    }
    state_.active = true;
    state_.level = level;
    state_.partial = false;
    std::cout << "[Brownout] level " << ToString(level) << " active" << std::endl;
    return true;
}

bool BrownoutManager::Deactivate() {
    if (!state_.active && !state_.partial) {
        return true;
    }

    std::cout << "[Brownout] deactivating, restoring normal operation" << std::endl;

    bool success = true;
    success = Track(serving_.SwitchModel(settings_.modelPrimary), "restore model") && success;
    success = Track(serving_.SetContextWindow(settings_.contextWindowNormal), "restore context window") && success;
    success = Track(serving_.SetRagTopK(settings_.ragTopKNormal), "restore RAG top-k") && success;
    success = Track(serving_.EnableAllTools(), "enable all tools") && success;

    if (!success) {
        std::cerr << "[Brownout] failed to fully deactivate" << std::endl;
        return false;
    }

    const double durationS = state_.activationTime ? SecondsBetween(*state_.activationTime, now_()) : 0.0;
    state_ = BrownoutState{};
    std::cout << "[Brownout] deactivated after " << std::fixed << std::setprecision(1) << durationS << "s"
              << std::defaultfloat << std::endl;
    return true;
}

BrownoutState BrownoutManager::GetState() const {
    BrownoutState snapshot = state_;
    if (snapshot.active && snapshot.activationTime) {
        snapshot.durationS = std::max(0.0, SecondsBetween(*snapshot.activationTime, now_()));
    }
    return snapshot;
}

const BrownoutSettings& BrownoutManager::Settings() const {
    return settings_;
}

int BrownoutManager::FailedCalls() const {
    return failedCalls_;
}

std::vector<std::string> BrownoutManager::DisabledToolsFor(BrownoutLevel level, const BrownoutSettings& settings) {
    std::vector<std::string> tools;
    auto append = [&tools](const std::vector<std::string>& list) {
        for (const auto& tool : list) {
            if (std::find(tools.begin(), tools.end(), tool) == tools.end()) {
                tools.push_back(tool);
            }
        }
    };

    if (level >= BrownoutLevel::MODERATE) {
        append(settings.toolsModerate);
    }
    if (level >= BrownoutLevel::HEAVY) {
        append(settings.toolsHeavy);
    }
    return tools;
}

bool BrownoutManager::Track(bool callOk, const char* action) {
    if (!callOk) {
        ++failedCalls_;
        std::cerr << "[Brownout] " << action << " failed" << std::endl;
    }
    return callOk;
}
