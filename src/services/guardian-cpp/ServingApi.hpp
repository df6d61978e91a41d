#pragma once

#include <string>
#include <vector>

// Actions the guardian asks of the serving system. Every call is idempotent
// and reports success only on a verified response.
class ServingApi {
public:
    virtual ~ServingApi() = default;

    virtual bool StopIntake() = 0;
    virtual bool ResumeIntake() = 0;
    virtual bool SwitchModel(const std::string& model) = 0;
    virtual bool SetContextWindow(int contextWindow) = 0;
    virtual bool SetRagTopK(int topK) = 0;
    virtual bool DisableTools(const std::vector<std::string>& tools) = 0;
    virtual bool EnableAllTools() = 0;
};

// Calls made directly against the inference backend.
class BackendApi {
public:
    virtual ~BackendApi() = default;

    virtual bool CheckHealth() = 0;
    virtual bool SmokeTest(const std::string& model) = 0;
    virtual bool ListLoadedModels(std::vector<std::string>& outModels) = 0;
    virtual bool UnloadModel(const std::string& model) = 0;
};
