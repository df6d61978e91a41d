#pragma once

#include "ServingApi.hpp"

#include <chrono>
#include <string>
#include <vector>

struct TlsSettings {
    bool enabled = false;
    std::string certPath;
    std::string keyPath;
    std::string caPath;
    bool verifyPeer = true;
    bool verifyHost = false;
};

struct ClientSettings {
    std::string baseUrl;
    std::chrono::milliseconds timeout{5000};
    TlsSettings tls;
    std::string apiKey;
};

class ServingClient : public ServingApi {
public:
    explicit ServingClient(ClientSettings settings);

    bool StopIntake() override;
    bool ResumeIntake() override;
    bool SwitchModel(const std::string& model) override;
    bool SetContextWindow(int contextWindow) override;
    bool SetRagTopK(int topK) override;
    bool DisableTools(const std::vector<std::string>& tools) override;
    bool EnableAllTools() override;

private:
    bool Post(const std::string& spanName, const std::string& path, const std::string& body);

    ClientSettings settings_;
};

class BackendClient : public BackendApi {
public:
    BackendClient(ClientSettings settings, std::string healthPath);

    bool CheckHealth() override;
    bool SmokeTest(const std::string& model) override;
    bool ListLoadedModels(std::vector<std::string>& outModels) override;
    bool UnloadModel(const std::string& model) override;

private:
    ClientSettings settings_;
    std::string healthPath_;
};
