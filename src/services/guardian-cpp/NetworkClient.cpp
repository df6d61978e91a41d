#include "NetworkClient.hpp"
#include "Tracing.hpp"

#include <cpr/cpr.h>
#include <cpr/ssl_options.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace {
constexpr auto kMaxConnectTimeout = std::chrono::milliseconds(3000);

std::string BuildUrl(const std::string& baseUrl, const std::string& path) {
    if (baseUrl.empty()) {
        return path;
    }

    if (baseUrl.back() == '/') {
        return baseUrl.substr(0, baseUrl.size() - 1) + path;
    }

    return baseUrl + path;
}

bool IsSuccessStatus(const cpr::Response& response) {
    return response.status_code == 200 || response.status_code == 201 || response.status_code == 204;
}

cpr::SslOptions BuildSslOptions(const TlsSettings& settings) {
    return cpr::Ssl(
        cpr::ssl::CaInfo{settings.caPath},
        cpr::ssl::CertFile{settings.certPath},
        cpr::ssl::KeyFile{settings.keyPath},
        cpr::ssl::VerifyPeer{settings.verifyPeer},
        cpr::ssl::VerifyHost{settings.verifyHost});
}

cpr::Header BuildHeaders(const ClientSettings& settings, const std::string& traceparent, bool jsonBody) {
    cpr::Header headers;
    if (jsonBody) {
        headers["Content-Type"] = "application/json";
    }
    headers["traceparent"] = traceparent;
    if (!settings.apiKey.empty()) {
        headers["X-API-Key"] = settings.apiKey;
    }
    return headers;
}

void ConfigureSession(cpr::Session& session, const ClientSettings& settings, const std::string& url, const cpr::Header& headers) {
    session.SetUrl(cpr::Url{url});
    session.SetHeader(headers);
    session.SetConnectTimeout(cpr::ConnectTimeout{std::min(settings.timeout, kMaxConnectTimeout)});
    session.SetTimeout(cpr::Timeout{settings.timeout});
    if (settings.tls.enabled) {
        session.SetSslOptions(BuildSslOptions(settings.tls));
    }
}

// Runs one request inside a span and reports whether transport and status
// both succeeded. Failures are logged with the caller's tag.
bool Execute(
    const ClientSettings& settings,
    const std::string& spanName,
    const std::string& method,
    const std::string& path,
    const std::string* body,
    const char* logTag,
    cpr::Response* outResponse = nullptr) {
    const std::string url = BuildUrl(settings.baseUrl, path);

    auto span = Tracer::Instance().StartSpan(spanName);
    Tracer::Instance().SetAttribute(span, "http.method", method);
    Tracer::Instance().SetAttribute(span, "http.url", url);

    cpr::Session session;
    ConfigureSession(session, settings, url, BuildHeaders(settings, span.traceparent, body != nullptr));

    cpr::Response response;
    if (method == "POST") {
        session.SetBody(cpr::Body{body != nullptr ? *body : std::string{}});
        response = session.Post();
    } else {
        response = session.Get();
    }

    const bool requestOk = response.error.code == cpr::ErrorCode::OK;
    const bool statusOk = IsSuccessStatus(response);
    Tracer::Instance().SetAttribute(span, "http.status_code", static_cast<int64_t>(response.status_code));
    Tracer::Instance().EndSpan(span, requestOk && statusOk);

    if (!requestOk) {
        std::cerr << logTag << " " << method << " " << path << " failed: " << response.error.message << std::endl;
        return false;
    }

    if (!statusOk) {
        std::cerr << logTag << " " << method << " " << path << " failed with HTTP " << response.status_code << std::endl;
        return false;
    }

    if (outResponse != nullptr) {
        *outResponse = std::move(response);
    }
    return true;
}
} // namespace

ServingClient::ServingClient(ClientSettings settings)
    : settings_(std::move(settings)) {}

bool ServingClient::StopIntake() {
    return Post("serving.stop_intake", "/api/guard/stop-intake", "{}");
}

bool ServingClient::ResumeIntake() {
    return Post("serving.resume_intake", "/api/guard/resume-intake", "{}");
}

bool ServingClient::SwitchModel(const std::string& model) {
    const nlohmann::json payload = {{"model", model}};
    return Post("serving.switch_model", "/api/brain/model/switch", payload.dump());
}

bool ServingClient::SetContextWindow(int contextWindow) {
    const nlohmann::json payload = {{"context_window", contextWindow}};
    return Post("serving.set_context", "/api/brain/context/set", payload.dump());
}

bool ServingClient::SetRagTopK(int topK) {
    const nlohmann::json payload = {{"top_k", topK}};
    return Post("serving.set_rag_top_k", "/api/brain/rag/set", payload.dump());
}

bool ServingClient::DisableTools(const std::vector<std::string>& tools) {
    const nlohmann::json payload = {{"tools", tools}};
    return Post("serving.disable_tools", "/api/brain/tools/disable", payload.dump());
}

bool ServingClient::EnableAllTools() {
    return Post("serving.enable_all_tools", "/api/brain/tools/enable-all", "{}");
}

bool ServingClient::Post(const std::string& spanName, const std::string& path, const std::string& body) {
    return Execute(settings_, spanName, "POST", path, &body, "[Serving]");
}

BackendClient::BackendClient(ClientSettings settings, std::string healthPath)
    : settings_(std::move(settings)),
      healthPath_(std::move(healthPath)) {}

bool BackendClient::CheckHealth() {
    return Execute(settings_, "backend.health", "GET", healthPath_, nullptr, "[Backend]");
}

bool BackendClient::SmokeTest(const std::string& model) {
    const nlohmann::json payload = {
        {"model", model},
        {"prompt", "2+2="},
        {"stream", false},
        {"options", {{"temperature", 0}, {"num_predict", 5}}}
    };
    const std::string body = payload.dump();

    cpr::Response response;
    if (!Execute(settings_, "backend.smoke_test", "POST", "/api/generate", &body, "[Backend]", &response)) {
        return false;
    }

    auto json = nlohmann::json::parse(response.text, nullptr, false);
    if (json.is_discarded() || !json.is_object() || !json.contains("response")) {
        std::cerr << "[Backend] smoke test response missing generated text" << std::endl;
        return false;
    }
    return true;
}

bool BackendClient::ListLoadedModels(std::vector<std::string>& outModels) {
    outModels.clear();

    cpr::Response response;
    if (!Execute(settings_, "backend.list_models", "GET", "/api/ps", nullptr, "[Backend]", &response)) {
        return false;
    }

    auto json = nlohmann::json::parse(response.text, nullptr, false);
    if (json.is_discarded() || !json.contains("models") || !json["models"].is_array()) {
        std::cerr << "[Backend] /api/ps response missing models" << std::endl;
        return false;
    }

    for (const auto& item : json["models"]) {
        if (!item.is_object()) {
            continue;
        }
        std::string name = item.value("name", "");
        if (name.empty()) {
            name = item.value("model", "");
        }
        if (!name.empty()) {
            outModels.push_back(std::move(name));
        }
    }
    return true;
}

bool BackendClient::UnloadModel(const std::string& model) {
    const nlohmann::json payload = {{"model", model}, {"keep_alive", 0}};
    const std::string body = payload.dump();
    return Execute(settings_, "backend.unload_model", "POST", "/api/generate", &body, "[Backend]");
}
