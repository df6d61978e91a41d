#include "CancellationToken.hpp"
#include "Guardian.hpp"
#include "GuardianConfig.hpp"
#include "MetricsCollector.hpp"
#include "NetworkClient.hpp"
#include "ProcessControl.hpp"
#include "Tracing.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace {
bool WaitForTlsFiles(const TlsSettings& settings, int timeoutSeconds) {
    for (int attempt = 0; attempt < timeoutSeconds; ++attempt) {
        if (std::filesystem::exists(settings.certPath)
            && std::filesystem::exists(settings.keyPath)
            && std::filesystem::exists(settings.caPath)) {
            return true;
        }

        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    return false;
}

void PrintConfiguration(const GuardianConfig& config) {
    const HysteresisSettings& h = config.hysteresis;
    std::cout << "[Config] serving " << config.servingBaseUrl << ", backend " << config.backendBaseUrl << std::endl;
    std::cout << "[Config] RAM soft/hard/recovery " << h.ramSoftPct << "/" << h.ramHardPct << "/"
              << h.ramRecoveryPct << "%, CPU " << h.cpuSoftPct << "/" << h.cpuHardPct << "/"
              << h.cpuRecoveryPct << "%, disk hard " << h.diskHardPct << "%, temp hard " << h.tempHardC << "C"
              << std::endl;
    std::cout << "[Config] window " << h.measurementWindow << " samples, recovery "
              << std::chrono::duration<double>(h.recoveryWindow).count() << "s, brownout "
              << (config.enableBrownout ? "on" : "off") << ", kill " << (h.killEnabled ? "on" : "off")
              << std::endl;
}
} // namespace

int main() {
    std::cout << "Guardian Starting..." << std::endl;

    GuardianConfig config;
    std::string error;
    if (!LoadGuardianConfig(ProcessEnvironment(), config, error)
        || !ValidateGuardianConfig(config, error)) {
        std::cerr << "[Config] " << error << std::endl;
        return 1;
    }
    PrintConfiguration(config);

    if (config.tls.enabled && !WaitForTlsFiles(config.tls, 30)) {
        std::cerr << "[Config] TLS enabled but certificate files are missing." << std::endl;
        return 1;
    }

    // Block termination signals before any thread starts so that only the
    // waiter below ever receives them.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (pthread_sigmask(SIG_BLOCK, &signals, nullptr) != 0) {
        std::cerr << "[Guardian] cannot block termination signals" << std::endl;
        return 1;
    }

    Tracer::Instance().Configure(config.trace);

    ClientSettings servingSettings;
    servingSettings.baseUrl = config.servingBaseUrl;
    servingSettings.timeout = config.servingTimeout;
    servingSettings.tls = config.tls;
    servingSettings.apiKey = config.apiKey;
    ServingClient serving(servingSettings);

    ClientSettings backendSettings;
    backendSettings.baseUrl = config.backendBaseUrl;
    backendSettings.timeout = config.healthTimeout;
    BackendClient backend(backendSettings, config.backendHealthPath);

    LinuxProcessControl processes(config.backendCommand, config.backendLogPath);
    MetricsCollector collector(processes, config.cpuSampleInterval);
    Guardian guardian(config, collector, serving, backend, processes);

    CancellationToken token;
    std::thread signalWaiter([&signals, &token] {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            std::cout << "[Guardian] received signal " << received << ", finishing current tick" << std::endl;
        }
        token.Cancel();
    });

    guardian.Run(token);

    // Run can only return after a cancel, which the waiter issues; if the
    // loop ended some other way wake the waiter so it can be joined.
    if (!token.IsCancelled()) {
        pthread_kill(signalWaiter.native_handle(), SIGTERM);
    }
    signalWaiter.join();

    Tracer::Instance().Shutdown();
    std::cout << "Guardian stopped." << std::endl;
    return 0;
}
