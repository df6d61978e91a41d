#include "Tracing.hpp"

#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <vector>

#if GUARDIAN_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>

#include <unistd.h>
#endif

namespace {
// Trace ids of the ScopedSpans open on this thread, innermost last.
thread_local std::vector<std::string> activeTraceIds;

std::string RandomHex(size_t bytes) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 255);

    std::ostringstream out;
    out << std::hex << std::nouppercase;
    for (size_t i = 0; i < bytes; ++i) {
        out << std::setw(2) << std::setfill('0') << dist(rng);
    }
    return out.str();
}

std::string CurrentOrNewTraceId() {
    return activeTraceIds.empty() ? RandomHex(16) : activeTraceIds.back();
}

std::string FormatTraceparent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + "-" + (sampled ? "01" : "00");
}

#if GUARDIAN_ENABLE_OTEL
std::string HostName() {
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0) {
        return buffer;
    }
    return "unknown-host";
}
#endif
} // namespace

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if GUARDIAN_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(
        std::move(exporter),
        opentelemetry::sdk::trace::BatchSpanProcessorOptions{});
    auto resource = opentelemetry::sdk::resource::Resource::Create({
        {"service.name", config.serviceName.empty() ? "guardian" : config.serviceName},
        {"host.name", HostName()}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(
        opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider>(provider_));
    tracer_ = provider_->GetTracer("guardian-daemon");
    enabled_ = true;
    std::cout << "[Tracing] exporting spans to "
              << (config.endpoint.empty() ? std::string("default OTLP endpoint") : config.endpoint) << std::endl;
#else
    std::cerr << "[Tracing] tracing requested but this build has no exporter" << std::endl;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
    handle.valid = true;

#if GUARDIAN_ENABLE_OTEL
    if (enabled_ && tracer_) {
        // The SDK parents the span on whatever ScopedSpan is active.
        handle.span = tracer_->StartSpan(name);
        const auto context = handle.span->GetContext();
        if (context.IsValid()) {
            handle.traceId = context.trace_id().ToLowerBase16();
            handle.traceparent = FormatTraceparent(
                handle.traceId,
                context.span_id().ToLowerBase16(),
                context.trace_flags().IsSampled());
            return handle;
        }
    }
#else
    (void)name;
#endif

    handle.traceId = CurrentOrNewTraceId();
    handle.traceparent = FormatTraceparent(handle.traceId, RandomHex(8), true);
    return handle;
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
#if GUARDIAN_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
#if GUARDIAN_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, double value) {
#if GUARDIAN_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetAttribute(key, value);
    }
#else
    (void)handle;
    (void)key;
    (void)value;
#endif
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
#if GUARDIAN_ENABLE_OTEL
    if (enabled_ && handle.span) {
        handle.span->SetStatus(
            success ? opentelemetry::trace::StatusCode::kOk : opentelemetry::trace::StatusCode::kError);
        handle.span->End();
    }
#else
    (void)handle;
    (void)success;
#endif
}

void Tracer::Shutdown() {
#if GUARDIAN_ENABLE_OTEL
    if (provider_) {
        provider_->ForceFlush();
        provider_->Shutdown();
    }
#endif
    enabled_ = false;
}

ScopedSpan::ScopedSpan(const std::string& name)
    : handle_(Tracer::Instance().StartSpan(name)) {
    activeTraceIds.push_back(handle_.traceId);
#if GUARDIAN_ENABLE_OTEL
    if (handle_.span) {
        scope_ = std::make_unique<opentelemetry::trace::Scope>(handle_.span);
    }
#endif
}

ScopedSpan::~ScopedSpan() {
#if GUARDIAN_ENABLE_OTEL
    scope_.reset();
#endif
    Tracer::Instance().EndSpan(handle_, success_);
    if (!activeTraceIds.empty()) {
        activeTraceIds.pop_back();
    }
}

SpanHandle& ScopedSpan::Handle() {
    return handle_;
}

void ScopedSpan::Succeed() {
    success_ = true;
}
