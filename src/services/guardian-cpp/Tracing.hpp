#pragma once

#include <cstdint>
#include <memory>
#include <string>

#if GUARDIAN_ENABLE_OTEL
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/scope.h>
#include <opentelemetry/trace/tracer.h>
#endif

struct TraceConfig {
    bool enabled = false;
    std::string endpoint;
    std::string serviceName;
};

struct SpanHandle {
    std::string traceparent;
    std::string traceId;
    bool valid = false;
#if GUARDIAN_ENABLE_OTEL
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span> span;
#endif
};

// Process-wide tracer. Spans started while a ScopedSpan is alive on the same
// thread join its trace, so one remediation shows up as a single trace even
// when the exporter is compiled out (the traceparent headers still line up).
class Tracer {
public:
    static Tracer& Instance();

    void Configure(const TraceConfig& config);
    bool Enabled() const;

    SpanHandle StartSpan(const std::string& name);
    void SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value);
    void SetAttribute(SpanHandle& handle, const std::string& key, int64_t value);
    void SetAttribute(SpanHandle& handle, const std::string& key, double value);
    void EndSpan(SpanHandle& handle, bool success);
    void Shutdown();

private:
    Tracer() = default;

    bool enabled_ = false;
#if GUARDIAN_ENABLE_OTEL
    std::shared_ptr<opentelemetry::sdk::trace::TracerProvider> provider_;
    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;
#endif
};

// Active span for its scope: ended on exit, failed unless Succeed() was
// called. Must be destroyed on the thread that created it.
class ScopedSpan {
public:
    explicit ScopedSpan(const std::string& name);
    ~ScopedSpan();

    ScopedSpan(const ScopedSpan&) = delete;
    ScopedSpan& operator=(const ScopedSpan&) = delete;

    SpanHandle& Handle();
    void Succeed();

private:
    SpanHandle handle_;
    bool success_ = false;
#if GUARDIAN_ENABLE_OTEL
    std::unique_ptr<opentelemetry::trace::Scope> scope_;
#endif
};
