#include "Tracing.hpp"

#include "Config.hpp"
#include "Encoding.hpp"

#include <iostream>

#if DISPATCH_ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_http_exporter.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span_context.h>
#include <opentelemetry/trace/status_code.h>
#endif

namespace {
std::string FormatTraceParent(const std::string& traceId, const std::string& spanId, bool sampled) {
    return "00-" + traceId + "-" + spanId + "-" + (sampled ? "01" : "00");
}

std::string FreshTraceParent() {
    return FormatTraceParent(RandomHex(16), RandomHex(8), true);
}

#if DISPATCH_ENABLE_OTEL
template <typename Value>
void Annotate(SpanHandle& handle, const std::string& key, const Value& value) {
    handle.span->SetAttribute(key, value);
}
#else
template <typename Value>
void Annotate(SpanHandle&, const std::string&, const Value&) {}
#endif

#if DISPATCH_ENABLE_OTEL
std::string TraceParentOf(const opentelemetry::trace::SpanContext& context) {
    if (!context.IsValid()) {
        return FreshTraceParent();
    }

    return FormatTraceParent(
        context.trace_id().ToLowerBase16(),
        context.span_id().ToLowerBase16(),
        context.trace_flags().IsSampled());
}
#endif
} // namespace

TraceConfig LoadTraceConfig(const std::string& defaultServiceName) {
    TraceConfig config;
    config.enabled = GetEnvBool("DISPATCH_OTEL_ENABLED", false);
    config.endpoint = GetEnvOrDefault("DISPATCH_OTEL_ENDPOINT", "");
    config.serviceName = GetEnvOrDefault("DISPATCH_OTEL_SERVICE", defaultServiceName);
    return config;
}

Tracer& Tracer::Instance() {
    static Tracer instance;
    return instance;
}

void Tracer::Configure(const TraceConfig& config) {
    if (!config.serviceName.empty()) {
        serviceName_ = config.serviceName;
    }
    if (!config.enabled) {
        enabled_ = false;
        return;
    }

#if DISPATCH_ENABLE_OTEL
    opentelemetry::exporter::otlp::OtlpHttpExporterOptions options;
    if (!config.endpoint.empty()) {
        options.url = config.endpoint;
    }

    auto exporter = std::make_unique<opentelemetry::exporter::otlp::OtlpHttpExporter>(options);
    auto processor = std::make_unique<opentelemetry::sdk::trace::BatchSpanProcessor>(std::move(exporter));
    auto resource = opentelemetry::sdk::resource::Resource::Create({{"service.name", serviceName_}});
    provider_ = std::make_shared<opentelemetry::sdk::trace::TracerProvider>(std::move(processor), resource);

    opentelemetry::trace::Provider::SetTracerProvider(provider_);
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer(serviceName_);
    enabled_ = true;
#else
    std::cerr << "[Tracing] DISPATCH_OTEL_ENABLED set but built without OpenTelemetry; spans stay local" << std::endl;
    enabled_ = false;
#endif
}

bool Tracer::Enabled() const {
    return enabled_;
}

SpanHandle Tracer::StartSpan(const std::string& name) {
    SpanHandle handle;
    handle.name = name;
    handle.valid = true;
#if DISPATCH_ENABLE_OTEL
    if (enabled_ && tracer_) {
        handle.span = tracer_->StartSpan(name);
    }
    handle.traceparent = handle.span ? TraceParentOf(handle.span->GetContext()) : FreshTraceParent();
#else
    handle.traceparent = FreshTraceParent();
#endif
    return handle;
}

bool Tracer::Recording(const SpanHandle& handle) const {
#if DISPATCH_ENABLE_OTEL
    return enabled_ && handle.valid && handle.span;
#else
    (void)handle;
    return false;
#endif
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, const std::string& value) {
    if (Recording(handle)) {
        Annotate(handle, key, value);
    }
}

void Tracer::SetAttribute(SpanHandle& handle, const std::string& key, int64_t value) {
    if (Recording(handle)) {
        Annotate(handle, key, value);
    }
}

void Tracer::EndSpan(SpanHandle& handle, bool success) {
    if (!handle.valid) {
        return;
    }
    const bool recording = Recording(handle);
    handle.valid = false;
    if (!recording && !success) {
        std::cerr << "[Tracing] " << handle.name << " failed traceparent=" << handle.traceparent << std::endl;
    }
#if DISPATCH_ENABLE_OTEL
    if (recording) {
        using opentelemetry::trace::StatusCode;
        handle.span->SetStatus(success ? StatusCode::kOk : StatusCode::kError);
        handle.span->End();
    }
#endif
}

void Tracer::Shutdown() {
#if DISPATCH_ENABLE_OTEL
    if (provider_) {
        provider_->Shutdown();
    }
#endif
    enabled_ = false;
}
