#pragma once

#include <map>
#include <memory>
#include <string>

namespace SceneStitch {
namespace tracing {

// Open the span log. Empty outfile = <temp>/scenestitch-trace.log.
// Re-initialising with the same path is a no-op; a different path switches files.
void InitTracing(const std::string& outfile = "");

// Flush and close the span log. Safe to call when tracing was never initialised.
void ShutdownTracing();

// Lightweight RAII init helper
struct ScopedInit {
    explicit ScopedInit(const std::string& outfile = "") { InitTracing(outfile); }
    ~ScopedInit() { ShutdownTracing(); }
};

// Records START on construction and END (with duration and attributes) on
// End() or destruction. Spans are no-ops while tracing is not initialised.
class Span {
public:
    explicit Span(const char* name);
    explicit Span(const std::string& name);
    ~Span();

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    void addAttribute(const std::string& key, const std::string& value);
    void End();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tracing
} // namespace SceneStitch

#define SCENESTITCH_TRACE_CAT2(a, b) a##b
#define SCENESTITCH_TRACE_CAT(a, b) SCENESTITCH_TRACE_CAT2(a, b)

// Scoped span with a unique local name
#define TRACE_SCOPE(name) ::SceneStitch::tracing::Span SCENESTITCH_TRACE_CAT(trace_span_, __COUNTER__)(name)
#define TRACE_FUNC() TRACE_SCOPE(__func__)
