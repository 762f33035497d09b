#pragma once
#include "analysis_cache.hpp"
#include "single_flight.hpp"
#include "telemetry_log.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

struct RunOptions {
    std::string source{"openai"};
    std::optional<std::chrono::seconds> ttl{std::chrono::hours(24)};
    // Share one computation between concurrent callers in this process.
    // Off: both callers compute and the later put wins.
    bool single_flight{false};
    std::string session_token;
};

struct RunResult {
    std::string payload;
    bool cache_hit{false};
    bool shared{false};
};

// Wraps a text-producing service with cache get/put. Empty results are
// returned but never cached.
class CachedRunner {
public:
    explicit CachedRunner(const Database& db);

    RunResult run(const std::string& subject,
                  const std::string& query_kind,
                  const Params& params,
                  const std::function<std::string()>& compute,
                  const RunOptions& opts = {});

private:
    AnalysisCache cache_;
    TelemetryLog telemetry_;
    SingleFlight flights_;
};
