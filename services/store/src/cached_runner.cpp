#include "../include/cached_runner.hpp"
#include <nlohmann/json.hpp>

CachedRunner::CachedRunner(const Database& db) : cache_(db), telemetry_(db) {}

RunResult CachedRunner::run(const std::string& subject,
                            const std::string& query_kind,
                            const Params& params,
                            const std::function<std::string()>& compute,
                            const RunOptions& opts) {
    RunResult res;
    if (auto hit = cache_.get(subject, query_kind, params)) {
        res.payload = std::move(hit->payload);
        res.cache_hit = true;
        return res;
    }

    bool late_hit = false;
    auto produce = [&]() {
        // A flight that started after another one finished sees its result here.
        if (opts.single_flight) {
            if (auto hit = cache_.get(subject, query_kind, params)) {
                late_hit = true;
                return hit->payload;
            }
        }
        std::string payload = compute();
        if (!payload.empty()) {
            cache_.put(subject, query_kind, params, payload, opts.source, opts.ttl);
        }
        return payload;
    };

    if (opts.single_flight) {
        auto flight = flights_.run(fingerprint(subject, query_kind, params), produce);
        res.payload = std::move(flight.value);
        res.shared = flight.shared;
        res.cache_hit = late_hit;
    } else {
        res.payload = produce();
    }

    if (!res.payload.empty() && !res.shared && !res.cache_hit) {
        nlohmann::json event = {
            {"market_name", subject},
            {"analysis_type", query_kind},
            {"result_length", res.payload.size()},
            {"cache_hit", res.cache_hit}
        };
        telemetry_.log_event("market_analysis", event, opts.session_token);
    }
    return res;
}
