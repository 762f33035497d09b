#pragma once
#include "db.hpp"
#include "records.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Append-only usage events. Payloads are free-form JSON; nothing validates
// their shape.
class TelemetryLog {
public:
    explicit TelemetryLog(const Database& db);

    int64_t log_event(const std::string& event_kind,
                      const std::optional<nlohmann::json>& payload = std::nullopt,
                      const std::string& session_token = {});

    std::vector<TelemetryEvent> recent(int limit) const;

    // Events per UTC day within the window, newest day first.
    std::vector<DailyCount> daily_counts(std::chrono::seconds window, int limit) const;
    std::vector<KindCount> kind_counts(std::chrono::seconds window) const;
    int64_t count_since(std::chrono::seconds window) const;

    int64_t purge_older_than(std::chrono::seconds age);

private:
    const Database& db_;
};
