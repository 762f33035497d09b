#pragma once
#include "db.hpp"
#include <chrono>
#include <optional>
#include <string>

// Two-phase confirmation for destructive commands, held by the caller (one per
// session). arm() records intent; commit() succeeds only for the same scope
// within the window. Any commit attempt disarms the gate.
class ConfirmGate {
public:
    explicit ConfirmGate(std::chrono::seconds window = std::chrono::seconds(30), Clock clock = system_now);

    void arm(const std::string& scope);
    bool commit(const std::string& scope);
    bool armed(const std::string& scope) const;
    void reset();

private:
    std::chrono::seconds window_;
    Clock clock_;
    std::optional<std::string> scope_;
    int64_t armed_at_{0};
};
