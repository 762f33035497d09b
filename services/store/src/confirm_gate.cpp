#include "../include/confirm_gate.hpp"
#include <utility>

ConfirmGate::ConfirmGate(std::chrono::seconds window, Clock clock)
    : window_(window), clock_(clock ? std::move(clock) : Clock(system_now)) {}

void ConfirmGate::arm(const std::string& scope) {
    scope_ = scope;
    armed_at_ = clock_();
}

bool ConfirmGate::armed(const std::string& scope) const {
    return scope_ && *scope_ == scope && clock_() - armed_at_ <= window_.count();
}

bool ConfirmGate::commit(const std::string& scope) {
    bool ok = armed(scope);
    reset();
    return ok;
}

void ConfirmGate::reset() {
    scope_.reset();
    armed_at_ = 0;
}
