// =============================================================================
// Confirm Gate Tests
// =============================================================================

#include "test_support.hpp"
#include "../include/confirm_gate.hpp"

using namespace std::chrono_literals;

TEST(ConfirmGateTest, ArmThenCommit) {
    ManualClock clock;
    ConfirmGate gate(30s, clock.fn());
    gate.arm("cache");
    EXPECT_TRUE(gate.armed("cache"));
    EXPECT_TRUE(gate.commit("cache"));
    // one arm buys one commit
    EXPECT_FALSE(gate.commit("cache"));
}

TEST(ConfirmGateTest, CommitWithoutArmFails) {
    ManualClock clock;
    ConfirmGate gate(30s, clock.fn());
    EXPECT_FALSE(gate.commit("everything"));
}

TEST(ConfirmGateTest, DifferentScopeDisarms) {
    ManualClock clock;
    ConfirmGate gate(30s, clock.fn());
    gate.arm("documents");
    EXPECT_FALSE(gate.commit("everything"));
    EXPECT_FALSE(gate.commit("documents"));
}

TEST(ConfirmGateTest, ArmedStateExpires) {
    ManualClock clock;
    ConfirmGate gate(30s, clock.fn());
    gate.arm("searches");
    clock.advance(31s);
    EXPECT_FALSE(gate.armed("searches"));
    EXPECT_FALSE(gate.commit("searches"));
}

TEST(ConfirmGateTest, RearmRestartsWindow) {
    ManualClock clock;
    ConfirmGate gate(30s, clock.fn());
    gate.arm("cache");
    clock.advance(20s);
    gate.arm("cache");
    clock.advance(20s);
    EXPECT_TRUE(gate.commit("cache"));
}
