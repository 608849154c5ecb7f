/*
 * Animation gate tests - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <devdeck/exec/animation_gate.hpp>

using namespace devdeck;
using namespace std::chrono_literals;
using Clock = AnimationGate::clock;

static CommandResult quick_result(int code) {
    return make_result("true", "", "", code, std::chrono::system_clock::now(), 0ms);
}

TEST(AnimationGate, FastResultHeldUntilMinimumElapsed) {
    AnimationGate gate;
    auto t0 = Clock::time_point{} + 1h;
    ASSERT_TRUE(gate.start(t0));
    EXPECT_EQ(gate.state(), GateState::Running);
    ASSERT_TRUE(gate.offer(quick_result(0)));   // finished "instantly"
    EXPECT_EQ(gate.state(), GateState::ResultBuffered);

    for (auto t : {0ms, 1ms, 100ms, 499ms}) {
        EXPECT_FALSE(gate.poll(t0 + t).has_value()) << t.count();
    }
    auto r = gate.poll(t0 + 500ms);
    ASSERT_TRUE(r.has_value());
    EXPECT_TRUE(r->success);
    EXPECT_EQ(gate.state(), GateState::Settled);
    EXPECT_FALSE(gate.poll(t0 + 900ms).has_value());
}

TEST(AnimationGate, SlowResultReleasedOnNextPoll) {
    AnimationGate gate(200ms);
    auto t0 = Clock::time_point{} + 1h;
    gate.start(t0);
    EXPECT_FALSE(gate.poll(t0 + 5s).has_value());   // nothing offered yet
    gate.offer(quick_result(2));
    auto r = gate.poll(t0 + 5s);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->exit_code, 2);
}

TEST(AnimationGate, OfferOutsideRunningIsRejected) {
    AnimationGate gate;
    EXPECT_FALSE(gate.offer(quick_result(0)));
    EXPECT_EQ(gate.state(), GateState::Idle);
    auto t0 = Clock::time_point{} + 1h;
    gate.start(t0);
    EXPECT_TRUE(gate.offer(quick_result(0)));
    EXPECT_FALSE(gate.offer(quick_result(1)));
    auto r = gate.poll(t0 + 1s);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->exit_code, 0);
}

TEST(AnimationGate, StartIgnoredWhileActive) {
    AnimationGate gate;
    auto t0 = Clock::time_point{} + 1h;
    EXPECT_TRUE(gate.start(t0));
    EXPECT_FALSE(gate.start(t0 + 400ms));
    EXPECT_EQ(gate.started_at(), t0);
    gate.offer(quick_result(0));
    EXPECT_FALSE(gate.start(t0 + 450ms));
    ASSERT_TRUE(gate.poll(t0 + 500ms).has_value());
    EXPECT_TRUE(gate.start(t0 + 2s));   // Settled -> Running
    EXPECT_EQ(gate.started_at(), t0 + 2s);
}

TEST(AnimationGate, ResetDropsBufferedResult) {
    AnimationGate gate;
    auto t0 = Clock::time_point{} + 1h;
    gate.start(t0);
    gate.offer(quick_result(0));
    gate.reset();
    EXPECT_EQ(gate.state(), GateState::Idle);
    EXPECT_FALSE(gate.active());
    EXPECT_FALSE(gate.poll(t0 + 10s).has_value());
}

TEST(AnimationGate, ConfigurableMinimum) {
    AnimationGate zero(0ms);
    auto t0 = Clock::time_point{} + 1h;
    zero.start(t0);
    zero.offer(quick_result(0));
    EXPECT_TRUE(zero.poll(t0).has_value());
    EXPECT_EQ(AnimationGate().min_visible(), 500ms);
    EXPECT_STREQ(to_string(GateState::ResultBuffered), "buffered");
}
