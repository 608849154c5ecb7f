/*
 * Animation Gate - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Holds a finished CommandResult back until the "running" indicator has been
 * visible for a minimum time, so fast commands do not flash. The caller passes
 * the current time in; the gate never reads a clock itself.
 *
 *   Idle --start--> Running --offer--> ResultBuffered --poll(elapsed)--> Settled
 */
#pragma once
#include <devdeck/exec/result.hpp>
#include <chrono>
#include <optional>

namespace devdeck {

enum class GateState { Idle, Running, ResultBuffered, Settled };

const char* to_string(GateState state);

class AnimationGate {
public:
    using clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds k_default_min_visible{500};

    explicit AnimationGate(std::chrono::milliseconds min_visible = k_default_min_visible)
        : m_min_visible(min_visible) {}

    // Idle/Settled -> Running. Ignored while a command is already tracked.
    bool start(clock::time_point now);
    // Running -> ResultBuffered. Returns false (and drops nothing) in any other state.
    bool offer(CommandResult result);
    // Releases the buffered result once min_visible has elapsed since start().
    std::optional<CommandResult> poll(clock::time_point now);
    // Back to Idle, dropping any buffered result.
    void reset();

    GateState state() const { return m_state; }
    bool active() const { return m_state == GateState::Running || m_state == GateState::ResultBuffered; }
    clock::time_point started_at() const { return m_started_at; }
    std::chrono::milliseconds min_visible() const { return m_min_visible; }

private:
    std::chrono::milliseconds m_min_visible;
    GateState m_state = GateState::Idle;
    clock::time_point m_started_at{};
    std::optional<CommandResult> m_buffered;
};

} // namespace devdeck
