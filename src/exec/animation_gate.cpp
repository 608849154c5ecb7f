/*
 * Animation Gate implementation - DevDeck
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <devdeck/exec/animation_gate.hpp>

namespace devdeck {

const char* to_string(GateState state) {
    switch (state) {
        case GateState::Idle: return "idle";
        case GateState::Running: return "running";
        case GateState::ResultBuffered: return "buffered";
        case GateState::Settled: return "settled";
    }
    return "?";
}

bool AnimationGate::start(clock::time_point now) {
    if (active()) return false;
    m_state = GateState::Running;
    m_started_at = now;
    m_buffered.reset();
    return true;
}

bool AnimationGate::offer(CommandResult result) {
    if (m_state != GateState::Running) return false;
    m_buffered = std::move(result);
    m_state = GateState::ResultBuffered;
    return true;
}

std::optional<CommandResult> AnimationGate::poll(clock::time_point now) {
    if (m_state != GateState::ResultBuffered) return std::nullopt;
    if (now - m_started_at < m_min_visible) return std::nullopt;
    std::optional<CommandResult> out = std::move(m_buffered);
    m_buffered.reset();
    m_state = GateState::Settled;
    return out;
}

void AnimationGate::reset() {
    m_buffered.reset();
    m_state = GateState::Idle;
}

} // namespace devdeck
