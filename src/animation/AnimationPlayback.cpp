#include "animation/AnimationPlayback.hpp"
#include "engine/Log.hpp"

namespace emberfall {

ContentResult AnimationPlayback::setState(const std::string& state) {
    if (m_active && state == m_state) {
        return ContentResult::Success; // already playing
    }

    const CompiledAnimation* next = m_sprite ? m_sprite->find(state) : nullptr;
    if (!next) {
        LOG_WARN("AnimationPlayback: unknown animation state '{}', keeping '{}'", state, m_state);
        return ContentResult::UnknownAnimationState;
    }

    m_active = next;
    m_state = state;
    m_frameIndex = 0;
    m_elapsed = 0.0f;
    m_finished = false;
    return ContentResult::Success;
}

void AnimationPlayback::advance(float dt) {
    if (!m_active || m_finished) return;

    const auto& animation = *m_active;
    m_elapsed += dt;

    while (m_elapsed >= animation.frameInterval) {
        m_elapsed -= animation.frameInterval;
        ++m_frameIndex;

        if (m_frameIndex >= animation.frameCount) {
            if (animation.loop) {
                m_frameIndex %= animation.frameCount;
            } else {
                m_frameIndex = animation.frameCount - 1;
                m_finished = true;
                m_elapsed = 0.0f;
                break;
            }
        }
    }
}

std::vector<LayerFrame> AnimationPlayback::currentFrame() const {
    std::vector<LayerFrame> frame;
    if (!m_active) return frame;

    Rect source = m_active->frameRect(m_frameIndex);
    frame.reserve(m_active->layers.size());
    for (const auto& sheet : m_active->layers) {
        frame.push_back({sheet, source});
    }
    return frame;
}

} // namespace emberfall
