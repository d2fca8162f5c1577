#include "engine/Time.hpp"

#include <algorithm>

namespace emberfall {

void Time::update(double rawDeltaTime) {
    m_rawDeltaTime = rawDeltaTime;

    double clampLimit = m_maxDelta;

    // Apply one-shot clamp if set (e.g., after suspend/resume)
    if (m_nextDeltaClamp > 0.0) {
        clampLimit = std::min(clampLimit, m_nextDeltaClamp);
        m_nextDeltaClamp = 0.0;
    }

    m_deltaTime = std::clamp(rawDeltaTime, 0.0, clampLimit);
    m_elapsedTime += m_deltaTime;
    m_tickCount++;
}

void Time::setMaxDelta(double maxDelta) {
    m_maxDelta = maxDelta > 0.0 ? maxDelta : DEFAULT_MAX_DELTA;
}

void Time::clampNextDelta(double maxDelta) {
    m_nextDeltaClamp = maxDelta;
}

} // namespace emberfall
