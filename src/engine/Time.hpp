#pragma once

#include <cstdint>

namespace emberfall {

/// Simulation clock. One update() per tick.
class Time {
public:
    /// Call once per tick with the raw elapsed time.
    void update(double rawDeltaTime);

    /// Seconds elapsed since last tick (clamped).
    double deltaTime() const { return m_deltaTime; }

    /// Raw (unclamped) delta from the last update.  A raw delta much
    /// larger than the clamp means the process was suspended.
    double rawDeltaTime() const { return m_rawDeltaTime; }

    /// Total simulated seconds since Time was created.
    double elapsedTime() const { return m_elapsedTime; }

    /// Number of ticks since Time was created.
    uint64_t tickCount() const { return m_tickCount; }

    /// Upper bound applied to every delta.
    void setMaxDelta(double maxDelta);
    double getMaxDelta() const { return m_maxDelta; }

    /// Force the next tick's delta to be clamped to this value.
    void clampNextDelta(double maxDelta);

    static constexpr double DEFAULT_MAX_DELTA = 0.25; // Clamp to avoid spiral of death

private:
    double   m_deltaTime    = 0.0;
    double   m_rawDeltaTime = 0.0;
    double   m_elapsedTime  = 0.0;
    uint64_t m_tickCount    = 0;
    double   m_maxDelta     = DEFAULT_MAX_DELTA;

    // One-shot clamp for the next tick
    double m_nextDeltaClamp = 0.0;
};

} // namespace emberfall
