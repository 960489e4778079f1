#include "frame_clock.h"

#include <algorithm>
#include <cmath>

void FrameClock::togglePause() {
    m_state = (m_state == CLOCK_PAUSED) ? CLOCK_RUNNING : CLOCK_PAUSED;
}

void FrameClock::pauseAfterNextFrame() {
    if (m_state == CLOCK_RUNNING) m_state = CLOCK_PAUSED_PENDING_STEP;
}

float FrameClock::frameDelta(float hostDt) const {
    if (!std::isfinite(hostDt) || hostDt <= 0.0f) return 0.0f;

    float dt = hostDt * activeTimeScale();
    if (maxTimestepFPS > 0.0f) {
        dt = std::min(dt, 1.0f / maxTimestepFPS);
    }
    return std::max(dt, 0.0f);
}

void FrameClock::finishFrame() {
    if (m_state == CLOCK_PAUSED_PENDING_STEP) m_state = CLOCK_PAUSED;
}
