#pragma once

// Run state of the solver between host frames.
enum ClockState : int {
    CLOCK_RUNNING             = 0,
    CLOCK_PAUSED              = 1,
    CLOCK_PAUSED_PENDING_STEP = 2  // run the next frame, then pause
};

// Pause / single-step / slow-motion bookkeeping plus the frame delta clamp.
// Holds no simulation data; FluidSim asks it whether to advance and by how much.
class FrameClock {
public:
    float normalTimeScale = 1.0f;
    float slowTimeScale   = 0.1f;
    float maxTimestepFPS  = 60.0f; // 0 disables the clamp

    void pause()  { m_state = CLOCK_PAUSED; }
    void resume() { m_state = CLOCK_RUNNING; }
    void togglePause();
    void requestSingleStep() { m_state = CLOCK_PAUSED_PENDING_STEP; }

    // Reset semantics: a running clock runs one more frame then pauses,
    // a paused clock stays paused.
    void pauseAfterNextFrame();

    void toggleSlowMode() { m_slowMode = !m_slowMode; }
    void setSlowMode(bool on) { m_slowMode = on; }
    bool slowMode() const { return m_slowMode; }

    ClockState state() const { return m_state; }
    bool paused() const { return m_state == CLOCK_PAUSED; }

    float activeTimeScale() const { return m_slowMode ? slowTimeScale : normalTimeScale; }

    // min(hostDt * timeScale, 1 / maxTimestepFPS). Bad host deltas give 0.
    float frameDelta(float hostDt) const;

    bool shouldAdvance() const { return m_state != CLOCK_PAUSED; }

    // Call once per host frame after the (possible) advance.
    void finishFrame();

private:
    ClockState m_state = CLOCK_RUNNING;
    bool m_slowMode = false;
};
