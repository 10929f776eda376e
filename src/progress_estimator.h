#pragma once

#include <cstdint>

// Damped time-remaining estimate. A new estimate replaces the previous one
// only when it is below previous + kUpwardTolerance, so single slow frames
// do not make the ETA jump upward.
class ProgressEstimator
{
public:
    static constexpr double kUpwardTolerance = 100.0; // seconds

    // Returns the estimate in effect after the update
    double update(double elapsedSeconds, int64_t framesProcessed, double totalFrames);

    double timeRemaining() const { return m_estimate; }
    void reset() { m_estimate = 0.0; }

private:
    double m_estimate = 0.0;
};
