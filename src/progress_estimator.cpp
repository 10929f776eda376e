#include "progress_estimator.h"

constexpr double ProgressEstimator::kUpwardTolerance;

double ProgressEstimator::update(double elapsedSeconds, int64_t framesProcessed, double totalFrames)
{
    if (framesProcessed <= 0)
        return m_estimate;

    const double perFrame = elapsedSeconds / static_cast<double>(framesProcessed);
    double candidate = perFrame * (totalFrames - static_cast<double>(framesProcessed));
    if (candidate < 0.0)
        candidate = 0.0;

    if (m_estimate == 0.0 || candidate < m_estimate + kUpwardTolerance)
        m_estimate = candidate;
    return m_estimate;
}
