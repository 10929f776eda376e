#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "media_interfaces.h"
#include "pipeline_types.h"
#include "processor.h"
#include "progress_estimator.h"

struct ConverterSettings
{
    int retainedBufferCount = 4; // pool size hint for the frame processor
};

using ProgressCallback = std::function<void(const ProgressSnapshot &)>;

/**
 * Drives one side-by-side to spatial conversion at a time.
 *
 * convert() blocks the calling thread while two pump threads (video, and
 * audio when the source has it) feed the sink as fast as it asks for data.
 * The last pump to run out of input finalizes the file. cancel() may be
 * called from any thread.
 *
 * Phases: Idle -> Preparing -> Processing -> Finishing -> Idle, with
 * Cancelled reachable from Preparing and Processing. A cancelled session
 * goes back to Idle once its pumps have stopped.
 */
class ConversionOrchestrator
{
public:
    ConversionOrchestrator(IMediaBackend &backend, IAccessProvider &access, IFrameProcessor &processor,
                           ConverterSettings settings = ConverterSettings());
    ~ConversionOrchestrator() = default;

    ConversionOrchestrator(const ConversionOrchestrator &) = delete;
    ConversionOrchestrator &operator=(const ConversionOrchestrator &) = delete;

    // Throws ConversionError. The session is Idle again when this returns or throws.
    ConversionOutcome convert(const std::string &sourcePath, const std::string &destinationPath);

    // Returns false when nothing is being prepared or processed. The output is
    // gone when this returns; the phase reads Cancelled until convert() returns.
    bool cancel(const std::string &expectedOutputPath);

    ProgressSnapshot progress() const;
    ConversionPhase phase() const;

    // Result of the most recent successful finalize; empty when its metadata could not be read
    std::optional<ConversionResult> lastConvertedFile() const;

    // Invoked on the video pump thread after every processed frame
    void setProgressCallback(ProgressCallback callback);

private:
    struct Session;
    using SessionPtr = std::shared_ptr<Session>;

    bool prepareSession(const SessionPtr &session);
    bool cancelledWhilePreparing(const SessionPtr &session) const;
    ConversionOutcome abandonPreparing(const SessionPtr &session);
    void cleanupFailedSession(const SessionPtr &session);

    void runVideoPump(SessionPtr session);
    void runAudioPump(SessionPtr session);
    void processVideoFrame(Session &session, IStereoFrameWriter &input, const VideoFrame &frame);
    void finishVideo(const SessionPtr &session);
    void finishAudio(const SessionPtr &session);
    void finalizeIfComplete(const SessionPtr &session);
    void finalize(const SessionPtr &session);

    void resetToIdleLocked(const SessionPtr &session);

    IMediaBackend &m_backend;
    IAccessProvider &m_access;
    IFrameProcessor &m_processor;
    ConverterSettings m_settings;

    // Lock order: m_teardownMutex, then m_stateMutex
    std::mutex m_teardownMutex;
    mutable std::mutex m_stateMutex;
    ConversionPhase m_phase = ConversionPhase::Idle;
    SessionPtr m_session;
    ProgressSnapshot m_progress;
    ProgressEstimator m_estimator;
    std::optional<ConversionResult> m_lastResult;
    ProgressCallback m_callback;
};
