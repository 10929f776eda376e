#include "conversion_orchestrator.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;
using Kind = ConversionError::Kind;

struct ConversionOrchestrator::Session
{
    Session(IAccessProvider &access, const std::string &src, const std::string &dst)
        : sourcePath(src), destinationPath(dst), sourceAccess(access, src), destinationAccess(access, dst) {}

    std::string sourcePath;
    std::string destinationPath;
    ScopedAccess sourceAccess;
    ScopedAccess destinationAccess;

    std::unique_ptr<IMediaSink> sink;
    std::unique_ptr<IMediaSource> source;
    bool hasAudio = false;
    EyeRegions regions;
    Clock::time_point startTime;

    std::atomic<bool> cancelled{false};

    // Guarded by m_stateMutex
    std::string cancelTarget;
    bool videoDone = false;
    bool audioDone = false;
    bool finalizeClaimed = false;
    bool finalized = false;
    bool writeFailed = false;
    bool pumpFailed = false;
    std::string failure;
};

static void remove_output(const std::string &path)
{
    std::error_code ec;
    if (fs::remove(path, ec))
        LOG_VERBOSE("Removed partial output %s", path.c_str());
    else if (ec)
        LOG_WARN("Could not remove %s: %s", path.c_str(), ec.message().c_str());
}

static double seconds_since(Clock::time_point start)
{
    return std::chrono::duration<double>(Clock::now() - start).count();
}

ConversionOrchestrator::ConversionOrchestrator(IMediaBackend &backend, IAccessProvider &access,
                                               IFrameProcessor &processor, ConverterSettings settings)
    : m_backend(backend), m_access(access), m_processor(processor), m_settings(settings)
{
}

ConversionOutcome ConversionOrchestrator::convert(const std::string &sourcePath, const std::string &destinationPath)
{
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_session || m_phase != ConversionPhase::Idle)
            throw ConversionError(Kind::Busy, "a conversion is already in progress");
        session = std::make_shared<Session>(m_access, sourcePath, destinationPath);
        m_session = session;
        m_phase = ConversionPhase::Preparing;
        m_progress = ProgressSnapshot();
        m_estimator.reset();
    }
    LOG_INFO("Converting %s -> %s", sourcePath.c_str(), destinationPath.c_str());

    bool started = false;
    try
    {
        started = prepareSession(session);
    }
    catch (const ConversionError &e)
    {
        LOG_ERROR("Conversion setup failed (%s): %s", error_kind_name(e.kind()), e.what());
        cleanupFailedSession(session);
        throw;
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Conversion setup failed: %s", e.what());
        cleanupFailedSession(session);
        throw;
    }
    if (!started)
        return abandonPreparing(session);

    std::thread videoPump(&ConversionOrchestrator::runVideoPump, this, session);
    std::thread audioPump;
    if (session->hasAudio)
        audioPump = std::thread(&ConversionOrchestrator::runAudioPump, this, session);
    videoPump.join();
    if (audioPump.joinable())
        audioPump.join();

    std::lock_guard<std::mutex> teardown(m_teardownMutex);
    bool cancelled = false;
    bool finalized = false;
    bool writeFailed = false;
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        cancelled = session->cancelled;
        finalized = session->finalized;
        writeFailed = session->writeFailed;
        failure = session->failure;
    }

    if (cancelled)
    {
        // cancel() already tore the session down; Idle only once the pumps are gone
        std::lock_guard<std::mutex> lock(m_stateMutex);
        resetToIdleLocked(session);
        LOG_INFO("Conversion cancelled");
        return ConversionOutcome::Cancelled;
    }
    if (finalized)
    {
        LOG_INFO("Conversion finished: %s", destinationPath.c_str());
        return ConversionOutcome::Completed;
    }

    if (!writeFailed)
    {
        // A pump stopped on an error before the file could be finalized
        session->sink->cancelWriting();
        session->source->cancelReading();
        remove_output(destinationPath);
        session->sourceAccess.release();
        session->destinationAccess.release();
        std::lock_guard<std::mutex> lock(m_stateMutex);
        resetToIdleLocked(session);
        m_progress = ProgressSnapshot();
    }
    if (failure.empty())
        failure = "could not finish writing " + destinationPath;
    LOG_ERROR("Conversion failed: %s", failure.c_str());
    throw ConversionError(Kind::WriteFailed, failure);
}

bool ConversionOrchestrator::prepareSession(const SessionPtr &session)
{
    Session &s = *session;

    if (!s.sourceAccess.acquire(AccessMode::Read))
        throw ConversionError(Kind::PermissionDenied, "no read access to " + s.sourcePath);
    if (!s.destinationAccess.acquire(AccessMode::Write))
        throw ConversionError(Kind::PermissionDenied, "no write access to " + s.destinationPath);

    std::error_code ec;
    if (fs::exists(s.destinationPath, ec))
    {
        fs::remove(s.destinationPath, ec);
        if (ec)
            throw ConversionError(Kind::DestinationNotRemovable,
                                  "cannot replace " + s.destinationPath + ": " + ec.message());
        LOG_VERBOSE("Removed existing %s", s.destinationPath.c_str());
    }
    if (cancelledWhilePreparing(session))
        return false;

    s.sink = m_backend.openSink(s.destinationPath);
    s.source = m_backend.openSource(s.sourcePath);
    if (cancelledWhilePreparing(session))
        return false;

    const SourceInfo &info = s.source->info();
    double totalFrames = info.durationSeconds * av_q2d(info.frameRate);
    if (!(totalFrames > 0.0))
        totalFrames = 0.0;

    if (m_processor.isPrepared() && m_processor.inputFormat() == info.format)
    {
        LOG_DEBUG("Reusing frame processor configuration");
    }
    else if (!m_processor.prepare(info.format, m_settings.retainedBufferCount))
    {
        throw ConversionError(Kind::ProcessorUnavailable, "frame processor could not be prepared");
    }
    if (!m_processor.isPrepared())
        throw ConversionError(Kind::ProcessorUnavailable, "frame processor is not prepared");

    s.regions = make_eye_regions(info.naturalWidth, info.naturalHeight);

    const OutputFormat out = m_processor.outputFormat();
    VideoOutputSettings video;
    video.width = out.width;
    video.height = out.height;
    video.pixelFormat = out.pixelFormat;
    video.frameRate = info.frameRate;
    video.bitRate = info.estimatedBitRate;
    video.colorSpace = out.colorSpace;
    video.horizontalFieldOfViewDegrees = 90.0;
    video.horizontalDisparityAdjustment = 0.0;

    ISourceAudioTrack *audio = s.source->audioTrack();
    try
    {
        s.sink->configureVideo(video);
        if (audio)
            s.sink->configureAudio(audio->trackInfo());
        s.sink->startWriting();
    }
    catch (const ConversionError &)
    {
        throw;
    }
    catch (const std::runtime_error &e)
    {
        throw ConversionError(Kind::DestinationOpenFailed, e.what());
    }

    try
    {
        s.source->startReading();
    }
    catch (const ConversionError &)
    {
        throw;
    }
    catch (const std::runtime_error &e)
    {
        throw ConversionError(Kind::SourceOpenFailed, e.what());
    }
    s.hasAudio = audio != nullptr && s.sink->audioInput() != nullptr;

    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (s.cancelled)
        return false;
    m_phase = ConversionPhase::Processing;
    s.startTime = Clock::now();
    m_progress.isProcessing = true;
    m_progress.totalFrames = totalFrames;
    m_progress.framesProcessed = 0;
    m_progress.timeRemaining = 0.0;
    LOG_VERBOSE("Processing ~%.0f frames (%s audio)", totalFrames, s.hasAudio ? "with" : "no");
    return true;
}

bool ConversionOrchestrator::cancelledWhilePreparing(const SessionPtr &session) const
{
    return session->cancelled.load();
}

ConversionOutcome ConversionOrchestrator::abandonPreparing(const SessionPtr &session)
{
    std::lock_guard<std::mutex> teardown(m_teardownMutex);
    std::string target;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        target = session->cancelTarget.empty() ? session->destinationPath : session->cancelTarget;
    }
    if (session->sink)
        session->sink->cancelWriting();
    if (session->source)
        session->source->cancelReading();
    remove_output(target);
    session->sourceAccess.release();
    session->destinationAccess.release();

    std::lock_guard<std::mutex> lock(m_stateMutex);
    resetToIdleLocked(session);
    m_progress = ProgressSnapshot();
    LOG_INFO("Conversion cancelled before processing started");
    return ConversionOutcome::Cancelled;
}

void ConversionOrchestrator::cleanupFailedSession(const SessionPtr &session)
{
    std::lock_guard<std::mutex> teardown(m_teardownMutex);
    if (session->sink)
    {
        session->sink->cancelWriting();
        remove_output(session->destinationPath);
    }
    if (session->source)
        session->source->cancelReading();
    session->sourceAccess.release();
    session->destinationAccess.release();

    std::lock_guard<std::mutex> lock(m_stateMutex);
    resetToIdleLocked(session);
    m_progress = ProgressSnapshot();
}

bool ConversionOrchestrator::cancel(const std::string &expectedOutputPath)
{
    std::lock_guard<std::mutex> teardown(m_teardownMutex);
    SessionPtr session;
    ConversionPhase phaseAtCancel;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!m_session || (m_phase != ConversionPhase::Preparing && m_phase != ConversionPhase::Processing))
            return false;
        session = m_session;
        phaseAtCancel = m_phase;
        session->cancelled = true;
        session->cancelTarget = expectedOutputPath;
        m_phase = ConversionPhase::Cancelled;
        m_progress.isProcessing = false;
    }

    // convert() tears down a session that is still being set up at its next checkpoint
    if (phaseAtCancel == ConversionPhase::Preparing)
    {
        LOG_VERBOSE("Cancel requested while preparing");
        return true;
    }

    session->sink->videoInput().markAsFinished();
    if (IAudioPassthroughInput *audio = session->sink->audioInput())
        audio->markAsFinished();
    session->sink->cancelWriting();
    session->source->cancelReading();
    remove_output(expectedOutputPath.empty() ? session->destinationPath : expectedOutputPath);
    session->sourceAccess.release();
    session->destinationAccess.release();

    // The phase stays Cancelled until convert() has joined the pumps
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_progress = ProgressSnapshot();
    m_estimator.reset();
    LOG_VERBOSE("Conversion of %s cancelled", session->sourcePath.c_str());
    return true;
}

void ConversionOrchestrator::runVideoPump(SessionPtr session)
{
    IStereoFrameWriter &input = session->sink->videoInput();
    ISourceVideoTrack &track = session->source->videoTrack();

    try
    {
        bool exhausted = false;
        while (!exhausted && input.waitForDemand())
        {
            if (session->cancelled)
                break;
            while (input.isReadyForMoreData() && !session->cancelled)
            {
                VideoFrame frame;
                if (!track.copyNextFrame(frame))
                {
                    exhausted = true;
                    break;
                }
                processVideoFrame(*session, input, frame);
            }
        }
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Video pump stopped: %s", e.what());
        std::lock_guard<std::mutex> lock(m_stateMutex);
        session->pumpFailed = true;
        session->failure = e.what();
    }

    if (session->cancelled)
        return;
    finishVideo(session);
}

void ConversionOrchestrator::processVideoFrame(Session &session, IStereoFrameWriter &input, const VideoFrame &frame)
{
    if (!frame.image)
        return;

    FramePtr left = m_processor.cropFrame(*frame.image, session.regions.left);
    FramePtr right = left ? m_processor.cropFrame(*frame.image, session.regions.right) : make_frame_ptr();
    if (!left || !right)
    {
        LOG_WARN("Skipping frame at pts %lld: no buffer for the eye views", static_cast<long long>(frame.pts));
        return;
    }

    StereoFramePair pair;
    pair.views[0].buffer = std::move(left);
    pair.views[0].layerId = 0;
    pair.views[0].eye = StereoEye::Left;
    pair.views[1].buffer = std::move(right);
    pair.views[1].layerId = 1;
    pair.views[1].eye = StereoEye::Right;
    pair.pts = frame.pts;
    pair.timeBase = frame.timeBase;

    if (!input.appendPair(pair))
        LOG_WARN("Dropped frame at pts %lld: append failed", static_cast<long long>(frame.pts));

    ProgressSnapshot snapshot;
    ProgressCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (session.cancelled)
            return;
        if (m_progress.framesProcessed < m_progress.totalFrames - 1)
            ++m_progress.framesProcessed;
        m_progress.timeRemaining = m_estimator.update(seconds_since(session.startTime),
                                                      m_progress.framesProcessed, m_progress.totalFrames);
        snapshot = m_progress;
        callback = m_callback;
    }
    if (callback)
        callback(snapshot);
}

void ConversionOrchestrator::runAudioPump(SessionPtr session)
{
    IAudioPassthroughInput *input = session->sink->audioInput();
    ISourceAudioTrack *track = session->source->audioTrack();

    try
    {
        bool exhausted = false;
        while (!exhausted && input->waitForDemand())
        {
            if (session->cancelled)
                break;
            while (input->isReadyForMoreData() && !session->cancelled)
            {
                AudioSample sample;
                if (!track->copyNextSample(sample))
                {
                    exhausted = true;
                    break;
                }
                if (!input->appendSample(sample))
                    LOG_WARN("Dropped audio sample: append failed");
            }
        }
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("Audio pump stopped: %s", e.what());
        std::lock_guard<std::mutex> lock(m_stateMutex);
        session->pumpFailed = true;
        session->failure = e.what();
    }

    if (session->cancelled)
        return;
    finishAudio(session);
}

void ConversionOrchestrator::finishVideo(const SessionPtr &session)
{
    session->sourceAccess.release();
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (session->videoDone)
            return;
        session->videoDone = true;
    }
    session->sink->videoInput().markAsFinished();
    LOG_VERBOSE("Video input finished");
    finalizeIfComplete(session);
}

void ConversionOrchestrator::finishAudio(const SessionPtr &session)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (session->audioDone)
            return;
        session->audioDone = true;
    }
    if (IAudioPassthroughInput *input = session->sink->audioInput())
        input->markAsFinished();
    LOG_VERBOSE("Audio input finished");
    finalizeIfComplete(session);
}

void ConversionOrchestrator::finalizeIfComplete(const SessionPtr &session)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (session->cancelled || session->finalizeClaimed || session->pumpFailed)
            return;
        if (!session->videoDone || (session->hasAudio && !session->audioDone))
            return;
        if (m_session != session || m_phase != ConversionPhase::Processing)
            return;
        session->finalizeClaimed = true;
        m_phase = ConversionPhase::Finishing;
    }
    finalize(session);
}

void ConversionOrchestrator::finalize(const SessionPtr &session)
{
    const std::string &path = session->destinationPath;
    LOG_VERBOSE("Finalizing %s", path.c_str());

    bool finished = false;
    std::string failure = "could not finish writing " + path;
    try
    {
        finished = session->sink->finishWriting();
    }
    catch (const ConversionError &e)
    {
        failure = e.what();
    }
    if (!finished)
    {
        remove_output(path);
        session->sourceAccess.release();
        session->destinationAccess.release();
        std::lock_guard<std::mutex> lock(m_stateMutex);
        session->writeFailed = true;
        session->failure = failure;
        resetToIdleLocked(session);
        m_progress = ProgressSnapshot();
        return;
    }

    ConversionResult result;
    result.outputPath = path;
    result.elapsedSeconds = seconds_since(session->startTime);
    bool haveMetadata = true;

    std::error_code ec;
    const uintmax_t size = fs::file_size(path, ec);
    if (ec)
    {
        LOG_WARN("Could not read size of %s: %s", path.c_str(), ec.message().c_str());
        haveMetadata = false;
    }
    else
    {
        result.outputSizeBytes = size;
    }

    try
    {
        result.outputDurationSeconds = m_backend.probeDuration(path);
    }
    catch (const std::exception &e)
    {
        LOG_WARN("Could not read duration of %s: %s", path.c_str(), e.what());
        haveMetadata = false;
    }

    session->destinationAccess.release();
    session->sourceAccess.release();

    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (haveMetadata)
        m_lastResult = result;
    else
        m_lastResult.reset();
    session->finalized = true;
    m_progress.timeRemaining = 0.0;
    resetToIdleLocked(session);
}

void ConversionOrchestrator::resetToIdleLocked(const SessionPtr &session)
{
    if (m_session == session)
    {
        m_session.reset();
        m_phase = ConversionPhase::Idle;
    }
    m_progress.isProcessing = false;
}

ProgressSnapshot ConversionOrchestrator::progress() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_progress;
}

ConversionPhase ConversionOrchestrator::phase() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_phase;
}

std::optional<ConversionResult> ConversionOrchestrator::lastConvertedFile() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastResult;
}

void ConversionOrchestrator::setProgressCallback(ProgressCallback callback)
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_callback = std::move(callback);
}
