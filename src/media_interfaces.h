#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>

#include "pipeline_types.h"

// Demand side of one sink input. waitForDemand() blocks until the input can
// take more data and returns false once the input has been marked finished.
class ISinkInput
{
public:
    virtual ~ISinkInput() = default;
    virtual bool waitForDemand() = 0;
    virtual bool isReadyForMoreData() const = 0;
    virtual void markAsFinished() = 0;
};

class IStereoFrameWriter : public ISinkInput
{
public:
    // Encodes both views of the pair as one access unit. False on failure.
    virtual bool appendPair(const StereoFramePair &pair) = 0;
};

class IAudioPassthroughInput : public ISinkInput
{
public:
    virtual bool appendSample(const AudioSample &sample) = 0;
};

class IMediaSink
{
public:
    virtual ~IMediaSink() = default;

    virtual void configureVideo(const VideoOutputSettings &settings) = 0;
    virtual void configureAudio(const AudioTrackInfo &track) = 0;

    virtual IStereoFrameWriter &videoInput() = 0;
    // nullptr unless configureAudio() was called
    virtual IAudioPassthroughInput *audioInput() = 0;

    virtual void startWriting() = 0;
    // Flushes and closes the container. False when the file could not be completed;
    // throws ConversionError, after closing, when the stream itself is unusable.
    virtual bool finishWriting() = 0;
    // Abandons the output without writing a trailer
    virtual void cancelWriting() = 0;
};

class ISourceVideoTrack
{
public:
    virtual ~ISourceVideoTrack() = default;
    // False once the track is exhausted or reading was cancelled
    virtual bool copyNextFrame(VideoFrame &frame) = 0;
};

class ISourceAudioTrack
{
public:
    virtual ~ISourceAudioTrack() = default;
    virtual bool copyNextSample(AudioSample &sample) = 0;
    virtual const AudioTrackInfo &trackInfo() const = 0;
};

class IMediaSource
{
public:
    virtual ~IMediaSource() = default;

    virtual const SourceInfo &info() const = 0;
    virtual ISourceVideoTrack &videoTrack() = 0;
    virtual ISourceAudioTrack *audioTrack() = 0;

    virtual void startReading() = 0;
    virtual void cancelReading() = 0;
};

class IMediaBackend
{
public:
    virtual ~IMediaBackend() = default;

    // Both throw ConversionError when the location cannot be opened
    virtual std::unique_ptr<IMediaSource> openSource(const std::string &path) = 0;
    virtual std::unique_ptr<IMediaSink> openSink(const std::string &path) = 0;

    // Duration in seconds of a finished file. Throws on failure.
    virtual double probeDuration(const std::string &path) = 0;
};

enum class AccessMode
{
    Read,
    Write
};

class IAccessProvider
{
public:
    virtual ~IAccessProvider() = default;
    virtual bool startAccessing(const std::string &path, AccessMode mode) = 0;
    virtual void stopAccessing(const std::string &path) = 0;
};

// Holds one access grant and gives it back exactly once
class ScopedAccess
{
public:
    ScopedAccess(IAccessProvider &provider, std::string path)
        : m_provider(provider), m_path(std::move(path)) {}
    ~ScopedAccess() { release(); }

    ScopedAccess(const ScopedAccess &) = delete;
    ScopedAccess &operator=(const ScopedAccess &) = delete;

    bool acquire(AccessMode mode)
    {
        if (m_held.load())
            return true;
        if (!m_provider.startAccessing(m_path, mode))
            return false;
        m_held.store(true);
        return true;
    }

    void release()
    {
        if (m_held.exchange(false))
            m_provider.stopAccessing(m_path);
    }

    bool held() const { return m_held.load(); }
    const std::string &path() const { return m_path; }

private:
    IAccessProvider &m_provider;
    std::string m_path;
    std::atomic<bool> m_held{false};
};
