#pragma once

extern "C"
{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

#include "async_muxer.h"
#include "media_interfaces.h"

class FfmpegSink;

// Switches an allocated, not yet opened encoder into two-view (MV-HEVC) mode.
// Returns false when the encoder has no such mode.
bool enable_two_view_encoding(AVCodecContext *enc);

class FfmpegVideoInput : public IStereoFrameWriter
{
public:
    explicit FfmpegVideoInput(FfmpegSink &sink) : m_sink(sink) {}

    bool waitForDemand() override;
    bool isReadyForMoreData() const override;
    void markAsFinished() override;
    bool appendPair(const StereoFramePair &pair) override;

    bool finished() const { return m_finished; }

private:
    FfmpegSink &m_sink;
    std::atomic<bool> m_finished{false};
};

class FfmpegAudioInput : public IAudioPassthroughInput
{
public:
    explicit FfmpegAudioInput(FfmpegSink &sink) : m_sink(sink) {}

    bool waitForDemand() override;
    bool isReadyForMoreData() const override;
    void markAsFinished() override;
    bool appendSample(const AudioSample &sample) override;

private:
    FfmpegSink &m_sink;
    std::atomic<bool> m_finished{false};
};

// Spatial video writer: one HEVC track carrying both eye views per frame,
// tagged with stereo metadata, plus an optional pass-through audio track.
class FfmpegSink : public IMediaSink
{
public:
    // Creates the output container and opens the file for writing.
    // Throws ConversionError(DestinationOpenFailed).
    FfmpegSink(const std::string &path, const std::string &encoderName);
    ~FfmpegSink() override;

    FfmpegSink(const FfmpegSink &) = delete;
    FfmpegSink &operator=(const FfmpegSink &) = delete;

    void configureVideo(const VideoOutputSettings &settings) override;
    void configureAudio(const AudioTrackInfo &track) override;

    IStereoFrameWriter &videoInput() override { return m_videoInput; }
    IAudioPassthroughInput *audioInput() override { return m_audioStream ? &m_audioInput : nullptr; }

    void startWriting() override;
    bool finishWriting() override;
    void cancelWriting() override;

private:
    friend class FfmpegVideoInput;
    friend class FfmpegAudioInput;

    bool encodePair(const StereoFramePair &pair);
    bool writeAudio(const AudioSample &sample);
    void sendFrame(AVFrame *frame);
    void drainEncoder();
    void closeOutput();

    std::string m_path;
    std::string m_encoderName;
    AVFormatContext *m_fmt = nullptr;
    AVCodecContext *m_venc = nullptr;
    AVStream *m_videoStream = nullptr;
    AVStream *m_audioStream = nullptr;
    AVRational m_audioSourceTimeBase{0, 1};

    std::unique_ptr<AsyncMuxer> m_muxer;
    FfmpegVideoInput m_videoInput;
    FfmpegAudioInput m_audioInput;

    std::mutex m_encMutex;
    PacketPtr m_encPkt{nullptr, &av_packet_free_single};
    int64_t m_lastPts = AV_NOPTS_VALUE;
    int64_t m_lastVideoDts = AV_NOPTS_VALUE;
    int64_t m_pairsSent = 0;
    int64_t m_videoPackets = 0;
    std::atomic<bool> m_cancelled{false};
    bool m_closed = false;
};
