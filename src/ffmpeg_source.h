#pragma once

extern "C"
{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
}

#include <atomic>
#include <memory>
#include <string>

#include "async_demuxer.h"
#include "media_interfaces.h"

class FfmpegVideoTrack : public ISourceVideoTrack
{
public:
    FfmpegVideoTrack(AVFormatContext *fmt, AVStream *st, AVCodecContext *dec);
    ~FfmpegVideoTrack() override;

    bool copyNextFrame(VideoFrame &frame) override;

    void start();
    void cancel();

private:
    AVStream *m_stream;
    AVCodecContext *m_dec;
    AsyncDemuxer m_demuxer;
    std::atomic<bool> m_cancelled{false};
    bool m_flushed = false;
    bool m_done = false;
    int64_t m_decodeErrors = 0;
};

class FfmpegAudioTrack : public ISourceAudioTrack
{
public:
    FfmpegAudioTrack(AVFormatContext *fmt, AVStream *st);

    bool copyNextSample(AudioSample &sample) override;
    const AudioTrackInfo &trackInfo() const override { return m_info; }

    void start();
    void cancel();

private:
    AVStream *m_stream;
    AsyncDemuxer m_demuxer;
    AudioTrackInfo m_info;
};

// Demultiplexer for a side-by-side source. The video and audio tracks each
// read through their own AVFormatContext so they can be pumped independently.
class FfmpegSource : public IMediaSource
{
public:
    // Throws ConversionError (SourceOpenFailed, NoVideoTrack, NoFormatDescription)
    explicit FfmpegSource(const std::string &path);
    ~FfmpegSource() override;

    FfmpegSource(const FfmpegSource &) = delete;
    FfmpegSource &operator=(const FfmpegSource &) = delete;

    const SourceInfo &info() const override { return m_info; }
    ISourceVideoTrack &videoTrack() override { return *m_video; }
    ISourceAudioTrack *audioTrack() override { return m_audio.get(); }

    void startReading() override;
    void cancelReading() override;

private:
    void open(const std::string &path);
    void close();

    AVFormatContext *m_videoFmt = nullptr;
    AVFormatContext *m_audioFmt = nullptr;
    AVCodecContext *m_vdec = nullptr;
    std::unique_ptr<FfmpegVideoTrack> m_video;
    std::unique_ptr<FfmpegAudioTrack> m_audio;
    SourceInfo m_info;
    bool m_started = false;
};
