#pragma once

extern "C"
{
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
}

#include <cstdio>
#include <stdexcept>
#include <string>

inline void ff_check(int err, const char *what)
{
    if (err < 0)
    {
        char buf[256];
        av_strerror(err, buf, sizeof(buf));
        throw std::runtime_error(std::string(what) + ": " + buf);
    }
}

inline std::string ff_err_string(int err)
{
    char buf[AV_ERROR_MAX_STRING_SIZE];
    av_make_error_string(buf, sizeof(buf), err);
    return buf;
}

inline std::string ff_ts(double seconds)
{
    char b[64];
    snprintf(b, sizeof(b), "%.3fs", seconds);
    return b;
}

// Route av_log output through Logger and match FFmpeg verbosity to ours.
void install_ffmpeg_log_bridge();

// Nominal fps, FFmpeg-like priority: guess -> r_frame_rate -> avg_frame_rate -> inverse time_base
AVRational nominal_frame_rate(AVFormatContext *fmt, AVStream *st);

// Stream duration if known, otherwise container duration; 0 when neither is
double stream_duration_seconds(const AVFormatContext *fmt, const AVStream *st);

// Bitrate of the stream if declared, otherwise the container's overall bitrate
int64_t estimated_bit_rate(const AVFormatContext *fmt, const AVStream *st);

// Reopens a finished container and reads its duration. Throws on failure.
double probe_media_duration(const std::string &path);

// True for mov/mp4 style muxers that take ISO-BMFF flags and tags
bool muxer_is_isobmff(const AVOutputFormat *ofmt);
