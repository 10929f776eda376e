#include "ffmpeg_utils.h"
#include "logger.h"

#include <cstring>

extern "C"
{
#include <libavutil/log.h>
}

static void ffmpeg_log_callback(void *avcl, int level, const char *fmt, va_list vl)
{
    if (level > av_log_get_level())
        return;

    LogLevel mapped;
    if (level <= AV_LOG_ERROR)
        mapped = LogLevel::Error;
    else if (level <= AV_LOG_WARNING)
        mapped = LogLevel::Warn;
    else if (level <= AV_LOG_INFO)
        mapped = LogLevel::Verbose;
    else
        mapped = LogLevel::Debug;

    if (!Logger::instance().shouldLog(mapped))
        return;

    // FFmpeg splits some messages across calls; only prefix the start of a line
    static thread_local int print_prefix = 1;
    char line[1024];
    int len = av_log_format_line2(avcl, level, fmt, vl, line, sizeof(line), &print_prefix);
    if (len <= 0)
        return;

    size_t n = std::strlen(line);
    while (n > 0 && (line[n - 1] == '\n' || line[n - 1] == '\r'))
        line[--n] = '\0';
    if (n == 0)
        return;

    Logger::instance().log(mapped, "[ffmpeg] %s", line);
}

void install_ffmpeg_log_bridge()
{
    // Set FFmpeg log level to match application log level
    if (Logger::instance().debugEnabled())
        av_log_set_level(AV_LOG_VERBOSE);
    else if (Logger::instance().verboseEnabled())
        av_log_set_level(AV_LOG_INFO);
    else
        av_log_set_level(AV_LOG_WARNING);

    av_log_set_callback(ffmpeg_log_callback);
}

AVRational nominal_frame_rate(AVFormatContext *fmt, AVStream *st)
{
    AVRational fr = av_guess_frame_rate(fmt, st, nullptr);
    if (fr.num == 0 || fr.den == 0) fr = st->r_frame_rate;
    if (fr.num == 0 || fr.den == 0) fr = st->avg_frame_rate;
    if (fr.num == 0 || fr.den == 0) fr = AVRational{st->time_base.den, st->time_base.num};
    return fr;
}

double stream_duration_seconds(const AVFormatContext *fmt, const AVStream *st)
{
    if (st && st->duration > 0 && st->duration != AV_NOPTS_VALUE)
        return st->duration * av_q2d(st->time_base);
    if (fmt && fmt->duration != AV_NOPTS_VALUE && fmt->duration > 0)
        return static_cast<double>(fmt->duration) / AV_TIME_BASE;
    return 0.0;
}

int64_t estimated_bit_rate(const AVFormatContext *fmt, const AVStream *st)
{
    if (st && st->codecpar && st->codecpar->bit_rate > 0)
        return st->codecpar->bit_rate;
    if (fmt && fmt->bit_rate > 0)
        return fmt->bit_rate;
    return 0;
}

double probe_media_duration(const std::string &path)
{
    AVFormatContext *fmt = nullptr;
    ff_check(avformat_open_input(&fmt, path.c_str(), nullptr, nullptr), "reopen output");

    int err = avformat_find_stream_info(fmt, nullptr);
    if (err < 0)
    {
        avformat_close_input(&fmt);
        ff_check(err, "probe output stream info");
    }

    double seconds = stream_duration_seconds(fmt, nullptr);
    if (seconds <= 0.0)
    {
        for (unsigned int i = 0; i < fmt->nb_streams; ++i)
        {
            double d = stream_duration_seconds(nullptr, fmt->streams[i]);
            if (d > seconds)
                seconds = d;
        }
    }
    avformat_close_input(&fmt);

    if (seconds <= 0.0)
        throw std::runtime_error("output container reports no duration: " + path);
    return seconds;
}

bool muxer_is_isobmff(const AVOutputFormat *ofmt)
{
    if (!ofmt || !ofmt->name)
        return false;
    const char *name = ofmt->name;
    return std::strcmp(name, "mov") == 0 || std::strcmp(name, "mp4") == 0 ||
           std::strcmp(name, "ipod") == 0 || std::strcmp(name, "ismv") == 0;
}
