#include "ffmpeg_source.h"
#include "ffmpeg_utils.h"
#include "logger.h"

extern "C"
{
#include <libavutil/pixdesc.h>
}

static AVFormatContext *open_container(const std::string &path)
{
    AVFormatContext *fmt = nullptr;
    int err = avformat_open_input(&fmt, path.c_str(), nullptr, nullptr);
    if (err < 0)
        throw ConversionError(ConversionError::Kind::SourceOpenFailed,
                              "cannot open " + path + ": " + ff_err_string(err));
    err = avformat_find_stream_info(fmt, nullptr);
    if (err < 0)
    {
        avformat_close_input(&fmt);
        throw ConversionError(ConversionError::Kind::SourceOpenFailed,
                              "cannot read stream info of " + path + ": " + ff_err_string(err));
    }
    return fmt;
}

// Only the selected stream is demuxed by each context
static void discard_all_but(AVFormatContext *fmt, int keep)
{
    for (unsigned int i = 0; i < fmt->nb_streams; ++i)
        fmt->streams[i]->discard = (static_cast<int>(i) == keep) ? AVDISCARD_DEFAULT : AVDISCARD_ALL;
}

FfmpegVideoTrack::FfmpegVideoTrack(AVFormatContext *fmt, AVStream *st, AVCodecContext *dec)
    : m_stream(st), m_dec(dec), m_demuxer(fmt, st->index)
{
}

FfmpegVideoTrack::~FfmpegVideoTrack()
{
    m_demuxer.stop();
}

void FfmpegVideoTrack::start()
{
    m_demuxer.start();
}

void FfmpegVideoTrack::cancel()
{
    m_cancelled = true;
    m_demuxer.stop();
}

bool FfmpegVideoTrack::copyNextFrame(VideoFrame &out)
{
    if (m_done)
        return false;

    FramePtr frame = make_frame_ptr(av_frame_alloc());
    if (!frame)
        throw std::runtime_error("alloc decode frame failed");

    while (!m_cancelled)
    {
        int ret = avcodec_receive_frame(m_dec, frame.get());
        if (ret >= 0)
        {
            out.pts = frame->best_effort_timestamp != AV_NOPTS_VALUE ? frame->best_effort_timestamp : frame->pts;
            out.timeBase = m_stream->time_base;
            out.image = std::move(frame);
            return true;
        }
        if (ret == AVERROR_EOF)
            break;
        if (ret != AVERROR(EAGAIN))
        {
            LOG_WARN("Video decode error: %s", ff_err_string(ret).c_str());
            break;
        }

        if (m_flushed)
            break;

        PacketPtr pkt = m_demuxer.getPacket();
        if (!pkt)
        {
            if (m_cancelled || m_demuxer.state() == AsyncDemuxer::State::Stopped)
                break;
            if (m_demuxer.state() == AsyncDemuxer::State::Failed)
                LOG_WARN("Video read ended early: %s", ff_err_string(m_demuxer.error()).c_str());
            // Drain frames still held by the decoder
            ff_check(avcodec_send_packet(m_dec, nullptr), "flush video decoder");
            m_flushed = true;
            continue;
        }

        ret = avcodec_send_packet(m_dec, pkt.get());
        if (ret < 0 && ret != AVERROR(EAGAIN))
        {
            ++m_decodeErrors;
            LOG_DEBUG("Dropping undecodable video packet (pts=%lld): %s",
                      static_cast<long long>(pkt->pts), ff_err_string(ret).c_str());
        }
    }

    m_done = true;
    if (m_decodeErrors > 0)
        LOG_VERBOSE("Video track finished with %lld undecodable packets", static_cast<long long>(m_decodeErrors));
    return false;
}

FfmpegAudioTrack::FfmpegAudioTrack(AVFormatContext *fmt, AVStream *st)
    : m_stream(st), m_demuxer(fmt, st->index)
{
    m_info.streamIndex = st->index;
    m_info.timeBase = st->time_base;
    m_info.params.reset(avcodec_parameters_alloc());
    if (!m_info.params)
        throw std::runtime_error("alloc audio parameters failed");
    ff_check(avcodec_parameters_copy(m_info.params.get(), st->codecpar), "copy audio parameters");
}

void FfmpegAudioTrack::start()
{
    m_demuxer.start();
}

void FfmpegAudioTrack::cancel()
{
    m_demuxer.stop();
}

bool FfmpegAudioTrack::copyNextSample(AudioSample &sample)
{
    PacketPtr pkt = m_demuxer.getPacket();
    if (!pkt)
        return false;
    sample.packet = std::move(pkt);
    sample.timeBase = m_stream->time_base;
    return true;
}

FfmpegSource::FfmpegSource(const std::string &path)
{
    try
    {
        open(path);
    }
    catch (...)
    {
        close();
        throw;
    }
}

FfmpegSource::~FfmpegSource()
{
    close();
}

void FfmpegSource::open(const std::string &path)
{
    m_videoFmt = open_container(path);

    int vstream = av_find_best_stream(m_videoFmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (vstream < 0)
        throw ConversionError(ConversionError::Kind::NoVideoTrack, "no video track in " + path);
    AVStream *vst = m_videoFmt->streams[vstream];

    FormatDescriptor &fd = m_info.format;
    fd.pixelFormat = static_cast<AVPixelFormat>(vst->codecpar->format);
    fd.width = vst->codecpar->width;
    fd.height = vst->codecpar->height;
    fd.primaries = vst->codecpar->color_primaries;
    fd.transfer = vst->codecpar->color_trc;
    fd.matrix = vst->codecpar->color_space;
    fd.range = vst->codecpar->color_range;
    if (fd.pixelFormat == AV_PIX_FMT_NONE || fd.width <= 0 || fd.height <= 0)
        throw ConversionError(ConversionError::Kind::NoFormatDescription,
                              "video track of " + path + " has no usable format description");

    const AVCodec *decoder = avcodec_find_decoder(vst->codecpar->codec_id);
    if (!decoder)
        throw ConversionError(ConversionError::Kind::SourceOpenFailed,
                              std::string("no decoder for ") + avcodec_get_name(vst->codecpar->codec_id));

    m_vdec = avcodec_alloc_context3(decoder);
    if (!m_vdec)
        throw std::runtime_error("Failed to allocate decoder context");
    ff_check(avcodec_parameters_to_context(m_vdec, vst->codecpar), "copy decoder parameters");
    m_vdec->pkt_timebase = vst->time_base;
    m_vdec->framerate = av_guess_frame_rate(m_videoFmt, vst, nullptr);
    m_vdec->thread_count = 0;
    int err = avcodec_open2(m_vdec, decoder, nullptr);
    if (err < 0)
        throw ConversionError(ConversionError::Kind::SourceOpenFailed,
                              "cannot open video decoder: " + ff_err_string(err));

    m_info.naturalWidth = fd.width;
    m_info.naturalHeight = fd.height;
    m_info.frameRate = nominal_frame_rate(m_videoFmt, vst);
    m_info.estimatedBitRate = estimated_bit_rate(m_videoFmt, vst);
    m_info.durationSeconds = stream_duration_seconds(m_videoFmt, vst);

    int astream = av_find_best_stream(m_videoFmt, AVMEDIA_TYPE_AUDIO, -1, vstream, nullptr, 0);
    discard_all_but(m_videoFmt, vstream);
    m_video = std::make_unique<FfmpegVideoTrack>(m_videoFmt, vst, m_vdec);

    if (astream >= 0)
    {
        m_audioFmt = open_container(path);
        if (astream >= static_cast<int>(m_audioFmt->nb_streams))
            throw ConversionError(ConversionError::Kind::SourceOpenFailed, "audio track vanished on reopen");
        discard_all_but(m_audioFmt, astream);
        AVStream *ast = m_audioFmt->streams[astream];
        m_audio = std::make_unique<FfmpegAudioTrack>(m_audioFmt, ast);
        m_info.hasAudio = true;
        LOG_VERBOSE("Source audio stream: %d (%s, %d Hz, %d channels)",
                    astream, avcodec_get_name(ast->codecpar->codec_id),
                    ast->codecpar->sample_rate, ast->codecpar->ch_layout.nb_channels);
    }

    LOG_VERBOSE("Source video: %dx%d %s, %.3f fps, %lld bps, %s, %s",
                fd.width, fd.height, av_get_pix_fmt_name(fd.pixelFormat), av_q2d(m_info.frameRate),
                static_cast<long long>(m_info.estimatedBitRate), ff_ts(m_info.durationSeconds).c_str(),
                m_info.hasAudio ? "with audio" : "no audio");
}

void FfmpegSource::startReading()
{
    if (m_started)
        return;
    m_started = true;
    m_video->start();
    if (m_audio)
        m_audio->start();
}

void FfmpegSource::cancelReading()
{
    if (m_video)
        m_video->cancel();
    if (m_audio)
        m_audio->cancel();
}

void FfmpegSource::close()
{
    // Tracks own reader threads on the contexts; stop them first
    m_audio.reset();
    m_video.reset();
    if (m_vdec)
        avcodec_free_context(&m_vdec);
    if (m_audioFmt)
        avformat_close_input(&m_audioFmt);
    if (m_videoFmt)
        avformat_close_input(&m_videoFmt);
}
