#include "ffmpeg_sink.h"
#include "ffmpeg_utils.h"
#include "logger.h"

extern "C"
{
#include <libavutil/opt.h>
#include <libavutil/pixdesc.h>
#include <libavutil/stereo3d.h>
}

#include <cstring>
#include <optional>

bool FfmpegVideoInput::waitForDemand()
{
    if (m_finished || !m_sink.m_muxer)
        return false;
    return m_sink.m_muxer->waitForRoom(m_finished);
}

bool FfmpegVideoInput::isReadyForMoreData() const
{
    return !m_finished && m_sink.m_muxer && m_sink.m_muxer->hasRoom();
}

void FfmpegVideoInput::markAsFinished()
{
    m_finished = true;
    if (m_sink.m_muxer)
        m_sink.m_muxer->wakeAll();
}

bool FfmpegVideoInput::appendPair(const StereoFramePair &pair)
{
    if (m_finished)
        return false;
    return m_sink.encodePair(pair);
}

bool FfmpegAudioInput::waitForDemand()
{
    if (m_finished || !m_sink.m_muxer)
        return false;
    return m_sink.m_muxer->waitForRoom(m_finished);
}

bool FfmpegAudioInput::isReadyForMoreData() const
{
    return !m_finished && m_sink.m_muxer && m_sink.m_muxer->hasRoom();
}

void FfmpegAudioInput::markAsFinished()
{
    m_finished = true;
    if (m_sink.m_muxer)
        m_sink.m_muxer->wakeAll();
}

bool FfmpegAudioInput::appendSample(const AudioSample &sample)
{
    if (m_finished)
        return false;
    return m_sink.writeAudio(sample);
}

FfmpegSink::FfmpegSink(const std::string &path, const std::string &encoderName)
    : m_path(path), m_encoderName(encoderName), m_videoInput(*this), m_audioInput(*this)
{
    int err = avformat_alloc_output_context2(&m_fmt, nullptr, nullptr, path.c_str());
    if (err < 0 || !m_fmt)
    {
        LOG_DEBUG("No muxer matches %s, falling back to mov", path.c_str());
        err = avformat_alloc_output_context2(&m_fmt, nullptr, "mov", path.c_str());
    }
    if (err < 0 || !m_fmt)
        throw ConversionError(ConversionError::Kind::DestinationOpenFailed,
                              "cannot create output container for " + path + ": " + ff_err_string(err));

    if (!(m_fmt->oformat->flags & AVFMT_NOFILE))
    {
        err = avio_open(&m_fmt->pb, path.c_str(), AVIO_FLAG_WRITE);
        if (err < 0)
        {
            avformat_free_context(m_fmt);
            m_fmt = nullptr;
            throw ConversionError(ConversionError::Kind::DestinationOpenFailed,
                                  "cannot open " + path + " for writing: " + ff_err_string(err));
        }
    }

    m_encPkt = make_packet_ptr(av_packet_alloc());
    if (!m_encPkt)
    {
        closeOutput();
        throw std::runtime_error("alloc encoder packet failed");
    }
}

FfmpegSink::~FfmpegSink()
{
    if (m_muxer)
        m_muxer->abort();
    m_muxer.reset();
    if (m_venc)
        avcodec_free_context(&m_venc);
    closeOutput();
}

void FfmpegSink::closeOutput()
{
    if (!m_fmt)
        return;
    if (!(m_fmt->oformat->flags & AVFMT_NOFILE) && m_fmt->pb)
        avio_closep(&m_fmt->pb);
    avformat_free_context(m_fmt);
    m_fmt = nullptr;
}

// An empty name picks FFmpeg's default HEVC encoder
static const AVCodec *find_hevc_encoder(const std::string &name)
{
    if (name.empty())
        return avcodec_find_encoder(AV_CODEC_ID_HEVC);
    const AVCodec *codec = avcodec_find_encoder_by_name(name.c_str());
    if (!codec || codec->id != AV_CODEC_ID_HEVC)
        throw ConversionError(ConversionError::Kind::DestinationOpenFailed,
                              "encoder '" + name + "' is not an available HEVC encoder");
    return codec;
}

bool enable_two_view_encoding(AVCodecContext *enc)
{
    if (!enc || !enc->codec || !enc->priv_data)
        return false;

    // libx265 codes the second view as an enhancement layer of the same access unit
    if (std::string(enc->codec->name) == "libx265")
        return av_opt_set(enc->priv_data, "x265-params", "num-views=2", 0) >= 0;
    return false;
}

static void add_stream_stereo_metadata(AVStream *st, const VideoOutputSettings &settings)
{
    size_t size = 0;
    AVStereo3D *s3d = av_stereo3d_alloc_size(&size);
    if (!s3d)
        throw std::runtime_error("alloc stereo3d side data failed");

    s3d->type = AV_STEREO3D_UNSPEC;
    s3d->view = AV_STEREO3D_VIEW_PACKED;
    s3d->primary_eye = AV_PRIMARY_EYE_LEFT;
    s3d->horizontal_field_of_view = av_make_q(static_cast<int>(settings.horizontalFieldOfViewDegrees * 1000.0), 1000);
    s3d->horizontal_disparity_adjustment = av_make_q(static_cast<int>(settings.horizontalDisparityAdjustment * 10000.0), 10000);

    if (!av_packet_side_data_add(&st->codecpar->coded_side_data, &st->codecpar->nb_coded_side_data,
                                 AV_PKT_DATA_STEREO3D, s3d, size, 0))
    {
        av_free(s3d);
        throw std::runtime_error("attach stereo3d side data failed");
    }
}

void FfmpegSink::configureVideo(const VideoOutputSettings &settings)
{
    const AVCodec *codec = find_hevc_encoder(m_encoderName);
    if (!codec)
        throw ConversionError(ConversionError::Kind::DestinationOpenFailed, "no HEVC encoder available");

    m_venc = avcodec_alloc_context3(codec);
    if (!m_venc)
        throw std::runtime_error("alloc encoder context failed");

    AVRational fr = settings.frameRate;
    if (fr.num <= 0 || fr.den <= 0)
        fr = AVRational{60, 1};

    m_venc->width = settings.width;
    m_venc->height = settings.height;
    m_venc->pix_fmt = settings.pixelFormat;
    m_venc->time_base = av_inv_q(fr);
    m_venc->framerate = fr;
    m_venc->sample_aspect_ratio = AVRational{1, 1};
    m_venc->thread_count = 0;
    if (settings.bitRate > 0)
        m_venc->bit_rate = settings.bitRate;
    m_venc->color_primaries = settings.colorSpace.primaries;
    m_venc->color_trc = settings.colorSpace.transfer;
    m_venc->colorspace = settings.colorSpace.matrix;
    m_venc->color_range = settings.colorSpace.range;

    if (m_fmt->oformat->flags & AVFMT_GLOBALHEADER)
        m_venc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

    if (!enable_two_view_encoding(m_venc))
        throw ConversionError(ConversionError::Kind::DestinationOpenFailed,
                              std::string("encoder ") + codec->name + " cannot write two views per frame");

    int err = avcodec_open2(m_venc, codec, nullptr);
    if (err < 0)
        throw ConversionError(ConversionError::Kind::DestinationOpenFailed,
                              std::string("cannot open encoder ") + codec->name + ": " + ff_err_string(err));

    m_videoStream = avformat_new_stream(m_fmt, nullptr);
    if (!m_videoStream)
        throw std::runtime_error("alloc output video stream failed");
    ff_check(avcodec_parameters_from_context(m_videoStream->codecpar, m_venc), "enc params to stream");
    m_videoStream->time_base = m_venc->time_base;
    m_videoStream->avg_frame_rate = fr;
    m_videoStream->codecpar->codec_tag = muxer_is_isobmff(m_fmt->oformat) ? MKTAG('h', 'v', 'c', '1') : 0;

    add_stream_stereo_metadata(m_videoStream, settings);

    LOG_VERBOSE("Output video: %s %dx%d %s, %.3f fps, %.2f Mbps, %s, hfov=%.1f deg",
                codec->name, settings.width, settings.height, av_get_pix_fmt_name(settings.pixelFormat),
                av_q2d(fr), settings.bitRate / 1000000.0, settings.colorSpace.name.c_str(),
                settings.horizontalFieldOfViewDegrees);
}

void FfmpegSink::configureAudio(const AudioTrackInfo &track)
{
    if (!track.params)
        return;
    m_audioStream = avformat_new_stream(m_fmt, nullptr);
    if (!m_audioStream)
        throw std::runtime_error("alloc output audio stream failed");
    ff_check(avcodec_parameters_copy(m_audioStream->codecpar, track.params.get()), "copy audio parameters");
    m_audioStream->codecpar->codec_tag = 0;
    if (track.params->sample_rate > 0)
        m_audioStream->time_base = AVRational{1, track.params->sample_rate};
    else
        m_audioStream->time_base = track.timeBase;
    m_audioSourceTimeBase = track.timeBase;
    LOG_VERBOSE("Output audio: %s passthrough", avcodec_get_name(track.params->codec_id));
}

void FfmpegSink::startWriting()
{
    if (!m_videoStream)
        throw std::runtime_error("startWriting before configureVideo");

    AVDictionary *muxopts = nullptr;
    if (muxer_is_isobmff(m_fmt->oformat))
    {
        av_dict_set(&muxopts, "movflags", "+faststart+write_colr", 0);
        // movenc only writes the vexu/hfov stereo boxes at unofficial strictness
        m_fmt->strict_std_compliance = FF_COMPLIANCE_UNOFFICIAL;
    }
    int err = avformat_write_header(m_fmt, &muxopts);
    if (muxopts)
        av_dict_free(&muxopts);
    ff_check(err, "write header");

    m_muxer = std::make_unique<AsyncMuxer>(m_fmt);
    m_muxer->start();
}

bool FfmpegSink::encodePair(const StereoFramePair &pair)
{
    std::lock_guard<std::mutex> lock(m_encMutex);
    if (m_cancelled || !m_venc || !m_muxer)
        return false;

    int64_t pts = pair.pts;
    if (pts != AV_NOPTS_VALUE && pair.timeBase.num > 0)
        pts = av_rescale_q(pts, pair.timeBase, m_venc->time_base);
    else
        pts = (m_lastPts == AV_NOPTS_VALUE) ? 0 : m_lastPts + 1;
    if (m_lastPts != AV_NOPTS_VALUE && pts <= m_lastPts)
        pts = m_lastPts + 1;
    m_lastPts = pts;
    ++m_pairsSent;

    try
    {
        for (const TaggedBuffer &view : pair.views)
        {
            if (!view.buffer)
                return false;
            FramePtr frame = make_frame_ptr(av_frame_clone(view.buffer.get()));
            if (!frame)
                return false;
            frame->pts = pts;
            frame->pict_type = AV_PICTURE_TYPE_NONE;

            AVFrameSideData *sd = av_frame_new_side_data(frame.get(), AV_FRAME_DATA_VIEW_ID, sizeof(int));
            if (!sd)
                return false;
            const int viewId = view.layerId;
            std::memcpy(sd->data, &viewId, sizeof(viewId));

            AVStereo3D *s3d = av_stereo3d_create_side_data(frame.get());
            if (!s3d)
                return false;
            s3d->type = AV_STEREO3D_UNSPEC;
            s3d->view = view.eye == StereoEye::Left ? AV_STEREO3D_VIEW_LEFT : AV_STEREO3D_VIEW_RIGHT;
            s3d->primary_eye = AV_PRIMARY_EYE_LEFT;

            sendFrame(frame.get());
        }
    }
    catch (const ConversionError &)
    {
        throw;
    }
    catch (const std::runtime_error &e)
    {
        LOG_WARN("Encoding frame pair failed: %s", e.what());
        return false;
    }
    return true;
}

void FfmpegSink::sendFrame(AVFrame *frame)
{
    ff_check(avcodec_send_frame(m_venc, frame), frame ? "send frame to encoder" : "flush encoder");
    drainEncoder();
}

void FfmpegSink::drainEncoder()
{
    while (true)
    {
        int ret = avcodec_receive_packet(m_venc, m_encPkt.get());
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
            break;
        ff_check(ret, "receive encoded packet");

        // A two-view encoder emits one access unit per pair. More packets than
        // pairs means the views were coded as consecutive flat frames.
        if (++m_videoPackets > m_pairsSent)
        {
            av_packet_unref(m_encPkt.get());
            throw ConversionError(ConversionError::Kind::WriteFailed,
                                  std::string("encoder ") + m_venc->codec->name +
                                      " wrote single-layer packets and cannot carry two views");
        }

        m_encPkt->stream_index = m_videoStream->index;
        av_packet_rescale_ts(m_encPkt.get(), m_venc->time_base, m_videoStream->time_base);

        // Keep DTS strictly increasing, as the mov muxer requires
        if (m_lastVideoDts != AV_NOPTS_VALUE && m_encPkt->dts != AV_NOPTS_VALUE && m_encPkt->dts <= m_lastVideoDts)
        {
            LOG_DEBUG("DTS monotonicity: adjusting packet DTS from %lld to %lld",
                      static_cast<long long>(m_encPkt->dts), static_cast<long long>(m_lastVideoDts + 1));
            m_encPkt->dts = m_lastVideoDts + 1;
            if (m_encPkt->pts != AV_NOPTS_VALUE && m_encPkt->pts < m_encPkt->dts)
                m_encPkt->pts = m_encPkt->dts;
        }
        if (m_encPkt->dts != AV_NOPTS_VALUE)
            m_lastVideoDts = m_encPkt->dts;

        PacketPtr out = make_packet_ptr(av_packet_alloc());
        if (!out)
            throw std::runtime_error("alloc muxer packet failed");
        av_packet_move_ref(out.get(), m_encPkt.get());
        if (!m_muxer->push(std::move(out)))
            throw std::runtime_error("muxer rejected video packet");
    }
}

bool FfmpegSink::writeAudio(const AudioSample &sample)
{
    if (m_cancelled || !m_audioStream || !m_muxer || !sample.packet)
        return false;

    PacketPtr pkt = make_packet_ptr(av_packet_alloc());
    if (!pkt || av_packet_ref(pkt.get(), sample.packet.get()) < 0)
        return false;

    AVRational srcTb = sample.timeBase.num > 0 ? sample.timeBase : m_audioSourceTimeBase;
    av_packet_rescale_ts(pkt.get(), srcTb, m_audioStream->time_base);
    pkt->stream_index = m_audioStream->index;
    pkt->pos = -1;
    return m_muxer->push(std::move(pkt));
}

bool FfmpegSink::finishWriting()
{
    std::lock_guard<std::mutex> lock(m_encMutex);
    if (m_cancelled || m_closed || !m_muxer)
        return false;
    m_closed = true;

    bool ok = true;
    std::optional<ConversionError> rejected;
    try
    {
        sendFrame(nullptr);
    }
    catch (const ConversionError &e)
    {
        LOG_ERROR("Flushing encoder failed: %s", e.what());
        rejected = e;
        ok = false;
    }
    catch (const std::runtime_error &e)
    {
        LOG_ERROR("Flushing encoder failed: %s", e.what());
        ok = false;
    }

    int err = m_muxer->finish();
    if (err < 0)
    {
        LOG_ERROR("Writing %s failed: %s", m_path.c_str(), ff_err_string(err).c_str());
        ok = false;
    }

    if (ok)
    {
        err = av_write_trailer(m_fmt);
        if (err < 0)
        {
            LOG_ERROR("Writing trailer failed: %s", ff_err_string(err).c_str());
            ok = false;
        }
    }

    if (!(m_fmt->oformat->flags & AVFMT_NOFILE) && m_fmt->pb)
    {
        err = avio_closep(&m_fmt->pb);
        if (err < 0)
        {
            LOG_ERROR("Closing %s failed: %s", m_path.c_str(), ff_err_string(err).c_str());
            ok = false;
        }
    }
    if (rejected)
        throw *rejected;
    return ok;
}

void FfmpegSink::cancelWriting()
{
    if (m_cancelled.exchange(true))
        return;
    m_videoInput.markAsFinished();
    m_audioInput.markAsFinished();
    if (m_muxer)
        m_muxer->abort();

    // Wait for an in-flight encode, then drop the file without a trailer
    std::lock_guard<std::mutex> lock(m_encMutex);
    m_closed = true;
    if (m_fmt && !(m_fmt->oformat->flags & AVFMT_NOFILE) && m_fmt->pb)
        avio_closep(&m_fmt->pb);
    LOG_DEBUG("Output %s abandoned", m_path.c_str());
}
