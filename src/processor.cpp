#include "processor.h"
#include "logger.h"

extern "C"
{
#include <libavutil/imgutils.h>
#include <libavutil/pixdesc.h>
}

#include <algorithm>
#include <cmath>

EyeRegions make_eye_regions(int width, int height)
{
    const double half = width / 2.0;
    EyeRegions regions;
    regions.left = CropRegion{0.0, 0.0, half, static_cast<double>(height)};
    regions.right = CropRegion{half, 0.0, half, static_cast<double>(height)};
    return regions;
}

static bool is_specified(AVColorPrimaries p)
{
    return p != AVCOL_PRI_UNSPECIFIED && p != AVCOL_PRI_RESERVED && p != AVCOL_PRI_RESERVED0;
}

static bool is_specified(AVColorTransferCharacteristic t)
{
    return t != AVCOL_TRC_UNSPECIFIED && t != AVCOL_TRC_RESERVED && t != AVCOL_TRC_RESERVED0;
}

static bool is_specified(AVColorSpace m)
{
    return m != AVCOL_SPC_UNSPECIFIED && m != AVCOL_SPC_RESERVED;
}

OutputColorSpace derive_output_color_space(const FormatDescriptor &format)
{
    OutputColorSpace cs;
    if (!is_specified(format.primaries))
        return cs;

    cs.propagated = true;
    cs.primaries = format.primaries;
    if (is_specified(format.transfer))
        cs.transfer = format.transfer;
    if (is_specified(format.matrix))
        cs.matrix = format.matrix;

    if (format.primaries == AVCOL_PRI_SMPTE432)
    {
        // P3-D65 becomes display-referred Display P3
        cs.name = "Display P3";
    }
    else
    {
        const char *name = av_color_primaries_name(format.primaries);
        cs.name = name ? name : "unknown";
    }
    return cs;
}

AVPixelFormat output_pixel_format_for(AVPixelFormat source)
{
    const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(source);
    if (desc && desc->comp[0].depth > 8)
        return AV_PIX_FMT_YUV420P10LE;
    return AV_PIX_FMT_YUV420P;
}

static int sws_colorspace_for(AVColorSpace matrix)
{
    switch (matrix)
    {
    case AVCOL_SPC_BT2020_NCL:
    case AVCOL_SPC_BT2020_CL:
        return SWS_CS_BT2020;
    case AVCOL_SPC_BT709:
        return SWS_CS_ITU709;
    case AVCOL_SPC_BT470BG:
    case AVCOL_SPC_SMPTE170M:
        return SWS_CS_ITU601;
    default:
        return SWS_CS_DEFAULT;
    }
}

FrameProcessor::~FrameProcessor()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    resetLocked();
}

bool FrameProcessor::prepare(const FormatDescriptor &format, int retainedBufferCountHint)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    resetLocked();

    if (format.width <= 0 || format.height <= 0 || format.pixelFormat == AV_PIX_FMT_NONE)
    {
        LOG_ERROR("FrameProcessor: unusable source format %dx%d", format.width, format.height);
        return false;
    }

    OutputFormat out;
    out.width = format.width / 2;
    out.height = format.height;
    out.pixelFormat = output_pixel_format_for(format.pixelFormat);
    out.colorSpace = derive_output_color_space(format);

    if (!m_pool.initialize(out, retainedBufferCountHint))
    {
        LOG_ERROR("FrameProcessor: could not build a pool of %d buffers", retainedBufferCountHint);
        return false;
    }

    m_input = format;
    m_output = out;
    m_prepared = true;
    LOG_VERBOSE("FrameProcessor prepared: %dx%d %s -> %dx%d %s (%s%s)",
                format.width, format.height, av_get_pix_fmt_name(format.pixelFormat),
                out.width, out.height, av_get_pix_fmt_name(out.pixelFormat),
                out.colorSpace.name.c_str(), out.colorSpace.propagated ? "" : ", default");
    return true;
}

bool FrameProcessor::isPrepared() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_prepared;
}

FormatDescriptor FrameProcessor::inputFormat() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_input;
}

OutputFormat FrameProcessor::outputFormat() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_output;
}

int FrameProcessor::outstandingBuffers() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pool.outstanding();
}

void FrameProcessor::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    resetLocked();
}

void FrameProcessor::resetLocked()
{
    if (m_sws)
    {
        sws_freeContext(m_sws);
        m_sws = nullptr;
    }
    m_last_src_format = AV_PIX_FMT_NONE;
    m_last_src_w = m_last_src_h = 0;
    m_last_src_matrix = AVCOL_SPC_UNSPECIFIED;
    m_last_src_range = AVCOL_RANGE_UNSPECIFIED;
    m_pool.reset();
    m_input = FormatDescriptor{};
    m_output = OutputFormat{};
    m_prepared = false;
}

FramePtr FrameProcessor::cropFrame(const AVFrame &image, const CropRegion &region)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_prepared)
        return make_frame_ptr();

    const AVPixelFormat srcFmt = static_cast<AVPixelFormat>(image.format);
    const AVPixFmtDescriptor *desc = av_pix_fmt_desc_get(srcFmt);
    if (!desc || (desc->flags & AV_PIX_FMT_FLAG_HWACCEL))
    {
        LOG_WARN("FrameProcessor: cannot crop frames of format %s", av_get_pix_fmt_name(srcFmt));
        return make_frame_ptr();
    }

    // Snap the fractional region outward to whole pixels inside the image.
    // The origin also moves down onto the chroma grid so every plane starts
    // at the same picture position.
    int x0 = std::max(0, static_cast<int>(std::floor(region.x)));
    int y0 = std::max(0, static_cast<int>(std::floor(region.y)));
    x0 = (x0 >> desc->log2_chroma_w) << desc->log2_chroma_w;
    y0 = (y0 >> desc->log2_chroma_h) << desc->log2_chroma_h;
    const int x1 = std::min(image.width, static_cast<int>(std::ceil(region.x + region.width)));
    const int y1 = std::min(image.height, static_cast<int>(std::ceil(region.y + region.height)));
    const int cropW = x1 - x0;
    const int cropH = y1 - y0;
    if (cropW <= 0 || cropH <= 0)
        return make_frame_ptr();

    // Re-zero the origin by offsetting every plane pointer
    const uint8_t *srcData[4] = {nullptr, nullptr, nullptr, nullptr};
    int srcLines[4] = {0, 0, 0, 0};
    const int planes = av_pix_fmt_count_planes(srcFmt);
    for (int p = 0; p < planes && p < 4; ++p)
    {
        const bool chroma = (p == 1 || p == 2) && !(desc->flags & AV_PIX_FMT_FLAG_RGB);
        const int xBytes = x0 > 0 ? av_image_get_linesize(srcFmt, x0, p) : 0;
        if (xBytes < 0)
            return make_frame_ptr();
        const int yRows = chroma ? (y0 >> desc->log2_chroma_h) : y0;
        srcData[p] = image.data[p] + static_cast<ptrdiff_t>(yRows) * image.linesize[p] + xBytes;
        srcLines[p] = image.linesize[p];
    }

    if (!m_sws || m_last_src_format != image.format || m_last_src_w != cropW || m_last_src_h != cropH ||
        m_last_src_matrix != image.colorspace || m_last_src_range != image.color_range)
    {
        m_sws = sws_getCachedContext(m_sws,
                                     cropW, cropH, srcFmt,
                                     m_output.width, m_output.height, m_output.pixelFormat,
                                     SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!m_sws)
        {
            LOG_WARN("FrameProcessor: scaler setup failed for %dx%d %s", cropW, cropH, av_get_pix_fmt_name(srcFmt));
            m_last_src_format = AV_PIX_FMT_NONE;
            return make_frame_ptr();
        }
        const AVColorSpace srcMatrix = image.colorspace != AVCOL_SPC_UNSPECIFIED ? image.colorspace : m_input.matrix;
        const int *srcCoeffs = sws_getCoefficients(sws_colorspace_for(srcMatrix));
        const int *dstCoeffs = sws_getCoefficients(sws_colorspace_for(m_output.colorSpace.matrix));
        const int srcFull = image.color_range == AVCOL_RANGE_JPEG ? 1 : 0;
        const int dstFull = m_output.colorSpace.range == AVCOL_RANGE_JPEG ? 1 : 0;
        sws_setColorspaceDetails(m_sws, srcCoeffs, srcFull, dstCoeffs, dstFull, 0, 1 << 16, 1 << 16);

        m_last_src_format = image.format;
        m_last_src_w = cropW;
        m_last_src_h = cropH;
        m_last_src_matrix = image.colorspace;
        m_last_src_range = image.color_range;
    }

    FramePtr out = m_pool.acquire();
    if (!out)
        return out;

    const int rows = sws_scale(m_sws, srcData, srcLines, 0, cropH, out->data, out->linesize);
    if (rows <= 0)
    {
        LOG_WARN("FrameProcessor: sws_scale produced no output");
        return make_frame_ptr();
    }
    out->pts = image.pts;
    return out;
}
