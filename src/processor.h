#pragma once

extern "C"
{
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

#include <mutex>

#include "frame_pool.h"
#include "pipeline_types.h"

class IFrameProcessor
{
public:
    virtual ~IFrameProcessor() = default;

    // Configures output geometry, color space and the buffer pool for a source format.
    // Returns false and stays unprepared when the pool cannot be built.
    virtual bool prepare(const FormatDescriptor &format, int retainedBufferCountHint) = 0;
    virtual bool isPrepared() const = 0;

    // Renders `region` of `image` into a pooled buffer. Returns nullptr when
    // unprepared, when the pool is exhausted or when rendering fails.
    virtual FramePtr cropFrame(const AVFrame &image, const CropRegion &region) = 0;

    virtual FormatDescriptor inputFormat() const = 0;
    virtual OutputFormat outputFormat() const = 0;

    virtual void reset() = 0;
};

// Left and right halves of a side-by-side frame; the two rectangles tile it exactly
EyeRegions make_eye_regions(int width, int height);

OutputColorSpace derive_output_color_space(const FormatDescriptor &format);

// 8-bit sources render to yuv420p, deeper ones to yuv420p10le
AVPixelFormat output_pixel_format_for(AVPixelFormat source);

// Software crop/convert through libswscale into a bounded FrameBufferPool
class FrameProcessor : public IFrameProcessor
{
public:
    FrameProcessor() = default;
    ~FrameProcessor() override;

    FrameProcessor(const FrameProcessor &) = delete;
    FrameProcessor &operator=(const FrameProcessor &) = delete;

    bool prepare(const FormatDescriptor &format, int retainedBufferCountHint) override;
    bool isPrepared() const override;
    FramePtr cropFrame(const AVFrame &image, const CropRegion &region) override;
    FormatDescriptor inputFormat() const override;
    OutputFormat outputFormat() const override;
    void reset() override;

    int outstandingBuffers() const;

private:
    void resetLocked();

    mutable std::mutex m_mutex;
    bool m_prepared = false;
    FormatDescriptor m_input;
    OutputFormat m_output;
    FrameBufferPool m_pool;

    SwsContext *m_sws = nullptr;
    int m_last_src_format = AV_PIX_FMT_NONE;
    int m_last_src_w = 0, m_last_src_h = 0;
    AVColorSpace m_last_src_matrix = AVCOL_SPC_UNSPECIFIED;
    AVColorRange m_last_src_range = AVCOL_RANGE_UNSPECIFIED;
};
