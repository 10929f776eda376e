#include "frame_pool.h"
#include "logger.h"

extern "C"
{
#include <libavutil/imgutils.h>
#include <libavutil/macros.h>
#include <libavutil/pixdesc.h>
}

#include <memory>
#include <vector>

static constexpr int kLineAlign = 32;

namespace
{
struct Lease
{
    std::shared_ptr<void> counters;
    AVBufferRef *pooled = nullptr;
    std::atomic<int> *outstanding = nullptr;
};
}

FrameBufferPool::~FrameBufferPool()
{
    reset();
}

bool FrameBufferPool::initialize(const OutputFormat &format, int capacity)
{
    reset();

    if (format.width <= 0 || format.height <= 0 || format.pixelFormat == AV_PIX_FMT_NONE)
    {
        LOG_ERROR("FrameBufferPool: invalid output geometry %dx%d", format.width, format.height);
        return false;
    }
    if (capacity <= 0)
    {
        LOG_ERROR("FrameBufferPool: capacity must be positive (got %d)", capacity);
        return false;
    }

    int linesize[4] = {0, 0, 0, 0};
    if (av_image_fill_linesizes(linesize, format.pixelFormat, format.width) < 0)
    {
        LOG_ERROR("FrameBufferPool: unsupported pixel format %s", av_get_pix_fmt_name(format.pixelFormat));
        return false;
    }

    ptrdiff_t aligned[4] = {0, 0, 0, 0};
    for (int i = 0; i < 4; ++i)
    {
        m_linesize[i] = FFALIGN(linesize[i], kLineAlign);
        aligned[i] = m_linesize[i];
    }

    size_t planeSizes[4] = {0, 0, 0, 0};
    if (av_image_fill_plane_sizes(planeSizes, format.pixelFormat, format.height, aligned) < 0)
    {
        LOG_ERROR("FrameBufferPool: failed to compute plane sizes");
        return false;
    }

    m_planes = av_pix_fmt_count_planes(format.pixelFormat);
    size_t total = 0;
    for (int i = 0; i < m_planes; ++i)
    {
        m_planeOffset[i] = total;
        total += FFALIGN(planeSizes[i], static_cast<size_t>(kLineAlign));
    }

    m_counters = std::make_shared<Counters>();
    m_counters->threshold = capacity;
    m_counters->bufferSize = total;

    m_pool = av_buffer_pool_init2(total, m_counters.get(), &FrameBufferPool::allocBuffer, nullptr);
    if (!m_pool)
    {
        LOG_ERROR("FrameBufferPool: av_buffer_pool_init2 failed");
        m_counters.reset();
        return false;
    }

    // Preallocate every buffer once so the first frames do not stall on allocation
    std::vector<AVBufferRef *> warm;
    warm.reserve(capacity);
    bool ok = true;
    for (int i = 0; i < capacity; ++i)
    {
        AVBufferRef *ref = av_buffer_pool_get(m_pool);
        if (!ref)
        {
            ok = false;
            break;
        }
        warm.push_back(ref);
    }
    for (AVBufferRef *ref : warm)
        av_buffer_unref(&ref);

    if (!ok)
    {
        LOG_ERROR("FrameBufferPool: preallocation of %d buffers failed", capacity);
        reset();
        return false;
    }

    m_format = format;
    m_capacity = capacity;
    LOG_DEBUG("FrameBufferPool ready: %dx%d %s, %d buffers of %zu bytes",
              format.width, format.height, av_get_pix_fmt_name(format.pixelFormat), capacity, total);
    return true;
}

AVBufferRef *FrameBufferPool::allocBuffer(void *opaque, size_t size)
{
    Counters *counters = static_cast<Counters *>(opaque);
    if (counters->allocated.fetch_add(1) >= counters->threshold)
    {
        counters->allocated.fetch_sub(1);
        return nullptr;
    }
    AVBufferRef *ref = av_buffer_alloc(size);
    if (!ref)
        counters->allocated.fetch_sub(1);
    return ref;
}

void FrameBufferPool::releaseLease(void *opaque, uint8_t *)
{
    Lease *lease = static_cast<Lease *>(opaque);
    lease->outstanding->fetch_sub(1);
    av_buffer_unref(&lease->pooled);
    delete lease;
}

FramePtr FrameBufferPool::acquire()
{
    if (!m_pool)
        return make_frame_ptr();

    AVBufferRef *pooled = av_buffer_pool_get(m_pool);
    if (!pooled)
    {
        LOG_DEBUG("FrameBufferPool: allocation threshold (%d) reached", m_capacity);
        return make_frame_ptr();
    }

    std::unique_ptr<Lease> lease = std::make_unique<Lease>();
    lease->counters = m_counters;
    lease->pooled = pooled;
    lease->outstanding = &m_counters->outstanding;

    AVBufferRef *buf = av_buffer_create(pooled->data, pooled->size, &FrameBufferPool::releaseLease, lease.get(), 0);
    if (!buf)
    {
        av_buffer_unref(&lease->pooled);
        return make_frame_ptr();
    }
    // The buffer's free callback owns the lease from here
    lease.release();
    m_counters->outstanding.fetch_add(1);

    FramePtr frame = make_frame_ptr(av_frame_alloc());
    if (!frame)
    {
        av_buffer_unref(&buf);
        return make_frame_ptr();
    }

    frame->buf[0] = buf;
    frame->format = m_format.pixelFormat;
    frame->width = m_format.width;
    frame->height = m_format.height;
    for (int i = 0; i < m_planes; ++i)
    {
        frame->data[i] = buf->data + m_planeOffset[i];
        frame->linesize[i] = m_linesize[i];
    }
    frame->color_primaries = m_format.colorSpace.primaries;
    frame->color_trc = m_format.colorSpace.transfer;
    frame->colorspace = m_format.colorSpace.matrix;
    frame->color_range = m_format.colorSpace.range;
    return frame;
}

void FrameBufferPool::reset()
{
    if (m_pool)
        av_buffer_pool_uninit(&m_pool);
    m_pool = nullptr;
    m_counters.reset();
    m_format = OutputFormat{};
    m_capacity = 0;
    m_planes = 0;
    for (int i = 0; i < 4; ++i)
    {
        m_linesize[i] = 0;
        m_planeOffset[i] = 0;
    }
}

int FrameBufferPool::outstanding() const
{
    return m_counters ? m_counters->outstanding.load() : 0;
}

int FrameBufferPool::allocated() const
{
    return m_counters ? m_counters->allocated.load() : 0;
}
