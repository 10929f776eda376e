#pragma once

extern "C"
{
#include <libavutil/buffer.h>
#include <libavutil/frame.h>
}

#include <atomic>
#include <memory>

#include "pipeline_types.h"

// Bounded pool of output frames backed by an AVBufferPool.
// The pool never allocates more than `capacity` buffers; once all of them
// are in use acquire() fails instead of growing.
class FrameBufferPool
{
public:
    FrameBufferPool() = default;
    ~FrameBufferPool();

    FrameBufferPool(const FrameBufferPool &) = delete;
    FrameBufferPool &operator=(const FrameBufferPool &) = delete;

    // Builds the pool and preallocates `capacity` buffers.
    // Returns false (and leaves the pool empty) on any allocation failure.
    bool initialize(const OutputFormat &format, int capacity);

    // Returns a frame whose data lives in a pooled buffer, or nullptr when
    // the allocation threshold is reached or the pool is not initialized.
    FramePtr acquire();

    void reset();

    bool initialized() const { return m_pool != nullptr; }
    int capacity() const { return m_capacity; }
    const OutputFormat &format() const { return m_format; }

    // Buffers currently handed out and not yet released
    int outstanding() const;
    // Buffers ever allocated by the underlying pool (never above capacity)
    int allocated() const;

private:
    struct Counters
    {
        std::atomic<int> allocated{0};
        std::atomic<int> outstanding{0};
        int threshold = 0;
        size_t bufferSize = 0;
    };

    static AVBufferRef *allocBuffer(void *opaque, size_t size);
    static void releaseLease(void *opaque, uint8_t *data);

    AVBufferPool *m_pool = nullptr;
    std::shared_ptr<Counters> m_counters;
    OutputFormat m_format;
    int m_capacity = 0;
    int m_linesize[4] = {0, 0, 0, 0};
    size_t m_planeOffset[4] = {0, 0, 0, 0};
    int m_planes = 0;
};
