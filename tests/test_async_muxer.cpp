#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>

#include "async_muxer.h"
#include "ffmpeg_utils.h"

// Output context for the "null" muxer with one rawvideo stream and its header written
class NullOutput
{
public:
    NullOutput()
    {
        ff_check(avformat_alloc_output_context2(&m_fmt, nullptr, "null", nullptr), "alloc null muxer");
        AVStream *st = avformat_new_stream(m_fmt, nullptr);
        if (!st)
            throw std::runtime_error("alloc stream failed");
        st->codecpar->codec_type = AVMEDIA_TYPE_VIDEO;
        st->codecpar->codec_id = AV_CODEC_ID_RAWVIDEO;
        st->codecpar->format = AV_PIX_FMT_YUV420P;
        st->codecpar->width = 16;
        st->codecpar->height = 16;
        st->time_base = AVRational{1, 25};
        ff_check(avformat_write_header(m_fmt, nullptr), "write header");
    }

    ~NullOutput() { avformat_free_context(m_fmt); }

    AVFormatContext *get() const { return m_fmt; }

private:
    AVFormatContext *m_fmt = nullptr;
};

static PacketPtr make_test_packet(int64_t ts)
{
    PacketPtr pkt = make_packet_ptr(av_packet_alloc());
    if (!pkt || av_new_packet(pkt.get(), 16) < 0)
        throw std::runtime_error("packet allocation failed");
    pkt->pts = ts;
    pkt->dts = ts;
    pkt->duration = 1;
    pkt->stream_index = 0;
    return pkt;
}

static AsyncMuxer::Config small_queue(size_t size)
{
    AsyncMuxer::Config config;
    config.max_queue_size = size;
    return config;
}

TEST(AsyncMuxerTest, WriterBlocksUntilQueueDrains)
{
    NullOutput out;
    AsyncMuxer muxer(out.get(), small_queue(2));
    ASSERT_TRUE(muxer.push(make_test_packet(0)));
    ASSERT_TRUE(muxer.push(make_test_packet(1)));
    EXPECT_FALSE(muxer.hasRoom());

    std::atomic<bool> finished{false};
    auto waiter = std::async(std::launch::async, [&]
                             { return muxer.waitForRoom(finished); });
    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    ASSERT_TRUE(muxer.start());
    EXPECT_TRUE(waiter.get());

    EXPECT_EQ(muxer.finish(), 0);
    EXPECT_EQ(muxer.getStats().total_writes, 2u);
    EXPECT_EQ(muxer.getStats().max_queue_depth, 2u);
}

TEST(AsyncMuxerTest, FinishedWriterIsReleased)
{
    NullOutput out;
    AsyncMuxer muxer(out.get(), small_queue(1));
    ASSERT_TRUE(muxer.push(make_test_packet(0)));

    std::atomic<bool> finished{false};
    auto waiter = std::async(std::launch::async, [&]
                             { return muxer.waitForRoom(finished); });
    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    finished = true;
    muxer.wakeAll();
    EXPECT_FALSE(waiter.get());
    muxer.abort();
}

TEST(AsyncMuxerTest, AbortReleasesWritersAndRejectsPackets)
{
    NullOutput out;
    AsyncMuxer muxer(out.get(), small_queue(1));
    ASSERT_TRUE(muxer.push(make_test_packet(0)));

    std::atomic<bool> finished{false};
    auto waiter = std::async(std::launch::async, [&]
                             { return muxer.waitForRoom(finished); });
    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);

    muxer.abort();
    EXPECT_FALSE(waiter.get());
    EXPECT_FALSE(muxer.push(make_test_packet(1)));
    EXPECT_FALSE(muxer.hasRoom());
    EXPECT_EQ(muxer.getStats().total_writes, 0u);
}

TEST(AsyncMuxerTest, FinishWritesEverythingQueued)
{
    NullOutput out;
    AsyncMuxer muxer(out.get(), small_queue(4));
    ASSERT_TRUE(muxer.start());
    std::atomic<bool> finished{false};
    for (int64_t ts = 0; ts < 20; ++ts)
    {
        ASSERT_TRUE(muxer.waitForRoom(finished));
        ASSERT_TRUE(muxer.push(make_test_packet(ts)));
    }

    EXPECT_EQ(muxer.finish(), 0);
    EXPECT_EQ(muxer.getStats().total_writes, 20u);
    EXPECT_LE(muxer.getStats().max_queue_depth, 4u);
    EXPECT_FALSE(muxer.push(make_test_packet(20)));
}
