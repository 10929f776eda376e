#include <gtest/gtest.h>

#include <vector>

#include "frame_pool.h"

static OutputFormat small_format()
{
    OutputFormat format;
    format.width = 8;
    format.height = 8;
    format.pixelFormat = AV_PIX_FMT_YUV420P;
    return format;
}

TEST(FrameBufferPoolTest, RejectsInvalidConfiguration)
{
    FrameBufferPool pool;
    OutputFormat format = small_format();
    EXPECT_FALSE(pool.initialize(format, 0));

    format.width = 0;
    EXPECT_FALSE(pool.initialize(format, 3));
    EXPECT_FALSE(pool.initialized());
    EXPECT_FALSE(pool.acquire());
}

TEST(FrameBufferPoolTest, NeverGrowsPastCapacity)
{
    FrameBufferPool pool;
    ASSERT_TRUE(pool.initialize(small_format(), 3));
    EXPECT_EQ(pool.allocated(), 3);

    std::vector<FramePtr> held;
    for (int i = 0; i < 3; ++i)
    {
        FramePtr frame = pool.acquire();
        ASSERT_TRUE(frame);
        held.push_back(std::move(frame));
    }
    EXPECT_EQ(pool.outstanding(), 3);

    EXPECT_FALSE(pool.acquire());
    EXPECT_EQ(pool.allocated(), 3);
}

TEST(FrameBufferPoolTest, ReleasedBuffersAreRecycled)
{
    FrameBufferPool pool;
    ASSERT_TRUE(pool.initialize(small_format(), 3));

    std::vector<FramePtr> held;
    for (int i = 0; i < 3; ++i)
        held.push_back(pool.acquire());
    ASSERT_FALSE(pool.acquire());

    held.pop_back();
    EXPECT_EQ(pool.outstanding(), 2);

    FramePtr again = pool.acquire();
    ASSERT_TRUE(again);
    EXPECT_EQ(pool.allocated(), 3);
    held.push_back(std::move(again));

    held.clear();
    EXPECT_EQ(pool.outstanding(), 0);
}

TEST(FrameBufferPoolTest, FramesCarryGeometryAndColorTags)
{
    FrameBufferPool pool;
    OutputFormat format = small_format();
    format.colorSpace.primaries = AVCOL_PRI_BT2020;
    format.colorSpace.transfer = AVCOL_TRC_SMPTE2084;
    format.colorSpace.matrix = AVCOL_SPC_BT2020_NCL;
    ASSERT_TRUE(pool.initialize(format, 2));

    FramePtr frame = pool.acquire();
    ASSERT_TRUE(frame);
    EXPECT_EQ(frame->width, 8);
    EXPECT_EQ(frame->height, 8);
    EXPECT_EQ(frame->format, AV_PIX_FMT_YUV420P);
    EXPECT_EQ(frame->color_primaries, AVCOL_PRI_BT2020);
    EXPECT_EQ(frame->color_trc, AVCOL_TRC_SMPTE2084);
    EXPECT_EQ(frame->colorspace, AVCOL_SPC_BT2020_NCL);
    EXPECT_EQ(frame->color_range, AVCOL_RANGE_MPEG);
    for (int p = 0; p < 3; ++p)
    {
        EXPECT_NE(frame->data[p], nullptr);
        EXPECT_EQ(frame->linesize[p] % 32, 0);
    }
}

TEST(FrameBufferPoolTest, ResetWithOutstandingFramesIsSafe)
{
    FrameBufferPool pool;
    ASSERT_TRUE(pool.initialize(small_format(), 2));
    FramePtr frame = pool.acquire();
    ASSERT_TRUE(frame);

    pool.reset();
    EXPECT_FALSE(pool.initialized());
    EXPECT_EQ(pool.outstanding(), 0);
    frame->data[0][0] = 1;
    frame.reset();
}
