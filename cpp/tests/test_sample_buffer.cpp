// ─────────────────────────────────────────────────────────────────────────────
// test_sample_buffer.cpp  –  Sliding Window Behaviour
// ─────────────────────────────────────────────────────────────────────────────

#include "sample_buffer.h"

#include <gtest/gtest.h>

namespace swing {
namespace {

MotionSample numbered(int i) {
    return make_sample(i * 0.01, static_cast<double>(i), i + 0.5, -i, 0.0);
}

TEST(SampleBuffer, StartsEmpty) {
    SampleBuffer buf(10);
    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.size(), 0u);
    EXPECT_EQ(buf.capacity(), 10u);
    EXPECT_TRUE(buf.last(Channel::ACCELERATION, 5).empty());
    EXPECT_DOUBLE_EQ(buf.newest(Channel::ACCELERATION), 0.0);
}

TEST(SampleBuffer, LastReturnsOldestFirst) {
    SampleBuffer buf(10);
    for (int i = 1; i <= 4; ++i) buf.push(numbered(i));

    auto v = buf.last(Channel::ACCELERATION, 3);
    ASSERT_EQ(v.size(), 3u);
    EXPECT_DOUBLE_EQ(v[0], 2.0);
    EXPECT_DOUBLE_EQ(v[1], 3.0);
    EXPECT_DOUBLE_EQ(v[2], 4.0);
}

TEST(SampleBuffer, LastIsClippedToSize) {
    SampleBuffer buf(10);
    buf.push(numbered(1));
    buf.push(numbered(2));
    EXPECT_EQ(buf.last(Channel::ACCELERATION, 50).size(), 2u);
}

TEST(SampleBuffer, EvictsOldestWhenFull) {
    SampleBuffer buf(5);
    const int pushed = 3 * static_cast<int>(buf.capacity()) + 2;
    for (int i = 1; i <= pushed; ++i) {
        buf.push(numbered(i));
        ASSERT_LE(buf.size(), buf.capacity());
    }

    EXPECT_EQ(buf.size(), buf.capacity());
    auto v = buf.last(Channel::ACCELERATION, 100);
    ASSERT_EQ(v.size(), 5u);
    for (int k = 0; k < 5; ++k) EXPECT_DOUBLE_EQ(v[k], pushed - 4.0 + k);
    EXPECT_DOUBLE_EQ(buf.newest(Channel::ACCELERATION), static_cast<double>(pushed));
}

TEST(SampleBuffer, ChannelsStayAligned) {
    SampleBuffer buf(4);
    for (int i = 1; i <= 6; ++i) buf.push(numbered(i));

    auto ts = buf.last(Channel::TIMESTAMP, 4);
    auto xs = buf.last(Channel::ROTATION_X, 4);
    auto ys = buf.last(Channel::ROTATION_Y, 4);
    auto zs = buf.last(Channel::ROTATION_Z, 4);
    ASSERT_EQ(ts.size(), 4u);
    for (int k = 0; k < 4; ++k) {
        int i = k + 3;
        EXPECT_DOUBLE_EQ(ts[k], i * 0.01);
        EXPECT_DOUBLE_EQ(xs[k], i + 0.5);
        EXPECT_DOUBLE_EQ(ys[k], -i);
        EXPECT_DOUBLE_EQ(zs[k], 0.0);
    }
}

TEST(SampleBuffer, RotationIsMagnitude) {
    SampleBuffer buf(4);
    buf.push(make_sample(0.0, 1.0, 3.0, 4.0, 0.0));
    EXPECT_DOUBLE_EQ(buf.newest(Channel::ROTATION), 5.0);
}

TEST(SampleBuffer, ClearKeepsCapacity) {
    SampleBuffer buf(3);
    for (int i = 1; i <= 5; ++i) buf.push(numbered(i));
    buf.clear();

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(buf.capacity(), 3u);
    EXPECT_TRUE(buf.last(Channel::ROTATION, 3).empty());

    buf.push(numbered(9));
    EXPECT_EQ(buf.size(), 1u);
    EXPECT_DOUBLE_EQ(buf.newest(Channel::ACCELERATION), 9.0);
}

TEST(SampleBuffer, ZeroCapacityHoldsOneSample) {
    SampleBuffer buf(0);
    EXPECT_EQ(buf.capacity(), 1u);
    buf.push(numbered(1));
    buf.push(numbered(2));
    EXPECT_EQ(buf.size(), 1u);
    EXPECT_DOUBLE_EQ(buf.newest(Channel::ACCELERATION), 2.0);
}

}  // namespace
}  // namespace swing
