/**
 * @file test_chunk_sizer.cpp
 * @brief Throughput tiers of the adaptive chunk size
 */

#include <gtest/gtest.h>

#include "ChunkSizer.h"

using namespace CipherLink;

class ChunkSizerTest : public ::testing::Test {};

TEST_F(ChunkSizerTest, TierThresholds) {
    // bytes per millisecond for 2 MiB/s, 512 KiB/s and 128 KiB/s
    const double twoMiB = 2.0 * 1024 * 1024 / 1000.0;
    const double halfMiB = 512.0 * 1024 / 1000.0;
    const double quarterOfHalf = 128.0 * 1024 / 1000.0;

    EXPECT_EQ(ChunkSizer::tierFor(twoMiB), 1024u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(twoMiB * 10), 1024u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(twoMiB * 0.99), 512u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(halfMiB), 512u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(halfMiB * 0.99), 128u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(quarterOfHalf), 128u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(quarterOfHalf * 0.99), 32u * 1024u);
    EXPECT_EQ(ChunkSizer::tierFor(0.0), 32u * 1024u);
}

TEST_F(ChunkSizerTest, RecordChunkUpdatesNextSize) {
    ChunkSizer sizer;
    EXPECT_EQ(sizer.nextChunkSize(), 128u * 1024u);

    // 1 MiB in 100ms is about 10 MiB/s
    sizer.recordChunk(1024 * 1024, std::chrono::milliseconds(100));
    EXPECT_EQ(sizer.nextChunkSize(), 1024u * 1024u);

    // 32 KiB in one second
    sizer.recordChunk(32 * 1024, std::chrono::milliseconds(1000));
    EXPECT_EQ(sizer.nextChunkSize(), 32u * 1024u);
}

TEST_F(ChunkSizerTest, ZeroElapsedCountsAsOneMillisecond) {
    ChunkSizer sizer(32 * 1024);
    sizer.recordChunk(1024, std::chrono::milliseconds(0));
    // 1024 bytes/ms is about 1 MiB/s
    EXPECT_EQ(sizer.nextChunkSize(), 512u * 1024u);
}
