#include <gtest/gtest.h>

#include <string>

#include "IO/ChunkedEncoder.h"

using namespace Scribe::Core::IO;

namespace {
std::string asString(const std::vector<std::byte>& bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}
}

TEST(ChunkedEncoder, DefaultThresholdIs32KiB) {
    EXPECT_EQ(kDefaultChunkThreshold, 32768u);
    ChunkedEncoder encoder("\n");
    EXPECT_EQ(encoder.threshold(), 32768u);
}

TEST(ChunkedEncoder, ChunkIsJoinedLinesPlusTrailingBreak) {
    ChunkedEncoder encoder("\r\n");
    EXPECT_FALSE(encoder.append("a"));
    EXPECT_FALSE(encoder.append("b"));
    EXPECT_FALSE(encoder.append("c"));
    EXPECT_EQ(encoder.pendingLineCount(), 3u);
    EXPECT_EQ(asString(encoder.takeChunk()), "a\r\nb\r\nc\r\n");
    EXPECT_FALSE(encoder.hasPendingLines());
    EXPECT_EQ(encoder.pendingLength(), 0u);
}

TEST(ChunkedEncoder, LengthIgnoresLineBreaks) {
    ChunkedEncoder encoder("\r\n", 4);
    EXPECT_FALSE(encoder.append("ab"));
    EXPECT_EQ(encoder.pendingLength(), 2u);
    EXPECT_TRUE(encoder.append("cd"));
    EXPECT_EQ(encoder.pendingLength(), 4u);
}

TEST(ChunkedEncoder, SingleOversizedLine_TriggersFlushAfterAppend) {
    ChunkedEncoder encoder("\n");
    EXPECT_TRUE(encoder.append(std::string(40000, 'q')));
    auto chunk = encoder.takeChunk();
    EXPECT_EQ(chunk.size(), 40001u);
    EXPECT_EQ(encoder.pendingLength(), 0u);
}

TEST(ChunkedEncoder, LengthIsUtf16UnitsNotBytes) {
    // Each euro sign is three bytes but one UTF-16 unit
    ChunkedEncoder encoder("\n", 3);
    EXPECT_FALSE(encoder.append("\xE2\x82\xAC\xE2\x82\xAC"));
    EXPECT_EQ(encoder.pendingLength(), 2u);
    EXPECT_TRUE(encoder.append("\xE2\x82\xAC"));
}

TEST(ChunkedEncoder, EmptyLinesArePendingEvenWithZeroLength) {
    ChunkedEncoder encoder("\n");
    encoder.append("");
    EXPECT_TRUE(encoder.hasPendingLines());
    EXPECT_EQ(encoder.pendingLength(), 0u);
    EXPECT_EQ(asString(encoder.takeChunk()), "\n");
}
