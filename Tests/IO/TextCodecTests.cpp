#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "IO/TextCodec.h"

using namespace Scribe::Core::IO;

namespace {
std::vector<std::byte> bytesOf(const std::string& s) {
    return TextCodec::encodeUtf8(s);
}
const std::string kReplacement = "\xEF\xBF\xBD";
}

TEST(TextCodec, ValidUtf8_PassesThrough) {
    const std::string text = "plain ascii, caf\xC3\xA9, \xE2\x82\xAC, \xF0\x9F\x98\x80";
    EXPECT_EQ(TextCodec::decodeUtf8Lossy(bytesOf(text)), text);
}

TEST(TextCodec, ByteOrderMark_IsDropped) {
    EXPECT_EQ(TextCodec::decodeUtf8Lossy(bytesOf("\xEF\xBB\xBFhi")), "hi");
}

TEST(TextCodec, InvalidBytes_BecomeReplacementCharacter) {
    EXPECT_EQ(TextCodec::decodeUtf8Lossy(bytesOf("a\xFF" "b")), "a" + kReplacement + "b");
    // Lone continuation byte
    EXPECT_EQ(TextCodec::decodeUtf8Lossy(bytesOf("\x80")), kReplacement);
    // Encoded surrogate is not valid UTF-8: each byte is a separate maximal subpart
    EXPECT_EQ(TextCodec::decodeUtf8Lossy(bytesOf("\xED\xA0\x80")), kReplacement + kReplacement + kReplacement);
}

TEST(TextCodec, TruncatedSequence_IsOneReplacement) {
    EXPECT_EQ(TextCodec::decodeUtf8Lossy(bytesOf("x\xE2\x82")), "x" + kReplacement);
}

TEST(TextCodec, Utf16Length_CountsCodeUnits) {
    EXPECT_EQ(TextCodec::utf16Length(""), 0u);
    EXPECT_EQ(TextCodec::utf16Length("abc"), 3u);
    EXPECT_EQ(TextCodec::utf16Length("caf\xC3\xA9"), 4u);
    EXPECT_EQ(TextCodec::utf16Length("\xE2\x82\xAC"), 1u);
    // Astral code point is a surrogate pair
    EXPECT_EQ(TextCodec::utf16Length("\xF0\x9F\x98\x80"), 2u);
}
