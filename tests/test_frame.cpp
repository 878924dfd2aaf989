#include "frame.hpp"

#include <cstring>
#include <string>
#include <gtest/gtest.h>

namespace {

// Reads an encoded frame back the way a connection does: header, then body.
bool decodeInto(const std::string& wire, Frame& frame) {
    std::memcpy(frame.headerData, wire.data(), Frame::header);
    if (!frame.decodeHeader()) {
        return false;
    }
    std::memcpy(frame.body.data(), wire.data() + Frame::header, frame.getBodyLength());
    return true;
}

void setHeader(Frame& frame, unsigned char b0, unsigned char b1, unsigned char b2, unsigned char b3) {
    frame.headerData[0] = static_cast<char>(b0);
    frame.headerData[1] = static_cast<char>(b1);
    frame.headerData[2] = static_cast<char>(b2);
    frame.headerData[3] = static_cast<char>(b3);
}

} // namespace

TEST(FrameTest, HeaderIsBigEndianLength) {
    std::string wire = encodeFrame(std::string(0x0102, 'x'));

    ASSERT_EQ(wire.size(), Frame::header + 0x0102);
    EXPECT_EQ(static_cast<unsigned char>(wire[0]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(wire[1]), 0x00);
    EXPECT_EQ(static_cast<unsigned char>(wire[2]), 0x01);
    EXPECT_EQ(static_cast<unsigned char>(wire[3]), 0x02);
}

TEST(FrameTest, DecodesWhatWasEncoded) {
    const std::string payload = "{\"hello\":\"world\"}";
    Frame frame;

    ASSERT_TRUE(decodeInto(encodeFrame(payload), frame));
    EXPECT_EQ(frame.getBodyLength(), payload.size());
    EXPECT_EQ(frame.getBody(), payload);
}

TEST(FrameTest, BinaryPayloadSurvives) {
    std::string payload("\0\x01\xff\x7f", 4);
    Frame frame;

    ASSERT_TRUE(decodeInto(encodeFrame(payload), frame));
    EXPECT_EQ(frame.getBody(), payload);
}

TEST(FrameTest, PayloadAtCeilingIsAccepted) {
    std::string payload(Frame::maxBytes, 'a');
    Frame frame;

    ASSERT_TRUE(decodeInto(encodeFrame(payload), frame));
    EXPECT_EQ(frame.getBodyLength(), Frame::maxBytes);
}

TEST(FrameTest, HighHeaderBytesReadAsUnsigned) {
    Frame frame;
    // 0x005fffff, one byte under the ceiling
    setHeader(frame, 0x00, 0x5f, 0xff, 0xff);

    ASSERT_TRUE(frame.decodeHeader());
    EXPECT_EQ(frame.getBodyLength(), 0x5fffffu);

    setHeader(frame, 0x00, 0x00, 0x80, 0x81);
    ASSERT_TRUE(frame.decodeHeader());
    EXPECT_EQ(frame.getBodyLength(), 0x8081u);
}

TEST(FrameTest, ZeroLengthHeaderIsRejected) {
    Frame frame;
    setHeader(frame, 0, 0, 0, 0);

    EXPECT_FALSE(frame.decodeHeader());
    EXPECT_EQ(frame.getBodyLength(), 0u);
}

TEST(FrameTest, OversizedHeaderIsRejectedWithoutAllocating) {
    Frame frame;
    // 6 MiB + 1
    setHeader(frame, 0x00, 0x60, 0x00, 0x01);

    EXPECT_FALSE(frame.decodeHeader());
    EXPECT_EQ(frame.getBodyLength(), 0u);
    EXPECT_TRUE(frame.body.empty());

    setHeader(frame, 0xff, 0xff, 0xff, 0xff);
    EXPECT_FALSE(frame.decodeHeader());
}

TEST(FrameTest, EncodingRefusesEmptyAndOversizedPayloads) {
    EXPECT_THROW(encodeFrame(std::string()), FrameError);
    EXPECT_THROW(encodeFrame(std::string(Frame::maxBytes + 1, 'a')), FrameError);
}

TEST(FrameTest, SharedFrameHoldsWholeWireImage) {
    FramePtr frame = makeFrame("abc");

    ASSERT_TRUE(frame);
    EXPECT_EQ(*frame, std::string("\0\0\0\x03" "abc", 7));
}
