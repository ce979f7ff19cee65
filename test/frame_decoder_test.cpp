/***********************************************************************
    This file is in the public domain.

    Description:

    Unit tests of the frame decoder.

***********************************************************************/

#include <algorithm>
#include <gtest/gtest.h>
#include <fwcam/fwcam_error.hpp>
#include <fwcam/fwcam_frame.hpp>

using namespace fwcam;

namespace
{
    Raw_frame make_raw(const std::vector<uint8_t> &bytes, const int width, const int height)
    {
        Raw_frame raw;
        raw.bytes = bytes.empty() ? NULL : &bytes[0];
        raw.length = bytes.size();
        raw.width = width;
        raw.height = height;
        return raw;
    }

    std::vector<uint8_t> counting_bytes(const size_t length)
    {
        std::vector<uint8_t> bytes(length);
        for (size_t i = 0; i < length; ++i)
            bytes[i] = static_cast<uint8_t>(i*7 + 1);
        return bytes;
    }

    Fwcam_error decode_error(const Raw_frame &raw)
    {
        try
        {
            decode(raw);
        }
        catch (const failure &f)
        {
            return f.code();
        }
        ADD_FAILURE() << "decode() did not throw";
        return FWCAM_ERROR_GENERIC_BACKEND_ERROR;
    }
}

TEST(FrameDecoder, Mono8IsByteForByteCopy) {
    const std::vector<uint8_t> bytes = counting_bytes(8);
    const Decoded_image image = decode(make_raw(bytes, 4, 2));

    EXPECT_EQ(image.type, FWCAM_DTYPE_UINT8);
    ASSERT_EQ(image.shape().size(), 2u);
    EXPECT_EQ(image.shape()[0], 2u);
    EXPECT_EQ(image.shape()[1], 4u);
    EXPECT_EQ(image.pixels8, bytes);
    EXPECT_TRUE(image.pixels16.empty());
}

TEST(FrameDecoder, Mono16IsBigEndian) {
    std::vector<uint8_t> bytes;
    for (int p = 0; p < 8; ++p)
    {
        bytes.push_back(static_cast<uint8_t>(0x10 + p));   // High byte first.
        bytes.push_back(static_cast<uint8_t>(0xa0 + p));
    }
    const Decoded_image image = decode(make_raw(bytes, 4, 2));

    EXPECT_EQ(image.type, FWCAM_DTYPE_UINT16);
    ASSERT_EQ(image.shape().size(), 2u);
    EXPECT_EQ(image.shape()[0], 2u);
    EXPECT_EQ(image.shape()[1], 4u);
    ASSERT_EQ(image.pixels16.size(), 8u);
    for (int p = 0; p < 8; ++p)
        EXPECT_EQ(image.pixels16[p], ((0x10 + p) << 8) | (0xa0 + p)) << "pixel " << p;
    EXPECT_EQ(image.at(1, 3), 0x17a7);
}

TEST(FrameDecoder, Mono16FromOddAddress) {
    std::vector<uint8_t> storage(17, 0);
    storage[1] = 0x12;
    storage[2] = 0x34;
    Raw_frame raw;
    raw.bytes = &storage[1];
    raw.length = 16;
    raw.width = 4;
    raw.height = 2;
    EXPECT_EQ(decode(raw).at(0, 0), 0x1234);
}

TEST(FrameDecoder, ThreeBytesPerPixelIsInterleavedRgb) {
    const std::vector<uint8_t> bytes = counting_bytes(24);
    const Decoded_image image = decode(make_raw(bytes, 4, 2));

    EXPECT_EQ(image.type, FWCAM_DTYPE_UINT8);
    ASSERT_EQ(image.shape().size(), 3u);
    EXPECT_EQ(image.shape()[2], 3u);
    EXPECT_EQ(image.channels, 3);
    EXPECT_EQ(image.pixels8, bytes);
    EXPECT_EQ(image.at(1, 2, 1), bytes[(1*4 + 2)*3 + 1]);
}

TEST(FrameDecoder, OtherLengthsAreUnknownLayout) {
    const std::vector<uint8_t> bytes = counting_bytes(12);   // 1.5 bytes per pixel, as YUV 4:1:1.
    EXPECT_EQ(decode_error(make_raw(bytes, 4, 2)), FWCAM_ERROR_UNKNOWN_LAYOUT);
    EXPECT_EQ(decode_error(make_raw(counting_bytes(32), 4, 2)), FWCAM_ERROR_UNKNOWN_LAYOUT);
    EXPECT_EQ(decode_error(make_raw(std::vector<uint8_t>(), 4, 2)), FWCAM_ERROR_UNKNOWN_LAYOUT);
}

TEST(FrameDecoder, BadDimensionsAreInvalidInput) {
    const std::vector<uint8_t> bytes = counting_bytes(8);
    EXPECT_EQ(decode_error(make_raw(bytes, 0, 2)), FWCAM_ERROR_INVALID_INPUT);
    EXPECT_EQ(decode_error(make_raw(bytes, 4, -2)), FWCAM_ERROR_INVALID_INPUT);
}

TEST(FrameDecoder, OutputDoesNotAliasInput) {
    std::vector<uint8_t> bytes = counting_bytes(8);
    const Decoded_image image = decode(make_raw(bytes, 4, 2));
    const std::vector<uint8_t> before = image.pixels8;

    std::fill(bytes.begin(), bytes.end(), 0);   // The backend reuses its buffer.
    EXPECT_EQ(image.pixels8, before);
}

TEST(FrameDecoder, DecodeRgbSkipsInference) {
    // Buffer also fits 8-bit mono of a larger frame; decode_rgb trusts
    // the given size.
    const std::vector<uint8_t> bytes = counting_bytes(24);
    const Decoded_image image = decode_rgb(make_raw(bytes, 24, 1), 4, 2);
    EXPECT_EQ(image.channels, 3);
    EXPECT_EQ(image.height, 2);
    EXPECT_EQ(image.width, 4);
    EXPECT_EQ(image.pixels8, bytes);
}

TEST(FrameDecoder, DecodeRgbTooShortIsInvalidInput) {
    const std::vector<uint8_t> bytes = counting_bytes(23);
    try
    {
        decode_rgb(make_raw(bytes, 4, 2), 4, 2);
        FAIL() << "expected InvalidInput";
    }
    catch (const failure &f)
    {
        EXPECT_EQ(f.code(), FWCAM_ERROR_INVALID_INPUT);
    }
}

TEST(FrameDecoder, ErrorNamesInMessage) {
    try
    {
        decode(make_raw(counting_bytes(5), 4, 2));
        FAIL() << "expected UnknownLayout";
    }
    catch (const failure &f)
    {
        EXPECT_EQ(std::string(f.what()).find(error_name(FWCAM_ERROR_UNKNOWN_LAYOUT)), 0u);
    }
}
