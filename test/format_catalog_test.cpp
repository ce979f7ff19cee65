/***********************************************************************
    This file is in the public domain.

    Description:

    Unit tests of the format catalog and the frame rate ladder.

***********************************************************************/

#include <set>
#include <utility>
#include <gtest/gtest.h>
#include <fwcam/fwcam_formats.hpp>

using namespace fwcam;

TEST(FormatCatalog, HasTwentyThreeFixedFormats) {
    EXPECT_EQ(all_formats().size(), 23u);
}

TEST(FormatCatalog, NamesAndModesAreUnique) {
    std::set<std::string> names;
    std::set<std::pair<int, int> > modes;
    for (const Format_descriptor &entry : all_formats())
    {
        EXPECT_TRUE(names.insert(entry.name).second) << entry.name;
        EXPECT_TRUE(modes.insert(std::make_pair(entry.group, entry.mode)).second) << entry.name;
    }
}

TEST(FormatCatalog, LookupRoundTripsEveryEntry) {
    for (const Format_descriptor &entry : all_formats())
    {
        Format_descriptor by_name, by_mode;
        ASSERT_TRUE(lookup_format(entry.name, by_name));
        ASSERT_TRUE(lookup_format(entry.group, entry.mode, by_mode));
        EXPECT_EQ(by_name, entry);
        EXPECT_EQ(by_mode, entry);
    }
}

TEST(FormatCatalog, KnownEntries) {
    Format_descriptor descriptor;
    ASSERT_TRUE(lookup_format("640x480 Mono 8-bit", descriptor));
    EXPECT_EQ(descriptor.group, 0);
    EXPECT_EQ(descriptor.mode, 5);
    EXPECT_EQ(descriptor.width, 640);
    EXPECT_EQ(descriptor.height, 480);
    EXPECT_EQ(descriptor.coding, FWCAM_PIXEL_MONO8);

    ASSERT_TRUE(lookup_format(2, 7, descriptor));
    EXPECT_EQ(descriptor.name, "1600x1200 Mono 16-bit");
    EXPECT_EQ(descriptor.coding, FWCAM_PIXEL_MONO16);
}

TEST(FormatCatalog, LookupMissesLeaveDescriptorAlone) {
    Format_descriptor descriptor;
    ASSERT_TRUE(lookup_format("800x600 Mono 8-bit", descriptor));
    EXPECT_FALSE(lookup_format("800x600 mono 8-bit", descriptor));  // Exact names only.
    EXPECT_FALSE(lookup_format(7, 0, descriptor));                   // Format 7 is scalable.
    EXPECT_FALSE(lookup_format(0, 7, descriptor));
    EXPECT_EQ(descriptor.name, "800x600 Mono 8-bit");
}

TEST(FormatCatalog, CodingMatchesName) {
    for (const Format_descriptor &entry : all_formats())
    {
        if (entry.name.find("Mono 16-bit") != std::string::npos)
            EXPECT_EQ(entry.coding, FWCAM_PIXEL_MONO16) << entry.name;
        else if (entry.name.find("Mono 8-bit") != std::string::npos)
            EXPECT_EQ(entry.coding, FWCAM_PIXEL_MONO8) << entry.name;
        else if (entry.name.find("RGB") != std::string::npos)
            EXPECT_EQ(entry.coding, FWCAM_PIXEL_RGB8) << entry.name;
        EXPECT_NE(entry.name.find(std::to_string(entry.width) + "x" + std::to_string(entry.height)),
                  std::string::npos) << entry.name;
    }
}

TEST(FormatCatalog, PixelDepth) {
    EXPECT_EQ(pixel_depth(FWCAM_PIXEL_MONO8), 8);
    EXPECT_EQ(pixel_depth(FWCAM_PIXEL_YUV411), 12);
    EXPECT_EQ(pixel_depth(FWCAM_PIXEL_YUV422), 16);
    EXPECT_EQ(pixel_depth(FWCAM_PIXEL_MONO16), 16);
    EXPECT_EQ(pixel_depth(FWCAM_PIXEL_RGB8), 24);
    EXPECT_EQ(pixel_depth(FWCAM_PIXEL_INVALID), 0);
}

// ============================================================================
// Frame rate ladder
// ============================================================================

TEST(RateTable, DoublesFromStepToStep) {
    const std::vector<Frame_rate> &rates = rate_table();
    ASSERT_EQ(rates.size(), 8u);
    EXPECT_DOUBLE_EQ(rates.front().fps, 1.875);
    EXPECT_DOUBLE_EQ(rates.back().fps, 240.0);
    for (size_t i = 0; i < rates.size(); ++i)
    {
        EXPECT_EQ(rates[i].index, static_cast<int>(i));
        if (i > 0)
            EXPECT_DOUBLE_EQ(rates[i].fps, 2.0*rates[i - 1].fps);
    }
}

TEST(RateTable, LookupByIndexAndValue) {
    Frame_rate rate;
    ASSERT_TRUE(lookup_frame_rate(4, rate));
    EXPECT_DOUBLE_EQ(rate.fps, 30.0);
    ASSERT_TRUE(lookup_frame_rate(7.5, rate));
    EXPECT_EQ(rate.index, 2);
    EXPECT_FALSE(lookup_frame_rate(8, rate));
    EXPECT_FALSE(lookup_frame_rate(-1, rate));
    EXPECT_FALSE(lookup_frame_rate(25.0, rate));
}

TEST(RateTable, NearestOnLogarithmicLadder) {
    Frame_rate rate;
    ASSERT_TRUE(nearest_frame_rate(25.0, rate_table(), rate));
    EXPECT_EQ(rate.index, 4);   // 30 fps
    ASSERT_TRUE(nearest_frame_rate(45.0, rate_table(), rate));
    EXPECT_EQ(rate.index, 5);   // 60 fps, nearer in log2
    ASSERT_TRUE(nearest_frame_rate(0.0, rate_table(), rate));
    EXPECT_EQ(rate.index, 0);
    ASSERT_TRUE(nearest_frame_rate(1000.0, rate_table(), rate));
    EXPECT_EQ(rate.index, 7);
}

TEST(RateTable, NearestAmongCandidatesOnly) {
    std::vector<Frame_rate> candidates(rate_table().begin(), rate_table().begin() + 5);  // Up to 30 fps.
    Frame_rate rate;
    ASSERT_TRUE(nearest_frame_rate(120.0, candidates, rate));
    EXPECT_EQ(rate.index, 4);
    EXPECT_FALSE(nearest_frame_rate(30.0, std::vector<Frame_rate>(), rate));
}
