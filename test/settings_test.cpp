/***********************************************************************
    This file is in the public domain.

    Description:

    Unit tests of session settings and their configuration files.

***********************************************************************/

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>
#include <unistd.h>
#include <gtest/gtest.h>
#include <fwcam/fwcam_settings.hpp>

using namespace fwcam;

TEST(Settings, Defaults) {
    const Fwcam_settings set;
    EXPECT_EQ(set.format, "640x480 Mono 8-bit");
    EXPECT_DOUBLE_EQ(set.frame_rate, 30.0);
    EXPECT_EQ(set.settle_delay, 100);
    EXPECT_EQ(set.capture_timeout, 2000);
    EXPECT_EQ(set.num_frame_buffers, 8);
}

TEST(Settings, ReadsFullAndAbbreviatedTags) {
    std::istringstream file(
        "# Camera at the loading bay\n"
        "\n"
        "format      800x600 Mono 16-bit\n"
        "fr          15\n"
        "se 0\n"
        "  capture_timeout   500  \n"
        "num         4\n");
    Fwcam_settings set;
    ASSERT_EQ(read_settings_from_file(file, set), FWCAM_SUCCESS);
    EXPECT_EQ(set.format, "800x600 Mono 16-bit");
    EXPECT_DOUBLE_EQ(set.frame_rate, 15.0);
    EXPECT_EQ(set.settle_delay, 0);
    EXPECT_EQ(set.capture_timeout, 500);
    EXPECT_EQ(set.num_frame_buffers, 4);
}

TEST(Settings, UnknownTagsAreIgnored) {
    std::istringstream file("gain 0.5\nframe_rate 7.5\n");
    Fwcam_settings set;
    ASSERT_EQ(read_settings_from_file(file, set), FWCAM_SUCCESS);
    EXPECT_DOUBLE_EQ(set.frame_rate, 7.5);
    EXPECT_EQ(set.format, Fwcam_settings().format);
}

TEST(Settings, AmbiguousTagFails) {
    std::istringstream file("frame_rate 60\nf 15\n");   // format or frame_rate?
    Fwcam_settings set;
    EXPECT_EQ(read_settings_from_file(file, set), FWCAM_FAILURE);
    EXPECT_DOUBLE_EQ(set.frame_rate, 60.0);   // Earlier lines applied.
}

TEST(Settings, InvalidValuesFail) {
    const char *const bad_files[] = {
        "frame_rate fast\n",
        "frame_rate -30\n",
        "settle_delay -1\n",
        "capture_timeout 0\n",
        "num_frame_buffers 1\n",
        "num_frame_buffers 8 buffers\n",
        "format\n"
    };
    for (const char *bad : bad_files)
    {
        std::istringstream file(bad);
        Fwcam_settings set;
        EXPECT_EQ(read_settings_from_file(file, set), FWCAM_FAILURE) << bad;
        EXPECT_EQ(set.num_frame_buffers, 8) << bad;
        EXPECT_DOUBLE_EQ(set.frame_rate, 30.0) << bad;
    }
}

TEST(Settings, WrittenSettingsReadBack) {
    Fwcam_settings written;
    written.format = "1024x768 RGB 24-bit";
    written.frame_rate = 3.75;
    written.settle_delay = 250;
    written.capture_timeout = 1000;
    written.num_frame_buffers = 16;

    std::stringstream file;
    ASSERT_EQ(write_settings_to_file(file, written), FWCAM_SUCCESS);
    Fwcam_settings read;
    ASSERT_EQ(read_settings_from_file(file, read), FWCAM_SUCCESS);
    EXPECT_EQ(read.format, written.format);
    EXPECT_DOUBLE_EQ(read.frame_rate, written.frame_rate);
    EXPECT_EQ(read.settle_delay, written.settle_delay);
    EXPECT_EQ(read.capture_timeout, written.capture_timeout);
    EXPECT_EQ(read.num_frame_buffers, written.num_frame_buffers);
}

TEST(Settings, CameraNameDropsSerial) {
    EXPECT_EQ(camera_name("Acme FW-100 00b09d0100a0b1c2"), "Acme FW-100");
    EXPECT_EQ(camera_name("Single"), "Single");
}

// ============================================================================
// Configuration file lookup
// ============================================================================

class SettingsFile : public ::testing::Test
{
    protected:
        void SetUp()
        {
            char dir_template[] = "/tmp/fwcam_conf_XXXXXX";
            ASSERT_TRUE(mkdtemp(dir_template) != NULL);
            conf_dir = dir_template;
            const char *previous = std::getenv(ENVIRONMENT_VAR_CONF);
            had_previous = previous != NULL;
            if (had_previous) previous_value = previous;
            setenv(ENVIRONMENT_VAR_CONF, conf_dir.c_str(), 1);
        }

        void TearDown()
        {
            for (const std::string &path : written)
                std::remove(path.c_str());
            rmdir(conf_dir.c_str());
            if (had_previous)
                setenv(ENVIRONMENT_VAR_CONF, previous_value.c_str(), 1);
            else
                unsetenv(ENVIRONMENT_VAR_CONF);
        }

        std::string write_conf(const std::string &name, const std::string &content)
        {
            const std::string path = conf_dir + "/" + name + CONFFILE_EXTENSION;
            std::ofstream file(path.c_str());
            file << content;
            written.push_back(path);
            return path;
        }

        std::string conf_dir;
        std::vector<std::string> written;
        bool had_previous;
        std::string previous_value;
};

TEST_F(SettingsFile, NoFileMeansDefaults) {
    std::string found;
    EXPECT_EQ(find_settings_file("Nobody Nothing 0000000000000001", found), FWCAM_FAILURE);

    Fwcam_settings set;
    set.frame_rate = 1.875;
    ASSERT_EQ(load_settings("Nobody Nothing 0000000000000001", set), FWCAM_SUCCESS);
    EXPECT_DOUBLE_EQ(set.frame_rate, 30.0);
}

TEST_F(SettingsFile, FoundByCameraName) {
    const std::string path = write_conf("Fwcamtest Model", "frame_rate 60\n");
    std::string found;
    ASSERT_EQ(find_settings_file("Fwcamtest Model 00b09d0100a0b1c2", found), FWCAM_SUCCESS);
    EXPECT_EQ(found, path);

    Fwcam_settings set;
    ASSERT_EQ(load_settings("Fwcamtest Model 00b09d0100a0b1c2", set), FWCAM_SUCCESS);
    EXPECT_DOUBLE_EQ(set.frame_rate, 60.0);
}

TEST_F(SettingsFile, FullDescriptionWinsOverName) {
    write_conf("Fwcamtest Model", "frame_rate 60\n");
    const std::string specific = write_conf("Fwcamtest Model 00b09d0100a0b1c2", "frame_rate 7.5\n");
    std::string found;
    ASSERT_EQ(find_settings_file("Fwcamtest Model 00b09d0100a0b1c2", found), FWCAM_SUCCESS);
    EXPECT_EQ(found, specific);
}

TEST_F(SettingsFile, BrokenFileFailsLoad) {
    write_conf("Fwcamtest Broken", "f 15\n");
    Fwcam_settings set;
    EXPECT_EQ(load_settings("Fwcamtest Broken 00b09d0100a0b1c4", set), FWCAM_FAILURE);
}
