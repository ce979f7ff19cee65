#ifndef FWCAM_DC1394_HPP
#define FWCAM_DC1394_HPP
/***********************************************************************

    Copyright (c) The Fwcam developers 2026

    This file is part of Fwcam, a generic camera interface.

    Fwcam is free software; you can redistribute it and/or modify it
    under the terms of the GNU Lesser General Public License as
    published by the Free Software Foundation; either version 2.1 of the
    License, or (at your option) any later version.

    Fwcam is distributed in the hope that it will be useful, but
    WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
    Lesser General Public License for more details.

    You should have received a copy of the GNU Lesser General Public
    License along with Fwcam; if not, write to the Free Software
    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307
    USA


    Title: Header for the libdc1394 camera backend

    Description:
    Drives real IEEE 1394 IIDC cameras through libdc1394 version 2.
    Capture buffers are set up when acquisition starts, after the mode
    and frame rate have been set, so that DMA buffers get the right
    size.  A frame dequeued by acquire_frame() is given back to the DMA
    ring at the next acquisition or when acquisition stops.

***********************************************************************/

#include <memory>
#include <string>
#include <vector>
#include <dc1394/dc1394.h>
#include <fwcam/fwcam_backend.hpp>

namespace fwcam
{
    /* To translate to or from dc1394 mode enums: */
    static const int mode_dc1394_offset[] = {
        DC1394_VIDEO_MODE_160x120_YUV444,   /* Format 0.*/
        DC1394_VIDEO_MODE_800x600_YUV422,   /* Format 1.*/
        DC1394_VIDEO_MODE_1280x960_YUV422,  /* Format 2.*/
        0, 0, 0,                            /* Reserved formats.*/
        DC1394_VIDEO_MODE_EXIF,             /* Format 6.*/
        DC1394_VIDEO_MODE_FORMAT7_0         /* Format 7.*/
    };

    /* Maps a libdc1394 error code onto the backend status taxonomy. */
    Backend_status convert_dc1394_error(const dc1394error_t error);

    class dc1394_backend : public backend
    {
        public:
            /* num_frame_buffers is the DMA ring size (minimum 2) and
               capture_timeout the milliseconds acquire_frame() waits. */
            dc1394_backend(const int num_frame_buffers = 8, const int capture_timeout = 2000);
            ~dc1394_backend();

            Backend_status enumerate(int &num_cameras);
            std::string describe(const int index);
            Backend_status select(const int index);
            Backend_status init();
            void release();

            bool is_acquiring();
            Backend_status start_acquisition();
            Backend_status stop_acquisition();

            bool has_mode(const int group, const int mode);
            bool has_rate(const int group, const int mode, const int rate_index);

            int get_format();
            int get_mode();
            int get_frame_rate();
            Backend_status set_format(const int group);
            Backend_status set_mode(const int mode);
            Backend_status set_frame_rate(const int rate_index);

            Backend_status acquire_frame();
            Backend_status get_raw_buffer(const uint8_t **buf_ptr, size_t &length);
            Backend_status get_dimensions(int &width, int &height);
            Backend_status get_rgb(uint8_t *buffer, const size_t size);

            std::string last_error() const;

        private:
            std::shared_ptr<dc1394_t> dc1394_lib;
            std::vector<uint64_t> guids;
            std::vector<std::string> descriptions;
            int selected;
            std::shared_ptr<dc1394camera_t> camera;
            bool capture_set;
            dc1394video_frame_t *frame;
            int pending_group;
            int num_dma_buffers;
            int timeout_ms;
            std::string error_text;

            Backend_status fail(const dc1394error_t error, const std::string &what);
            Backend_status fail(const Backend_status status, const std::string &message);
            Backend_status requeue_frame();
            int current_video_mode();
            dc1394_backend(const dc1394_backend &db);
            dc1394_backend& operator=(const dc1394_backend &db);
    };

    /* Factory for fwcambus, taking num_frame_buffers and capture_timeout
       from the settings of each camera. */
    Backend_factory dc1394_factory();
}

#endif /* FWCAM_DC1394_HPP */
