#ifndef FWCAM_BACKEND_HPP
#define FWCAM_BACKEND_HPP
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


    Title: Camera backend interface

    Description:
    The capability surface that the camera session drives.  A backend
    enumerates the cameras it can see, drives one selected camera at a
    time and hands out raw frame buffers.  Bus arbitration, isochronous
    streaming and DMA buffer management all stay behind it.  Two
    variants are provided: dc1394_backend for real IEEE 1394 hardware
    and simulated_backend for testing without devices.

***********************************************************************/

#include <cstddef>
#include <cinttypes>
#include <functional>
#include <memory>
#include <string>
#include <fwcam/fwcam_error.hpp>
#include <fwcam/fwcam_settings.hpp>

namespace fwcam
{
    class backend
    {
        public:
            virtual ~backend() {};

            /* Counts the visible cameras. */
            virtual Backend_status enumerate(int &num_cameras) = 0;
            /* Human-readable identity of camera index, such as
               "Vendor Model 00b09d0100a0b1c2", or empty if there is no
               such camera.  The last space-separated word is the unique
               serial. */
            virtual std::string describe(const int index) = 0;
            /* Chooses the camera that the following calls refer to. */
            virtual Backend_status select(const int index) = 0;
            /* Connects to the selected camera. */
            virtual Backend_status init() = 0;
            /* Disconnects from the selected camera, stopping it first if
               needed.  Safe to call when not initialized. */
            virtual void release() = 0;

            virtual bool is_acquiring() = 0;
            virtual Backend_status start_acquisition() = 0;
            virtual Backend_status stop_acquisition() = 0;

            virtual bool has_mode(const int group, const int mode) = 0;
            virtual bool has_rate(const int group, const int mode, const int rate_index) = 0;

            virtual int get_format() = 0;
            virtual int get_mode() = 0;
            virtual int get_frame_rate() = 0;
            /* Setting the format group takes effect with the next
               set_mode() call, which selects a mode within it.  The two
               are only meaningful as a pair: after a failed set_mode(),
               set the camera's own group back. */
            virtual Backend_status set_format(const int group) = 0;
            virtual Backend_status set_mode(const int mode) = 0;
            virtual Backend_status set_frame_rate(const int rate_index) = 0;

            /* Waits for the next frame, up to the backend's timeout.  The
               previously acquired buffer becomes invalid. */
            virtual Backend_status acquire_frame() = 0;
            /* Points to the buffer of the last acquired frame.  The buffer
               stays owned by the backend. */
            virtual Backend_status get_raw_buffer(const uint8_t **buf_ptr, size_t &length) = 0;
            virtual Backend_status get_dimensions(int &width, int &height) = 0;
            /* Converts the last acquired frame to interleaved 8-bit RGB into
               buffer, which holds size bytes. */
            virtual Backend_status get_rgb(uint8_t *buffer, const size_t size) = 0;

            /* Message text of the most recent failure. */
            virtual std::string last_error() const = 0;
    };

    typedef std::shared_ptr<backend> Backend_ptr;
    /* Makes one fresh backend, for one camera session.  The settings
       carry the backend's own parameters, such as capture_timeout. */
    typedef std::function<Backend_ptr(const Fwcam_settings &)> Backend_factory;
}

#endif /* FWCAM_BACKEND_HPP */
