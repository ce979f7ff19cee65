#ifndef FWCAM_HPP
#define FWCAM_HPP
/******************************************************************************

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


    Title: Header for fwcam.cpp

    Description:
    This module is about using a single camera through a session.  The
    session owns its backend exclusively and sequences format
    negotiation and acquisition in the order the hardware requires:
    open, set format and frame rate, start, capture, stop.  Finding
    cameras and handing out sessions for them is done in the Fwcam bus
    module.

    A session is not thread-safe.  Use one session per thread, or lock
    around it.

******************************************************************************/

#include <string>
#include <vector>
#include <fwcam/fwcam_backend.hpp>
#include <fwcam/fwcam_formats.hpp>
#include <fwcam/fwcam_frame.hpp>
#include <fwcam/fwcam_settings.hpp>

namespace fwcam
{
    enum Session_state
    {
        FWCAM_UNINITIALIZED,
        FWCAM_IDLE,
        FWCAM_ACQUIRING
    };

    /* Returns Fwcam's version as a string such as "1.2.3". */
    std::string version();

    class camera
    {

        public:
            explicit camera(const Backend_ptr &backend_handle, const Fwcam_settings &set = Fwcam_settings());
            /* Stops acquisition if needed and releases the backend. */
            ~camera();
            /* Connects to camera index of the backend and applies the
               default format and frame rate from the settings.  Throws
               fwcam::failure with FWCAM_ERROR_NOT_FOUND if there is no such
               camera and FWCAM_ERROR_INIT_FAILED if the backend cannot
               select or initialize it.  A default that the camera rejects
               is reported as a warning and leaves the camera's own
               setting in place.  An open session is closed first. */
            void open(const int index);
            /* Stops acquisition if needed and releases the backend.  Never
               throws; calling it on a closed session has no effect. */
            void close();

            Session_state state() const;
            bool is_acquiring() const;
            /* Index and backend description of the open camera. */
            int index() const;
            std::string description() const;
            /* The description without the serial word. */
            std::string name() const;
            const Fwcam_settings &settings() const;

            /* The catalog formats the camera reports, ordered by pixel
               count and then by name.  Queried afresh on every call. */
            std::vector<Format_descriptor> supported_formats() const;
            std::vector<std::string> supported_format_names() const;
            /* The format currently set in the camera.  Throws
               FWCAM_ERROR_NOT_FOUND if the camera is in a mode outside the
               catalog, such as format 7. */
            Format_descriptor format() const;
            /* Stops acquisition if needed, then sets the format.  Throws
               FWCAM_ERROR_UNSUPPORTED if the camera lacks it. */
            void set_format(const Format_descriptor &descriptor);
            /* Resolves a terse format string, such as "mono 8-bit 800x600",
               against the supported formats (see resolve_format()) and
               sets the result, which is returned. */
            Format_descriptor set_format(const std::string &format_string);

            /* The frame rates the camera supports in its current format. */
            std::vector<Frame_rate> supported_frame_rates() const;
            Frame_rate frame_rate() const;
            /* Stops acquisition if needed, then sets the frame rate.
               Throws FWCAM_ERROR_UNSUPPORTED if the current format does
               not support it. */
            void set_frame_rate(const Frame_rate &rate);
            /* Sets the supported frame rate nearest to fps and returns it. */
            Frame_rate set_frame_rate(const double fps);

            /* Starts acquisition and waits for the settling delay.  Has no
               effect if already acquiring. */
            void start();
            /* Stops acquisition.  Never throws: a backend failure is
               reported as a warning.  Has no effect if already stopped. */
            void stop();

            /* Starts acquisition if needed and waits for the next frame,
               decoded by layout inference (see decode()).  Throws
               FWCAM_ERROR_TIMEOUT or FWCAM_ERROR_BUSY as signalled by the
               backend. */
            Decoded_image capture();
            /* Like capture(), but lets the backend convert the frame to
               8-bit RGB first.  Works for the YUV formats too. */
            Decoded_image capture_rgb();

        private:
            Backend_ptr cam_backend;
            Fwcam_settings session_settings;
            Session_state session_state;
            int cam_index;
            std::string cam_description;

            void apply_defaults();
            void acquire();
            camera(const camera &cam);
            camera& operator=(const camera &cam);

    };

}

#endif
