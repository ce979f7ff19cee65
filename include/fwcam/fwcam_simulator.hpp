#ifndef FWCAM_SIMULATOR_HPP
#define FWCAM_SIMULATOR_HPP
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


    Title: Header for the simulated camera backend

    Description:
    A backend that simulates IIDC cameras in memory, for testing and
    demonstrating Fwcam without hardware.  Frames are deterministic test
    patterns laid out as the camera would send them: 16-bit pixels in
    network byte order and YUV as UYVY.  Failures of individual calls
    can be injected and calls are counted.

    The simulated cameras are shared by all backends made from the same
    Simulated_bus, so that, like real hardware, a camera keeps its
    format and frame rate from one session to the next.

***********************************************************************/

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <fwcam/fwcam_backend.hpp>
#include <fwcam/fwcam_formats.hpp>

namespace fwcam
{
    /* Backend calls, for failure injection and call counting: */
    enum Sim_call
    {
        SIM_ENUMERATE,
        SIM_SELECT,
        SIM_INIT,
        SIM_START,
        SIM_STOP,
        SIM_SET_FORMAT,
        SIM_SET_MODE,
        SIM_SET_FRAME_RATE,
        SIM_ACQUIRE,
        SIM_GET_RGB,
        SIM_NUM_CALLS
    };

    /* One simulated camera: its identity, the modes it supports with
       their frame rates, and its current settings. */
    struct Simulated_camera
    {
        std::string description;
        std::map<std::pair<int, int>, std::vector<int> > modes;  /* (group, mode) -> rate indices.*/
        int group;
        int mode;
        int rate_index;
        bool acquiring;
        Simulated_camera(): description(""), group(-1), mode(-1), rate_index(-1), acquiring(false) {};

        /* Adds a catalog format with the given rate indices.  The first
           format added becomes the current one.  Returns false if name
           is not a catalog format. */
        bool add_format(const std::string &name, const std::vector<int> &rate_indices);
    };

    /* A typical monochrome and colour camera: formats 0 and 1 in all
       codings up to 30 fps, and 640x480 Mono 8-bit also at 60 fps. */
    Simulated_camera standard_camera(const std::string &description);

    /* The value of pixel (x, y) in frame number n of a simulated mono
       camera: 8-bit codings give (x + 2*y + n) & 0xff, 16-bit codings
       give x in the high byte and (y + n) & 0xff in the low byte.  Colour
       codings use (x & 0xff, y & 0xff, n & 0xff) as RGB. */
    uint16_t simulated_mono_value(const int x, const int y, const long frame_number, const Fwcam_pixel coding);

    typedef std::shared_ptr<std::vector<Simulated_camera> > Simulated_bus;

    Simulated_bus make_simulated_bus(const std::vector<Simulated_camera> &cameras);

    class simulated_backend : public backend
    {
        public:
            explicit simulated_backend(const Simulated_bus &bus);
            ~simulated_backend();

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

            /* Makes every following call of the given kind return status,
               until cleared by inject_failure(call, BACKEND_SUCCESS). */
            void inject_failure(const Sim_call call, const Backend_status status);
            int call_count(const Sim_call call) const;
            /* Serves the given bytes and dimensions from the next
               acquisitions instead of a generated pattern. */
            void override_frame(const std::vector<uint8_t> &bytes, const int width, const int height);
            long frame_number() const;
            bool is_initialized() const;

        private:
            Simulated_bus cameras;
            int selected;
            bool initialized;
            int pending_group;
            std::vector<Backend_status> injected;
            std::vector<int> calls;
            std::vector<uint8_t> frame_buffer;
            int frame_width;
            int frame_height;
            Fwcam_pixel frame_coding;
            long frames_acquired;
            bool frame_valid;
            bool use_override;
            std::vector<uint8_t> override_bytes;
            int override_width;
            int override_height;
            std::string error_text;

            Backend_status count_call(const Sim_call call);
            Backend_status fail(const Backend_status status, const std::string &message);
            Simulated_camera *current();
            void generate_frame(const Format_descriptor &descriptor);
            simulated_backend(const simulated_backend &sb);
            simulated_backend& operator=(const simulated_backend &sb);
    };
}

#endif /* FWCAM_SIMULATOR_HPP */
