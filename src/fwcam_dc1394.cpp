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


    Title: libdc1394 camera backend

***********************************************************************/
#include <chrono>
#include <iomanip>
#include <sstream>         //stringstream
#include <thread>
#include <fwcam/fwcam_macros.hpp>
#include <fwcam/fwcam_dc1394.hpp>

/* Records the dc1394 error text and returns the mapped status: */
#define RETURN_IF_DC1394_FAIL(r, what) \
    { \
        const dc1394error_t dc1394_return_ = (r); \
        if (dc1394_return_ != DC1394_SUCCESS) \
            return fail(dc1394_return_, what); \
    }

namespace
{
    const int num_fixed_formats = 3;             /* Formats 0 to 2.*/
    const int modes_in_format[num_fixed_formats] = {7, 8, 8};

    void free_library(dc1394_t *lib)
    {
        if (lib) dc1394_free(lib);
    }

    void free_camera(dc1394camera_t *cam)
    {
        if (cam) dc1394_camera_free(cam);
    }

    dc1394video_mode_t convert_format_mode2dc1394video_mode(const int group, const int mode)
    {
        if (group < 0 || group >= num_fixed_formats || mode < 0 || mode >= modes_in_format[group])
            return static_cast<dc1394video_mode_t>(0);
        return static_cast<dc1394video_mode_t>(fwcam::mode_dc1394_offset[group] + mode);
    }

    /* Splits a dc1394 video mode into format group and mode, or returns
       false for modes outside formats 0 to 2: */
    bool convert_dc1394video_mode2format_mode(const int video_mode, int &group, int &mode)
    {
        for (int g = num_fixed_formats - 1; g >= 0; --g)
        {
            const int offset = video_mode - fwcam::mode_dc1394_offset[g];
            if (offset >= 0)
            {
                if (offset >= modes_in_format[g])
                    return false;
                group = g;
                mode = offset;
                return true;
            }
        }
        return false;
    }
}

fwcam::Backend_status fwcam::convert_dc1394_error(const dc1394error_t error)
{
    switch (error)
    {
        case DC1394_SUCCESS:
            return BACKEND_SUCCESS;
        case DC1394_FUNCTION_NOT_SUPPORTED:
        case DC1394_INVALID_VIDEO_MODE:
        case DC1394_INVALID_FRAMERATE:
            return BACKEND_UNSUPPORTED;
        case DC1394_CAMERA_NOT_INITIALIZED:
            return BACKEND_NOT_INITIALIZED;
        case DC1394_INVALID_ARGUMENT_VALUE:
        case DC1394_REQ_VALUE_OUTSIDE_RANGE:
            return BACKEND_OUT_OF_RANGE;
        case DC1394_MEMORY_ALLOCATION_FAILURE:
        case DC1394_NO_BANDWIDTH:
        case DC1394_NO_ISO_CHANNEL:
            return BACKEND_INSUFFICIENT_RESOURCES;
        case DC1394_CAPTURE_IS_RUNNING:
            return BACKEND_BUSY;
        default:
            return BACKEND_ERROR;
    }
}

fwcam::dc1394_backend::dc1394_backend(const int num_frame_buffers, const int capture_timeout):
    selected(-1), capture_set(false), frame(NULL), pending_group(-1),
    num_dma_buffers(num_frame_buffers < 2 ? 2 : num_frame_buffers),
    timeout_ms(capture_timeout), error_text("")
{
}

fwcam::dc1394_backend::~dc1394_backend()
{
    release();
}

fwcam::Backend_status fwcam::dc1394_backend::fail(const dc1394error_t error, const std::string &what)
{
    error_text = what + ": " + dc1394_error_get_string(error);
    return convert_dc1394_error(error);
}

fwcam::Backend_status fwcam::dc1394_backend::fail(const Backend_status status, const std::string &message)
{
    error_text = message;
    return status;
}

fwcam::Backend_status fwcam::dc1394_backend::enumerate(int &num_cameras)
{
    if (!dc1394_lib)
    {
        dc1394_lib.reset(dc1394_new(), free_library);
        if (!dc1394_lib)
            return fail(BACKEND_NOT_INITIALIZED, "Failed to initialize dc1394 library");
    }

    dc1394camera_list_t *list = NULL;
    RETURN_IF_DC1394_FAIL(dc1394_camera_enumerate(dc1394_lib.get(), &list), "Error accessing cameras");

    guids.clear();
    descriptions.clear();
    for (uint32_t c = 0; c < list->num; ++c)
    {
        std::shared_ptr<dc1394camera_t> cam(dc1394_camera_new(dc1394_lib.get(), list->ids[c].guid), free_camera);
        if (!cam)
        {
            DPRINTF("Warning: dc1394_camera_new() failed for camera " << c << ", skipping it.");
            continue;
        }
        std::ostringstream description;
        description << (cam->vendor ? cam->vendor : "Unknown") << " "
                    << (cam->model ? cam->model : "camera") << " "
                    << std::hex << std::setw(16) << std::setfill('0') << cam->guid;
        guids.push_back(list->ids[c].guid);
        descriptions.push_back(description.str());
    }
    dc1394_camera_free_list(list);

    num_cameras = static_cast<int>(guids.size());
    return BACKEND_SUCCESS;
}

std::string fwcam::dc1394_backend::describe(const int index)
{
    if (index < 0 || index >= static_cast<int>(descriptions.size()))
        return "";
    return descriptions[index];
}

fwcam::Backend_status fwcam::dc1394_backend::select(const int index)
{
    if (index < 0 || index >= static_cast<int>(guids.size()))
        return fail(BACKEND_OUT_OF_RANGE, "No camera with that index was enumerated");
    if (camera)
        release();
    selected = index;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::dc1394_backend::init()
{
    if (!dc1394_lib || selected < 0)
        return fail(BACKEND_NOT_INITIALIZED, "No camera selected");

    camera.reset(dc1394_camera_new(dc1394_lib.get(), guids[selected]), free_camera);
    if (!camera)
        return fail(BACKEND_NOT_INITIALIZED, "dc1394_camera_new() failed");

    /* Make sure the isochronous channel is not still held by a previous
       process that was killed without releasing it.  Hopefully this
       won't hurt anything: */
    dc1394_iso_release_all(camera.get());
    capture_set = false;
    frame = NULL;
    pending_group = get_format();
    return BACKEND_SUCCESS;
}

void fwcam::dc1394_backend::release()
{
    if (!camera)
        return;
    if (capture_set || is_acquiring())
    {
        if (stop_acquisition() != BACKEND_SUCCESS)
            DPRINTF("Warning: " << error_text);
    }
    camera.reset();
}

bool fwcam::dc1394_backend::is_acquiring()
{
    if (!camera)
        return false;
    dc1394switch_t iso_en;
    if (dc1394_video_get_transmission(camera.get(), &iso_en) != DC1394_SUCCESS)
        return capture_set;
    return iso_en == DC1394_ON;
}

fwcam::Backend_status fwcam::dc1394_backend::start_acquisition()
{
    if (!camera)
        return fail(BACKEND_NOT_INITIALIZED, "Camera is not initialized");
    if (!capture_set)
    {
        RETURN_IF_DC1394_FAIL(dc1394_capture_setup(camera.get(), num_dma_buffers, DC1394_CAPTURE_FLAGS_DEFAULT),
                              "dc1394_capture_setup() failed");
        capture_set = true;
    }
    RETURN_IF_DC1394_FAIL(dc1394_video_set_transmission(camera.get(), DC1394_ON),
                          "dc1394_video_set_transmission() failed");
    return BACKEND_SUCCESS;
}

/* If dc1394_capture_stop() is called without a preceding successful
   call to dc1394_capture_setup(), libdc1394 can get into a tangled
   state, hence the capture_set flag. */
fwcam::Backend_status fwcam::dc1394_backend::stop_acquisition()
{
    if (!camera)
        return fail(BACKEND_NOT_INITIALIZED, "Camera is not initialized");

    const Backend_status requeue_status = requeue_frame();
    const dc1394error_t transmission = dc1394_video_set_transmission(camera.get(), DC1394_OFF);
    if (capture_set)
    {
        dc1394_capture_stop(camera.get());
        capture_set = false;
    }
    RETURN_IF_DC1394_FAIL(transmission, "dc1394_video_set_transmission() failed");
    return requeue_status;
}

bool fwcam::dc1394_backend::has_mode(const int group, const int mode)
{
    const dc1394video_mode_t video_mode = convert_format_mode2dc1394video_mode(group, mode);
    if (!camera || video_mode == 0)
        return false;

    dc1394video_modes_t mode_list;
    if (dc1394_video_get_supported_modes(camera.get(), &mode_list) != DC1394_SUCCESS)
    {
        DPRINTF("dc1394_video_get_supported_modes() failed.");
        return false;
    }
    for (uint32_t m = 0; m < mode_list.num; ++m)
    {
        if (mode_list.modes[m] == video_mode)
            return true;
    }
    return false;
}

bool fwcam::dc1394_backend::has_rate(const int group, const int mode, const int rate_index)
{
    const dc1394video_mode_t video_mode = convert_format_mode2dc1394video_mode(group, mode);
    if (!camera || video_mode == 0)
        return false;

    dc1394framerates_t framerate_list;
    if (dc1394_video_get_supported_framerates(camera.get(), video_mode, &framerate_list) != DC1394_SUCCESS)
    {
        DPRINTF("dc1394_video_get_supported_framerates() failed.");
        return false;
    }
    for (uint32_t r = 0; r < framerate_list.num; ++r)
    {
        if (framerate_list.framerates[r] - DC1394_FRAMERATE_MIN == rate_index)
            return true;
    }
    return false;
}

int fwcam::dc1394_backend::current_video_mode()
{
    if (!camera)
        return -1;
    dc1394video_mode_t video_mode;
    if (dc1394_video_get_mode(camera.get(), &video_mode) != DC1394_SUCCESS)
        return -1;
    return video_mode;
}

int fwcam::dc1394_backend::get_format()
{
    int group = -1, mode = -1;
    if (!convert_dc1394video_mode2format_mode(current_video_mode(), group, mode))
        return -1;
    return group;
}

int fwcam::dc1394_backend::get_mode()
{
    int group = -1, mode = -1;
    if (!convert_dc1394video_mode2format_mode(current_video_mode(), group, mode))
        return -1;
    return mode;
}

int fwcam::dc1394_backend::get_frame_rate()
{
    if (!camera)
        return -1;
    dc1394framerate_t frame_rate;
    if (dc1394_video_get_framerate(camera.get(), &frame_rate) != DC1394_SUCCESS)
        return -1;
    return frame_rate - DC1394_FRAMERATE_MIN;
}

fwcam::Backend_status fwcam::dc1394_backend::set_format(const int group)
{
    if (!camera)
        return fail(BACKEND_NOT_INITIALIZED, "Camera is not initialized");
    if (group < 0 || group >= num_fixed_formats)
        return fail(BACKEND_UNSUPPORTED, "Only formats 0 to 2 are supported");
    pending_group = group;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::dc1394_backend::set_mode(const int mode)
{
    if (!camera)
        return fail(BACKEND_NOT_INITIALIZED, "Camera is not initialized");
    if (capture_set)
        return fail(BACKEND_BUSY, "Cannot change mode while capturing");
    const dc1394video_mode_t video_mode = convert_format_mode2dc1394video_mode(pending_group, mode);
    if (video_mode == 0)
        return fail(BACKEND_OUT_OF_RANGE, "Mode out of range for the format");
    RETURN_IF_DC1394_FAIL(dc1394_video_set_mode(camera.get(), video_mode), "dc1394_video_set_mode() failed");
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::dc1394_backend::set_frame_rate(const int rate_index)
{
    if (!camera)
        return fail(BACKEND_NOT_INITIALIZED, "Camera is not initialized");
    if (capture_set)
        return fail(BACKEND_BUSY, "Cannot change frame rate while capturing");
    if (rate_index < 0 || rate_index > DC1394_FRAMERATE_MAX - DC1394_FRAMERATE_MIN)
        return fail(BACKEND_OUT_OF_RANGE, "Frame rate index out of range");
    RETURN_IF_DC1394_FAIL(dc1394_video_set_framerate(camera.get(),
                                                     static_cast<dc1394framerate_t>(DC1394_FRAMERATE_MIN + rate_index)),
                          "dc1394_video_set_framerate() failed");
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::dc1394_backend::requeue_frame()
{
    if (frame == NULL)
        return BACKEND_SUCCESS;
    dc1394video_frame_t *done = frame;
    frame = NULL;
    RETURN_IF_DC1394_FAIL(dc1394_capture_enqueue(camera.get(), done), "dc1394_capture_enqueue() failed");
    return BACKEND_SUCCESS;
}

/* Polls rather than waits, so that a camera that stops sending cannot
   block the caller beyond the timeout: */
fwcam::Backend_status fwcam::dc1394_backend::acquire_frame()
{
    if (!camera || !capture_set)
        return fail(BACKEND_NOT_INITIALIZED, "Capture is not running");

    const Backend_status requeue_status = requeue_frame();
    if (requeue_status != BACKEND_SUCCESS)
        return requeue_status;

    const std::chrono::steady_clock::time_point deadline =
            std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    for (;;)
    {
        dc1394video_frame_t *next = NULL;
        RETURN_IF_DC1394_FAIL(dc1394_capture_dequeue(camera.get(), DC1394_CAPTURE_POLICY_POLL, &next),
                              "dc1394_capture_dequeue() failed");
        if (next != NULL)
        {
            frame = next;
            if (dc1394_capture_is_frame_corrupt(camera.get(), frame) == DC1394_TRUE)
                DPRINTF("Warning: dequeued frame is corrupt.");
            return BACKEND_SUCCESS;
        }
        if (std::chrono::steady_clock::now() >= deadline)
        {
            std::ostringstream msg;
            msg << "No frame within " << timeout_ms << " ms";
            return fail(BACKEND_TIMEOUT, msg.str());
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

fwcam::Backend_status fwcam::dc1394_backend::get_raw_buffer(const uint8_t **buf_ptr, size_t &length)
{
    if (buf_ptr == NULL)
        return fail(BACKEND_ERROR, "Null buffer pointer");
    if (frame == NULL)
        return fail(BACKEND_NOT_INITIALIZED, "No frame acquired");
    *buf_ptr = frame->image;
    length = frame->image_bytes;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::dc1394_backend::get_dimensions(int &width, int &height)
{
    if (frame != NULL)
    {
        width = frame->size[0];
        height = frame->size[1];
        return BACKEND_SUCCESS;
    }

    const int video_mode = current_video_mode();
    if (video_mode < 0)
        return fail(BACKEND_NOT_INITIALIZED, "Camera mode is unknown");
    uint32_t w = 0, h = 0;
    RETURN_IF_DC1394_FAIL(dc1394_get_image_size_from_video_mode(camera.get(),
                                                                static_cast<dc1394video_mode_t>(video_mode), &w, &h),
                          "dc1394_get_image_size_from_video_mode() failed");
    width = w;
    height = h;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::dc1394_backend::get_rgb(uint8_t *buffer, const size_t size)
{
    if (buffer == NULL)
        return fail(BACKEND_ERROR, "Null RGB buffer");
    if (frame == NULL)
        return fail(BACKEND_NOT_INITIALIZED, "No frame acquired");
    if (size < static_cast<size_t>(frame->size[0])*frame->size[1]*3)
        return fail(BACKEND_OUT_OF_RANGE, "RGB buffer too small");

    RETURN_IF_DC1394_FAIL(dc1394_convert_to_RGB8(frame->image, buffer, frame->size[0], frame->size[1],
                                                 DC1394_BYTE_ORDER_UYVY, frame->color_coding, frame->data_depth),
                          "dc1394_convert_to_RGB8() failed");
    return BACKEND_SUCCESS;
}

std::string fwcam::dc1394_backend::last_error() const
{
    return error_text;
}

fwcam::Backend_factory fwcam::dc1394_factory()
{
    return [](const Fwcam_settings &set) {
        return Backend_ptr(new dc1394_backend(set.num_frame_buffers, set.capture_timeout));
    };
}
