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


    Title: Camera session

    Description:
    The Uninitialized -> Idle <-> Acquiring state machine on top of a
    camera backend.  Mode and rate changes are only made while the
    camera is stopped, so they stop it first.

******************************************************************************/
#include <algorithm>
#include <chrono>
#include <sstream>         //stringstream
#include <thread>
#include <fwcam/fwcam_config.hpp>
#include <fwcam/fwcam.hpp>

namespace
{
    bool fewer_pixels(const fwcam::Format_descriptor &a, const fwcam::Format_descriptor &b)
    {
        const long a_pixels = static_cast<long>(a.width)*a.height;
        const long b_pixels = static_cast<long>(b.width)*b.height;
        if (a_pixels != b_pixels)
            return a_pixels < b_pixels;
        return a.name < b.name;
    }
}

std::string fwcam::version()
{
    std::ostringstream version_str;
    version_str << FWCAM_VERSION_MAJOR << "." << FWCAM_VERSION_MINOR << "." << FWCAM_VERSION_PATCH;
    return version_str.str();
}

fwcam::camera::camera(const Backend_ptr &backend_handle, const Fwcam_settings &set):
    cam_backend(backend_handle), session_settings(set), session_state(FWCAM_UNINITIALIZED),
    cam_index(-1), cam_description("")
{
    if (!cam_backend)
        throw failure(FWCAM_ERROR_INIT_FAILED, "Camera session needs a backend.");
}

fwcam::camera::~camera()
{
    close();
}

void fwcam::camera::open(const int index)
{
    if (session_state != FWCAM_UNINITIALIZED)
        close();

    int num_cameras = 0;
    const Backend_status enum_status = cam_backend->enumerate(num_cameras);
    if (enum_status != BACKEND_SUCCESS)
        throw failure(FWCAM_ERROR_INIT_FAILED, "Cannot enumerate cameras: " + cam_backend->last_error());
    if (index < 0 || index >= num_cameras)
    {
        std::ostringstream msg;
        msg << "No camera with index " << index << " (" << num_cameras << " found).";
        throw failure(FWCAM_ERROR_NOT_FOUND, msg.str());
    }

    if (cam_backend->select(index) != BACKEND_SUCCESS)
        throw failure(FWCAM_ERROR_INIT_FAILED, "Cannot select camera: " + cam_backend->last_error());
    if (cam_backend->init() != BACKEND_SUCCESS)
    {
        const std::string reason = cam_backend->last_error();
        cam_backend->release();
        throw failure(FWCAM_ERROR_INIT_FAILED, "Cannot initialize camera: " + reason);
    }

    cam_index = index;
    cam_description = cam_backend->describe(index);
    session_state = FWCAM_IDLE;

    /* The camera may have been left running by a previous process that
       was killed without stopping it: */
    if (cam_backend->is_acquiring() && cam_backend->stop_acquisition() != BACKEND_SUCCESS)
        DPRINTF("Warning: could not stop camera left running: " << cam_backend->last_error());

    apply_defaults();
}

/* Not all cameras support the default format and rate, so we are
   lenient here: the camera keeps its own setting instead. */
void fwcam::camera::apply_defaults()
{
    try
    {
        set_format(session_settings.format);
    }
    catch(failure &f)
    {
        DPRINTF("Warning: default format '" << session_settings.format << "' not applied: " << f.what());
    }

    try
    {
        set_frame_rate(session_settings.frame_rate);
    }
    catch(failure &f)
    {
        DPRINTF("Warning: default frame rate " << session_settings.frame_rate << " not applied: " << f.what());
    }
}

void fwcam::camera::close()
{
    if (session_state == FWCAM_UNINITIALIZED)
        return;

    stop();
    try
    {
        cam_backend->release();
    }
    catch(std::exception &e)
    {
        DPRINTF("Warning: releasing the camera failed: " << e.what());
    }
    session_state = FWCAM_UNINITIALIZED;
    cam_index = -1;
    cam_description = "";
}

fwcam::Session_state fwcam::camera::state() const
{
    return session_state;
}

bool fwcam::camera::is_acquiring() const
{
    return session_state == FWCAM_ACQUIRING;
}

int fwcam::camera::index() const
{
    return cam_index;
}

std::string fwcam::camera::description() const
{
    return cam_description;
}

std::string fwcam::camera::name() const
{
    return camera_name(cam_description);
}

const fwcam::Fwcam_settings &fwcam::camera::settings() const
{
    return session_settings;
}

std::vector<fwcam::Format_descriptor> fwcam::camera::supported_formats() const
{
    THROW_IF_CLOSED(session_state);
    std::vector<Format_descriptor> supported;
    for (const Format_descriptor &entry : all_formats())
    {
        if (cam_backend->has_mode(entry.group, entry.mode))
            supported.push_back(entry);
    }
    std::sort(supported.begin(), supported.end(), fewer_pixels);
    return supported;
}

std::vector<std::string> fwcam::camera::supported_format_names() const
{
    std::vector<std::string> names;
    for (const Format_descriptor &entry : supported_formats())
        names.push_back(entry.name);
    return names;
}

fwcam::Format_descriptor fwcam::camera::format() const
{
    THROW_IF_CLOSED(session_state);
    const int group = cam_backend->get_format();
    const int mode = cam_backend->get_mode();
    Format_descriptor descriptor;
    if (!lookup_format(group, mode, descriptor))
    {
        std::ostringstream msg;
        msg << "Camera is in format " << group << " mode " << mode << ", which is not in the catalog.";
        throw failure(FWCAM_ERROR_NOT_FOUND, msg.str());
    }
    return descriptor;
}

void fwcam::camera::set_format(const Format_descriptor &descriptor)
{
    THROW_IF_CLOSED(session_state);
    stop();
    if (!cam_backend->has_mode(descriptor.group, descriptor.mode))
        throw failure(FWCAM_ERROR_UNSUPPORTED, "Camera does not support format '" + descriptor.name + "'.");

    const int previous_group = cam_backend->get_format();
    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->set_format(descriptor.group),
                          "Cannot set format '" + descriptor.name + "'");
    const Backend_status mode_status = cam_backend->set_mode(descriptor.mode);
    if (mode_status != BACKEND_SUCCESS)
    {
        /* The group only takes effect with a mode, so the backend must
           not be left holding the rejected one: */
        const std::string reason = cam_backend->last_error();
        if (cam_backend->set_format(previous_group) != BACKEND_SUCCESS)
            DPRINTF("Warning: could not restore format group " << previous_group << ": "
                    << cam_backend->last_error());
        throw failure(convert_status2error(mode_status),
                      "Cannot set format '" + descriptor.name + "': " + reason);
    }
}

fwcam::Format_descriptor fwcam::camera::set_format(const std::string &format_string)
{
    const std::vector<std::string> names = supported_format_names();
    const Format_descriptor descriptor =
            resolve_format(format_string, std::set<std::string>(names.begin(), names.end()));
    set_format(descriptor);
    return descriptor;
}

std::vector<fwcam::Frame_rate> fwcam::camera::supported_frame_rates() const
{
    THROW_IF_CLOSED(session_state);
    const int group = cam_backend->get_format();
    const int mode = cam_backend->get_mode();
    std::vector<Frame_rate> supported;
    for (const Frame_rate &rate : rate_table())
    {
        if (cam_backend->has_rate(group, mode, rate.index))
            supported.push_back(rate);
    }
    return supported;
}

fwcam::Frame_rate fwcam::camera::frame_rate() const
{
    THROW_IF_CLOSED(session_state);
    const int rate_index = cam_backend->get_frame_rate();
    Frame_rate rate;
    if (!lookup_frame_rate(rate_index, rate))
    {
        std::ostringstream msg;
        msg << "Camera reports frame rate index " << rate_index << ", which is not on the ladder.";
        throw failure(FWCAM_ERROR_OUT_OF_RANGE, msg.str());
    }
    return rate;
}

void fwcam::camera::set_frame_rate(const Frame_rate &rate)
{
    THROW_IF_CLOSED(session_state);
    stop();
    const int group = cam_backend->get_format();
    const int mode = cam_backend->get_mode();
    std::ostringstream what;
    what << "Cannot set frame rate " << rate.fps << " fps";
    if (!cam_backend->has_rate(group, mode, rate.index))
        throw failure(FWCAM_ERROR_UNSUPPORTED, what.str() + " in the current format.");

    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->set_frame_rate(rate.index), what.str());
}

fwcam::Frame_rate fwcam::camera::set_frame_rate(const double fps)
{
    Frame_rate rate;
    if (!nearest_frame_rate(fps, supported_frame_rates(), rate))
        throw failure(FWCAM_ERROR_UNSUPPORTED, "Camera supports no frame rate in the current format.");
    set_frame_rate(rate);
    return rate;
}

void fwcam::camera::start()
{
    THROW_IF_CLOSED(session_state);
    if (session_state == FWCAM_ACQUIRING)
        return;

    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->start_acquisition(), "Cannot start acquisition");
    session_state = FWCAM_ACQUIRING;
    /* Some cameras need time after starting before the first frame is
       valid: */
    if (session_settings.settle_delay > 0)
        std::this_thread::sleep_for(std::chrono::milliseconds(session_settings.settle_delay));
}

void fwcam::camera::stop()
{
    if (session_state != FWCAM_ACQUIRING)
        return;

    try
    {
        if (cam_backend->stop_acquisition() != BACKEND_SUCCESS)
            DPRINTF("Warning: stopping acquisition failed: " << cam_backend->last_error());
    }
    catch(std::exception &e)
    {
        DPRINTF("Warning: stopping acquisition failed: " << e.what());
    }
    session_state = FWCAM_IDLE;
}

void fwcam::camera::acquire()
{
    THROW_IF_CLOSED(session_state);
    if (session_state == FWCAM_IDLE)
        start();
    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->acquire_frame(), "No frame acquired");
}

fwcam::Decoded_image fwcam::camera::capture()
{
    acquire();

    Raw_frame raw;
    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->get_raw_buffer(&raw.bytes, raw.length),
                          "Cannot access frame buffer");
    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->get_dimensions(raw.width, raw.height),
                          "Cannot get frame size");
    return decode(raw);
}

fwcam::Decoded_image fwcam::camera::capture_rgb()
{
    acquire();

    int width = 0, height = 0;
    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->get_dimensions(width, height),
                          "Cannot get frame size");
    if (width <= 0 || height <= 0)
        throw failure(FWCAM_ERROR_INVALID_INPUT, "Backend reports an empty frame.");

    std::vector<uint8_t> rgb_buffer(static_cast<size_t>(width)*height*3);
    THROW_IF_BACKEND_FAIL(cam_backend, cam_backend->get_rgb(&rgb_buffer[0], rgb_buffer.size()),
                          "Cannot convert frame to RGB");

    Raw_frame raw;
    raw.bytes = &rgb_buffer[0];
    raw.length = rgb_buffer.size();
    raw.width = width;
    raw.height = height;
    return decode_rgb(raw, width, height);
}
