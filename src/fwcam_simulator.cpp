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


    Title: Simulated camera backend

***********************************************************************/
#include <algorithm>
#include <sstream>         //stringstream
#include <fwcam/fwcam_simulator.hpp>

namespace
{
    uint8_t clamp_byte(const double value)
    {
        if (value < 0.0) return 0;
        if (value > 255.0) return 255;
        return static_cast<uint8_t>(value + 0.5);
    }

    void yuv2rgb(const uint8_t y, const uint8_t u, const uint8_t v, uint8_t *rgb)
    {
        const double cb = u - 128.0;
        const double cr = v - 128.0;
        rgb[0] = clamp_byte(y + 1.402*cr);
        rgb[1] = clamp_byte(y - 0.344*cb - 0.714*cr);
        rgb[2] = clamp_byte(y + 1.772*cb);
    }

    void gray2rgb(const uint8_t y, uint8_t *rgb)
    {
        rgb[0] = rgb[1] = rgb[2] = y;
    }
}

bool fwcam::Simulated_camera::add_format(const std::string &name, const std::vector<int> &rate_indices)
{
    Format_descriptor descriptor;
    if (!lookup_format(name, descriptor))
        return false;
    modes[std::make_pair(descriptor.group, descriptor.mode)] = rate_indices;
    if (group < 0)
    {
        group = descriptor.group;
        mode = descriptor.mode;
        rate_index = rate_indices.empty() ? -1 : rate_indices.back();
    }
    return true;
}

fwcam::Simulated_camera fwcam::standard_camera(const std::string &description)
{
    Simulated_camera cam;
    cam.description = description;
    std::vector<int> up_to_30fps;
    for (int r = 0; r <= 4; ++r)
        up_to_30fps.push_back(r);
    std::vector<int> up_to_60fps(up_to_30fps);
    up_to_60fps.push_back(5);

    cam.add_format("640x480 Mono 8-bit", up_to_60fps);
    for (const Format_descriptor &entry : all_formats())
    {
        if (entry.group <= 1 && entry.name != "640x480 Mono 8-bit")
            cam.add_format(entry.name, up_to_30fps);
    }
    return cam;
}

uint16_t fwcam::simulated_mono_value(const int x, const int y, const long frame_number, const Fwcam_pixel coding)
{
    if (coding == FWCAM_PIXEL_MONO16)
        return static_cast<uint16_t>(((x & 0xff) << 8) | ((y + frame_number) & 0xff));
    return static_cast<uint16_t>((x + 2*y + frame_number) & 0xff);
}

fwcam::Simulated_bus fwcam::make_simulated_bus(const std::vector<Simulated_camera> &cameras)
{
    return Simulated_bus(new std::vector<Simulated_camera>(cameras));
}

fwcam::simulated_backend::simulated_backend(const Simulated_bus &bus):
    cameras(bus), selected(-1), initialized(false), pending_group(-1),
    injected(SIM_NUM_CALLS, BACKEND_SUCCESS), calls(SIM_NUM_CALLS, 0),
    frame_width(0), frame_height(0), frame_coding(FWCAM_PIXEL_INVALID),
    frames_acquired(0), frame_valid(false), use_override(false),
    override_width(0), override_height(0), error_text("")
{
    if (!cameras)
        cameras = make_simulated_bus(std::vector<Simulated_camera>());
}

fwcam::simulated_backend::~simulated_backend()
{
    release();
}

fwcam::Backend_status fwcam::simulated_backend::count_call(const Sim_call call)
{
    ++calls[call];
    const Backend_status status = injected[call];
    if (status != BACKEND_SUCCESS)
    {
        std::ostringstream msg;
        msg << "Injected " << status_name(status) << " failure.";
        return fail(status, msg.str());
    }
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::fail(const Backend_status status, const std::string &message)
{
    error_text = message;
    return status;
}

fwcam::Simulated_camera *fwcam::simulated_backend::current()
{
    if (selected < 0 || selected >= static_cast<int>(cameras->size()))
        return NULL;
    return &(*cameras)[selected];
}

fwcam::Backend_status fwcam::simulated_backend::enumerate(int &num_cameras)
{
    const Backend_status status = count_call(SIM_ENUMERATE);
    if (status != BACKEND_SUCCESS)
        return status;
    num_cameras = static_cast<int>(cameras->size());
    return BACKEND_SUCCESS;
}

std::string fwcam::simulated_backend::describe(const int index)
{
    if (index < 0 || index >= static_cast<int>(cameras->size()))
        return "";
    return (*cameras)[index].description;
}

fwcam::Backend_status fwcam::simulated_backend::select(const int index)
{
    const Backend_status status = count_call(SIM_SELECT);
    if (status != BACKEND_SUCCESS)
        return status;
    if (index < 0 || index >= static_cast<int>(cameras->size()))
        return fail(BACKEND_OUT_OF_RANGE, "No simulated camera with that index.");
    if (initialized)
        release();
    selected = index;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::init()
{
    const Backend_status status = count_call(SIM_INIT);
    if (status != BACKEND_SUCCESS)
        return status;
    Simulated_camera *cam = current();
    if (cam == NULL)
        return fail(BACKEND_NOT_INITIALIZED, "No simulated camera selected.");
    initialized = true;
    pending_group = cam->group;
    frame_valid = false;
    return BACKEND_SUCCESS;
}

void fwcam::simulated_backend::release()
{
    Simulated_camera *cam = current();
    if (initialized && cam != NULL)
        cam->acquiring = false;
    initialized = false;
    frame_valid = false;
}

bool fwcam::simulated_backend::is_acquiring()
{
    const Simulated_camera *cam = current();
    return initialized && cam != NULL && cam->acquiring;
}

fwcam::Backend_status fwcam::simulated_backend::start_acquisition()
{
    const Backend_status status = count_call(SIM_START);
    if (status != BACKEND_SUCCESS)
        return status;
    if (!initialized)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated camera is not initialized.");
    current()->acquiring = true;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::stop_acquisition()
{
    const Backend_status status = count_call(SIM_STOP);
    if (status != BACKEND_SUCCESS)
        return status;
    if (!initialized)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated camera is not initialized.");
    current()->acquiring = false;
    return BACKEND_SUCCESS;
}

bool fwcam::simulated_backend::has_mode(const int group, const int mode)
{
    const Simulated_camera *cam = current();
    if (!initialized || cam == NULL)
        return false;
    return cam->modes.find(std::make_pair(group, mode)) != cam->modes.end();
}

bool fwcam::simulated_backend::has_rate(const int group, const int mode, const int rate_index)
{
    const Simulated_camera *cam = current();
    if (!initialized || cam == NULL)
        return false;
    std::map<std::pair<int, int>, std::vector<int> >::const_iterator found =
            cam->modes.find(std::make_pair(group, mode));
    if (found == cam->modes.end())
        return false;
    return std::find(found->second.begin(), found->second.end(), rate_index) != found->second.end();
}

int fwcam::simulated_backend::get_format()
{
    const Simulated_camera *cam = current();
    return (initialized && cam != NULL) ? cam->group : -1;
}

int fwcam::simulated_backend::get_mode()
{
    const Simulated_camera *cam = current();
    return (initialized && cam != NULL) ? cam->mode : -1;
}

int fwcam::simulated_backend::get_frame_rate()
{
    const Simulated_camera *cam = current();
    return (initialized && cam != NULL) ? cam->rate_index : -1;
}

fwcam::Backend_status fwcam::simulated_backend::set_format(const int group)
{
    const Backend_status status = count_call(SIM_SET_FORMAT);
    if (status != BACKEND_SUCCESS)
        return status;
    if (!initialized)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated camera is not initialized.");
    if (group < 0 || group > 2)
        return fail(BACKEND_OUT_OF_RANGE, "Format group out of range.");
    pending_group = group;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::set_mode(const int mode)
{
    const Backend_status status = count_call(SIM_SET_MODE);
    if (status != BACKEND_SUCCESS)
        return status;
    if (!initialized)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated camera is not initialized.");
    Simulated_camera *cam = current();
    if (cam->acquiring)
        return fail(BACKEND_BUSY, "Cannot change mode while acquiring.");
    std::map<std::pair<int, int>, std::vector<int> >::const_iterator found =
            cam->modes.find(std::make_pair(pending_group, mode));
    if (found == cam->modes.end())
        return fail(BACKEND_UNSUPPORTED, "Mode not supported by simulated camera.");

    cam->group = pending_group;
    cam->mode = mode;
    /* Like real cameras, fall back to a supported rate of the new mode: */
    const std::vector<int> &rates = found->second;
    if (std::find(rates.begin(), rates.end(), cam->rate_index) == rates.end())
        cam->rate_index = rates.empty() ? -1 : rates.back();
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::set_frame_rate(const int rate_index)
{
    const Backend_status status = count_call(SIM_SET_FRAME_RATE);
    if (status != BACKEND_SUCCESS)
        return status;
    if (!initialized)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated camera is not initialized.");
    Simulated_camera *cam = current();
    if (cam->acquiring)
        return fail(BACKEND_BUSY, "Cannot change frame rate while acquiring.");
    if (!has_rate(cam->group, cam->mode, rate_index))
        return fail(BACKEND_UNSUPPORTED, "Frame rate not supported in the current mode.");
    cam->rate_index = rate_index;
    return BACKEND_SUCCESS;
}

/* Lays out the test pattern the way the camera would transmit it.
   Widths in the catalog are multiples of 4, as YUV 4:1:1 needs. */
void fwcam::simulated_backend::generate_frame(const Format_descriptor &descriptor)
{
    const int width = descriptor.width;
    const int height = descriptor.height;
    const long n = frames_acquired;
    const size_t num_pixels = static_cast<size_t>(width)*height;
    frame_buffer.assign(num_pixels*pixel_depth(descriptor.coding)/8, 0);

    uint8_t *out = frame_buffer.empty() ? NULL : &frame_buffer[0];
    for (int y = 0; y < height; ++y)
    {
        for (int x = 0; x < width; ++x)
        {
            const uint8_t luma = static_cast<uint8_t>(simulated_mono_value(x, y, n, FWCAM_PIXEL_MONO8));
            switch (descriptor.coding)
            {
                case FWCAM_PIXEL_MONO8:
                    *out++ = luma;
                    break;
                case FWCAM_PIXEL_MONO16:
                {
                    const uint16_t value = simulated_mono_value(x, y, n, FWCAM_PIXEL_MONO16);
                    *out++ = static_cast<uint8_t>(value >> 8);
                    *out++ = static_cast<uint8_t>(value & 0xff);
                    break;
                }
                case FWCAM_PIXEL_RGB8:
                    *out++ = static_cast<uint8_t>(x & 0xff);
                    *out++ = static_cast<uint8_t>(y & 0xff);
                    *out++ = static_cast<uint8_t>(n & 0xff);
                    break;
                case FWCAM_PIXEL_YUV444:  /* U Y V */
                    *out++ = 128;
                    *out++ = luma;
                    *out++ = 128;
                    break;
                case FWCAM_PIXEL_YUV422:  /* U Y0 V Y1 */
                    if (x % 2 == 0) *out++ = 128;
                    *out++ = luma;
                    if (x % 2 == 0) *out++ = 128;
                    break;
                case FWCAM_PIXEL_YUV411:  /* U Y0 Y1 V Y2 Y3 */
                    if (x % 4 == 0 || x % 4 == 2) *out++ = 128;
                    *out++ = luma;
                    break;
                default:
                    break;
            }
        }
    }

    frame_width = width;
    frame_height = height;
    frame_coding = descriptor.coding;
}

fwcam::Backend_status fwcam::simulated_backend::acquire_frame()
{
    const Backend_status status = count_call(SIM_ACQUIRE);
    if (status != BACKEND_SUCCESS)
    {
        frame_valid = false;
        return status;
    }
    if (!initialized)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated camera is not initialized.");
    Simulated_camera *cam = current();
    if (!cam->acquiring)
        return fail(BACKEND_NOT_INITIALIZED, "Simulated capture is not running.");

    if (use_override)
    {
        frame_buffer = override_bytes;
        frame_width = override_width;
        frame_height = override_height;
        frame_coding = FWCAM_PIXEL_INVALID;
    }
    else
    {
        Format_descriptor descriptor;
        if (!lookup_format(cam->group, cam->mode, descriptor))
            return fail(BACKEND_ERROR, "Simulated camera is in an unknown mode.");
        generate_frame(descriptor);
    }
    ++frames_acquired;
    frame_valid = true;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::get_raw_buffer(const uint8_t **buf_ptr, size_t &length)
{
    if (buf_ptr == NULL)
        return fail(BACKEND_ERROR, "Null buffer pointer.");
    if (!frame_valid)
        return fail(BACKEND_NOT_INITIALIZED, "No frame acquired.");
    *buf_ptr = frame_buffer.empty() ? NULL : &frame_buffer[0];
    length = frame_buffer.size();
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::get_dimensions(int &width, int &height)
{
    if (frame_valid)
    {
        width = frame_width;
        height = frame_height;
        return BACKEND_SUCCESS;
    }

    Format_descriptor descriptor;
    if (!initialized || !lookup_format(get_format(), get_mode(), descriptor))
        return fail(BACKEND_NOT_INITIALIZED, "No frame size known.");
    width = descriptor.width;
    height = descriptor.height;
    return BACKEND_SUCCESS;
}

fwcam::Backend_status fwcam::simulated_backend::get_rgb(uint8_t *buffer, const size_t size)
{
    const Backend_status status = count_call(SIM_GET_RGB);
    if (status != BACKEND_SUCCESS)
        return status;
    if (buffer == NULL)
        return fail(BACKEND_ERROR, "Null RGB buffer.");
    if (!frame_valid)
        return fail(BACKEND_NOT_INITIALIZED, "No frame acquired.");
    const size_t num_pixels = static_cast<size_t>(frame_width)*frame_height;
    if (size < num_pixels*3)
        return fail(BACKEND_OUT_OF_RANGE, "RGB buffer too small.");

    Fwcam_pixel coding = frame_coding;
    if (coding == FWCAM_PIXEL_INVALID)
    {
        /* Overridden frames carry no coding, so infer a plain one: */
        if (frame_buffer.size() == num_pixels)
            coding = FWCAM_PIXEL_MONO8;
        else if (frame_buffer.size() == num_pixels*3)
            coding = FWCAM_PIXEL_RGB8;
        else
            return fail(BACKEND_UNSUPPORTED, "Cannot convert frame of this size to RGB.");
    }

    const uint8_t *in = frame_buffer.empty() ? NULL : &frame_buffer[0];
    uint8_t *out = buffer;
    switch (coding)
    {
        case FWCAM_PIXEL_MONO8:
            for (size_t p = 0; p < num_pixels; ++p, out += 3)
                gray2rgb(in[p], out);
            break;
        case FWCAM_PIXEL_MONO16:
            for (size_t p = 0; p < num_pixels; ++p, out += 3)
                gray2rgb(in[2*p], out);  /* High byte.*/
            break;
        case FWCAM_PIXEL_RGB8:
            std::copy(in, in + num_pixels*3, out);
            break;
        case FWCAM_PIXEL_YUV444:
            for (size_t p = 0; p < num_pixels; ++p, out += 3)
                yuv2rgb(in[3*p + 1], in[3*p], in[3*p + 2], out);
            break;
        case FWCAM_PIXEL_YUV422:
            for (size_t p = 0; p + 1 < num_pixels; p += 2, in += 4)
            {
                yuv2rgb(in[1], in[0], in[2], out);  out += 3;
                yuv2rgb(in[3], in[0], in[2], out);  out += 3;
            }
            break;
        case FWCAM_PIXEL_YUV411:
            for (size_t p = 0; p + 3 < num_pixels; p += 4, in += 6)
            {
                yuv2rgb(in[1], in[0], in[3], out);  out += 3;
                yuv2rgb(in[2], in[0], in[3], out);  out += 3;
                yuv2rgb(in[4], in[0], in[3], out);  out += 3;
                yuv2rgb(in[5], in[0], in[3], out);  out += 3;
            }
            break;
        default:
            return fail(BACKEND_UNSUPPORTED, "Cannot convert this coding to RGB.");
    }
    return BACKEND_SUCCESS;
}

std::string fwcam::simulated_backend::last_error() const
{
    return error_text;
}

void fwcam::simulated_backend::inject_failure(const Sim_call call, const Backend_status status)
{
    injected[call] = status;
}

int fwcam::simulated_backend::call_count(const Sim_call call) const
{
    return calls[call];
}

void fwcam::simulated_backend::override_frame(const std::vector<uint8_t> &bytes, const int width, const int height)
{
    override_bytes = bytes;
    override_width = width;
    override_height = height;
    use_override = true;
}

long fwcam::simulated_backend::frame_number() const
{
    return frames_acquired - 1;
}

bool fwcam::simulated_backend::is_initialized() const
{
    return initialized;
}
