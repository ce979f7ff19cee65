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


    Title: Frame decoder

***********************************************************************/
#include <algorithm>
#include <netinet/in.h>     //ntohs on Linux
#include <sstream>
#include <fwcam/fwcam_error.hpp>
#include <fwcam/fwcam_frame.hpp>

namespace
{
    void check_dimensions(const fwcam::Raw_frame &raw, const int width, const int height)
    {
        if (width <= 0 || height <= 0)
        {
            std::ostringstream msg;
            msg << "Invalid frame dimensions " << width << "x" << height << ".";
            throw fwcam::failure(fwcam::FWCAM_ERROR_INVALID_INPUT, msg.str());
        }
        if (raw.bytes == NULL && raw.length > 0)
            throw fwcam::failure(fwcam::FWCAM_ERROR_INVALID_INPUT, "Null frame buffer.");
    }

    fwcam::Decoded_image copy_bytes(const fwcam::Raw_frame &raw, const int width, const int height,
                                    const int channels)
    {
        fwcam::Decoded_image image;
        image.width = width;
        image.height = height;
        image.channels = channels;
        image.type = fwcam::FWCAM_DTYPE_UINT8;
        const size_t num_bytes = static_cast<size_t>(width)*height*channels;
        image.pixels8.assign(raw.bytes, raw.bytes + num_bytes);
        return image;
    }
}

std::vector<size_t> fwcam::Decoded_image::shape() const
{
    std::vector<size_t> dims;
    dims.push_back(static_cast<size_t>(height));
    dims.push_back(static_cast<size_t>(width));
    if (channels > 1)
        dims.push_back(static_cast<size_t>(channels));
    return dims;
}

size_t fwcam::Decoded_image::num_elements() const
{
    return static_cast<size_t>(height)*width*channels;
}

uint16_t fwcam::Decoded_image::at(const int y, const int x, const int c) const
{
    const size_t offset = (static_cast<size_t>(y)*width + x)*channels + c;
    if (type == FWCAM_DTYPE_UINT16)
        return pixels16.at(offset);
    return pixels8.at(offset);
}

fwcam::Decoded_image fwcam::decode(const Raw_frame &raw)
{
    check_dimensions(raw, raw.width, raw.height);
    const size_t num_pixels = static_cast<size_t>(raw.width)*raw.height;

    if (raw.length == num_pixels)
        return copy_bytes(raw, raw.width, raw.height, 1);

    if (raw.length == 2*num_pixels)
    {
        Decoded_image image;
        image.width = raw.width;
        image.height = raw.height;
        image.channels = 1;
        image.type = FWCAM_DTYPE_UINT16;
        image.pixels16.resize(num_pixels);
        /* Byte pairs are big-endian; assemble them into host order
           without assuming the alignment of the backend buffer: */
        for (size_t p = 0; p < num_pixels; ++p)
        {
            uint16_t network_value;
            std::copy(raw.bytes + 2*p, raw.bytes + 2*p + 2,
                      reinterpret_cast<uint8_t *>(&network_value));
            image.pixels16[p] = ntohs(network_value);
        }
        return image;
    }

    if (raw.length == 3*num_pixels)
        return copy_bytes(raw, raw.width, raw.height, 3);

    std::ostringstream msg;
    msg << "Cannot infer pixel layout of a " << raw.length << "-byte buffer for a "
        << raw.width << "x" << raw.height << " frame.";
    throw failure(FWCAM_ERROR_UNKNOWN_LAYOUT, msg.str());
}

fwcam::Decoded_image fwcam::decode_rgb(const Raw_frame &raw, const int width, const int height)
{
    check_dimensions(raw, width, height);
    const size_t num_bytes = static_cast<size_t>(width)*height*3;
    if (raw.bytes == NULL || raw.length < num_bytes)
    {
        std::ostringstream msg;
        msg << "RGB buffer of " << raw.length << " bytes is too small for a "
            << width << "x" << height << " frame.";
        throw failure(FWCAM_ERROR_INVALID_INPUT, msg.str());
    }
    return copy_bytes(raw, width, height, 3);
}
