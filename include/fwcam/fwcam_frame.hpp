#ifndef FWCAM_FRAME_HPP
#define FWCAM_FRAME_HPP
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


    Title: Header for the frame decoder

    Description:
    Turns a raw frame buffer, as handed out by a camera backend, into an
    owned image of 8-bit or 16-bit unsigned pixels.  All 16-bit camera
    images arrive in network (big-endian) byte order and are converted
    to host order here.

***********************************************************************/

#include <cstddef>
#include <cinttypes>
#include <vector>

namespace fwcam
{
    /* A view of a backend frame buffer.  The bytes belong to the
       backend and are only valid until its next acquisition call. */
    struct Raw_frame
    {
        const uint8_t *bytes;
        size_t length;
        int width;
        int height;
    };

    enum Fwcam_dtype
    {
        FWCAM_DTYPE_UINT8,
        FWCAM_DTYPE_UINT16
    };

    /* A decoded image of shape (height, width) or, when channels is 3,
       (height, width, 3) with interleaved channels.  Only the pixel
       vector matching type is filled. */
    struct Decoded_image
    {
        int height;
        int width;
        int channels;
        Fwcam_dtype type;
        std::vector<uint8_t> pixels8;
        std::vector<uint16_t> pixels16;

        Decoded_image(): height(0), width(0), channels(1), type(FWCAM_DTYPE_UINT8) {};
        /* {height, width} or {height, width, 3}. */
        std::vector<size_t> shape() const;
        size_t num_elements() const;
        /* Element at row y, column x and channel c, widened to 16 bits. */
        uint16_t at(const int y, const int x, const int c = 0) const;
    };

    /* Infers the pixel layout from the buffer length: width*height bytes
       is 8-bit mono, twice that is big-endian 16-bit mono, three times
       that is interleaved 8-bit RGB.  The output is always a copy.
       Throws fwcam::failure with FWCAM_ERROR_UNKNOWN_LAYOUT if the
       length matches none of these, or FWCAM_ERROR_INVALID_INPUT for
       non-positive dimensions or a null buffer. */
    Decoded_image decode(const Raw_frame &raw);

    /* Copies a buffer the backend has already converted to interleaved
       8-bit RGB, with no layout inference.  The buffer must hold at
       least width*height*3 bytes, else fwcam::failure with
       FWCAM_ERROR_INVALID_INPUT is thrown. */
    Decoded_image decode_rgb(const Raw_frame &raw, const int width, const int height);
}

#endif /* FWCAM_FRAME_HPP */
