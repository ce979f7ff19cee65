#ifndef FWCAM_FORMATS_HPP
#define FWCAM_FORMATS_HPP
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


    Title: Header for the format catalog and format matcher

    Description:
    The IEEE 1394 IIDC digital camera (DCAM) specification gives camera
    manufacturers a choice of several predefined resolutions called
    "formats", each with up to eight "modes":

    Format 0 is for 160x120 up to 640x480 (VGA).
    Format 1 is for 800x600 up to 1024x768 (SVGA).
    Format 2 is for 1280x960 up to 1600x1200 (XVGA).

    This module holds the fixed catalog of those formats under
    human-readable names, the frame rate ladder, and the matcher that
    turns a loosely written format string into exactly one catalog
    entry.

***********************************************************************/

#include <set>
#include <string>
#include <vector>
#include <fwcam/fwcam_error.hpp>

namespace fwcam
{
    /* Type for the pixel encoding of a format.  The 16-bit codings are
       transmitted in network (big-endian) byte order.
    */
    enum Fwcam_pixel
    {
        FWCAM_PIXEL_INVALID,
        FWCAM_PIXEL_MONO8,     /*  8 bits average.*/
        FWCAM_PIXEL_YUV411,    /* 12 bits average.*/
        FWCAM_PIXEL_YUV422,    /* 16 bits average.*/
        FWCAM_PIXEL_YUV444,    /* 24 bits average.*/
        FWCAM_PIXEL_RGB8,      /* 24 bits average.*/
        FWCAM_PIXEL_MONO16     /* 16 bits average.*/
    };

    /* One catalog entry.  name is unique in the catalog, and so is the
       (group, mode) pair, where group is the IIDC format number. */
    struct Format_descriptor
    {
        std::string name;
        int group;
        int mode;
        int width;
        int height;
        Fwcam_pixel coding;
    };

    bool operator==(const Format_descriptor &a, const Format_descriptor &b);
    bool operator!=(const Format_descriptor &a, const Format_descriptor &b);

    /* A step of the frame rate ladder.  index is the backend selector,
       0 for 1.875 fps up to 7 for 240 fps. */
    struct Frame_rate
    {
        int index;
        double fps;
    };

    bool operator==(const Frame_rate &a, const Frame_rate &b);
    bool operator!=(const Frame_rate &a, const Frame_rate &b);

    /* Looks up a catalog entry by its exact name.  Returns false if not
       found, leaving descriptor unchanged. */
    bool lookup_format(const std::string &name, Format_descriptor &descriptor);
    /* Looks up a catalog entry by format group and mode. */
    bool lookup_format(const int group, const int mode, Format_descriptor &descriptor);
    /* The whole catalog in (group, mode) order. */
    const std::vector<Format_descriptor> &all_formats();

    /* The frame rate ladder in index order. */
    const std::vector<Frame_rate> &rate_table();
    bool lookup_frame_rate(const int index, Frame_rate &rate);
    /* Exact match on the fps value (to within rounding of the ladder's
       binary fractions). */
    bool lookup_frame_rate(const double fps, Frame_rate &rate);
    /* Picks the candidate nearest to fps on the logarithmic ladder.  A
       non-positive fps asks for the slowest rate.  Returns false if
       candidates is empty. */
    bool nearest_frame_rate(const double fps, const std::vector<Frame_rate> &candidates, Frame_rate &rate);

    /* Bits per pixel of a coding on average, or 0 for
       FWCAM_PIXEL_INVALID. */
    int pixel_depth(const Fwcam_pixel coding);

    /* Resolves user_string into the single catalog entry among
       supported_names that contains every whitespace-separated token of
       user_string, case-insensitively and in any order.  Throws
       fwcam::failure with FWCAM_ERROR_INVALID_INPUT if there is no token
       or any token is shorter than 3 characters,
       FWCAM_ERROR_UNSUPPORTED if no supported name matches all tokens,
       FWCAM_ERROR_AMBIGUOUS if more than one does, and
       FWCAM_ERROR_NOT_FOUND if the single match is not a catalog name. */
    Format_descriptor resolve_format(const std::string &user_string, const std::set<std::string> &supported_names);
}

#endif /* FWCAM_FORMATS_HPP */
