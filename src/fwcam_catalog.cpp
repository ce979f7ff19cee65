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


    Title: Format catalog

    Description:
    The fixed-size IIDC formats 0 to 2 and the frame rate ladder.
    Format 6 (still images) and format 7 (scalable image sizes) have no
    fixed geometry and are not in the catalog.

***********************************************************************/
#include <cfloat>           //definition of DBL_MAX
#include <cmath>            //log function
#include <fwcam/fwcam_formats.hpp>

namespace
{
    const fwcam::Format_descriptor format_table[] = {
        {"160x120 YUV 4:4:4",     0, 0,  160,  120, fwcam::FWCAM_PIXEL_YUV444},
        {"320x240 YUV 4:2:2",     0, 1,  320,  240, fwcam::FWCAM_PIXEL_YUV422},
        {"640x480 YUV 4:1:1",     0, 2,  640,  480, fwcam::FWCAM_PIXEL_YUV411},
        {"640x480 YUV 4:2:2",     0, 3,  640,  480, fwcam::FWCAM_PIXEL_YUV422},
        {"640x480 RGB 24-bit",    0, 4,  640,  480, fwcam::FWCAM_PIXEL_RGB8},
        {"640x480 Mono 8-bit",    0, 5,  640,  480, fwcam::FWCAM_PIXEL_MONO8},
        {"640x480 Mono 16-bit",   0, 6,  640,  480, fwcam::FWCAM_PIXEL_MONO16},
        {"800x600 YUV 4:2:2",     1, 0,  800,  600, fwcam::FWCAM_PIXEL_YUV422},
        {"800x600 RGB 24-bit",    1, 1,  800,  600, fwcam::FWCAM_PIXEL_RGB8},
        {"800x600 Mono 8-bit",    1, 2,  800,  600, fwcam::FWCAM_PIXEL_MONO8},
        {"1024x768 YUV 4:2:2",    1, 3, 1024,  768, fwcam::FWCAM_PIXEL_YUV422},
        {"1024x768 RGB 24-bit",   1, 4, 1024,  768, fwcam::FWCAM_PIXEL_RGB8},
        {"1024x768 Mono 8-bit",   1, 5, 1024,  768, fwcam::FWCAM_PIXEL_MONO8},
        {"800x600 Mono 16-bit",   1, 6,  800,  600, fwcam::FWCAM_PIXEL_MONO16},
        {"1024x768 Mono 16-bit",  1, 7, 1024,  768, fwcam::FWCAM_PIXEL_MONO16},
        {"1280x960 YUV 4:2:2",    2, 0, 1280,  960, fwcam::FWCAM_PIXEL_YUV422},
        {"1280x960 RGB 24-bit",   2, 1, 1280,  960, fwcam::FWCAM_PIXEL_RGB8},
        {"1280x960 Mono 8-bit",   2, 2, 1280,  960, fwcam::FWCAM_PIXEL_MONO8},
        {"1600x1200 YUV 4:2:2",   2, 3, 1600, 1200, fwcam::FWCAM_PIXEL_YUV422},
        {"1600x1200 RGB 24-bit",  2, 4, 1600, 1200, fwcam::FWCAM_PIXEL_RGB8},
        {"1600x1200 Mono 8-bit",  2, 5, 1600, 1200, fwcam::FWCAM_PIXEL_MONO8},
        {"1280x960 Mono 16-bit",  2, 6, 1280,  960, fwcam::FWCAM_PIXEL_MONO16},
        {"1600x1200 Mono 16-bit", 2, 7, 1600, 1200, fwcam::FWCAM_PIXEL_MONO16}
    };

    /* Hardware-defined, doubling from one step to the next: */
    const fwcam::Frame_rate rate_ladder[] = {
        {0, 1.875}, {1, 3.75}, {2, 7.5}, {3, 15.0},
        {4, 30.0}, {5, 60.0}, {6, 120.0}, {7, 240.0}
    };
}

bool fwcam::operator==(const Format_descriptor &a, const Format_descriptor &b)
{
    return a.name == b.name && a.group == b.group && a.mode == b.mode &&
           a.width == b.width && a.height == b.height && a.coding == b.coding;
}

bool fwcam::operator!=(const Format_descriptor &a, const Format_descriptor &b)
{
    return !(a == b);
}

bool fwcam::operator==(const Frame_rate &a, const Frame_rate &b)
{
    return a.index == b.index && a.fps == b.fps;
}

bool fwcam::operator!=(const Frame_rate &a, const Frame_rate &b)
{
    return !(a == b);
}

const std::vector<fwcam::Format_descriptor> &fwcam::all_formats()
{
    static const std::vector<Format_descriptor> formats(
        format_table, format_table + sizeof(format_table)/sizeof(format_table[0]));
    return formats;
}

bool fwcam::lookup_format(const std::string &name, Format_descriptor &descriptor)
{
    for (const Format_descriptor &entry : all_formats())
    {
        if (entry.name == name)
        {
            descriptor = entry;
            return true;
        }
    }
    return false;
}

bool fwcam::lookup_format(const int group, const int mode, Format_descriptor &descriptor)
{
    for (const Format_descriptor &entry : all_formats())
    {
        if (entry.group == group && entry.mode == mode)
        {
            descriptor = entry;
            return true;
        }
    }
    return false;
}

const std::vector<fwcam::Frame_rate> &fwcam::rate_table()
{
    static const std::vector<Frame_rate> rates(
        rate_ladder, rate_ladder + sizeof(rate_ladder)/sizeof(rate_ladder[0]));
    return rates;
}

bool fwcam::lookup_frame_rate(const int index, Frame_rate &rate)
{
    if (index < 0 || index >= static_cast<int>(rate_table().size()))
        return false;
    rate = rate_table()[index];
    return true;
}

bool fwcam::lookup_frame_rate(const double fps, Frame_rate &rate)
{
    for (const Frame_rate &entry : rate_table())
    {
        if (std::fabs(entry.fps - fps) < 1e-6)
        {
            rate = entry;
            return true;
        }
    }
    return false;
}

bool fwcam::nearest_frame_rate(const double fps, const std::vector<Frame_rate> &candidates, Frame_rate &rate)
{
    const double min_fr = rate_ladder[0].fps;  /* 1.875.*/
    double best = DBL_MAX;
    bool found = false;

    const double target = fps > 0.0 ? fps : min_fr;
    const double log2f = std::log(target/min_fr)/std::log(2.0);  /* 1.875->0, 3.75->1, 7.5->2, etc.*/
    for (const Frame_rate &candidate : candidates)
    {
        const double diff = std::fabs(log2f - candidate.index);
        if (diff < best)
        {
            best = diff;
            rate = candidate;
            found = true;
        }
    }
    return found;
}

int fwcam::pixel_depth(const Fwcam_pixel coding)
{
    switch (coding)
    {
        case FWCAM_PIXEL_MONO8:
            return 8;
        case FWCAM_PIXEL_YUV411:
            return 12;
        case FWCAM_PIXEL_YUV422:
        case FWCAM_PIXEL_MONO16:
            return 16;
        case FWCAM_PIXEL_YUV444:
        case FWCAM_PIXEL_RGB8:
            return 24;
        default:
            return 0;
    }
}
