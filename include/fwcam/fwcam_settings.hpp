#ifndef FWCAM_SETTINGS_HPP
#define FWCAM_SETTINGS_HPP
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


    Title: Header for session settings

    Description:
    Default settings applied when a camera session is opened, and their
    configuration files.  A configuration file holds one setting per
    line: a tag and its value separated by whitespace.  The tags are the
    names of the members of Fwcam_settings and may be abbreviated as
    long as no ambiguity results.  Empty lines, lines starting with the
    '#' character and unrecognized tags are ignored.

***********************************************************************/

#include <iostream>
#include <string>
#include <fwcam/fwcam_macros.hpp>

namespace fwcam
{
    /* Type for holding session settings:

       format:              Format string applied at open, resolved like
                            camera::set_format(const std::string &).

       frame_rate:          Frames per second applied at open; the nearest
                            supported rate of the format is used.

       settle_delay:        Milliseconds to wait after starting acquisition
                            before the first frame is valid.

       capture_timeout:     Milliseconds a capture may wait for a frame
                            before failing with a timeout.

       num_frame_buffers:   The number of frames to buffer on the bus side.
                            Minimum 2.
    */
    struct Fwcam_settings
    {
        std::string format;
        double frame_rate;
        int settle_delay;
        int capture_timeout;
        int num_frame_buffers;
        Fwcam_settings(): format("640x480 Mono 8-bit"), frame_rate(30.0), settle_delay(100),
                          capture_timeout(2000), num_frame_buffers(8) {};
    };

    /* Reads settings from infile, changing only the members present in
       the file.  Returns FWCAM_SUCCESS on success or FWCAM_FAILURE on an
       ambiguous tag or an invalid value, in which case the lines before
       the offending one have been applied. */
    int read_settings_from_file(std::istream &infile, Fwcam_settings &set);

    /* Writes settings in the format understood by
       read_settings_from_file().  Returns FWCAM_SUCCESS on success or
       FWCAM_FAILURE on failure. */
    int write_settings_to_file(std::ostream &outfile, const Fwcam_settings &set);

    /* Looks for a configuration file for the camera with the given
       description.  The candidate file names are the description and
       then the camera name (see camera_name()), each with a ".conf"
       extension, first in the current working directory and then in the
       directory given by the FWCAM_CONF environment variable.  Returns
       FWCAM_SUCCESS and sets conffilename if a file was found, else
       FWCAM_FAILURE. */
    int find_settings_file(const std::string &description, std::string &conffilename);

    /* Fills set with the built-in defaults overridden by the camera's
       configuration file, if there is one.  Returns FWCAM_FAILURE only if
       a file was found and could not be read. */
    int load_settings(const std::string &description, Fwcam_settings &set);

    /* The description without its trailing serial word, such as
       "Vendor Model" for "Vendor Model 00b09d0100a0b1c2". */
    std::string camera_name(const std::string &description);
}

#endif /* FWCAM_SETTINGS_HPP */
