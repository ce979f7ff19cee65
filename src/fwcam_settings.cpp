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


    Title: Session settings

***********************************************************************/
#include <cstdlib>
#include <fstream>
#include <sstream>         //stringstream
#include <vector>
#include <fwcam/fwcam_settings.hpp>

namespace
{
    enum Settings_tag
    {
        TAG_FORMAT,
        TAG_FRAME_RATE,
        TAG_SETTLE_DELAY,
        TAG_CAPTURE_TIMEOUT,
        TAG_NUM_FRAME_BUFFERS,
        TAG_UNKNOWN,
        TAG_AMBIGUOUS
    };

    const char *const tag_names[] = {
        "format",
        "frame_rate",
        "settle_delay",
        "capture_timeout",
        "num_frame_buffers"
    };
    const int num_tags = sizeof(tag_names)/sizeof(tag_names[0]);

    /* An abbreviation matches every tag it is a prefix of; an exact
       match wins over longer tags: */
    Settings_tag match_tag(const std::string &abbreviation)
    {
        Settings_tag found = TAG_UNKNOWN;
        for (int t = 0; t < num_tags; ++t)
        {
            const std::string name(tag_names[t]);
            if (name == abbreviation)
                return static_cast<Settings_tag>(t);
            if (name.compare(0, abbreviation.size(), abbreviation) == 0)
            {
                if (found != TAG_UNKNOWN)
                    return TAG_AMBIGUOUS;
                found = static_cast<Settings_tag>(t);
            }
        }
        return found;
    }

    std::string trim(const std::string &text)
    {
        const std::string::size_type first = text.find_first_not_of(" \t\r");
        if (first == std::string::npos)
            return "";
        const std::string::size_type last = text.find_last_not_of(" \t\r");
        return text.substr(first, last - first + 1);
    }

    template <typename T>
    bool parse_value(const std::string &text, T &value)
    {
        std::istringstream stream(text);
        T parsed;
        if (!(stream >> parsed))
            return false;
        std::string rest;
        if (stream >> rest)
            return false;
        value = parsed;
        return true;
    }

    bool get_environment(const char *name, std::string &env)
    {
        const char *ret = std::getenv(name);
        if (ret) env = std::string(ret);
        return !!ret;
    }

    int open_named_conf_file(const std::string &path, const std::string &filename, std::string &conffilename)
    {
        conffilename = "";
        if (filename.empty())
            return FWCAM_FAILURE;
        if (path.length() > 0)
        {
            conffilename = path;
            if (conffilename[conffilename.length() - 1] != '/')
                conffilename += "/";
        }

        conffilename += filename + CONFFILE_EXTENSION;
        std::ifstream conffile(conffilename.c_str());
        if (conffile.good())
            return FWCAM_SUCCESS;

        conffilename = "";
        return FWCAM_FAILURE;
    }
}

int fwcam::read_settings_from_file(std::istream &infile, Fwcam_settings &set)
{
    std::string line;
    int line_number = 0;
    while (std::getline(infile, line))
    {
        ++line_number;
        const std::string content = trim(line);
        if (content.empty() || content[0] == '#')
            continue;

        const std::string::size_type tag_end = content.find_first_of(" \t");
        const std::string tag = content.substr(0, tag_end);
        const std::string value = tag_end == std::string::npos ? "" : trim(content.substr(tag_end));

        bool valid = true;
        double rate = 0.0;
        int count = 0;
        switch (match_tag(tag))
        {
            case TAG_FORMAT:
                valid = !value.empty();
                if (valid) set.format = value;
                break;
            case TAG_FRAME_RATE:
                valid = parse_value(value, rate) && rate > 0.0;
                if (valid) set.frame_rate = rate;
                break;
            case TAG_SETTLE_DELAY:
                valid = parse_value(value, count) && count >= 0;
                if (valid) set.settle_delay = count;
                break;
            case TAG_CAPTURE_TIMEOUT:
                valid = parse_value(value, count) && count > 0;
                if (valid) set.capture_timeout = count;
                break;
            case TAG_NUM_FRAME_BUFFERS:
                valid = parse_value(value, count) && count >= 2;
                if (valid) set.num_frame_buffers = count;
                break;
            case TAG_AMBIGUOUS:
                DPRINTF("Ambiguous settings tag '" << tag << "' on line " << line_number << ".");
                return FWCAM_FAILURE;
            case TAG_UNKNOWN:
            default:
                break;
        }

        if (!valid)
        {
            DPRINTF("Invalid value '" << value << "' for settings tag '" << tag
                    << "' on line " << line_number << ".");
            return FWCAM_FAILURE;
        }
    }
    return FWCAM_SUCCESS;
}

int fwcam::write_settings_to_file(std::ostream &outfile, const Fwcam_settings &set)
{
    outfile << "# Fwcam settings:\n"
            << "    format             " << set.format << "\n"
            << "    frame_rate         " << set.frame_rate << "\n"
            << "    settle_delay       " << set.settle_delay << "\n"
            << "    capture_timeout    " << set.capture_timeout << "\n"
            << "    num_frame_buffers  " << set.num_frame_buffers << "\n";
    outfile.flush();
    if (!outfile)
    {
        DPRINTF("Failed to write settings.");
        return FWCAM_FAILURE;
    }
    return FWCAM_SUCCESS;
}

int fwcam::find_settings_file(const std::string &description, std::string &conffilename)
{
    std::vector<std::string> candidates;
    candidates.push_back(description);
    const std::string name = camera_name(description);
    if (name != description)
        candidates.push_back(name);

    for (const std::string &candidate : candidates)
    {
        if (open_named_conf_file("", candidate, conffilename) == FWCAM_SUCCESS)
            return FWCAM_SUCCESS;
    }

    std::string env_directory("");
    if (get_environment(ENVIRONMENT_VAR_CONF, env_directory) && env_directory.size() > 0)
    {
        for (const std::string &candidate : candidates)
        {
            if (open_named_conf_file(env_directory, candidate, conffilename) == FWCAM_SUCCESS)
                return FWCAM_SUCCESS;
        }
    }

    return FWCAM_FAILURE;
}

int fwcam::load_settings(const std::string &description, Fwcam_settings &set)
{
    set = Fwcam_settings();
    std::string conffilename;
    if (find_settings_file(description, conffilename) != FWCAM_SUCCESS)
        return FWCAM_SUCCESS;  /* No file, built-in defaults.*/

    std::ifstream conffile(conffilename.c_str());
    if (!conffile)
    {
        DPRINTF("Could not open settings file " << conffilename << ".");
        return FWCAM_FAILURE;
    }
    if (read_settings_from_file(conffile, set) != FWCAM_SUCCESS)
    {
        DPRINTF("Could not read settings file " << conffilename << ".");
        return FWCAM_FAILURE;
    }
    return FWCAM_SUCCESS;
}

std::string fwcam::camera_name(const std::string &description)
{
    const std::string trimmed = trim(description);
    const std::string::size_type last_space = trimmed.find_last_of(' ');
    if (last_space == std::string::npos)
        return trimmed;
    return trim(trimmed.substr(0, last_space));
}
