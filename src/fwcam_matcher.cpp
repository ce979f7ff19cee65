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


    Title: Format matcher

    Description:
    Resolves a terse format string such as "mono 800x600 8-bit" into a
    single supported catalog entry.  Every token must be a substring of
    the chosen name; the tokens may come in any order.

***********************************************************************/
#include <algorithm>
#include <cctype>
#include <iterator>
#include <sstream>         //stringstream
#include <fwcam/fwcam_error.hpp>
#include <fwcam/fwcam_formats.hpp>

namespace
{
    const std::string::size_type min_token_length = 3;

    std::string to_lower(const std::string &text)
    {
        std::string lowered(text);
        for (std::string::size_type c = 0; c < lowered.size(); ++c)
            lowered[c] = static_cast<char>(std::tolower(static_cast<unsigned char>(lowered[c])));
        return lowered;
    }

    std::vector<std::string> split_tokens(const std::string &user_string)
    {
        std::istringstream stream(to_lower(user_string));
        std::vector<std::string> tokens;
        std::string token;
        while (stream >> token)
            tokens.push_back(token);
        return tokens;
    }
}

fwcam::Format_descriptor fwcam::resolve_format(const std::string &user_string, const std::set<std::string> &supported_names)
{
    const std::vector<std::string> tokens = split_tokens(user_string);
    if (tokens.empty())
        throw failure(FWCAM_ERROR_INVALID_INPUT, "Empty format string.");

    for (const std::string &token : tokens)
    {
        if (token.size() < min_token_length)
            throw failure(FWCAM_ERROR_INVALID_INPUT,
                          "Format token '" + token + "' is too short to be unambiguous.");
    }

    std::set<std::string> candidates(supported_names);
    for (const std::string &token : tokens)
    {
        std::set<std::string> matching;
        for (const std::string &name : supported_names)
        {
            if (to_lower(name).find(token) != std::string::npos)
                matching.insert(name);
        }

        std::set<std::string> remaining;
        std::set_intersection(candidates.begin(), candidates.end(),
                              matching.begin(), matching.end(),
                              std::inserter(remaining, remaining.begin()));
        candidates.swap(remaining);
    }

    if (candidates.empty())
        throw failure(FWCAM_ERROR_UNSUPPORTED,
                      "No format matches all given tokens of '" + user_string + "'.");
    if (candidates.size() > 1)
    {
        std::string names;
        for (const std::string &name : candidates)
            names += (names.empty() ? "" : ", ") + name;
        throw failure(FWCAM_ERROR_AMBIGUOUS,
                      "'" + user_string + "' underspecifies a unique format: " + names + ".");
    }

    Format_descriptor descriptor;
    if (!lookup_format(*candidates.begin(), descriptor))
        throw failure(FWCAM_ERROR_NOT_FOUND,
                      "'" + *candidates.begin() + "' is not a catalog format.");
    return descriptor;
}
