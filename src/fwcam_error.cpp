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


    Title: Error codes for Fwcam

***********************************************************************/
#include <fwcam/fwcam_error.hpp>

fwcam::failure::failure(const Fwcam_error code, const std::string &message):
    std::runtime_error(std::string(error_name(code)) + ": " + message),
    error_code(code)
{
}

fwcam::Fwcam_error fwcam::failure::code() const
{
    return error_code;
}

fwcam::Fwcam_error fwcam::convert_status2error(const Backend_status status)
{
    switch (status)
    {
        case BACKEND_UNSUPPORTED:
            return FWCAM_ERROR_UNSUPPORTED;
        case BACKEND_NOT_INITIALIZED:
            return FWCAM_ERROR_INIT_FAILED;
        case BACKEND_INVALID_SETTINGS:
            return FWCAM_ERROR_INVALID_INPUT;
        case BACKEND_BUSY:
            return FWCAM_ERROR_BUSY;
        case BACKEND_INSUFFICIENT_RESOURCES:
            return FWCAM_ERROR_INSUFFICIENT_RESOURCES;
        case BACKEND_OUT_OF_RANGE:
            return FWCAM_ERROR_OUT_OF_RANGE;
        case BACKEND_TIMEOUT:
            return FWCAM_ERROR_TIMEOUT;
        case BACKEND_ERROR:
        case BACKEND_SUCCESS:
        default:
            return FWCAM_ERROR_GENERIC_BACKEND_ERROR;
    }
}

const char *fwcam::error_name(const Fwcam_error code)
{
    switch (code)
    {
        case FWCAM_ERROR_NOT_FOUND:              return "NotFound";
        case FWCAM_ERROR_INIT_FAILED:            return "InitFailed";
        case FWCAM_ERROR_UNSUPPORTED:            return "Unsupported";
        case FWCAM_ERROR_AMBIGUOUS:              return "Ambiguous";
        case FWCAM_ERROR_INVALID_INPUT:          return "InvalidInput";
        case FWCAM_ERROR_BUSY:                   return "Busy";
        case FWCAM_ERROR_INSUFFICIENT_RESOURCES: return "InsufficientResources";
        case FWCAM_ERROR_OUT_OF_RANGE:           return "OutOfRange";
        case FWCAM_ERROR_TIMEOUT:                return "Timeout";
        case FWCAM_ERROR_UNKNOWN_LAYOUT:         return "UnknownLayout";
        case FWCAM_ERROR_GENERIC_BACKEND_ERROR:  return "GenericBackendError";
    }
    return "Unknown";
}

const char *fwcam::status_name(const Backend_status status)
{
    switch (status)
    {
        case BACKEND_SUCCESS:                return "success";
        case BACKEND_ERROR:                  return "generic error";
        case BACKEND_UNSUPPORTED:            return "unsupported feature";
        case BACKEND_NOT_INITIALIZED:        return "not initialized";
        case BACKEND_INVALID_SETTINGS:       return "invalid settings";
        case BACKEND_BUSY:                   return "busy";
        case BACKEND_INSUFFICIENT_RESOURCES: return "insufficient resources";
        case BACKEND_OUT_OF_RANGE:           return "out-of-range parameter";
        case BACKEND_TIMEOUT:                return "frame timeout";
    }
    return "unknown status";
}
