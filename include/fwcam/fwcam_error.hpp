#ifndef FWCAM_ERROR_HPP
#define FWCAM_ERROR_HPP
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

    Description:
    Backend status codes, the error taxonomy they map to, and the
    exception type carrying both a taxonomy code and the original
    message text to the caller.

***********************************************************************/

#include <stdexcept>
#include <string>

namespace fwcam
{
    /* Status returned by every status-returning call of a camera
       backend.  The values are a fixed taxonomy that each backend maps
       its native codes onto: */
    enum Backend_status
    {
        BACKEND_SUCCESS,
        BACKEND_ERROR,                  /* Generic error.*/
        BACKEND_UNSUPPORTED,            /* Unsupported feature or mode.*/
        BACKEND_NOT_INITIALIZED,
        BACKEND_INVALID_SETTINGS,
        BACKEND_BUSY,
        BACKEND_INSUFFICIENT_RESOURCES,
        BACKEND_OUT_OF_RANGE,           /* Out-of-range parameter.*/
        BACKEND_TIMEOUT                 /* Frame timeout.*/
    };

    /* Errors reported by Fwcam.  Backend statuses map 1:1 onto the
       backend-related entries; AMBIGUOUS, INVALID_INPUT and
       UNKNOWN_LAYOUT are also raised locally by the format matcher and
       the frame decoder. */
    enum Fwcam_error
    {
        FWCAM_ERROR_NOT_FOUND,
        FWCAM_ERROR_INIT_FAILED,
        FWCAM_ERROR_UNSUPPORTED,
        FWCAM_ERROR_AMBIGUOUS,
        FWCAM_ERROR_INVALID_INPUT,
        FWCAM_ERROR_BUSY,
        FWCAM_ERROR_INSUFFICIENT_RESOURCES,
        FWCAM_ERROR_OUT_OF_RANGE,
        FWCAM_ERROR_TIMEOUT,
        FWCAM_ERROR_UNKNOWN_LAYOUT,
        FWCAM_ERROR_GENERIC_BACKEND_ERROR
    };

    class failure : public std::runtime_error
    {
        public:
            failure(const Fwcam_error code, const std::string &message);
            Fwcam_error code() const;

        private:
            Fwcam_error error_code;
    };

    /* Maps a non-success backend status onto the error taxonomy.
       BACKEND_SUCCESS has no error and maps to
       FWCAM_ERROR_GENERIC_BACKEND_ERROR. */
    Fwcam_error convert_status2error(const Backend_status status);

    /* Short names such as "Timeout", used in messages and by tests: */
    const char *error_name(const Fwcam_error code);
    const char *status_name(const Backend_status status);
}

#endif /* FWCAM_ERROR_HPP */
