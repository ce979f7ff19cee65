#ifndef FWCAM_MACROS_HPP
#define FWCAM_MACROS_HPP
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


    Title: Macro header for Fwcam modules

    Description:
    This header file provides some macros for printing debugging
    information and for error status returns to make the code more
    readable and maintainable.

***********************************************************************/

#include <iostream>
#include <fwcam/fwcam_error.hpp>

/* Print debugging error message: */
#ifdef FWCAM_DEBUG
#define DPRINTF(m) std::cerr << "In " << __FILE__ << " line "<< __LINE__ << " function " << __func__ << ": " << m << std::endl;
#else
#define DPRINTF(m) std::cerr << m << std::endl;
#endif

/* If consistently used, it should be possible to change these return
   codes without breaking anything: */
const int FWCAM_SUCCESS = 1;  /* true */
const int FWCAM_FAILURE = 0;  /* false */

/* Function error status returns, for readability and
   maintainability: */
#define ERROR_IF_NULL(p) \
    if ((p)==NULL) {DPRINTF("Null pointer."); return(FWCAM_FAILURE);}
#define ERROR_IF_FWCAM_FAIL(r) \
    if ((r)!=FWCAM_SUCCESS) \
      {DPRINTF("Fwcam function call failed."); \
       return(FWCAM_FAILURE);}

/* Throwing counterparts for the session layer, which reports failures
   as fwcam::failure exceptions: */
#define THROW_IF_BACKEND_FAIL(b, r, what) \
    { \
        const ::fwcam::Backend_status status_ = (r); \
        if (status_ != ::fwcam::BACKEND_SUCCESS) \
            throw ::fwcam::failure(::fwcam::convert_status2error(status_), \
                                   std::string(what) + ": " + (b)->last_error()); \
    }
#define THROW_IF_CLOSED(s) \
    if ((s) == ::fwcam::FWCAM_UNINITIALIZED) \
        throw ::fwcam::failure(::fwcam::FWCAM_ERROR_INIT_FAILED, "Camera session is not open.");

#define CONFFILE_EXTENSION      ".conf"
#define ENVIRONMENT_VAR_CONF    "FWCAM_CONF"

#endif /* ndef FWCAM_MACROS_HPP */
