#ifndef FWCAMBUS_HPP
#define FWCAMBUS_HPP
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


    Title: Header for fwcambus.cpp

    Description:
    This Fwcam bus module is about finding all visible cameras and
    handing out sessions for them.  Each session gets a backend of its
    own from the factory given to the bus, and the settings found in the
    camera's configuration file.  Sessions are cached by camera index
    and identity, so asking twice for the same camera gives the same
    session.  Functions to control individual cameras through their
    sessions are defined in the Fwcam main module.

    A bus is not reentrant: use it from one thread, then hand the
    sessions out, one per thread.

***********************************************************************/

#include <memory>
#include <string>
#include <vector>
#include <fwcam/fwcam.hpp>

namespace fwcam
{
    typedef std::shared_ptr<camera> Camera_ptr;

    class fwcambus
    {
        public:
            explicit fwcambus(const Backend_factory &factory);
            /* Closes all sessions handed out. */
            ~fwcambus();

            /* Enumerates the visible cameras.  Returns FWCAM_SUCCESS on
               success, also if no camera is found, or FWCAM_FAILURE if the
               bus is already created or the backend cannot enumerate. */
            int create();
            /* Returns true if create() succeeded and destroy() has not been
               called since. */
            bool exists() const;
            /* Enumerates again.  Sessions of cameras whose identity at their
               index has changed are closed and dropped.  Returns
               FWCAM_SUCCESS on success or FWCAM_FAILURE on failure. */
            int reset();
            /* Closes all sessions and forgets the enumeration. */
            int destroy();

            int get_number_cameras() const;
            /* The backend description of camera index, or empty if there is
               no such camera. */
            std::string get_description(const int index) const;
            /* Returns the open session for camera index, creating the bus
               first if needed.  Throws fwcam::failure with
               FWCAM_ERROR_NOT_FOUND if there is no such camera, and
               whatever camera::open() throws. */
            Camera_ptr get_camera(const int index);
            /* Sessions for all cameras, in index order. */
            std::vector<Camera_ptr> get_cameras();

        private:
            Backend_factory backend_factory;
            Backend_ptr probe;
            bool created;
            std::vector<std::string> descriptions;
            std::vector<Camera_ptr> sessions;

            int enumerate(std::vector<std::string> &found);
            fwcambus(const fwcambus &cb);
            fwcambus& operator=(const fwcambus &cb);
    };
}

#endif /* FWCAMBUS_HPP */
