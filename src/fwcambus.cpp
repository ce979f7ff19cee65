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


    Title: Fwcam bus module

***********************************************************************/
#include <new>            //bad_alloc
#include <sstream>         //stringstream
#include <fwcam/fwcambus.hpp>

fwcam::fwcambus::fwcambus(const Backend_factory &factory):
    backend_factory(factory), created(false)
{
    if (!backend_factory)
        throw failure(FWCAM_ERROR_INIT_FAILED, "Fwcam bus needs a backend factory.");
}

fwcam::fwcambus::~fwcambus()
{
    destroy();
}

int fwcam::fwcambus::enumerate(std::vector<std::string> &found)
{
    try
    {
        if (!probe)
            probe = backend_factory(Fwcam_settings());
        ERROR_IF_NULL(probe.get());

        int num_cameras = 0;
        if (probe->enumerate(num_cameras) != BACKEND_SUCCESS)
        {
            DPRINTF("Error accessing cameras: " << probe->last_error());
            return FWCAM_FAILURE;
        }

        found.clear();
        for (int c = 0; c < num_cameras; ++c)
            found.push_back(probe->describe(c));
        return FWCAM_SUCCESS;
    }
    catch(std::bad_alloc &ba)
    {
        DPRINTF("Failed to allocate the probe backend");
        return FWCAM_FAILURE;
    }
}

int fwcam::fwcambus::create()
{
    /* Check whether the bus has not already been created: */
    if (exists())
    {
        DPRINTF("Fwcam bus already created");
        return FWCAM_FAILURE;
    }

    std::vector<std::string> found;
    ERROR_IF_FWCAM_FAIL(enumerate(found));
    if (found.empty())  /* Nothing wrong, just found no cameras.*/
        DPRINTF("No camera found.");

    descriptions = found;
    sessions.assign(descriptions.size(), Camera_ptr());
    created = true;
    return FWCAM_SUCCESS;
}

bool fwcam::fwcambus::exists() const
{
    return created;
}

int fwcam::fwcambus::reset()
{
    if (!exists())
        return create();

    std::vector<std::string> found;
    ERROR_IF_FWCAM_FAIL(enumerate(found));

    for (size_t i = 0; i < sessions.size(); ++i)
    {
        if (sessions[i] && (i >= found.size() || found[i] != descriptions[i]))
        {
            sessions[i]->close();
            sessions[i].reset();
        }
    }
    descriptions = found;
    sessions.resize(descriptions.size());
    return FWCAM_SUCCESS;
}

int fwcam::fwcambus::destroy()
{
    for (Camera_ptr &session : sessions)
    {
        if (session)
            session->close();
        session.reset();
    }
    sessions.clear();
    descriptions.clear();
    probe.reset();
    created = false;
    return FWCAM_SUCCESS;
}

int fwcam::fwcambus::get_number_cameras() const
{
    return static_cast<int>(descriptions.size());
}

std::string fwcam::fwcambus::get_description(const int index) const
{
    if (index < 0 || index >= get_number_cameras())
        return "";
    return descriptions[index];
}

fwcam::Camera_ptr fwcam::fwcambus::get_camera(const int index)
{
    if (!exists() && create() != FWCAM_SUCCESS)
        throw failure(FWCAM_ERROR_INIT_FAILED, "Cannot create the Fwcam bus.");
    if (index < 0 || index >= get_number_cameras())
    {
        std::ostringstream msg;
        msg << "No camera with index " << index << " (" << get_number_cameras() << " found).";
        throw failure(FWCAM_ERROR_NOT_FOUND, msg.str());
    }

    Camera_ptr &cached = sessions[index];
    if (cached && cached->state() != FWCAM_UNINITIALIZED && cached->description() == descriptions[index])
        return cached;

    Fwcam_settings set;
    if (load_settings(descriptions[index], set) != FWCAM_SUCCESS)
    {
        DPRINTF("Warning: using default settings for " << descriptions[index] << ".");
        set = Fwcam_settings();
    }

    Camera_ptr session(new camera(backend_factory(set), set));
    session->open(index);
    cached = session;
    return cached;
}

std::vector<fwcam::Camera_ptr> fwcam::fwcambus::get_cameras()
{
    if (!exists() && create() != FWCAM_SUCCESS)
        throw failure(FWCAM_ERROR_INIT_FAILED, "Cannot create the Fwcam bus.");

    std::vector<Camera_ptr> all;
    for (int c = 0; c < get_number_cameras(); ++c)
        all.push_back(get_camera(c));
    return all;
}
