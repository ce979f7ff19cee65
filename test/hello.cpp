/***********************************************************************
    This file is in the public domain.

    Description:

    A simple invocation of the Fwcam library for IEEE 1394 cameras.
    Lists the cameras found with their formats and frame rates, and
    grabs one frame from each.

    Compile and link with something like:

    $ g++ -std=c++11 hello.cpp -o hello -lfwcam_dc1394 -lfwcam -ldc1394 -lm

***********************************************************************/

#include <iostream>

#include <fwcam/fwcambus.hpp>   /* fwcambus, camera */
#include <fwcam/fwcam_dc1394.hpp>   /* dc1394_factory() */

int main()
{
    int num_cameras;
    std::shared_ptr<fwcam::fwcambus> bus(new fwcam::fwcambus(fwcam::dc1394_factory()));

    std::cout << "Fwcam version " << fwcam::version() << std::endl;

    /* Initialize the bus: */
    if(bus->create() != FWCAM_SUCCESS)
    {
        std::cout << "Failed to initialize the bus" << std::endl;
        return -1;
    }

    num_cameras = bus->get_number_cameras();
    if(num_cameras == 0)
    {
        std::cout << "No camera connected." << std::endl;
        return -1;
    }

    std::cout << "Number of cameras attached: " << num_cameras << std::endl;

    /* Open the cameras found */
    for(int i = 0; i < num_cameras; ++i)
    {
        try
        {
            fwcam::Camera_ptr camera = bus->get_camera(i);
            /* Print some info: */
            std::cout << "Camera " << i << ": " << camera->description() << std::endl;
            std::cout << "  Supported formats:" << std::endl;
            for(const std::string &name : camera->supported_format_names())
                std::cout << "    " << name << std::endl;

            std::cout << "  Current format: " << camera->format().name << std::endl;
            std::cout << "  Frame rates:";
            for(const fwcam::Frame_rate &rate : camera->supported_frame_rates())
                std::cout << " " << rate.fps;
            std::cout << std::endl;
            std::cout << "  Current frame rate: " << camera->frame_rate().fps << std::endl;

            const fwcam::Decoded_image image = camera->capture();
            std::cout << "  Frame size: " << image.width << "x" << image.height
                      << "x" << image.channels << std::endl;
            camera->stop();
        }
        catch(fwcam::failure &f)
        {
            std::cout << "Camera " << i << " failed: " << f.what() << std::endl;
        }
    }

    bus->destroy();
    return 0;
} /* main() */
