/***********************************************************************
    This file is in the public domain.

    Description:

    Unit tests of the Fwcam bus, which hands out cached camera
    sessions, over simulated cameras.

***********************************************************************/

#include <gtest/gtest.h>
#include <fwcam/fwcambus.hpp>
#include <fwcam/fwcam_simulator.hpp>
#include "test_helpers.hpp"

using namespace fwcam;

class FwcamBus : public ::testing::Test
{
    protected:
        void SetUp()
        {
            std::vector<Simulated_camera> cameras;
            cameras.push_back(standard_camera("Acme FW-100 00b09d0100a0b1c2"));
            cameras.push_back(standard_camera("Acme FW-200 00b09d0100a0b1c3"));
            sim_bus = make_simulated_bus(cameras);
            backends_made = 0;
        }

        Backend_factory factory()
        {
            Simulated_bus shared = sim_bus;
            int *made = &backends_made;
            return [shared, made](const Fwcam_settings &) -> Backend_ptr {
                ++*made;
                return Backend_ptr(new simulated_backend(shared));
            };
        }

        Simulated_bus sim_bus;
        int backends_made;
};

TEST_F(FwcamBus, CreateEnumerates) {
    fwcambus bus(factory());
    EXPECT_FALSE(bus.exists());
    ASSERT_EQ(bus.create(), FWCAM_SUCCESS);
    EXPECT_TRUE(bus.exists());
    EXPECT_EQ(bus.get_number_cameras(), 2);
    EXPECT_EQ(bus.get_description(1), "Acme FW-200 00b09d0100a0b1c3");
    EXPECT_EQ(bus.get_description(2), "");
    EXPECT_EQ(bus.create(), FWCAM_FAILURE);   // Already created.
}

TEST_F(FwcamBus, NoCamerasIsNotAnError) {
    sim_bus->clear();
    fwcambus bus(factory());
    EXPECT_EQ(bus.create(), FWCAM_SUCCESS);
    EXPECT_EQ(bus.get_number_cameras(), 0);
    EXPECT_TRUE(bus.get_cameras().empty());
}

TEST_F(FwcamBus, SameIndexGivesSameSession) {
    fwcambus bus(factory());
    const Camera_ptr first = bus.get_camera(0);
    const Camera_ptr again = bus.get_camera(0);
    EXPECT_EQ(first.get(), again.get());
    EXPECT_EQ(first->state(), FWCAM_IDLE);
    EXPECT_EQ(first->description(), "Acme FW-100 00b09d0100a0b1c2");
    EXPECT_EQ(backends_made, 2);   // Probe and one session.
}

TEST_F(FwcamBus, EachSessionHasItsOwnBackend) {
    fwcambus bus(factory());
    const std::vector<Camera_ptr> sessions = bus.get_cameras();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_NE(sessions[0].get(), sessions[1].get());
    EXPECT_EQ(sessions[1]->index(), 1);
    EXPECT_EQ(backends_made, 3);
}

TEST_F(FwcamBus, BadIndexIsNotFound) {
    fwcambus bus(factory());
    EXPECT_FWCAM_ERROR(bus.get_camera(2), FWCAM_ERROR_NOT_FOUND);
    EXPECT_FWCAM_ERROR(bus.get_camera(-1), FWCAM_ERROR_NOT_FOUND);
}

TEST_F(FwcamBus, NewSessionAfterIdentityChanges) {
    fwcambus bus(factory());
    const Camera_ptr before = bus.get_camera(0);
    const Camera_ptr other = bus.get_camera(1);

    (*sim_bus)[0].description = "Acme FW-100 00b09d0100a0ffff";   // Camera swapped.
    ASSERT_EQ(bus.reset(), FWCAM_SUCCESS);
    EXPECT_EQ(before->state(), FWCAM_UNINITIALIZED);
    EXPECT_EQ(other->state(), FWCAM_IDLE);

    const Camera_ptr after = bus.get_camera(0);
    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(after->description(), "Acme FW-100 00b09d0100a0ffff");
    EXPECT_EQ(bus.get_camera(1).get(), other.get());
}

TEST_F(FwcamBus, ClosedSessionIsReopened) {
    fwcambus bus(factory());
    const Camera_ptr first = bus.get_camera(0);
    first->close();
    const Camera_ptr second = bus.get_camera(0);
    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(second->state(), FWCAM_IDLE);
}

TEST_F(FwcamBus, DestroyClosesSessions) {
    fwcambus bus(factory());
    const Camera_ptr session = bus.get_camera(0);
    session->start();
    EXPECT_EQ(bus.destroy(), FWCAM_SUCCESS);
    EXPECT_FALSE(bus.exists());
    EXPECT_EQ(session->state(), FWCAM_UNINITIALIZED);
    EXPECT_FALSE((*sim_bus)[0].acquiring);
}

TEST_F(FwcamBus, FailedEnumerationFailsCreate) {
    fwcambus bus([](const Fwcam_settings &) -> Backend_ptr {
        std::shared_ptr<simulated_backend> sim(new simulated_backend(Simulated_bus()));
        sim->inject_failure(SIM_ENUMERATE, BACKEND_ERROR);
        return Backend_ptr(sim);
    });
    EXPECT_EQ(bus.create(), FWCAM_FAILURE);
    EXPECT_FWCAM_ERROR(bus.get_camera(0), FWCAM_ERROR_INIT_FAILED);
}
