#include "f8/claim.hpp"
#include "fake_usb.hpp"
#include <gtest/gtest.h>

using namespace f8;
using namespace f8::test;

class Claim : public ::testing::Test {
protected:
    std::shared_ptr<FakeDeviceState> state =
        std::make_shared<FakeDeviceState>();
    FakeConnection connection{state};
};

TEST_F(Claim, ClaimAndRelease) {
    ClaimInterface(connection, 0);
    EXPECT_TRUE(state->claimed[0]);
    ReleaseInterface(connection, 0);
    EXPECT_FALSE(state->claimed[0]);
}

TEST_F(Claim, AccessDeniedIsPermissionDenied) {
    state->claim_result = LIBUSB_ERROR_ACCESS;
    try {
        ClaimInterface(connection, 0);
        FAIL() << "expected PermissionDenied";
    } catch (const error::F8Exception& e) {
        EXPECT_EQ(e.kind(), error::ErrorKind::PermissionDenied);
        EXPECT_EQ(e.code(), LIBUSB_ERROR_ACCESS);
    }
}

TEST_F(Claim, BusyIsDriverError) {
    state->kernel_driver_bound[0] = true;
    EXPECT_THROW(ClaimInterface(connection, 0), error::DriverException);
    EXPECT_FALSE(state->AnyClaimed());
}

TEST_F(Claim, GuardReleasesOnScopeExit) {
    {
        InterfaceClaimGuard claim(connection, 2);
        EXPECT_TRUE(claim.Claimed());
        EXPECT_TRUE(state->claimed[2]);
    }
    EXPECT_FALSE(state->AnyClaimed());
}

TEST_F(Claim, GuardReleasesExactlyOnce) {
    {
        InterfaceClaimGuard claim(connection, 0);
        claim.Release();
        EXPECT_FALSE(claim.Claimed());
        claim.Release();
    }
    EXPECT_EQ(std::count(state->calls.begin(), state->calls.end(), "release 0"),
              1);
}

TEST_F(Claim, GuardReleasesWhenScopeThrows) {
    try {
        InterfaceClaimGuard claim(connection, 0);
        throw error::TransferException("Report control transfer",
                                       LIBUSB_ERROR_IO);
    } catch (const error::TransferException&) {
    }
    EXPECT_FALSE(state->AnyClaimed());
}

TEST_F(Claim, GuardDestructorSurvivesAnyException) {
    state->release_throws = true;
    try {
        InterfaceClaimGuard claim(connection, 0);
        throw error::TransferException("Report control transfer",
                                       LIBUSB_ERROR_IO);
    } catch (const error::TransferException& e) {
        EXPECT_EQ(e.code(), LIBUSB_ERROR_IO);
    }
    EXPECT_EQ(std::count(state->calls.begin(), state->calls.end(), "release 0"),
              1);
}

TEST_F(Claim, FailedClaimIsNotReleased) {
    state->claim_result = LIBUSB_ERROR_BUSY;
    EXPECT_THROW(InterfaceClaimGuard(connection, 0), error::DriverException);
    EXPECT_EQ(std::count(state->calls.begin(), state->calls.end(), "release 0"),
              0);
}
