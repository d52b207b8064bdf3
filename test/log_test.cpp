#include "f8/log.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace f8;

class Log : public ::testing::Test {
protected:
    void TearDown() override { log::SetVerbose(false); }
};

TEST_F(Log, TraceSilentByDefault) {
    log::SetVerbose(false);

    ::testing::internal::CaptureStdout();
    log::Trace("Claimed interface %i\n", 3);
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

TEST_F(Log, TraceFormatsWhenVerbose) {
    log::SetVerbose(true);

    ::testing::internal::CaptureStdout();
    log::Trace("endpoint if:%i, addr:0x%02x, %s\n", 1, 0x81, "ok");
    EXPECT_EQ(::testing::internal::GetCapturedStdout(),
              "endpoint if:1, addr:0x81, ok\n");
}
