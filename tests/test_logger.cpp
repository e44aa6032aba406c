#include <gtest/gtest.h>

#include "logger.hpp"

TEST(Logger, LastPhaseTracksMostRecentPhase) {
    LOG_PHASE("Config validation", false);

    PhaseInfo last = lastPhase();
    EXPECT_EQ(last.phaseName, "Config validation");
    EXPECT_EQ(last.fileName, "test_logger.cpp");
    EXPECT_FALSE(last.success);

    LOG_PHASE("Peripheral ready", true);
    last = lastPhase();
    EXPECT_EQ(last.phaseName, "Peripheral ready");
    EXPECT_TRUE(last.success);
}

TEST(Logger, GroupedPhasesStillUpdateLastPhase) {
    beginPhaseGroup();
    LOG_PHASE("Errors config load", true);
    EXPECT_EQ(lastPhase().phaseName, "Errors config load");
    endPhaseGroup();
}
