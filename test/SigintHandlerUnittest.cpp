#include <gtest/gtest.h>

#include <atomic>
#include <csignal>

#include "SigintHandler.hpp"

TEST(SigintHandler, FirstSignalSetsFlagOnly) {
    std::atomic<bool> interrupted = false;
    {
        SigintHandler handler(interrupted);
        std::raise(SIGINT);
        EXPECT_TRUE(interrupted);

        // The next SIGINT would take the default action
        auto current = std::signal(SIGINT, SIG_IGN);
        EXPECT_EQ(current, SIG_DFL);
        std::signal(SIGINT, current);
    }
}

TEST(SigintHandler, DestructorRestoresDefault) {
    std::atomic<bool> interrupted = false;
    {
        SigintHandler handler(interrupted);
    }
    auto current = std::signal(SIGINT, SIG_IGN);
    EXPECT_EQ(current, SIG_DFL);
    std::signal(SIGINT, current);
    EXPECT_FALSE(interrupted);
}
