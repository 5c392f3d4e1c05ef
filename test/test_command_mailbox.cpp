#include "zlac8030l_driver/command_mailbox.hpp"
#include <gtest/gtest.h>
#include <thread>

using namespace zlac8030l_driver;

namespace {

VelocityCommand makeCommand(double linear, double angular, double stamp) {
    VelocityCommand cmd;
    cmd.linear = linear;
    cmd.angular = angular;
    cmd.stamp = stamp;
    return cmd;
}

} // namespace

TEST(CommandMailbox, EmptyMailboxHasNothingToTake) {
    CommandMailbox box;
    VelocityCommand cmd;
    EXPECT_FALSE(box.take(cmd));
}

TEST(CommandMailbox, LatestCommandWins) {
    CommandMailbox box;
    box.post(makeCommand(0.1, 0.0, 1.0));
    box.post(makeCommand(0.2, 0.3, 2.0));
    box.post(makeCommand(0.4, -0.5, 3.0));

    VelocityCommand cmd;
    ASSERT_TRUE(box.take(cmd));
    EXPECT_DOUBLE_EQ(cmd.linear, 0.4);
    EXPECT_DOUBLE_EQ(cmd.angular, -0.5);
    EXPECT_DOUBLE_EQ(cmd.stamp, 3.0);

    // 取走后清空
    EXPECT_FALSE(box.take(cmd));
}

TEST(CommandMailbox, ConcurrentWriterNeverTearsValue) {
    CommandMailbox box;
    constexpr int kPosts = 20000;

    std::thread writer([&box]() {
        for (int i = 1; i <= kPosts; ++i) {
            double v = static_cast<double>(i);
            box.post(makeCommand(v, -v, v));
        }
    });

    double last_stamp = 0.0;
    VelocityCommand cmd;
    while (last_stamp < kPosts) {
        if (box.take(cmd)) {
            EXPECT_DOUBLE_EQ(cmd.angular, -cmd.linear);
            EXPECT_DOUBLE_EQ(cmd.stamp, cmd.linear);
            EXPECT_GT(cmd.stamp, last_stamp);
            last_stamp = cmd.stamp;
        }
    }
    writer.join();
}
