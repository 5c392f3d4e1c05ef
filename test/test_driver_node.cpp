#include "zlac8030l_driver/driver_node.hpp"
#include "fake_wheel_actuator.hpp"

#include <gtest/gtest.h>
#include <rclcpp/rclcpp.hpp>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace zlac8030l_driver;
using zlac8030l_driver::test::FakeWheelActuator;

class DriverNodeTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() { rclcpp::init(0, nullptr); }
    static void TearDownTestSuite() { rclcpp::shutdown(); }
};

TEST_F(DriverNodeTest, DefaultParameters) {
    auto node = std::make_shared<DriverNode>(std::make_unique<FakeWheelActuator>());
    const DriverConfig& cfg = node->config();
    EXPECT_EQ(cfg.bus.channel, "can0");
    EXPECT_EQ(cfg.bus_type, "socketcan");
    EXPECT_EQ(cfg.bitrate, 500000);
    EXPECT_EQ(cfg.loop.mode, ControlMode::VELOCITY);
    EXPECT_DOUBLE_EQ(cfg.loop.gains.kp, 200.0);
    EXPECT_DOUBLE_EQ(cfg.loop.geometry.wheel_radius, 0.194);
    EXPECT_DOUBLE_EQ(cfg.loop.geometry.track_width, 0.8);
    EXPECT_DOUBLE_EQ(cfg.loop.limits.max_w, 1.57);
    EXPECT_EQ(cfg.odom_frame, "odom_link");
    EXPECT_EQ(cfg.robot_frame, "base_link");
    EXPECT_DOUBLE_EQ(cfg.loop_rate, 100.0);
    EXPECT_DOUBLE_EQ(cfg.loop.cmd_timeout, 0.1);
    EXPECT_FALSE(cfg.pub_tf);
}

TEST_F(DriverNodeTest, ParameterOverridesSelectTorqueMode) {
    rclcpp::NodeOptions options;
    options.parameter_overrides({
        rclcpp::Parameter("torque_mode", true),
        rclcpp::Parameter("vel_kp", 50.0),
        rclcpp::Parameter("odom_frame", std::string("odom")),
    });
    auto node = std::make_shared<DriverNode>(std::make_unique<FakeWheelActuator>(), options);
    EXPECT_EQ(node->config().loop.mode, ControlMode::TORQUE);
    EXPECT_DOUBLE_EQ(node->config().loop.gains.kp, 50.0);
    EXPECT_EQ(node->config().odom_frame, "odom");
}

TEST_F(DriverNodeTest, ConnectsInjectedActuatorInConfiguredModeAndStopsOnExit) {
    auto fake = std::make_unique<FakeWheelActuator>();
    auto lifecycle = fake->lifecycle;
    rclcpp::NodeOptions options;
    options.parameter_overrides({rclcpp::Parameter("torque_mode", true)});

    auto node = std::make_shared<DriverNode>(std::move(fake), options);
    EXPECT_EQ(lifecycle->connect_calls, 1);
    EXPECT_EQ(lifecycle->mode, ControlMode::TORQUE);
    EXPECT_EQ(lifecycle->disconnect_calls, 0);

    node.reset();
    EXPECT_EQ(lifecycle->disconnect_calls, 1);
}

TEST_F(DriverNodeTest, ConnectFailureIsFatal) {
    auto fake = std::make_unique<FakeWheelActuator>();
    fake->fail_connect = true;
    auto lifecycle = fake->lifecycle;
    EXPECT_THROW(DriverNode(std::move(fake)), std::runtime_error);
    EXPECT_EQ(lifecycle->connect_calls, 1);
    EXPECT_EQ(lifecycle->disconnect_calls, 0);
}

class InvalidGeometryTest : public DriverNodeTest,
                            public ::testing::WithParamInterface<rclcpp::Parameter> {};

TEST_P(InvalidGeometryTest, RejectedBeforeDrivesAreEnabled) {
    auto fake = std::make_unique<FakeWheelActuator>();
    auto lifecycle = fake->lifecycle;
    rclcpp::NodeOptions options;
    options.parameter_overrides({GetParam()});

    EXPECT_THROW(DriverNode(std::move(fake), options), std::invalid_argument);
    EXPECT_EQ(lifecycle->connect_calls, 0);
}

INSTANTIATE_TEST_SUITE_P(
    GeometryAndLimits, InvalidGeometryTest,
    ::testing::Values(rclcpp::Parameter("wheel_radius", 0.0),
                      rclcpp::Parameter("track_width", -0.8),
                      rclcpp::Parameter("max_vx", 0.0),
                      rclcpp::Parameter("max_w", -1.0),
                      rclcpp::Parameter("max_lin_accel", 0.0),
                      rclcpp::Parameter("max_ang_accel", 0.0)));

TEST_F(DriverNodeTest, CanBusNodeValidatesGeometryBeforeOpeningTheBus) {
    // 接口不存在：若先打开总线会得到 runtime_error
    rclcpp::NodeOptions options;
    options.parameter_overrides({
        rclcpp::Parameter("can_channel", std::string("zlac_missing0")),
        rclcpp::Parameter("wheel_radius", 0.0),
    });
    EXPECT_THROW(DriverNode{options}, std::invalid_argument);
}

TEST_F(DriverNodeTest, RejectsNonPositiveLoopRate) {
    rclcpp::NodeOptions options;
    options.parameter_overrides({rclcpp::Parameter("loop_rate", 0.0)});
    EXPECT_THROW(DriverNode(std::make_unique<FakeWheelActuator>(), options), std::invalid_argument);
}

TEST_F(DriverNodeTest, RejectsUnsupportedBusType) {
    rclcpp::NodeOptions options;
    options.parameter_overrides({rclcpp::Parameter("bus_type", std::string("pcan"))});
    EXPECT_THROW(DriverNode{options}, std::runtime_error);
}

TEST_F(DriverNodeTest, TimerStopsWheelsWithoutCommands) {
    auto fake = std::make_unique<FakeWheelActuator>();
    FakeWheelActuator* actuator = fake.get();
    auto node = std::make_shared<DriverNode>(std::move(fake));

    rclcpp::executors::SingleThreadedExecutor executor;
    executor.add_node(node);
    for (int i = 0; i < 20 && actuator->velocity_writes.empty(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        executor.spin_some();
    }
    executor.remove_node(node);

    ASSERT_FALSE(actuator->velocity_writes.empty());
    for (double t : actuator->lastVelocityTargets()) {
        EXPECT_EQ(t, 0.0);
    }
}
