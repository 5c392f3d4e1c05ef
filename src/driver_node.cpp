#include "zlac8030l_driver/driver_node.hpp"
#include "zlac8030l_driver/telemetry.hpp"

#include <chrono>
#include <stdexcept>

namespace zlac8030l_driver {

DriverNode::DriverNode(const rclcpp::NodeOptions& options)
    : Node("zlac8030l_driver", options) {
    declareParameters();

    if (config_.bus_type != "socketcan") {
        RCLCPP_ERROR(get_logger(), "Unsupported bus_type '%s'. Only 'socketcan' is available.",
                     config_.bus_type.c_str());
        throw std::runtime_error("zlac8030l_driver: unsupported bus_type");
    }
    // SocketCAN 的波特率在网卡上配置（ip link set can0 type can bitrate ...）
    RCLCPP_INFO(get_logger(), "Opening %s on '%s' (expected bitrate %d)",
                config_.bus_type.c_str(), config_.bus.channel.c_str(), config_.bitrate);
    if (!config_.eds_file.empty()) {
        RCLCPP_WARN(get_logger(), "eds_file '%s' is ignored, using built-in ZLAC8030L object dictionary",
                    config_.eds_file.c_str());
    }

    start(std::make_unique<CanopenActuator>(
        config_.bus, std::make_unique<SocketCanTransport>(config_.bus.channel)));
}

DriverNode::DriverNode(std::unique_ptr<WheelActuator> actuator, const rclcpp::NodeOptions& options)
    : Node("zlac8030l_driver", options) {
    if (!actuator) {
        throw std::invalid_argument("zlac8030l_driver: actuator must not be null");
    }
    declareParameters();
    start(std::move(actuator));
}

DriverNode::~DriverNode() {
    if (control_timer_) control_timer_->cancel();
    if (actuator_ && !actuator_->disconnect()) {
        RCLCPP_WARN(get_logger(), "Not all motor drivers acknowledged the stop request");
    }
}

void DriverNode::declareParameters() {
    config_.bus.channel = declare_parameter("can_channel", std::string("can0"));
    config_.bus_type = declare_parameter("bus_type", std::string("socketcan"));
    config_.bitrate = declare_parameter("bitrate", 500000);
    config_.eds_file = declare_parameter("eds_file", std::string(""));
    config_.bus.sdo_timeout = declare_parameter("sdo_timeout", 0.02);

    // 速度模式 / 力矩模式
    bool torque_mode = declare_parameter("torque_mode", false);
    config_.loop.mode = torque_mode ? ControlMode::TORQUE : ControlMode::VELOCITY;

    config_.loop.gains.kp = declare_parameter("vel_kp", 200.0);
    config_.loop.gains.ki = declare_parameter("vel_ki", 10.0);
    config_.loop.gains.kd = declare_parameter("vel_kd", 0.0);

    config_.loop.geometry.wheel_radius = declare_parameter("wheel_radius", 0.194);
    config_.loop.geometry.track_width = declare_parameter("track_width", 0.8);

    config_.loop.limits.max_vx = declare_parameter("max_vx", 2.0);
    config_.loop.limits.max_w = declare_parameter("max_w", 1.57);
    config_.loop.limits.max_lin_accel = declare_parameter("max_lin_accel", 10.0);
    config_.loop.limits.max_ang_accel = declare_parameter("max_ang_accel", 15.0);

    config_.odom_frame = declare_parameter("odom_frame", std::string("odom_link"));
    config_.robot_frame = declare_parameter("robot_frame", std::string("base_link"));
    config_.loop_rate = declare_parameter("loop_rate", 100.0);
    config_.loop.cmd_timeout = declare_parameter("cmd_timeout", 0.1);
    config_.pub_tf = declare_parameter("pub_tf", false);

    if (config_.loop_rate <= 0.0) {
        throw std::invalid_argument("zlac8030l_driver: loop_rate must be positive");
    }
    if (config_.loop.cmd_timeout <= 0.0) {
        throw std::invalid_argument("zlac8030l_driver: cmd_timeout must be positive");
    }
    if (config_.bus.sdo_timeout <= 0.0) {
        throw std::invalid_argument("zlac8030l_driver: sdo_timeout must be positive");
    }
    // 几何与限幅参数在连接总线之前检查，避免驱动器使能后才因配置错误退出
    const DriveGeometry& geometry = config_.loop.geometry;
    if (geometry.wheel_radius <= 0.0 || geometry.track_width <= 0.0) {
        throw std::invalid_argument("zlac8030l_driver: wheel_radius and track_width must be positive");
    }
    const DriveLimits& limits = config_.loop.limits;
    if (limits.max_vx <= 0.0 || limits.max_w <= 0.0 ||
        limits.max_lin_accel <= 0.0 || limits.max_ang_accel <= 0.0) {
        throw std::invalid_argument("zlac8030l_driver: velocity and acceleration limits must be positive");
    }
}

void DriverNode::start(std::unique_ptr<WheelActuator> actuator) {
    std::string error;
    if (!actuator->connect(config_.loop.mode, error)) {
        RCLCPP_ERROR(get_logger(), "Could not create CAN network object. Error: %s", error.c_str());
        throw std::runtime_error("zlac8030l_driver: " + error);
    }
    actuator_ = std::move(actuator);

    try {
        setup();
    } catch (const std::exception& e) {
        // 构造失败时析构函数不会执行，这里先停下已使能的电机
        RCLCPP_ERROR(get_logger(), "Driver setup failed: %s", e.what());
        if (!actuator_->disconnect()) {
            RCLCPP_WARN(get_logger(), "Not all motor drivers acknowledged the stop request");
        }
        throw;
    }
}

void DriverNode::setup() {
    loop_ = std::make_unique<ControlLoop>(config_.loop, *actuator_, steadyNow(),
                                          get_logger(), get_clock());

    RCLCPP_INFO(get_logger(), "Control mode: %s, loop rate: %.1f Hz", toString(config_.loop.mode),
                config_.loop_rate);
    RCLCPP_WARN(get_logger(), "cmd_vel must be published at rate more than %.1f Hz",
                1.0 / config_.loop.cmd_timeout);

    cmd_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);
    control_group_ = create_callback_group(rclcpp::CallbackGroupType::MutuallyExclusive);

    rclcpp::SubscriptionOptions sub_options;
    sub_options.callback_group = cmd_group_;
    cmd_vel_sub_ = create_subscription<geometry_msgs::msg::Twist>(
        "cmd_vel", 10,
        std::bind(&DriverNode::cmdVelCallback, this, std::placeholders::_1),
        sub_options);

    odom_pub_ = create_publisher<nav_msgs::msg::Odometry>("odom", 10);
    forward_vel_pub_ = create_publisher<std_msgs::msg::Float64>("forward_vel", 10);
    for (WheelId wheel : ALL_WHEELS) {
        motor_state_pubs_[index(wheel)] = create_publisher<msg::MotorState>(
            std::string(shortName(wheel)) + "_motor/state", 10);
    }

    if (config_.pub_tf) {
        tf_broadcaster_ = std::make_shared<tf2_ros::TransformBroadcaster>(this);
    }

    control_timer_ = create_wall_timer(
        std::chrono::microseconds(static_cast<int64_t>(1e6 / config_.loop_rate)),
        std::bind(&DriverNode::controlTimerCallback, this),
        control_group_);

    RCLCPP_INFO(get_logger(), "** Driver initialization is done **");
}

double DriverNode::steadyNow() {
    return steady_clock_.now().seconds();
}

void DriverNode::cmdVelCallback(const geometry_msgs::msg::Twist::SharedPtr msg) {
    VelocityCommand cmd;
    cmd.linear = msg->linear.x;
    cmd.angular = msg->angular.z;
    cmd.stamp = steadyNow();
    loop_->postCommand(cmd);
}

void DriverNode::controlTimerCallback() {
    TickReport report = loop_->tick(steadyNow());
    if (busFailures(report) > 0) {
        RCLCPP_WARN_THROTTLE(get_logger(), *get_clock(), 5000, "Tick summary: %s",
                             summarize(report).c_str());
    }

    rclcpp::Time stamp = now();
    publishOdometry(report, stamp);
    publishMotorStates(report, stamp);
}

void DriverNode::publishOdometry(const TickReport& report, const rclcpp::Time& stamp) {
    nav_msgs::msg::Odometry odom = makeOdometryMessage(report.odometry, stamp,
                                                       config_.odom_frame, config_.robot_frame);
    odom_pub_->publish(odom);

    if (tf_broadcaster_) {
        tf_broadcaster_->sendTransform(makeOdometryTransform(odom));
    }

    std_msgs::msg::Float64 forward_vel;
    forward_vel.data = report.odometry.v;
    forward_vel_pub_->publish(forward_vel);
}

void DriverNode::publishMotorStates(const TickReport& report, const rclcpp::Time& stamp) {
    for (WheelId wheel : ALL_WHEELS) {
        motor_state_pubs_[index(wheel)]->publish(
            makeMotorStateMessage(wheel, report.wheels[index(wheel)], stamp));
    }
}

} // namespace zlac8030l_driver
