#ifndef ZLAC8030L_DRIVER_DRIVER_NODE_HPP
#define ZLAC8030L_DRIVER_DRIVER_NODE_HPP

#include "zlac8030l_driver/canopen_actuator.hpp"
#include "zlac8030l_driver/socketcan_transport.hpp"
#include "zlac8030l_driver/control_loop.hpp"
#include "zlac8030l_driver/wheel_actuator.hpp"
#include "zlac8030l_driver/msg/motor_state.hpp"

#include <rclcpp/rclcpp.hpp>
#include <geometry_msgs/msg/twist.hpp>
#include <nav_msgs/msg/odometry.hpp>
#include <std_msgs/msg/float64.hpp>
#include <tf2_ros/transform_broadcaster.h>
#include <memory>
#include <string>

namespace zlac8030l_driver {

/** 节点参数，启动时读取一次 */
struct DriverConfig {
    std::string bus_type = "socketcan";
    int bitrate = 500000;
    std::string eds_file;
    CanBusConfig bus;
    ControlLoopConfig loop;
    std::string odom_frame = "odom_link";
    std::string robot_frame = "base_link";
    double loop_rate = 100.0;   // Hz
    bool pub_tf = false;
};

/**
 * @brief ZLAC8030L 四轮差速驱动节点
 *
 * 订阅: cmd_vel (geometry_msgs/Twist)
 * 发布: odom (nav_msgs/Odometry)
 *       forward_vel (std_msgs/Float64)
 *       <fl|bl|br|fr>_motor/state (zlac8030l_driver/MotorState)
 *       TF odom_frame -> robot_frame（pub_tf 为 true 时）
 *
 * 订阅回调与控制定时器分属不同回调组，回调只写邮箱，循环状态只由定时器线程访问。
 */
class DriverNode : public rclcpp::Node {
public:
    /**
     * @brief 按参数打开 CAN 总线
     * @throws std::invalid_argument 参数非法（在打开总线之前检查）
     * @throws std::runtime_error 总线类型不支持或驱动器连接失败
     */
    explicit DriverNode(const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

    /** 使用外部提供的执行器，参数检查通过后由节点负责 connect */
    DriverNode(std::unique_ptr<WheelActuator> actuator,
               const rclcpp::NodeOptions& options = rclcpp::NodeOptions());

    ~DriverNode() override;

    const DriverConfig& config() const { return config_; }

private:
    void declareParameters();
    /** 连接并接管执行器，随后创建控制循环与通信接口 */
    void start(std::unique_ptr<WheelActuator> actuator);
    void setup();
    double steadyNow();

    void cmdVelCallback(const geometry_msgs::msg::Twist::SharedPtr msg);
    void controlTimerCallback();
    void publishOdometry(const TickReport& report, const rclcpp::Time& stamp);
    void publishMotorStates(const TickReport& report, const rclcpp::Time& stamp);

    DriverConfig config_;
    rclcpp::Clock steady_clock_{RCL_STEADY_TIME};

    std::unique_ptr<WheelActuator> actuator_;
    std::unique_ptr<ControlLoop> loop_;

    rclcpp::CallbackGroup::SharedPtr cmd_group_;
    rclcpp::CallbackGroup::SharedPtr control_group_;

    rclcpp::Subscription<geometry_msgs::msg::Twist>::SharedPtr cmd_vel_sub_;
    rclcpp::Publisher<nav_msgs::msg::Odometry>::SharedPtr odom_pub_;
    rclcpp::Publisher<std_msgs::msg::Float64>::SharedPtr forward_vel_pub_;
    PerWheel<rclcpp::Publisher<msg::MotorState>::SharedPtr> motor_state_pubs_;
    std::shared_ptr<tf2_ros::TransformBroadcaster> tf_broadcaster_;
    rclcpp::TimerBase::SharedPtr control_timer_;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_DRIVER_NODE_HPP
