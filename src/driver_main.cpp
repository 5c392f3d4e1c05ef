#include "zlac8030l_driver/driver_node.hpp"

#include <cstdlib>
#include <exception>

int main(int argc, char** argv) {
    rclcpp::init(argc, argv);

    std::shared_ptr<zlac8030l_driver::DriverNode> node;
    try {
        node = std::make_shared<zlac8030l_driver::DriverNode>();
    } catch (const std::exception& e) {
        RCLCPP_FATAL(rclcpp::get_logger("zlac8030l_driver"), "Driver initialization failed: %s", e.what());
        rclcpp::shutdown();
        return EXIT_FAILURE;
    }

    // 订阅与控制定时器在不同回调组，需要多线程执行器
    rclcpp::executors::MultiThreadedExecutor executor(rclcpp::ExecutorOptions(), 2);
    executor.add_node(node);
    executor.spin();

    executor.remove_node(node);
    node.reset();
    rclcpp::shutdown();
    return EXIT_SUCCESS;
}
