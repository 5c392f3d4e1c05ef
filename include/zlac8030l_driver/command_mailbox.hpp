#ifndef ZLAC8030L_DRIVER_COMMAND_MAILBOX_HPP
#define ZLAC8030L_DRIVER_COMMAND_MAILBOX_HPP

#include "zlac8030l_driver/types.hpp"
#include <mutex>

namespace zlac8030l_driver {

/**
 * @brief 单槽邮箱：订阅回调写入，控制循环读取
 *
 * 只保留最新一条指令，新指令直接覆盖未取走的旧指令（不排队）。
 * 一个写者（订阅回调）、一个读者（控制定时器）。
 */
class CommandMailbox {
public:
    void post(const VelocityCommand& cmd) {
        std::lock_guard<std::mutex> lock(mutex_);
        slot_ = cmd;
        has_new_ = true;
    }

    /**
     * @brief 取走最新指令
     * @return 自上次 take 以来有新指令时返回 true 并写入 cmd
     */
    bool take(VelocityCommand& cmd) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_new_) return false;
        cmd = slot_;
        has_new_ = false;
        return true;
    }

private:
    std::mutex mutex_;
    VelocityCommand slot_;
    bool has_new_ = false;
};

} // namespace zlac8030l_driver

#endif // ZLAC8030L_DRIVER_COMMAND_MAILBOX_HPP
