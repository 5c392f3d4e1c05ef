#include "zlac8030l_driver/types.hpp"
#include "zlac8030l_driver/wheel_actuator.hpp"

namespace zlac8030l_driver {

const char* toString(IoResult result) {
    switch (result) {
        case IoResult::OK:            return "ok";
        case IoResult::TIMEOUT:       return "timeout";
        case IoResult::ABORTED:       return "sdo abort";
        case IoResult::BUS_ERROR:     return "bus error";
        case IoResult::NOT_CONNECTED: return "not connected";
    }
    return "unknown";
}

const char* shortName(WheelId id) {
    switch (id) {
        case WheelId::FRONT_LEFT:  return "fl";
        case WheelId::BACK_LEFT:   return "bl";
        case WheelId::BACK_RIGHT:  return "br";
        case WheelId::FRONT_RIGHT: return "fr";
    }
    return "unknown";
}

const char* toString(ControlMode mode) {
    switch (mode) {
        case ControlMode::VELOCITY: return "velocity";
        case ControlMode::TORQUE:   return "torque";
    }
    return "unknown";
}

} // namespace zlac8030l_driver
