#ifndef ZDT_CAN_DRIVER__MOTOR_CONTROLLER_HPP_
#define ZDT_CAN_DRIVER__MOTOR_CONTROLLER_HPP_

#include <memory>
#include <vector>

#include "zdt_can_driver/command_channel.hpp"
#include "zdt_can_driver/control_actions.hpp"
#include "zdt_can_driver/homing_commands.hpp"
#include "zdt_can_driver/modify_parameters.hpp"
#include "zdt_can_driver/motor_state.hpp"
#include "zdt_can_driver/read_parameters.hpp"
#include "zdt_can_driver/transport.hpp"
#include "zdt_can_driver/trigger_actions.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief One logical motor on a shared bus
 *
 * Binds an address to the bus Transport and exposes the five
 * sub-interfaces. Every controller on the bus holds the Transport; it
 * lives as long as the longest-lived controller. Address 0 gives a
 * broadcast controller that can only issue syncMotion().
 */
class MotorController
{
public:
  /**
   * @brief Constructor
   * @param address Motor address (0 = broadcast)
   * @param transport Shared bus
   * @param config Response timeout and retry policy
   * @param limits Axis limits enforced before encoding motion commands
   */
  MotorController(
    uint8_t address, std::shared_ptr<Transport> transport, const BusConfig & config,
    const AxisLimits & limits = AxisLimits());

  MotorController(const MotorController &) = delete;
  MotorController & operator=(const MotorController &) = delete;

  ControlActions & controlActions() { return control_actions_; }
  ReadParameters & readParameters() { return read_parameters_; }
  ModifyParameters & modifyParameters() { return modify_parameters_; }
  HomingCommands & homingCommands() { return homing_commands_; }
  TriggerActions & triggerActions() { return trigger_actions_; }

  uint8_t address() const { return channel_.address(); }

  /**
   * @brief Reachability observed on the last exchange
   */
  ConnectionStatus connectionStatus() const { return channel_.connectionStatus(); }

  /**
   * @brief Whether a preloaded command waits for the sync trigger
   */
  bool pendingSync() const;

  const rclcpp::Logger & getLogger() const { return channel_.getLogger(); }

private:
  CommandChannel channel_;
  MotorSoftState state_;
  ControlActions control_actions_;
  ReadParameters read_parameters_;
  ModifyParameters modify_parameters_;
  HomingCommands homing_commands_;
  TriggerActions trigger_actions_;
};

/**
 * @brief One axis of a synchronized move
 */
struct SyncTarget
{
  MotorController * motor;
  double position_deg;
};

/**
 * @brief Trapezoid move of several axes released by one sync trigger
 *
 * Every target is checked against its axis limits before the first preload
 * is sent. If a preload fails, every axis already preloaded is stopped and
 * the error is rethrown; the trigger is only sent once all preloads are
 * acknowledged.
 * @param broadcast Controller on the broadcast address
 * @throws ValidationError if a target is rejected (nothing sent)
 */
void moveSynchronized(
  MotorController & broadcast, const std::vector<SyncTarget> & targets,
  double max_speed_rpm, double acceleration, double deceleration, bool absolute = true);

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__MOTOR_CONTROLLER_HPP_
