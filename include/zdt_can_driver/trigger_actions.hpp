#ifndef ZDT_CAN_DRIVER__TRIGGER_ACTIONS_HPP_
#define ZDT_CAN_DRIVER__TRIGGER_ACTIONS_HPP_

#include "zdt_can_driver/command_channel.hpp"
#include "zdt_can_driver/motor_state.hpp"

namespace zdt_can_driver
{

/**
 * @brief One-shot maintenance commands
 */
class TriggerActions
{
public:
  TriggerActions(CommandChannel & channel, MotorSoftState & state);

  void triggerEncoderCalibration();

  /**
   * @brief Reset the multi-turn position counter to zero
   */
  void clearPosition();

  void releaseStallProtection();

  /**
   * @brief Restore factory parameters
   *
   * Drops the cached DriveParameters and the homing session; read the
   * parameters again before relying on them.
   */
  void factoryReset();

private:
  CommandChannel & channel_;
  MotorSoftState & state_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__TRIGGER_ACTIONS_HPP_
