#ifndef ZDT_CAN_DRIVER__HOMING_COMMANDS_HPP_
#define ZDT_CAN_DRIVER__HOMING_COMMANDS_HPP_

#include <chrono>

#include "zdt_can_driver/command_channel.hpp"
#include "zdt_can_driver/motor_state.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Homing procedure and its configuration
 *
 * State machine: Idle -> Requested -> InProgress -> {Completed | TimedOut | Failed}.
 * A session is started by triggerHoming() and advanced by polling the
 * drive's homing status flags.
 */
class HomingCommands
{
public:
  HomingCommands(CommandChannel & channel, MotorSoftState & state);

  /**
   * @brief Start a homing procedure
   * @param mode Homing mode
   * @param multi_sync Buffer the request until the broadcast sync trigger,
   *        so several axes start homing together. Poll only after the trigger.
   * @throws CommandError if the drive rejects the request (e.g. already homing),
   *         the session state is left unchanged
   */
  void triggerHoming(HomingMode mode, bool multi_sync = false);

  /**
   * @brief Poll the drive and advance the session
   * @return Decoded flags with the resulting session state
   */
  HomingStatus getHomingStatus();

  /**
   * @brief Poll until the session leaves Requested/InProgress
   * @param timeout Client-side limit, on top of the per-request response timeout
   * @param interval Poll period
   * @return Completed, Failed or TimedOut
   * @throws ValidationError if no homing was triggered
   */
  HomingState waitForHomingComplete(
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds interval = std::chrono::milliseconds(100));

  /**
   * @brief Force the drive to abandon homing, the session returns to Idle
   */
  void abortHoming();

  /**
   * @brief Define the current position as the zero reference
   *
   * Valid in any state, does not change the homing state.
   */
  void setZeroPosition(bool save_to_chip);

  HomingParameters getHomingParameters();

  /**
   * @throws ValidationError if a field is out of range (nothing sent)
   */
  void modifyHomingParameters(const HomingParameters & params, bool save_to_chip);

  HomingState state() const { return state_.homing.state; }
  const HomingSession & session() const { return state_.homing; }

  static void validateHomingParameters(const HomingParameters & params, uint8_t address);

private:
  void transition(HomingState next);

  CommandChannel & channel_;
  MotorSoftState & state_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__HOMING_COMMANDS_HPP_
