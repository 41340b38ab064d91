#include "zdt_can_driver/trigger_actions.hpp"

namespace zdt_can_driver
{

TriggerActions::TriggerActions(CommandChannel & channel, MotorSoftState & state)
  : channel_(channel),
    state_(state)
{
}

void TriggerActions::triggerEncoderCalibration()
{
  channel_.command(
    FunctionCode::ENCODER_CALIBRATION, {AuxCode::ENCODER_CALIBRATION}, RetryMode::SINGLE_SHOT);
  RCLCPP_INFO(channel_.getLogger(), "Encoder calibration started");
}

void TriggerActions::clearPosition()
{
  channel_.command(
    FunctionCode::CLEAR_POSITION, {AuxCode::CLEAR_POSITION}, RetryMode::SINGLE_SHOT);
  RCLCPP_INFO(channel_.getLogger(), "Position counter cleared");
}

void TriggerActions::releaseStallProtection()
{
  channel_.command(
    FunctionCode::RELEASE_STALL_PROTECTION, {AuxCode::RELEASE_STALL_PROTECTION},
    RetryMode::SINGLE_SHOT);
  RCLCPP_INFO(channel_.getLogger(), "Stall protection released");
}

void TriggerActions::factoryReset()
{
  // Cached state may no longer match the drive even if the reply is lost
  state_.invalidateDriveParameters();
  state_.homing = HomingSession();

  channel_.command(
    FunctionCode::FACTORY_RESET, {AuxCode::FACTORY_RESET}, RetryMode::SINGLE_SHOT);
  RCLCPP_WARN(channel_.getLogger(), "Factory reset, drive parameters must be read again");
}

}  // namespace zdt_can_driver
