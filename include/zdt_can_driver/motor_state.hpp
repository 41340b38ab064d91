#ifndef ZDT_CAN_DRIVER__MOTOR_STATE_HPP_
#define ZDT_CAN_DRIVER__MOTOR_STATE_HPP_

#include <chrono>
#include <optional>

#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Homing procedure of one motor
 */
struct HomingSession
{
  HomingMode mode{HomingMode::SINGLE_TURN_NEAREST};
  HomingState state{HomingState::IDLE};
  HomingStatus last_status;
  std::optional<HomingParameters> parameters;  // last written or read
  std::chrono::steady_clock::time_point requested_at;
};

/**
 * @brief Soft state owned by a MotorController and shared by its modules
 *
 * Not synchronized: one motor's calls are expected from one thread at a
 * time. Bus access itself is serialized by the Transport.
 */
struct MotorSoftState
{
  std::optional<DriveParameters> drive_parameters;
  HomingSession homing;

  void invalidateDriveParameters() { drive_parameters.reset(); }
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__MOTOR_STATE_HPP_
