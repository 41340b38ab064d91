#ifndef ZDT_CAN_DRIVER__READ_PARAMETERS_HPP_
#define ZDT_CAN_DRIVER__READ_PARAMETERS_HPP_

#include <cstdint>
#include <optional>

#include "zdt_can_driver/command_channel.hpp"
#include "zdt_can_driver/motor_state.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Status, telemetry and configuration queries
 *
 * Every accessor sends one query and applies the protocol's fixed-point
 * scaling. Reads are retried on lost or corrupted replies.
 */
class ReadParameters
{
public:
  ReadParameters(CommandChannel & channel, MotorSoftState & state);

  MotorStatus getMotorStatus();

  /**
   * @brief Realtime position in degrees
   */
  double getPosition();

  /**
   * @brief Realtime speed in RPM
   */
  double getSpeed();

  /**
   * @brief Driver temperature in degrees Celsius
   */
  double getTemperature();

  /**
   * @brief Bus voltage in volts
   */
  double getBusVoltage();

  /**
   * @brief Phase current in amperes
   */
  double getCurrent();

  /**
   * @brief Bus current in amperes
   */
  double getBusCurrent();

  VersionInfo getVersion();
  ResistanceInductance getResistanceInductance();
  PidParameters getPidParameters();

  /**
   * @brief Full drive configuration, refreshes the cached copy
   */
  DriveParameters getDriveParameters();

  SystemStatus getSystemStatus();

  /**
   * @brief Raw encoder angle (0..16383 counts) in degrees
   */
  double getEncoderRaw();

  /**
   * @brief Calibrated encoder angle (0..65535 counts) in degrees
   */
  double getEncoderCalibrated();

  /**
   * @brief Accumulated step pulses of the motor, signed
   */
  int64_t getPulseCount();

  /**
   * @brief Pulses received on the step/direction input, signed
   */
  int64_t getInputPulse();

  double getTargetPosition();
  double getRealtimeTargetPosition();

  /**
   * @brief Position error in degrees (0.01 degree resolution)
   */
  double getPositionError();

  /**
   * @brief Last DriveParameters read or written, empty after a reset or write
   */
  std::optional<DriveParameters> cachedDriveParameters() const { return state_.drive_parameters; }

private:
  CommandChannel & channel_;
  MotorSoftState & state_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__READ_PARAMETERS_HPP_
