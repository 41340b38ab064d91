#ifndef ZDT_CAN_DRIVER__CONTROL_ACTIONS_HPP_
#define ZDT_CAN_DRIVER__CONTROL_ACTIONS_HPP_

#include <chrono>
#include <cstddef>
#include <vector>

#include "zdt_can_driver/command_channel.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Motion, enable and stop commands, including synchronized motion
 *
 * Every motion call validates its arguments before anything is encoded.
 * With multi_sync set, the drive buffers the command and the address joins
 * the bus SyncGroup until syncMotion() is issued from the broadcast address.
 */
class ControlActions
{
public:
  ControlActions(CommandChannel & channel, const AxisLimits & limits);

  /**
   * @brief Energize the motor
   * @throws CommandError if the drive rejects the request
   */
  void enable();

  /**
   * @brief De-energize the motor
   */
  void disable();

  /**
   * @brief Stop immediately, dropping this motor from the sync group
   */
  void stop();

  /**
   * @brief Velocity mode
   * @param speed_rpm Signed speed, the sign selects the direction
   * @param acceleration Acceleration in RPM/s
   * @param multi_sync Preload for synchronized motion
   * @throws ValidationError if |speed| exceeds the axis limit
   */
  void setSpeed(double speed_rpm, double acceleration, bool multi_sync = false);

  /**
   * @brief Direct (speed limited) position mode
   * @param position_deg Target position in degrees
   * @param speed_rpm Travel speed, must be >= 0
   * @param multi_sync Preload for synchronized motion
   * @param absolute Absolute target (checked against joint limits) or relative
   * @throws ValidationError on out-of-range arguments
   */
  void moveToPosition(
    double position_deg, double speed_rpm, bool multi_sync = false, bool absolute = true);

  /**
   * @brief Trapezoid profile position mode
   * @param position_deg Target position in degrees
   * @param max_speed_rpm Cruise speed, must be >= 0
   * @param acceleration Acceleration in RPM/s
   * @param deceleration Deceleration in RPM/s
   */
  void moveToPositionTrapezoid(
    double position_deg, double max_speed_rpm, double acceleration, double deceleration,
    bool multi_sync = false, bool absolute = true);

  /**
   * @brief Torque (current) mode
   * @param current_ma Signed phase current, the sign selects the direction
   * @param current_slope Current ramp in mA/s
   */
  void setTorque(double current_ma, double current_slope, bool multi_sync = false);

  /**
   * @brief Release every preloaded command on the bus at once
   *
   * Only valid on the broadcast-address controller. Sent without waiting
   * for a reply.
   * @return false if no motor was preloaded (nothing sent)
   */
  bool syncMotion();

  /**
   * @brief Stop every preloaded motor on the bus and empty the sync group
   * @return Number of motors that acknowledged the stop
   */
  std::size_t abortSync();

  /**
   * @brief Check a position move against the axis limits without sending it
   * @throws ValidationError
   */
  void validateMove(double position_deg, double speed_rpm, bool absolute = true) const;

  bool isEnabled();
  bool isInPosition();

  /**
   * @brief Whether the drive reports a stall or tripped stall protection
   */
  bool isStalled();

  /**
   * @brief Poll the in-position flag
   * @return true once reached, false when the timeout elapses first
   */
  bool waitForPosition(
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds interval = std::chrono::milliseconds(50));

  const AxisLimits & limits() const { return limits_; }
  void setLimits(const AxisLimits & limits) { limits_ = limits; }

private:
  void sendMotion(uint8_t function, const std::vector<uint8_t> & payload, bool multi_sync);
  void checkSpeed(double speed_rpm, const char * operation) const;
  void checkPosition(double position_deg, bool absolute, const char * operation) const;
  uint8_t readMotorFlags();

  CommandChannel & channel_;
  AxisLimits limits_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__CONTROL_ACTIONS_HPP_
