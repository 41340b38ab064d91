#ifndef ZDT_CAN_DRIVER__MODIFY_PARAMETERS_HPP_
#define ZDT_CAN_DRIVER__MODIFY_PARAMETERS_HPP_

#include "zdt_can_driver/command_channel.hpp"
#include "zdt_can_driver/motor_state.hpp"
#include "zdt_can_driver/read_parameters.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Parameter writes
 *
 * Arguments are validated before any I/O. save_to_chip is passed to the
 * drive verbatim: false changes active RAM only, true also persists to
 * non-volatile storage. Subset writers read the current DriveParameters,
 * merge the change and write the whole record back.
 */
class ModifyParameters
{
public:
  ModifyParameters(CommandChannel & channel, ReadParameters & reader, MotorSoftState & state);

  void modifyControlMode(ControlMode mode, bool save_to_chip);

  /**
   * @brief Open-loop working current and closed-loop current ceiling
   * @param open_loop_ma 100..3000 mA
   * @param closed_loop_max_ma 100..3000 mA
   */
  void modifyCurrentLimits(uint16_t open_loop_ma, uint16_t closed_loop_max_ma, bool save_to_chip);

  /**
   * @param max_speed_rpm 100..6000 RPM
   */
  void modifySpeedLimit(uint16_t max_speed_rpm, bool save_to_chip);

  void modifyStallProtection(
    bool enabled, uint16_t speed_rpm, uint16_t current_ma, uint16_t time_ms,
    bool save_to_chip);

  /**
   * @brief Baud-rate selectors, checksum mode and response mode
   *
   * A new checksum mode only takes effect for this bus once the caller
   * reconfigures the Transport.
   */
  void modifyCommunicationSettings(
    uint8_t uart_baudrate, uint8_t can_baudrate, ChecksumMode checksum_mode,
    uint8_t response_mode, bool save_to_chip);

  /**
   * @brief Write the complete record
   * @throws ValidationError if any field is out of range (nothing sent)
   */
  void modifyDriveParameters(const DriveParameters & params, bool save_to_chip);

  void modifyPidParameters(const PidParameters & params, bool save_to_chip);

  /**
   * @brief Microstep subdivision, 1..256
   */
  void modifySubdivision(uint16_t subdivision, bool save_to_chip);

  /**
   * @brief Change the drive's bus address, 1..255
   *
   * This controller keeps talking to the old address; build a new
   * MotorController for the new one.
   */
  void modifyMotorAddress(uint8_t new_address, bool save_to_chip);

  /**
   * @throws ValidationError naming the first field out of range
   */
  static void validateDriveParameters(const DriveParameters & params, uint8_t address);

private:
  void writeDriveParameters(const DriveParameters & params, bool save_to_chip);
  DriveParameters currentDriveParameters();

  CommandChannel & channel_;
  ReadParameters & reader_;
  MotorSoftState & state_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__MODIFY_PARAMETERS_HPP_
