#include "zdt_can_driver/modify_parameters.hpp"

#include <algorithm>
#include <string>

#include "zdt_can_driver/codec.hpp"
#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

namespace
{

constexpr uint8_t kSave = 0x01;
constexpr uint8_t kNoSave = 0x00;

const uint16_t kValidSubdivisions[] = {
  1, 2, 4, 5, 8, 10, 16, 20, 25, 32, 40, 50, 64, 80, 100, 125, 128, 160, 200, 250, 256
};

uint8_t saveByte(bool save_to_chip)
{
  return save_to_chip ? kSave : kNoSave;
}

void checkRange(
  long value, long min, long max, uint8_t address, const char * operation,
  const char * field)
{
  if (value < min || value > max) {
    throw ValidationError(
      address, operation,
      std::string(field) + " " + std::to_string(value) + " outside " + std::to_string(min) +
      ".." + std::to_string(max));
  }
}

void checkSubdivision(uint16_t subdivision, uint8_t address, const char * operation)
{
  const auto * end = std::end(kValidSubdivisions);
  if (std::find(std::begin(kValidSubdivisions), end, subdivision) == end) {
    throw ValidationError(
      address, operation, "unsupported subdivision " + std::to_string(subdivision));
  }
}

}  // namespace

ModifyParameters::ModifyParameters(
  CommandChannel & channel, ReadParameters & reader, MotorSoftState & state)
  : channel_(channel),
    reader_(reader),
    state_(state)
{
}

void ModifyParameters::validateDriveParameters(const DriveParameters & p, uint8_t address)
{
  const char * op = "modify_drive_parameters";
  checkRange(static_cast<long>(p.control_mode), 0, 1, address, op, "control_mode");
  checkRange(p.pulse_port_function, 0, 3, address, op, "pulse_port_function");
  checkRange(p.serial_port_function, 0, 3, address, op, "serial_port_function");
  checkRange(p.enable_pin_mode, 0, 2, address, op, "enable_pin_mode");
  checkRange(static_cast<long>(p.motor_direction), 0, 1, address, op, "motor_direction");
  checkSubdivision(p.subdivision, address, op);
  checkRange(p.lpf_intensity, 0, 3, address, op, "lpf_intensity");
  checkRange(p.open_loop_current_ma, 100, 3000, address, op, "open_loop_current_ma");
  checkRange(p.closed_loop_max_current_ma, 100, 3000, address, op, "closed_loop_max_current_ma");
  checkRange(p.max_speed_limit_rpm, 100, 6000, address, op, "max_speed_limit_rpm");
  checkRange(p.uart_baudrate, 0, 7, address, op, "uart_baudrate");
  checkRange(p.can_baudrate, 0, 7, address, op, "can_baudrate");
  checkRange(static_cast<long>(p.checksum_mode), 0, 3, address, op, "checksum_mode");
  checkRange(p.response_mode, 0, 4, address, op, "response_mode");
  if (p.stall_protection_enabled) {
    checkRange(p.stall_protection_speed_rpm, 1, 100, address, op, "stall_protection_speed_rpm");
    checkRange(
      p.stall_protection_current_ma, 100, 3000, address, op, "stall_protection_current_ma");
    checkRange(p.stall_protection_time_ms, 100, 5000, address, op, "stall_protection_time_ms");
  }
  checkRange(p.position_arrival_window, 1, 100, address, op, "position_arrival_window");
}

void ModifyParameters::modifyControlMode(ControlMode mode, bool save_to_chip)
{
  checkRange(
    static_cast<long>(mode), 0, 1, channel_.address(), "modify_control_mode", "control_mode");

  DriveParameters params = currentDriveParameters();
  params.control_mode = mode;
  writeDriveParameters(params, save_to_chip);
}

void ModifyParameters::modifyCurrentLimits(
  uint16_t open_loop_ma, uint16_t closed_loop_max_ma, bool save_to_chip)
{
  const char * op = "modify_current_limits";
  checkRange(open_loop_ma, 100, 3000, channel_.address(), op, "open_loop_current_ma");
  checkRange(closed_loop_max_ma, 100, 3000, channel_.address(), op, "closed_loop_max_current_ma");

  DriveParameters params = currentDriveParameters();
  params.open_loop_current_ma = open_loop_ma;
  params.closed_loop_max_current_ma = closed_loop_max_ma;
  writeDriveParameters(params, save_to_chip);
}

void ModifyParameters::modifySpeedLimit(uint16_t max_speed_rpm, bool save_to_chip)
{
  checkRange(
    max_speed_rpm, 100, 6000, channel_.address(), "modify_speed_limit", "max_speed_limit_rpm");

  DriveParameters params = currentDriveParameters();
  params.max_speed_limit_rpm = max_speed_rpm;
  writeDriveParameters(params, save_to_chip);
}

void ModifyParameters::modifyStallProtection(
  bool enabled, uint16_t speed_rpm, uint16_t current_ma, uint16_t time_ms, bool save_to_chip)
{
  const char * op = "modify_stall_protection";
  if (enabled) {
    checkRange(speed_rpm, 1, 100, channel_.address(), op, "stall_protection_speed_rpm");
    checkRange(current_ma, 100, 3000, channel_.address(), op, "stall_protection_current_ma");
    checkRange(time_ms, 100, 5000, channel_.address(), op, "stall_protection_time_ms");
  }

  DriveParameters params = currentDriveParameters();
  params.stall_protection_enabled = enabled;
  params.stall_protection_speed_rpm = speed_rpm;
  params.stall_protection_current_ma = current_ma;
  params.stall_protection_time_ms = time_ms;
  writeDriveParameters(params, save_to_chip);
}

void ModifyParameters::modifyCommunicationSettings(
  uint8_t uart_baudrate, uint8_t can_baudrate, ChecksumMode checksum_mode,
  uint8_t response_mode, bool save_to_chip)
{
  const char * op = "modify_communication_settings";
  checkRange(uart_baudrate, 0, 7, channel_.address(), op, "uart_baudrate");
  checkRange(can_baudrate, 0, 7, channel_.address(), op, "can_baudrate");
  checkRange(static_cast<long>(checksum_mode), 0, 3, channel_.address(), op, "checksum_mode");
  checkRange(response_mode, 0, 4, channel_.address(), op, "response_mode");

  DriveParameters params = currentDriveParameters();
  params.uart_baudrate = uart_baudrate;
  params.can_baudrate = can_baudrate;
  params.checksum_mode = checksum_mode;
  params.response_mode = response_mode;
  writeDriveParameters(params, save_to_chip);
}

void ModifyParameters::modifyDriveParameters(const DriveParameters & params, bool save_to_chip)
{
  validateDriveParameters(params, channel_.address());
  writeDriveParameters(params, save_to_chip);
}

void ModifyParameters::modifyPidParameters(const PidParameters & params, bool save_to_chip)
{
  std::vector<uint8_t> payload{AuxCode::MODIFY_PID_PARAMS, saveByte(save_to_chip)};
  const auto block = Codec::encodePidParameters(params);
  payload.insert(payload.end(), block.begin(), block.end());

  channel_.command(FunctionCode::MODIFY_PID_PARAMS, payload, RetryMode::RETRY_SAFE);
  RCLCPP_INFO(
    channel_.getLogger(), "PID parameters written (save_to_chip=%s)",
    save_to_chip ? "true" : "false");
}

void ModifyParameters::modifySubdivision(uint16_t subdivision, bool save_to_chip)
{
  checkSubdivision(subdivision, channel_.address(), "modify_subdivision");

  channel_.command(
    FunctionCode::MODIFY_SUBDIVISION,
    {AuxCode::MODIFY_SUBDIVISION, saveByte(save_to_chip),
      static_cast<uint8_t>(subdivision == 256 ? 0 : subdivision)},
    RetryMode::RETRY_SAFE);
  state_.invalidateDriveParameters();
  RCLCPP_INFO(
    channel_.getLogger(), "Subdivision set to %u (save_to_chip=%s)", subdivision,
    save_to_chip ? "true" : "false");
}

void ModifyParameters::modifyMotorAddress(uint8_t new_address, bool save_to_chip)
{
  checkRange(new_address, 1, 255, channel_.address(), "modify_address", "new_address");

  channel_.command(
    FunctionCode::MODIFY_ADDRESS,
    {AuxCode::MODIFY_ADDRESS, saveByte(save_to_chip), new_address},
    RetryMode::RETRY_SAFE);
  state_.invalidateDriveParameters();
  RCLCPP_WARN(
    channel_.getLogger(), "Drive address changed to %u (save_to_chip=%s)", new_address,
    save_to_chip ? "true" : "false");
}

void ModifyParameters::writeDriveParameters(const DriveParameters & params, bool save_to_chip)
{
  validateDriveParameters(params, channel_.address());

  std::vector<uint8_t> payload{AuxCode::MODIFY_DRIVE_PARAMS, saveByte(save_to_chip)};
  const auto block = Codec::encodeDriveParameters(params, channel_.address());
  payload.insert(payload.end(), block.begin(), block.end());

  const auto previous = state_.drive_parameters;
  state_.invalidateDriveParameters();
  channel_.command(FunctionCode::MODIFY_DRIVE_PARAMS, payload, RetryMode::RETRY_SAFE);

  if (previous && previous->checksum_mode != params.checksum_mode) {
    RCLCPP_WARN(
      channel_.getLogger(), "Drive checksum mode changed from %s to %s, reconfigure the bus",
      toString(previous->checksum_mode), toString(params.checksum_mode));
  }
  RCLCPP_INFO(
    channel_.getLogger(), "Drive parameters written (save_to_chip=%s)",
    save_to_chip ? "true" : "false");
}

DriveParameters ModifyParameters::currentDriveParameters()
{
  return reader_.getDriveParameters();
}

}  // namespace zdt_can_driver
