#include "zdt_can_driver/types.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>
#include <tuple>

namespace zdt_can_driver
{

ChecksumMode checksumModeFromString(const std::string & name)
{
  std::string lower(name);
  std::transform(
    lower.begin(), lower.end(), lower.begin(),
    [](unsigned char c) {return static_cast<char>(std::tolower(c));});

  if (lower == "fixed" || lower == "0x6b") {
    return ChecksumMode::FIXED_6B;
  }
  if (lower == "xor") {
    return ChecksumMode::XOR;
  }
  if (lower == "crc8") {
    return ChecksumMode::CRC8;
  }
  if (lower == "none") {
    return ChecksumMode::NONE;
  }
  throw std::invalid_argument("unknown checksum mode '" + name + "'");
}

uint16_t currentLimitFromParameter(int64_t value_ma)
{
  if (value_ma < 0 || value_ma > std::numeric_limits<uint16_t>::max()) {
    throw std::invalid_argument(
      "current limit " + std::to_string(value_ma) + " mA outside 0..65535");
  }
  return static_cast<uint16_t>(value_ma);
}

const char * toString(ChecksumMode mode)
{
  switch (mode) {
    case ChecksumMode::FIXED_6B: return "fixed";
    case ChecksumMode::XOR: return "xor";
    case ChecksumMode::CRC8: return "crc8";
    case ChecksumMode::NONE: return "none";
  }
  return "unknown";
}

const char * toString(HomingState state)
{
  switch (state) {
    case HomingState::IDLE: return "idle";
    case HomingState::REQUESTED: return "requested";
    case HomingState::IN_PROGRESS: return "in_progress";
    case HomingState::COMPLETED: return "completed";
    case HomingState::TIMED_OUT: return "timed_out";
    case HomingState::FAILED: return "failed";
  }
  return "unknown";
}

const char * toString(ConnectionStatus status)
{
  switch (status) {
    case ConnectionStatus::UNKNOWN: return "unknown";
    case ConnectionStatus::ONLINE: return "online";
    case ConnectionStatus::OFFLINE: return "offline";
  }
  return "unknown";
}

bool HomingParameters::operator==(const HomingParameters & other) const
{
  return std::tie(
    mode, direction, speed_rpm, timeout_ms, collision_speed_rpm,
    collision_current_ma, collision_time_ms, auto_homing_on_power_up) ==
         std::tie(
    other.mode, other.direction, other.speed_rpm, other.timeout_ms,
    other.collision_speed_rpm, other.collision_current_ma, other.collision_time_ms,
    other.auto_homing_on_power_up);
}

bool DriveParameters::operator==(const DriveParameters & other) const
{
  return std::tie(
    lock_enabled, control_mode, pulse_port_function, serial_port_function,
    enable_pin_mode, motor_direction, subdivision, subdivision_interpolation,
    auto_screen_off, lpf_intensity, open_loop_current_ma, closed_loop_max_current_ma,
    max_speed_limit_rpm, current_loop_bandwidth, uart_baudrate, can_baudrate,
    checksum_mode, response_mode, position_precision_high, stall_protection_enabled,
    stall_protection_speed_rpm, stall_protection_current_ma, stall_protection_time_ms,
    position_arrival_window) ==
         std::tie(
    other.lock_enabled, other.control_mode, other.pulse_port_function,
    other.serial_port_function, other.enable_pin_mode, other.motor_direction,
    other.subdivision, other.subdivision_interpolation, other.auto_screen_off,
    other.lpf_intensity, other.open_loop_current_ma, other.closed_loop_max_current_ma,
    other.max_speed_limit_rpm, other.current_loop_bandwidth, other.uart_baudrate,
    other.can_baudrate, other.checksum_mode, other.response_mode,
    other.position_precision_high, other.stall_protection_enabled,
    other.stall_protection_speed_rpm, other.stall_protection_current_ma,
    other.stall_protection_time_ms, other.position_arrival_window);
}

}  // namespace zdt_can_driver
