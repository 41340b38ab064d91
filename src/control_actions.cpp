#include "zdt_can_driver/control_actions.hpp"

#include <cmath>
#include <string>
#include <thread>

#include "zdt_can_driver/codec.hpp"
#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

namespace
{

constexpr uint8_t kSyncFlag = 0x01;
constexpr uint8_t kNoSyncFlag = 0x00;
constexpr uint8_t kAbsolute = 0x01;
constexpr uint8_t kRelative = 0x00;

uint8_t syncByte(bool multi_sync)
{
  return multi_sync ? kSyncFlag : kNoSyncFlag;
}

}  // namespace

ControlActions::ControlActions(CommandChannel & channel, const AxisLimits & limits)
  : channel_(channel),
    limits_(limits)
{
}

void ControlActions::enable()
{
  channel_.command(
    FunctionCode::MOTOR_ENABLE, {AuxCode::MOTOR_ENABLE, 0x01, kNoSyncFlag}, RetryMode::RETRY_SAFE);
  RCLCPP_INFO(channel_.getLogger(), "Motor enabled");
}

void ControlActions::disable()
{
  channel_.command(
    FunctionCode::MOTOR_ENABLE, {AuxCode::MOTOR_ENABLE, 0x00, kNoSyncFlag}, RetryMode::RETRY_SAFE);
  RCLCPP_INFO(channel_.getLogger(), "Motor disabled");
}

void ControlActions::stop()
{
  // A stop supersedes any buffered motion
  channel_.transport().syncGroup().remove(channel_.address());
  channel_.command(
    FunctionCode::IMMEDIATE_STOP, {AuxCode::IMMEDIATE_STOP, kNoSyncFlag}, RetryMode::RETRY_SAFE);
  RCLCPP_INFO(channel_.getLogger(), "Motor stopped");
}

void ControlActions::setSpeed(double speed_rpm, double acceleration, bool multi_sync)
{
  const char * op = "speed_mode";
  if (!std::isfinite(speed_rpm)) {
    throw ValidationError(channel_.address(), op, "speed must be a finite number");
  }
  checkSpeed(std::fabs(speed_rpm), op);

  std::vector<uint8_t> payload;
  payload.push_back(static_cast<uint8_t>(wire::directionOf(speed_rpm)));
  wire::putU16(payload, wire::scaleToU16(acceleration, 1.0, channel_.address(), "acceleration"));
  wire::putU16(
    payload, wire::scaleToU16(std::fabs(speed_rpm), kSpeedScale, channel_.address(), op));
  payload.push_back(syncByte(multi_sync));

  sendMotion(FunctionCode::SPEED_MODE, payload, multi_sync);
  RCLCPP_INFO(
    channel_.getLogger(), "Speed mode: %.1f RPM, accel %.0f%s", speed_rpm, acceleration,
    multi_sync ? " (preloaded)" : "");
}

void ControlActions::moveToPosition(
  double position_deg, double speed_rpm, bool multi_sync, bool absolute)
{
  const char * op = "position_direct";
  checkSpeed(speed_rpm, op);
  checkPosition(position_deg, absolute, op);

  std::vector<uint8_t> payload;
  payload.push_back(static_cast<uint8_t>(wire::directionOf(position_deg)));
  wire::putU16(payload, wire::scaleToU16(speed_rpm, kSpeedScale, channel_.address(), op));
  wire::putU32(
    payload, wire::scaleToU32(std::fabs(position_deg), kPositionScale, channel_.address(), op));
  payload.push_back(absolute ? kAbsolute : kRelative);
  payload.push_back(syncByte(multi_sync));

  sendMotion(FunctionCode::POSITION_DIRECT, payload, multi_sync);
  RCLCPP_INFO(
    channel_.getLogger(), "Move %s %.1f deg at %.1f RPM%s", absolute ? "to" : "by",
    position_deg, speed_rpm, multi_sync ? " (preloaded)" : "");
}

void ControlActions::moveToPositionTrapezoid(
  double position_deg, double max_speed_rpm, double acceleration, double deceleration,
  bool multi_sync, bool absolute)
{
  const char * op = "position_trapezoid";
  checkSpeed(max_speed_rpm, op);
  checkPosition(position_deg, absolute, op);

  std::vector<uint8_t> payload;
  payload.push_back(static_cast<uint8_t>(wire::directionOf(position_deg)));
  wire::putU16(payload, wire::scaleToU16(acceleration, 1.0, channel_.address(), "acceleration"));
  wire::putU16(payload, wire::scaleToU16(deceleration, 1.0, channel_.address(), "deceleration"));
  wire::putU16(payload, wire::scaleToU16(max_speed_rpm, kSpeedScale, channel_.address(), op));
  wire::putU32(
    payload, wire::scaleToU32(std::fabs(position_deg), kPositionScale, channel_.address(), op));
  payload.push_back(absolute ? kAbsolute : kRelative);
  payload.push_back(syncByte(multi_sync));

  sendMotion(FunctionCode::POSITION_TRAPEZOID, payload, multi_sync);
  RCLCPP_INFO(
    channel_.getLogger(), "Trapezoid move %s %.1f deg, max %.1f RPM%s", absolute ? "to" : "by",
    position_deg, max_speed_rpm, multi_sync ? " (preloaded)" : "");
}

void ControlActions::setTorque(double current_ma, double current_slope, bool multi_sync)
{
  const char * op = "torque_mode";
  if (!std::isfinite(current_ma) || std::fabs(current_ma) > limits_.max_current_ma) {
    throw ValidationError(
      channel_.address(), op,
      "current " + std::to_string(current_ma) + " mA exceeds limit of " +
      std::to_string(limits_.max_current_ma) + " mA");
  }

  std::vector<uint8_t> payload;
  payload.push_back(static_cast<uint8_t>(wire::directionOf(current_ma)));
  wire::putU16(payload, wire::scaleToU16(current_slope, 1.0, channel_.address(), "current_slope"));
  wire::putU16(payload, wire::scaleToU16(std::fabs(current_ma), 1.0, channel_.address(), op));
  payload.push_back(syncByte(multi_sync));

  sendMotion(FunctionCode::TORQUE_MODE, payload, multi_sync);
  RCLCPP_INFO(
    channel_.getLogger(), "Torque mode: %.0f mA%s", current_ma,
    multi_sync ? " (preloaded)" : "");
}

bool ControlActions::syncMotion()
{
  if (!channel_.isBroadcast()) {
    throw ValidationError(
      channel_.address(), "sync_motion", "sync trigger must be sent from the broadcast address");
  }

  SyncGroup & group = channel_.transport().syncGroup();
  const std::vector<uint8_t> members = group.takeAll();
  if (members.empty()) {
    RCLCPP_DEBUG(channel_.getLogger(), "Sync trigger skipped, no motor preloaded");
    return false;
  }

  try {
    channel_.broadcast(FunctionCode::SYNC_MOTION, {AuxCode::SYNC_MOTION});
  } catch (const DriverError &) {
    // Trigger not sent, the drives still hold their commands
    for (uint8_t address : members) {
      group.add(address);
    }
    throw;
  }
  RCLCPP_INFO(channel_.getLogger(), "Sync trigger sent to %zu motors", members.size());
  return true;
}

std::size_t ControlActions::abortSync()
{
  return channel_.transport().abortSync(channel_.timeout());
}

bool ControlActions::isEnabled()
{
  return Codec::decodeMotorStatus(readMotorFlags()).enabled;
}

bool ControlActions::isInPosition()
{
  return Codec::decodeMotorStatus(readMotorFlags()).in_position;
}

bool ControlActions::isStalled()
{
  const MotorStatus status = Codec::decodeMotorStatus(readMotorFlags());
  return status.stalled || status.stall_protection;
}

bool ControlActions::waitForPosition(
  std::chrono::milliseconds timeout, std::chrono::milliseconds interval)
{
  auto start = std::chrono::steady_clock::now();
  while (true) {
    if (isInPosition()) {
      return true;
    }
    if (std::chrono::steady_clock::now() - start >= timeout) {
      RCLCPP_WARN(
        channel_.getLogger(), "Position not reached within %ld ms",
        static_cast<long>(timeout.count()));
      return false;
    }
    std::this_thread::sleep_for(interval);
  }
}

void ControlActions::sendMotion(
  uint8_t function, const std::vector<uint8_t> & payload, bool multi_sync)
{
  if (multi_sync) {
    channel_.preload(function, payload);
  } else {
    channel_.command(function, payload, RetryMode::SINGLE_SHOT);
  }
}

void ControlActions::validateMove(double position_deg, double speed_rpm, bool absolute) const
{
  checkSpeed(speed_rpm, "position_trapezoid");
  checkPosition(position_deg, absolute, "position_trapezoid");
}

void ControlActions::checkSpeed(double speed_rpm, const char * operation) const
{
  if (!std::isfinite(speed_rpm) || speed_rpm < 0.0) {
    throw ValidationError(channel_.address(), operation, "speed must be >= 0");
  }
  if (speed_rpm > limits_.max_speed_rpm) {
    throw ValidationError(
      channel_.address(), operation,
      "speed " + std::to_string(speed_rpm) + " RPM exceeds limit of " +
      std::to_string(limits_.max_speed_rpm) + " RPM");
  }
}

void ControlActions::checkPosition(double position_deg, bool absolute, const char * operation) const
{
  if (!std::isfinite(position_deg)) {
    throw ValidationError(channel_.address(), operation, "position must be a finite number");
  }
  if (!absolute) {
    return;
  }
  if ((limits_.min_position_deg && position_deg < *limits_.min_position_deg) ||
    (limits_.max_position_deg && position_deg > *limits_.max_position_deg))
  {
    throw ValidationError(
      channel_.address(), operation,
      "position " + std::to_string(position_deg) + " deg outside joint limits");
  }
}

uint8_t ControlActions::readMotorFlags()
{
  return channel_.query(FunctionCode::READ_MOTOR_STATUS).at(0);
}

}  // namespace zdt_can_driver
