#include "zdt_can_driver/homing_commands.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include "zdt_can_driver/codec.hpp"
#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

namespace
{

constexpr uint32_t kMaxHomingTimeoutMs = 600000;

bool isActive(HomingState state)
{
  return state == HomingState::REQUESTED || state == HomingState::IN_PROGRESS;
}

}  // namespace

HomingCommands::HomingCommands(CommandChannel & channel, MotorSoftState & state)
  : channel_(channel),
    state_(state)
{
}

void HomingCommands::triggerHoming(HomingMode mode, bool multi_sync)
{
  if (static_cast<uint8_t>(mode) > static_cast<uint8_t>(HomingMode::LAST_POWER_DOWN)) {
    throw ValidationError(channel_.address(), "trigger_homing", "unknown homing mode");
  }

  const uint8_t mode_byte = static_cast<uint8_t>(mode);
  if (multi_sync) {
    channel_.preload(FunctionCode::TRIGGER_HOMING, {mode_byte, 0x01});
  } else {
    channel_.command(FunctionCode::TRIGGER_HOMING, {mode_byte, 0x00}, RetryMode::SINGLE_SHOT);
  }

  state_.homing.mode = mode;
  state_.homing.last_status = HomingStatus();
  state_.homing.requested_at = std::chrono::steady_clock::now();
  transition(HomingState::REQUESTED);
}

HomingStatus HomingCommands::getHomingStatus()
{
  HomingStatus status = Codec::decodeHomingStatus(
    channel_.query(FunctionCode::READ_HOMING_STATUS).at(0));

  if (isActive(state_.homing.state)) {
    if (status.homing_failed) {
      transition(HomingState::FAILED);
    } else if (status.homing_in_progress) {
      transition(HomingState::IN_PROGRESS);
    } else if (!status.encoder_ready) {
      transition(HomingState::FAILED);
    } else {
      transition(HomingState::COMPLETED);
    }
  }

  status.state = state_.homing.state;
  state_.homing.last_status = status;
  return status;
}

HomingState HomingCommands::waitForHomingComplete(
  std::chrono::milliseconds timeout, std::chrono::milliseconds interval)
{
  if (!isActive(state_.homing.state)) {
    throw ValidationError(
      channel_.address(), "wait_for_homing",
      std::string("no homing in progress (state: ") + toString(state_.homing.state) + ")");
  }

  auto start = std::chrono::steady_clock::now();
  while (true) {
    const HomingState current = getHomingStatus().state;
    if (!isActive(current)) {
      return current;
    }

    auto elapsed = std::chrono::steady_clock::now() - start;
    if (elapsed >= timeout) {
      transition(HomingState::TIMED_OUT);
      RCLCPP_WARN(
        channel_.getLogger(), "Homing not finished within %ld ms",
        static_cast<long>(timeout.count()));
      return HomingState::TIMED_OUT;
    }

    auto remaining = timeout - std::chrono::duration_cast<std::chrono::milliseconds>(elapsed);
    std::this_thread::sleep_for(std::min(interval, remaining));
  }
}

void HomingCommands::abortHoming()
{
  channel_.command(
    FunctionCode::ABORT_HOMING, {AuxCode::ABORT_HOMING}, RetryMode::RETRY_SAFE);
  transition(HomingState::IDLE);
}

void HomingCommands::setZeroPosition(bool save_to_chip)
{
  channel_.command(
    FunctionCode::SET_ZERO_POSITION,
    {AuxCode::SET_ZERO_POSITION, static_cast<uint8_t>(save_to_chip ? 0x01 : 0x00)},
    RetryMode::RETRY_SAFE);
  RCLCPP_INFO(
    channel_.getLogger(), "Zero position set (save_to_chip=%s)", save_to_chip ? "true" : "false");
}

HomingParameters HomingCommands::getHomingParameters()
{
  HomingParameters params = Codec::decodeHomingParameters(
    channel_.query(FunctionCode::READ_HOMING_PARAMS), channel_.address());
  state_.homing.parameters = params;
  return params;
}

void HomingCommands::modifyHomingParameters(const HomingParameters & params, bool save_to_chip)
{
  validateHomingParameters(params, channel_.address());

  std::vector<uint8_t> payload{
    AuxCode::MODIFY_HOMING_PARAMS, static_cast<uint8_t>(save_to_chip ? 0x01 : 0x00)};
  const auto block = Codec::encodeHomingParameters(params);
  payload.insert(payload.end(), block.begin(), block.end());

  channel_.command(FunctionCode::MODIFY_HOMING_PARAMS, payload, RetryMode::RETRY_SAFE);
  state_.homing.parameters = params;
  RCLCPP_INFO(
    channel_.getLogger(), "Homing parameters written (save_to_chip=%s)",
    save_to_chip ? "true" : "false");
}

void HomingCommands::validateHomingParameters(const HomingParameters & params, uint8_t address)
{
  const char * op = "modify_homing_parameters";
  if (static_cast<uint8_t>(params.mode) > static_cast<uint8_t>(HomingMode::LAST_POWER_DOWN)) {
    throw ValidationError(address, op, "homing mode outside 0..5");
  }
  if (static_cast<uint8_t>(params.direction) > 1) {
    throw ValidationError(address, op, "direction outside 0..1");
  }
  if (params.speed_rpm < 1 || params.speed_rpm > 3000) {
    throw ValidationError(
      address, op, "speed " + std::to_string(params.speed_rpm) + " RPM outside 1..3000");
  }
  if (params.timeout_ms > kMaxHomingTimeoutMs) {
    throw ValidationError(
      address, op, "timeout " + std::to_string(params.timeout_ms) + " ms exceeds " +
      std::to_string(kMaxHomingTimeoutMs));
  }
}

void HomingCommands::transition(HomingState next)
{
  if (state_.homing.state == next) {
    return;
  }
  RCLCPP_INFO(
    channel_.getLogger(), "Homing %s -> %s", toString(state_.homing.state), toString(next));
  state_.homing.state = next;
}

}  // namespace zdt_can_driver
