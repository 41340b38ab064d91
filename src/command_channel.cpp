#include "zdt_can_driver/command_channel.hpp"

#include <thread>

#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

CommandChannel::CommandChannel(
  uint8_t address, std::shared_ptr<Transport> transport, const BusConfig & config,
  rclcpp::Logger logger)
  : address_(address),
    transport_(std::move(transport)),
    timeout_(config.response_timeout),
    retry_(config.retry),
    logger_(logger)
{
  if (!transport_) {
    throw ConnectionError(address_, "motor_controller", "no transport given");
  }
  if (retry_.max_retries < 1) {
    throw ValidationError(address_, "motor_controller", "max_retries must be at least 1");
  }
}

uint8_t CommandChannel::command(
  uint8_t function, const std::vector<uint8_t> & payload, RetryMode mode)
{
  ResponseFrame response = request(function, payload, mode);
  checkStatus(response, function);
  return response.status;
}

std::vector<uint8_t> CommandChannel::query(uint8_t function, const std::vector<uint8_t> & payload)
{
  ResponseFrame response = request(function, payload, RetryMode::RETRY_SAFE);
  if (response.function == FunctionCode::ERROR_REPLY) {
    checkStatus(response, function);
  }
  return response.payload;
}

void CommandChannel::preload(uint8_t function, const std::vector<uint8_t> & payload)
{
  SyncGroup & group = transport_->syncGroup();
  try {
    command(function, payload, RetryMode::RETRY_SAFE);
  } catch (const DriverError & e) {
    RCLCPP_WARN(logger_, "Preload failed, aborting synchronized group: %s", e.what());
    // A lost reply does not mean the drive dropped the command
    if (!isBroadcast()) {
      group.add(address_);
    }
    transport_->abortSync(timeout_);
    throw;
  }
  group.add(address_);
}

void CommandChannel::broadcast(uint8_t function, const std::vector<uint8_t> & payload)
{
  if (!isBroadcast()) {
    throw ValidationError(
      address_, functionName(function), "broadcast frames are sent from address 0 only");
  }
  transport_->sendOnly(transport_->codec().encode(function, address_, payload));
}

ResponseFrame CommandChannel::request(
  uint8_t function, const std::vector<uint8_t> & payload, RetryMode mode)
{
  if (isBroadcast()) {
    throw ValidationError(
      address_, functionName(function),
      "the broadcast address only triggers synchronized motion");
  }

  const CommandFrame frame = transport_->codec().encode(function, address_, payload);
  const int attempts = mode == RetryMode::RETRY_SAFE ? retry_.max_retries : 1;
  std::exception_ptr last_cause;

  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      ResponseFrame response = transport_->sendAndWait(frame, timeout_);
      connection_status_ = ConnectionStatus::ONLINE;
      return response;
    } catch (const TimeoutError & e) {
      markOffline();
      last_cause = std::current_exception();
      RCLCPP_WARN(logger_, "%s (attempt %d/%d)", e.what(), attempt, attempts);
    } catch (const ChecksumError & e) {
      connection_status_ = ConnectionStatus::ONLINE;
      last_cause = std::current_exception();
      RCLCPP_WARN(logger_, "%s (attempt %d/%d)", e.what(), attempt, attempts);
    } catch (const ConnectionError &) {
      markOffline();
      throw;
    }

    if (attempt < attempts && retry_.retry_delay.count() > 0) {
      std::this_thread::sleep_for(retry_.retry_delay);
    }
  }

  if (mode == RetryMode::SINGLE_SHOT) {
    std::rethrow_exception(last_cause);
  }

  RetryExhaustedError error(address_, functionName(function), attempts, last_cause);
  RCLCPP_ERROR(logger_, "%s", error.what());
  throw error;
}

void CommandChannel::markOffline()
{
  connection_status_ = ConnectionStatus::OFFLINE;
  if (offline_handler_) {
    offline_handler_();
  }
}

void CommandChannel::checkStatus(const ResponseFrame & response, uint8_t function) const
{
  const char * op = functionName(function);

  if (response.function == FunctionCode::ERROR_REPLY) {
    throw CommandError(address_, op, response.status, "drive reported a malformed command");
  }

  switch (response.status) {
    case StatusCode::SUCCESS:
    case StatusCode::REACHED:
      return;
    case StatusCode::CONDITION_NOT_MET:
      throw CommandError(address_, op, response.status, "condition not met");
    case StatusCode::COMMAND_ERROR:
      throw CommandError(address_, op, response.status, "command rejected");
    default:
      throw CommandError(
        address_, op, response.status,
        "unexpected status " + std::to_string(response.status));
  }
}

}  // namespace zdt_can_driver
