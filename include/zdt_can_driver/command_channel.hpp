#ifndef ZDT_CAN_DRIVER__COMMAND_CHANNEL_HPP_
#define ZDT_CAN_DRIVER__COMMAND_CHANNEL_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "zdt_can_driver/transport.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Whether a request may be re-sent after a lost or corrupted reply
 */
enum class RetryMode
{
  RETRY_SAFE,   // reads, enable, stop, parameter writes
  SINGLE_SHOT   // motion starts, homing trigger, maintenance triggers
};

/**
 * @brief Request path of one motor address
 *
 * Encodes, sends through the shared Transport, applies the retry policy
 * and turns device status bytes into CommandError.
 */
class CommandChannel
{
public:
  CommandChannel(
    uint8_t address, std::shared_ptr<Transport> transport, const BusConfig & config,
    rclcpp::Logger logger);

  /**
   * @brief Send a command acknowledged by a status byte
   * @return The success status (SUCCESS or REACHED)
   * @throws CommandError if the drive rejects the command
   * @throws RetryExhaustedError if a RETRY_SAFE request keeps failing
   */
  uint8_t command(uint8_t function, const std::vector<uint8_t> & payload, RetryMode mode);

  /**
   * @brief Send a read request (always RETRY_SAFE)
   * @return Response data between function code and checksum
   */
  std::vector<uint8_t> query(uint8_t function, const std::vector<uint8_t> & payload = {});

  /**
   * @brief Send a deferred command and join the bus sync group
   *
   * Retried like any RETRY_SAFE request. On failure the whole sync group,
   * this address included, is aborted before the error is rethrown.
   */
  void preload(uint8_t function, const std::vector<uint8_t> & payload);

  /**
   * @brief Fire-and-forget frame, only allowed on the broadcast address
   */
  void broadcast(uint8_t function, const std::vector<uint8_t> & payload);

  uint8_t address() const { return address_; }
  bool isBroadcast() const { return address_ == kBroadcastAddress; }
  ConnectionStatus connectionStatus() const { return connection_status_; }
  std::chrono::milliseconds timeout() const { return timeout_; }

  /**
   * @brief Called each time an exchange leaves the motor unreachable
   */
  void setOfflineHandler(std::function<void()> handler) { offline_handler_ = std::move(handler); }

  Transport & transport() { return *transport_; }
  const Transport & transport() const { return *transport_; }
  const rclcpp::Logger & getLogger() const { return logger_; }

private:
  ResponseFrame request(uint8_t function, const std::vector<uint8_t> & payload, RetryMode mode);
  void checkStatus(const ResponseFrame & response, uint8_t function) const;
  void markOffline();

  uint8_t address_;
  std::shared_ptr<Transport> transport_;
  std::chrono::milliseconds timeout_;
  RetryPolicy retry_;
  rclcpp::Logger logger_;
  ConnectionStatus connection_status_{ConnectionStatus::UNKNOWN};
  std::function<void()> offline_handler_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__COMMAND_CHANNEL_HPP_
