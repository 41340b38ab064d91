#ifndef ZDT_CAN_DRIVER__CAN_INTERFACE_HPP_
#define ZDT_CAN_DRIVER__CAN_INTERFACE_HPP_

#include <mutex>
#include <optional>
#include <string>

#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Raw CAN access used by the Transport
 *
 * Sends and receives single classic CAN frames with 29-bit identifiers.
 * Implementations report failures through their return values; the
 * Transport turns them into typed errors.
 */
class CanInterface
{
public:
  virtual ~CanInterface() = default;

  /**
   * @brief Open the interface
   * @return true if successful
   */
  virtual bool open() = 0;

  /**
   * @brief Close the interface
   */
  virtual void close() = 0;

  virtual bool isOpen() const = 0;

  /**
   * @brief Send one extended CAN frame
   * @param id 29-bit CAN ID
   * @param data Data bytes
   * @param len Data length (0..8)
   * @return true if the frame was written
   */
  virtual bool sendFrame(uint32_t id, const uint8_t * data, uint8_t len) = 0;

  /**
   * @brief Receive one frame
   * @param timeout_ms Timeout in milliseconds
   * @return Frame if received, nullopt on timeout/error
   */
  virtual std::optional<CanFrame> receiveFrame(int timeout_ms) = 0;

  virtual const std::string & getInterfaceName() const = 0;
};

/**
 * @brief SocketCAN implementation for Linux
 */
class SocketCanInterface : public CanInterface
{
public:
  /**
   * @brief Constructor
   * @param interface_name SocketCAN interface name (e.g., "can0")
   */
  explicit SocketCanInterface(const std::string & interface_name);

  /**
   * @brief Destructor - closes socket if open
   */
  ~SocketCanInterface() override;

  SocketCanInterface(const SocketCanInterface &) = delete;
  SocketCanInterface & operator=(const SocketCanInterface &) = delete;

  bool open() override;
  void close() override;
  bool isOpen() const override;
  bool sendFrame(uint32_t id, const uint8_t * data, uint8_t len) override;
  std::optional<CanFrame> receiveFrame(int timeout_ms) override;

  const std::string & getInterfaceName() const override { return interface_name_; }

private:
  std::string interface_name_;
  int socket_fd_{-1};
  mutable std::mutex mutex_;  // Thread safety for socket operations
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__CAN_INTERFACE_HPP_
