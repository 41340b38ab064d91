#ifndef ZDT_CAN_DRIVER__TRANSPORT_HPP_
#define ZDT_CAN_DRIVER__TRANSPORT_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <rclcpp/rclcpp.hpp>

#include "zdt_can_driver/can_interface.hpp"
#include "zdt_can_driver/codec.hpp"
#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Addresses holding a preloaded (deferred) motion command
 *
 * One group per bus. Preloading the same address twice keeps a single
 * entry, the drive overwrites its buffered command.
 */
class SyncGroup
{
public:
  void add(uint8_t address);
  void remove(uint8_t address);
  void clear();

  /**
   * @brief Empty the group and return its former members in one step
   */
  std::vector<uint8_t> takeAll();

  bool contains(uint8_t address) const;
  bool empty() const;
  std::vector<uint8_t> members() const;

private:
  mutable std::mutex mutex_;
  std::set<uint8_t> addresses_;
};

/**
 * @brief One physical CAN connection shared by every controller on the bus
 *
 * All exchanges are serialized by a single bus mutex: a request and its
 * response are never interleaved with another controller's traffic.
 */
class Transport
{
public:
  /**
   * @brief Constructor
   * @param can Raw CAN access, shared with nobody else
   * @param checksum_mode Checksum mode configured on the drives
   * @param logger Logger owned by the caller
   */
  Transport(
    std::shared_ptr<CanInterface> can, ChecksumMode checksum_mode,
    rclcpp::Logger logger = rclcpp::get_logger("zdt_can_driver"));

  ~Transport();

  Transport(const Transport &) = delete;
  Transport & operator=(const Transport &) = delete;

  /**
   * @brief Open the underlying interface
   * @throws ConnectionError if the interface cannot be opened
   */
  void open();

  /**
   * @brief Close the underlying interface, clearing any pending sync group
   */
  void close();

  bool isOpen() const;

  /**
   * @brief Send a frame and block for the matching response
   * @param frame Encoded command
   * @param timeout Response window
   * @return Decoded response
   * @throws TimeoutError, ChecksumError, ProtocolError, ConnectionError
   */
  ResponseFrame sendAndWait(const CommandFrame & frame, std::chrono::milliseconds timeout);

  /**
   * @brief Send a frame without waiting, used only by the sync trigger
   * @throws ConnectionError
   */
  void sendOnly(const CommandFrame & frame);

  /**
   * @brief Cancel every preloaded command on the bus
   *
   * Sends an immediate stop to each member of the sync group, which also
   * clears the command the drive buffered, then empties the group. A member
   * that cannot be stopped is logged and the remaining members are still
   * stopped.
   * @param timeout Response window of each stop
   * @return Number of members that acknowledged the stop
   */
  std::size_t abortSync(std::chrono::milliseconds timeout);

  const Codec & codec() const { return codec_; }
  SyncGroup & syncGroup() { return sync_group_; }
  const SyncGroup & syncGroup() const { return sync_group_; }
  const rclcpp::Logger & getLogger() const { return logger_; }
  const std::string & interfaceName() const { return can_->getInterfaceName(); }

private:
  void writePackets(const CommandFrame & frame);
  void discardPending();
  std::vector<uint8_t> collectResponse(
    uint8_t address, uint8_t function, std::chrono::milliseconds timeout);

  std::shared_ptr<CanInterface> can_;
  Codec codec_;
  rclcpp::Logger logger_;
  SyncGroup sync_group_;
  std::mutex bus_mutex_;  // one exchange in flight per bus
};

/**
 * @brief CAN identifier of a packet: (address << 8) | packet index
 */
inline uint32_t makeCanId(uint8_t address, uint8_t packet_index)
{
  return (static_cast<uint32_t>(address) << 8) | packet_index;
}

/**
 * @brief Split a serial frame into CAN packets
 *
 * The first packet carries the first 8 bytes; each further packet repeats
 * the function code followed by up to 7 more bytes.
 */
std::vector<std::vector<uint8_t>> packetize(const std::vector<uint8_t> & serial);

std::string toHex(const uint8_t * data, std::size_t len);

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__TRANSPORT_HPP_
