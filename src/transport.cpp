#include "zdt_can_driver/transport.hpp"

#include <algorithm>
#include <cstdio>

#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

namespace
{

constexpr int kMaxStaleFrames = 64;

}  // namespace

// ============================================================================
// SyncGroup
// ============================================================================

void SyncGroup::add(uint8_t address)
{
  std::lock_guard<std::mutex> lock(mutex_);
  addresses_.insert(address);
}

void SyncGroup::remove(uint8_t address)
{
  std::lock_guard<std::mutex> lock(mutex_);
  addresses_.erase(address);
}

void SyncGroup::clear()
{
  std::lock_guard<std::mutex> lock(mutex_);
  addresses_.clear();
}

std::vector<uint8_t> SyncGroup::takeAll()
{
  std::set<uint8_t> taken;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    taken.swap(addresses_);
  }
  return std::vector<uint8_t>(taken.begin(), taken.end());
}

bool SyncGroup::contains(uint8_t address) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return addresses_.count(address) > 0;
}

bool SyncGroup::empty() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return addresses_.empty();
}

std::vector<uint8_t> SyncGroup::members() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<uint8_t>(addresses_.begin(), addresses_.end());
}

// ============================================================================
// Helpers
// ============================================================================

std::vector<std::vector<uint8_t>> packetize(const std::vector<uint8_t> & serial)
{
  std::vector<std::vector<uint8_t>> packets;
  if (serial.empty()) {
    return packets;
  }

  const std::size_t first = std::min(serial.size(), kCanPacketLength);
  packets.emplace_back(serial.begin(), serial.begin() + first);

  std::size_t offset = first;
  while (offset < serial.size()) {
    const std::size_t chunk = std::min(serial.size() - offset, kCanPacketLength - 1);
    std::vector<uint8_t> packet;
    packet.reserve(chunk + 1);
    packet.push_back(serial[0]);
    packet.insert(packet.end(), serial.begin() + offset, serial.begin() + offset + chunk);
    packets.push_back(std::move(packet));
    offset += chunk;
  }
  return packets;
}

std::string toHex(const uint8_t * data, std::size_t len)
{
  std::string out;
  out.reserve(len * 3);
  char buf[4];
  for (std::size_t i = 0; i < len; ++i) {
    std::snprintf(buf, sizeof(buf), i == 0 ? "%02X" : " %02X", data[i]);
    out += buf;
  }
  return out;
}

// ============================================================================
// Transport
// ============================================================================

Transport::Transport(
  std::shared_ptr<CanInterface> can, ChecksumMode checksum_mode, rclcpp::Logger logger)
  : can_(std::move(can)),
    codec_(checksum_mode),
    logger_(logger)
{
  if (!can_) {
    throw ConnectionError(kBroadcastAddress, "transport", "no CAN interface given");
  }
}

Transport::~Transport()
{
  close();
}

void Transport::open()
{
  std::lock_guard<std::mutex> lock(bus_mutex_);

  if (!can_->open()) {
    throw ConnectionError(
      kBroadcastAddress, "open", "failed to open CAN interface " + can_->getInterfaceName());
  }
  RCLCPP_INFO(
    logger_, "CAN interface %s opened (checksum: %s)",
    can_->getInterfaceName().c_str(), toString(codec_.checksumMode()));
}

void Transport::close()
{
  std::lock_guard<std::mutex> lock(bus_mutex_);

  if (!sync_group_.empty()) {
    RCLCPP_WARN(logger_, "Closing bus with preloaded motion pending, sync group discarded");
    sync_group_.clear();
  }
  if (can_->isOpen()) {
    can_->close();
    RCLCPP_INFO(logger_, "CAN interface %s closed", can_->getInterfaceName().c_str());
  }
}

bool Transport::isOpen() const
{
  return can_->isOpen();
}

ResponseFrame Transport::sendAndWait(const CommandFrame & frame, std::chrono::milliseconds timeout)
{
  std::lock_guard<std::mutex> lock(bus_mutex_);

  discardPending();
  writePackets(frame);

  std::vector<uint8_t> raw = collectResponse(frame.address, frame.function, timeout);
  RCLCPP_DEBUG(
    logger_, "RX %02X: %s", frame.address, toHex(raw.data(), raw.size()).c_str());

  ResponseFrame response = codec_.decode(raw, frame.address);
  if (response.function != frame.function && response.function != FunctionCode::ERROR_REPLY) {
    throw ProtocolError(
      frame.address, functionName(frame.function),
      std::string("reply carries function ") + functionName(response.function));
  }
  return response;
}

void Transport::sendOnly(const CommandFrame & frame)
{
  std::lock_guard<std::mutex> lock(bus_mutex_);
  writePackets(frame);
}

std::size_t Transport::abortSync(std::chrono::milliseconds timeout)
{
  const std::vector<uint8_t> members = sync_group_.takeAll();
  if (members.empty()) {
    return 0;
  }

  RCLCPP_WARN(logger_, "Aborting synchronized motion, stopping %zu motors", members.size());

  std::size_t stopped = 0;
  for (uint8_t address : members) {
    try {
      const ResponseFrame response = sendAndWait(
        codec_.encode(FunctionCode::IMMEDIATE_STOP, address, {AuxCode::IMMEDIATE_STOP, 0x00}),
        timeout);
      if (response.function == FunctionCode::IMMEDIATE_STOP &&
        (response.status == StatusCode::SUCCESS || response.status == StatusCode::REACHED))
      {
        ++stopped;
        continue;
      }
      RCLCPP_ERROR(
        logger_, "Motor %u refused the stop (status 0x%02X), its preloaded command may remain",
        address, response.status);
    } catch (const DriverError & e) {
      RCLCPP_ERROR(
        logger_, "Failed to stop motor %u, its preloaded command may remain: %s",
        address, e.what());
    }
  }
  return stopped;
}

void Transport::writePackets(const CommandFrame & frame)
{
  if (!can_->isOpen()) {
    throw ConnectionError(frame.address, functionName(frame.function), "CAN interface is closed");
  }

  const std::vector<uint8_t> serial = frame.serialize();
  RCLCPP_DEBUG(
    logger_, "TX %02X: %s", frame.address, toHex(serial.data(), serial.size()).c_str());

  const auto packets = packetize(serial);
  for (std::size_t i = 0; i < packets.size(); ++i) {
    const auto & packet = packets[i];
    if (!can_->sendFrame(
        makeCanId(frame.address, static_cast<uint8_t>(i)), packet.data(),
        static_cast<uint8_t>(packet.size())))
    {
      throw ConnectionError(
        frame.address, functionName(frame.function),
        "failed to write packet " + std::to_string(i) + " on " + can_->getInterfaceName());
    }
  }
}

void Transport::discardPending()
{
  // Late replies from a previous timed-out exchange would be taken for ours
  for (int i = 0; i < kMaxStaleFrames; ++i) {
    auto stale = can_->receiveFrame(0);
    if (!stale) {
      return;
    }
    RCLCPP_DEBUG(
      logger_, "Discarding stale frame id=0x%X: %s", stale->id,
      toHex(stale->data, stale->len).c_str());
  }
}

std::vector<uint8_t> Transport::collectResponse(
  uint8_t address, uint8_t function, std::chrono::milliseconds timeout)
{
  const std::size_t width = Codec::checksumWidth(codec_.checksumMode());
  const std::size_t error_reply_length = 2 + width;
  std::size_t expected = codec_.expectedResponseLength(function).value_or(kMaxFrameLength);

  std::vector<uint8_t> raw;
  auto start = std::chrono::steady_clock::now();

  while (true) {
    auto elapsed = std::chrono::steady_clock::now() - start;
    int remaining_ms = static_cast<int>(
      timeout.count() -
      std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());

    if (remaining_ms <= 0) {
      throw TimeoutError(
        address, functionName(function),
        "no complete response within " + std::to_string(timeout.count()) + " ms (" +
        std::to_string(raw.size()) + " bytes received)");
    }

    if (!can_->isOpen()) {
      throw ConnectionError(address, functionName(function), "CAN interface closed while waiting");
    }

    auto packet = can_->receiveFrame(remaining_ms);
    if (!packet) {
      continue;
    }
    if ((packet->id >> 8) != address || packet->len == 0) {
      // Traffic for another address
      continue;
    }

    if (raw.empty()) {
      raw.assign(packet->data, packet->data + packet->len);
      if (raw[0] == FunctionCode::ERROR_REPLY) {
        expected = error_reply_length;
      }
    } else {
      // Continuation packets repeat the function code
      raw.insert(raw.end(), packet->data + 1, packet->data + packet->len);
    }

    if (raw.size() >= expected || packet->len < kCanPacketLength) {
      return raw;
    }
  }
}

}  // namespace zdt_can_driver
