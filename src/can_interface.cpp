#include "zdt_can_driver/can_interface.hpp"

#include <algorithm>
#include <cstring>
#include <sys/socket.h>
#include <sys/ioctl.h>
#include <net/if.h>
#include <linux/can.h>
#include <linux/can/raw.h>
#include <unistd.h>
#include <poll.h>

namespace zdt_can_driver
{

SocketCanInterface::SocketCanInterface(const std::string & interface_name)
  : interface_name_(interface_name)
{
}

SocketCanInterface::~SocketCanInterface()
{
  close();
}

bool SocketCanInterface::open()
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (socket_fd_ >= 0) {
    return true;  // Already open
  }

  socket_fd_ = socket(PF_CAN, SOCK_RAW, CAN_RAW);
  if (socket_fd_ < 0) {
    return false;
  }

  // Drives only answer with extended identifiers
  struct can_filter filter;
  filter.can_id = CAN_EFF_FLAG;
  filter.can_mask = CAN_EFF_FLAG | CAN_RTR_FLAG;
  if (setsockopt(socket_fd_, SOL_CAN_RAW, CAN_RAW_FILTER, &filter, sizeof(filter)) < 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
    return false;
  }

  struct ifreq ifr;
  std::memset(&ifr, 0, sizeof(ifr));
  std::strncpy(ifr.ifr_name, interface_name_.c_str(), IFNAMSIZ - 1);

  if (ioctl(socket_fd_, SIOCGIFINDEX, &ifr) < 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
    return false;
  }

  struct sockaddr_can addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.can_family = AF_CAN;
  addr.can_ifindex = ifr.ifr_ifindex;

  if (bind(socket_fd_, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) < 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
    return false;
  }

  return true;
}

void SocketCanInterface::close()
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (socket_fd_ >= 0) {
    ::close(socket_fd_);
    socket_fd_ = -1;
  }
}

bool SocketCanInterface::isOpen() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return socket_fd_ >= 0;
}

bool SocketCanInterface::sendFrame(uint32_t id, const uint8_t * data, uint8_t len)
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (socket_fd_ < 0 || len > CAN_MAX_DLEN) {
    return false;
  }

  struct can_frame frame;
  std::memset(&frame, 0, sizeof(frame));
  frame.can_id = (id & CAN_EFF_MASK) | CAN_EFF_FLAG;
  frame.can_dlc = len;

  if (data && len > 0) {
    std::memcpy(frame.data, data, len);
  }

  ssize_t nbytes = write(socket_fd_, &frame, sizeof(frame));
  return nbytes == static_cast<ssize_t>(sizeof(frame));
}

std::optional<CanFrame> SocketCanInterface::receiveFrame(int timeout_ms)
{
  std::lock_guard<std::mutex> lock(mutex_);

  if (socket_fd_ < 0) {
    return std::nullopt;
  }

  struct pollfd pfd;
  pfd.fd = socket_fd_;
  pfd.events = POLLIN;

  int ret = poll(&pfd, 1, std::max(timeout_ms, 0));
  if (ret <= 0) {
    return std::nullopt;  // Timeout or error
  }

  struct can_frame frame;
  ssize_t nbytes = read(socket_fd_, &frame, sizeof(frame));
  if (nbytes < static_cast<ssize_t>(sizeof(frame))) {
    return std::nullopt;
  }

  CanFrame result;
  result.id = frame.can_id & CAN_EFF_MASK;
  result.len = std::min<uint8_t>(frame.can_dlc, CAN_MAX_DLEN);
  std::memcpy(result.data, frame.data, result.len);

  return result;
}

}  // namespace zdt_can_driver
