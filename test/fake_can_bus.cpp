#include "fake_can_bus.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

#include "zdt_can_driver/codec.hpp"
#include "zdt_can_driver/transport.hpp"

namespace zdt_can_driver
{
namespace test
{

namespace
{

constexpr uint8_t kAck = StatusCode::SUCCESS;

void putSigned(std::vector<uint8_t> & out, double value, std::size_t width, double scale)
{
  out.push_back(value < 0.0 ? 0x01 : 0x00);
  const uint32_t magnitude = static_cast<uint32_t>(std::llround(std::fabs(value) * scale));
  for (std::size_t i = width; i > 0; --i) {
    out.push_back(static_cast<uint8_t>((magnitude >> (8 * (i - 1))) & 0xFF));
  }
}

double signedValue(uint8_t direction, uint32_t magnitude, double scale)
{
  const double value = magnitude / scale;
  return direction == 0x01 ? -value : value;
}

std::vector<uint8_t> tail(const std::vector<uint8_t> & payload, std::size_t from)
{
  return std::vector<uint8_t>(payload.begin() + from, payload.end());
}

}  // namespace

FakeCanBus::FakeCanBus(ChecksumMode mode, const std::string & name)
  : mode_(mode),
    name_(name)
{
}

bool FakeCanBus::open()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_fails_) {
    return false;
  }
  open_ = true;
  return true;
}

void FakeCanBus::close()
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
  }
  rx_cv_.notify_all();
}

bool FakeCanBus::isOpen() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

bool FakeCanBus::sendFrame(uint32_t id, const uint8_t * data, uint8_t len)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_ || write_fails_ || len == 0 || len > kCanPacketLength) {
      return false;
    }
    ++packet_count_;
    handlePacket(static_cast<uint8_t>(id >> 8), static_cast<uint8_t>(id & 0xFF), data, len);
  }
  rx_cv_.notify_all();
  return true;
}

std::optional<CanFrame> FakeCanBus::receiveFrame(int timeout_ms)
{
  std::unique_lock<std::mutex> lock(mutex_);
  if (rx_queue_.empty() && timeout_ms > 0) {
    rx_cv_.wait_for(
      lock, std::chrono::milliseconds(timeout_ms),
      [this]() {return !rx_queue_.empty() || !open_;});
  }
  if (rx_queue_.empty()) {
    return std::nullopt;
  }

  CanFrame frame = rx_queue_.front();
  rx_queue_.pop_front();
  if (rx_queue_.empty()) {
    awaiting_.reset();
  }
  return frame;
}

// ============================================================================
// Setup and fault injection
// ============================================================================

void FakeCanBus::addDrive(uint8_t address)
{
  std::lock_guard<std::mutex> lock(mutex_);
  drives_[address];
}

FakeCanBus::Drive & FakeCanBus::drive(uint8_t address)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = drives_.find(address);
  if (it == drives_.end()) {
    throw std::out_of_range("no simulated drive at address " + std::to_string(address));
  }
  return it->second;
}

void FakeCanBus::setOpenFails(bool fails)
{
  std::lock_guard<std::mutex> lock(mutex_);
  open_fails_ = fails;
}

void FakeCanBus::setWriteFails(bool fails)
{
  std::lock_guard<std::mutex> lock(mutex_);
  write_fails_ = fails;
}

void FakeCanBus::powerCycle()
{
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto & entry : drives_) {
    Drive & d = entry.second;
    d.ram = d.flash;
    d.homing_ram = d.homing_flash;
    d.enabled = false;
    d.speed_rpm = 0.0;
    d.preload.reset();
    d.homing_active = false;
    d.homing_script.clear();
  }
}

void FakeCanBus::dropResponses(uint8_t address, int count)
{
  std::lock_guard<std::mutex> lock(mutex_);
  drop_counts_[address] = count;
}

void FakeCanBus::corruptNextResponse(uint8_t address)
{
  std::lock_guard<std::mutex> lock(mutex_);
  corrupt_next_[address] = true;
}

void FakeCanBus::rejectNext(uint8_t address, uint8_t function, uint8_t status)
{
  std::lock_guard<std::mutex> lock(mutex_);
  reject_next_[address] = std::make_pair(function, status);
}

void FakeCanBus::scriptHoming(uint8_t address, const std::vector<uint8_t> & flags)
{
  std::lock_guard<std::mutex> lock(mutex_);
  auto & script = drives_[address].homing_script;
  script.assign(flags.begin(), flags.end());
}

void FakeCanBus::injectFrame(const CanFrame & frame)
{
  {
    std::lock_guard<std::mutex> lock(mutex_);
    rx_queue_.push_back(frame);
  }
  rx_cv_.notify_all();
}

std::vector<FakeCanBus::LoggedCommand> FakeCanBus::commands() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return log_;
}

std::size_t FakeCanBus::commandCount(uint8_t function) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto & entry : log_) {
    if (entry.function == function) {
      ++count;
    }
  }
  return count;
}

std::size_t FakeCanBus::packetCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return packet_count_;
}

void FakeCanBus::clearLog()
{
  std::lock_guard<std::mutex> lock(mutex_);
  log_.clear();
  packet_count_ = 0;
}

bool FakeCanBus::interleaved() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return interleaved_;
}

// ============================================================================
// Simulation
// ============================================================================

std::size_t FakeCanBus::commandLength(uint8_t function) const
{
  static const std::map<uint8_t, std::size_t> kPayloadLength = {
    {FunctionCode::MOTOR_ENABLE, 3},
    {FunctionCode::TORQUE_MODE, 6},
    {FunctionCode::SPEED_MODE, 6},
    {FunctionCode::POSITION_DIRECT, 9},
    {FunctionCode::POSITION_TRAPEZOID, 13},
    {FunctionCode::IMMEDIATE_STOP, 2},
    {FunctionCode::SYNC_MOTION, 1},
    {FunctionCode::SET_ZERO_POSITION, 2},
    {FunctionCode::TRIGGER_HOMING, 2},
    {FunctionCode::ABORT_HOMING, 1},
    {FunctionCode::MODIFY_HOMING_PARAMS, 17},
    {FunctionCode::ENCODER_CALIBRATION, 1},
    {FunctionCode::CLEAR_POSITION, 1},
    {FunctionCode::RELEASE_STALL_PROTECTION, 1},
    {FunctionCode::FACTORY_RESET, 1},
    {FunctionCode::READ_DRIVE_PARAMS, 1},
    {FunctionCode::READ_SYSTEM_STATUS, 1},
    {FunctionCode::MODIFY_DRIVE_PARAMS, 34},
    {FunctionCode::MODIFY_PID_PARAMS, 18},
    {FunctionCode::MODIFY_SUBDIVISION, 3},
    {FunctionCode::MODIFY_ADDRESS, 3},
  };

  auto it = kPayloadLength.find(function);
  const std::size_t payload = it != kPayloadLength.end() ? it->second : 0;
  return 1 + payload + Codec::checksumWidth(mode_);
}

void FakeCanBus::handlePacket(
  uint8_t address, uint8_t index, const uint8_t * data, uint8_t len)
{
  if (index == 0) {
    if (awaiting_) {
      interleaved_ = true;
    }
    for (const auto & entry : partial_) {
      if (entry.first != address) {
        interleaved_ = true;
      }
    }
    partial_[address].assign(data, data + len);
  } else {
    auto it = partial_.find(address);
    if (it == partial_.end()) {
      return;
    }
    it->second.insert(it->second.end(), data + 1, data + len);
  }

  auto & serial = partial_[address];
  if (serial.size() >= commandLength(serial[0])) {
    std::vector<uint8_t> complete = std::move(serial);
    partial_.erase(address);
    dispatch(address, complete);
  }
}

void FakeCanBus::dispatch(uint8_t address, const std::vector<uint8_t> & serial)
{
  const std::size_t width = Codec::checksumWidth(mode_);
  const std::vector<uint8_t> body(serial.begin(), serial.end() - width);

  LoggedCommand entry{address, body[0], tail(body, 1), false};

  if (address == kBroadcastAddress) {
    if (body[0] == FunctionCode::SYNC_MOTION) {
      for (auto & d : drives_) {
        if (d.second.preload) {
          const std::vector<uint8_t> preload = *d.second.preload;
          d.second.preload.reset();
          applyMotion(d.second, preload[0], tail(preload, 1));
        }
      }
    }
    log_.push_back(entry);
    return;
  }

  auto drive_it = drives_.find(address);
  if (drive_it == drives_.end()) {
    log_.push_back(entry);
    return;
  }

  auto drop = drop_counts_.find(address);
  if (drop != drop_counts_.end() && drop->second > 0) {
    --drop->second;
    log_.push_back(entry);
    return;
  }

  entry.answered = true;
  log_.push_back(entry);

  if (width > 0 && serial.back() != Codec::computeChecksum(mode_, address, body)) {
    reply(address, {FunctionCode::ERROR_REPLY, StatusCode::COMMAND_ERROR});
    return;
  }

  auto reject = reject_next_.find(address);
  if (reject != reject_next_.end() && reject->second.first == body[0]) {
    const uint8_t status = reject->second.second;
    reject_next_.erase(reject);
    reply(address, {body[0], status});
    return;
  }

  auto response = execute(address, drive_it->second, body[0], tail(body, 1));
  if (!response) {
    reply(address, {FunctionCode::ERROR_REPLY, StatusCode::COMMAND_ERROR});
    return;
  }
  reply(address, *response);
}

std::optional<std::vector<uint8_t>> FakeCanBus::execute(
  uint8_t address, Drive & drive, uint8_t function, const std::vector<uint8_t> & payload)
{
  const std::vector<uint8_t> ack{function, kAck};
  std::vector<uint8_t> out{function};

  switch (function) {
    case FunctionCode::MOTOR_ENABLE:
      drive.enabled = payload.at(1) != 0;
      return ack;

    case FunctionCode::IMMEDIATE_STOP:
      drive.preload.reset();
      drive.speed_rpm = 0.0;
      return ack;

    case FunctionCode::TORQUE_MODE:
    case FunctionCode::SPEED_MODE:
    case FunctionCode::POSITION_DIRECT:
    case FunctionCode::POSITION_TRAPEZOID:
      if (payload.back() == 0x01) {
        std::vector<uint8_t> preload{function};
        preload.insert(preload.end(), payload.begin(), payload.end());
        drive.preload = preload;
      } else {
        applyMotion(drive, function, payload);
      }
      return ack;

    case FunctionCode::SET_ZERO_POSITION:
      drive.position_deg = 0.0;
      drive.target_position_deg = 0.0;
      return ack;

    case FunctionCode::TRIGGER_HOMING:
      if (drive.homing_active) {
        return std::vector<uint8_t>{function, StatusCode::CONDITION_NOT_MET};
      }
      if (payload.at(1) == 0x01) {
        drive.preload = std::vector<uint8_t>{function, payload.at(0), payload.at(1)};
      } else {
        drive.homing_active = true;
      }
      return ack;

    case FunctionCode::ABORT_HOMING:
      drive.homing_active = false;
      drive.homing_script.clear();
      return ack;

    case FunctionCode::READ_HOMING_PARAMS:
      {
        const auto block = Codec::encodeHomingParameters(drive.homing_ram);
        out.insert(out.end(), block.begin(), block.end());
        return out;
      }

    case FunctionCode::MODIFY_HOMING_PARAMS:
      drive.homing_ram = Codec::decodeHomingParameters(tail(payload, 2), address);
      if (payload.at(1) == 0x01) {
        drive.homing_flash = drive.homing_ram;
      }
      return ack;

    case FunctionCode::READ_HOMING_STATUS:
      {
        uint8_t flags = HomingStatusFlag::ENCODER_READY | HomingStatusFlag::CALIBRATION_TABLE_READY;
        if (!drive.homing_script.empty()) {
          flags = drive.homing_script.front();
          drive.homing_script.pop_front();
        }
        if ((flags & HomingStatusFlag::HOMING_IN_PROGRESS) == 0) {
          drive.homing_active = false;
        }
        out.push_back(flags);
        return out;
      }

    case FunctionCode::ENCODER_CALIBRATION:
      return ack;

    case FunctionCode::CLEAR_POSITION:
      drive.position_deg = 0.0;
      drive.target_position_deg = 0.0;
      return ack;

    case FunctionCode::RELEASE_STALL_PROTECTION:
      drive.stalled = false;
      return ack;

    case FunctionCode::FACTORY_RESET:
      drive.ram = DriveParameters();
      drive.flash = DriveParameters();
      drive.homing_ram = HomingParameters();
      drive.homing_flash = HomingParameters();
      return ack;

    case FunctionCode::READ_VERSION:
      wire::putU16(out, drive.firmware_raw);
      wire::putU16(out, drive.hardware_raw);
      return out;

    case FunctionCode::READ_RESISTANCE_INDUCTANCE:
      wire::putU16(out, drive.resistance_mohm);
      wire::putU16(out, drive.inductance_uh);
      return out;

    case FunctionCode::READ_PID_PARAMS:
      {
        const auto block = Codec::encodePidParameters(drive.pid);
        out.insert(out.end(), block.begin(), block.end());
        return out;
      }

    case FunctionCode::READ_BUS_VOLTAGE:
      wire::putU16(out, drive.bus_voltage_mv);
      return out;

    case FunctionCode::READ_BUS_CURRENT:
      wire::putU16(out, drive.bus_current_ma);
      return out;

    case FunctionCode::READ_PHASE_CURRENT:
      wire::putU16(out, drive.phase_current_ma);
      return out;

    case FunctionCode::READ_ENCODER_RAW:
      wire::putU16(out, drive.encoder_raw);
      return out;

    case FunctionCode::READ_ENCODER_CALIBRATED:
      wire::putU16(out, drive.encoder_calibrated);
      return out;

    case FunctionCode::READ_PULSE_COUNT:
      putSigned(out, static_cast<double>(drive.pulse_count), 4, 1.0);
      return out;

    case FunctionCode::READ_INPUT_PULSE:
      putSigned(out, static_cast<double>(drive.input_pulse), 4, 1.0);
      return out;

    case FunctionCode::READ_TARGET_POSITION:
    case FunctionCode::READ_REALTIME_TARGET_POSITION:
      putSigned(out, drive.target_position_deg, 4, kPositionScale);
      return out;

    case FunctionCode::READ_REALTIME_SPEED:
      putSigned(out, drive.speed_rpm, 2, kSpeedScale);
      return out;

    case FunctionCode::READ_REALTIME_POSITION:
      putSigned(out, drive.position_deg, 4, kPositionScale);
      return out;

    case FunctionCode::READ_POSITION_ERROR:
      putSigned(out, drive.position_error_deg, 4, kPositionErrorScale);
      return out;

    case FunctionCode::READ_TEMPERATURE:
      putSigned(out, drive.temperature_c, 1, 1.0);
      return out;

    case FunctionCode::READ_MOTOR_STATUS:
      {
        uint8_t flags = 0;
        if (drive.enabled) {
          flags |= MotorStatusFlag::ENABLED;
        }
        if (drive.position_deg == drive.target_position_deg) {
          flags |= MotorStatusFlag::IN_POSITION;
        }
        if (drive.stalled) {
          flags |= MotorStatusFlag::STALLED;
        }
        out.push_back(flags);
        return out;
      }

    case FunctionCode::READ_DRIVE_PARAMS:
      {
        const auto block = Codec::encodeDriveParameters(drive.ram, address);
        out.push_back(static_cast<uint8_t>(block.size() + 2));
        out.push_back(24);
        out.insert(out.end(), block.begin(), block.end());
        return out;
      }

    case FunctionCode::READ_SYSTEM_STATUS:
      {
        const auto block = systemStatusBlock(drive);
        out.push_back(static_cast<uint8_t>(block.size() + 2));
        out.push_back(12);
        out.insert(out.end(), block.begin(), block.end());
        return out;
      }

    case FunctionCode::MODIFY_DRIVE_PARAMS:
      {
        std::vector<uint8_t> data{34, 24};
        data.insert(data.end(), payload.begin() + 2, payload.end());
        drive.ram = Codec::decodeDriveParameters(data, address);
        if (payload.at(1) == 0x01) {
          drive.flash = drive.ram;
        }
        return ack;
      }

    case FunctionCode::MODIFY_PID_PARAMS:
      drive.pid = Codec::decodePidParameters(tail(payload, 2), address);
      return ack;

    case FunctionCode::MODIFY_SUBDIVISION:
      {
        const uint16_t subdivision = payload.at(2) == 0 ? 256 : payload.at(2);
        drive.ram.subdivision = subdivision;
        if (payload.at(1) == 0x01) {
          drive.flash.subdivision = subdivision;
        }
        return ack;
      }

    case FunctionCode::MODIFY_ADDRESS:
      return ack;

    default:
      return std::nullopt;
  }
}

void FakeCanBus::applyMotion(Drive & drive, uint8_t function, const std::vector<uint8_t> & p)
{
  switch (function) {
    case FunctionCode::POSITION_DIRECT:
    case FunctionCode::POSITION_TRAPEZOID:
      {
        const std::size_t pos_offset = function == FunctionCode::POSITION_DIRECT ? 3 : 7;
        const double value = signedValue(p.at(0), wire::readU32(p, pos_offset), kPositionScale);
        const bool absolute = p.at(pos_offset + 4) == 0x01;
        drive.target_position_deg = absolute ? value : drive.position_deg + value;
        drive.position_deg = drive.target_position_deg;
        drive.speed_rpm = 0.0;
        break;
      }
    case FunctionCode::SPEED_MODE:
      drive.speed_rpm = signedValue(p.at(0), wire::readU16(p, 3), kSpeedScale);
      break;
    case FunctionCode::TORQUE_MODE:
      drive.phase_current_ma = wire::readU16(p, 3);
      break;
    case FunctionCode::TRIGGER_HOMING:
      drive.homing_active = true;
      break;
    default:
      break;
  }
}

std::vector<uint8_t> FakeCanBus::systemStatusBlock(const Drive & drive) const
{
  std::vector<uint8_t> block;
  wire::putU16(block, drive.bus_voltage_mv);
  wire::putU16(block, drive.bus_current_ma);
  wire::putU16(block, drive.phase_current_ma);
  wire::putU16(block, drive.encoder_raw);
  wire::putU16(block, drive.encoder_calibrated);
  putSigned(block, drive.target_position_deg, 4, kPositionScale);
  putSigned(block, drive.speed_rpm, 2, kSpeedScale);
  putSigned(block, drive.position_deg, 4, kPositionScale);
  putSigned(block, drive.position_error_deg, 4, kPositionErrorScale);
  putSigned(block, drive.temperature_c, 1, 1.0);

  uint8_t homing_flags = HomingStatusFlag::ENCODER_READY | HomingStatusFlag::CALIBRATION_TABLE_READY;
  if (drive.homing_active) {
    homing_flags |= HomingStatusFlag::HOMING_IN_PROGRESS;
  }
  uint8_t motor_flags = 0;
  if (drive.enabled) {
    motor_flags |= MotorStatusFlag::ENABLED;
  }
  if (drive.position_deg == drive.target_position_deg) {
    motor_flags |= MotorStatusFlag::IN_POSITION;
  }
  if (drive.stalled) {
    motor_flags |= MotorStatusFlag::STALLED;
  }
  block.push_back(homing_flags);
  block.push_back(motor_flags);
  return block;
}

void FakeCanBus::reply(uint8_t address, const std::vector<uint8_t> & body)
{
  std::vector<uint8_t> serial = body;
  if (mode_ != ChecksumMode::NONE) {
    serial.push_back(Codec::computeChecksum(mode_, address, body));
  }

  auto corrupt = corrupt_next_.find(address);
  if (corrupt != corrupt_next_.end() && corrupt->second) {
    corrupt->second = false;
    serial.back() ^= 0x01;
  }

  const auto packets = packetize(serial);
  for (std::size_t i = 0; i < packets.size(); ++i) {
    CanFrame frame;
    frame.id = makeCanId(address, static_cast<uint8_t>(i));
    frame.len = static_cast<uint8_t>(packets[i].size());
    std::copy(packets[i].begin(), packets[i].end(), frame.data);
    rx_queue_.push_back(frame);
  }
  awaiting_ = address;
}

}  // namespace test
}  // namespace zdt_can_driver
