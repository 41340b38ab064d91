#include "zdt_can_driver/codec.hpp"

#include <cmath>
#include <cstdio>
#include <limits>

#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

namespace
{

struct FunctionInfo
{
  uint8_t code;
  const char * name;
  std::size_t data_length;  // reply bytes between function code and checksum
  bool acknowledge;
};

constexpr std::size_t kDriveParameterBlock = 32;
constexpr std::size_t kDriveParameterFields = 24;
constexpr std::size_t kSystemStatusBlock = 32;
constexpr std::size_t kSystemStatusFields = 12;
constexpr std::size_t kRecordHeader = 2;  // byte count, field count

const FunctionInfo kFunctionTable[] = {
  {FunctionCode::ERROR_REPLY, "error_reply", 1, true},
  {FunctionCode::MOTOR_ENABLE, "motor_enable", 1, true},
  {FunctionCode::TORQUE_MODE, "torque_mode", 1, true},
  {FunctionCode::SPEED_MODE, "speed_mode", 1, true},
  {FunctionCode::POSITION_DIRECT, "position_direct", 1, true},
  {FunctionCode::POSITION_TRAPEZOID, "position_trapezoid", 1, true},
  {FunctionCode::IMMEDIATE_STOP, "immediate_stop", 1, true},
  {FunctionCode::SYNC_MOTION, "sync_motion", 1, true},
  {FunctionCode::SET_ZERO_POSITION, "set_zero_position", 1, true},
  {FunctionCode::TRIGGER_HOMING, "trigger_homing", 1, true},
  {FunctionCode::ABORT_HOMING, "abort_homing", 1, true},
  {FunctionCode::READ_HOMING_PARAMS, "read_homing_parameters", 15, false},
  {FunctionCode::MODIFY_HOMING_PARAMS, "modify_homing_parameters", 1, true},
  {FunctionCode::READ_HOMING_STATUS, "read_homing_status", 1, false},
  {FunctionCode::ENCODER_CALIBRATION, "encoder_calibration", 1, true},
  {FunctionCode::CLEAR_POSITION, "clear_position", 1, true},
  {FunctionCode::RELEASE_STALL_PROTECTION, "release_stall_protection", 1, true},
  {FunctionCode::FACTORY_RESET, "factory_reset", 1, true},
  {FunctionCode::READ_VERSION, "read_version", 4, false},
  {FunctionCode::READ_RESISTANCE_INDUCTANCE, "read_resistance_inductance", 4, false},
  {FunctionCode::READ_PID_PARAMS, "read_pid_parameters", 16, false},
  {FunctionCode::READ_BUS_VOLTAGE, "read_bus_voltage", 2, false},
  {FunctionCode::READ_BUS_CURRENT, "read_bus_current", 2, false},
  {FunctionCode::READ_PHASE_CURRENT, "read_phase_current", 2, false},
  {FunctionCode::READ_ENCODER_RAW, "read_encoder_raw", 2, false},
  {FunctionCode::READ_PULSE_COUNT, "read_pulse_count", 5, false},
  {FunctionCode::READ_ENCODER_CALIBRATED, "read_encoder_calibrated", 2, false},
  {FunctionCode::READ_INPUT_PULSE, "read_input_pulse", 5, false},
  {FunctionCode::READ_TARGET_POSITION, "read_target_position", 5, false},
  {FunctionCode::READ_REALTIME_TARGET_POSITION, "read_realtime_target_position", 5, false},
  {FunctionCode::READ_REALTIME_SPEED, "read_realtime_speed", 3, false},
  {FunctionCode::READ_REALTIME_POSITION, "read_realtime_position", 5, false},
  {FunctionCode::READ_POSITION_ERROR, "read_position_error", 5, false},
  {FunctionCode::READ_TEMPERATURE, "read_temperature", 2, false},
  {FunctionCode::READ_MOTOR_STATUS, "read_motor_status", 1, false},
  {FunctionCode::READ_DRIVE_PARAMS, "read_drive_parameters",
    kRecordHeader + kDriveParameterBlock, false},
  {FunctionCode::READ_SYSTEM_STATUS, "read_system_status",
    kRecordHeader + kSystemStatusBlock, false},
  {FunctionCode::MODIFY_DRIVE_PARAMS, "modify_drive_parameters", 1, true},
  {FunctionCode::MODIFY_PID_PARAMS, "modify_pid_parameters", 1, true},
  {FunctionCode::MODIFY_SUBDIVISION, "modify_subdivision", 1, true},
  {FunctionCode::MODIFY_ADDRESS, "modify_address", 1, true},
};

const FunctionInfo * lookup(uint8_t function)
{
  for (const auto & info : kFunctionTable) {
    if (info.code == function) {
      return &info;
    }
  }
  return nullptr;
}

std::string hexByte(uint8_t value)
{
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02X", value);
  return buf;
}

uint8_t crc8(uint8_t crc, uint8_t byte)
{
  crc ^= byte;
  for (int bit = 0; bit < 8; ++bit) {
    crc = (crc & 0x80) ? static_cast<uint8_t>((crc << 1) ^ 0x07) : static_cast<uint8_t>(crc << 1);
  }
  return crc;
}

void requireLength(
  const std::vector<uint8_t> & data, std::size_t length, uint8_t address,
  const char * operation)
{
  if (data.size() < length) {
    throw ProtocolError(
      address, operation,
      "expected " + std::to_string(length) + " data bytes, got " + std::to_string(data.size()));
  }
}

uint8_t boolByte(bool value)
{
  return value ? 0x01 : 0x00;
}

}  // namespace

const char * functionName(uint8_t function)
{
  const FunctionInfo * info = lookup(function);
  return info ? info->name : "unknown";
}

std::vector<uint8_t> CommandFrame::serialize() const
{
  std::vector<uint8_t> bytes;
  bytes.reserve(payload.size() + 2);
  bytes.push_back(function);
  bytes.insert(bytes.end(), payload.begin(), payload.end());
  if (checksum) {
    bytes.push_back(*checksum);
  }
  return bytes;
}

// ============================================================================
// Codec
// ============================================================================

Codec::Codec(ChecksumMode mode)
  : mode_(mode)
{
}

CommandFrame Codec::encode(
  uint8_t function, uint8_t address, const std::vector<uint8_t> & payload) const
{
  const std::size_t length = 1 + payload.size() + checksumWidth(mode_);
  if (length > kMaxFrameLength) {
    throw ValidationError(
      address, functionName(function),
      "frame length " + std::to_string(length) + " exceeds " + std::to_string(kMaxFrameLength));
  }

  CommandFrame frame;
  frame.function = function;
  frame.address = address;
  frame.payload = payload;

  if (mode_ != ChecksumMode::NONE) {
    std::vector<uint8_t> body;
    body.reserve(payload.size() + 1);
    body.push_back(function);
    body.insert(body.end(), payload.begin(), payload.end());
    frame.checksum = computeChecksum(mode_, address, body);
  }
  return frame;
}

ResponseFrame Codec::decode(const std::vector<uint8_t> & raw, uint8_t source_address) const
{
  const std::size_t width = checksumWidth(mode_);
  if (raw.size() < 2 + width) {
    throw ProtocolError(
      source_address, "decode",
      "frame too short (" + std::to_string(raw.size()) + " bytes)");
  }

  const uint8_t function = raw[0];

  if (width > 0) {
    std::vector<uint8_t> body(raw.begin(), raw.end() - 1);
    const uint8_t expected = computeChecksum(mode_, source_address, body);
    if (raw.back() != expected) {
      throw ChecksumError(
        source_address, functionName(function),
        "checksum " + hexByte(raw.back()) + " does not match " + hexByte(expected) +
        " (" + toString(mode_) + ")");
    }
  }

  const FunctionInfo * info = lookup(function);
  if (!info) {
    throw ProtocolError(source_address, "decode", "unrecognized function code " + hexByte(function));
  }

  std::vector<uint8_t> data(raw.begin() + 1, raw.end() - width);
  if (data.size() != info->data_length) {
    throw ProtocolError(
      source_address, info->name,
      "expected " + std::to_string(info->data_length) + " data bytes, got " +
      std::to_string(data.size()));
  }

  ResponseFrame response;
  response.address = source_address;
  response.function = function;
  if (info->acknowledge) {
    response.status = data[0];
  } else {
    response.status = StatusCode::DATA_RESPONSE;
    response.payload = std::move(data);
  }
  return response;
}

std::optional<std::size_t> Codec::expectedResponseLength(uint8_t function) const
{
  auto data_length = responseDataLength(function);
  if (!data_length) {
    return std::nullopt;
  }
  return 1 + *data_length + checksumWidth(mode_);
}

uint8_t Codec::computeChecksum(ChecksumMode mode, uint8_t address, const std::vector<uint8_t> & body)
{
  switch (mode) {
    case ChecksumMode::FIXED_6B:
      return kFixedChecksumByte;
    case ChecksumMode::XOR:
      {
        uint8_t value = address;
        for (uint8_t byte : body) {
          value ^= byte;
        }
        return value;
      }
    case ChecksumMode::CRC8:
      {
        uint8_t crc = crc8(0x00, address);
        for (uint8_t byte : body) {
          crc = crc8(crc, byte);
        }
        return crc;
      }
    case ChecksumMode::NONE:
      break;
  }
  return 0;
}

bool Codec::isAcknowledgeFunction(uint8_t function)
{
  const FunctionInfo * info = lookup(function);
  return info && info->acknowledge;
}

std::optional<std::size_t> Codec::responseDataLength(uint8_t function)
{
  const FunctionInfo * info = lookup(function);
  if (!info) {
    return std::nullopt;
  }
  return info->data_length;
}

// ============================================================================
// Record layouts
// ============================================================================

std::vector<uint8_t> Codec::encodeDriveParameters(const DriveParameters & params, uint8_t address)
{
  if (params.subdivision < 1 || params.subdivision > 256) {
    throw ValidationError(
      address, "modify_drive_parameters",
      "subdivision " + std::to_string(params.subdivision) + " outside 1..256");
  }

  std::vector<uint8_t> out;
  out.reserve(kDriveParameterBlock);
  out.push_back(boolByte(params.lock_enabled));
  out.push_back(static_cast<uint8_t>(params.control_mode));
  out.push_back(params.pulse_port_function);
  out.push_back(params.serial_port_function);
  out.push_back(params.enable_pin_mode);
  out.push_back(static_cast<uint8_t>(params.motor_direction));
  out.push_back(params.subdivision == 256 ? 0 : static_cast<uint8_t>(params.subdivision));
  out.push_back(boolByte(params.subdivision_interpolation));
  out.push_back(boolByte(params.auto_screen_off));
  out.push_back(params.lpf_intensity);
  wire::putU16(out, params.open_loop_current_ma);
  wire::putU16(out, params.closed_loop_max_current_ma);
  wire::putU16(out, params.max_speed_limit_rpm);
  wire::putU16(out, params.current_loop_bandwidth);
  out.push_back(params.uart_baudrate);
  out.push_back(params.can_baudrate);
  out.push_back(static_cast<uint8_t>(params.checksum_mode));
  out.push_back(params.response_mode);
  out.push_back(boolByte(params.position_precision_high));
  out.push_back(boolByte(params.stall_protection_enabled));
  wire::putU16(out, params.stall_protection_speed_rpm);
  wire::putU16(out, params.stall_protection_current_ma);
  wire::putU16(out, params.stall_protection_time_ms);
  wire::putU16(out, params.position_arrival_window);
  return out;
}

DriveParameters Codec::decodeDriveParameters(const std::vector<uint8_t> & data, uint8_t address)
{
  const char * op = "read_drive_parameters";
  requireLength(data, kRecordHeader + kDriveParameterBlock, address, op);
  if (data[1] != kDriveParameterFields) {
    throw ProtocolError(address, op, "unexpected field count " + std::to_string(data[1]));
  }

  const std::size_t b = kRecordHeader;
  if (data[b + 1] > 1 || data[b + 5] > 1 || data[b + 20] > 3) {
    throw ProtocolError(address, op, "enumerated field out of range");
  }

  DriveParameters p;
  p.lock_enabled = data[b + 0] != 0;
  p.control_mode = static_cast<ControlMode>(data[b + 1]);
  p.pulse_port_function = data[b + 2];
  p.serial_port_function = data[b + 3];
  p.enable_pin_mode = data[b + 4];
  p.motor_direction = static_cast<Direction>(data[b + 5]);
  p.subdivision = data[b + 6] == 0 ? 256 : data[b + 6];
  p.subdivision_interpolation = data[b + 7] != 0;
  p.auto_screen_off = data[b + 8] != 0;
  p.lpf_intensity = data[b + 9];
  p.open_loop_current_ma = wire::readU16(data, b + 10);
  p.closed_loop_max_current_ma = wire::readU16(data, b + 12);
  p.max_speed_limit_rpm = wire::readU16(data, b + 14);
  p.current_loop_bandwidth = wire::readU16(data, b + 16);
  p.uart_baudrate = data[b + 18];
  p.can_baudrate = data[b + 19];
  p.checksum_mode = static_cast<ChecksumMode>(data[b + 20]);
  p.response_mode = data[b + 21];
  p.position_precision_high = data[b + 22] != 0;
  p.stall_protection_enabled = data[b + 23] != 0;
  p.stall_protection_speed_rpm = wire::readU16(data, b + 24);
  p.stall_protection_current_ma = wire::readU16(data, b + 26);
  p.stall_protection_time_ms = wire::readU16(data, b + 28);
  p.position_arrival_window = wire::readU16(data, b + 30);
  return p;
}

SystemStatus Codec::decodeSystemStatus(const std::vector<uint8_t> & data, uint8_t address)
{
  const char * op = "read_system_status";
  requireLength(data, kRecordHeader + kSystemStatusBlock, address, op);
  if (data[1] != kSystemStatusFields) {
    throw ProtocolError(address, op, "unexpected field count " + std::to_string(data[1]));
  }

  const std::size_t b = kRecordHeader;
  SystemStatus s;
  s.bus_voltage_v = wire::readU16(data, b + 0) / 1000.0;
  s.bus_current_a = wire::readU16(data, b + 2) / 1000.0;
  s.phase_current_a = wire::readU16(data, b + 4) / 1000.0;
  s.encoder_raw = wire::readU16(data, b + 6);
  s.encoder_calibrated = wire::readU16(data, b + 8);
  s.target_position_deg = wire::readSigned(data, b + 10, 4, kPositionScale);
  s.realtime_speed_rpm = wire::readSigned(data, b + 15, 2, kSpeedScale);
  s.realtime_position_deg = wire::readSigned(data, b + 18, 4, kPositionScale);
  s.position_error_deg = wire::readSigned(data, b + 23, 4, kPositionErrorScale);
  s.temperature_c = wire::readSigned(data, b + 28, 1, 1.0);
  s.homing_flags = data[b + 30];
  s.motor_flags = data[b + 31];

  const HomingStatus homing = decodeHomingStatus(s.homing_flags);
  const MotorStatus motor = decodeMotorStatus(s.motor_flags);
  s.encoder_ready = homing.encoder_ready;
  s.motor_enabled = motor.enabled;
  s.in_position = motor.in_position;
  s.stall_triggered = motor.stalled || motor.stall_protection;
  return s;
}

std::vector<uint8_t> Codec::encodeHomingParameters(const HomingParameters & params)
{
  std::vector<uint8_t> out;
  out.reserve(15);
  out.push_back(static_cast<uint8_t>(params.mode));
  out.push_back(static_cast<uint8_t>(params.direction));
  wire::putU16(out, params.speed_rpm);
  wire::putU32(out, params.timeout_ms);
  wire::putU16(out, params.collision_speed_rpm);
  wire::putU16(out, params.collision_current_ma);
  wire::putU16(out, params.collision_time_ms);
  out.push_back(boolByte(params.auto_homing_on_power_up));
  return out;
}

HomingParameters Codec::decodeHomingParameters(const std::vector<uint8_t> & data, uint8_t address)
{
  const char * op = "read_homing_parameters";
  requireLength(data, 15, address, op);
  if (data[0] > static_cast<uint8_t>(HomingMode::LAST_POWER_DOWN) || data[1] > 1) {
    throw ProtocolError(address, op, "homing mode or direction out of range");
  }

  HomingParameters p;
  p.mode = static_cast<HomingMode>(data[0]);
  p.direction = static_cast<Direction>(data[1]);
  p.speed_rpm = wire::readU16(data, 2);
  p.timeout_ms = wire::readU32(data, 4);
  p.collision_speed_rpm = wire::readU16(data, 8);
  p.collision_current_ma = wire::readU16(data, 10);
  p.collision_time_ms = wire::readU16(data, 12);
  p.auto_homing_on_power_up = data[14] != 0;
  return p;
}

std::vector<uint8_t> Codec::encodePidParameters(const PidParameters & params)
{
  std::vector<uint8_t> out;
  out.reserve(16);
  wire::putU32(out, params.trapezoid_position_kp);
  wire::putU32(out, params.direct_position_kp);
  wire::putU32(out, params.speed_kp);
  wire::putU32(out, params.speed_ki);
  return out;
}

PidParameters Codec::decodePidParameters(const std::vector<uint8_t> & data, uint8_t address)
{
  requireLength(data, 16, address, "read_pid_parameters");
  PidParameters p;
  p.trapezoid_position_kp = wire::readU32(data, 0);
  p.direct_position_kp = wire::readU32(data, 4);
  p.speed_kp = wire::readU32(data, 8);
  p.speed_ki = wire::readU32(data, 12);
  return p;
}

MotorStatus Codec::decodeMotorStatus(uint8_t flags)
{
  MotorStatus status;
  status.enabled = (flags & MotorStatusFlag::ENABLED) != 0;
  status.in_position = (flags & MotorStatusFlag::IN_POSITION) != 0;
  status.stalled = (flags & MotorStatusFlag::STALLED) != 0;
  status.stall_protection = (flags & MotorStatusFlag::STALL_PROTECTION) != 0;
  return status;
}

HomingStatus Codec::decodeHomingStatus(uint8_t flags)
{
  HomingStatus status;
  status.encoder_ready = (flags & HomingStatusFlag::ENCODER_READY) != 0;
  status.calibration_table_ready = (flags & HomingStatusFlag::CALIBRATION_TABLE_READY) != 0;
  status.homing_in_progress = (flags & HomingStatusFlag::HOMING_IN_PROGRESS) != 0;
  status.homing_failed = (flags & HomingStatusFlag::HOMING_FAILED) != 0;
  status.position_precision_high = (flags & HomingStatusFlag::POSITION_PRECISION_HIGH) != 0;
  return status;
}

// ============================================================================
// Field helpers
// ============================================================================

namespace wire
{

void putU16(std::vector<uint8_t> & out, uint16_t value)
{
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void putU32(std::vector<uint8_t> & out, uint32_t value)
{
  out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint16_t readU16(const std::vector<uint8_t> & data, std::size_t offset)
{
  return static_cast<uint16_t>((data.at(offset) << 8) | data.at(offset + 1));
}

uint32_t readU32(const std::vector<uint8_t> & data, std::size_t offset)
{
  return (static_cast<uint32_t>(data.at(offset)) << 24) |
         (static_cast<uint32_t>(data.at(offset + 1)) << 16) |
         (static_cast<uint32_t>(data.at(offset + 2)) << 8) |
         static_cast<uint32_t>(data.at(offset + 3));
}

uint16_t scaleToU16(double value, double scale, uint8_t address, const std::string & field)
{
  if (!std::isfinite(value) || value < 0.0) {
    throw ValidationError(address, field, "value must be a non-negative number");
  }
  const double scaled = std::round(value * scale);
  if (scaled > std::numeric_limits<uint16_t>::max()) {
    throw ValidationError(
      address, field, "value " + std::to_string(value) + " does not fit a 16-bit field");
  }
  return static_cast<uint16_t>(scaled);
}

uint32_t scaleToU32(double value, double scale, uint8_t address, const std::string & field)
{
  if (!std::isfinite(value) || value < 0.0) {
    throw ValidationError(address, field, "value must be a non-negative number");
  }
  const double scaled = std::round(value * scale);
  if (scaled > std::numeric_limits<uint32_t>::max()) {
    throw ValidationError(
      address, field, "value " + std::to_string(value) + " does not fit a 32-bit field");
  }
  return static_cast<uint32_t>(scaled);
}

double readSigned(const std::vector<uint8_t> & data, std::size_t offset, std::size_t width, double scale)
{
  uint32_t magnitude = 0;
  for (std::size_t i = 0; i < width; ++i) {
    magnitude = (magnitude << 8) | data.at(offset + 1 + i);
  }
  const double value = magnitude / scale;
  return data.at(offset) == static_cast<uint8_t>(Direction::NEGATIVE) ? -value : value;
}

}  // namespace wire

}  // namespace zdt_can_driver
