#include "zdt_can_driver/read_parameters.hpp"

#include <cstdio>

#include "zdt_can_driver/codec.hpp"

namespace zdt_can_driver
{

namespace
{

std::string formatVersion(uint16_t raw)
{
  char buf[32];
  std::snprintf(buf, sizeof(buf), "V%u.%u.%u", raw / 100, (raw % 100) / 10, raw % 10);
  return buf;
}

}  // namespace

ReadParameters::ReadParameters(CommandChannel & channel, MotorSoftState & state)
  : channel_(channel),
    state_(state)
{
}

MotorStatus ReadParameters::getMotorStatus()
{
  return Codec::decodeMotorStatus(channel_.query(FunctionCode::READ_MOTOR_STATUS).at(0));
}

double ReadParameters::getPosition()
{
  auto data = channel_.query(FunctionCode::READ_REALTIME_POSITION);
  return wire::readSigned(data, 0, 4, kPositionScale);
}

double ReadParameters::getSpeed()
{
  auto data = channel_.query(FunctionCode::READ_REALTIME_SPEED);
  return wire::readSigned(data, 0, 2, kSpeedScale);
}

double ReadParameters::getTemperature()
{
  auto data = channel_.query(FunctionCode::READ_TEMPERATURE);
  return wire::readSigned(data, 0, 1, 1.0);
}

double ReadParameters::getBusVoltage()
{
  return wire::readU16(channel_.query(FunctionCode::READ_BUS_VOLTAGE), 0) / 1000.0;
}

double ReadParameters::getCurrent()
{
  return wire::readU16(channel_.query(FunctionCode::READ_PHASE_CURRENT), 0) / 1000.0;
}

double ReadParameters::getBusCurrent()
{
  return wire::readU16(channel_.query(FunctionCode::READ_BUS_CURRENT), 0) / 1000.0;
}

VersionInfo ReadParameters::getVersion()
{
  auto data = channel_.query(FunctionCode::READ_VERSION);
  VersionInfo info;
  info.firmware_raw = wire::readU16(data, 0);
  info.hardware_raw = wire::readU16(data, 2);
  info.firmware = formatVersion(info.firmware_raw);
  info.hardware = formatVersion(info.hardware_raw);
  return info;
}

ResistanceInductance ReadParameters::getResistanceInductance()
{
  auto data = channel_.query(FunctionCode::READ_RESISTANCE_INDUCTANCE);
  ResistanceInductance result;
  result.resistance_ohm = wire::readU16(data, 0) / 1000.0;  // mOhm
  result.inductance_mh = wire::readU16(data, 2) / 1000.0;   // uH
  return result;
}

PidParameters ReadParameters::getPidParameters()
{
  return Codec::decodePidParameters(
    channel_.query(FunctionCode::READ_PID_PARAMS), channel_.address());
}

DriveParameters ReadParameters::getDriveParameters()
{
  DriveParameters params = Codec::decodeDriveParameters(
    channel_.query(FunctionCode::READ_DRIVE_PARAMS, {AuxCode::READ_DRIVE_PARAMS}),
    channel_.address());
  state_.drive_parameters = params;
  return params;
}

SystemStatus ReadParameters::getSystemStatus()
{
  return Codec::decodeSystemStatus(
    channel_.query(FunctionCode::READ_SYSTEM_STATUS, {AuxCode::READ_SYSTEM_STATUS}),
    channel_.address());
}

double ReadParameters::getEncoderRaw()
{
  return encoderRawToDegrees(wire::readU16(channel_.query(FunctionCode::READ_ENCODER_RAW), 0));
}

double ReadParameters::getEncoderCalibrated()
{
  return encoderCalibratedToDegrees(
    wire::readU16(channel_.query(FunctionCode::READ_ENCODER_CALIBRATED), 0));
}

int64_t ReadParameters::getPulseCount()
{
  auto data = channel_.query(FunctionCode::READ_PULSE_COUNT);
  return static_cast<int64_t>(wire::readSigned(data, 0, 4, 1.0));
}

int64_t ReadParameters::getInputPulse()
{
  auto data = channel_.query(FunctionCode::READ_INPUT_PULSE);
  return static_cast<int64_t>(wire::readSigned(data, 0, 4, 1.0));
}

double ReadParameters::getTargetPosition()
{
  auto data = channel_.query(FunctionCode::READ_TARGET_POSITION);
  return wire::readSigned(data, 0, 4, kPositionScale);
}

double ReadParameters::getRealtimeTargetPosition()
{
  auto data = channel_.query(FunctionCode::READ_REALTIME_TARGET_POSITION);
  return wire::readSigned(data, 0, 4, kPositionScale);
}

double ReadParameters::getPositionError()
{
  auto data = channel_.query(FunctionCode::READ_POSITION_ERROR);
  return wire::readSigned(data, 0, 4, kPositionErrorScale);
}

}  // namespace zdt_can_driver
