#include <gtest/gtest.h>

#include "bus_fixture.hpp"
#include "zdt_can_driver/exceptions.hpp"

using namespace zdt_can_driver;
using zdt_can_driver::test::BusFixture;

class ReadParametersTest : public BusFixture
{
protected:
  void SetUp() override
  {
    BusFixture::SetUp();
    auto & drive = bus_->drive(1);
    drive.enabled = true;
    drive.position_deg = -123.4;
    drive.target_position_deg = -120.0;
    drive.speed_rpm = 250.5;
    drive.position_error_deg = 0.37;
    drive.temperature_c = -5.0;
  }
};

TEST_F(ReadParametersTest, ScalarReadingsAreScaled)
{
  auto motor = makeMotor(1);
  auto & read = motor->readParameters();

  EXPECT_NEAR(read.getPosition(), -123.4, 1e-9);
  EXPECT_NEAR(read.getSpeed(), 250.5, 1e-9);
  EXPECT_NEAR(read.getTemperature(), -5.0, 1e-9);
  EXPECT_NEAR(read.getBusVoltage(), 24.1, 1e-9);
  EXPECT_NEAR(read.getBusCurrent(), 0.35, 1e-9);
  EXPECT_NEAR(read.getCurrent(), 0.82, 1e-9);
  EXPECT_NEAR(read.getTargetPosition(), -120.0, 1e-9);
  EXPECT_NEAR(read.getRealtimeTargetPosition(), -120.0, 1e-9);
  EXPECT_NEAR(read.getPositionError(), 0.37, 1e-9);
}

TEST_F(ReadParametersTest, EncoderCountsAreConvertedToDegrees)
{
  auto motor = makeMotor(1);
  EXPECT_NEAR(motor->readParameters().getEncoderRaw(), 90.0, 1e-9);
  EXPECT_NEAR(motor->readParameters().getEncoderCalibrated(), 90.0, 1e-9);
}

TEST_F(ReadParametersTest, MotorStatusFlags)
{
  bus_->drive(1).stalled = true;
  auto motor = makeMotor(1);

  MotorStatus status = motor->readParameters().getMotorStatus();
  EXPECT_TRUE(status.enabled);
  EXPECT_FALSE(status.in_position);
  EXPECT_TRUE(status.stalled);
}

TEST_F(ReadParametersTest, VersionStrings)
{
  auto motor = makeMotor(1);
  VersionInfo version = motor->readParameters().getVersion();

  EXPECT_EQ(version.firmware_raw, 132);
  EXPECT_EQ(version.firmware, "V1.3.2");
  EXPECT_EQ(version.hardware, "V0.4.1");
}

TEST_F(ReadParametersTest, ResistanceInductance)
{
  auto motor = makeMotor(1);
  ResistanceInductance ri = motor->readParameters().getResistanceInductance();
  EXPECT_NEAR(ri.resistance_ohm, 1.25, 1e-9);
  EXPECT_NEAR(ri.inductance_mh, 2.3, 1e-9);
}

TEST_F(ReadParametersTest, PidParameters)
{
  auto motor = makeMotor(1);
  PidParameters pid = motor->readParameters().getPidParameters();
  EXPECT_EQ(pid.trapezoid_position_kp, 66000u);
  EXPECT_EQ(pid.direct_position_kp, 32000u);
  EXPECT_EQ(pid.speed_kp, 1800u);
  EXPECT_EQ(pid.speed_ki, 20u);
}

TEST_F(ReadParametersTest, SystemStatusSnapshot)
{
  auto motor = makeMotor(1);
  SystemStatus status = motor->readParameters().getSystemStatus();

  EXPECT_NEAR(status.bus_voltage_v, 24.1, 1e-9);
  EXPECT_NEAR(status.phase_current_a, 0.82, 1e-9);
  EXPECT_EQ(status.encoder_raw, 4096);
  EXPECT_NEAR(status.target_position_deg, -120.0, 1e-9);
  EXPECT_NEAR(status.realtime_speed_rpm, 250.5, 1e-9);
  EXPECT_NEAR(status.realtime_position_deg, -123.4, 1e-9);
  EXPECT_NEAR(status.position_error_deg, 0.37, 1e-9);
  EXPECT_NEAR(status.temperature_c, -5.0, 1e-9);
  EXPECT_TRUE(status.encoder_ready);
  EXPECT_TRUE(status.motor_enabled);
  EXPECT_FALSE(status.in_position);
  EXPECT_FALSE(status.stall_triggered);
}

TEST_F(ReadParametersTest, DriveParametersAreCached)
{
  auto motor = makeMotor(1);
  auto & read = motor->readParameters();
  EXPECT_FALSE(read.cachedDriveParameters().has_value());

  bus_->drive(1).ram.subdivision = 64;
  DriveParameters params = read.getDriveParameters();
  EXPECT_EQ(params.subdivision, 64);
  ASSERT_TRUE(read.cachedDriveParameters().has_value());
  EXPECT_EQ(*read.cachedDriveParameters(), params);
}

TEST_F(ReadParametersTest, CacheIsDroppedWhenDriveGoesOffline)
{
  auto motor = makeMotor(1);
  auto & read = motor->readParameters();
  motor->modifyParameters().modifySpeedLimit(2000, false);
  EXPECT_EQ(read.getDriveParameters().max_speed_limit_rpm, 2000);

  // Power loss: the RAM-only limit is gone and the drive is silent meanwhile
  bus_->powerCycle();
  bus_->dropResponses(1, config_.retry.max_retries);
  EXPECT_THROW(read.getPosition(), RetryExhaustedError);
  EXPECT_FALSE(read.cachedDriveParameters().has_value());

  EXPECT_EQ(read.getDriveParameters().max_speed_limit_rpm, 3000);
}

TEST_F(ReadParametersTest, SingleLostReplyAlsoDropsCache)
{
  auto motor = makeMotor(1);
  auto & read = motor->readParameters();
  read.getDriveParameters();
  bus_->dropResponses(1, 1);

  EXPECT_NO_THROW(read.getTemperature());
  EXPECT_EQ(motor->connectionStatus(), ConnectionStatus::ONLINE);
  EXPECT_FALSE(read.cachedDriveParameters().has_value());
}

TEST_F(ReadParametersTest, PulseCounters)
{
  bus_->drive(1).pulse_count = -102400;
  bus_->drive(1).input_pulse = 3200;
  auto motor = makeMotor(1);

  EXPECT_EQ(motor->readParameters().getPulseCount(), -102400);
  EXPECT_EQ(motor->readParameters().getInputPulse(), 3200);

  auto commands = bus_->commands();
  ASSERT_EQ(commands.size(), 2u);
  EXPECT_EQ(commands[0].function, FunctionCode::READ_PULSE_COUNT);
  EXPECT_EQ(commands[1].function, FunctionCode::READ_INPUT_PULSE);
}

TEST_F(ReadParametersTest, OfflineDriveReportsOffline)
{
  auto motor = makeMotor(7);
  EXPECT_EQ(motor->connectionStatus(), ConnectionStatus::UNKNOWN);
  EXPECT_THROW(motor->readParameters().getPosition(), RetryExhaustedError);
  EXPECT_EQ(motor->connectionStatus(), ConnectionStatus::OFFLINE);
}
