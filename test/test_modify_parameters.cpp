#include <gtest/gtest.h>

#include "bus_fixture.hpp"
#include "zdt_can_driver/exceptions.hpp"
#include "zdt_can_driver/modify_parameters.hpp"

using namespace zdt_can_driver;
using zdt_can_driver::test::BusFixture;

class ModifyParametersTest : public BusFixture
{
};

TEST_F(ModifyParametersTest, RamOnlyWriteIsLostOnPowerCycle)
{
  auto motor = makeMotor(1);
  motor->modifyParameters().modifySpeedLimit(2000, false);
  EXPECT_EQ(motor->readParameters().getDriveParameters().max_speed_limit_rpm, 2000);

  bus_->powerCycle();
  EXPECT_EQ(motor->readParameters().getDriveParameters().max_speed_limit_rpm, 3000);
}

TEST_F(ModifyParametersTest, SavedWriteSurvivesPowerCycle)
{
  auto motor = makeMotor(1);
  motor->modifyParameters().modifySpeedLimit(2000, true);

  bus_->powerCycle();
  EXPECT_EQ(motor->readParameters().getDriveParameters().max_speed_limit_rpm, 2000);
}

TEST_F(ModifyParametersTest, SaveFlagIsPassedThrough)
{
  auto motor = makeMotor(1);

  motor->modifyParameters().modifyCurrentLimits(1000, 2500, true);
  EXPECT_EQ(bus_->commands().back().payload[0], AuxCode::MODIFY_DRIVE_PARAMS);
  EXPECT_EQ(bus_->commands().back().payload[1], 0x01);

  motor->modifyParameters().modifyCurrentLimits(1000, 2500, false);
  EXPECT_EQ(bus_->commands().back().payload[1], 0x00);
}

TEST_F(ModifyParametersTest, FullRecordRoundTripsThroughDrive)
{
  auto motor = makeMotor(1);

  DriveParameters params;
  params.lock_enabled = true;
  params.control_mode = ControlMode::OPEN_LOOP;
  params.subdivision = 256;
  params.lpf_intensity = 2;
  params.open_loop_current_ma = 900;
  params.closed_loop_max_current_ma = 2800;
  params.max_speed_limit_rpm = 5000;
  params.can_baudrate = 5;
  params.response_mode = 3;
  params.stall_protection_speed_rpm = 20;
  params.stall_protection_current_ma = 1500;
  params.stall_protection_time_ms = 500;
  params.position_arrival_window = 10;

  motor->modifyParameters().modifyDriveParameters(params, false);
  EXPECT_EQ(motor->readParameters().getDriveParameters(), params);
}

TEST_F(ModifyParametersTest, SubsetWriteKeepsOtherFields)
{
  bus_->drive(1).ram.open_loop_current_ma = 700;
  bus_->drive(1).ram.subdivision = 32;
  auto motor = makeMotor(1);

  motor->modifyParameters().modifyControlMode(ControlMode::OPEN_LOOP, false);

  const DriveParameters & ram = bus_->drive(1).ram;
  EXPECT_EQ(ram.control_mode, ControlMode::OPEN_LOOP);
  EXPECT_EQ(ram.open_loop_current_ma, 700);
  EXPECT_EQ(ram.subdivision, 32);
  EXPECT_EQ(bus_->commandCount(FunctionCode::READ_DRIVE_PARAMS), 1u);
  EXPECT_EQ(bus_->commandCount(FunctionCode::MODIFY_DRIVE_PARAMS), 1u);
}

TEST_F(ModifyParametersTest, StallProtectionAndCommunication)
{
  auto motor = makeMotor(1);
  auto & modify = motor->modifyParameters();

  modify.modifyStallProtection(true, 15, 1800, 1000, false);
  modify.modifyCommunicationSettings(4, 6, ChecksumMode::FIXED_6B, 2, false);

  const DriveParameters & ram = bus_->drive(1).ram;
  EXPECT_TRUE(ram.stall_protection_enabled);
  EXPECT_EQ(ram.stall_protection_speed_rpm, 15);
  EXPECT_EQ(ram.stall_protection_current_ma, 1800);
  EXPECT_EQ(ram.uart_baudrate, 4);
  EXPECT_EQ(ram.can_baudrate, 6);
  EXPECT_EQ(ram.response_mode, 2);
}

TEST_F(ModifyParametersTest, OutOfRangeValuesPerformNoIo)
{
  auto motor = makeMotor(1);
  auto & modify = motor->modifyParameters();

  EXPECT_THROW(modify.modifyCurrentLimits(50, 2000, false), ValidationError);
  EXPECT_THROW(modify.modifySpeedLimit(7000, true), ValidationError);
  EXPECT_THROW(modify.modifyStallProtection(true, 0, 1000, 1000, false), ValidationError);
  EXPECT_THROW(
    modify.modifyCommunicationSettings(8, 7, ChecksumMode::XOR, 1, false), ValidationError);
  EXPECT_THROW(modify.modifySubdivision(3, false), ValidationError);
  EXPECT_THROW(modify.modifyMotorAddress(0, false), ValidationError);

  DriveParameters params;
  params.position_arrival_window = 0;
  EXPECT_THROW(modify.modifyDriveParameters(params, false), ValidationError);

  EXPECT_EQ(bus_->packetCount(), 0u);
}

TEST_F(ModifyParametersTest, DisabledStallProtectionSkipsThresholds)
{
  auto motor = makeMotor(1);
  EXPECT_NO_THROW(motor->modifyParameters().modifyStallProtection(false, 0, 0, 0, false));
  EXPECT_FALSE(bus_->drive(1).ram.stall_protection_enabled);
}

TEST_F(ModifyParametersTest, WriteInvalidatesCache)
{
  auto motor = makeMotor(1);
  motor->modifyParameters().modifySpeedLimit(1500, false);
  EXPECT_FALSE(motor->readParameters().cachedDriveParameters().has_value());

  motor->readParameters().getDriveParameters();
  motor->modifyParameters().modifySubdivision(128, false);
  EXPECT_FALSE(motor->readParameters().cachedDriveParameters().has_value());
  EXPECT_EQ(motor->readParameters().getDriveParameters().subdivision, 128);
}

TEST_F(ModifyParametersTest, SubdivisionPersistence)
{
  auto motor = makeMotor(1);
  motor->modifyParameters().modifySubdivision(256, true);
  bus_->powerCycle();
  EXPECT_EQ(motor->readParameters().getDriveParameters().subdivision, 256);
}

TEST_F(ModifyParametersTest, PidParametersWrite)
{
  auto motor = makeMotor(2);
  PidParameters pid{50000, 25000, 1500, 10};
  motor->modifyParameters().modifyPidParameters(pid, false);

  PidParameters read = motor->readParameters().getPidParameters();
  EXPECT_EQ(read.trapezoid_position_kp, 50000u);
  EXPECT_EQ(read.speed_ki, 10u);
}

TEST_F(ModifyParametersTest, RejectedWriteIsCommandError)
{
  auto motor = makeMotor(1);
  bus_->rejectNext(1, FunctionCode::MODIFY_DRIVE_PARAMS, StatusCode::CONDITION_NOT_MET);

  EXPECT_THROW(motor->modifyParameters().modifySpeedLimit(2000, false), CommandError);
  EXPECT_EQ(bus_->drive(1).ram.max_speed_limit_rpm, 3000);
}

TEST(ModifyParametersValidationTest, DefaultRecordIsValid)
{
  EXPECT_NO_THROW(ModifyParameters::validateDriveParameters(DriveParameters(), 1));
}
