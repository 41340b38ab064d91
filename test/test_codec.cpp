#include <gtest/gtest.h>

#include <vector>

#include "zdt_can_driver/codec.hpp"
#include "zdt_can_driver/exceptions.hpp"

using namespace zdt_can_driver;

namespace
{

std::vector<uint8_t> withChecksum(ChecksumMode mode, uint8_t address, std::vector<uint8_t> body)
{
  if (mode != ChecksumMode::NONE) {
    body.push_back(Codec::computeChecksum(mode, address, body));
  }
  return body;
}

}  // namespace

// ============================================================================
// Encoding
// ============================================================================

TEST(CodecTest, FixedModeAppendsSentinel)
{
  Codec codec(ChecksumMode::FIXED_6B);
  CommandFrame frame = codec.encode(FunctionCode::MOTOR_ENABLE, 1, {AuxCode::MOTOR_ENABLE, 0x01, 0x00});

  EXPECT_EQ(frame.address, 1);
  EXPECT_EQ(frame.serialize(), (std::vector<uint8_t>{0xF3, 0xAB, 0x01, 0x00, 0x6B}));
}

TEST(CodecTest, XorChecksumCoversAddress)
{
  const std::vector<uint8_t> body{0xF3, 0xAB, 0x01, 0x00};
  EXPECT_EQ(Codec::computeChecksum(ChecksumMode::XOR, 1, body), 0x01 ^ 0xF3 ^ 0xAB ^ 0x01);
  EXPECT_NE(
    Codec::computeChecksum(ChecksumMode::XOR, 1, body),
    Codec::computeChecksum(ChecksumMode::XOR, 2, body));
}

TEST(CodecTest, NoneModeOmitsChecksum)
{
  Codec codec(ChecksumMode::NONE);
  CommandFrame frame = codec.encode(FunctionCode::READ_BUS_VOLTAGE, 3, {});

  EXPECT_FALSE(frame.checksum.has_value());
  EXPECT_EQ(frame.serialize(), (std::vector<uint8_t>{0x24}));
}

TEST(CodecTest, RejectsFramesLongerThanMaximum)
{
  Codec codec(ChecksumMode::XOR);
  EXPECT_NO_THROW(codec.encode(0x48, 1, std::vector<uint8_t>(62, 0x00)));
  EXPECT_THROW(codec.encode(0x48, 1, std::vector<uint8_t>(63, 0x00)), ValidationError);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(CodecTest, AcknowledgeCarriesStatusByte)
{
  Codec codec(ChecksumMode::FIXED_6B);
  ResponseFrame response = codec.decode({0xFD, 0x9F, 0x6B}, 4);

  EXPECT_EQ(response.address, 4);
  EXPECT_EQ(response.function, FunctionCode::POSITION_TRAPEZOID);
  EXPECT_EQ(response.status, StatusCode::REACHED);
  EXPECT_TRUE(response.payload.empty());
}

TEST(CodecTest, DataResponseKeepsPayload)
{
  Codec codec(ChecksumMode::CRC8);
  ResponseFrame response = codec.decode(
    withChecksum(ChecksumMode::CRC8, 1, {0x24, 0x5E, 0x24}), 1);

  EXPECT_EQ(response.status, StatusCode::DATA_RESPONSE);
  EXPECT_EQ(wire::readU16(response.payload, 0), 24100);
}

TEST(CodecTest, ShortFrameIsProtocolError)
{
  Codec codec(ChecksumMode::FIXED_6B);
  EXPECT_THROW(codec.decode({0x6B}, 1), ProtocolError);
  EXPECT_THROW(codec.decode({}, 1), ProtocolError);
}

TEST(CodecTest, UnknownFunctionIsProtocolError)
{
  Codec codec(ChecksumMode::XOR);
  EXPECT_THROW(codec.decode(withChecksum(ChecksumMode::XOR, 1, {0x55, 0x02}), 1), ProtocolError);
}

TEST(CodecTest, WrongDataLengthIsProtocolError)
{
  Codec codec(ChecksumMode::XOR);
  EXPECT_THROW(
    codec.decode(withChecksum(ChecksumMode::XOR, 1, {0x24, 0x5E}), 1), ProtocolError);
}

TEST(CodecTest, ErrorReplyDecodes)
{
  Codec codec(ChecksumMode::FIXED_6B);
  ResponseFrame response = codec.decode({0x00, 0xEE, 0x6B}, 2);
  EXPECT_EQ(response.function, FunctionCode::ERROR_REPLY);
  EXPECT_EQ(response.status, StatusCode::COMMAND_ERROR);
}

class ChecksumBitFlipTest : public ::testing::TestWithParam<ChecksumMode>
{
};

TEST_P(ChecksumBitFlipTest, EverySingleBitFlipIsRejected)
{
  const ChecksumMode mode = GetParam();
  Codec codec(mode);
  const std::vector<uint8_t> good = withChecksum(mode, 5, {0x1F, 0x00, 0x84, 0x00, 0x29});
  ASSERT_NO_THROW(codec.decode(good, 5));

  for (std::size_t byte = 1; byte + 1 < good.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      std::vector<uint8_t> bad = good;
      bad[byte] ^= static_cast<uint8_t>(1 << bit);
      EXPECT_THROW(codec.decode(bad, 5), ChecksumError) << "byte " << byte << " bit " << bit;
    }
  }
}

// FIXED_6B only carries a constant sentinel and NONE carries nothing, so a
// flipped payload bit cannot be detected in those modes.
INSTANTIATE_TEST_SUITE_P(
  IntegrityModes, ChecksumBitFlipTest,
  ::testing::Values(ChecksumMode::XOR, ChecksumMode::CRC8));

TEST(CodecTest, FixedModeRejectsCorruptedSentinel)
{
  Codec codec(ChecksumMode::FIXED_6B);
  EXPECT_THROW(codec.decode({0xF3, 0x02, 0x6A}, 1), ChecksumError);
}

TEST(CodecTest, ChecksumIsBoundToSourceAddress)
{
  Codec codec(ChecksumMode::XOR);
  EXPECT_THROW(codec.decode(withChecksum(ChecksumMode::XOR, 1, {0xF3, 0x02}), 2), ChecksumError);
}

// ============================================================================
// Records
// ============================================================================

TEST(CodecTest, DriveParametersSurviveEncodeDecode)
{
  DriveParameters params;
  params.control_mode = ControlMode::OPEN_LOOP;
  params.motor_direction = Direction::NEGATIVE;
  params.subdivision = 256;
  params.open_loop_current_ma = 800;
  params.max_speed_limit_rpm = 4500;
  params.checksum_mode = ChecksumMode::CRC8;
  params.stall_protection_enabled = false;
  params.position_arrival_window = 8;

  std::vector<uint8_t> block = Codec::encodeDriveParameters(params, 1);
  ASSERT_EQ(block.size(), 32u);
  EXPECT_EQ(block[6], 0x00);  // subdivision 256

  std::vector<uint8_t> data{34, 24};
  data.insert(data.end(), block.begin(), block.end());
  EXPECT_EQ(Codec::decodeDriveParameters(data, 1), params);
}

TEST(CodecTest, DriveParametersRejectOutOfRangeEnum)
{
  std::vector<uint8_t> data{34, 24};
  auto block = Codec::encodeDriveParameters(DriveParameters(), 1);
  block[20] = 9;  // checksum mode
  data.insert(data.end(), block.begin(), block.end());
  EXPECT_THROW(Codec::decodeDriveParameters(data, 1), ProtocolError);
}

TEST(CodecTest, HomingParametersLayout)
{
  HomingParameters params;
  params.mode = HomingMode::COLLISION;
  params.speed_rpm = 60;
  params.timeout_ms = 20000;

  auto block = Codec::encodeHomingParameters(params);
  ASSERT_EQ(block.size(), 15u);
  EXPECT_EQ(block[0], 0x02);
  EXPECT_EQ(wire::readU32(block, 4), 20000u);
  EXPECT_EQ(Codec::decodeHomingParameters(block, 1), params);
}

TEST(CodecTest, StatusFlags)
{
  MotorStatus motor = Codec::decodeMotorStatus(MotorStatusFlag::ENABLED | MotorStatusFlag::STALLED);
  EXPECT_TRUE(motor.enabled);
  EXPECT_FALSE(motor.in_position);
  EXPECT_TRUE(motor.stalled);

  HomingStatus homing = Codec::decodeHomingStatus(
    HomingStatusFlag::ENCODER_READY | HomingStatusFlag::HOMING_FAILED);
  EXPECT_TRUE(homing.encoder_ready);
  EXPECT_TRUE(homing.homing_failed);
  EXPECT_FALSE(homing.homing_in_progress);
}

// ============================================================================
// Field helpers
// ============================================================================

TEST(WireTest, ScaledFieldsMustFit)
{
  EXPECT_EQ(wire::scaleToU16(500.0, kSpeedScale, 1, "speed"), 5000);
  EXPECT_THROW(wire::scaleToU16(7000.0, kSpeedScale, 1, "speed"), ValidationError);
  EXPECT_THROW(wire::scaleToU16(-1.0, 1.0, 1, "speed"), ValidationError);
  EXPECT_EQ(wire::scaleToU32(90.0, kPositionScale, 1, "position"), 900u);
  EXPECT_THROW(wire::scaleToU32(1e12, kPositionScale, 1, "position"), ValidationError);
}

TEST(WireTest, SignedFieldsUseDirectionByte)
{
  const std::vector<uint8_t> data{0x01, 0x00, 0x00, 0x04, 0xD2};
  EXPECT_DOUBLE_EQ(wire::readSigned(data, 0, 4, kPositionScale), -123.4);
}

TEST(TypesTest, ChecksumModeFromString)
{
  EXPECT_EQ(checksumModeFromString("XOR"), ChecksumMode::XOR);
  EXPECT_EQ(checksumModeFromString("0x6B"), ChecksumMode::FIXED_6B);
  EXPECT_EQ(checksumModeFromString("none"), ChecksumMode::NONE);
  EXPECT_THROW(checksumModeFromString("parity"), std::invalid_argument);
}

TEST(TypesTest, CurrentLimitMustFitSixteenBits)
{
  EXPECT_EQ(currentLimitFromParameter(0), 0);
  EXPECT_EQ(currentLimitFromParameter(3000), 3000);
  EXPECT_EQ(currentLimitFromParameter(65535), 65535);
  EXPECT_THROW(currentLimitFromParameter(70000), std::invalid_argument);
  EXPECT_THROW(currentLimitFromParameter(-1), std::invalid_argument);
}
