#ifndef ZDT_CAN_DRIVER__CODEC_HPP_
#define ZDT_CAN_DRIVER__CODEC_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zdt_can_driver/types.hpp"

namespace zdt_can_driver
{

/**
 * @brief Frame builder and parser for the ZDT closed-loop drive protocol
 *
 * Serial frames are `function, payload..., checksum`. The checksum covers
 * the target address, the function code and the payload; its algorithm
 * is selected per bus and never inferred from the frame.
 */
class Codec
{
public:
  /**
   * @brief Constructor
   * @param mode Checksum mode configured on every drive of the bus
   */
  explicit Codec(ChecksumMode mode = ChecksumMode::FIXED_6B);

  ChecksumMode checksumMode() const { return mode_; }

  /**
   * @brief Build an outgoing frame
   * @param function Function code
   * @param address Target motor address
   * @param payload Bytes following the function code
   * @return Immutable command frame
   * @throws ValidationError if the serialized frame exceeds kMaxFrameLength
   */
  CommandFrame encode(uint8_t function, uint8_t address, const std::vector<uint8_t> & payload) const;

  /**
   * @brief Parse a reassembled response
   * @param raw Serial bytes: function, data, checksum
   * @param source_address Address the frame came from
   * @return Decoded response; ack replies carry their status byte in `status`
   * @throws ProtocolError if too short, unknown function or wrong length
   * @throws ChecksumError if the trailing checksum does not match
   */
  ResponseFrame decode(const std::vector<uint8_t> & raw, uint8_t source_address) const;

  /**
   * @brief Serial length of a complete response to `function`
   * @return Length including checksum, nullopt for unknown functions
   */
  std::optional<std::size_t> expectedResponseLength(uint8_t function) const;

  /**
   * @brief Compute the checksum byte over address, function and payload
   * @param mode Checksum mode, NONE returns 0
   * @param address Motor address
   * @param body Function code followed by payload
   */
  static uint8_t computeChecksum(ChecksumMode mode, uint8_t address, const std::vector<uint8_t> & body);

  static std::size_t checksumWidth(ChecksumMode mode)
  {
    return mode == ChecksumMode::NONE ? 0 : 1;
  }

  /**
   * @brief Whether replies to this function are a single status byte
   */
  static bool isAcknowledgeFunction(uint8_t function);

  /**
   * @brief Response data length (between function code and checksum)
   */
  static std::optional<std::size_t> responseDataLength(uint8_t function);

  // =========================================================================
  // Record layouts
  // =========================================================================

  /**
   * @brief 32-byte drive parameter block, subdivision 256 encoded as 0
   * @throws ValidationError if a field cannot be represented
   */
  static std::vector<uint8_t> encodeDriveParameters(const DriveParameters & params, uint8_t address);

  /**
   * @brief Parse the READ_DRIVE_PARAMS data (byte count, field count, block)
   */
  static DriveParameters decodeDriveParameters(const std::vector<uint8_t> & data, uint8_t address);

  static SystemStatus decodeSystemStatus(const std::vector<uint8_t> & data, uint8_t address);

  static std::vector<uint8_t> encodeHomingParameters(const HomingParameters & params);
  static HomingParameters decodeHomingParameters(const std::vector<uint8_t> & data, uint8_t address);

  static std::vector<uint8_t> encodePidParameters(const PidParameters & params);
  static PidParameters decodePidParameters(const std::vector<uint8_t> & data, uint8_t address);

  static MotorStatus decodeMotorStatus(uint8_t flags);
  static HomingStatus decodeHomingStatus(uint8_t flags);

private:
  ChecksumMode mode_;
};

/**
 * @brief Big-endian field helpers and fixed-point scaling
 */
namespace wire
{

void putU16(std::vector<uint8_t> & out, uint16_t value);
void putU32(std::vector<uint8_t> & out, uint32_t value);
uint16_t readU16(const std::vector<uint8_t> & data, std::size_t offset);
uint32_t readU32(const std::vector<uint8_t> & data, std::size_t offset);

/**
 * @brief Scale a non-negative quantity into an unsigned 16-bit field
 * @throws ValidationError if the scaled value is negative or does not fit
 */
uint16_t scaleToU16(double value, double scale, uint8_t address, const std::string & field);

/**
 * @brief Scale a magnitude into an unsigned 32-bit field
 * @throws ValidationError if the scaled value does not fit
 */
uint32_t scaleToU32(double value, double scale, uint8_t address, const std::string & field);

/**
 * @brief Direction byte for a signed quantity
 */
inline Direction directionOf(double value)
{
  return value < 0.0 ? Direction::NEGATIVE : Direction::POSITIVE;
}

/**
 * @brief Decode `sign, magnitude(width bytes)` into a scaled value
 */
double readSigned(const std::vector<uint8_t> & data, std::size_t offset, std::size_t width, double scale);

}  // namespace wire

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__CODEC_HPP_
