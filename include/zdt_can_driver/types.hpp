#ifndef ZDT_CAN_DRIVER__TYPES_HPP_
#define ZDT_CAN_DRIVER__TYPES_HPP_

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace zdt_can_driver
{

/**
 * @brief Reserved group address used only to trigger synchronized motion
 */
constexpr uint8_t kBroadcastAddress = 0x00;

/**
 * @brief Longest serial frame (function + payload + checksum) the drive accepts
 */
constexpr std::size_t kMaxFrameLength = 64;

/**
 * @brief Classic CAN data length
 */
constexpr std::size_t kCanPacketLength = 8;

/**
 * @brief Frame integrity algorithm configured on the drive (menu "Checksum")
 */
enum class ChecksumMode : uint8_t
{
  FIXED_6B = 0x00,
  XOR = 0x01,
  CRC8 = 0x02,
  NONE = 0x03
};

constexpr uint8_t kFixedChecksumByte = 0x6B;

/**
 * @brief Command function codes
 */
namespace FunctionCode
{
  constexpr uint8_t ERROR_REPLY = 0x00;

  // Control actions
  constexpr uint8_t MOTOR_ENABLE = 0xF3;
  constexpr uint8_t TORQUE_MODE = 0xF5;
  constexpr uint8_t SPEED_MODE = 0xF6;
  constexpr uint8_t POSITION_DIRECT = 0xFB;
  constexpr uint8_t POSITION_TRAPEZOID = 0xFD;
  constexpr uint8_t IMMEDIATE_STOP = 0xFE;
  constexpr uint8_t SYNC_MOTION = 0xFF;

  // Homing
  constexpr uint8_t SET_ZERO_POSITION = 0x93;
  constexpr uint8_t TRIGGER_HOMING = 0x9A;
  constexpr uint8_t ABORT_HOMING = 0x9C;
  constexpr uint8_t READ_HOMING_PARAMS = 0x22;
  constexpr uint8_t MODIFY_HOMING_PARAMS = 0x4C;
  constexpr uint8_t READ_HOMING_STATUS = 0x3B;

  // Trigger actions
  constexpr uint8_t ENCODER_CALIBRATION = 0x06;
  constexpr uint8_t CLEAR_POSITION = 0x0A;
  constexpr uint8_t RELEASE_STALL_PROTECTION = 0x0E;
  constexpr uint8_t FACTORY_RESET = 0x0F;

  // Reads
  constexpr uint8_t READ_VERSION = 0x1F;
  constexpr uint8_t READ_RESISTANCE_INDUCTANCE = 0x20;
  constexpr uint8_t READ_PID_PARAMS = 0x21;
  constexpr uint8_t READ_BUS_VOLTAGE = 0x24;
  constexpr uint8_t READ_BUS_CURRENT = 0x26;
  constexpr uint8_t READ_PHASE_CURRENT = 0x27;
  constexpr uint8_t READ_ENCODER_RAW = 0x29;
  constexpr uint8_t READ_PULSE_COUNT = 0x30;
  constexpr uint8_t READ_ENCODER_CALIBRATED = 0x31;
  constexpr uint8_t READ_INPUT_PULSE = 0x32;
  constexpr uint8_t READ_TARGET_POSITION = 0x33;
  constexpr uint8_t READ_REALTIME_TARGET_POSITION = 0x34;
  constexpr uint8_t READ_REALTIME_SPEED = 0x35;
  constexpr uint8_t READ_REALTIME_POSITION = 0x36;
  constexpr uint8_t READ_POSITION_ERROR = 0x37;
  constexpr uint8_t READ_TEMPERATURE = 0x39;
  constexpr uint8_t READ_MOTOR_STATUS = 0x3A;
  constexpr uint8_t READ_DRIVE_PARAMS = 0x42;
  constexpr uint8_t READ_SYSTEM_STATUS = 0x43;

  // Writes
  constexpr uint8_t MODIFY_DRIVE_PARAMS = 0x48;
  constexpr uint8_t MODIFY_PID_PARAMS = 0x4A;
  constexpr uint8_t MODIFY_SUBDIVISION = 0x84;
  constexpr uint8_t MODIFY_ADDRESS = 0xAE;
}  // namespace FunctionCode

/**
 * @brief Auxiliary codes that must follow certain function codes
 */
namespace AuxCode
{
  constexpr uint8_t MOTOR_ENABLE = 0xAB;
  constexpr uint8_t IMMEDIATE_STOP = 0x98;
  constexpr uint8_t SYNC_MOTION = 0x66;
  constexpr uint8_t SET_ZERO_POSITION = 0x88;
  constexpr uint8_t ABORT_HOMING = 0x48;
  constexpr uint8_t MODIFY_HOMING_PARAMS = 0xAE;
  constexpr uint8_t ENCODER_CALIBRATION = 0x45;
  constexpr uint8_t CLEAR_POSITION = 0x6D;
  constexpr uint8_t RELEASE_STALL_PROTECTION = 0x52;
  constexpr uint8_t FACTORY_RESET = 0x5F;
  constexpr uint8_t READ_DRIVE_PARAMS = 0x6C;
  constexpr uint8_t READ_SYSTEM_STATUS = 0x7A;
  constexpr uint8_t MODIFY_DRIVE_PARAMS = 0xD1;
  constexpr uint8_t MODIFY_PID_PARAMS = 0xC3;
  constexpr uint8_t MODIFY_SUBDIVISION = 0x8A;
  constexpr uint8_t MODIFY_ADDRESS = 0x4B;
}  // namespace AuxCode

/**
 * @brief Status byte carried by acknowledge replies
 */
namespace StatusCode
{
  constexpr uint8_t DATA_RESPONSE = 0x00;
  constexpr uint8_t SUCCESS = 0x02;
  constexpr uint8_t REACHED = 0x9F;
  constexpr uint8_t CONDITION_NOT_MET = 0xE2;
  constexpr uint8_t COMMAND_ERROR = 0xEE;
}  // namespace StatusCode

namespace MotorStatusFlag
{
  constexpr uint8_t ENABLED = 0x01;
  constexpr uint8_t IN_POSITION = 0x02;
  constexpr uint8_t STALLED = 0x04;
  constexpr uint8_t STALL_PROTECTION = 0x08;
}  // namespace MotorStatusFlag

namespace HomingStatusFlag
{
  constexpr uint8_t ENCODER_READY = 0x01;
  constexpr uint8_t CALIBRATION_TABLE_READY = 0x02;
  constexpr uint8_t HOMING_IN_PROGRESS = 0x04;
  constexpr uint8_t HOMING_FAILED = 0x08;
  constexpr uint8_t POSITION_PRECISION_HIGH = 0x80;
}  // namespace HomingStatusFlag

/**
 * @brief Sign byte used by directional fields
 */
enum class Direction : uint8_t
{
  POSITIVE = 0x00,
  NEGATIVE = 0x01
};

/**
 * @brief Drive control loop selection
 */
enum class ControlMode : uint8_t
{
  OPEN_LOOP = 0,
  CLOSED_LOOP_FOC = 1
};

enum class HomingMode : uint8_t
{
  SINGLE_TURN_NEAREST = 0x00,
  SINGLE_TURN_DIRECTIONAL = 0x01,
  COLLISION = 0x02,
  LIMIT_SWITCH = 0x03,
  ABSOLUTE_ZERO = 0x04,
  LAST_POWER_DOWN = 0x05
};

enum class HomingState : uint8_t
{
  IDLE,
  REQUESTED,
  IN_PROGRESS,
  COMPLETED,
  TIMED_OUT,
  FAILED
};

/**
 * @brief Last known reachability of a drive
 */
enum class ConnectionStatus : uint8_t
{
  UNKNOWN,
  ONLINE,
  OFFLINE
};

// ============================================================================
// Frames
// ============================================================================

/**
 * @brief CAN frame structure (classic CAN, extended id)
 */
struct CanFrame
{
  uint32_t id{0};
  uint8_t data[8]{0};
  uint8_t len{0};
};

/**
 * @brief Outgoing command, immutable once built by the codec
 */
struct CommandFrame
{
  uint8_t function{0};
  uint8_t address{0};
  std::vector<uint8_t> payload;
  std::optional<uint8_t> checksum;  // absent in ChecksumMode::NONE

  /**
   * @brief Serial byte sequence: function, payload, checksum
   */
  std::vector<uint8_t> serialize() const;
};

/**
 * @brief Decoded reply of a drive
 */
struct ResponseFrame
{
  uint8_t address{0};
  uint8_t function{0};
  uint8_t status{StatusCode::DATA_RESPONSE};
  std::vector<uint8_t> payload;
};

// ============================================================================
// Records
// ============================================================================

struct MotorStatus
{
  bool enabled{false};
  bool in_position{false};
  bool stalled{false};
  bool stall_protection{false};
};

struct HomingStatus
{
  bool encoder_ready{false};
  bool calibration_table_ready{false};
  bool homing_in_progress{false};
  bool homing_failed{false};
  bool position_precision_high{false};
  HomingState state{HomingState::IDLE};
};

struct HomingParameters
{
  HomingMode mode{HomingMode::SINGLE_TURN_NEAREST};
  Direction direction{Direction::POSITIVE};
  uint16_t speed_rpm{30};
  uint32_t timeout_ms{10000};
  uint16_t collision_speed_rpm{300};
  uint16_t collision_current_ma{800};
  uint16_t collision_time_ms{60};
  bool auto_homing_on_power_up{false};

  bool operator==(const HomingParameters & other) const;
};

struct PidParameters
{
  uint32_t trapezoid_position_kp{0};
  uint32_t direct_position_kp{0};
  uint32_t speed_kp{0};
  uint32_t speed_ki{0};
};

struct VersionInfo
{
  uint16_t firmware_raw{0};
  uint16_t hardware_raw{0};
  std::string firmware;
  std::string hardware;
};

struct ResistanceInductance
{
  double resistance_ohm{0.0};
  double inductance_mh{0.0};
};

/**
 * @brief Drive configuration record, read and written as a whole
 */
struct DriveParameters
{
  bool lock_enabled{false};
  ControlMode control_mode{ControlMode::CLOSED_LOOP_FOC};
  uint8_t pulse_port_function{1};
  uint8_t serial_port_function{2};
  uint8_t enable_pin_mode{2};
  Direction motor_direction{Direction::POSITIVE};
  uint16_t subdivision{16};          // 1..256
  bool subdivision_interpolation{true};
  bool auto_screen_off{false};
  uint8_t lpf_intensity{0};
  uint16_t open_loop_current_ma{1200};
  uint16_t closed_loop_max_current_ma{2200};
  uint16_t max_speed_limit_rpm{3000};
  uint16_t current_loop_bandwidth{1000};  // rad/s
  uint8_t uart_baudrate{5};          // option index 0..7
  uint8_t can_baudrate{7};           // option index 0..7
  ChecksumMode checksum_mode{ChecksumMode::FIXED_6B};
  uint8_t response_mode{1};          // 0 none, 1 receive, 2 reached, 3 both, 4 other
  bool position_precision_high{false};
  bool stall_protection_enabled{true};
  uint16_t stall_protection_speed_rpm{8};
  uint16_t stall_protection_current_ma{2000};
  uint16_t stall_protection_time_ms{2000};
  uint16_t position_arrival_window{3};  // 0.1 degree units

  bool operator==(const DriveParameters & other) const;
  bool operator!=(const DriveParameters & other) const { return !(*this == other); }
};

/**
 * @brief Telemetry snapshot returned by READ_SYSTEM_STATUS
 */
struct SystemStatus
{
  double bus_voltage_v{0.0};
  double bus_current_a{0.0};
  double phase_current_a{0.0};
  uint16_t encoder_raw{0};
  uint16_t encoder_calibrated{0};
  double target_position_deg{0.0};
  double realtime_speed_rpm{0.0};
  double realtime_position_deg{0.0};
  double position_error_deg{0.0};
  double temperature_c{0.0};
  uint8_t homing_flags{0};
  uint8_t motor_flags{0};

  bool encoder_ready{false};
  bool motor_enabled{false};
  bool in_position{false};
  bool stall_triggered{false};
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief Retry bound for idempotent requests
 *
 * max_retries is the total number of transmissions of one request.
 */
struct RetryPolicy
{
  int max_retries{3};
  std::chrono::milliseconds retry_delay{20};
};

/**
 * @brief Per-bus session settings
 */
struct BusConfig
{
  std::string interface_name{"can0"};
  ChecksumMode checksum_mode{ChecksumMode::FIXED_6B};
  std::chrono::milliseconds response_timeout{1000};
  RetryPolicy retry;
};

/**
 * @brief Per-axis limits checked before any command is encoded
 */
struct AxisLimits
{
  std::optional<double> min_position_deg;
  std::optional<double> max_position_deg;
  double max_speed_rpm{3000.0};
  uint16_t max_current_ma{3000};
};

// ============================================================================
// Unit Conversion Functions
// ============================================================================

constexpr double kSpeedScale = 10.0;          // 0.1 RPM units
constexpr double kPositionScale = 10.0;       // 0.1 degree units
constexpr double kPositionErrorScale = 100.0; // 0.01 degree units
constexpr double kEncoderRawCounts = 16384.0;
constexpr double kEncoderCalibratedCounts = 65536.0;

inline double degreesToRadians(double degrees)
{
  return degrees * M_PI / 180.0;
}

inline double radiansToDegrees(double radians)
{
  return radians * 180.0 / M_PI;
}

inline double encoderRawToDegrees(uint16_t raw)
{
  return raw / kEncoderRawCounts * 360.0;
}

inline double encoderCalibratedToDegrees(uint16_t raw)
{
  return raw / kEncoderCalibratedCounts * 360.0;
}

/**
 * @brief Parse "fixed", "xor", "crc8" or "none"
 * @throws std::invalid_argument on any other value
 */
ChecksumMode checksumModeFromString(const std::string & name);

/**
 * @brief Convert a configured current limit to the 16-bit mA field
 * @throws std::invalid_argument outside 0..65535
 */
uint16_t currentLimitFromParameter(int64_t value_ma);

const char * toString(ChecksumMode mode);
const char * toString(HomingState state);
const char * toString(ConnectionStatus status);

/**
 * @brief Human-readable name of a function code, "unknown" if not in the table
 */
const char * functionName(uint8_t function);

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__TYPES_HPP_
