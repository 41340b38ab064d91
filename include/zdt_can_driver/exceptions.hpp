#ifndef ZDT_CAN_DRIVER__EXCEPTIONS_HPP_
#define ZDT_CAN_DRIVER__EXCEPTIONS_HPP_

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <string>

namespace zdt_can_driver
{

/**
 * @brief Base of every error raised by the protocol stack
 *
 * Carries the motor address and the operation that was attempted. The
 * message is formatted as "[motor <address>] <operation>: <detail>".
 */
class DriverError : public std::runtime_error
{
public:
  DriverError(uint8_t address, const std::string & operation, const std::string & detail);

  uint8_t address() const noexcept { return address_; }
  const std::string & operation() const noexcept { return operation_; }
  const std::string & detail() const noexcept { return detail_; }

private:
  uint8_t address_;
  std::string operation_;
  std::string detail_;
};

/**
 * @brief Argument outside its protocol-legal range, raised before any I/O
 */
class ValidationError : public DriverError
{
public:
  using DriverError::DriverError;
};

/**
 * @brief No complete response within the response window
 */
class TimeoutError : public DriverError
{
public:
  using DriverError::DriverError;
};

/**
 * @brief Response failed its integrity check
 */
class ChecksumError : public DriverError
{
public:
  using DriverError::DriverError;
};

/**
 * @brief Malformed, truncated or unrecognized frame
 */
class ProtocolError : public DriverError
{
public:
  using DriverError::DriverError;
};

/**
 * @brief The drive answered with a rejection or fault code
 */
class CommandError : public DriverError
{
public:
  CommandError(
    uint8_t address, const std::string & operation, uint8_t status_code,
    const std::string & detail);

  uint8_t statusCode() const noexcept { return status_code_; }

private:
  uint8_t status_code_;
};

/**
 * @brief CAN interface missing, closed or failing at the socket level
 */
class ConnectionError : public DriverError
{
public:
  using DriverError::DriverError;
};

/**
 * @brief Retry bound exhausted for an idempotent request
 *
 * Aggregates the attempts; lastCause() holds the final TimeoutError or
 * ChecksumError.
 */
class RetryExhaustedError : public DriverError
{
public:
  RetryExhaustedError(
    uint8_t address, const std::string & operation, int attempts,
    std::exception_ptr last_cause);

  int attempts() const noexcept { return attempts_; }
  std::exception_ptr lastCause() const noexcept { return last_cause_; }

  /**
   * @brief Rethrow the underlying error so callers can catch it by type
   */
  [[noreturn]] void rethrowLastCause() const;

private:
  int attempts_;
  std::exception_ptr last_cause_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__EXCEPTIONS_HPP_
