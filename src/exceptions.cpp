#include "zdt_can_driver/exceptions.hpp"

#include <sstream>

namespace zdt_can_driver
{

namespace
{

std::string formatMessage(uint8_t address, const std::string & operation, const std::string & detail)
{
  std::ostringstream ss;
  ss << "[motor " << static_cast<int>(address) << "] " << operation << ": " << detail;
  return ss.str();
}

std::string describeCause(const std::exception_ptr & cause)
{
  if (!cause) {
    return "no underlying error";
  }
  try {
    std::rethrow_exception(cause);
  } catch (const DriverError & e) {
    return e.detail();
  } catch (const std::exception & e) {
    return e.what();
  }
}

}  // namespace

DriverError::DriverError(uint8_t address, const std::string & operation, const std::string & detail)
  : std::runtime_error(formatMessage(address, operation, detail)),
    address_(address),
    operation_(operation),
    detail_(detail)
{
}

CommandError::CommandError(
  uint8_t address, const std::string & operation, uint8_t status_code,
  const std::string & detail)
  : DriverError(address, operation, detail),
    status_code_(status_code)
{
}

RetryExhaustedError::RetryExhaustedError(
  uint8_t address, const std::string & operation, int attempts,
  std::exception_ptr last_cause)
  : DriverError(
      address, operation,
      "gave up after " + std::to_string(attempts) + " attempts, last error: " +
      describeCause(last_cause)),
    attempts_(attempts),
    last_cause_(last_cause)
{
}

void RetryExhaustedError::rethrowLastCause() const
{
  if (last_cause_) {
    std::rethrow_exception(last_cause_);
  }
  throw TimeoutError(address(), operation(), "retries exhausted");
}

}  // namespace zdt_can_driver
