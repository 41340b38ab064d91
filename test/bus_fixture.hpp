#ifndef ZDT_CAN_DRIVER__TEST__BUS_FIXTURE_HPP_
#define ZDT_CAN_DRIVER__TEST__BUS_FIXTURE_HPP_

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "fake_can_bus.hpp"
#include "zdt_can_driver/motor_controller.hpp"
#include "zdt_can_driver/transport.hpp"

namespace zdt_can_driver
{
namespace test
{

/**
 * @brief Open bus with simulated drives at addresses 1 and 2
 */
class BusFixture : public ::testing::Test
{
protected:
  void SetUp() override
  {
    bus_ = std::make_shared<FakeCanBus>(checksumMode());
    bus_->addDrive(1);
    bus_->addDrive(2);

    transport_ = std::make_shared<Transport>(bus_, checksumMode());
    transport_->open();

    config_.checksum_mode = checksumMode();
    config_.response_timeout = std::chrono::milliseconds(20);
    config_.retry.max_retries = 3;
    config_.retry.retry_delay = std::chrono::milliseconds(0);
  }

  virtual ChecksumMode checksumMode() const { return ChecksumMode::FIXED_6B; }

  std::unique_ptr<MotorController> makeMotor(uint8_t address, const AxisLimits & limits = {})
  {
    return std::make_unique<MotorController>(address, transport_, config_, limits);
  }

  std::shared_ptr<FakeCanBus> bus_;
  std::shared_ptr<Transport> transport_;
  BusConfig config_;
};

}  // namespace test
}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__TEST__BUS_FIXTURE_HPP_
