#include "zdt_can_driver/motor_controller.hpp"

#include <string>

#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

namespace
{

rclcpp::Logger motorLogger(const std::shared_ptr<Transport> & transport, uint8_t address)
{
  if (!transport) {
    throw ConnectionError(address, "motor_controller", "no transport given");
  }
  return transport->getLogger().get_child("motor_" + std::to_string(address));
}

}  // namespace

MotorController::MotorController(
  uint8_t address, std::shared_ptr<Transport> transport, const BusConfig & config,
  const AxisLimits & limits)
  : channel_(address, transport, config, motorLogger(transport, address)),
    control_actions_(channel_, limits),
    read_parameters_(channel_, state_),
    modify_parameters_(channel_, read_parameters_, state_),
    homing_commands_(channel_, state_),
    trigger_actions_(channel_, state_)
{
  // The drive may have lost RAM-only settings while unreachable
  channel_.setOfflineHandler([this]() {state_.invalidateDriveParameters();});
}

bool MotorController::pendingSync() const
{
  return channel_.transport().syncGroup().contains(channel_.address());
}

void moveSynchronized(
  MotorController & broadcast, const std::vector<SyncTarget> & targets,
  double max_speed_rpm, double acceleration, double deceleration, bool absolute)
{
  if (broadcast.address() != kBroadcastAddress) {
    throw ValidationError(
      broadcast.address(), "sync_motion", "sync trigger must be sent from the broadcast address");
  }
  for (const auto & target : targets) {
    target.motor->controlActions().validateMove(target.position_deg, max_speed_rpm, absolute);
  }

  try {
    for (const auto & target : targets) {
      target.motor->controlActions().moveToPositionTrapezoid(
        target.position_deg, max_speed_rpm, acceleration, deceleration, true, absolute);
    }
  } catch (const DriverError &) {
    broadcast.controlActions().abortSync();
    throw;
  }
  broadcast.controlActions().syncMotion();
}

}  // namespace zdt_can_driver
