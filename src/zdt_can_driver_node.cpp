#include "zdt_can_driver/zdt_can_driver_node.hpp"

#include <chrono>
#include <cmath>
#include <functional>
#include <stdexcept>

#include "zdt_can_driver/can_interface.hpp"
#include "zdt_can_driver/exceptions.hpp"

namespace zdt_can_driver
{

using namespace std::chrono_literals;
using std::placeholders::_1;
using std::placeholders::_2;

namespace
{

double rpmToRadPerSec(double rpm)
{
  return rpm * 2.0 * M_PI / 60.0;
}

}  // namespace

ZdtCanDriverNode::ZdtCanDriverNode(const rclcpp::NodeOptions & options)
  : Node("zdt_can_driver", options)
{
  RCLCPP_INFO(get_logger(), "Initializing ZDT CAN Driver...");

  declareParameters();
  if (!loadParameters()) {
    RCLCPP_ERROR(get_logger(), "Invalid parameters, driver not started");
    return;
  }

  // Create publishers
  joint_state_pub_ = create_publisher<sensor_msgs::msg::JointState>(
    "~/joint_states", 10);
  bus_status_pub_ = create_publisher<msg::BusStatus>(
    "~/status", 10);

  // Create subscribers
  joint_command_sub_ = create_subscription<sensor_msgs::msg::JointState>(
    "~/joint_commands", 10,
    std::bind(&ZdtCanDriverNode::jointCommandCallback, this, _1));

  // Create services
  enable_srv_ = create_service<std_srvs::srv::SetBool>(
    "~/enable",
    std::bind(&ZdtCanDriverNode::enableServiceCallback, this, _1, _2));

  stop_srv_ = create_service<std_srvs::srv::Trigger>(
    "~/stop",
    std::bind(&ZdtCanDriverNode::stopServiceCallback, this, _1, _2));

  release_stall_srv_ = create_service<std_srvs::srv::Trigger>(
    "~/release_stall",
    std::bind(&ZdtCanDriverNode::releaseStallServiceCallback, this, _1, _2));

  set_zero_srv_ = create_service<std_srvs::srv::Trigger>(
    "~/set_zero",
    std::bind(&ZdtCanDriverNode::setZeroServiceCallback, this, _1, _2));

  home_srv_ = create_service<srv::Home>(
    "~/home",
    std::bind(&ZdtCanDriverNode::homeServiceCallback, this, _1, _2));

  move_axes_srv_ = create_service<srv::MoveAxes>(
    "~/move_axes",
    std::bind(&ZdtCanDriverNode::moveAxesServiceCallback, this, _1, _2));

  if (!initializeBus()) {
    RCLCPP_ERROR(get_logger(), "Failed to initialize CAN bus!");
    return;
  }

  if (!initializeMotors()) {
    RCLCPP_ERROR(get_logger(), "Failed to initialize motors!");
    return;
  }

  auto status_period = std::chrono::duration<double>(1.0 / status_rate_hz_);
  status_timer_ = create_wall_timer(
    std::chrono::duration_cast<std::chrono::nanoseconds>(status_period),
    std::bind(&ZdtCanDriverNode::statusLoopCallback, this));

  RCLCPP_INFO(get_logger(), "ZDT CAN Driver initialized successfully!");
  RCLCPP_INFO(get_logger(), "  Status rate: %.1f Hz", status_rate_hz_);
  RCLCPP_INFO(get_logger(), "  Checksum: %s", toString(bus_config_.checksum_mode));
  RCLCPP_INFO(get_logger(), "  Axes: %zu", axes_.size());
  for (const auto & axis : axes_) {
    RCLCPP_INFO(get_logger(), "    - %s (address: %u)", axis.name.c_str(), axis.address);
  }
}

ZdtCanDriverNode::~ZdtCanDriverNode()
{
  RCLCPP_INFO(get_logger(), "Shutting down ZDT CAN Driver...");

  // Disable all motors before shutdown
  if (!ready()) {
    return;
  }
  for (auto & axis : axes_) {
    try {
      axis.controller->controlActions().disable();
    } catch (const DriverError & e) {
      RCLCPP_WARN(get_logger(), "Failed to disable %s: %s", axis.name.c_str(), e.what());
    }
  }
  transport_->close();
}

// ============================================================================
// Initialization
// ============================================================================

void ZdtCanDriverNode::declareParameters()
{
  // CAN bus
  declare_parameter("can_interface", "can0");
  declare_parameter("checksum_mode", "fixed");

  // Communication
  declare_parameter("response_timeout_ms", 100);
  declare_parameter("max_retries", 3);
  declare_parameter("retry_delay_ms", 20);
  declare_parameter("status_rate_hz", 10.0);
  declare_parameter("max_consecutive_errors", 5);

  // Axis configuration
  declare_parameter("joint_names", std::vector<std::string>{"joint1", "joint2", "joint3"});
  declare_parameter("joint_ids", std::vector<int64_t>{1, 2, 3});

  // Limits (degrees, RPM, mA)
  declare_parameter("position_limits_min", std::vector<double>{-180.0, -90.0, -135.0});
  declare_parameter("position_limits_max", std::vector<double>{180.0, 90.0, 135.0});
  declare_parameter("max_speed_rpm", 1000.0);
  declare_parameter("max_current_ma", 3000);

  // Motion defaults
  declare_parameter("default_speed_rpm", 300.0);
  declare_parameter("default_acceleration", 100.0);
  declare_parameter("homing_timeout_s", 30.0);
  declare_parameter("enable_on_startup", false);
}

bool ZdtCanDriverNode::loadParameters()
{
  bus_config_.interface_name = get_parameter("can_interface").as_string();
  bus_config_.response_timeout =
    std::chrono::milliseconds(get_parameter("response_timeout_ms").as_int());
  bus_config_.retry.max_retries = static_cast<int>(get_parameter("max_retries").as_int());
  bus_config_.retry.retry_delay =
    std::chrono::milliseconds(get_parameter("retry_delay_ms").as_int());
  status_rate_hz_ = get_parameter("status_rate_hz").as_double();
  max_consecutive_errors_ = static_cast<int>(get_parameter("max_consecutive_errors").as_int());
  default_speed_rpm_ = get_parameter("default_speed_rpm").as_double();
  default_acceleration_ = get_parameter("default_acceleration").as_double();
  homing_timeout_s_ = get_parameter("homing_timeout_s").as_double();
  enable_on_startup_ = get_parameter("enable_on_startup").as_bool();

  try {
    bus_config_.checksum_mode = checksumModeFromString(get_parameter("checksum_mode").as_string());
  } catch (const std::invalid_argument & e) {
    RCLCPP_ERROR(get_logger(), "%s", e.what());
    return false;
  }

  if (status_rate_hz_ <= 0.0 || bus_config_.retry.max_retries < 1) {
    RCLCPP_ERROR(get_logger(), "status_rate_hz must be > 0 and max_retries >= 1");
    return false;
  }

  joint_names_ = get_parameter("joint_names").as_string_array();
  auto joint_ids = get_parameter("joint_ids").as_integer_array();
  auto pos_min = get_parameter("position_limits_min").as_double_array();
  auto pos_max = get_parameter("position_limits_max").as_double_array();
  double max_speed = get_parameter("max_speed_rpm").as_double();
  uint16_t max_current = 0;
  try {
    max_current = currentLimitFromParameter(get_parameter("max_current_ma").as_int());
  } catch (const std::invalid_argument & e) {
    RCLCPP_ERROR(get_logger(), "max_current_ma: %s", e.what());
    return false;
  }

  if (joint_ids.size() != joint_names_.size()) {
    RCLCPP_ERROR(
      get_logger(), "joint_ids has %zu entries, joint_names has %zu",
      joint_ids.size(), joint_names_.size());
    return false;
  }

  joint_ids_.clear();
  joint_limits_.clear();
  for (size_t i = 0; i < joint_names_.size(); ++i) {
    if (joint_ids[i] < 1 || joint_ids[i] > 255) {
      RCLCPP_ERROR(
        get_logger(), "Joint %s: address %ld outside 1..255",
        joint_names_[i].c_str(), static_cast<long>(joint_ids[i]));
      return false;
    }
    joint_ids_.push_back(static_cast<uint8_t>(joint_ids[i]));

    AxisLimits limits;
    if (i < pos_min.size()) {
      limits.min_position_deg = pos_min[i];
    }
    if (i < pos_max.size()) {
      limits.max_position_deg = pos_max[i];
    }
    limits.max_speed_rpm = max_speed;
    limits.max_current_ma = max_current;
    joint_limits_.push_back(limits);
  }
  return true;
}

bool ZdtCanDriverNode::initializeBus()
{
  auto can = std::make_shared<SocketCanInterface>(bus_config_.interface_name);
  transport_ = std::make_shared<Transport>(can, bus_config_.checksum_mode, get_logger());

  try {
    transport_->open();
  } catch (const ConnectionError & e) {
    RCLCPP_ERROR(get_logger(), "%s", e.what());
    return false;
  }

  broadcast_ = std::make_unique<MotorController>(kBroadcastAddress, transport_, bus_config_);
  axes_.clear();
  axes_.reserve(joint_names_.size());
  for (size_t i = 0; i < joint_names_.size(); ++i) {
    Axis axis;
    axis.name = joint_names_[i];
    axis.address = joint_ids_[i];
    axis.controller = std::make_unique<MotorController>(
      axis.address, transport_, bus_config_, joint_limits_[i]);
    axis.last_state.address = axis.address;
    axis.last_state.name = axis.name;
    axes_.push_back(std::move(axis));
  }
  return true;
}

bool ZdtCanDriverNode::initializeMotors()
{
  for (auto & axis : axes_) {
    RCLCPP_INFO(
      get_logger(), "Initializing axis '%s' (address: %u)...",
      axis.name.c_str(), axis.address);

    try {
      auto version = axis.controller->readParameters().getVersion();
      auto params = axis.controller->readParameters().getDriveParameters();
      RCLCPP_INFO(
        get_logger(), "  Axis %s: firmware %s, hardware %s, subdivision %u, max %u RPM",
        axis.name.c_str(), version.firmware.c_str(), version.hardware.c_str(),
        params.subdivision, params.max_speed_limit_rpm);

      if (params.checksum_mode != bus_config_.checksum_mode) {
        RCLCPP_WARN(
          get_logger(), "  Axis %s reports checksum mode %s, bus uses %s",
          axis.name.c_str(), toString(params.checksum_mode),
          toString(bus_config_.checksum_mode));
      }
    } catch (const DriverError & e) {
      axis.last_state.last_error = e.what();
      RCLCPP_WARN(get_logger(), "  Failed to initialize axis %s: %s", axis.name.c_str(), e.what());
    }
  }

  if (enable_on_startup_) {
    for (auto & axis : axes_) {
      try {
        axis.controller->controlActions().enable();
      } catch (const DriverError & e) {
        RCLCPP_ERROR(get_logger(), "Failed to enable %s: %s", axis.name.c_str(), e.what());
        return false;
      }
    }
    RCLCPP_INFO(get_logger(), "Motors enabled on startup");
  }

  return true;
}

// ============================================================================
// Callbacks
// ============================================================================

void ZdtCanDriverNode::statusLoopCallback()
{
  if (!ready()) {
    return;
  }

  sensor_msgs::msg::JointState joint_state_msg;
  joint_state_msg.header.stamp = now();
  joint_state_msg.name.reserve(axes_.size());
  joint_state_msg.position.reserve(axes_.size());
  joint_state_msg.velocity.reserve(axes_.size());
  joint_state_msg.effort.reserve(axes_.size());

  msg::BusStatus status_msg;
  status_msg.header.stamp = joint_state_msg.header.stamp;
  status_msg.interface_name = bus_config_.interface_name;
  status_msg.bus_open = transport_->isOpen();
  status_msg.sync_pending = !transport_->syncGroup().empty();

  for (auto & axis : axes_) {
    msg::AxisState & state = axis.last_state;

    try {
      auto status = axis.controller->readParameters().getSystemStatus();
      state.position_deg = status.realtime_position_deg;
      state.speed_rpm = status.realtime_speed_rpm;
      state.phase_current_a = status.phase_current_a;
      state.temperature_c = status.temperature_c;
      state.bus_voltage_v = status.bus_voltage_v;
      state.enabled = status.motor_enabled;
      state.in_position = status.in_position;
      state.stall_triggered = status.stall_triggered;
      state.last_error.clear();
      consecutive_errors_ = 0;

      if (status.stall_triggered) {
        RCLCPP_WARN_THROTTLE(
          get_logger(), *get_clock(), 1000,
          "Axis %s stall protection triggered", axis.name.c_str());
      }
    } catch (const DriverError & e) {
      consecutive_errors_++;
      state.last_error = e.what();
      RCLCPP_WARN_THROTTLE(
        get_logger(), *get_clock(), 1000,
        "No status from axis %s: %s", axis.name.c_str(), e.what());
    }

    state.online = axis.controller->connectionStatus() == ConnectionStatus::ONLINE;
    state.pending_sync = axis.controller->pendingSync();
    state.homing_state = toString(axis.controller->homingCommands().state());

    joint_state_msg.name.push_back(axis.name);
    joint_state_msg.position.push_back(degreesToRadians(state.position_deg));
    joint_state_msg.velocity.push_back(rpmToRadPerSec(state.speed_rpm));
    joint_state_msg.effort.push_back(state.phase_current_a);
    status_msg.axes.push_back(state);
  }

  if (consecutive_errors_ > max_consecutive_errors_) {
    RCLCPP_ERROR(get_logger(), "Too many consecutive CAN errors, triggering emergency stop");
    emergencyStop();
    consecutive_errors_ = 0;
  }

  joint_state_pub_->publish(joint_state_msg);
  bus_status_pub_->publish(status_msg);
}

void ZdtCanDriverNode::jointCommandCallback(const sensor_msgs::msg::JointState::SharedPtr msg)
{
  if (!ready()) {
    return;
  }

  std::vector<std::pair<Axis *, double>> targets;
  for (size_t i = 0; i < msg->name.size() && i < msg->position.size(); ++i) {
    Axis * axis = findAxis(msg->name[i]);
    if (!axis) {
      RCLCPP_WARN_THROTTLE(
        get_logger(), *get_clock(), 1000, "Unknown joint %s", msg->name[i].c_str());
      continue;
    }
    targets.emplace_back(axis, radiansToDegrees(msg->position[i]));
  }
  if (targets.empty()) {
    return;
  }

  try {
    moveSynchronized(targets, default_speed_rpm_, true);
  } catch (const DriverError & e) {
    RCLCPP_ERROR(get_logger(), "Joint command rejected: %s", e.what());
  }
}

// ============================================================================
// Service handlers
// ============================================================================

void ZdtCanDriverNode::enableServiceCallback(
  const std::shared_ptr<std_srvs::srv::SetBool::Request> request,
  std::shared_ptr<std_srvs::srv::SetBool::Response> response)
{
  const bool enable = request->data;
  response->success = applyToAll(
    enable ? "enable" : "disable",
    [enable](MotorController & motor) {
      if (enable) {
        motor.controlActions().enable();
      } else {
        motor.controlActions().disable();
      }
    },
    response->message);
}

void ZdtCanDriverNode::stopServiceCallback(
  const std::shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  response->success = applyToAll(
    "stop", [](MotorController & motor) {motor.controlActions().stop();},
    response->message);
}

void ZdtCanDriverNode::releaseStallServiceCallback(
  const std::shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  response->success = applyToAll(
    "release stall protection",
    [](MotorController & motor) {motor.triggerActions().releaseStallProtection();},
    response->message);
}

void ZdtCanDriverNode::setZeroServiceCallback(
  const std::shared_ptr<std_srvs::srv::Trigger::Request> /*request*/,
  std::shared_ptr<std_srvs::srv::Trigger::Response> response)
{
  response->success = applyToAll(
    "set zero",
    [](MotorController & motor) {motor.homingCommands().setZeroPosition(true);},
    response->message);
}

void ZdtCanDriverNode::homeServiceCallback(
  const std::shared_ptr<srv::Home::Request> request,
  std::shared_ptr<srv::Home::Response> response)
{
  response->success = false;
  if (!ready()) {
    response->message = "Driver not initialized";
    return;
  }

  Axis * axis = findAxis(request->address);
  if (!axis) {
    response->message = "Unknown axis address " + std::to_string(request->address);
    return;
  }
  if (request->mode > static_cast<uint8_t>(HomingMode::LAST_POWER_DOWN)) {
    response->message = "Invalid homing mode. Use 0..5";
    return;
  }

  const double timeout_s = request->timeout_s > 0.0 ? request->timeout_s : homing_timeout_s_;
  auto & homing = axis->controller->homingCommands();

  try {
    homing.triggerHoming(static_cast<HomingMode>(request->mode));
    HomingState result = homing.waitForHomingComplete(
      std::chrono::milliseconds(static_cast<int64_t>(timeout_s * 1000.0)));
    response->state = toString(result);
    response->success = result == HomingState::COMPLETED;
    response->message = "Homing of " + axis->name + " " + response->state;
  } catch (const DriverError & e) {
    response->state = toString(homing.state());
    response->message = e.what();
  }

  if (response->success) {
    RCLCPP_INFO(get_logger(), "%s", response->message.c_str());
  } else {
    RCLCPP_ERROR(get_logger(), "%s", response->message.c_str());
  }
}

void ZdtCanDriverNode::moveAxesServiceCallback(
  const std::shared_ptr<srv::MoveAxes::Request> request,
  std::shared_ptr<srv::MoveAxes::Response> response)
{
  response->success = false;
  if (!ready()) {
    response->message = "Driver not initialized";
    return;
  }
  if (request->addresses.size() != request->positions_deg.size()) {
    response->message = "addresses and positions_deg differ in length";
    return;
  }

  std::vector<std::pair<Axis *, double>> targets;
  for (size_t i = 0; i < request->addresses.size(); ++i) {
    Axis * axis = findAxis(request->addresses[i]);
    if (!axis) {
      response->message = "Unknown axis address " + std::to_string(request->addresses[i]);
      return;
    }
    targets.emplace_back(axis, request->positions_deg[i]);
  }

  const double speed = request->speed_rpm > 0.0 ? request->speed_rpm : default_speed_rpm_;

  try {
    if (request->synchronized) {
      moveSynchronized(targets, speed, request->absolute);
    } else {
      for (const auto & target : targets) {
        target.first->controller->controlActions().validateMove(
          target.second, speed, request->absolute);
      }
      for (auto & target : targets) {
        target.first->controller->controlActions().moveToPosition(
          target.second, speed, false, request->absolute);
      }
    }
    response->success = true;
    response->message = "Moving " + std::to_string(targets.size()) + " axes";
  } catch (const DriverError & e) {
    response->message = e.what();
    RCLCPP_ERROR(get_logger(), "Move rejected: %s", e.what());
  }
}

// ============================================================================
// Helper functions
// ============================================================================

bool ZdtCanDriverNode::applyToAll(
  const std::string & action, const std::function<void(MotorController &)> & fn,
  std::string & message)
{
  if (!ready()) {
    message = "Driver not initialized";
    return false;
  }

  bool success = true;
  for (auto & axis : axes_) {
    try {
      fn(*axis.controller);
    } catch (const DriverError & e) {
      success = false;
      axis.last_state.last_error = e.what();
      RCLCPP_ERROR(
        get_logger(), "Failed to %s axis %s: %s", action.c_str(), axis.name.c_str(), e.what());
    }
  }

  if (success) {
    message = action + " done for all axes";
    RCLCPP_INFO(get_logger(), "%s", message.c_str());
  } else {
    message = "Failed to " + action + " some axes";
  }
  return success;
}

ZdtCanDriverNode::Axis * ZdtCanDriverNode::findAxis(uint8_t address)
{
  for (auto & axis : axes_) {
    if (axis.address == address) {
      return &axis;
    }
  }
  return nullptr;
}

ZdtCanDriverNode::Axis * ZdtCanDriverNode::findAxis(const std::string & name)
{
  for (auto & axis : axes_) {
    if (axis.name == name) {
      return &axis;
    }
  }
  return nullptr;
}

void ZdtCanDriverNode::moveSynchronized(
  const std::vector<std::pair<Axis *, double>> & targets, double speed_rpm, bool absolute)
{
  std::vector<SyncTarget> sync_targets;
  sync_targets.reserve(targets.size());
  for (const auto & target : targets) {
    sync_targets.push_back({target.first->controller.get(), target.second});
  }
  zdt_can_driver::moveSynchronized(
    *broadcast_, sync_targets, speed_rpm, default_acceleration_, default_acceleration_, absolute);
}

void ZdtCanDriverNode::emergencyStop()
{
  RCLCPP_ERROR(get_logger(), "EMERGENCY STOP TRIGGERED!");

  for (auto & axis : axes_) {
    try {
      axis.controller->controlActions().stop();
    } catch (const DriverError & e) {
      RCLCPP_ERROR(get_logger(), "Failed to stop %s: %s", axis.name.c_str(), e.what());
    }
  }
}

bool ZdtCanDriverNode::ready() const
{
  return transport_ && broadcast_ && transport_->isOpen();
}

}  // namespace zdt_can_driver
