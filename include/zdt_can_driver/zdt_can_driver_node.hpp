#ifndef ZDT_CAN_DRIVER__ZDT_CAN_DRIVER_NODE_HPP_
#define ZDT_CAN_DRIVER__ZDT_CAN_DRIVER_NODE_HPP_

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "sensor_msgs/msg/joint_state.hpp"
#include "std_srvs/srv/set_bool.hpp"
#include "std_srvs/srv/trigger.hpp"

#include "zdt_can_driver/motor_controller.hpp"
#include "zdt_can_driver/transport.hpp"
#include "zdt_can_driver/types.hpp"
#include "zdt_can_driver/msg/axis_state.hpp"
#include "zdt_can_driver/msg/bus_status.hpp"
#include "zdt_can_driver/srv/home.hpp"
#include "zdt_can_driver/srv/move_axes.hpp"

namespace zdt_can_driver
{

/**
 * @brief ROS2 node driving every ZDT axis on one CAN bus
 */
class ZdtCanDriverNode : public rclcpp::Node
{
public:
  /**
   * @brief Constructor
   * @param options Node options
   */
  explicit ZdtCanDriverNode(const rclcpp::NodeOptions & options = rclcpp::NodeOptions());

  /**
   * @brief Destructor - disables every axis
   */
  ~ZdtCanDriverNode() override;

private:
  struct Axis
  {
    std::string name;
    uint8_t address{0};
    std::unique_ptr<MotorController> controller;
    msg::AxisState last_state;
  };

  // =========================================================================
  // Initialization
  // =========================================================================

  /**
   * @brief Declare parameters with defaults
   */
  void declareParameters();

  /**
   * @brief Load parameters into member variables
   * @return false if a parameter is invalid
   */
  bool loadParameters();

  /**
   * @brief Open the bus and build one controller per axis
   */
  bool initializeBus();

  /**
   * @brief Query every axis (version, drive configuration), optionally enable
   */
  bool initializeMotors();

  // =========================================================================
  // Callbacks
  // =========================================================================

  /**
   * @brief Status loop callback - runs at status_rate_hz
   */
  void statusLoopCallback();

  /**
   * @brief Synchronized move of the named joints (positions in radians)
   */
  void jointCommandCallback(const sensor_msgs::msg::JointState::SharedPtr msg);

  // =========================================================================
  // Service handlers
  // =========================================================================

  void enableServiceCallback(
    const std::shared_ptr<std_srvs::srv::SetBool::Request> request,
    std::shared_ptr<std_srvs::srv::SetBool::Response> response);

  void stopServiceCallback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  void releaseStallServiceCallback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  void setZeroServiceCallback(
    const std::shared_ptr<std_srvs::srv::Trigger::Request> request,
    std::shared_ptr<std_srvs::srv::Trigger::Response> response);

  /**
   * @brief Home one axis and block until it finishes or times out
   */
  void homeServiceCallback(
    const std::shared_ptr<srv::Home::Request> request,
    std::shared_ptr<srv::Home::Response> response);

  void moveAxesServiceCallback(
    const std::shared_ptr<srv::MoveAxes::Request> request,
    std::shared_ptr<srv::MoveAxes::Response> response);

  // =========================================================================
  // Helper functions
  // =========================================================================

  Axis * findAxis(uint8_t address);
  Axis * findAxis(const std::string & name);

  /**
   * @brief Preload every target, then release them with one sync trigger
   */
  void moveSynchronized(
    const std::vector<std::pair<Axis *, double>> & targets, double speed_rpm, bool absolute);

  /**
   * @brief Run an action on every axis, collecting failures
   * @return true if every axis succeeded
   */
  bool applyToAll(
    const std::string & action, const std::function<void(MotorController &)> & fn,
    std::string & message);

  /**
   * @brief Stop every axis
   */
  void emergencyStop();

  bool ready() const;

  // =========================================================================
  // Member variables
  // =========================================================================

  std::shared_ptr<Transport> transport_;
  std::unique_ptr<MotorController> broadcast_;
  std::vector<Axis> axes_;
  int consecutive_errors_{0};

  // Parameters
  BusConfig bus_config_;
  double status_rate_hz_{10.0};
  int max_consecutive_errors_{5};
  double default_speed_rpm_{300.0};
  double default_acceleration_{100.0};
  double homing_timeout_s_{30.0};
  bool enable_on_startup_{false};
  std::vector<std::string> joint_names_;
  std::vector<AxisLimits> joint_limits_;
  std::vector<uint8_t> joint_ids_;

  // ROS2 publishers
  rclcpp::Publisher<sensor_msgs::msg::JointState>::SharedPtr joint_state_pub_;
  rclcpp::Publisher<msg::BusStatus>::SharedPtr bus_status_pub_;

  // ROS2 subscribers
  rclcpp::Subscription<sensor_msgs::msg::JointState>::SharedPtr joint_command_sub_;

  // ROS2 services
  rclcpp::Service<std_srvs::srv::SetBool>::SharedPtr enable_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr stop_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr release_stall_srv_;
  rclcpp::Service<std_srvs::srv::Trigger>::SharedPtr set_zero_srv_;
  rclcpp::Service<srv::Home>::SharedPtr home_srv_;
  rclcpp::Service<srv::MoveAxes>::SharedPtr move_axes_srv_;

  // Timers
  rclcpp::TimerBase::SharedPtr status_timer_;
};

}  // namespace zdt_can_driver

#endif  // ZDT_CAN_DRIVER__ZDT_CAN_DRIVER_NODE_HPP_
