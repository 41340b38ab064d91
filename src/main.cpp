#include <memory>

#include "rclcpp/rclcpp.hpp"
#include "zdt_can_driver/zdt_can_driver_node.hpp"

int main(int argc, char * argv[])
{
  rclcpp::init(argc, argv);

  auto node = std::make_shared<zdt_can_driver::ZdtCanDriverNode>();

  rclcpp::spin(node);
  rclcpp::shutdown();

  return 0;
}
