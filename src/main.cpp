#include "bayer_snapshot/SnapshotNode.hpp"
#include <rclcpp/rclcpp.hpp>

int main(int argc, char* argv[]) {
  rclcpp::init(argc, argv);
  auto node = std::make_shared<bayer_snapshot::SnapshotNode>();

  int rc = node->take_snapshot() ? 0 : 1;

  node->shutdown();
  rclcpp::shutdown();
  return rc;
}
