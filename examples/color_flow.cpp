// Example: run a colour flow given on the command line.
#include "yeelight/yeelight.h"

#include <iostream>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <address> [flow]" << std::endl;
    std::cerr << "  flow: duration,mode,value,brightness,... (default: red/blue pulse)"
              << std::endl;
    return 2;
  }

  yeelight::FlowExpression flow;
  if (argc > 2) {
    std::string parse_error;
    if (!yeelight::ParseFlowExpression(argv[2], &flow, &parse_error)) {
      std::cerr << "Invalid flow: " << parse_error << std::endl;
      return 2;
    }
  } else {
    using std::chrono::milliseconds;
    flow.tuples.push_back(yeelight::FlowTuple::Rgb(milliseconds(1000), 0xff0000, 100));
    flow.tuples.push_back(yeelight::FlowTuple::Sleep(milliseconds(500)));
    flow.tuples.push_back(yeelight::FlowTuple::Rgb(milliseconds(1000), 0x0000ff, 50));
  }

  yeelight::Config config;
  yeelight::Error error;
  auto session = yeelight::Session::Connect(argv[1], 0, config, &error);
  if (!session) {
    std::cerr << "Failed to connect: " << error.ToString() << std::endl;
    return 1;
  }

  std::cout << "start_cf " << flow.ToString() << std::endl;
  const auto result = session->StartCf(4, yeelight::CfAction::kRecover, flow);
  if (!result.ok()) {
    std::cerr << "start_cf failed: " << result.error.ToString() << std::endl;
    return 1;
  }
  return 0;
}
