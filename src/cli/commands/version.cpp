#include "cli/registry.hpp"
#include "raptorboost/client.hpp"

#include <iostream>

int cmd_version(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: raptorboost version <host[:port]>\n";
    return 2;
  }
  try {
    const auto ep = raptorboost::cli::parse_endpoint(argv[1]);
    auto client = raptorboost::Client::connect(ep.host, ep.port);
    std::cout << client.get_version() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "version: " << e.what() << "\n";
    return 1;
  }
}
