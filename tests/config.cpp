#include "raptorboost/config.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static int run(const fs::path &tmp) {
  fs::create_directories(tmp);

  // Missing file: defaults
  {
    const auto cfg = raptorboost::load_server_config(tmp);
    if (cfg.base_dir != tmp || cfg.host != "::1" || cfg.port != 7272 ||
        cfg.max_fragment_bytes != 64ull * 1024 * 1024) {
      std::cerr << "unexpected defaults\n";
      return 1;
    }
  }

  // Save then load
  {
    raptorboost::ServerConfig cfg;
    cfg.base_dir = tmp;
    cfg.host = "0.0.0.0";
    cfg.port = 9000;
    cfg.max_fragment_bytes = 4096;
    raptorboost::save_server_config(cfg);
    const auto back = raptorboost::load_server_config(tmp);
    if (back.host != "0.0.0.0" || back.port != 9000 || back.max_fragment_bytes != 4096) {
      std::cerr << "saved settings not read back\n";
      return 1;
    }
  }

  // Comments, padding and unknown keys
  {
    std::ofstream(raptorboost::config_path(tmp), std::ios::trunc)
        << "# local overrides\n"
        << "port:   7000  \r\n"
        << "colour: blue\n"
        << "\n";
    const auto cfg = raptorboost::load_server_config(tmp);
    if (cfg.port != 7000 || cfg.host != "::1") {
      std::cerr << "hand-edited config not parsed\n";
      return 1;
    }
  }

  // Port values from the command line
  if (raptorboost::parse_port("0") != 0 || raptorboost::parse_port(" 8080") != 8080) {
    std::cerr << "valid ports rejected\n";
    return 1;
  }
  for (const char *bad : {"65536", "-1", "80x", ""}) {
    bool threw = false;
    try {
      (void)raptorboost::parse_port(bad);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "bad port accepted: '" << bad << "'\n";
      return 1;
    }
  }

  // Bad values are reported
  for (const char *bad : {"port: 70000\n", "port: seven\n", "max_fragment_bytes: -1\n"}) {
    std::ofstream(raptorboost::config_path(tmp), std::ios::trunc) << bad;
    bool threw = false;
    try {
      (void)raptorboost::load_server_config(tmp);
    } catch (const std::runtime_error &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "bad config accepted: " << bad;
      return 1;
    }
  }
  return 0;
}

int main() {
  const fs::path tmp =
      fs::temp_directory_path() / ("raptorboost_config_test_" + std::to_string(std::random_device{}()));
  int rc = 0;
  try {
    rc = run(tmp);
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    rc = 1;
  }
  std::error_code ec;
  fs::remove_all(tmp, ec);
  if (rc == 0) {
    std::cout << "config test OK\n";
  }
  return rc;
}
