#include "raptorboost/config.hpp"
#include "raptorboost/fs.hpp"
#include "raptorboost/naming.hpp"
#include "raptorboost/object_store.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int argc, char **argv) {
  try {
    const std::filesystem::path base = argc >= 2 ? std::filesystem::path{argv[1]}
                                                 : std::filesystem::current_path();
    if (raptorboost::fs::exists(raptorboost::config_path(base))) {
      std::cerr << "init: already initialized: " << raptorboost::config_path(base) << "\n";
      return 1;
    }
    const raptorboost::ContentStore store{base};
    const raptorboost::TransferNamer namer{store};

    raptorboost::ServerConfig cfg{};
    cfg.base_dir = base;
    raptorboost::save_server_config(cfg);
    std::cout << "Initialized raptorboost store in " << store.base_dir() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
