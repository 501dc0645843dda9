#include "raptorboost/config.hpp"
#include "raptorboost/naming.hpp"
#include "raptorboost/object_store.hpp"
#include "raptorboost/server.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int cmd_serve(int argc, char **argv) {
  std::filesystem::path base = std::filesystem::current_path();
  std::optional<std::string> host;
  std::optional<std::string> port;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "serve: missing value for " << arg << "\n";
      return 2;
    }
    if (arg == "--base") {
      base = argv[++i];
    } else if (arg == "--host") {
      host = argv[++i];
    } else if (arg == "--port") {
      port = argv[++i];
    } else {
      std::cerr << "usage: raptorboost serve [--base dir] [--host h] [--port p]\n";
      return 2;
    }
  }

  try {
    auto cfg = raptorboost::load_server_config(base);
    if (host)
      cfg.host = *host;
    if (port)
      cfg.port = raptorboost::parse_port(*port);

    raptorboost::ContentStore store{cfg.base_dir};
    const raptorboost::TransferNamer namer{store};
    raptorboost::Server server{cfg, store, namer};
    server.listen();
    server.run();
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "serve: " << e.what() << "\n";
    return 1;
  }
}
