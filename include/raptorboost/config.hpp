#pragma once
#include "raptorboost/consts.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace raptorboost {

struct ServerConfig {
  std::filesystem::path base_dir{"."};
  std::string host{consts::kDefaultHost};
  int port{consts::portNumber};
  std::uint64_t max_fragment_bytes{consts::kDefaultMaxFragmentBytes};
};

// Decimal TCP port in 0..65535 (0 picks a free port); throws on anything else.
int parse_port(std::string_view text);

// <base>/raptorboost.conf
auto config_path(const std::filesystem::path& base_dir) -> std::filesystem::path;

// Read settings from <base>/raptorboost.conf over the defaults. base_dir is
// always the given directory. A missing file yields the defaults.
ServerConfig load_server_config(const std::filesystem::path& base_dir);

// Overwrite <base>/raptorboost.conf (base_dir itself is not stored).
void save_server_config(const ServerConfig& cfg);

} // namespace raptorboost
