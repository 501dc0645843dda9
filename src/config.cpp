#include "raptorboost/config.hpp"

#include "raptorboost/fs.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

template <typename T> T parse_number(std::string_view key, const std::string &value) {
  T out{};
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    throw std::runtime_error("bad number for " + std::string(key) + ": '" + value + "'");
  }
  return out;
}

} // namespace

namespace raptorboost {

int parse_port(std::string_view text) {
  const int port = parse_number<int>("port", trim(text));
  if (port < 0 || port > 65535) {
    throw std::runtime_error("port out of range: " + std::to_string(port));
  }
  return port;
}

std::filesystem::path config_path(const std::filesystem::path &base_dir) {
  return base_dir / consts::kConfigFile;
}

auto load_server_config(const std::filesystem::path &base_dir) -> ServerConfig {
  ServerConfig out{};
  out.base_dir = base_dir;
  const auto path = config_path(base_dir);
  if (!fs::exists(path))
    return out;

  const auto bytes = fs::read_file(path);
  const std::string text(bytes.begin(), bytes.end());
  std::istringstream iss(text);

  constexpr std::string_view k_host = "host:";
  constexpr std::string_view k_port = "port:";
  constexpr std::string_view k_max_fragment = "max_fragment_bytes:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_host)) {
      out.host = trim(sv.substr(k_host.size()));
    } else if (sv.starts_with(k_port)) {
      out.port = parse_port(sv.substr(k_port.size()));
    } else if (sv.starts_with(k_max_fragment)) {
      out.max_fragment_bytes =
          parse_number<std::uint64_t>("max_fragment_bytes", trim(sv.substr(k_max_fragment.size())));
    }
  }
  return out;
}

void save_server_config(const ServerConfig &cfg) {
  std::ostringstream os;
  os << "# raptorboost server settings\n"
     << "host: " << cfg.host << '\n'
     << "port: " << cfg.port << '\n'
     << "max_fragment_bytes: " << cfg.max_fragment_bytes << '\n';

  const auto path = config_path(cfg.base_dir);
  const std::string s = os.str();
  const auto *data = reinterpret_cast<const std::uint8_t *>(s.data());
  fs::write_file_atomic(path, std::span(data, s.size()));
}

} // namespace raptorboost
