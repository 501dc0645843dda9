#include "cli/registry.hpp"

#include "raptorboost/consts.hpp"

#include <iostream>
#include <map>
#include <stdexcept>

namespace raptorboost::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: raptorboost <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
}

Endpoint parse_endpoint(const std::string &text) {
  std::string host = text;
  std::string port_s;
  if (!text.empty() && text.front() == '[') {
    const auto close = text.find(']');
    if (close == std::string::npos) {
      throw std::runtime_error("bad address: " + text);
    }
    host = text.substr(1, close - 1);
    if (close + 1 < text.size()) {
      if (text[close + 1] != ':') {
        throw std::runtime_error("bad address: " + text);
      }
      port_s = text.substr(close + 2);
    }
  } else if (const auto colon = text.find(':');
             colon != std::string::npos && text.find(':', colon + 1) == std::string::npos) {
    host = text.substr(0, colon);
    port_s = text.substr(colon + 1);
  }
  const int port = port_s.empty() ? consts::portNumber : std::stoi(port_s);
  return Endpoint{.host = host, .port = port};
}

} // namespace raptorboost::cli
