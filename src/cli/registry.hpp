#pragma once
#include <string>
#include "cli/command.hpp"

namespace raptorboost::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage();

// implemented in register_commands.cpp
void register_all_commands();

struct Endpoint {
  std::string host;
  int port;
};

// "host", "host:port" or "[v6addr]:port"; the port defaults to consts::portNumber.
Endpoint parse_endpoint(const std::string& text);

} // namespace raptorboost::cli
