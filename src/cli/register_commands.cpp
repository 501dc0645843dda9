#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_serve(int, char **);
int cmd_version(int, char **);
int cmd_send(int, char **);

namespace raptorboost::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Create a server base directory: raptorboost init [dir]");
  register_command("serve", ::cmd_serve,
                   "Run the server: raptorboost serve [--base dir] [--host h] [--port p]");
  register_command("version", ::cmd_version, "Ask a server for its version: raptorboost version <host[:port]>");
  register_command("send", ::cmd_send,
                   "Upload files: raptorboost send <host[:port]> [--name transfer] [--force] [--restart] <file>...");
}

} // namespace raptorboost::cli
