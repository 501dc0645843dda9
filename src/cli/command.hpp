#pragma once

namespace raptorboost::cli {

// argv[0] is the command name; returns the process exit code.
using command_fn = int (*)(int argc, char **argv);

} // namespace raptorboost::cli
