#pragma once

#include <optional>
#include <string>
#include "config.hpp"

namespace tunebox {

struct CommandLine {
  std::string config_path;
  std::optional<std::string> language;
  bool no_clear = false;
  bool no_pause = false;
  bool verbose = false;
  bool help = false;
  bool version = false;
  std::string error; // non-empty when parsing failed
};

CommandLine parse_command_line(int argc, char *argv[]);

// Flags win over whatever the config file said.
void apply(const CommandLine &cmd, Config &config);

std::string usage(const char *program);

} // namespace tunebox
