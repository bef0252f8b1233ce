#include "command_line.hpp"

#include <getopt.h>
#include <fmt/format.h>

namespace tunebox {

CommandLine parse_command_line(int argc, char *argv[]) {
  CommandLine cmd;

  static struct option long_options[] = {
    {"config",   required_argument, nullptr, 'c'},
    {"lang",     required_argument, nullptr, 'l'},
    {"no-clear", no_argument,       nullptr, 'n'},
    {"no-pause", no_argument,       nullptr, 'p'},
    {"verbose",  no_argument,       nullptr, 'v'},
    {"help",     no_argument,       nullptr, 'h'},
    {"version",  no_argument,       nullptr, 'V'},
    {nullptr,    0,                 nullptr,  0 }
  };

  // Reset getopt so the parser can run more than once per process.
  optind = 0;
  opterr = 0;
  int opt;
  int option_index = 0;
  while ((opt = getopt_long(argc, argv, ":c:l:vh", long_options, &option_index)) != -1) {
    switch (opt) {
      case 'c':
        cmd.config_path = optarg;
        break;
      case 'l':
        if (!is_supported_language(optarg)) {
          cmd.error = fmt::format("Unsupported language '{}' (expected en or da)", optarg);
          return cmd;
        }
        cmd.language = optarg;
        break;
      case 'n':
        cmd.no_clear = true;
        break;
      case 'p':
        cmd.no_pause = true;
        break;
      case 'v':
        cmd.verbose = true;
        break;
      case 'h':
        cmd.help = true;
        break;
      case 'V':
        cmd.version = true;
        break;
      case ':':
        cmd.error = fmt::format("Option '{}' requires an argument", argv[optind - 1]);
        return cmd;
      default:
        cmd.error = optopt != 0 ? fmt::format("Invalid option '-{}'", static_cast<char>(optopt))
                                : fmt::format("Invalid option '{}'", argv[optind - 1]);
        return cmd;
    }
  }

  if (optind < argc) {
    cmd.error = fmt::format("Unexpected argument '{}'", argv[optind]);
  }
  return cmd;
}

void apply(const CommandLine &cmd, Config &config) {
  if (cmd.language) {
    config.set_language(*cmd.language);
  }
  if (cmd.no_clear) {
    config.set_clear_screen(false);
  }
  if (cmd.no_pause) {
    config.set_pause(false);
  }
  if (cmd.verbose) {
    config.set_log_level(spdlog::level::debug);
  }
}

std::string usage(const char *program) {
  return fmt::format(
      "Usage: {} [options]\n"
      "\n"
      "  -c, --config <file>  read settings from a JSON file\n"
      "  -l, --lang <en|da>   interface language\n"
      "      --no-clear       do not clear the screen between views\n"
      "      --no-pause       do not wait for Enter after each action\n"
      "  -v, --verbose        trace playlist operations on stderr\n"
      "  -h, --help           show this help\n"
      "      --version        print the version\n",
      program);
}

} // namespace tunebox
