#include <cstdlib>
#include <iostream>
#include <string>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "common/i18n/strings.hpp"
#include "common/log.hpp"
#include "core/config/command_line.hpp"
#include "core/config/config.hpp"
#include "core/library/playlist_library.hpp"
#include "ui/shell.hpp"

#ifndef TUNEBOX_VERSION
#define TUNEBOX_VERSION "0.0.0"
#endif

int main(int argc, char *argv[]) {
  using namespace tunebox;

  // stderr from the start so config warnings never reach the screen
  init_logging(spdlog::level::warn);

  CommandLine cmd = parse_command_line(argc, argv);
  if (!cmd.error.empty()) {
    std::cerr << cmd.error << "\n\n" << usage(argv[0]);
    return 2;
  }
  if (cmd.help) {
    std::cout << usage(argv[0]);
    return EXIT_SUCCESS;
  }
  if (cmd.version) {
    fmt::print("tunebox {}\n", TUNEBOX_VERSION);
    return EXIT_SUCCESS;
  }

  Config config(cmd.config_path);
  apply(cmd, config);
  init_logging(config.get_log_level());
  spdlog::debug("config: {}", config.to_json());

  const Strings &strings = strings_for(config.get_language());
  PlaylistLibrary library(strings.now_playing);

  ShellOptions options;
  options.clear_screen = config.get_clear_screen();
  options.pause = config.get_pause();

  Shell shell(library, strings, std::cin, std::cout, options);
  return shell.run();
}
