#include "view.hpp"

#include <vector>
#include <fmt/format.h>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <ftxui/screen/screen.hpp>

namespace tunebox::view {

namespace {

constexpr int kBoxWidth = 40;

std::string render(ftxui::Element document) {
  auto screen = ftxui::Screen::Create(ftxui::Dimension::Fixed(kBoxWidth),
                                      ftxui::Dimension::Fit(document));
  ftxui::Render(screen, document);
  return screen.ToString() + "\n";
}

} // namespace

std::string banner(const Strings &strings) {
  using namespace ftxui;
  auto document = vbox({
                      text(strings.title) | bold | color(Color::Blue) | center,
                  }) |
                  borderDouble;
  return render(document) + "\n";
}

std::string menu(const Strings &strings) {
  using namespace ftxui;
  auto entry = [](const char *key, const std::string &label) {
    return hbox({
        text(fmt::format("  [{}]  ", key)) | bold,
        text(label),
    });
  };
  auto document = vbox({
                      entry("1", strings.menu_create),
                      entry("2", strings.menu_add_song),
                      entry("3", strings.menu_play),
                      entry("4", strings.menu_list),
                      entry("0", strings.menu_exit),
                  }) |
                  border;
  return render(document);
}

std::string playlists(const PlaylistLibrary &library, const Strings &strings) {
  std::string out = "\n";
  if (library.empty()) {
    out += fmt::format("  {}\n", strings.no_playlists);
    return out;
  }

  for (const auto &[name, songs] : library.playlists()) {
    out += fmt::format("  📁  {}\n", name);
    if (songs.empty()) {
      out += fmt::format("       {}\n", strings.no_songs);
      continue;
    }
    for (std::size_t i = 0; i < songs.size(); ++i) {
      out += fmt::format("       {}. {}\n", i + 1, songs[i]);
    }
  }
  return out;
}

std::string success(const std::string &message) {
  return fmt::format("\n  ✅  {}\n", message);
}

std::string failure(const std::string &message) {
  return fmt::format("\n  ❌  {}\n", message);
}

std::string warning(const std::string &message) {
  return fmt::format("\n  ⚠️   {}\n", message);
}

} // namespace tunebox::view
