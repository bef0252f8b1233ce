#pragma once

#include <iosfwd>
#include <string>
#include "../common/i18n/strings.hpp"
#include "../core/library/playlist_library.hpp"

namespace tunebox {

struct ShellOptions {
    bool clear_screen = true;
    bool pause = true;
};

// Line-oriented menu loop over a PlaylistLibrary. Owns no state of its own
// besides the streams it was given.
class Shell {
public:
    Shell(PlaylistLibrary& library, const Strings& strings, std::istream& in,
          std::ostream& out, ShellOptions options = {});

    // Runs until the exit choice or end of input. Returns the process exit code.
    int run();

    // Handles one top-level menu choice. Returns false when the loop should stop.
    bool execute(const std::string& choice);

    static std::string trim(const std::string& str);

private:
    void handle_create();
    void handle_add_song();
    void handle_play();
    void handle_list();
    void handle_exit();

    Result<std::string> render_play(const std::string& playlist, const std::string& song,
                                    bool online);

    void show_screen(const std::string& heading);
    void clear();
    void pause();
    std::string prompt(const std::string& label);

    PlaylistLibrary& library;
    const Strings& strings;
    std::istream& in;
    std::ostream& out;
    ShellOptions options;
    bool input_closed = false;
};

} // namespace tunebox
