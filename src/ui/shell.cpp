#include "shell.hpp"

#include <istream>
#include <ostream>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "view.hpp"

namespace tunebox {

Shell::Shell(PlaylistLibrary& library, const Strings& strings, std::istream& in,
             std::ostream& out, ShellOptions options)
    : library(library), strings(strings), in(in), out(out), options(options) {}

int Shell::run() {
    while (true) {
        clear();
        out << view::banner(strings) << view::menu(strings);
        out << "  " << strings.menu_prompt << " " << std::flush;

        std::string choice;
        if (!std::getline(in, choice)) {
            spdlog::info("input closed, leaving menu loop");
            input_closed = true;
            choice = "0";
        }
        if (!execute(trim(choice))) {
            break;
        }
    }
    return 0;
}

bool Shell::execute(const std::string& choice) {
    spdlog::debug("menu choice '{}'", choice);
    if (choice == "1") {
        handle_create();
    } else if (choice == "2") {
        handle_add_song();
    } else if (choice == "3") {
        handle_play();
    } else if (choice == "4") {
        handle_list();
    } else if (choice == "0") {
        handle_exit();
        return false;
    } else {
        out << view::warning(strings.warn_invalid_choice);
        pause();
    }
    if (input_closed) {
        handle_exit();
        return false;
    }
    return true;
}

void Shell::handle_create() {
    show_screen(strings.heading_create);
    out << "\n";

    std::string name = prompt(strings.prompt_playlist_name);
    if (name.empty()) {
        out << view::warning(strings.warn_empty_name);
    } else {
        auto result = library.create_playlist(name);
        if (result) {
            out << view::success(fmt::vformat(strings.created, fmt::make_format_args(name)));
        } else {
            out << view::failure(describe(result.error(), strings));
        }
    }
    pause();
}

void Shell::handle_add_song() {
    show_screen(strings.heading_add_song);
    out << view::playlists(library, strings) << "\n";

    std::string playlist = prompt(strings.prompt_playlist);
    std::string song = prompt(strings.prompt_song);

    if (playlist.empty() || song.empty()) {
        out << view::warning(strings.warn_empty_fields);
    } else {
        auto result = library.add_song(playlist, song);
        if (result) {
            out << view::success(
                fmt::vformat(strings.song_added, fmt::make_format_args(song, playlist)));
        } else {
            out << view::failure(describe(result.error(), strings));
        }
    }
    pause();
}

void Shell::handle_play() {
    show_screen(strings.heading_play);
    out << view::playlists(library, strings) << "\n";

    std::string playlist = prompt(strings.prompt_playlist);
    std::string song = prompt(strings.prompt_song);
    bool online = is_affirmative(prompt(strings.prompt_online), strings);

    if (playlist.empty() || song.empty()) {
        out << view::warning(strings.warn_empty_fields);
    } else {
        auto result = render_play(playlist, song, online);
        // One retry with connectivity asserted; any other error is final.
        if (!result && result.error().kind == ErrorKind::Offline &&
            is_affirmative(prompt(strings.prompt_retry), strings)) {
            spdlog::debug("retrying '{}' from '{}' online", song, playlist);
            render_play(playlist, song, true);
        }
    }
    pause();
}

Result<std::string> Shell::render_play(const std::string& playlist, const std::string& song,
                                       bool online) {
    auto result = library.play_song(playlist, song, online);
    if (result) {
        out << view::success(fmt::format("♪  {}  ♪", result.value()));
    } else {
        out << view::failure(describe(result.error(), strings));
    }
    return result;
}

void Shell::handle_list() {
    show_screen(strings.heading_list);
    out << view::playlists(library, strings);
    pause();
}

void Shell::handle_exit() {
    clear();
    out << "  " << strings.goodbye << std::endl;
}

void Shell::show_screen(const std::string& heading) {
    clear();
    out << view::banner(strings);
    out << "  " << heading << "\n";
}

void Shell::clear() {
    if (options.clear_screen) {
        out << view::kClearScreen;
    }
}

void Shell::pause() {
    if (!options.pause || input_closed) {
        return;
    }
    out << "\n";
    prompt(strings.prompt_continue);
}

std::string Shell::prompt(const std::string& label) {
    out << "  " << label << " " << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        input_closed = true;
        return "";
    }
    return trim(line);
}

std::string Shell::trim(const std::string& str) {
    const char* whitespace = " \t\r\n\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, (last - first + 1));
}

} // namespace tunebox
