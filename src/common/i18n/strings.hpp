#pragma once

#include <string>
#include "../result.hpp"

namespace tunebox {

// Every user-visible text of the shell. Entries containing "{}" are fmt
// format strings taking one argument (a playlist or song name).
struct Strings {
    std::string language;
    std::string yes_token;

    std::string title;
    std::string menu_create;
    std::string menu_add_song;
    std::string menu_play;
    std::string menu_list;
    std::string menu_exit;
    std::string menu_prompt;

    std::string heading_create;
    std::string heading_add_song;
    std::string heading_play;
    std::string heading_list;

    std::string prompt_playlist_name;
    std::string prompt_playlist;
    std::string prompt_song;
    std::string prompt_online;
    std::string prompt_retry;
    std::string prompt_continue;

    std::string created;      // {} = playlist
    std::string song_added;   // {0} = song, {1} = playlist
    std::string now_playing;  // {} = song

    std::string warn_empty_name;
    std::string warn_empty_fields;
    std::string warn_invalid_choice;

    std::string no_playlists;
    std::string no_songs;
    std::string goodbye;

    std::string err_playlist_exists;
    std::string err_playlist_not_found;
    std::string err_song_exists;
    std::string err_song_not_found;
    std::string err_empty_playlist;
    std::string err_offline;
    std::string err_invalid_user;
};

const Strings& english();
const Strings& danish();

// Catalog for a language code; unknown codes fall back to English.
const Strings& strings_for(const std::string& language);
bool is_supported_language(const std::string& language);

// One-line display text of an error in the given catalog.
std::string describe(const MusicError& error, const Strings& strings);

// Case-insensitive comparison of a trimmed answer against the yes token.
bool is_affirmative(const std::string& answer, const Strings& strings);

} // namespace tunebox
