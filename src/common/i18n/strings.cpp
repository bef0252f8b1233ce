#include "strings.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace tunebox {

namespace {

Strings make_english() {
    Strings s;
    s.language = "en";
    s.yes_token = "y";

    s.title = "🎵  Music Manager TUI  🎵";
    s.menu_create = "Create playlist";
    s.menu_add_song = "Add song to playlist";
    s.menu_play = "Play song";
    s.menu_list = "Show all playlists and songs";
    s.menu_exit = "Exit";
    s.menu_prompt = "Choose:";

    s.heading_create = "── Create playlist ──";
    s.heading_add_song = "── Add song ──";
    s.heading_play = "── Play song ──";
    s.heading_list = "── All playlists ──";

    s.prompt_playlist_name = "Playlist name:";
    s.prompt_playlist = "Playlist:";
    s.prompt_song = "Song name:";
    s.prompt_online = "Are you online? (y/n):";
    s.prompt_retry = "Try again? (y/n):";
    s.prompt_continue = "Press Enter to continue...";

    s.created = "Playlist '{}' created!";
    s.song_added = "'{}' added to '{}'!";
    s.now_playing = "Now playing: '{}'";

    s.warn_empty_name = "Name must not be empty.";
    s.warn_empty_fields = "No field may be empty.";
    s.warn_invalid_choice = "Invalid choice.";

    s.no_playlists = "(no playlists yet)";
    s.no_songs = "(no songs)";
    s.goodbye = "Goodbye! 👋";

    s.err_playlist_exists = "Playlist '{}' already exists.";
    s.err_playlist_not_found = "Playlist '{}' was not found.";
    s.err_song_exists = "Song '{}' is already in the playlist.";
    s.err_song_not_found = "Song '{}' does not exist.";
    s.err_empty_playlist = "Playlist '{}' is empty.";
    s.err_offline = "No internet connection, try again.";
    s.err_invalid_user = "Invalid username.";
    return s;
}

Strings make_danish() {
    Strings s;
    s.language = "da";
    s.yes_token = "j";

    s.title = "🎵  Musik Manager TUI  🎵";
    s.menu_create = "Opret afspilningsliste";
    s.menu_add_song = "Tilføj sang til liste";
    s.menu_play = "Afspil sang";
    s.menu_list = "Vis alle lister og sange";
    s.menu_exit = "Afslut";
    s.menu_prompt = "Vælg:";

    s.heading_create = "── Opret afspilningsliste ──";
    s.heading_add_song = "── Tilføj sang ──";
    s.heading_play = "── Afspil sang ──";
    s.heading_list = "── Alle afspilningslister ──";

    s.prompt_playlist_name = "Navn på liste:";
    s.prompt_playlist = "Navn på afspilningsliste:";
    s.prompt_song = "Sangnavn:";
    s.prompt_online = "Er du online? (j/n):";
    s.prompt_retry = "Prøv igen? (j/n):";
    s.prompt_continue = "Tryk Enter for at fortsætte...";

    s.created = "Playlist '{}' oprettet!";
    s.song_added = "'{}' tilføjet til '{}'!";
    s.now_playing = "Afspiller nu: '{}'";

    s.warn_empty_name = "Navn må ikke være tomt.";
    s.warn_empty_fields = "Ingen felter må være tomme.";
    s.warn_invalid_choice = "Ugyldigt valg.";

    s.no_playlists = "(ingen afspilningslister endnu)";
    s.no_songs = "(ingen sange)";
    s.goodbye = "Farvel! 👋";

    s.err_playlist_exists = "Playlist '{}' eksisterer allerede.";
    s.err_playlist_not_found = "Playlist '{}' blev ikke fundet.";
    s.err_song_exists = "Sangen '{}' er allerede på listen.";
    s.err_song_not_found = "Sangen '{}' findes ikke.";
    s.err_empty_playlist = "Playlist '{}' er tom.";
    s.err_offline = "Ingen internetforbindelse, prøv igen.";
    s.err_invalid_user = "Ugyldigt brugernavn.";
    return s;
}

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

const Strings& english() {
    static const Strings catalog = make_english();
    return catalog;
}

const Strings& danish() {
    static const Strings catalog = make_danish();
    return catalog;
}

bool is_supported_language(const std::string& language) {
    return language == "en" || language == "da";
}

const Strings& strings_for(const std::string& language) {
    if (language == "da") {
        return danish();
    }
    return english();
}

std::string describe(const MusicError& error, const Strings& strings) {
    const std::string* pattern = nullptr;
    switch (error.kind) {
    case ErrorKind::PlaylistAlreadyExists: pattern = &strings.err_playlist_exists; break;
    case ErrorKind::PlaylistNotFound: pattern = &strings.err_playlist_not_found; break;
    case ErrorKind::SongAlreadyInPlaylist: pattern = &strings.err_song_exists; break;
    case ErrorKind::SongNotFound: pattern = &strings.err_song_not_found; break;
    case ErrorKind::EmptyPlaylist: pattern = &strings.err_empty_playlist; break;
    case ErrorKind::Offline: return strings.err_offline;
    case ErrorKind::InvalidUser: return strings.err_invalid_user;
    }
    if (pattern == nullptr) {
        return to_string(error.kind);
    }
    return fmt::vformat(*pattern, fmt::make_format_args(error.subject));
}

bool is_affirmative(const std::string& answer, const Strings& strings) {
    return lowercase(answer) == strings.yes_token;
}

} // namespace tunebox
