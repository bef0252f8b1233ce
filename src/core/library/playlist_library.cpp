#include "playlist_library.hpp"

#include <algorithm>
#include <utility>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tunebox {

PlaylistLibrary::PlaylistLibrary(std::string format)
    : now_playing_format(std::move(format)) {}

Result<void> PlaylistLibrary::create_playlist(const std::string& name) {
    if (collection.count(name) != 0) {
        spdlog::debug("create '{}': already exists", name);
        return Result<void>::err(MusicError(ErrorKind::PlaylistAlreadyExists, name));
    }
    collection.emplace(name, SongList{});
    spdlog::debug("create '{}': ok ({} playlists)", name, collection.size());
    return Result<void>::ok();
}

Result<void> PlaylistLibrary::add_song(const std::string& playlist, const std::string& song) {
    auto it = collection.find(playlist);
    if (it == collection.end()) {
        spdlog::debug("add '{}' to '{}': playlist not found", song, playlist);
        return Result<void>::err(MusicError(ErrorKind::PlaylistNotFound, playlist));
    }

    SongList& songs = it->second;
    if (std::find(songs.begin(), songs.end(), song) != songs.end()) {
        spdlog::debug("add '{}' to '{}': duplicate", song, playlist);
        return Result<void>::err(MusicError(ErrorKind::SongAlreadyInPlaylist, song));
    }
    songs.push_back(song);
    spdlog::debug("add '{}' to '{}': ok (#{})", song, playlist, songs.size());
    return Result<void>::ok();
}

Result<std::string> PlaylistLibrary::play_song(const std::string& playlist,
                                               const std::string& song, bool online) const {
    auto it = collection.find(playlist);
    if (it == collection.end()) {
        spdlog::debug("play '{}' from '{}': playlist not found", song, playlist);
        return Result<std::string>::err(MusicError(ErrorKind::PlaylistNotFound, playlist));
    }

    const SongList& songs = it->second;
    if (songs.empty()) {
        spdlog::debug("play '{}' from '{}': playlist empty", song, playlist);
        return Result<std::string>::err(MusicError(ErrorKind::EmptyPlaylist, playlist));
    }
    if (std::find(songs.begin(), songs.end(), song) == songs.end()) {
        spdlog::debug("play '{}' from '{}': song not found", song, playlist);
        return Result<std::string>::err(MusicError(ErrorKind::SongNotFound, song));
    }
    if (!online) {
        spdlog::debug("play '{}' from '{}': offline", song, playlist);
        return Result<std::string>::err(MusicError(ErrorKind::Offline));
    }

    spdlog::debug("play '{}' from '{}': ok", song, playlist);
    return Result<std::string>::ok(fmt::vformat(now_playing_format, fmt::make_format_args(song)));
}

bool PlaylistLibrary::contains(const std::string& name) const {
    return collection.count(name) != 0;
}

const SongList* PlaylistLibrary::songs(const std::string& name) const {
    auto it = collection.find(name);
    if (it == collection.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace tunebox
