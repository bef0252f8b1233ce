#pragma once

#include <map>
#include <string>
#include <vector>
#include "../../common/result.hpp"

namespace tunebox {

using SongList = std::vector<std::string>;
using Playlists = std::map<std::string, SongList>;

// In-memory playlist collection. Playlists and songs are only ever added;
// a failed operation leaves the collection untouched.
class PlaylistLibrary {
public:
    // `now_playing_format` is an fmt pattern with one "{}" for the song name.
    explicit PlaylistLibrary(std::string now_playing_format = "Now playing: '{}'");

    Result<void> create_playlist(const std::string& name);
    Result<void> add_song(const std::string& playlist, const std::string& song);

    // Checks, in order: playlist exists, playlist not empty, song present,
    // online. Never mutates the collection.
    Result<std::string> play_song(const std::string& playlist, const std::string& song,
                                  bool online) const;

    bool contains(const std::string& name) const;
    const SongList* songs(const std::string& name) const;
    const Playlists& playlists() const { return collection; }
    std::size_t size() const { return collection.size(); }
    bool empty() const { return collection.empty(); }

private:
    Playlists collection;
    std::string now_playing_format;
};

} // namespace tunebox
