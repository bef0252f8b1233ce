#pragma once

#include <string>
#include "../common/i18n/strings.hpp"
#include "../core/library/playlist_library.hpp"

namespace tunebox {

// Pure text rendering of the shell's screens. Nothing here touches a stream.
namespace view {

inline constexpr const char* kClearScreen = "\x1B[2J\x1B[H";

std::string banner(const Strings& strings);
std::string menu(const Strings& strings);

// Playlist name lines followed by indented, 1-based song lines.
std::string playlists(const PlaylistLibrary& library, const Strings& strings);

std::string success(const std::string& message);
std::string failure(const std::string& message);
std::string warning(const std::string& message);

} // namespace view
} // namespace tunebox
