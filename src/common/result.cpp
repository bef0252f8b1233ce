#include "result.hpp"

namespace tunebox {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::PlaylistAlreadyExists: return "PlaylistAlreadyExists";
    case ErrorKind::PlaylistNotFound: return "PlaylistNotFound";
    case ErrorKind::SongAlreadyInPlaylist: return "SongAlreadyInPlaylist";
    case ErrorKind::SongNotFound: return "SongNotFound";
    case ErrorKind::EmptyPlaylist: return "EmptyPlaylist";
    case ErrorKind::Offline: return "Offline";
    case ErrorKind::InvalidUser: return "InvalidUser";
    }
    return "Unknown";
}

} // namespace tunebox
