#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace tunebox {

enum class ErrorKind {
    PlaylistAlreadyExists,
    PlaylistNotFound,
    SongAlreadyInPlaylist,
    SongNotFound,
    EmptyPlaylist,
    Offline,
    InvalidUser, // reserved, nothing produces it yet
};

struct MusicError {
    ErrorKind kind;
    std::string subject; // playlist or song name, empty for Offline/InvalidUser

    explicit MusicError(ErrorKind k, std::string s = "") : kind(k), subject(std::move(s)) {}

    bool operator==(const MusicError& other) const {
        return kind == other.kind && subject == other.subject;
    }
    bool operator!=(const MusicError& other) const { return !(*this == other); }
};

const char* to_string(ErrorKind kind);

// Either a value or a MusicError. Domain operations never throw.
template <typename T>
class Result {
public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(MusicError error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool is_ok() const { return state.index() == 0; }
    explicit operator bool() const { return is_ok(); }

    const T& value() const { return std::get<0>(state); }
    const MusicError& error() const { return std::get<1>(state); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& v) : state(tag, std::forward<U>(v)) {}

    std::variant<T, MusicError> state;
};

template <>
class Result<void> {
public:
    static Result ok() { return Result(std::nullopt); }
    static Result err(MusicError error) { return Result(std::move(error)); }

    bool is_ok() const { return !failure.has_value(); }
    explicit operator bool() const { return is_ok(); }

    const MusicError& error() const { return *failure; }

private:
    explicit Result(std::optional<MusicError> f) : failure(std::move(f)) {}

    std::optional<MusicError> failure;
};

} // namespace tunebox
