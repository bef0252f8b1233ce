#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "common/i18n/strings.hpp"
#include "core/library/playlist_library.hpp"
#include "ui/shell.hpp"

using tunebox::PlaylistLibrary;
using tunebox::Shell;
using tunebox::ShellOptions;
using tunebox::Strings;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::size_t count(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++n;
    }
    return n;
}

} // namespace

class ShellTest : public ::testing::Test {
protected:
    // Feeds `script` to a fresh shell and returns everything it printed.
    std::string run(const std::string& script, const Strings& strings = tunebox::english()) {
        std::istringstream in(script);
        std::ostringstream out;
        Shell shell(library, strings, in, out, options);
        exit_code = shell.run();
        return out.str();
    }

    void seed() {
        ASSERT_TRUE(library.create_playlist("Road Trip"));
        ASSERT_TRUE(library.add_song("Road Trip", "Sunny Day"));
        ASSERT_TRUE(library.create_playlist("Empty List"));
    }

    PlaylistLibrary library;
    ShellOptions options{false, false};
    int exit_code = -1;
};

TEST_F(ShellTest, ExitChoiceSaysGoodbye) {
    std::string output = run("0\n");
    EXPECT_EQ(exit_code, 0);
    EXPECT_TRUE(contains(output, "Goodbye!"));
    EXPECT_TRUE(contains(output, "Create playlist"));
}

TEST_F(ShellTest, CreatePlaylist) {
    std::string output = run("1\n  Road Trip  \n0\n");
    EXPECT_TRUE(contains(output, "✅  Playlist 'Road Trip' created!"));
    EXPECT_TRUE(library.contains("Road Trip"));
}

TEST_F(ShellTest, CreateDuplicateShowsError) {
    seed();
    std::string output = run("1\nRoad Trip\n0\n");
    EXPECT_TRUE(contains(output, "❌  Playlist 'Road Trip' already exists."));
    EXPECT_EQ(library.size(), 2u);
}

TEST_F(ShellTest, EmptyNameIsRejectedBeforeTheLibrary) {
    std::string output = run("1\n   \n0\n");
    EXPECT_TRUE(contains(output, "Name must not be empty."));
    EXPECT_TRUE(library.empty());
}

TEST_F(ShellTest, AddSong) {
    seed();
    std::string output = run("2\nRoad Trip\nHighway\n0\n");
    EXPECT_TRUE(contains(output, "✅  'Highway' added to 'Road Trip'!"));
    // The listing is shown before the first field prompt.
    auto listing = output.find("📁  Road Trip");
    ASSERT_NE(listing, std::string::npos);
    EXPECT_LT(listing, output.find("Playlist:"));
    ASSERT_NE(library.songs("Road Trip"), nullptr);
    EXPECT_EQ(library.songs("Road Trip")->back(), "Highway");
}

TEST_F(ShellTest, AddSongWithEmptyFieldWarns) {
    seed();
    std::string output = run("2\nRoad Trip\n\n0\n");
    EXPECT_TRUE(contains(output, "No field may be empty."));
    EXPECT_EQ(library.songs("Road Trip")->size(), 1u);
}

TEST_F(ShellTest, AddSongToMissingPlaylist) {
    std::string output = run("2\nNowhere\nHighway\n0\n");
    EXPECT_TRUE(contains(output, "❌  Playlist 'Nowhere' was not found."));
}

TEST_F(ShellTest, PlayOnline) {
    seed();
    std::string output = run("3\nRoad Trip\nSunny Day\nY\n0\n");
    EXPECT_TRUE(contains(output, "♪  Now playing: 'Sunny Day'  ♪"));
    EXPECT_FALSE(contains(output, "Try again?"));
    auto listing = output.find("📁  Road Trip\n       1. Sunny Day");
    ASSERT_NE(listing, std::string::npos);
    EXPECT_LT(listing, output.find("Playlist:"));
}

TEST_F(ShellTest, OfflineRetryAffirmed) {
    seed();
    std::string output = run("3\nRoad Trip\nSunny Day\nn\ny\n0\n");
    EXPECT_TRUE(contains(output, "❌  No internet connection, try again."));
    EXPECT_TRUE(contains(output, "Try again? (y/n):"));
    EXPECT_TRUE(contains(output, "♪  Now playing: 'Sunny Day'  ♪"));
}

TEST_F(ShellTest, OfflineRetryDeclined) {
    seed();
    std::string output = run("3\nRoad Trip\nSunny Day\n\nno\n0\n");
    EXPECT_TRUE(contains(output, "No internet connection"));
    EXPECT_FALSE(contains(output, "Now playing"));
    EXPECT_TRUE(contains(output, "Goodbye!"));
}

TEST_F(ShellTest, OnlyTheYesTokenCountsAsOnline) {
    seed();
    std::string output = run("3\nRoad Trip\nSunny Day\nyes\nn\n0\n");
    EXPECT_TRUE(contains(output, "No internet connection"));
    EXPECT_FALSE(contains(output, "Now playing"));
}

TEST_F(ShellTest, RetryIsOfferedOnce) {
    seed();
    std::string output = run("3\nRoad Trip\nSunny Day\nn\nn\n0\n");
    EXPECT_EQ(count(output, "Try again?"), 1u);
}

TEST_F(ShellTest, NonOfflineErrorsAreNotRetried) {
    seed();
    // The "0" after the play fields must reach the menu, not a retry prompt.
    std::string output = run("3\nRoad Trip\nMissing Song\nn\n0\n");
    EXPECT_TRUE(contains(output, "❌  Song 'Missing Song' does not exist."));
    EXPECT_FALSE(contains(output, "Try again?"));
    EXPECT_TRUE(contains(output, "Goodbye!"));
}

TEST_F(ShellTest, PlayFromEmptyPlaylist) {
    seed();
    std::string output = run("3\nEmpty List\nSunny Day\ny\n0\n");
    EXPECT_TRUE(contains(output, "❌  Playlist 'Empty List' is empty."));
}

TEST_F(ShellTest, PlayWithEmptyFieldWarns) {
    seed();
    std::string output = run("3\n\nSunny Day\ny\n0\n");
    EXPECT_TRUE(contains(output, "No field may be empty."));
    EXPECT_FALSE(contains(output, "Now playing"));
    EXPECT_FALSE(contains(output, "❌"));
}

TEST_F(ShellTest, ListShowsNumberedSongs) {
    seed();
    ASSERT_TRUE(library.add_song("Road Trip", "Highway"));
    std::string output = run("4\n0\n");
    EXPECT_TRUE(contains(output, "📁  Road Trip\n       1. Sunny Day\n       2. Highway\n"));
    EXPECT_TRUE(contains(output, "📁  Empty List\n       (no songs)\n"));
}

TEST_F(ShellTest, ListEmptyCollection) {
    std::string output = run("4\n0\n");
    EXPECT_TRUE(contains(output, "(no playlists yet)"));
    EXPECT_FALSE(contains(output, "📁"));
}

TEST_F(ShellTest, InvalidChoiceWarns) {
    std::string output = run("9\n\n0\n");
    EXPECT_EQ(count(output, "Invalid choice."), 2u);
    EXPECT_TRUE(contains(output, "Goodbye!"));
}

TEST_F(ShellTest, EndOfInputExits) {
    std::string output = run("");
    EXPECT_EQ(exit_code, 0);
    EXPECT_TRUE(contains(output, "Goodbye!"));
}

TEST_F(ShellTest, EndOfInputInsideAHandlerExits) {
    std::string output = run("1\n");
    EXPECT_EQ(exit_code, 0);
    EXPECT_TRUE(contains(output, "Name must not be empty."));
    EXPECT_EQ(count(output, "Goodbye!"), 1u);
    EXPECT_TRUE(library.empty());
}

TEST_F(ShellTest, PausesAfterEachAction) {
    options.pause = true;
    std::string output = run("4\n\n0\n");
    EXPECT_EQ(count(output, "Press Enter to continue..."), 1u);
    EXPECT_TRUE(contains(output, "Goodbye!"));
}

TEST_F(ShellTest, ClearsScreenWhenEnabled) {
    options.clear_screen = true;
    std::string output = run("0\n");
    EXPECT_TRUE(contains(output, "\x1B[2J\x1B[H"));
}

TEST_F(ShellTest, NoClearSequenceWhenDisabled) {
    std::string output = run("4\n0\n");
    EXPECT_FALSE(contains(output, "\x1B[2J"));
}

TEST_F(ShellTest, DanishSession) {
    PlaylistLibrary danish_library(tunebox::danish().now_playing);
    std::istringstream in("1\nFest\n2\nFest\nSommer\n3\nFest\nSommer\nn\nJ\n0\n");
    std::ostringstream out;
    Shell shell(danish_library, tunebox::danish(), in, out, options);
    EXPECT_EQ(shell.run(), 0);

    std::string output = out.str();
    EXPECT_TRUE(contains(output, "Playlist 'Fest' oprettet!"));
    EXPECT_TRUE(contains(output, "'Sommer' tilføjet til 'Fest'!"));
    EXPECT_TRUE(contains(output, "Ingen internetforbindelse"));
    EXPECT_TRUE(contains(output, "♪  Afspiller nu: 'Sommer'  ♪"));
    EXPECT_TRUE(contains(output, "Farvel!"));
}

TEST(ShellTrim, StripsSurroundingWhitespace) {
    EXPECT_EQ(Shell::trim("  Road Trip \t\r"), "Road Trip");
    EXPECT_EQ(Shell::trim("Sunny  Day"), "Sunny  Day");
    EXPECT_EQ(Shell::trim(" \t "), "");
    EXPECT_EQ(Shell::trim(""), "");
}
