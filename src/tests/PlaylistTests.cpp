// SPDX-License-Identifier: Apache-2.0
#include <subplay/Playlist.hpp>

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace subplay;

namespace
{

auto const formats = std::vector<std::string> { ".mp3", ".wav", ".flac" };

/// @brief Temporary directory with a few files, removed on destruction.
struct MusicDirectory
{
    std::filesystem::path root = std::filesystem::temp_directory_path() / "subplay_test_playlist";

    MusicDirectory()
    {
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root / "nested");
        for (auto const* name: { "b.mp3", "a.WAV", "c.flac", "notes.txt", "nested/d.mp3" })
            std::ofstream(root / name) << "x";
    }

    ~MusicDirectory() { std::filesystem::remove_all(root); }

    [[nodiscard]] auto path(std::string_view name) const -> std::string { return (root / name).string(); }
};

} // namespace

TEST_CASE("hasSupportedExtension ignores case", "[playlist]")
{
    CHECK(hasSupportedExtension("song.mp3", formats));
    CHECK(hasSupportedExtension("/music/Song.MP3", formats));
    CHECK(hasSupportedExtension("a.Flac", formats));
    CHECK(!hasSupportedExtension("cover.jpg", formats));
    CHECK(!hasSupportedExtension("mp3", formats));
}

TEST_CASE("Playlist scans directories in name order", "[playlist]")
{
    auto const music = MusicDirectory {};
    auto const playlist = Playlist::fromPaths({ music.root.string() }, formats);
    REQUIRE(playlist.has_value());
    CHECK(playlist->paths()
          == std::vector<std::string> { music.path("a.WAV"), music.path("b.mp3"), music.path("c.flac") });
}

TEST_CASE("Playlist keeps explicit files in argument order", "[playlist]")
{
    auto const music = MusicDirectory {};
    auto const playlist =
        Playlist::fromPaths({ music.path("c.flac"), music.path("notes.txt"), music.path("b.mp3") }, formats);
    REQUIRE(playlist.has_value());
    CHECK(playlist->paths() == std::vector<std::string> { music.path("c.flac"), music.path("b.mp3") });
}

TEST_CASE("Playlist rejects missing paths", "[playlist]")
{
    auto const playlist = Playlist::fromPaths({ "/nonexistent/subplay/song.mp3" }, formats);
    REQUIRE(!playlist.has_value());
    CHECK(playlist.error().code == ErrorCode::IoError);
}

TEST_CASE("Playlist navigation stops at both ends", "[playlist]")
{
    auto playlist = Playlist({ "one.mp3", "two.mp3", "three.mp3" });
    CHECK(playlist.size() == 3);
    CHECK(playlist.current() == "one.mp3");

    CHECK(!playlist.previous());
    CHECK(playlist.index() == 0);

    CHECK(playlist.next());
    CHECK(playlist.next());
    CHECK(playlist.current() == "three.mp3");
    CHECK(!playlist.next());
    CHECK(playlist.index() == 2);

    CHECK(playlist.previous());
    CHECK(playlist.current() == "two.mp3");
}

TEST_CASE("Empty playlist has no current track", "[playlist]")
{
    auto playlist = Playlist {};
    CHECK(playlist.empty());
    CHECK(!playlist.current().has_value());
    CHECK(!playlist.next());
    CHECK(!playlist.previous());
}
