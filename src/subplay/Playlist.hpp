// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace subplay
{

/// @brief Ordered list of audio files with a current position.
class Playlist
{
  public:
    Playlist() = default;
    explicit Playlist(std::vector<std::string> paths);

    /// @brief Builds a playlist from files and directories.
    ///
    /// Directories are scanned non-recursively. Files (listed or found) are kept if their
    /// extension matches one of @p supportedFormats, compared case-insensitively. Directory
    /// entries are sorted by name; explicitly listed files keep their order.
    /// @return The playlist, or an IoError if an argument does not exist.
    [[nodiscard]] static auto fromPaths(const std::vector<std::string>& arguments,
                                        const std::vector<std::string>& supportedFormats) -> Result<Playlist>;

    [[nodiscard]] auto empty() const -> bool { return _paths.empty(); }
    [[nodiscard]] auto size() const -> std::size_t { return _paths.size(); }
    [[nodiscard]] auto paths() const -> const std::vector<std::string>& { return _paths; }
    [[nodiscard]] auto index() const -> std::size_t { return _index; }

    /// @brief Returns the current track path, or std::nullopt if the playlist is empty.
    [[nodiscard]] auto current() const -> std::optional<std::string>;

    /// @brief Advances to the next track.
    /// @return false at the end of the playlist (the position is unchanged).
    auto next() -> bool;

    /// @brief Steps back to the previous track.
    /// @return false at the start of the playlist (the position is unchanged).
    auto previous() -> bool;

  private:
    std::vector<std::string> _paths;
    std::size_t _index = 0;
};

/// @brief Returns true if @p path has one of the given extensions (case-insensitive, with dot).
[[nodiscard]] auto hasSupportedExtension(std::string_view path, const std::vector<std::string>& supportedFormats)
    -> bool;

} // namespace subplay
