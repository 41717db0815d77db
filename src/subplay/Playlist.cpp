// SPDX-License-Identifier: Apache-2.0
#include "Playlist.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>

namespace subplay
{

namespace
{

    auto toLower(std::string_view text) -> std::string
    {
        auto result = std::string(text);
        std::ranges::transform(result, result.begin(), [](unsigned char c) { return std::tolower(c); });
        return result;
    }

} // namespace

auto hasSupportedExtension(std::string_view path, const std::vector<std::string>& supportedFormats) -> bool
{
    auto const extension = toLower(std::filesystem::path(path).extension().string());
    if (extension.empty())
        return false;
    return std::ranges::any_of(supportedFormats,
                               [&](const std::string& format) { return toLower(format) == extension; });
}

Playlist::Playlist(std::vector<std::string> paths): _paths(std::move(paths))
{
}

auto Playlist::fromPaths(const std::vector<std::string>& arguments, const std::vector<std::string>& supportedFormats)
    -> Result<Playlist>
{
    namespace fs = std::filesystem;

    auto paths = std::vector<std::string> {};
    for (auto const& argument: arguments)
    {
        auto ec = std::error_code {};
        if (fs::is_directory(argument, ec))
        {
            auto found = std::vector<std::string> {};
            for (auto const& entry: fs::directory_iterator(argument, ec))
                if (entry.is_regular_file() && hasSupportedExtension(entry.path().string(), supportedFormats))
                    found.push_back(entry.path().string());
            if (ec)
                return makeError(ErrorCode::IoError,
                                 std::format("Cannot read directory '{}': {}", argument, ec.message()));

            std::ranges::sort(found);
            log::debug("Found {} audio file(s) in {}", found.size(), argument);
            paths.insert(paths.end(), found.begin(), found.end());
        }
        else if (fs::is_regular_file(argument, ec))
        {
            if (hasSupportedExtension(argument, supportedFormats))
                paths.push_back(argument);
            else
                log::warning("Skipping unsupported file: {}", argument);
        }
        else
        {
            return makeError(ErrorCode::IoError, std::format("No such file or directory: {}", argument));
        }
    }

    return Playlist(std::move(paths));
}

auto Playlist::current() const -> std::optional<std::string>
{
    if (_paths.empty())
        return std::nullopt;
    return _paths[_index];
}

auto Playlist::next() -> bool
{
    if (_index + 1 >= _paths.size())
        return false;
    ++_index;
    return true;
}

auto Playlist::previous() -> bool
{
    if (_index == 0)
        return false;
    --_index;
    return true;
}

} // namespace subplay
