// SPDX-License-Identifier: Apache-2.0
#include "SubtitleRenderer.hpp"

namespace subplay
{

SubtitleRenderer::SubtitleRenderer(const SubtitleTrackState& state): _state(state)
{
}

auto SubtitleRenderer::update(Seconds position, bool working) -> std::optional<RenderLine>
{
    auto line = RenderLine {};
    if (auto const hit = _state.coverageQuery(position))
    {
        if (hit->span)
            line.text = hit->span->text;
    }
    else if (working)
    {
        line.text = std::string(GeneratingSubtitlesText);
        line.status = true;
    }

    // A new generation means a new track: always redraw, even if the text happens to match.
    auto const generation = _state.generation();
    if (generation == _generation && _last == line)
        return std::nullopt;

    _generation = generation;
    _last = line;
    return line;
}

void SubtitleRenderer::invalidate()
{
    _last.reset();
}

} // namespace subplay
