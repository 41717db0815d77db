// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioPlayer.hpp>
#include <audio/DecoderAudioSource.hpp>
#include <core/Log.hpp>
#include <scheduler/SubtitleScheduler.hpp>
#include <speech/WhisperEngine.hpp>
#include <subplay/Console.hpp>
#include <subplay/Playlist.hpp>
#include <subplay/SubtitleRenderer.hpp>
#include <subtitle/Srt.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <string>

namespace subplay
{

namespace
{

    constexpr auto SeekStepSeconds = 10.0;

    /// @brief How playback of one track ended.
    enum class TrackOutcome : std::uint8_t
    {
        Finished,
        Next,
        Previous,
        Quit,
        Failed,
    };

    /// @brief Uses the default model location for a tier when none is configured and the file exists.
    void resolveModelPath(std::string& path, std::string const& fallback, std::string_view tierName)
    {
        if (!path.empty())
            return;
        if (std::filesystem::exists(fallback))
        {
            path = fallback;
            log::info("Using default {} model: {}", tierName, path);
        }
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::vector<std::string> inputs;

    Playlist playlist;
    WhisperEngine engine;
    DecoderAudioSource audioSource;
    AudioPlayer player;
    Console console;
    std::unique_ptr<SubtitleScheduler> scheduler;
    std::unique_ptr<SubtitleRenderer> renderer;

    TrackId nextTrackId = 1;
    bool subtitlesSaved = false;
    std::string lineText;

    Impl(AppConfig c, std::vector<std::string> i): config(std::move(c)), inputs(std::move(i)) {}

    ~Impl()
    {
        // The scheduler joins its workers before the engine and audio source go away.
        renderer.reset();
        scheduler.reset();
    }

    void preloadSidecar(const TrackInfo& track)
    {
        auto const path = srt::sidecarPath(track.path);
        if (!config.player.loadExistingSrt || !std::filesystem::exists(path))
            return;

        auto spans = srt::readFile(path);
        if (!spans)
        {
            log::warning("Ignoring subtitle file: {}", spans.error());
            return;
        }

        // The sidecar counts as complete for the whole track, even past its last cue.
        auto end = track.duration.value_or(0.0);
        for (auto const& span: *spans)
            end = std::max(end, span.end);
        if (end <= 0.0)
            return;

        auto const count = spans->size();
        if (auto result = scheduler->preload(TimeRange { .start = 0.0, .end = end }, std::move(*spans)); !result)
        {
            log::warning("Could not use subtitle file {}: {}", path, result.error());
            return;
        }

        subtitlesSaved = true;
        log::info("Loaded {} subtitle(s) from {}", count, path);
    }

    void saveSubtitlesIfComplete(const TrackInfo& track)
    {
        if (!config.player.writeSrtOnComplete || subtitlesSaved || !track.duration)
            return;

        auto const& state = scheduler->trackState();
        if (!state.isCovered(TimeRange { .start = 0.0, .end = *track.duration }, FidelityTier::Full))
            return;

        subtitlesSaved = true;
        if (auto result = srt::writeFile(srt::sidecarPath(track.path), state.spans()); !result)
            log::warning("{}", result.error());
    }

    auto handleCommand(ConsoleCommand command) -> std::optional<TrackOutcome>
    {
        switch (command)
        {
            case ConsoleCommand::TogglePause:
                if (auto result = player.togglePause(); !result)
                    log::warning("{}", result.error());
                return std::nullopt;
            case ConsoleCommand::SeekForward:
            case ConsoleCommand::SeekBackward: {
                auto const delta = command == ConsoleCommand::SeekForward ? SeekStepSeconds : -SeekStepSeconds;
                if (auto result = player.seek(player.position() + delta); !result)
                    log::warning("{}", result.error());
                return std::nullopt;
            }
            case ConsoleCommand::Next: return TrackOutcome::Next;
            case ConsoleCommand::Previous: return TrackOutcome::Previous;
            case ConsoleCommand::Quit: return TrackOutcome::Quit;
        }
        return std::nullopt;
    }

    auto playTrack(const std::string& path) -> TrackOutcome
    {
        if (auto result = player.open(path); !result)
        {
            log::error("Cannot play {}: {}", path, result.error());
            return TrackOutcome::Failed;
        }

        auto duration = player.duration();
        if (!duration)
        {
            if (auto probed = probeDuration(path))
                duration = *probed;
            else
                log::debug("{}", probed.error());
        }

        auto const track = TrackInfo { .id = nextTrackId++, .path = path, .duration = duration };

        // Invalidate the previous track's coverage before anything new can be planned.
        scheduler->beginTrack(track);
        subtitlesSaved = false;
        lineText.clear();
        renderer->invalidate();

        preloadSidecar(track);

        console.showTrack(path, playlist.index(), playlist.size(), duration);
        player.setVolume(static_cast<float>(config.player.volume));
        if (auto result = player.play(); !result)
        {
            log::error("Cannot play {}: {}", path, result.error());
            scheduler->endTrack();
            return TrackOutcome::Failed;
        }

        auto outcome = TrackOutcome::Finished;
        while (true)
        {
            if (auto command = console.pollCommand(config.scheduler.tickIntervalMs))
            {
                if (auto stop = handleCommand(*command))
                {
                    outcome = *stop;
                    break;
                }
            }

            if (player.finished())
                break;

            auto const position = player.position();
            if (player.isPlaying())
                scheduler->tick(position);

            if (auto line = renderer->update(position, scheduler->isWorking()))
                lineText = line->text;
            console.showLine(position, player.isPaused(), lineText);

            saveSubtitlesIfComplete(track);
        }

        player.stop();
        scheduler->endTrack();
        console.finishLine();

        auto const stats = scheduler->stats();
        log::debug("Track {} done: {} submitted, {} committed, {} stale, {} failed, {} superseded",
                   track.id,
                   stats.submitted,
                   stats.committed,
                   stats.stale,
                   stats.failed,
                   stats.superseded);
        return outcome;
    }
};

App::App(AppConfig config, std::vector<std::string> inputs):
    _impl(std::make_unique<Impl>(std::move(config), std::move(inputs)))
{
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto& config = _impl->config;

    auto playlist = Playlist::fromPaths(_impl->inputs, config.player.supportedFormats);
    if (!playlist)
        return std::unexpected(playlist.error());
    if (playlist->empty())
        return makeError(ErrorCode::InvalidArgument, "No playable audio files given");
    _impl->playlist = std::move(*playlist);
    log::info("Playlist: {} track(s)", _impl->playlist.size());

    resolveModelPath(config.whisper.previewModelPath, defaultPreviewModelPath(), "preview");
    resolveModelPath(config.whisper.fullModelPath, defaultFullModelPath(), "full");

    auto const engineConfig = WhisperEngineConfig {
        .previewModelPath = config.whisper.previewModelPath,
        .fullModelPath = config.whisper.fullModelPath,
        .device = deviceFromString(config.whisper.device).value_or(ComputeDevice::Auto),
        .threads = config.whisper.threads,
        .beamSize = config.whisper.beamSize,
        .bestOf = config.whisper.bestOf,
        .upgradeOnCpu = config.whisper.upgradeOnCpu,
    };

    // Without a model the player still works; it only shows existing subtitle files.
    if (auto result = _impl->engine.initialize(engineConfig); !result)
        log::warning("Subtitle generation disabled: {}", result.error());
    else
    {
        log::info("Transcribing on the {}", _impl->engine.usesGpu() ? "GPU" : "CPU");
        if (!_impl->engine.availableTiers().contains(FidelityTier::Full))
            log::info("Full-fidelity upgrades disabled on this device");
    }

    _impl->scheduler =
        std::make_unique<SubtitleScheduler>(_impl->engine, _impl->audioSource, toSchedulerConfig(config));
    _impl->renderer = std::make_unique<SubtitleRenderer>(_impl->scheduler->trackState());

    if (auto result = _impl->console.initialize(); !result)
        return std::unexpected(result.error());

    return {};
}

auto App::run() -> int
{
    auto& playlist = _impl->playlist;
    auto exitCode = 0;

    while (auto const path = playlist.current())
    {
        auto const outcome = _impl->playTrack(*path);
        if (outcome == TrackOutcome::Quit)
            break;

        if (outcome == TrackOutcome::Previous)
        {
            // At the first track, "previous" restarts it.
            playlist.previous();
            continue;
        }

        if (outcome == TrackOutcome::Failed)
            exitCode = 1;

        if (!playlist.next())
            break;
    }

    _impl->console.shutdown();
    return exitCode;
}

} // namespace subplay
