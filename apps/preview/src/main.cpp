/**
 * @file main.cpp
 * @brief Lumen preview player
 *
 * Usage: lumen_preview <project.json> [--config <file>] [--log-level <level>]
 *
 * Keys:
 *   space        play / pause
 *   home / end   jump to start / end
 *   left, right  step one frame (shift: one second)
 *   m            mute
 *   f, x         fullscreen, maximize
 *   tab          select the next entity under the playhead
 *   c            crop the selected clip (drag, enter commits, esc cancels)
 *   q            quit
 *
 * Mouse: drag moves the selection, shift-drag scales it, a click on the
 * bar at the bottom seeks.
 */

#define SDL_MAIN_HANDLED

#include "preview_window.hpp"

#include <lumen/core/config.hpp>
#include <lumen/core/frame_scheduler.hpp>
#include <lumen/core/logger.hpp>
#include <lumen/engine/playback_orchestrator.hpp>
#include <lumen/engine/preview_settings.hpp>
#include <lumen/engine/sdl_gpu_backend.hpp>
#include <lumen/model/io/project_io.hpp>

#include <SDL2/SDL.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace lumen;

namespace {

struct Options {
    std::string projectFile;
    std::string configFile;
    std::string logLevel = "info";
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <project.json> [--config <file>] [--log-level <level>]"
              << std::endl;
}

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            options.configFile = argv[++i];
        } else if ((arg == "--log-level" || arg == "-l") && i + 1 < argc) {
            options.logLevel = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (options.projectFile.empty() && arg.rfind("-", 0) != 0) {
            options.projectFile = arg;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return std::nullopt;
        }
    }
    if (options.projectFile.empty()) {
        return std::nullopt;
    }
    return options;
}

/// Authored transform of a clip or overlay, if the id exists
std::optional<model::Transform> authoredTransform(const model::Timeline& timeline,
                                                  const std::string& id) {
    if (const auto* clip = timeline.findClip(id)) {
        return clip->transform;
    }
    if (const auto* overlay = timeline.findOverlay(id)) {
        return model::overlayBase(*overlay).transform;
    }
    return std::nullopt;
}

/// Entities under the playhead, clips first, in paint order
std::vector<std::string> selectableAt(const model::Timeline& timeline, Timestamp time) {
    std::vector<std::string> ids;
    for (const auto& active : timeline.activeVisualClips(time)) {
        ids.push_back(active.clip->id);
    }
    for (const auto* overlay : model::activeOverlays(timeline.overlays, time)) {
        ids.push_back(model::overlayBase(*overlay).id);
    }
    return ids;
}

// ============================================================================
// Interaction
// ============================================================================

enum class DragMode {
    None,
    Move,
    Scale,
    Crop,
};

class InteractionController {
public:
    InteractionController(model::ProjectStore& store, engine::PlaybackOrchestrator& player,
                          preview::PreviewWindow& window)
        : m_store(store)
        , m_player(player)
        , m_window(window) {
        m_cropLog = m_player.liveSession().liveChanged.connectScoped(
            [this](const model::Transform& transform) {
                if (m_mode == DragMode::Crop && transform.crop) {
                    const Rect& c = *transform.crop;
                    LUMEN_LOG_INFO("Crop {}: x={:.3f} y={:.3f} w={:.3f} h={:.3f}", m_selection,
                                   c.x, c.y, c.width, c.height);
                }
            });
    }

    [[nodiscard]] const std::string& selection() const { return m_selection; }
    [[nodiscard]] bool cropping() const { return m_cropArmed; }
    [[nodiscard]] const std::optional<Rect>& cropRect() const { return m_cropRect; }

    void selectNext() {
        auto timeline = m_store.getProjectTimeline();
        const auto ids = selectableAt(*timeline, m_player.currentTime());
        if (ids.empty()) {
            m_selection.clear();
            LUMEN_LOG_INFO("Nothing to select");
            return;
        }
        auto it = std::find(ids.begin(), ids.end(), m_selection);
        m_selection = (it == ids.end() || std::next(it) == ids.end()) ? ids.front() : *std::next(it);
        LUMEN_LOG_INFO("Selected {}", m_selection);
    }

    void armCrop() {
        if (m_selection.empty() || m_player.isInteracting()) {
            return;
        }
        auto timeline = m_store.getProjectTimeline();
        const auto* clip = timeline->findClip(m_selection);
        if (!clip || !clip->isVisual()) {
            LUMEN_LOG_INFO("Only video and image clips can be cropped");
            return;
        }
        if (auto result = m_player.beginInteraction(m_selection); !result) {
            LUMEN_LOG_WARN("Crop failed to start: {}", result.error().what());
            return;
        }
        m_initial = clip->transform;
        m_cropArmed = true;
        m_cropRect = clip->transform.crop;
        LUMEN_LOG_INFO("Crop mode on {}: drag a rectangle, enter to apply, esc to cancel", m_selection);
    }

    void commitCrop() {
        if (!m_cropArmed) {
            return;
        }
        finish(true);
    }

    void cancelCrop() {
        if (!m_cropArmed) {
            return;
        }
        finish(false);
    }

    void mouseDown(int x, int y, bool shift) {
        if (auto fraction = m_window.scrubFraction(x, y)) {
            m_player.seek(static_cast<Timestamp>(*fraction * m_player.duration()));
            return;
        }
        if (m_selection.empty()) {
            return;
        }

        m_start = m_window.toCanvas(x, y);
        if (m_cropArmed) {
            m_mode = DragMode::Crop;
            return;
        }

        auto timeline = m_store.getProjectTimeline();
        auto initial = authoredTransform(*timeline, m_selection);
        if (!initial) {
            m_selection.clear();
            return;
        }
        if (auto result = m_player.beginInteraction(m_selection); !result) {
            LUMEN_LOG_WARN("Interaction failed to start: {}", result.error().what());
            return;
        }
        m_initial = *initial;
        m_mode = shift ? DragMode::Scale : DragMode::Move;
    }

    void mouseMove(int x, int y) {
        if (m_mode == DragMode::None) {
            return;
        }
        const Vec2 at = m_window.toCanvas(x, y);
        model::Transform next = m_initial;

        switch (m_mode) {
            case DragMode::Move:
                next.position.x += at.x - m_start.x;
                next.position.y += at.y - m_start.y;
                break;
            case DragMode::Scale: {
                const double factor = std::max(0.05, 1.0 + (at.x - m_start.x) / 200.0);
                next.scale.x *= factor;
                next.scale.y *= factor;
                break;
            }
            case DragMode::Crop: {
                const Size canvas = m_player.settings().canvas;
                const double x0 = std::clamp(std::min(m_start.x, at.x) / canvas.width, 0.0, 1.0);
                const double y0 = std::clamp(std::min(m_start.y, at.y) / canvas.height, 0.0, 1.0);
                const double x1 = std::clamp(std::max(m_start.x, at.x) / canvas.width, 0.0, 1.0);
                const double y1 = std::clamp(std::max(m_start.y, at.y) / canvas.height, 0.0, 1.0);
                if (x1 - x0 < 0.01 || y1 - y0 < 0.01) {
                    return;
                }
                m_cropRect = Rect{x0, y0, x1 - x0, y1 - y0};
                next.crop = m_cropRect;
                break;
            }
            case DragMode::None:
                return;
        }
        m_player.updateInteraction(next);
    }

    void mouseUp() {
        if (m_mode == DragMode::None) {
            return;
        }
        const DragMode mode = m_mode;
        m_mode = DragMode::None;
        // A crop stays open until enter or esc
        if (mode != DragMode::Crop) {
            if (auto result = m_player.endInteraction(); !result) {
                LUMEN_LOG_WARN("Commit of {} failed: {}", m_selection, result.error().what());
            }
        }
    }

private:
    void finish(bool commit) {
        m_mode = DragMode::None;
        m_cropArmed = false;
        m_cropRect.reset();
        if (!commit) {
            m_player.cancelInteraction();
            if (auto frame = m_player.renderAt(m_player.currentTime()); !frame) {
                LUMEN_LOG_WARN("Redraw after cancel failed: {}", frame.error().what());
            }
            return;
        }
        if (auto result = m_player.endInteraction(); !result) {
            LUMEN_LOG_WARN("Crop of {} failed: {}", m_selection, result.error().what());
        }
    }

    model::ProjectStore& m_store;
    engine::PlaybackOrchestrator& m_player;
    preview::PreviewWindow& m_window;

    std::string m_selection;
    DragMode m_mode = DragMode::None;
    Vec2 m_start;
    model::Transform m_initial;
    bool m_cropArmed = false;
    std::optional<Rect> m_cropRect;
    ScopedConnection m_cropLog;
};

} // namespace

int main(int argc, char* argv[]) {
    auto options = parseArgs(argc, argv);
    if (!options) {
        printUsage(argv[0]);
        return 1;
    }

    auto& config = Config::getInstance();
    config.loadDefaults();
    if (!options->configFile.empty()) {
        try {
            config.loadFromFile(options->configFile);
        } catch (const std::exception& e) {
            std::cerr << "Failed to load config: " << e.what() << std::endl;
            return 1;
        }
    }

    initLogging("lumen_preview", parseLogLevel(options->logLevel),
                config.get<std::string>("log.file", ""));

    auto store = model::ProjectIO::load(options->projectFile);
    if (!store) {
        LUMEN_LOG_CRITICAL("Failed to load {}: {}", options->projectFile, store.error().what());
        return 1;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
        LUMEN_LOG_CRITICAL("SDL_Init failed: {}", SDL_GetError());
        return 1;
    }

    const auto settings = engine::PreviewSettings::fromConfig(config);
    {
        preview::PreviewWindow window;
        if (auto result = window.init(settings.canvas, "Lumen Preview"); !result) {
            LUMEN_LOG_CRITICAL("Window: {}", result.error().what());
            SDL_Quit();
            return 1;
        }

        TimerQueue queue;
        engine::PlaybackOrchestrator player(*store.value(), queue, {}, settings);
        if (auto result = player.initialize(); !result) {
            LUMEN_LOG_CRITICAL("Render backend: {}", result.error().what());
            SDL_Quit();
            return 1;
        }
        if (auto result = player.openAudioDevice(); !result) {
            LUMEN_LOG_WARN("Audio disabled: {}", result.error().what());
        }

        media::BitmapPtr latest;
        bool dirty = false;
        auto presented = player.framePresented.connectScoped(
            [&](const media::BitmapPtr& frame, Timestamp) {
                latest = frame;
                dirty = true;
            });
        auto stateLog = player.stateChanged.connectScoped([&](PlaybackState state) {
            LUMEN_LOG_INFO("State: {} ({})", playbackStateToString(state),
                           playbackPathToString(player.path()));
        });

        InteractionController interaction(*store.value(), player, window);
        if (auto first = player.renderAt(0); !first) {
            LUMEN_LOG_WARN("First frame failed: {}", first.error().what());
        }

        bool running = true;
        while (running) {
            const Duration wait = queue.timeUntilNext();
            const int timeoutMs = wait == kNoTimestamp
                ? 100
                : static_cast<int>(std::clamp<Duration>(wait / 1000, 0, 100));

            SDL_Event event;
            if (SDL_WaitEventTimeout(&event, timeoutMs)) {
                do {
                    if (auto* gpu = dynamic_cast<engine::SdlGpuBackend*>(player.backend())) {
                        gpu->handleEvent(event);
                    }

                    switch (event.type) {
                        case SDL_QUIT:
                            running = false;
                            break;
                        case SDL_WINDOWEVENT:
                            if (event.window.event == SDL_WINDOWEVENT_SIZE_CHANGED) {
                                window.onResized(event.window.data1, event.window.data2);
                                dirty = true;
                            } else if (event.window.event == SDL_WINDOWEVENT_EXPOSED) {
                                dirty = true;
                            }
                            break;
                        case SDL_KEYDOWN: {
                            const bool shift = (event.key.keysym.mod & KMOD_SHIFT) != 0;
                            switch (event.key.keysym.sym) {
                                case SDLK_q: running = false; break;
                                case SDLK_SPACE: player.togglePlayPause(); break;
                                case SDLK_HOME: player.seek(0); break;
                                case SDLK_END: player.seek(player.duration()); break;
                                case SDLK_LEFT:
                                    if (shift) {
                                        player.seekRelative(-secondsToUs(1.0));
                                    } else {
                                        player.stepFrames(-1);
                                    }
                                    break;
                                case SDLK_RIGHT:
                                    if (shift) {
                                        player.seekRelative(secondsToUs(1.0));
                                    } else {
                                        player.stepFrames(1);
                                    }
                                    break;
                                case SDLK_m: player.setMuted(!player.isMuted()); break;
                                case SDLK_f: window.toggleFullscreen(); break;
                                case SDLK_x: window.toggleMaximize(); break;
                                case SDLK_TAB: interaction.selectNext(); break;
                                case SDLK_c: interaction.armCrop(); break;
                                case SDLK_RETURN: interaction.commitCrop(); break;
                                case SDLK_ESCAPE: interaction.cancelCrop(); break;
                                default: break;
                            }
                            dirty = true;
                            break;
                        }
                        case SDL_MOUSEBUTTONDOWN:
                            if (event.button.button == SDL_BUTTON_LEFT) {
                                interaction.mouseDown(event.button.x, event.button.y,
                                                      (SDL_GetModState() & KMOD_SHIFT) != 0);
                            }
                            break;
                        case SDL_MOUSEMOTION:
                            interaction.mouseMove(event.motion.x, event.motion.y);
                            break;
                        case SDL_MOUSEBUTTONUP:
                            if (event.button.button == SDL_BUTTON_LEFT) {
                                interaction.mouseUp();
                            }
                            break;
                        default:
                            break;
                    }
                } while (running && SDL_PollEvent(&event));
            }

            queue.runDue();

            if (dirty && latest) {
                if (auto result = window.setFrame(*latest); !result) {
                    LUMEN_LOG_WARN("Present failed: {}", result.error().what());
                }
                const Duration total = player.duration();
                const double progress = total > 0
                    ? static_cast<double>(player.currentTime()) / total
                    : 0.0;
                window.present(progress, interaction.cropRect());
                dirty = false;
            }
        }

        player.stop();
        LUMEN_LOG_INFO("Presented {} frames ({} errors, {} gap skips)", player.framesPresented(),
                       player.frameErrors(), player.gapSkips());
    }

    SDL_Quit();
    return 0;
}
