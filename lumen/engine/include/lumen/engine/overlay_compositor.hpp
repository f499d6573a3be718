/**
 * @file overlay_compositor.hpp
 * @brief Track-ordered painting of text, graphic and subtitle layers
 *
 * Overlay lanes are split around the visible video/image stack:
 * - Below: lanes with an index after every video lane (painted before video)
 * - Above: lanes with an index before every video lane (painted after video)
 * - All:   every overlay lane, used when no video lane is visible
 *
 * Lanes paint index-descending, so the lowest index ends up on top. Inside a
 * lane, entities paint in timeline insertion order. Overlay lanes that sit
 * between two video lanes go into the Above pass.
 */

#pragma once

#include <lumen/engine/overlay_rasterizer.hpp>
#include <lumen/engine/render_backend.hpp>
#include <lumen/model/timeline.hpp>

#include <memory>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace lumen::engine {

enum class OverlayPass {
    Below,
    Above,
    All,
};

const char* overlayPassToString(OverlayPass pass);

/// Index range of visible video/image lanes; lowest > highest when there are none
struct VideoIndexRange {
    int lowest = 0;
    int highest = -1;

    [[nodiscard]] bool empty() const { return highest < lowest; }
};

[[nodiscard]] VideoIndexRange videoIndexRange(const std::vector<model::Track>& tracks);

/// Visible overlay lane indices painted by a pass, in paint order
[[nodiscard]] std::vector<int> overlayTracksForPass(const std::vector<model::Track>& tracks,
                                                    OverlayPass pass);

/// Transform held by a live interaction in place of the stored one
struct TransformOverride {
    std::string id;
    model::Transform transform;
};

class OverlayCompositor {
public:
    explicit OverlayCompositor(std::shared_ptr<OverlayRasterizer> rasterizer);

    /**
     * @brief Paint the overlay entities of one pass into the current frame
     *
     * A failing entity is logged and skipped; the rest still paint.
     * @return Number of layers drawn
     */
    int paintOverlays(RenderBackend& backend, const model::Timeline& timeline, Timestamp time,
                      Size canvas, OverlayPass pass, const TransformOverride* live = nullptr);

    /// Paint active subtitles on top of everything
    int paintSubtitles(RenderBackend& backend, const model::Timeline& timeline, Timestamp time,
                       Size canvas);

    /// Paint one entity regardless of its lane (live interaction preview)
    bool paintEntity(RenderBackend& backend, const model::OverlayItem& item, Timestamp time,
                     Size canvas, const model::Transform* transformOverride = nullptr);

    [[nodiscard]] OverlayRasterizer& rasterizer() { return *m_rasterizer; }

    /// Rasterizer calls that threw, since construction
    [[nodiscard]] uint64_t rasterizeErrors() const { return m_rasterizeErrors; }

private:
    /// Null when the rasterizer throws; the entity is skipped for this frame
    media::BitmapPtr rasterize(const model::OverlayItem& item, Size canvas);
    media::BitmapPtr rasterizeSubtitle(const model::Subtitle& subtitle, Size canvas);
    void reportThrow(const std::string& id, const char* what);

    std::shared_ptr<OverlayRasterizer> m_rasterizer;
    std::unordered_set<std::string> m_failing;
    uint64_t m_rasterizeErrors = 0;
};

} // namespace lumen::engine
