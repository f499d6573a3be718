/**
 * @file transform.cpp
 * @brief Transform helpers
 */

#include <lumen/model/transform.hpp>

namespace lumen::model {

FitMode parseFitMode(const std::string& name) {
    if (name == "cover") return FitMode::Cover;
    if (name == "fill" || name == "stretch") return FitMode::Fill;
    if (name == "none") return FitMode::None;
    return FitMode::Contain;
}

const char* fitModeToString(FitMode mode) {
    switch (mode) {
        case FitMode::Contain: return "contain";
        case FitMode::Cover: return "cover";
        case FitMode::Fill: return "fill";
        case FitMode::None: return "none";
        default: return "contain";
    }
}

void TransformPatch::applyTo(Transform& t) const {
    if (position) t.position = *position;
    if (scale) t.scale = *scale;
    if (rotation) t.rotation = *rotation;
    if (anchor) t.anchor = *anchor;
    if (opacity) t.opacity = *opacity;
    if (borderRadius) t.borderRadius = *borderRadius;
    if (crop) t.crop = *crop;
}

} // namespace lumen::model
