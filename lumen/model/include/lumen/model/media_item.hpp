/**
 * @file media_item.hpp
 * @brief Imported media asset referenced by clips
 */

#pragma once

#include <lumen/core/types.hpp>

#include <string>

namespace lumen::model {

struct MediaMetadata {
    Duration duration = 0;
    int width = 0;
    int height = 0;
    double frameRate = 0.0;
    int sampleRate = 0;
    int channels = 0;
};

/**
 * @brief A media file known to the project
 *
 * Holds a reference to the file, not its data. Multiple clips share one
 * item through mediaId.
 */
struct MediaItem {
    std::string id;
    std::string name;
    MediaType type = MediaType::Unknown;
    std::string path;
    MediaMetadata metadata;
};

MediaType parseMediaType(const std::string& name);

} // namespace lumen::model
