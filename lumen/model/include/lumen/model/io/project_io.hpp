/**
 * @file project_io.hpp
 * @brief Read-only project loading from JSON
 *
 * Project files express every time in seconds; they are converted to
 * microseconds here and nowhere else. The loader backs the demo preview
 * application; saving is not part of the preview.
 */

#pragma once

#include <lumen/core/result.hpp>
#include <lumen/model/project_store.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <memory>
#include <string>

namespace lumen::model {

class ProjectIO {
public:
    /// Load a project file into a fresh in-memory store
    static Result<std::unique_ptr<InMemoryProjectStore>> load(const std::filesystem::path& path);

    /// Parse a project document held in a string
    static Result<std::unique_ptr<InMemoryProjectStore>> fromJson(const std::string& json);

    /**
     * @brief Parse just the timeline object
     *
     * @param json   The "timeline" object of a project document
     * @param media  The project's media list, used to infer clip kinds
     */
    static Result<Timeline> parseTimeline(const nlohmann::json& json,
                                          const nlohmann::json& media = nlohmann::json::array());
};

} // namespace lumen::model
