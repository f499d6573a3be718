/**
 * @file effect.hpp
 * @brief Effect instance attached to a clip
 */

#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace lumen::model {

// ========== Typed Parameter Reads ==========
// Project files are edited by hand and by other tools; a parameter of the
// wrong JSON type reads as absent.

[[nodiscard]] inline double numberParam(const nlohmann::json& params, const std::string& key,
                                        double fallback) {
    if (!params.is_object()) {
        return fallback;
    }
    auto it = params.find(key);
    return it != params.end() && it->is_number() ? it->get<double>() : fallback;
}

[[nodiscard]] inline std::string stringParam(const nlohmann::json& params, const std::string& key,
                                             const std::string& fallback) {
    if (!params.is_object()) {
        return fallback;
    }
    auto it = params.find(key);
    return it != params.end() && it->is_string() ? it->get<std::string>() : fallback;
}

[[nodiscard]] inline bool boolParam(const nlohmann::json& params, const std::string& key, bool fallback) {
    if (!params.is_object()) {
        return fallback;
    }
    auto it = params.find(key);
    return it != params.end() && it->is_boolean() ? it->get<bool>() : fallback;
}

/**
 * @brief One entry of a clip's video or audio effect list
 *
 * Parameters stay as JSON: the compositor never interprets video effect
 * parameters itself, and the audio processors read only the keys they know.
 */
struct Effect {
    std::string id;
    std::string type;
    nlohmann::json params = nlohmann::json::object();
    bool enabled = true;

    /// Numeric parameter or fallback when absent / not a number
    [[nodiscard]] double param(const std::string& key, double fallback) const {
        return numberParam(params, key, fallback);
    }
};

} // namespace lumen::model
