/**
 * @file config.cpp
 * @brief Config implementation
 */

#include <lumen/core/config.hpp>
#include <lumen/core/logger.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace lumen {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> segments;
    std::stringstream ss(key);
    std::string segment;
    while (std::getline(ss, segment, '.')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

} // namespace

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::loadFromFile(const std::string& configFile, bool merge) {
    std::ifstream file(configFile);
    if (!file.is_open()) {
        LUMEN_LOG_ERROR("Failed to open config file: {}", configFile);
        throw std::runtime_error("Failed to open config file: " + configFile);
    }

    nlohmann::json loaded;
    try {
        file >> loaded;
    } catch (const nlohmann::json::exception& e) {
        LUMEN_LOG_ERROR("Failed to parse config file: {} - {}", configFile, e.what());
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    loadFromJson(loaded, merge);
    LUMEN_LOG_INFO("Configuration loaded from file: {}", configFile);
}

void Config::loadFromJson(const nlohmann::json& json, bool merge) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (merge && m_config.is_object()) {
        m_config.merge_patch(json);
    } else {
        m_config = json;
    }
}

const nlohmann::json* Config::find(const std::string& key) const {
    const nlohmann::json* current = &m_config;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            return nullptr;
        }
        current = &*it;
    }
    return current;
}

nlohmann::json& Config::getOrCreate(const std::string& key) {
    nlohmann::json* current = &m_config;
    for (const auto& seg : splitKey(key)) {
        if (!current->is_object()) {
            *current = nlohmann::json::object();
        }
        current = &(*current)[seg];
    }
    return *current;
}

template<typename T>
T Config::get(const std::string& key, const T& defaultValue) const {
    std::lock_guard<std::mutex> lock(m_mutex);

    const nlohmann::json* node = find(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }
    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception& e) {
        LUMEN_LOG_WARN("Config key '{}' has unexpected type, using default: {}", key, e.what());
        return defaultValue;
    }
}

template<typename T>
bool Config::set(const std::string& key, const T& value, bool validate) {
    nlohmann::json newValue = value;
    nlohmann::json oldValue;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (validate && m_validator && !m_validator(key, newValue)) {
            LUMEN_LOG_WARN("Config validation failed for key: {}", key);
            return false;
        }

        if (const nlohmann::json* existing = find(key)) {
            oldValue = *existing;
        }
        getOrCreate(key) = newValue;
    }

    notifyListeners(key, oldValue, newValue);
    return true;
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return find(key) != nullptr;
}

bool Config::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto segments = splitKey(key);
    if (segments.empty()) {
        return false;
    }

    const std::string leaf = segments.back();
    segments.pop_back();

    nlohmann::json* parent = &m_config;
    for (const auto& seg : segments) {
        if (!parent->is_object() || !parent->contains(seg)) {
            return false;
        }
        parent = &(*parent)[seg];
    }

    if (parent->is_object() && parent->erase(leaf) > 0) {
        LUMEN_LOG_DEBUG("Config key removed: {}", key);
        return true;
    }
    return false;
}

void Config::saveToFile(const std::string& configFile, bool pretty) const {
    std::string text;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        text = pretty ? m_config.dump(4) : m_config.dump();
    }

    std::ofstream file(configFile);
    if (!file.is_open()) {
        LUMEN_LOG_ERROR("Failed to open config file for writing: {}", configFile);
        throw std::runtime_error("Failed to open config file for writing: " + configFile);
    }
    file << text;
    LUMEN_LOG_INFO("Configuration saved to file: {}", configFile);
}

nlohmann::json Config::toJson() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_config;
}

void Config::setValidator(ConfigValidator validator) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_validator = std::move(validator);
}

size_t Config::addChangeListener(ConfigChangeListener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t id = m_nextListenerId++;
    m_listeners[id] = std::move(listener);
    return id;
}

void Config::removeChangeListener(size_t listenerId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_listeners.erase(listenerId);
}

std::vector<std::string> Config::getKeys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> keys;

    const nlohmann::json* node = prefix.empty() ? &m_config : find(prefix);
    if (!node || !node->is_object()) {
        return keys;
    }
    for (auto it = node->begin(); it != node->end(); ++it) {
        keys.push_back(prefix.empty() ? it.key() : prefix + "." + it.key());
    }
    return keys;
}

void Config::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_config = nlohmann::json::object();
}

void Config::loadDefaults() {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_config = {
        {"preview", {
            {"width", 1280},
            {"height", 720},
            {"frame_rate", 30.0},
            {"background", "#000000"}
        }},
        {"render", {
            {"backend", "auto"}
        }},
        {"cache", {
            {"video_decoders", 8},
            {"seek_epsilon_ms", 50},
            {"decode_timeout_ms", 10000},
            {"seek_timeout_ms", 500},
            {"max_forward_decode_ms", 2000}
        }},
        {"streaming", {
            {"drift_threshold_ms", 100}
        }},
        {"audio", {
            {"sample_rate", 48000},
            {"channels", 2},
            {"schedule_ahead_ms", 200},
            {"scheduler_interval_ms", 100},
            {"linked_clip_tolerance_ms", 10},
            {"master_volume", 1.0}
        }},
        {"interaction", {
            {"commit_interval_ms", 32}
        }},
        {"overlay", {
            {"font_file", "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"}
        }},
        {"log", {
            {"level", "info"},
            {"file", ""}
        }}
    };
}

void Config::notifyListeners(const std::string& key, const nlohmann::json& oldValue,
                             const nlohmann::json& newValue) {
    std::map<size_t, ConfigChangeListener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        listeners = m_listeners;
    }

    for (const auto& [id, listener] : listeners) {
        try {
            listener(key, oldValue, newValue);
        } catch (const std::exception& e) {
            LUMEN_LOG_ERROR("Config change listener {} threw: {}", id, e.what());
        }
    }
}

// Explicit instantiations for the types the preview uses
template int Config::get<int>(const std::string&, const int&) const;
template int64_t Config::get<int64_t>(const std::string&, const int64_t&) const;
template double Config::get<double>(const std::string&, const double&) const;
template bool Config::get<bool>(const std::string&, const bool&) const;
template std::string Config::get<std::string>(const std::string&, const std::string&) const;

template bool Config::set<int>(const std::string&, const int&, bool);
template bool Config::set<int64_t>(const std::string&, const int64_t&, bool);
template bool Config::set<double>(const std::string&, const double&, bool);
template bool Config::set<bool>(const std::string&, const bool&, bool);
template bool Config::set<std::string>(const std::string&, const std::string&, bool);

} // namespace lumen
