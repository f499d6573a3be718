/**
 * @file config.hpp
 * @brief JSON-backed configuration store
 *
 * Keys are dotted paths into a nlohmann::json document ("cache.video_decoders").
 * The preview reads its tunables (cache bounds, timeouts, audio look-ahead,
 * interaction cadence) from here once per session.
 */

#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace lumen {

/// Validation hook; return false to reject a set()
using ConfigValidator = std::function<bool(const std::string& key, const nlohmann::json& value)>;

/// Change listener, invoked after a successful set()
using ConfigChangeListener = std::function<void(const std::string& key,
                                                const nlohmann::json& oldValue,
                                                const nlohmann::json& newValue)>;

class Config {
public:
    Config() = default;
    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /// Process-wide instance used by the preview application
    static Config& getInstance();

    /**
     * @brief Load configuration from a JSON file
     * @param merge Merge into the current document (true) or replace it
     * @throw std::runtime_error if the file cannot be read or parsed
     */
    void loadFromFile(const std::string& configFile, bool merge = true);

    /// Load configuration from a JSON object
    void loadFromJson(const nlohmann::json& json, bool merge = true);

    /// Typed lookup of a dotted key; returns defaultValue if absent or mistyped
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const;

    /// Typed assignment of a dotted key; false if the validator rejected it
    template<typename T>
    bool set(const std::string& key, const T& value, bool validate = true);

    [[nodiscard]] bool has(const std::string& key) const;
    bool remove(const std::string& key);

    /// @throw std::runtime_error if the file cannot be written
    void saveToFile(const std::string& configFile, bool pretty = true) const;

    [[nodiscard]] nlohmann::json toJson() const;

    void setValidator(ConfigValidator validator);

    size_t addChangeListener(ConfigChangeListener listener);
    void removeChangeListener(size_t listenerId);

    /// Keys directly under prefix (top-level keys if prefix is empty)
    [[nodiscard]] std::vector<std::string> getKeys(const std::string& prefix = "") const;

    void clear();

    /// Replace the document with the preview defaults
    void loadDefaults();

private:
    const nlohmann::json* find(const std::string& key) const;
    nlohmann::json& getOrCreate(const std::string& key);
    void notifyListeners(const std::string& key, const nlohmann::json& oldValue,
                         const nlohmann::json& newValue);

    nlohmann::json m_config = nlohmann::json::object();
    mutable std::mutex m_mutex;
    ConfigValidator m_validator;
    std::map<size_t, ConfigChangeListener> m_listeners;
    size_t m_nextListenerId = 1;
};

} // namespace lumen
