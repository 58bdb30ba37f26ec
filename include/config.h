// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __PRINTDESK_CONFIG_H__
#define __PRINTDESK_CONFIG_H__

#include "app_settings.h"
#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

namespace printdesk {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialize once at startup, then hand
 * settings() snapshots to the components that run on worker threads.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/etc/printdesk/printdesk.json");
 *
 * // Get with default fallback
 * int port = cfg->get<int>("/http/port", 5000);
 *
 * // Typed snapshot for the service
 * AppSettings settings = cfg->settings();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    /**
     * @brief Construct configuration manager
     *
     * Use get_instance() to obtain singleton instance.
     */
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults if it does not exist.
     * Keys missing from an existing file are filled in and written back. A
     * corrupt file is replaced by the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/http/port")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds a value of
     * the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            try {
                return data[ptr].template get<T>();
            } catch (const json::exception& e) {
                spdlog::warn("[Config] {} has unexpected type ({}), using default", json_ptr,
                             e.what());
            }
        }
        return default_value;
    };

    /**
     * @brief Path passed to init()
     */
    std::string get_path();

    /**
     * @brief Snapshot every setting the service needs
     *
     * Values of the wrong type fall back to their defaults; integers are
     * clamped to sane minimums.
     */
    AppSettings settings();

    /**
     * @brief Default configuration document
     */
    static json get_default_config();

    /**
     * @brief Get singleton instance
     *
     * @return Pointer to global Config instance
     */
    static Config* get_instance();
};

} // namespace printdesk

#endif // __PRINTDESK_CONFIG_H__
