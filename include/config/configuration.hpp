// File: config/configuration.hpp

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/formatting/fmt_yaml.hpp"
#include "common/logging/logger.hpp"

namespace config {
    class Configuration {
    public:
        using ChangeCallback = std::function<void(const std::string &, const YAML::Node &)>;

        Configuration(const Configuration &) = delete;

        Configuration &operator=(const Configuration &) = delete;

        Configuration(Configuration &&) = delete;

        Configuration &operator=(Configuration &&) = delete;

        ~Configuration() = default;

        explicit Configuration(std::string filename);

        // Builds a detached configuration from an already parsed document, with no file backing.
        explicit Configuration(const YAML::Node &root);

        // Initialize the singleton with a custom filepath; must run before the first getInstance()
        static void initialize(const std::string &filename);

        static Configuration &getInstance(const std::string &filename = "");

        [[nodiscard]] bool contains(const std::string &key) const;

        // Logs every flattened key
        void show() const;

        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        // yaml-cpp misbehaves with const char*, force std::string
        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

        template<typename T>
        bool set(const std::string &key, const T &value);

        void registerChangeCallback(ChangeCallback callback);

    private:
        std::unordered_map<std::string, YAML::Node> config_map_;
        static constexpr std::string_view default_filename_ = "configuration.yaml";
        static std::shared_ptr<Configuration> instance_;
        static std::once_flag init_flag_;
        std::string filename_;
        mutable std::shared_mutex mutex_;
        std::vector<ChangeCallback> change_callbacks_;

        // Flattens nested maps into dotted keys ("clustering.k_min")
        void load(const YAML::Node &node, const std::string &prefix = "");

        void notifyChangeCallbacks(const std::string &key, const YAML::Node &value) const;
    };

    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        std::shared_lock lock(mutex_);
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_WARN("Key '{}' not found in configuration", key);
            return std::nullopt;
        }
        try {
            return it->second.as<T>();
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML parsing exception for key '{}': {}", key, e.what());
            return std::nullopt;
        }
    }

    template<typename T>
    T Configuration::get(const std::string &key, T default_value) const {
        if (!contains(key)) {
            LOG_DEBUG("Key '{}' not configured, using default", key);
            return default_value;
        }
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

    template<typename T>
    bool Configuration::set(const std::string &key, const T &value) {
        YAML::Node node;
        try {
            node = value;
            std::unique_lock lock(mutex_);
            config_map_[key] = node;
        } catch (const YAML::Exception &e) {
            LOG_ERROR("Error setting value for key '{}': {}", key, e.what());
            return false;
        }
        notifyChangeCallbacks(key, node);
        return true;
    }

    inline bool Configuration::contains(const std::string &key) const {
        std::shared_lock lock(mutex_);
        return config_map_.contains(key);
    }

    // Convenience functions for the process-wide configuration
    inline void initialize(const std::string &filename = {}) { Configuration::initialize(filename); }

    inline void show() { Configuration::getInstance().show(); }

} // namespace config

#endif // CONFIGURATION_HPP
