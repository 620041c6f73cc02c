// File: config/configuration.cpp

#include "config/configuration.hpp"

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            instance_ = std::make_shared<Configuration>(filename.empty() ? std::string(default_filename_) : filename);
        });
        return *instance_;
    }

    Configuration::Configuration(std::string filename) : filename_(std::move(filename)) {
        LOG_INFO("Loading configuration from file: {}", filename_);

        try {
            const YAML::Node root = YAML::LoadFile(filename_);
            LOG_INFO("Configuration file '{}' loaded successfully.", filename_);
            load(root);
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename_, e.what());
            throw std::runtime_error("Failed to load configuration '" + filename_ + "': " + e.what());
        }
    }

    Configuration::Configuration(const YAML::Node &root) {
        try {
            load(root);
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML exception while reading configuration document: {}", e.what());
            throw std::runtime_error(std::string("Invalid configuration document: ") + e.what());
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        for (const auto &it: node) {
            std::string key = prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                load(it.second, key);
            } else {
                LOG_TRACE("Loaded key: '{}', value type: '{}'", key, it.second.Type());
                config_map_[key] = it.second;
            }
        }
    }

    void Configuration::registerChangeCallback(ChangeCallback callback) {
        std::unique_lock lock(mutex_);
        change_callbacks_.push_back(std::move(callback));
    }

    void Configuration::notifyChangeCallbacks(const std::string &key, const YAML::Node &value) const {
        std::vector<ChangeCallback> callbacks;
        {
            std::shared_lock lock(mutex_);
            callbacks = change_callbacks_;
        }
        for (const auto &callback: callbacks) {
            callback(key, value);
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details:");
        for (const auto &[key, value]: config_map_) {
            LOG_INFO("{}: {}", key, value.IsScalar() ? value.Scalar() : YAML::Dump(value));
        }
    }
} // namespace config
