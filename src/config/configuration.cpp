// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <algorithm>
#include <filesystem>

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::mutex Configuration::instance_mutex_;

    Configuration::Configuration(const YAML::Node &root) {
        if (root.IsDefined() && !root.IsNull() && !root.IsMap()) {
            throw std::runtime_error("Configuration root must be a YAML map");
        }
        load(root);
    }

    std::shared_ptr<Configuration> Configuration::loadFile(const std::string &filename) {
        LOG_INFO("Loading configuration from file: {}", filename);
        try {
            const YAML::Node root = YAML::LoadFile(filename);
            auto configuration = std::make_shared<Configuration>(root);
            LOG_INFO("Configuration file '{}' loaded ({} keys).", filename, configuration->config_map_.size());
            return configuration;
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename, e.what());
            throw std::runtime_error("Failed to load configuration file: " + filename);
        }
    }

    void Configuration::initialize(const std::string &filename) {
        auto configuration = loadFile(filename.empty() ? std::string(default_filename_) : filename);
        std::lock_guard lock(instance_mutex_);
        instance_ = std::move(configuration);
    }

    void Configuration::initializeFromString(const std::string &yaml) {
        std::shared_ptr<Configuration> configuration;
        try {
            configuration = std::make_shared<Configuration>(YAML::Load(yaml));
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while parsing configuration: {}", e.what());
            throw std::runtime_error("Failed to parse configuration document");
        }
        std::lock_guard lock(instance_mutex_);
        instance_ = std::move(configuration);
    }

    Configuration &Configuration::getInstance() {
        std::lock_guard lock(instance_mutex_);
        if (!instance_) {
            if (std::filesystem::exists(default_filename_)) {
                instance_ = loadFile(std::string(default_filename_));
            } else {
                LOG_WARN("Configuration file '{}' not found, using built-in defaults", default_filename_);
                instance_ = std::make_shared<Configuration>(YAML::Node());
            }
        }
        return *instance_;
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            return;
        }
        for (const auto &it: node) {
            const auto name = it.first.as<std::string>();
            const std::string key = prefix.empty() ? name : prefix + "." + name;
            if (it.second.IsMap()) {
                load(it.second, key);
            } else {
                config_map_[key] = it.second;
                LOG_TRACE("Loaded key: '{}'", key);
            }
        }
    }

    std::vector<std::string> Configuration::keys() const {
        std::shared_lock lock(mutex_);
        std::vector<std::string> result;
        result.reserve(config_map_.size());
        for (const auto &[key, value]: config_map_) {
            result.push_back(key);
        }
        std::ranges::sort(result);
        return result;
    }

    void Configuration::show() const {
        LOG_INFO("Configuration details:");
        for (const auto &key: keys()) {
            std::shared_lock lock(mutex_);
            const auto &value = config_map_.at(key);
            LOG_INFO("  {}: {}", key, value.IsScalar() ? value.as<std::string>() : "[non-scalar]");
        }
    }

} // namespace config
