// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <algorithm>
#include <stdexcept>

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    bool Configuration::isInitialized() noexcept { return instance_ != nullptr; }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            instance_ = std::make_shared<Configuration>(filename.empty() ? std::string(default_filename_) : filename);
        });
        return *instance_;
    }

    Configuration::Configuration(const std::string &filename) {
        LOG_INFO("Loading configuration from file: {}", filename);

        try {
            const YAML::Node root = YAML::LoadFile(filename);
            load(root);
            LOG_INFO("Configuration file '{}' loaded successfully ({} keys).", filename, config_map_.size());
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration '{}': {}", filename, e.what());
            throw std::runtime_error("Failed to load configuration '" + filename + "': " + e.what());
        }
    }

    Configuration::Configuration(const YAML::Node &root) {
        if (root.IsDefined() && !root.IsNull()) {
            load(root);
        }
    }

    std::unique_ptr<Configuration> Configuration::fromString(const std::string &yaml) {
        try {
            return std::make_unique<Configuration>(YAML::Load(yaml));
        } catch (const YAML::Exception &e) {
            LOG_ERROR("YAML exception while parsing configuration string: {}", e.what());
            throw std::runtime_error(std::string("Failed to parse configuration: ") + e.what());
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        if (!node.IsMap()) {
            throw std::runtime_error("Configuration root must be a YAML map");
        }
        for (const auto &it: node) {
            const std::string key =
                    prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
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
        std::sort(result.begin(), result.end());
        return result;
    }

    void Configuration::show() const {
        LOG_INFO("Configuration details:");
        for (const auto &key: keys()) {
            std::shared_lock lock(mutex_);
            const YAML::Node &value = config_map_.at(key);
            if (value.IsScalar()) {
                LOG_INFO("{}: {}", key, value.Scalar());
            } else {
                LOG_INFO("{}: [non-scalar]", key);
            }
        }
    }
} // namespace config
