// File: config/configuration.hpp

#ifndef CONFIGURATION_HPP
#define CONFIGURATION_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "common/logging/logger.hpp"

namespace config {
    class Configuration {
    public:
        Configuration(const Configuration &) = delete;

        Configuration &operator=(const Configuration &) = delete;

        Configuration(Configuration &&) = delete;

        Configuration &operator=(Configuration &&) = delete;

        ~Configuration() = default;

        // Loads and flattens the YAML file at `filename`
        explicit Configuration(const std::string &filename);

        explicit Configuration(const YAML::Node &root);

        [[nodiscard]] static std::unique_ptr<Configuration> fromString(const std::string &yaml);

        // Initialize the process-wide configuration with a custom filepath
        static void initialize(const std::string &filename);

        [[nodiscard]] static bool isInitialized() noexcept;

        // Get the singleton instance, loading the default file on first use
        static Configuration &getInstance(const std::string &filename = "");

        [[nodiscard]] bool contains(const std::string &key) const;

        // Logs the flattened configuration
        void show() const;

        template<typename T>
        [[nodiscard]] std::optional<T> get(const std::string &key) const;

        template<typename T>
        [[nodiscard]] T get(const std::string &key, T default_value) const;

        // yaml-cpp misbehaves with const char*, force std::string
        [[nodiscard]] std::string get(const std::string &key, const char *default_value) const;

        template<typename T>
        bool set(const std::string &key, const T &value);

        [[nodiscard]] std::vector<std::string> keys() const;

    private:
        std::unordered_map<std::string, YAML::Node> config_map_;
        static constexpr std::string_view default_filename_ = "configuration.yaml";
        static std::shared_ptr<Configuration> instance_;
        static std::once_flag init_flag_;
        mutable std::shared_mutex mutex_;

        // Flattens nested maps into dotted keys
        void load(const YAML::Node &node, const std::string &prefix = "");
    };

    template<typename T>
    std::optional<T> Configuration::get(const std::string &key) const {
        std::shared_lock lock(mutex_);
        const auto it = config_map_.find(key);
        if (it == config_map_.end()) {
            LOG_DEBUG("Key '{}' not found in configuration", key);
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
        auto value = get<T>(key);
        return value ? *value : default_value;
    }

    inline std::string Configuration::get(const std::string &key, const char *default_value) const {
        return get<std::string>(key, std::string(default_value));
    }

    template<typename T>
    bool Configuration::set(const std::string &key, const T &value) {
        std::unique_lock lock(mutex_);
        try {
            YAML::Node node;
            node = value;
            config_map_[key] = node;
            return true;
        } catch (const YAML::Exception &e) {
            LOG_ERROR("Error setting value for key '{}': {}", key, e.what());
            return false;
        }
    }

    inline bool Configuration::contains(const std::string &key) const {
        std::shared_lock lock(mutex_);
        return config_map_.contains(key);
    }

    inline void initialize(const std::string &filename = {}) { Configuration::initialize(filename); }

    template<typename T>
    std::optional<T> get(const std::string &key) {
        return Configuration::getInstance().get<T>(key);
    }

    template<typename T>
    T get(const std::string &key, T default_value) {
        return Configuration::getInstance().get<T>(key, default_value);
    }

    inline std::string get(const std::string &key, const char *default_value) {
        return Configuration::getInstance().get(key, default_value);
    }

    template<typename T>
    bool set(const std::string &key, const T &value) {
        return Configuration::getInstance().set<T>(key, value);
    }

    inline bool contains(const std::string &key) { return Configuration::getInstance().contains(key); }

    inline void show() { Configuration::getInstance().show(); }
} // namespace config

#endif // CONFIGURATION_HPP
