#pragma once

#include <boost/property_tree/ptree.hpp>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <typeindex>
#include <unordered_map>

namespace stasis::config {

enum class ConfigFormat { YAML, JSON };

// ".json" selects JSON, every other extension is read as YAML
ConfigFormat format_for(const std::string& file);

/**
 * @brief One named section of the configuration file
 *
 * The manager hands each registered section its subtree, then calls
 * validate(). A section missing from the file keeps its defaults.
 */
class ConfigurationProperties {
public:
    virtual ~ConfigurationProperties() = default;
    virtual void from_ptree(const boost::property_tree::ptree& pt) = 0;
    virtual void validate() const {}
    virtual std::string properties_name() const = 0;

protected:
    template <typename T>
    T get_value(const boost::property_tree::ptree& pt, const std::string& path,
                const T& default_value) {
        return pt.get<T>(path, default_value);
    }

    template <typename T>
    std::optional<T> get_optional_value(const boost::property_tree::ptree& pt,
                                        const std::string& path) {
        if (auto value = pt.get_optional<T>(path)) {
            return *value;
        }
        return std::nullopt;
    }
};

class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    // Reads the file and feeds every registered section. Throws
    // std::runtime_error when the file cannot be read or a section is invalid.
    void load_config(const std::string& config_file,
                     std::optional<ConfigFormat> format = std::nullopt);

    template <typename T>
    void register_configuration_properties(std::shared_ptr<T> properties) {
        static_assert(std::is_base_of_v<ConfigurationProperties, T>,
                      "T must inherit from ConfigurationProperties");
        sections_[std::type_index(typeid(T))] = properties;
        sections_by_name_[properties->properties_name()] = properties;
    }

    template <typename T>
    std::shared_ptr<T> get_configuration_properties() const {
        auto it = sections_.find(std::type_index(typeid(T)));
        return it != sections_.end() ? std::static_pointer_cast<T>(it->second)
                                     : nullptr;
    }

    std::shared_ptr<ConfigurationProperties> get_config_by_name(
        const std::string& name) const {
        auto it = sections_by_name_.find(name);
        return it != sections_by_name_.end() ? it->second : nullptr;
    }

    // Drops registered sections and the loaded tree
    void reset() {
        sections_.clear();
        sections_by_name_.clear();
        config_tree_ = boost::property_tree::ptree();
    }

    const boost::property_tree::ptree& get_config_tree() const {
        return config_tree_;
    }

private:
    ConfigManager() = default;

    void apply_sections();

    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        sections_;
    std::unordered_map<std::string, std::shared_ptr<ConfigurationProperties>>
        sections_by_name_;
    boost::property_tree::ptree config_tree_;
};

template <typename T>
class ConfigurationPropertiesFactory {
public:
    static std::shared_ptr<T> create_and_register() {
        auto properties = std::make_shared<T>();
        ConfigManager::instance().register_configuration_properties(properties);
        return properties;
    }
};

}  // namespace stasis::config
