#include "stasis/config/config.hpp"

#include <yaml-cpp/yaml.h>

#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <stdexcept>

#include "stasis/log/logger.hpp"

namespace stasis::config {

namespace {

boost::property_tree::ptree to_ptree(const YAML::Node& node) {
    boost::property_tree::ptree pt;
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& entry : node) {
                pt.add_child(entry.first.as<std::string>(),
                             to_ptree(entry.second));
            }
            break;
        case YAML::NodeType::Sequence:
            for (const auto& item : node) {
                pt.push_back({"", to_ptree(item)});
            }
            break;
        case YAML::NodeType::Scalar:
            pt.put_value(node.Scalar());
            break;
        default:
            break;
    }
    return pt;
}

boost::property_tree::ptree read_tree(const std::string& file,
                                      ConfigFormat format) {
    if (format == ConfigFormat::JSON) {
        boost::property_tree::ptree pt;
        boost::property_tree::read_json(file, pt);
        return pt;
    }
    return to_ptree(YAML::LoadFile(file));
}

}  // namespace

ConfigFormat format_for(const std::string& file) {
    return std::filesystem::path(file).extension() == ".json"
               ? ConfigFormat::JSON
               : ConfigFormat::YAML;
}

void ConfigManager::load_config(const std::string& config_file,
                                std::optional<ConfigFormat> format) {
    const ConfigFormat effective = format.value_or(format_for(config_file));
    STASIS_LOG_INFO << "Loading config file: " << config_file << " as "
                    << (effective == ConfigFormat::JSON ? "JSON" : "YAML");

    try {
        config_tree_ = read_tree(config_file, effective);
        apply_sections();
    } catch (const std::exception& e) {
        STASIS_LOG_ERROR << "Failed to load config file " << config_file << ": "
                         << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
    STASIS_LOG_INFO << "Loaded " << sections_.size()
                    << " configuration section(s) from " << config_file;
}

void ConfigManager::apply_sections() {
    for (auto& [type, section] : sections_) {
        const std::string name = section->properties_name();

        auto subtree = config_tree_.get_child_optional(name);
        if (!subtree) {
            STASIS_LOG_WARN << "No '" << name
                            << "' section in config, keeping defaults";
            continue;
        }

        section->from_ptree(*subtree);
        section->validate();
        STASIS_LOG_DEBUG << "Applied config section: " << name;
    }
}

}  // namespace stasis::config
