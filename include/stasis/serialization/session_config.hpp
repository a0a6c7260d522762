#pragma once

#include <string>

#include "stasis/config/config.hpp"

namespace stasis::serialization {

// Session settings, loaded from the "session" section
class SessionConfig : public config::ConfigurationProperties {
public:
    // false: lossy human-readable output, no reconstruction metadata
    bool unpicklable = true;

    // Nesting bound for flatten/restore recursion
    int max_depth = 512;

    // JSON text indentation, -1 for compact output
    int indent = -1;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "session"; }
};

}  // namespace stasis::serialization
