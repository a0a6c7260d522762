#include "stasis/serialization/session_config.hpp"

#include <stdexcept>

namespace stasis::serialization {

void SessionConfig::from_ptree(const boost::property_tree::ptree& pt) {
    unpicklable = get_value(pt, "unpicklable", unpicklable);
    max_depth = get_value(pt, "max_depth", max_depth);
    indent = get_value(pt, "indent", indent);
}

void SessionConfig::validate() const {
    if (max_depth <= 0) {
        throw std::invalid_argument("Session max_depth must be greater than 0");
    }

    if (indent < -1) {
        throw std::invalid_argument("Session indent must be -1 or greater");
    }
}

}  // namespace stasis::serialization
