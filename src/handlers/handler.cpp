#include "stasis/handlers/handler.hpp"

#include "stasis/log/logger.hpp"
#include "stasis/serialization/exceptions.hpp"

namespace stasis::handlers {

void BaseHandler::contract_violation(const std::string& message) {
    STASIS_LOG_ERROR << "Handler contract violation: " << message;
    throw serialization::ContractViolation(message);
}

}  // namespace stasis::handlers
