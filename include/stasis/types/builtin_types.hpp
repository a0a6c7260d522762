#pragma once

#include "stasis/serialization/type_catalog.hpp"

namespace stasis::types {

// Add every built-in type under its "stasis.<Name>" catalog name
void register_builtin_types(serialization::TypeCatalog& catalog);

}  // namespace stasis::types
