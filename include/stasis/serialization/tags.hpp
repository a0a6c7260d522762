#pragma once

namespace stasis::serialization::tags {

// Reconstruction marker: [encoded factory, [encoded arguments...]]
inline constexpr char REDUCE[] = "__reduce__";

// Catalog name of the flattened object's exact type
inline constexpr char OBJECT[] = "__object__";

// Reference to a factory by catalog name
inline constexpr char TYPE[] = "__type__";

// Generic byte string, base64 text
inline constexpr char BYTES[] = "__bytes__";

}  // namespace stasis::serialization::tags
