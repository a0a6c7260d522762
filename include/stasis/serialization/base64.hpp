#pragma once

#include <string>

#include "stasis/serialization/value.hpp"

namespace stasis::serialization::base64 {

// Standard alphabet, padded, no line breaks
std::string encode(const Value::Bytes& data);

// Throws DecodeError on a bad length, a character outside the alphabet,
// misplaced padding or non-zero bits in front of the padding
Value::Bytes decode(const std::string& text);

}  // namespace stasis::serialization::base64
