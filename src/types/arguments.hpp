#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "stasis/serialization/value.hpp"

// Argument checks shared by the built-in factories
namespace stasis::types::detail {

inline void check_arity(const serialization::Value::List& args,
                        std::size_t min_count, std::size_t max_count,
                        const std::string& factory) {
    if (args.size() < min_count || args.size() > max_count) {
        throw std::invalid_argument(
            factory + " takes " + std::to_string(min_count) + " to " +
            std::to_string(max_count) + " arguments, got " +
            std::to_string(args.size()));
    }
}

inline std::int64_t int_arg(const serialization::Value::List& args,
                            std::size_t index, std::int64_t default_value) {
    return index < args.size() ? args[index].as_int() : default_value;
}

inline int small_int_arg(const serialization::Value::List& args,
                         std::size_t index, int default_value) {
    const std::int64_t value = int_arg(args, index, default_value);
    if (value < INT32_MIN || value > INT32_MAX) {
        throw std::invalid_argument("argument " + std::to_string(index) +
                                    " out of range: " + std::to_string(value));
    }
    return static_cast<int>(value);
}

}  // namespace stasis::types::detail
