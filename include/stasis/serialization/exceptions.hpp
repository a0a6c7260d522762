#pragma once

#include <stdexcept>
#include <string>

namespace stasis::serialization {

// Serialization exception
class SerializationException : public std::runtime_error {
public:
    explicit SerializationException(const std::string& message)
        : std::runtime_error("Serialization error: " + message) {}
};

// Malformed binary payload (base64 text that does not decode)
class DecodeError : public SerializationException {
public:
    explicit DecodeError(const std::string& message)
        : SerializationException("decode failed: " + message) {}
};

// A Value accessed as an alternative it does not hold
class TypeMismatch : public SerializationException {
public:
    explicit TypeMismatch(const std::string& message)
        : SerializationException("type mismatch: " + message) {}
};

/**
 * @brief Defect in the calling engine or a corrupted document
 *
 * Thrown when a handler is dispatched on data it was never meant to see,
 * e.g. a restore without a reconstruction marker. Nothing inside the library
 * catches it.
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& message)
        : std::logic_error("Contract violation: " + message) {}
};

}  // namespace stasis::serialization
