/**
 * @file exceptions.h
 * @brief Standard Exception Hierarchy
 *
 * Exceptions are reserved for construction and programming errors.
 * Malformed user input is never reported through this channel; validators
 * return a ValidationResult instead.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace taxid {
namespace common {

/**
 * @brief Base exception for all taxid exceptions
 */
class TaxIdException : public std::runtime_error {
public:
    explicit TaxIdException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Identifier generation rejected its components
 *
 * Raised by generate() for unknown lookup codes or malformed partial
 * segments. Carries the offending segment name when one is known.
 */
class GenerationException : public TaxIdException {
public:
    GenerationException(const std::string& segment, const std::string& message)
        : TaxIdException("Generation error: " + message),
          segment_(segment) {}

    explicit GenerationException(const std::string& message)
        : GenerationException("", message) {}

    [[nodiscard]] const std::string& getSegment() const noexcept {
        return segment_;
    }

private:
    std::string segment_;
};

/**
 * @brief No strategy registered for the requested identifier kind
 */
class UnsupportedKindException : public TaxIdException {
public:
    explicit UnsupportedKindException(const std::string& kind)
        : TaxIdException("Unsupported identifier kind: " + kind) {}
};

/**
 * @brief Configuration error
 */
class ConfigException : public TaxIdException {
public:
    explicit ConfigException(const std::string& message)
        : TaxIdException("Configuration error: " + message) {}
};

} // namespace common
} // namespace taxid
