#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "Logging.hpp"

namespace Encoders {

// Raised when a value cannot be mapped to JSON: no encoder matches its type, or a
// structural constraint (string map keys, finite numbers, maximum depth) is violated.
class ENCODERS_API EncodingException : public std::runtime_error
{
public:
    explicit EncodingException(const std::string& message, std::exception_ptr cause = nullptr)
        : std::runtime_error(message), m_cause(std::move(cause)) {}

    // The failure that triggered this one, or null.
    const std::exception_ptr& Cause() const noexcept { return m_cause; }

private:
    std::exception_ptr m_cause;
};

}
