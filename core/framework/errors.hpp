#pragma once

#include "framework/argument.hpp"

#include <stdexcept>
#include <string>

namespace rebut {

/// Kinds of engine failure. All are synchronous and non-retryable:
/// they signal a caller programming error or a policy limit.
enum class ErrorKind {
    DUPLICATE_NODE,   // addNode on a reference already present
    UNKNOWN_NODE,     // attack endpoint never added
    TOO_LARGE         // enumeration above the node cap or past its budget
};

std::string toString(ErrorKind kind);

/// The single exception type thrown by the engine.
class ArgumentationError : public std::runtime_error {
public:
    ArgumentationError(ErrorKind kind, const std::string& message,
                       ArgumentRef node = 0)
        : std::runtime_error(message), kind_(kind), node_(node) {}

    ErrorKind kind() const { return kind_; }

    /// Offending node for DUPLICATE_NODE / UNKNOWN_NODE, 0 otherwise.
    ArgumentRef node() const { return node_; }

private:
    ErrorKind kind_;
    ArgumentRef node_;
};

} // namespace rebut
