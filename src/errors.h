#pragma once

#include <stdexcept>
#include <string>

namespace chatgate {

class GatewayError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Client input defect, answered with 400.
class ValidationError : public GatewayError {
public:
    enum class Kind {
        MissingField,
        InvalidArgument
    };

    explicit ValidationError(const std::string& message, Kind kind = Kind::MissingField)
        : GatewayError(message), kind_(kind) {}

    auto kind() const -> Kind { return kind_; }

private:
    Kind kind_;
};

// The backend could not be reached at the network layer.
class TransportError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// The backend was reached but the call failed.
class InvocationError : public GatewayError {
public:
    using GatewayError::GatewayError;
};

// The call succeeded but produced no value.
class NullResponseError : public InvocationError {
public:
    NullResponseError() : InvocationError("backend returned null response") {}
    using InvocationError::InvocationError;
};

} // namespace chatgate
