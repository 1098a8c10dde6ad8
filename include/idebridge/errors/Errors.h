//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed JSON-RPC errors, transport bind faults and registration faults
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include <boost/system/error_code.hpp>
#include <boost/asio/error.hpp>

#include "idebridge/JSONRPCTypes.h"

namespace idebridge {
namespace errors {

// Categorization of the JSON-RPC error codes this server emits.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation carried by Reply and mapped onto the wire error object.
struct RpcError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Build an RpcError with its category derived from the code.
inline RpcError makeRpcError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    RpcError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to RpcError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<RpcError> rpcErrorFromErrorValue(const JSONValue& errVal) {
    auto code = GetIntMember(errVal, "code");
    auto message = GetStringMember(errVal, "message");
    if (!code.has_value() || !message.has_value()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    if (const JSONValue* d = FindMember(errVal, "data")) {
        data = *d;
    }
    return makeRpcError(static_cast<int>(*code), std::move(*message), std::move(data));
}

// Extract RpcError from a JSONRPCResponse if it carries an error.
inline std::optional<RpcError> rpcErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return rpcErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed RpcError.
inline JSONValue makeErrorValue(const RpcError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from RpcError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const RpcError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

//==========================================================================================================
// TransportFault
// Purpose: Startup fault of one listener, reported outside any JSON-RPC exchange.
// Fields:
//   kind: PortInUse | PermissionDenied | Other.
//   port: The port that was requested.
//   message: Operator-facing guidance.
//==========================================================================================================
struct TransportFault {
    enum class Kind {
        PortInUse,
        PermissionDenied,
        Other
    };

    Kind kind{Kind::Other};
    uint16_t port{0};
    std::string message;
};

inline const char* toString(TransportFault::Kind kind) {
    switch (kind) {
        case TransportFault::Kind::PortInUse: return "PortInUse";
        case TransportFault::Kind::PermissionDenied: return "PermissionDenied";
        case TransportFault::Kind::Other: return "Other";
    }
    return "Other";
}

// Thrown (or set on a Start() future) when a listener cannot bind.
class BindError : public std::runtime_error {
public:
    explicit BindError(TransportFault fault)
        : std::runtime_error(fault.message), fault_(std::move(fault)) {}

    const TransportFault& fault() const noexcept { return fault_; }

private:
    TransportFault fault_;
};

// Thrown at startup when a tool definition and implementation do not pair up.
class RegistrationError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

//==========================================================================================================
// classifyBindError
// Purpose: Maps a bind/listen error code onto a TransportFault with guidance text.
//==========================================================================================================
inline TransportFault classifyBindError(const boost::system::error_code& ec, uint16_t port) {
    TransportFault f;
    f.port = port;
    if (ec == boost::asio::error::address_in_use) {
        f.kind = TransportFault::Kind::PortInUse;
        f.message = "Port " + std::to_string(port) + " is already in use. Please choose a different port.";
    } else if (ec == boost::asio::error::access_denied) {
        f.kind = TransportFault::Kind::PermissionDenied;
        f.message = "Permission denied for port " + std::to_string(port) + ". Try using a port above 1024.";
    } else {
        f.kind = TransportFault::Kind::Other;
        f.message = "Failed to bind port " + std::to_string(port) + ": " + ec.message();
    }
    return f;
}

} // namespace errors
} // namespace idebridge
